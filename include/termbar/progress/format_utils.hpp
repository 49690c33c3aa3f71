#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace termbar {
namespace progress {

std::string normalizeLabel(const std::string& label);

std::string centerField(const std::string& text, size_t width);

std::string formatPercent(std::int64_t value, std::int64_t end);

std::string formatReadout(std::int64_t value, std::int64_t end,
                          const std::optional<std::string>& suffix);

std::string repeatGlyph(const std::string& glyph, std::int64_t count);

// floor(value * width / end) without intermediate overflow.
std::int64_t filledCount(std::int64_t value, int width, std::int64_t end);

}}
