#pragma once

#include "style.hpp"
#include "output_lock.hpp"
#include <string>
#include <optional>
#include <ostream>
#include <iostream>
#include <cstdint>

namespace termbar {
namespace progress {

struct BarOptions {
    BarStyle style = BarStyle::HASHES;
    bool show_percent = false;
    std::optional<std::string> suffix;
    OutputLock* output_lock = nullptr;
    std::ostream* out = &std::cout;
};

class ProgressBar {
public:
    ProgressBar(const std::string& label, int width, std::int64_t start, std::int64_t end,
                const BarOptions& options);

    ProgressBar(const std::string& label, int width, std::int64_t start, std::int64_t end,
                BarStyle style = BarStyle::HASHES,
                bool show_percent = false,
                std::optional<std::string> suffix = std::nullopt,
                OutputLock* output_lock = nullptr);

    void relabel(const std::string& label);

    void advance(std::int64_t delta);

    // Row 0 is the top line. Every render of a complete bar ends with a newline.
    void render(std::optional<int> line_number = std::nullopt);

    std::string readout() const;

    const std::string& label() const { return label_; }
    std::int64_t value() const { return value_; }
    std::int64_t start() const { return start_; }
    std::int64_t end() const { return end_; }
    int width() const { return width_; }
    double scale() const { return scale_; }
    BarStyle style() const { return style_; }
    const Glyphs& glyphs() const { return glyphs_; }
    bool showPercent() const { return show_percent_; }
    const std::optional<std::string>& suffix() const { return suffix_; }
    bool isComplete() const { return complete_; }
    std::int64_t filledCount() const;

private:
    std::string label_;
    std::int64_t start_;
    std::int64_t end_;
    int width_;
    double scale_;
    std::int64_t value_;
    bool complete_;
    BarStyle style_;
    Glyphs glyphs_;
    bool show_percent_;
    std::optional<std::string> suffix_;
    OutputLock* output_lock_;
    std::ostream* out_;

    static BarOptions makeOptions(BarStyle style, bool show_percent,
                                  std::optional<std::string> suffix, OutputLock* output_lock);
};

}}
