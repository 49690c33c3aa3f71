#include "termbar/progress/format_utils.hpp"
#include "termbar/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <limits>

namespace termbar {
namespace progress {

std::string normalizeLabel(const std::string& label) {
    using namespace constants::label;

    if (label.size() > FIELD_WIDTH) {
        return label.substr(0, HEAD_CHARS) + ELLIPSIS + label.substr(label.size() - TAIL_CHARS);
    }
    return fmt::format("{:<{}}", label, FIELD_WIDTH);
}

std::string centerField(const std::string& text, size_t width) {
    return fmt::format("{:^{}}", text, width);
}

std::string formatPercent(std::int64_t value, std::int64_t end) {
    double percent = (static_cast<double>(value) / static_cast<double>(end)) * 100.0;
    return fmt::format("{:3.1f}%", percent);
}

std::string formatReadout(std::int64_t value, std::int64_t end,
                          const std::optional<std::string>& suffix) {
    std::string readout = fmt::format("{}{}{}", value, constants::bar::READOUT_SEPARATOR, end);
    if (suffix && !suffix->empty()) {
        readout += " " + *suffix;
    }
    return readout;
}

std::string repeatGlyph(const std::string& glyph, std::int64_t count) {
    std::string result;
    if (count <= 0) {
        return result;
    }

    result.reserve(glyph.size() * static_cast<size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        result += glyph;
    }
    return result;
}

std::int64_t filledCount(std::int64_t value, int width, std::int64_t end) {
    if (width <= 0 || end == 0) {
        return 0;
    }

    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    const std::int64_t min = std::numeric_limits<std::int64_t>::min();
    const std::int64_t limit = max / width;

    if (end == -1) {
        if (value > limit) return min;
        if (value < -limit) return max;
        return -(value * width);
    }

    if (value <= limit && value >= -limit) {
        std::int64_t product = value * width;
        std::int64_t count = product / end;
        if (product % end != 0 && ((product < 0) != (end < 0))) {
            --count;
        }
        return count;
    }

    std::int64_t quotient = value / end;
    std::int64_t remainder = value % end;
    if (quotient > limit) return max;
    if (quotient < -limit) return min;

    std::int64_t whole = quotient * width;
    std::int64_t partial = static_cast<std::int64_t>(
        std::floor(static_cast<long double>(remainder) * width / static_cast<long double>(end)));

    if (partial > 0 && whole > max - partial) return max;
    if (partial < 0 && whole < min - partial) return min;
    return whole + partial;
}

}}
