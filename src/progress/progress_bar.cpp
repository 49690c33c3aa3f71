#include "termbar/progress/progress_bar.hpp"
#include "termbar/progress/error_codes.hpp"
#include "termbar/progress/format_utils.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <algorithm>
#include <sstream>
#include <limits>
#include <mutex>
#include <utility>

namespace termbar {
namespace progress {

ProgressBar::ProgressBar(const std::string& label, int width, std::int64_t start, std::int64_t end,
                         const BarOptions& options)
    : label_(normalizeLabel(label)),
      start_(start),
      end_(end),
      width_(width),
      scale_(0.0),
      value_(start),
      complete_(false),
      style_(options.style),
      glyphs_(resolveGlyphs(options.style)),
      show_percent_(options.show_percent),
      suffix_(options.suffix),
      output_lock_(options.output_lock),
      out_(options.out ? options.out : &std::cout) {
    auto& logger = common::Logger::instance();

    if (width <= 0) {
        logger.error("[ProgressBar] Rejected '{}': width={}", label, width);
        throw ProgressBarError(ProgressErrorCode::INVALID_WIDTH,
                               {"ProgressBar", {{"width", std::to_string(width)}}});
    }

    if (end == 0) {
        logger.error("[ProgressBar] Rejected '{}': end=0", label);
        throw ProgressBarError(ProgressErrorCode::INVALID_CONFIGURATION,
                               {"ProgressBar", {{"end", "0"}}});
    }

    scale_ = static_cast<double>(width_) / static_cast<double>(end_);

    if (style_ == BarStyle::BOXES2 || !isKnownStyle(style_)) {
        logger.debug("[ProgressBar] Style {} ({}) drawn with default glyphs",
                     static_cast<int>(style_), styleName(style_));
    }

    logger.debug("[ProgressBar] Created '{}' width={} range={}..{} style={} percent={}",
                 label_, width_, start_, end_, styleName(style_), show_percent_);
}

ProgressBar::ProgressBar(const std::string& label, int width, std::int64_t start, std::int64_t end,
                         BarStyle style, bool show_percent,
                         std::optional<std::string> suffix, OutputLock* output_lock)
    : ProgressBar(label, width, start, end,
                  makeOptions(style, show_percent, std::move(suffix), output_lock)) {
}

BarOptions ProgressBar::makeOptions(BarStyle style, bool show_percent,
                                    std::optional<std::string> suffix, OutputLock* output_lock) {
    BarOptions options;
    options.style = style;
    options.show_percent = show_percent;
    options.suffix = std::move(suffix);
    options.output_lock = output_lock;
    return options;
}

void ProgressBar::relabel(const std::string& label) {
    label_ = normalizeLabel(label);
    common::Logger::instance().debug("[ProgressBar] Relabelled to '{}'", label_);
}

void ProgressBar::advance(std::int64_t delta) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    const std::int64_t min = std::numeric_limits<std::int64_t>::min();

    if (delta > 0 && value_ > max - delta) {
        value_ = end_;
    } else if (delta < 0 && value_ < min - delta) {
        value_ = min;
    } else {
        value_ += delta;
    }

    if (value_ > end_) {
        value_ = end_;
    }
}

std::int64_t ProgressBar::filledCount() const {
    return progress::filledCount(value_, width_, end_);
}

std::string ProgressBar::readout() const {
    if (show_percent_) {
        return formatPercent(value_, end_);
    }
    return formatReadout(value_, end_, suffix_);
}

void ProgressBar::render(std::optional<int> line_number) {
    using namespace constants;

    std::unique_lock<OutputLock> guard;
    if (output_lock_) {
        guard = std::unique_lock<OutputLock>(*output_lock_);
    }

    if (value_ >= end_) {
        value_ = end_;
        if (!complete_) {
            common::Logger::instance().debug("[ProgressBar] '{}' finished at {}", label_, value_);
        }
        complete_ = true;
    }

    std::int64_t count = std::min<std::int64_t>(filledCount(), width_);
    std::string head = std::string(ansi::CARRIAGE_RETURN) + bar::LABEL_PREFIX +
                       centerField(label_, constants::label::CENTER_WIDTH) + bar::OPEN;

    std::ostringstream frame;

    if (line_number) {
        frame << ansi::cursorToRow(*line_number);
    }

    frame << head;
    frame << ansi::TRACK_COLOR << repeatGlyph(glyphs_.track, width_) << ansi::NORMAL_COLOR << bar::CLOSE;
    frame << readout();

    frame << ansi::SAVE_CURSOR;

    frame << head;
    frame << ansi::FILL_COLOR << repeatGlyph(glyphs_.fill, count) << ansi::NORMAL_COLOR;

    frame << ansi::RESTORE_CURSOR;
    frame << ansi::CLEAR_TO_EOL;

    *out_ << frame.str() << std::flush;

    if (complete_) {
        *out_ << std::endl;
    }
}

}}
