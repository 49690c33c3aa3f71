#include "termbar/progress/style.hpp"

namespace termbar {
namespace progress {

namespace {
    constexpr const char* HASH_FILL = "#";
    constexpr const char* HASH_TRACK = "=";
    constexpr const char* BLOCK_FILL = "\u2589";
    constexpr const char* SHADE_TRACK = "\u2591";
    constexpr const char* UNDERSCORE_TRACK = "_";
}

Glyphs resolveGlyphs(BarStyle style) {
    switch (style) {
        case BarStyle::HASHES:
            return {HASH_FILL, HASH_TRACK};
        case BarStyle::BOXES1:
            return {BLOCK_FILL, SHADE_TRACK};
        case BarStyle::UNDERSCORED:
            return {BLOCK_FILL, UNDERSCORE_TRACK};
        case BarStyle::BOXES2:
        default:
            return {HASH_FILL, HASH_TRACK};
    }
}

bool isKnownStyle(BarStyle style) {
    switch (style) {
        case BarStyle::HASHES:
        case BarStyle::BOXES1:
        case BarStyle::BOXES2:
        case BarStyle::UNDERSCORED:
            return true;
        default:
            return false;
    }
}

const char* styleName(BarStyle style) {
    switch (style) {
        case BarStyle::HASHES: return "hashes";
        case BarStyle::BOXES1: return "boxes1";
        case BarStyle::BOXES2: return "boxes2";
        case BarStyle::UNDERSCORED: return "underscored";
        default: return "unknown";
    }
}

}}
