#pragma once

#include <string>

namespace termbar {
namespace progress {

enum class BarStyle {
    HASHES = 1,        // |###====|
    BOXES1 = 2,        // |▉▉▉▉▉░░|
    BOXES2 = 3,        // not implemented, drawn as HASHES
    UNDERSCORED = 4    // |▉▉▉____|
};

struct Glyphs {
    std::string fill;
    std::string track;
};

inline bool operator==(const Glyphs& a, const Glyphs& b) {
    return a.fill == b.fill && a.track == b.track;
}

inline bool operator!=(const Glyphs& a, const Glyphs& b) {
    return !(a == b);
}

// Never fails: BOXES2 and values outside the enumeration get the HASHES pair.
Glyphs resolveGlyphs(BarStyle style);

bool isKnownStyle(BarStyle style);

const char* styleName(BarStyle style);

}}
