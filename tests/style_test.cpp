#include "termbar/progress/style.hpp"

#include <string>

#include <gtest/gtest.h>

using termbar::progress::BarStyle;
using termbar::progress::Glyphs;
using termbar::progress::resolveGlyphs;

namespace {
  const Glyphs kHashPair{"#", "="};
}

TEST(Style, HashesUseHashAndEquals)
{
    EXPECT_EQ(kHashPair, resolveGlyphs(BarStyle::HASHES));
}

TEST(Style, Boxes1UsesBlockOnShade)
{
    Glyphs glyphs = resolveGlyphs(BarStyle::BOXES1);
    EXPECT_EQ("▉", glyphs.fill);
    EXPECT_EQ("░", glyphs.track);
}

TEST(Style, UnderscoredUsesBlockOnUnderscore)
{
    Glyphs glyphs = resolveGlyphs(BarStyle::UNDERSCORED);
    EXPECT_EQ("▉", glyphs.fill);
    EXPECT_EQ("_", glyphs.track);
}

TEST(Style, Boxes2FallsBackToHashes)
{
    EXPECT_EQ(kHashPair, resolveGlyphs(BarStyle::BOXES2));
}

TEST(Style, UnknownValueFallsBackToHashes)
{
    EXPECT_EQ(kHashPair, resolveGlyphs(static_cast<BarStyle>(0)));
    EXPECT_EQ(kHashPair, resolveGlyphs(static_cast<BarStyle>(42)));
    EXPECT_EQ(kHashPair, resolveGlyphs(static_cast<BarStyle>(-1)));
}

TEST(Style, KnownStyles)
{
    EXPECT_TRUE(termbar::progress::isKnownStyle(BarStyle::HASHES));
    EXPECT_TRUE(termbar::progress::isKnownStyle(BarStyle::BOXES2));
    EXPECT_FALSE(termbar::progress::isKnownStyle(static_cast<BarStyle>(42)));
}

TEST(Style, Names)
{
    EXPECT_STREQ("underscored", termbar::progress::styleName(BarStyle::UNDERSCORED));
    EXPECT_STREQ("unknown", termbar::progress::styleName(static_cast<BarStyle>(42)));
}
