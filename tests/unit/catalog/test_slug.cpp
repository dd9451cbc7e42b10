#include <gtest/gtest.h>
#include "tessera/catalog/slug.hpp"

using namespace tessera::catalog;

TEST(SlugTest, LowerCasesAndJoinsWords) {
    EXPECT_EQ(slugify("Arrows"), "arrows");
    EXPECT_EQ(slugify("My Icons!"), "my_icons");
    EXPECT_EQ(slugify("Media Controls 2"), "media_controls_2");
}

TEST(SlugTest, CollapsesSeparatorRuns) {
    EXPECT_EQ(slugify("A__b"), "a_b");
    EXPECT_EQ(slugify("social - brands"), "social_brands");
    EXPECT_EQ(slugify("x.y-z"), "x_y_z");
}

TEST(SlugTest, TrimsEdges) {
    EXPECT_EQ(slugify("  padded  "), "padded");
    EXPECT_EQ(slugify("_lead"), "lead");
    EXPECT_EQ(slugify("trail-"), "trail");
}

TEST(SlugTest, EmptyResultFallsBack) {
    EXPECT_EQ(slugify(""), "icons");
    EXPECT_EQ(slugify("--"), "icons");
    EXPECT_EQ(slugify("\xC3\xA9"), "icons");
}

TEST(SlugTest, AlreadySlugIsUnchanged) {
    EXPECT_EQ(slugify("ui_16"), "ui_16");
}
