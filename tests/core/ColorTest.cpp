#include <gtest/gtest.h>
#include <routegraph/core/Color.h>

#include <algorithm>

using namespace routegraph;

TEST(ColorTest, HexIsUpperCaseWithHash) {
    EXPECT_EQ(Color::fromRgb(0x1abc9c).toHex(), "#1ABC9C");
    EXPECT_EQ(Color(0, 0, 0).toHex(), "#000000");
    EXPECT_EQ(Color(255, 255, 255).toHex(), "#FFFFFF");
}

TEST(ColorTest, ParseHex) {
    auto c = Color::fromHex("#2563eb");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, colors::ROOT);

    auto noHash = Color::fromHex("1F2937");
    ASSERT_TRUE(noHash.has_value());
    EXPECT_EQ(*noHash, colors::NEUTRAL_EDGE);
}

TEST(ColorTest, ParseHexRejectsMalformedInput) {
    EXPECT_FALSE(Color::fromHex("").has_value());
    EXPECT_FALSE(Color::fromHex("#").has_value());
    EXPECT_FALSE(Color::fromHex("#12345").has_value());
    EXPECT_FALSE(Color::fromHex("#1234567").has_value());
    EXPECT_FALSE(Color::fromHex("#12345G").has_value());
}

TEST(ColorTest, PaletteMatchesExplorerColors) {
    const char* expected[] = {"#1ABC9C", "#2ECC71", "#3498DB", "#9B59B6",
                              "#F1C40F", "#E67E22", "#E74C3C"};
    ASSERT_EQ(colors::BRANCH_PALETTE.size(), 7);
    for (size_t i = 0; i < colors::BRANCH_PALETTE.size(); ++i) {
        EXPECT_EQ(colors::BRANCH_PALETTE[i].toHex(), expected[i]);
    }
}

TEST(ColorTest, RootColorNotInPalette) {
    EXPECT_TRUE(std::find(colors::BRANCH_PALETTE.begin(), colors::BRANCH_PALETTE.end(),
                          colors::ROOT) == colors::BRANCH_PALETTE.end());
}

TEST(ColorTest, BranchColorWrapsAround) {
    EXPECT_EQ(colors::branchColor(0), colors::BRANCH_PALETTE[0]);
    EXPECT_EQ(colors::branchColor(6), colors::BRANCH_PALETTE[6]);
    EXPECT_EQ(colors::branchColor(7), colors::BRANCH_PALETTE[0]);
    EXPECT_EQ(colors::branchColor(15), colors::BRANCH_PALETTE[1]);
}
