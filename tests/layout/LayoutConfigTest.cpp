#include <gtest/gtest.h>
#include <routegraph/core/Errors.h>
#include <routegraph/layout/LayoutConfig.h>

using namespace routegraph;

TEST(LayoutConfigTest, Defaults) {
    LayoutConfig config;

    EXPECT_EQ(config.direction, Direction::LeftToRight);
    EXPECT_FLOAT_EQ(config.nodeWidth, 172.0f);
    EXPECT_FLOAT_EQ(config.nodeHeight, 36.0f);
    EXPECT_FLOAT_EQ(config.nodeSeparation, 50.0f);
    EXPECT_FLOAT_EQ(config.rankSeparation, 250.0f);
    EXPECT_FLOAT_EQ(config.edgeSeparation, 10.0f);
    EXPECT_NO_THROW(config.validate());
}

TEST(LayoutConfigTest, BuilderSetters) {
    LayoutConfig config;
    config.setDirection(Direction::TopToBottom)
          .setNodeSize(100.0f, 40.0f)
          .setNodeSeparation(20.0f)
          .setRankSeparation(80.0f)
          .setEdgeSeparation(0.0f);

    EXPECT_EQ(config.direction, Direction::TopToBottom);
    EXPECT_EQ(config.nodeSize(), Size(100.0f, 40.0f));
    EXPECT_FLOAT_EQ(config.rankSeparation, 80.0f);
    EXPECT_NO_THROW(config.validate());
    EXPECT_NE(config, LayoutConfig{});
}

TEST(LayoutConfigTest, ValidateRejectsBadValues) {
    EXPECT_THROW(LayoutConfig{}.setNodeSize(-1.0f, 36.0f).validate(), InvalidLayoutConfig);
    EXPECT_THROW(LayoutConfig{}.setNodeSize(172.0f, 0.0f).validate(), InvalidLayoutConfig);
    EXPECT_THROW(LayoutConfig{}.setNodeSeparation(-1.0f).validate(), InvalidLayoutConfig);
    EXPECT_THROW(LayoutConfig{}.setRankSeparation(-0.5f).validate(), InvalidLayoutConfig);
    EXPECT_THROW(LayoutConfig{}.setEdgeSeparation(-10.0f).validate(), InvalidLayoutConfig);
}

TEST(LayoutConfigTest, ValidateRejectsForgedDirection) {
    LayoutConfig config;
    config.direction = static_cast<Direction>(7);
    EXPECT_THROW(config.validate(), UnknownDirection);
}

TEST(LayoutConfigTest, ParseDirection) {
    EXPECT_EQ(parseDirection("TB"), Direction::TopToBottom);
    EXPECT_EQ(parseDirection("BT"), Direction::BottomToTop);
    EXPECT_EQ(parseDirection("LR"), Direction::LeftToRight);
    EXPECT_EQ(parseDirection("RL"), Direction::RightToLeft);

    for (Direction d : {Direction::TopToBottom, Direction::BottomToTop,
                        Direction::LeftToRight, Direction::RightToLeft}) {
        EXPECT_EQ(parseDirection(toString(d)), d);
    }
}

TEST(LayoutConfigTest, ParseDirection_UnknownValue) {
    EXPECT_THROW(parseDirection("tb"), UnknownDirection);
    EXPECT_THROW(parseDirection(""), UnknownDirection);
    EXPECT_THROW(parseDirection("diagonal"), UnknownDirection);

    try {
        parseDirection("XY");
        FAIL() << "expected UnknownDirection";
    } catch (const UnknownDirection& e) {
        EXPECT_EQ(e.value(), "XY");
    }
}

TEST(LayoutConfigTest, HorizontalDirections) {
    EXPECT_TRUE(isHorizontal(Direction::LeftToRight));
    EXPECT_TRUE(isHorizontal(Direction::RightToLeft));
    EXPECT_FALSE(isHorizontal(Direction::TopToBottom));
    EXPECT_FALSE(isHorizontal(Direction::BottomToTop));
}

TEST(LayoutConfigTest, AnchorSides) {
    EXPECT_EQ(targetSide(Direction::TopToBottom), NodeSide::Top);
    EXPECT_EQ(sourceSide(Direction::TopToBottom), NodeSide::Bottom);
    EXPECT_EQ(targetSide(Direction::BottomToTop), NodeSide::Bottom);
    EXPECT_EQ(sourceSide(Direction::BottomToTop), NodeSide::Top);
    EXPECT_EQ(targetSide(Direction::LeftToRight), NodeSide::Left);
    EXPECT_EQ(sourceSide(Direction::LeftToRight), NodeSide::Right);
    EXPECT_EQ(targetSide(Direction::RightToLeft), NodeSide::Right);
    EXPECT_EQ(sourceSide(Direction::RightToLeft), NodeSide::Left);

    EXPECT_STREQ(toString(NodeSide::Top), "top");
    EXPECT_STREQ(toString(NodeSide::Right), "right");
}
