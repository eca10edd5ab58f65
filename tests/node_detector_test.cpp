#include <gtest/gtest.h>

#include <cmath>

#include "Errors.h"
#include "NodeDetector.h"
#include "SyntheticDiagrams.h"

using namespace graphscan;

TEST(NodeDetectorTest, BlankImageYieldsNothing)
{
    NodeDetector detector;
    EXPECT_TRUE(detector.detect(fixtures::blank()).empty());
}

TEST(NodeDetectorTest, FindsTwoFilledCircles)
{
    NodeDetector detector;
    const auto nodes = detector.detect(fixtures::twoCirclesJoined());
    ASSERT_EQ(nodes.size(), 2u);

    EXPECT_EQ(nodes[0].id, 0);
    EXPECT_EQ(nodes[1].id, 1);
    for (const auto &node : nodes) {
        EXPECT_EQ(node.shape.kind, ShapeKind::Circle);
        EXPECT_NEAR(node.shape.radius, fixtures::kRadius, 3.0);
        EXPECT_GT(node.confidence, 0.5);
        EXPECT_LE(node.confidence, 1.0);
        EXPECT_FALSE(node.label.has_value());
    }
    EXPECT_NEAR(nodes[0].shape.center.x, fixtures::kLeft.x, 2.0);
    EXPECT_NEAR(nodes[0].shape.center.y, fixtures::kLeft.y, 2.0);
    EXPECT_NEAR(nodes[1].shape.center.x, fixtures::kRight.x, 2.0);
}

TEST(NodeDetectorTest, FindsHollowCircles)
{
    NodeDetector detector;
    const auto nodes = detector.detect(fixtures::twoHollowCirclesJoined());
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].shape.kind, ShapeKind::Circle);
    EXPECT_NEAR(nodes[0].shape.center.x, fixtures::kLeft.x, 3.0);
    EXPECT_NEAR(nodes[1].shape.center.x, fixtures::kRight.x, 3.0);
}

TEST(NodeDetectorTest, HollowDetectionCanBeDisabled)
{
    NodeDetectionConfig cfg;
    cfg.detectHollowShapes = false;
    NodeDetector detector(cfg);
    EXPECT_TRUE(detector.detect(fixtures::twoHollowCirclesJoined()).empty());
}

TEST(NodeDetectorTest, ClassifiesRectangles)
{
    NodeDetector detector;
    const auto nodes = detector.detect(fixtures::twoRectanglesJoined());
    ASSERT_EQ(nodes.size(), 2u);
    for (const auto &node : nodes) {
        EXPECT_EQ(node.shape.kind, ShapeKind::Rectangle);
        EXPECT_EQ(node.shape.vertices.size(), 4u);
        EXPECT_NEAR(node.shape.bounds.width, 80.0, 3.0);
        EXPECT_NEAR(node.shape.bounds.height, 60.0, 3.0);
    }
    EXPECT_LT(nodes[0].shape.center.x, nodes[1].shape.center.x);
}

TEST(NodeDetectorTest, ClassifiesTrianglesAsPolygons)
{
    cv::Mat image = fixtures::blank();
    const std::vector<cv::Point> triangle {{200, 60}, {260, 180}, {140, 180}};
    cv::fillConvexPoly(image, triangle, cv::Scalar::all(0), cv::LINE_8);

    NodeDetector detector;
    const auto nodes = detector.detect(image);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].shape.kind, ShapeKind::Polygon);
    EXPECT_EQ(nodes[0].shape.vertices.size(), 3u);
}

TEST(NodeDetectorTest, OverlappingCandidatesKeepTheRounderShape)
{
    // The filled square and its circular hole are both candidates with overlapping bounds.
    cv::Mat image = fixtures::blank();
    cv::rectangle(image, cv::Rect(145, 95, 110, 110), cv::Scalar::all(0), cv::FILLED, cv::LINE_8);
    cv::circle(image, {200, 150}, 40, cv::Scalar::all(255), cv::FILLED, cv::LINE_8);

    const auto nodes = NodeDetector().detect(image);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].shape.kind, ShapeKind::Circle);
    EXPECT_NEAR(nodes[0].shape.center.x, 200.0, 3.0);
    EXPECT_NEAR(nodes[0].shape.center.y, 150.0, 3.0);
    EXPECT_NEAR(nodes[0].shape.radius, 40.0, 3.0);
}

TEST(NodeDetectorTest, OverlapSuppressionCanBeRelaxed)
{
    cv::Mat image = fixtures::blank();
    cv::rectangle(image, cv::Rect(145, 95, 110, 110), cv::Scalar::all(0), cv::FILLED, cv::LINE_8);
    cv::circle(image, {200, 150}, 40, cv::Scalar::all(255), cv::FILLED, cv::LINE_8);

    NodeDetectionConfig cfg;
    cfg.suppressionIoU = 0.9;
    const auto nodes = NodeDetector(cfg).detect(image);
    ASSERT_EQ(nodes.size(), 2u);
}

TEST(NodeDetectorTest, IgnoresSpecksAndStrokes)
{
    cv::Mat image = fixtures::blank();
    cv::circle(image, {50, 50}, 3, cv::Scalar::all(0), cv::FILLED);
    cv::line(image, {100, 250}, {350, 250}, cv::Scalar::all(0), 3);

    NodeDetector detector;
    EXPECT_TRUE(detector.detect(image).empty());
}

TEST(NodeDetectorTest, OrdersTopToBottomThenLeftToRight)
{
    cv::Mat image = fixtures::blank();
    cv::circle(image, {300, 60}, 25, cv::Scalar::all(0), cv::FILLED);
    cv::circle(image, {100, 60}, 25, cv::Scalar::all(0), cv::FILLED);
    cv::circle(image, {200, 220}, 25, cv::Scalar::all(0), cv::FILLED);

    NodeDetector detector;
    const auto nodes = detector.detect(image);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_NEAR(nodes[0].shape.center.x, 100.0, 2.0);
    EXPECT_NEAR(nodes[1].shape.center.x, 300.0, 2.0);
    EXPECT_NEAR(nodes[2].shape.center.y, 220.0, 2.0);
}

TEST(NodeDetectorTest, WorksOnGrayscaleAndDarkBackgrounds)
{
    cv::Mat gray;
    cv::cvtColor(fixtures::twoCirclesJoined(), gray, cv::COLOR_BGR2GRAY);
    NodeDetector detector;
    EXPECT_EQ(detector.detect(gray).size(), 2u);

    cv::Mat inverted;
    cv::bitwise_not(gray, inverted);
    EXPECT_EQ(detector.detect(inverted).size(), 2u);
}

TEST(NodeDetectorTest, RejectsEmptyImage)
{
    NodeDetector detector;
    EXPECT_THROW(detector.detect(cv::Mat()), InvalidImage);
}
