#include <gtest/gtest.h>

#include <QThreadPool>

#include "FakeOcrEngine.h"
#include "SyntheticDiagrams.h"
#include "TextLocalizer.h"

using namespace graphscan;

namespace {

TextRegion scripted(const std::string &text, double confidence, cv::Rect2f box)
{
    return TextRegion {text, confidence, box};
}

} // namespace

class TextLocalizerTest : public ::testing::Test {
protected:
    void TearDown() override { pool.waitForDone(); }

    QThreadPool pool;
    cv::Mat image = fixtures::twoCirclesJoined();
};

TEST_F(TextLocalizerTest, DisabledReportsUnavailable)
{
    TextConfig cfg;
    cfg.enabled = false;
    auto engine = std::make_shared<FakeOcrEngine>();
    const auto text = TextLocalizer(engine, &pool, cfg).localize(image, {}, {});
    EXPECT_FALSE(text.available);
    EXPECT_TRUE(text.regions.empty());
    EXPECT_EQ(engine->calls(), 0);
}

TEST_F(TextLocalizerTest, MissingEngineReportsUnavailable)
{
    const auto text = TextLocalizer(nullptr, &pool).localize(image, {}, {});
    EXPECT_FALSE(text.available);
}

TEST_F(TextLocalizerTest, FiltersLowConfidenceAndBlankText)
{
    auto engine = std::make_shared<FakeOcrEngine>(std::vector<TextRegion> {
        scripted("  A ", 0.9, {90, 140, 20, 20}),
        scripted("noise", 0.1, {10, 10, 20, 10}),
        scripted("   ", 0.95, {200, 100, 10, 10}),
    });
    const auto text = TextLocalizer(engine, &pool).localize(image, {}, {});
    EXPECT_TRUE(text.available);
    ASSERT_EQ(text.regions.size(), 1u);
    EXPECT_EQ(text.regions[0].text, "A");
    EXPECT_FLOAT_EQ(text.regions[0].box.x, 90.0F);
}

TEST_F(TextLocalizerTest, PassesConfiguredLanguages)
{
    TextConfig cfg;
    cfg.languages = QStringList {QStringLiteral("eng"), QStringLiteral("deu")};
    auto engine = std::make_shared<FakeOcrEngine>();
    TextLocalizer(engine, &pool, cfg).localize(image, {}, {});
    EXPECT_EQ(engine->lastLanguages(), cfg.languages);
}

TEST_F(TextLocalizerTest, EngineFailureDegradesToNoLabels)
{
    auto engine = std::make_shared<FakeOcrEngine>(std::vector<TextRegion> {scripted("A", 0.9, {90, 140, 20, 20})});
    engine->setFailing(true);
    const auto text = TextLocalizer(engine, &pool).localize(image, {}, {});
    EXPECT_FALSE(text.available);
    EXPECT_TRUE(text.regions.empty());
    EXPECT_TRUE(text.note.contains(QStringLiteral("fake engine offline")));
}

TEST_F(TextLocalizerTest, SlowEngineTimesOut)
{
    TextConfig cfg;
    cfg.timeoutMs = 50;
    auto engine = std::make_shared<FakeOcrEngine>(std::vector<TextRegion> {scripted("A", 0.9, {90, 140, 20, 20})});
    engine->setDelayMs(500);
    const auto text = TextLocalizer(engine, &pool, cfg).localize(image, {}, {});
    EXPECT_FALSE(text.available);
    EXPECT_TRUE(text.note.contains(QStringLiteral("timed out")));
}

TEST_F(TextLocalizerTest, ElementCropsVisitEachElement)
{
    TextConfig cfg;
    cfg.cropMode = TextCropMode::ElementCrops;
    auto engine = std::make_shared<FakeOcrEngine>();

    Node left;
    left.id = 0;
    left.shape = Shape::circle({100, 150}, 30);
    Node right;
    right.id = 1;
    right.shape = Shape::circle({300, 150}, 30);
    Edge edge;
    edge.source = 0;
    edge.target = 1;
    edge.sourcePoint = {130, 150};
    edge.targetPoint = {270, 150};

    const auto text = TextLocalizer(engine, &pool, cfg).localize(image, {left, right}, {edge});
    EXPECT_TRUE(text.available);
    EXPECT_EQ(engine->calls(), 3);
}

TEST_F(TextLocalizerTest, ElementCropsWithoutElementsSkipsEngine)
{
    TextConfig cfg;
    cfg.cropMode = TextCropMode::ElementCrops;
    auto engine = std::make_shared<FakeOcrEngine>();
    const auto text = TextLocalizer(engine, &pool, cfg).localize(image, {}, {});
    EXPECT_TRUE(text.available);
    EXPECT_EQ(engine->calls(), 0);
}

TEST_F(TextLocalizerTest, WordSeenThroughOverlappingCropsIsReportedOnce)
{
    TextConfig cfg;
    cfg.cropMode = TextCropMode::ElementCrops;
    cfg.cropPadding = 12;
    auto engine = std::make_shared<FakeOcrEngine>(std::vector<TextRegion> {scripted("A", 0.9, {116, 144, 8, 12})});

    Node left;
    left.id = 0;
    left.shape = Shape::circle({100, 150}, 15);
    Node right;
    right.id = 1;
    right.shape = Shape::circle({140, 150}, 15);

    const auto text = TextLocalizer(engine, &pool, cfg).localize(image, {left, right}, {});
    EXPECT_EQ(engine->calls(), 2);
    ASSERT_EQ(text.regions.size(), 1u);
    EXPECT_EQ(text.regions[0].text, "A");
    EXPECT_FLOAT_EQ(text.regions[0].box.x, 116.0F);
}

TEST_F(TextLocalizerTest, OverlappingDuplicatesKeepTheMoreConfidentCopy)
{
    auto engine = std::make_shared<FakeOcrEngine>(std::vector<TextRegion> {
        scripted("B", 0.5, {200, 100, 20, 20}),
        scripted("B", 0.8, {202, 101, 20, 20}),
        scripted("C", 0.7, {200, 100, 20, 20}),
        scripted("B", 0.6, {320, 100, 20, 20}),
    });
    const auto text = TextLocalizer(engine, &pool).localize(image, {}, {});
    ASSERT_EQ(text.regions.size(), 3u);
    EXPECT_EQ(text.regions[0].text, "B");
    EXPECT_DOUBLE_EQ(text.regions[0].confidence, 0.8);
    EXPECT_EQ(text.regions[1].text, "C");
    EXPECT_FLOAT_EQ(text.regions[2].box.x, 320.0F);
}
