#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <algorithm>

#include "Errors.h"
#include "FakeOcrEngine.h"
#include "GraphExtractor.h"
#include "SyntheticDiagrams.h"

using namespace graphscan;

namespace {

PipelineConfig uncached_config()
{
    PipelineConfig cfg;
    cfg.cache.enabled = false;
    return cfg;
}

PipelineConfig cached_config(const QTemporaryDir &dir)
{
    PipelineConfig cfg;
    cfg.cache.enabled = true;
    cfg.cache.directory = dir.path();
    return cfg;
}

void expect_referential_integrity(const DetectionResult &result)
{
    for (const auto &edge : result.edges) {
        EXPECT_NE(result.findNode(edge.source), nullptr) << "edge " << edge.id;
        EXPECT_NE(result.findNode(edge.target), nullptr) << "edge " << edge.id;
        EXPECT_NE(edge.source, edge.target);
    }
}

bool has_stage(const DetectionDiagnostics &diagnostics, const std::string &stage)
{
    return std::any_of(diagnostics.timings.begin(), diagnostics.timings.end(),
                       [&stage](const StageTiming &t) { return t.stage == stage; });
}

} // namespace

TEST(GraphExtractorTest, TwoCirclesAndALineWithoutText)
{
    GraphExtractor extractor(uncached_config());
    const auto result = extractor.extract(fixtures::twoCirclesJoined());

    ASSERT_EQ(result->nodes.size(), 2u);
    ASSERT_EQ(result->edges.size(), 1u);
    EXPECT_FALSE(result->edges[0].directed);
    EXPECT_EQ(result->edges[0].source, 0);
    EXPECT_EQ(result->edges[0].target, 1);
    EXPECT_EQ(result->labelCount(), 0);
    EXPECT_TRUE(result->diagnostics.labelsUnavailable);
    EXPECT_EQ(result->quality.level, QualityLevel::High);
    expect_referential_integrity(*result);
}

TEST(GraphExtractorTest, RepeatedImageIsServedFromCache)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    GraphExtractor extractor(cached_config(dir));

    const cv::Mat image = fixtures::twoCirclesJoined();
    const auto first = extractor.extract(image);
    const auto second = extractor.extract(image.clone());

    EXPECT_FALSE(first->diagnostics.cacheHit);
    EXPECT_TRUE(second->diagnostics.cacheHit);
    EXPECT_TRUE(second->sameContent(*first));
    EXPECT_EQ(extractor.pipelineRuns(), 1);
}

TEST(GraphExtractorTest, CacheSurvivesANewExtractor)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const cv::Mat image = fixtures::twoCirclesArrow();

    DetectionResultPtr first;
    {
        GraphExtractor extractor(cached_config(dir));
        first = extractor.extract(image);
    }

    GraphExtractor reopened(cached_config(dir));
    const auto second = reopened.extract(image);
    EXPECT_EQ(reopened.pipelineRuns(), 0);
    EXPECT_TRUE(second->diagnostics.cacheHit);
    EXPECT_TRUE(second->sameContent(*first));
}

TEST(GraphExtractorTest, ConcurrentIdenticalRequestsRunOnce)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    PipelineConfig cfg = cached_config(dir);
    cfg.concurrency.workerThreads = 4;
    GraphExtractor extractor(cfg);

    const cv::Mat image = fixtures::twoCirclesDashed();
    QList<QFuture<DetectionResultPtr>> futures;
    for (int i = 0; i < 6; ++i) {
        futures << extractor.extractAsync(image);
    }

    DetectionResultPtr reference;
    for (auto &future : futures) {
        const auto result = future.result();
        ASSERT_NE(result, nullptr);
        if (!reference) {
            reference = result;
        }
        EXPECT_TRUE(result->sameContent(*reference));
    }
    EXPECT_EQ(extractor.pipelineRuns(), 1);
}

TEST(GraphExtractorTest, NoisyImageRecoversCleanNodeCount)
{
    GraphExtractor extractor(uncached_config());
    const auto clean = extractor.extract(fixtures::twoCirclesJoined());
    const auto noisy = extractor.extract(fixtures::degraded(fixtures::twoCirclesJoined()));

    EXPECT_EQ(noisy->quality.level, QualityLevel::VeryLow);
    EXPECT_EQ(ImageEnhancer::planFor(noisy->quality.level).size(), 4u);
    EXPECT_GE(noisy->nodes.size(), clean->nodes.size());
    expect_referential_integrity(*noisy);
}

TEST(GraphExtractorTest, BlankImageGivesEmptyGraph)
{
    GraphExtractor extractor(uncached_config());
    const auto result = extractor.extract(fixtures::blank());
    EXPECT_TRUE(result->nodes.empty());
    EXPECT_TRUE(result->edges.empty());
}

TEST(GraphExtractorTest, MalformedImageIsRejected)
{
    GraphExtractor extractor(uncached_config());
    EXPECT_THROW(extractor.extract(cv::Mat()), InvalidImage);
    EXPECT_THROW(extractor.extract(cv::Mat(20, 20, CV_8UC2, cv::Scalar::all(0))), InvalidImage);
    EXPECT_EQ(extractor.pipelineRuns(), 0);
}

TEST(GraphExtractorTest, LabelsFromOcrAreAttached)
{
    auto engine = std::make_shared<FakeOcrEngine>(std::vector<TextRegion> {
        TextRegion {"A", 0.92, cv::Rect2f(92, 142, 16, 16)},
        TextRegion {"B", 0.90, cv::Rect2f(292, 142, 16, 16)},
        TextRegion {"5", 0.85, cv::Rect2f(194, 126, 12, 14)},
        TextRegion {"Figure 1", 0.95, cv::Rect2f(150, 260, 100, 20)},
    });
    GraphExtractor extractor(uncached_config(), engine);
    const auto result = extractor.extract(fixtures::twoCirclesJoined());

    ASSERT_EQ(result->nodes.size(), 2u);
    ASSERT_EQ(result->edges.size(), 1u);
    ASSERT_TRUE(result->nodes[0].label.has_value());
    EXPECT_EQ(result->nodes[0].label->text, "A");
    ASSERT_TRUE(result->nodes[1].label.has_value());
    EXPECT_EQ(result->nodes[1].label->text, "B");
    ASSERT_TRUE(result->edges[0].label.has_value());
    EXPECT_EQ(result->edges[0].label->text, "5");
    EXPECT_FALSE(result->diagnostics.labelsUnavailable);
    EXPECT_EQ(result->diagnostics.textRegionCount, 4);
    EXPECT_EQ(result->diagnostics.unclaimedTextRegions, 1);
}

TEST(GraphExtractorTest, OcrFailureKeepsTheGraph)
{
    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setFailing(true);
    GraphExtractor extractor(uncached_config(), engine);
    const auto result = extractor.extract(fixtures::twoCirclesJoined());

    EXPECT_EQ(result->nodes.size(), 2u);
    EXPECT_EQ(result->edges.size(), 1u);
    EXPECT_TRUE(result->diagnostics.labelsUnavailable);
    EXPECT_EQ(result->labelCount(), 0);
    ASSERT_FALSE(result->diagnostics.notes.empty());
}

TEST(GraphExtractorTest, DiagnosticsDescribeTheRun)
{
    GraphExtractor extractor(uncached_config());
    const cv::Mat image = fixtures::twoCirclesArrow();
    const auto result = extractor.extract(image);

    EXPECT_EQ(result->diagnostics.resolution, image.size());
    EXPECT_EQ(QString::fromStdString(result->diagnostics.imageHash), extractor.hashOf(image));
    EXPECT_FALSE(result->diagnostics.cacheHit);
    for (const char *stage : {"quality", "enhancement", "node_detection", "edge_detection", "text_localization",
                              "text_mapping"}) {
        EXPECT_TRUE(has_stage(result->diagnostics, stage)) << stage;
    }
    EXPECT_EQ(result->diagnostics.timings.size(), 6u);
    EXPECT_FALSE(has_stage(result->diagnostics, "assembly"));
    expect_referential_integrity(*result);
}

TEST(GraphExtractorTest, WorkerCountFollowsConfiguration)
{
    PipelineConfig cfg = uncached_config();
    cfg.concurrency.workerThreads = 3;
    EXPECT_EQ(GraphExtractor(cfg).workerCount(), 3);

    cfg.concurrency.workerThreads = 0;
    EXPECT_GE(GraphExtractor(cfg).workerCount(), 1);
}
