#include <gtest/gtest.h>

#include "ImageEnhancer.h"
#include "QualityAnalyzer.h"
#include "SyntheticDiagrams.h"

using namespace graphscan;

namespace {

double max_abs_difference(const cv::Mat &a, const cv::Mat &b)
{
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    double maxVal = 0.0;
    cv::minMaxLoc(diff.reshape(1), nullptr, &maxVal);
    return maxVal;
}

} // namespace

TEST(ImageEnhancerTest, PlanIsFixedPerLevel)
{
    EXPECT_TRUE(ImageEnhancer::planFor(QualityLevel::High).empty());
    EXPECT_EQ(ImageEnhancer::planFor(QualityLevel::Medium),
              (std::vector<EnhancementOp> {EnhancementOp::ContrastNormalize}));
    EXPECT_EQ(ImageEnhancer::planFor(QualityLevel::Low),
              (std::vector<EnhancementOp> {EnhancementOp::Denoise, EnhancementOp::ContrastNormalize,
                                           EnhancementOp::Sharpen}));
    EXPECT_EQ(ImageEnhancer::planFor(QualityLevel::VeryLow),
              (std::vector<EnhancementOp> {EnhancementOp::StrongDenoise, EnhancementOp::LocalContrast,
                                           EnhancementOp::Sharpen, EnhancementOp::Binarize}));
}

TEST(ImageEnhancerTest, HighQualityPassesThroughUntouched)
{
    ImageEnhancer enhancer;
    const cv::Mat image = fixtures::twoCirclesJoined();
    QualityReport report;
    report.level = QualityLevel::High;

    const cv::Mat out = enhancer.enhance(image, report);
    EXPECT_EQ(out.data, image.data);
    EXPECT_EQ(max_abs_difference(out, image), 0.0);
}

TEST(ImageEnhancerTest, MediumEnhancementIsIdempotent)
{
    ImageEnhancer enhancer;
    cv::Mat washedOut;
    fixtures::twoCirclesJoined().convertTo(washedOut, CV_8UC3, 0.5, 90.0);
    QualityReport report;
    report.level = QualityLevel::Medium;

    const cv::Mat once = enhancer.enhance(washedOut, report);
    const cv::Mat twice = enhancer.enhance(once, report);
    EXPECT_LE(max_abs_difference(once, twice), 1.0);
}

TEST(ImageEnhancerTest, ContrastNormalizeStretchesRange)
{
    ImageEnhancer enhancer;
    cv::Mat washedOut;
    fixtures::twoCirclesJoined().convertTo(washedOut, CV_8UC3, 0.5, 90.0);

    const cv::Mat out = enhancer.apply(EnhancementOp::ContrastNormalize, washedOut);
    cv::Mat gray;
    cv::cvtColor(out, gray, cv::COLOR_BGR2GRAY);
    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(gray, &minVal, &maxVal);
    EXPECT_LE(minVal, 5.0);
    EXPECT_GE(maxVal, 250.0);
}

TEST(ImageEnhancerTest, OperationsKeepSizeAndChannels)
{
    ImageEnhancer enhancer;
    const cv::Mat color = fixtures::degraded(fixtures::twoCirclesJoined());
    cv::Mat gray;
    cv::cvtColor(color, gray, cv::COLOR_BGR2GRAY);

    for (auto op : {EnhancementOp::ContrastNormalize, EnhancementOp::Denoise, EnhancementOp::StrongDenoise,
                    EnhancementOp::LocalContrast, EnhancementOp::Sharpen, EnhancementOp::Binarize}) {
        const cv::Mat outColor = enhancer.apply(op, color);
        EXPECT_EQ(outColor.size(), color.size()) << toString(op);
        EXPECT_EQ(outColor.type(), color.type()) << toString(op);

        const cv::Mat outGray = enhancer.apply(op, gray);
        EXPECT_EQ(outGray.size(), gray.size()) << toString(op);
        EXPECT_EQ(outGray.type(), gray.type()) << toString(op);
    }
}

TEST(ImageEnhancerTest, BinarizeProducesTwoLevels)
{
    ImageEnhancer enhancer;
    const cv::Mat out = enhancer.apply(EnhancementOp::Binarize, fixtures::degraded(fixtures::twoCirclesJoined()));
    cv::Mat gray;
    cv::cvtColor(out, gray, cv::COLOR_BGR2GRAY);
    const int dark = cv::countNonZero(gray == 0);
    const int light = cv::countNonZero(gray == 255);
    EXPECT_EQ(dark + light, static_cast<int>(gray.total()));
}

TEST(ImageEnhancerTest, VeryLowChainReducesNoise)
{
    ImageEnhancer enhancer;
    QualityAnalyzer analyzer;
    const cv::Mat noisy = fixtures::degraded(fixtures::twoCirclesJoined());
    const auto before = analyzer.analyze(noisy);
    ASSERT_EQ(before.level, QualityLevel::VeryLow);

    const auto after = analyzer.analyze(enhancer.enhance(noisy, before));
    EXPECT_LT(after.noise, before.noise);
}
