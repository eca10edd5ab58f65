#pragma once

#include <opencv2/core.hpp>

#include "Config.h"
#include "DetectionResult.h"

namespace graphscan {

// Scores how usable an image is for detection. Deterministic for identical pixels.
class QualityAnalyzer {
public:
    explicit QualityAnalyzer(const QualityConfig &config = QualityConfig());

    // Throws InvalidImage on malformed input.
    QualityReport analyze(const cv::Mat &image) const;

    [[nodiscard]] QualityLevel levelFor(double compositeScore) const;
    [[nodiscard]] const QualityConfig &config() const { return m_cfg; }

private:
    double contrastScore(const cv::Mat &gray) const;
    double noiseScore(const cv::Mat &gray) const;
    double sharpnessScore(const cv::Mat &gray) const;

    QualityConfig m_cfg;
};

} // namespace graphscan
