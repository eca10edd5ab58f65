#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "Config.h"
#include "DetectionResult.h"

namespace graphscan {

enum class EnhancementOp {
    ContrastNormalize,
    Denoise,
    StrongDenoise,
    LocalContrast,
    Sharpen,
    Binarize
};

std::string toString(EnhancementOp op);

// Quality-driven preprocessing. Every operation works on luminance and returns
// an image with the input's size and channel layout.
class ImageEnhancer {
public:
    explicit ImageEnhancer(const EnhancementConfig &config = EnhancementConfig());

    // Fixed decision table, independent of image content.
    static std::vector<EnhancementOp> planFor(QualityLevel level);

    cv::Mat apply(EnhancementOp op, const cv::Mat &image) const;

    // HIGH returns the input itself (shared buffer, no copy).
    cv::Mat enhance(const cv::Mat &image, const QualityReport &report) const;

    [[nodiscard]] const EnhancementConfig &config() const { return m_cfg; }

private:
    cv::Mat normalizeContrast(const cv::Mat &luma) const;
    cv::Mat denoise(const cv::Mat &luma, int medianKernel, double strength) const;
    cv::Mat localContrast(const cv::Mat &luma) const;
    cv::Mat sharpen(const cv::Mat &luma) const;
    cv::Mat binarize(const cv::Mat &luma) const;

    EnhancementConfig m_cfg;
};

} // namespace graphscan
