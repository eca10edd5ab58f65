#pragma once

#include <QString>

#include <opencv2/core.hpp>

namespace graphscan {

QString matTypeToString(int type);

// Throws InvalidImage for empty buffers, zero dimensions or channel counts outside {1, 3, 4}.
void validateImage(const cv::Mat &image, const char *stage);

// 8-bit single channel luminance. Other depths are range-scaled to [0, 255].
cv::Mat ensureGray(const cv::Mat &input);

// Ink mask (255 = drawn pixel) from Otsu thresholding. A dark-background image is
// inverted so strokes are always foreground. A flat image yields an all-zero mask.
cv::Mat inkMask(const cv::Mat &gray);

// Intensity at the given cumulative fraction of an 8-bit single channel histogram.
int histogramPercentile(const cv::Mat &gray, double fraction);

} // namespace graphscan
