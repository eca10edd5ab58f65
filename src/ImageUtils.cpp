#include "ImageUtils.h"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

#include "Errors.h"

namespace graphscan {

namespace {
constexpr double kFlatImageSpread = 8.0;
}

QString matTypeToString(int type)
{
    const int depth = type & CV_MAT_DEPTH_MASK;
    const int channels = 1 + (type >> CV_CN_SHIFT);
    QString depthStr;
    switch (depth) {
    case CV_8U: depthStr = QStringLiteral("8U"); break;
    case CV_8S: depthStr = QStringLiteral("8S"); break;
    case CV_16U: depthStr = QStringLiteral("16U"); break;
    case CV_16S: depthStr = QStringLiteral("16S"); break;
    case CV_32S: depthStr = QStringLiteral("32S"); break;
    case CV_32F: depthStr = QStringLiteral("32F"); break;
    case CV_64F: depthStr = QStringLiteral("64F"); break;
    default: depthStr = QStringLiteral("Unknown"); break;
    }
    return QStringLiteral("CV_%1C%2").arg(depthStr).arg(channels);
}

void validateImage(const cv::Mat &image, const char *stage)
{
    const std::string prefix = std::string(stage) + ": ";
    if (image.empty() || image.data == nullptr) {
        throw InvalidImage(prefix + "image buffer is empty");
    }
    if (image.cols <= 0 || image.rows <= 0 || image.dims != 2) {
        throw InvalidImage(prefix + "image has zero or unsupported dimensions");
    }
    const int channels = image.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        throw InvalidImage(prefix + "unsupported channel count " + std::to_string(channels));
    }
}

cv::Mat ensureGray(const cv::Mat &input)
{
    cv::Mat eightBit;
    if (input.depth() != CV_8U) {
        double minVal = 0.0;
        double maxVal = 0.0;
        cv::minMaxLoc(input.reshape(1), &minVal, &maxVal);
        if (!std::isfinite(minVal) || !std::isfinite(maxVal) || std::abs(maxVal - minVal) < 1e-6) {
            eightBit = cv::Mat::zeros(input.size(), CV_MAKETYPE(CV_8U, input.channels()));
        } else {
            const double scale = 255.0 / (maxVal - minVal);
            input.convertTo(eightBit, CV_8U, scale, -minVal * scale);
        }
    } else {
        eightBit = input;
    }

    if (eightBit.channels() == 1) {
        return eightBit;
    }
    cv::Mat gray;
    if (eightBit.channels() == 4) {
        cv::cvtColor(eightBit, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(eightBit, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}

cv::Mat inkMask(const cv::Mat &gray)
{
    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(gray, &minVal, &maxVal);
    if (maxVal - minVal < kFlatImageSpread) {
        return cv::Mat::zeros(gray.size(), CV_8UC1);
    }

    cv::Mat binary;
    cv::threshold(gray, binary, 0.0, 255.0, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

    // More than half the frame marked as ink means the background itself is dark.
    if (cv::countNonZero(binary) * 2 > binary.rows * binary.cols) {
        cv::bitwise_not(binary, binary);
    }
    return binary;
}

int histogramPercentile(const cv::Mat &gray, double fraction)
{
    const int histSize = 256;
    const float range[] = {0.0F, 256.0F};
    const float *ranges[] = {range};
    cv::Mat hist;
    cv::calcHist(&gray, 1, nullptr, cv::Mat(), hist, 1, &histSize, ranges);

    const double total = static_cast<double>(gray.total());
    const double target = std::clamp(fraction, 0.0, 1.0) * total;
    double cumulative = 0.0;
    for (int i = 0; i < histSize; ++i) {
        cumulative += static_cast<double>(hist.at<float>(i));
        if (cumulative >= target && cumulative > 0.0) {
            return i;
        }
    }
    return histSize - 1;
}

} // namespace graphscan
