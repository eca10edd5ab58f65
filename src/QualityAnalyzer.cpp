#include "QualityAnalyzer.h"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

#include "ImageUtils.h"
#include "Logger.h"

namespace graphscan {

namespace {

inline double normalizeMetric(double value, double low, double high)
{
    if (high <= low) {
        return 0.0;
    }
    const double t = (value - low) / (high - low);
    return std::clamp(t, 0.0, 1.0);
}

} // namespace

QualityAnalyzer::QualityAnalyzer(const QualityConfig &config) : m_cfg(sanitizeConfig(config)) {}

QualityReport QualityAnalyzer::analyze(const cv::Mat &image) const
{
    validateImage(image, "QualityAnalyzer");
    const cv::Mat gray = ensureGray(image);

    QualityReport report;
    report.contrast = contrastScore(gray);
    report.noise = noiseScore(gray);
    report.sharpness = sharpnessScore(gray);

    const double weightSum = m_cfg.contrastWeight + m_cfg.sharpnessWeight;
    const double detail = (m_cfg.contrastWeight * report.contrast + m_cfg.sharpnessWeight * report.sharpness) / weightSum;
    report.compositeScore = std::clamp(detail * (1.0 - report.noise), 0.0, 1.0);
    report.level = levelFor(report.compositeScore);

    report.brightness = cv::mean(gray)[0] / 255.0;
    cv::Mat edges;
    cv::Canny(gray, edges, m_cfg.cannyLow, m_cfg.cannyHigh);
    report.edgeDensity = static_cast<double>(cv::countNonZero(edges)) / static_cast<double>(edges.total());

    Logger::debug(QStringLiteral("Quality: level=%1 contrast=%2 noise=%3 sharpness=%4 composite=%5 | %6x%7")
                      .arg(QString::fromStdString(toString(report.level)))
                      .arg(report.contrast, 0, 'f', 3)
                      .arg(report.noise, 0, 'f', 3)
                      .arg(report.sharpness, 0, 'f', 3)
                      .arg(report.compositeScore, 0, 'f', 3)
                      .arg(gray.cols)
                      .arg(gray.rows));
    return report;
}

QualityLevel QualityAnalyzer::levelFor(double compositeScore) const
{
    if (compositeScore >= m_cfg.highThreshold) {
        return QualityLevel::High;
    }
    if (compositeScore >= m_cfg.mediumThreshold) {
        return QualityLevel::Medium;
    }
    if (compositeScore >= m_cfg.lowThreshold) {
        return QualityLevel::Low;
    }
    return QualityLevel::VeryLow;
}

// Spread between the low and high histogram tails.
double QualityAnalyzer::contrastScore(const cv::Mat &gray) const
{
    const int low = histogramPercentile(gray, m_cfg.histogramTail);
    const int high = histogramPercentile(gray, 1.0 - m_cfg.histogramTail);
    return std::clamp(static_cast<double>(high - low) / 255.0, 0.0, 1.0);
}

// Mean absolute residual against a median low-pass, normalised by pixel count.
double QualityAnalyzer::noiseScore(const cv::Mat &gray) const
{
    cv::Mat smoothed;
    cv::medianBlur(gray, smoothed, m_cfg.noiseMedianKernel);
    cv::Mat residual;
    cv::absdiff(gray, smoothed, residual);
    const double meanResidual = cv::mean(residual)[0];
    return normalizeMetric(meanResidual, m_cfg.noiseFloor, m_cfg.noiseCeiling);
}

// Share of edge pixels whose gradient is strong enough to count as crisp.
double QualityAnalyzer::sharpnessScore(const cv::Mat &gray) const
{
    cv::Mat gx;
    cv::Mat gy;
    cv::Sobel(gray, gx, CV_32F, 1, 0, 3);
    cv::Sobel(gray, gy, CV_32F, 0, 1, 3);
    cv::Mat magnitude;
    cv::magnitude(gx, gy, magnitude);

    const int edgePixels = cv::countNonZero(magnitude > m_cfg.weakGradient);
    if (edgePixels == 0) {
        return 0.0;
    }
    const int strongPixels = cv::countNonZero(magnitude > m_cfg.strongGradient);
    return std::clamp(static_cast<double>(strongPixels) / static_cast<double>(edgePixels), 0.0, 1.0);
}

} // namespace graphscan
