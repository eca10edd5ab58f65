#include "ImageEnhancer.h"

#include <algorithm>
#include <functional>

#include <QStringList>

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

#include "ImageUtils.h"
#include "Logger.h"

namespace graphscan {

namespace {

using LumaTransform = std::function<cv::Mat(const cv::Mat &)>;

cv::Mat to8u(const cv::Mat &image)
{
    if (image.depth() == CV_8U) {
        return image;
    }
    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(image.reshape(1), &minVal, &maxVal);
    cv::Mat converted;
    if (maxVal - minVal < 1e-6) {
        converted = cv::Mat::zeros(image.size(), CV_MAKETYPE(CV_8U, image.channels()));
        return converted;
    }
    const double scale = 255.0 / (maxVal - minVal);
    image.convertTo(converted, CV_8U, scale, -minVal * scale);
    return converted;
}

// Runs transform on the luminance plane. A transform that hands back its input
// buffer signals "no change" and the original image is returned untouched.
// With replicate set the result replaces all colour channels (binary output).
cv::Mat applyToLuminance(const cv::Mat &image, const LumaTransform &transform, bool replicate)
{
    if (image.channels() == 1) {
        return transform(image);
    }

    if (image.channels() == 4) {
        std::vector<cv::Mat> bgra;
        cv::split(image, bgra);
        cv::Mat alpha = bgra[3];
        bgra.pop_back();
        cv::Mat bgr;
        cv::merge(bgra, bgr);
        const cv::Mat processed = applyToLuminance(bgr, transform, replicate);
        if (processed.data == bgr.data) {
            return image;
        }
        std::vector<cv::Mat> out;
        cv::split(processed, out);
        out.push_back(alpha);
        cv::Mat merged;
        cv::merge(out, merged);
        return merged;
    }

    cv::Mat ycrcb;
    cv::cvtColor(image, ycrcb, cv::COLOR_BGR2YCrCb);
    std::vector<cv::Mat> planes;
    cv::split(ycrcb, planes);
    const cv::Mat luma = transform(planes[0]);
    if (luma.data == planes[0].data) {
        return image;
    }

    cv::Mat result;
    if (replicate) {
        cv::merge(std::vector<cv::Mat> {luma, luma, luma}, result);
        return result;
    }
    planes[0] = luma;
    cv::merge(planes, ycrcb);
    cv::cvtColor(ycrcb, result, cv::COLOR_YCrCb2BGR);
    return result;
}

} // namespace

std::string toString(EnhancementOp op)
{
    switch (op) {
    case EnhancementOp::ContrastNormalize:
        return "contrast_normalize";
    case EnhancementOp::Denoise:
        return "denoise";
    case EnhancementOp::StrongDenoise:
        return "strong_denoise";
    case EnhancementOp::LocalContrast:
        return "local_contrast";
    case EnhancementOp::Sharpen:
        return "sharpen";
    case EnhancementOp::Binarize:
    default:
        return "binarize";
    }
}

ImageEnhancer::ImageEnhancer(const EnhancementConfig &config) : m_cfg(sanitizeConfig(config)) {}

std::vector<EnhancementOp> ImageEnhancer::planFor(QualityLevel level)
{
    switch (level) {
    case QualityLevel::High:
        return {};
    case QualityLevel::Medium:
        return {EnhancementOp::ContrastNormalize};
    case QualityLevel::Low:
        return {EnhancementOp::Denoise, EnhancementOp::ContrastNormalize, EnhancementOp::Sharpen};
    case QualityLevel::VeryLow:
    default:
        return {EnhancementOp::StrongDenoise, EnhancementOp::LocalContrast, EnhancementOp::Sharpen,
                EnhancementOp::Binarize};
    }
}

cv::Mat ImageEnhancer::apply(EnhancementOp op, const cv::Mat &image) const
{
    validateImage(image, "ImageEnhancer");
    const cv::Mat input = to8u(image);

    switch (op) {
    case EnhancementOp::ContrastNormalize:
        return applyToLuminance(input, [this](const cv::Mat &luma) { return normalizeContrast(luma); }, false);
    case EnhancementOp::Denoise:
        return applyToLuminance(input, [this](const cv::Mat &luma) {
            return denoise(luma, m_cfg.denoiseMedianKernel, m_cfg.denoiseStrength);
        }, false);
    case EnhancementOp::StrongDenoise:
        return applyToLuminance(input, [this](const cv::Mat &luma) {
            return denoise(luma, m_cfg.strongDenoiseMedianKernel, m_cfg.strongDenoiseStrength);
        }, false);
    case EnhancementOp::LocalContrast:
        return applyToLuminance(input, [this](const cv::Mat &luma) { return localContrast(luma); }, false);
    case EnhancementOp::Sharpen:
        return applyToLuminance(input, [this](const cv::Mat &luma) { return sharpen(luma); }, false);
    case EnhancementOp::Binarize:
    default:
        return applyToLuminance(input, [this](const cv::Mat &luma) { return binarize(luma); }, true);
    }
}

cv::Mat ImageEnhancer::enhance(const cv::Mat &image, const QualityReport &report) const
{
    const auto plan = planFor(report.level);
    if (plan.empty()) {
        return image;
    }

    cv::Mat current = image;
    QStringList applied;
    for (const auto op : plan) {
        current = apply(op, current);
        applied << QString::fromStdString(toString(op));
    }
    Logger::debug(QStringLiteral("Enhancement for %1: %2")
                      .arg(QString::fromStdString(toString(report.level)))
                      .arg(applied.join(QStringLiteral(" -> "))));
    return current;
}

// Percentile stretch. Already-normalised input is returned as is.
cv::Mat ImageEnhancer::normalizeContrast(const cv::Mat &luma) const
{
    const int low = histogramPercentile(luma, m_cfg.contrastLowPercentile);
    const int high = histogramPercentile(luma, m_cfg.contrastHighPercentile);
    if (low <= m_cfg.contrastTolerance && high >= 255 - m_cfg.contrastTolerance) {
        return luma;
    }
    if (high <= low) {
        return luma;
    }
    const double scale = 255.0 / static_cast<double>(high - low);
    cv::Mat stretched;
    luma.convertTo(stretched, CV_8U, scale, -static_cast<double>(low) * scale);
    return stretched;
}

cv::Mat ImageEnhancer::denoise(const cv::Mat &luma, int medianKernel, double strength) const
{
    cv::Mat median;
    cv::medianBlur(luma, median, medianKernel);
    cv::Mat result;
    cv::fastNlMeansDenoising(median, result, static_cast<float>(strength), m_cfg.nlmTemplateWindow,
                             m_cfg.nlmSearchWindow);
    return result;
}

cv::Mat ImageEnhancer::localContrast(const cv::Mat &luma) const
{
    auto clahe = cv::createCLAHE(m_cfg.claheClipLimit, m_cfg.claheTileGrid);
    cv::Mat result;
    clahe->apply(luma, result);
    return result;
}

// Unsharp mask.
cv::Mat ImageEnhancer::sharpen(const cv::Mat &luma) const
{
    cv::Mat blurred;
    cv::GaussianBlur(luma, blurred, cv::Size(0, 0), m_cfg.sharpenSigma);
    cv::Mat result;
    cv::addWeighted(luma, 1.0 + m_cfg.sharpenAmount, blurred, -m_cfg.sharpenAmount, 0.0, result);
    return result;
}

cv::Mat ImageEnhancer::binarize(const cv::Mat &luma) const
{
    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(luma, &minVal, &maxVal);
    if (maxVal - minVal < static_cast<double>(m_cfg.minBinarizeSpread)) {
        return luma;
    }
    cv::Mat result;
    cv::threshold(luma, result, 0.0, 255.0, cv::THRESH_BINARY | cv::THRESH_OTSU);
    return result;
}

} // namespace graphscan
