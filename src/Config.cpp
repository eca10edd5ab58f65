#include "Config.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>
#include <cmath>

#include "Logger.h"

namespace graphscan {

namespace {

double positiveDouble(double value, double fallback, const char *name)
{
    if (!std::isfinite(value) || value <= 0.0) {
        Logger::warning(QStringLiteral("Config %1=%2 is invalid, falling back to %3")
                            .arg(QString::fromUtf8(name))
                            .arg(QString::number(value, 'g', 6))
                            .arg(QString::number(fallback, 'g', 6)));
        return fallback;
    }
    return value;
}

double unitDouble(double value, double fallback, const char *name)
{
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        Logger::warning(QStringLiteral("Config %1=%2 is outside [0,1], falling back to %3")
                            .arg(QString::fromUtf8(name))
                            .arg(QString::number(value, 'g', 6))
                            .arg(QString::number(fallback, 'g', 6)));
        return fallback;
    }
    return value;
}

int positiveInt(int value, int fallback, const char *name)
{
    if (value <= 0) {
        Logger::warning(QStringLiteral("Config %1=%2 is invalid, falling back to %3")
                            .arg(QString::fromUtf8(name))
                            .arg(value)
                            .arg(fallback));
        return fallback;
    }
    return value;
}

int oddKernel(int value, int fallback, const char *name)
{
    int kernel = positiveInt(value, fallback, name);
    if (kernel % 2 == 0) {
        ++kernel;
    }
    return kernel;
}

cv::Size positiveSize(cv::Size size, int fallback, const char *name)
{
    if (size.width <= 0 || size.height <= 0) {
        Logger::warning(QStringLiteral("Config %1=%2x%3 is invalid, falling back to %4")
                            .arg(QString::fromUtf8(name))
                            .arg(size.width)
                            .arg(size.height)
                            .arg(fallback));
        return {fallback, fallback};
    }
    return size;
}

void readDouble(const QJsonObject &obj, const char *key, double &target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isDouble()) {
        target = value.toDouble();
    }
}

void readInt(const QJsonObject &obj, const char *key, int &target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isDouble()) {
        target = value.toInt();
    }
}

void readInt64(const QJsonObject &obj, const char *key, qint64 &target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isDouble()) {
        target = value.toInteger();
    }
}

void readBool(const QJsonObject &obj, const char *key, bool &target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isBool()) {
        target = value.toBool();
    }
}

void readString(const QJsonObject &obj, const char *key, QString &target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isString()) {
        target = value.toString();
    }
}

void readSize(const QJsonObject &obj, const char *key, cv::Size &target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isArray()) {
        const QJsonArray array = value.toArray();
        if (array.size() == 2) {
            target = cv::Size(array.at(0).toInt(target.width), array.at(1).toInt(target.height));
        }
    } else if (value.isDouble()) {
        target = cv::Size(value.toInt(), value.toInt());
    }
}

QJsonArray sizeToJson(const cv::Size &size)
{
    return QJsonArray {size.width, size.height};
}

} // namespace

QualityConfig sanitizeConfig(const QualityConfig &config)
{
    QualityConfig cfg = config;
    cfg.histogramTail = unitDouble(cfg.histogramTail, 0.01, "quality.histogram_tail");
    cfg.histogramTail = std::min(cfg.histogramTail, 0.45);
    cfg.noiseMedianKernel = oddKernel(cfg.noiseMedianKernel, 3, "quality.noise_median_kernel");
    cfg.noiseFloor = std::max(0.0, std::isfinite(cfg.noiseFloor) ? cfg.noiseFloor : 1.5);
    cfg.noiseCeiling = positiveDouble(cfg.noiseCeiling, 12.0, "quality.noise_ceiling");
    if (cfg.noiseCeiling <= cfg.noiseFloor) {
        Logger::warning(QStringLiteral("Config quality.noise_ceiling=%1 <= noise_floor=%2; adjusting to %3")
                            .arg(cfg.noiseCeiling)
                            .arg(cfg.noiseFloor)
                            .arg(cfg.noiseFloor + 1.0));
        cfg.noiseCeiling = cfg.noiseFloor + 1.0;
    }
    cfg.weakGradient = positiveDouble(cfg.weakGradient, 40.0, "quality.weak_gradient");
    cfg.strongGradient = positiveDouble(cfg.strongGradient, 200.0, "quality.strong_gradient");
    cfg.strongGradient = std::max(cfg.strongGradient, cfg.weakGradient);
    cfg.contrastWeight = unitDouble(cfg.contrastWeight, 0.6, "quality.contrast_weight");
    cfg.sharpnessWeight = unitDouble(cfg.sharpnessWeight, 0.4, "quality.sharpness_weight");
    if (cfg.contrastWeight + cfg.sharpnessWeight <= 0.0) {
        cfg.contrastWeight = 0.6;
        cfg.sharpnessWeight = 0.4;
    }
    cfg.highThreshold = unitDouble(cfg.highThreshold, 0.75, "quality.high_threshold");
    cfg.mediumThreshold = unitDouble(cfg.mediumThreshold, 0.55, "quality.medium_threshold");
    cfg.lowThreshold = unitDouble(cfg.lowThreshold, 0.30, "quality.low_threshold");
    if (!(cfg.lowThreshold <= cfg.mediumThreshold && cfg.mediumThreshold <= cfg.highThreshold)) {
        Logger::warning(QStringLiteral("Config quality thresholds are not ordered (low=%1, medium=%2, high=%3); using defaults")
                            .arg(cfg.lowThreshold)
                            .arg(cfg.mediumThreshold)
                            .arg(cfg.highThreshold));
        cfg.lowThreshold = 0.30;
        cfg.mediumThreshold = 0.55;
        cfg.highThreshold = 0.75;
    }
    cfg.cannyLow = positiveDouble(cfg.cannyLow, 100.0, "quality.canny_low");
    cfg.cannyHigh = positiveDouble(cfg.cannyHigh, 200.0, "quality.canny_high");
    return cfg;
}

EnhancementConfig sanitizeConfig(const EnhancementConfig &config)
{
    EnhancementConfig cfg = config;
    cfg.contrastLowPercentile = unitDouble(cfg.contrastLowPercentile, 0.005, "enhancement.contrast_low_percentile");
    cfg.contrastHighPercentile = unitDouble(cfg.contrastHighPercentile, 0.995, "enhancement.contrast_high_percentile");
    if (cfg.contrastHighPercentile <= cfg.contrastLowPercentile) {
        Logger::warning(QStringLiteral("Config enhancement contrast percentiles inverted (%1 >= %2); using defaults")
                            .arg(cfg.contrastLowPercentile)
                            .arg(cfg.contrastHighPercentile));
        cfg.contrastLowPercentile = 0.005;
        cfg.contrastHighPercentile = 0.995;
    }
    cfg.contrastTolerance = std::clamp(cfg.contrastTolerance, 0, 64);
    cfg.denoiseMedianKernel = oddKernel(cfg.denoiseMedianKernel, 3, "enhancement.denoise_median_kernel");
    cfg.denoiseStrength = positiveDouble(cfg.denoiseStrength, 7.0, "enhancement.denoise_strength");
    cfg.strongDenoiseMedianKernel = oddKernel(cfg.strongDenoiseMedianKernel, 5, "enhancement.strong_denoise_median_kernel");
    cfg.strongDenoiseStrength = positiveDouble(cfg.strongDenoiseStrength, 25.0, "enhancement.strong_denoise_strength");
    cfg.nlmTemplateWindow = oddKernel(cfg.nlmTemplateWindow, 7, "enhancement.nlm_template_window");
    cfg.nlmSearchWindow = oddKernel(cfg.nlmSearchWindow, 21, "enhancement.nlm_search_window");
    cfg.claheClipLimit = positiveDouble(cfg.claheClipLimit, 2.0, "enhancement.clahe_clip_limit");
    cfg.claheTileGrid = positiveSize(cfg.claheTileGrid, 8, "enhancement.clahe_tile_grid");
    cfg.sharpenSigma = positiveDouble(cfg.sharpenSigma, 1.0, "enhancement.sharpen_sigma");
    cfg.sharpenAmount = positiveDouble(cfg.sharpenAmount, 0.8, "enhancement.sharpen_amount");
    cfg.minBinarizeSpread = std::clamp(cfg.minBinarizeSpread, 0, 255);
    return cfg;
}

NodeDetectionConfig sanitizeConfig(const NodeDetectionConfig &config)
{
    NodeDetectionConfig cfg = config;
    cfg.minArea = positiveDouble(cfg.minArea, 150.0, "nodes.min_area");
    cfg.maxArea = positiveDouble(cfg.maxArea, 60000.0, "nodes.max_area");
    if (cfg.maxArea <= cfg.minArea) {
        Logger::warning(QStringLiteral("Config nodes.max_area=%1 <= min_area=%2; adjusting to %3")
                            .arg(cfg.maxArea)
                            .arg(cfg.minArea)
                            .arg(cfg.minArea * 10.0));
        cfg.maxArea = cfg.minArea * 10.0;
    }
    cfg.maxAreaRatio = unitDouble(cfg.maxAreaRatio, 0.25, "nodes.max_area_ratio");
    cfg.circularityThreshold = unitDouble(cfg.circularityThreshold, 0.75, "nodes.circularity_threshold");
    cfg.circleFillRatio = unitDouble(cfg.circleFillRatio, 0.85, "nodes.circle_fill_ratio");
    cfg.polygonEpsilonRatio = unitDouble(cfg.polygonEpsilonRatio, 0.02, "nodes.polygon_epsilon_ratio");
    cfg.maxPolygonVertices = std::max(positiveInt(cfg.maxPolygonVertices, 8, "nodes.max_polygon_vertices"), 3);
    cfg.rectangleFillRatio = unitDouble(cfg.rectangleFillRatio, 0.85, "nodes.rectangle_fill_ratio");
    cfg.suppressionIoU = unitDouble(cfg.suppressionIoU, 0.3, "nodes.suppression_iou");
    cfg.closeKernel = oddKernel(cfg.closeKernel, 3, "nodes.close_kernel");
    cfg.openKernel = oddKernel(cfg.openKernel, 9, "nodes.open_kernel");
    cfg.hollowTouchDistance = std::max(0.0, std::isfinite(cfg.hollowTouchDistance) ? cfg.hollowTouchDistance : 6.0);
    return cfg;
}

EdgeDetectionConfig sanitizeConfig(const EdgeDetectionConfig &config)
{
    EdgeDetectionConfig cfg = config;
    cfg.nodeMaskMargin = std::max(0, cfg.nodeMaskMargin);
    cfg.houghRho = positiveDouble(cfg.houghRho, 1.0, "edges.hough_rho");
    cfg.houghThetaDeg = positiveDouble(cfg.houghThetaDeg, 1.0, "edges.hough_theta_deg");
    cfg.houghVotes = positiveInt(cfg.houghVotes, 20, "edges.hough_votes");
    cfg.minSegmentLength = positiveDouble(cfg.minSegmentLength, 20.0, "edges.min_segment_length");
    cfg.maxSegmentGap = positiveDouble(cfg.maxSegmentGap, 8.0, "edges.max_segment_gap");
    cfg.mergeAngleTolDeg = positiveDouble(cfg.mergeAngleTolDeg, 6.0, "edges.merge_angle_tol_deg");
    cfg.mergeDistance = positiveDouble(cfg.mergeDistance, 6.0, "edges.merge_distance");
    cfg.mergeGap = positiveDouble(cfg.mergeGap, 14.0, "edges.merge_gap");
    cfg.endpointDistance = positiveDouble(cfg.endpointDistance, 25.0, "edges.endpoint_distance");
    cfg.arrowProbeLength = positiveDouble(cfg.arrowProbeLength, 18.0, "edges.arrow_probe_length");
    cfg.arrowProbeHalfWidth = positiveDouble(cfg.arrowProbeHalfWidth, 18.0, "edges.arrow_probe_half_width");
    cfg.arrowSpreadRatio = positiveDouble(cfg.arrowSpreadRatio, 2.5, "edges.arrow_spread_ratio");
    cfg.arrowMinSpread = positiveDouble(cfg.arrowMinSpread, 10.0, "edges.arrow_min_spread");
    cfg.solidCoverage = unitDouble(cfg.solidCoverage, 0.85, "edges.solid_coverage");
    cfg.minCoverage = unitDouble(cfg.minCoverage, 0.25, "edges.min_coverage");
    cfg.minCoverage = std::min(cfg.minCoverage, cfg.solidCoverage);
    return cfg;
}

TextConfig sanitizeConfig(const TextConfig &config)
{
    TextConfig cfg = config;
    cfg.languages.removeAll(QString());
    if (cfg.languages.isEmpty()) {
        Logger::warning(QStringLiteral("Config text.languages is empty, falling back to eng"));
        cfg.languages = QStringList {QStringLiteral("eng")};
    }
    cfg.minConfidence = unitDouble(cfg.minConfidence, 0.3, "text.min_confidence");
    cfg.claimDistance = positiveDouble(cfg.claimDistance, 50.0, "text.claim_distance");
    cfg.timeoutMs = positiveInt(cfg.timeoutMs, 10000, "text.timeout_ms");
    cfg.cropPadding = std::max(0, cfg.cropPadding);
    return cfg;
}

CacheConfig sanitizeConfig(const CacheConfig &config)
{
    CacheConfig cfg = config;
    if (cfg.directory.trimmed().isEmpty()) {
        Logger::warning(QStringLiteral("Config cache.directory is empty, falling back to ./cache"));
        cfg.directory = QStringLiteral("cache");
    }
    cfg.ttlSeconds = std::max<qint64>(0, cfg.ttlSeconds);
    cfg.maxMemoryEntries = positiveInt(cfg.maxMemoryEntries, 256, "cache.max_memory_entries");
    cfg.hashSize = std::max(positiveInt(cfg.hashSize, 16, "cache.hash_size"), 2);
    if (cfg.hashSize % 2 != 0) {
        ++cfg.hashSize;
    }
    return cfg;
}

ConcurrencyConfig sanitizeConfig(const ConcurrencyConfig &config)
{
    ConcurrencyConfig cfg = config;
    cfg.workerThreads = std::max(0, cfg.workerThreads);
    cfg.ocrThreads = positiveInt(cfg.ocrThreads, 2, "concurrency.ocr_threads");
    return cfg;
}

PipelineConfig sanitizeConfig(const PipelineConfig &config)
{
    PipelineConfig cfg;
    cfg.quality = sanitizeConfig(config.quality);
    cfg.enhancement = sanitizeConfig(config.enhancement);
    cfg.nodes = sanitizeConfig(config.nodes);
    cfg.edges = sanitizeConfig(config.edges);
    cfg.text = sanitizeConfig(config.text);
    cfg.cache = sanitizeConfig(config.cache);
    cfg.concurrency = sanitizeConfig(config.concurrency);
    return cfg;
}

void pipelineConfigFromJson(const QJsonObject &obj, PipelineConfig &config)
{
    const QJsonObject quality = obj.value(QStringLiteral("quality")).toObject();
    readDouble(quality, "histogram_tail", config.quality.histogramTail);
    readInt(quality, "noise_median_kernel", config.quality.noiseMedianKernel);
    readDouble(quality, "noise_floor", config.quality.noiseFloor);
    readDouble(quality, "noise_ceiling", config.quality.noiseCeiling);
    readDouble(quality, "weak_gradient", config.quality.weakGradient);
    readDouble(quality, "strong_gradient", config.quality.strongGradient);
    readDouble(quality, "contrast_weight", config.quality.contrastWeight);
    readDouble(quality, "sharpness_weight", config.quality.sharpnessWeight);
    readDouble(quality, "high_threshold", config.quality.highThreshold);
    readDouble(quality, "medium_threshold", config.quality.mediumThreshold);
    readDouble(quality, "low_threshold", config.quality.lowThreshold);
    readDouble(quality, "canny_low", config.quality.cannyLow);
    readDouble(quality, "canny_high", config.quality.cannyHigh);

    const QJsonObject enhancement = obj.value(QStringLiteral("enhancement")).toObject();
    readDouble(enhancement, "contrast_low_percentile", config.enhancement.contrastLowPercentile);
    readDouble(enhancement, "contrast_high_percentile", config.enhancement.contrastHighPercentile);
    readInt(enhancement, "contrast_tolerance", config.enhancement.contrastTolerance);
    readInt(enhancement, "denoise_median_kernel", config.enhancement.denoiseMedianKernel);
    readDouble(enhancement, "denoise_strength", config.enhancement.denoiseStrength);
    readInt(enhancement, "strong_denoise_median_kernel", config.enhancement.strongDenoiseMedianKernel);
    readDouble(enhancement, "strong_denoise_strength", config.enhancement.strongDenoiseStrength);
    readInt(enhancement, "nlm_template_window", config.enhancement.nlmTemplateWindow);
    readInt(enhancement, "nlm_search_window", config.enhancement.nlmSearchWindow);
    readDouble(enhancement, "clahe_clip_limit", config.enhancement.claheClipLimit);
    readSize(enhancement, "clahe_tile_grid", config.enhancement.claheTileGrid);
    readDouble(enhancement, "sharpen_sigma", config.enhancement.sharpenSigma);
    readDouble(enhancement, "sharpen_amount", config.enhancement.sharpenAmount);
    readInt(enhancement, "min_binarize_spread", config.enhancement.minBinarizeSpread);

    const QJsonObject nodes = obj.value(QStringLiteral("nodes")).toObject();
    readDouble(nodes, "min_area", config.nodes.minArea);
    readDouble(nodes, "max_area", config.nodes.maxArea);
    readDouble(nodes, "max_area_ratio", config.nodes.maxAreaRatio);
    readDouble(nodes, "circularity_threshold", config.nodes.circularityThreshold);
    readDouble(nodes, "circle_fill_ratio", config.nodes.circleFillRatio);
    readDouble(nodes, "polygon_epsilon_ratio", config.nodes.polygonEpsilonRatio);
    readInt(nodes, "max_polygon_vertices", config.nodes.maxPolygonVertices);
    readDouble(nodes, "rectangle_fill_ratio", config.nodes.rectangleFillRatio);
    readDouble(nodes, "suppression_iou", config.nodes.suppressionIoU);
    readInt(nodes, "close_kernel", config.nodes.closeKernel);
    readInt(nodes, "open_kernel", config.nodes.openKernel);
    readBool(nodes, "detect_hollow_shapes", config.nodes.detectHollowShapes);
    readDouble(nodes, "hollow_touch_distance", config.nodes.hollowTouchDistance);

    const QJsonObject edges = obj.value(QStringLiteral("edges")).toObject();
    readInt(edges, "node_mask_margin", config.edges.nodeMaskMargin);
    readDouble(edges, "hough_rho", config.edges.houghRho);
    readDouble(edges, "hough_theta_deg", config.edges.houghThetaDeg);
    readInt(edges, "hough_votes", config.edges.houghVotes);
    readDouble(edges, "min_segment_length", config.edges.minSegmentLength);
    readDouble(edges, "max_segment_gap", config.edges.maxSegmentGap);
    readDouble(edges, "merge_angle_tol_deg", config.edges.mergeAngleTolDeg);
    readDouble(edges, "merge_distance", config.edges.mergeDistance);
    readDouble(edges, "merge_gap", config.edges.mergeGap);
    readDouble(edges, "endpoint_distance", config.edges.endpointDistance);
    readDouble(edges, "arrow_probe_length", config.edges.arrowProbeLength);
    readDouble(edges, "arrow_probe_half_width", config.edges.arrowProbeHalfWidth);
    readDouble(edges, "arrow_spread_ratio", config.edges.arrowSpreadRatio);
    readDouble(edges, "arrow_min_spread", config.edges.arrowMinSpread);
    readDouble(edges, "solid_coverage", config.edges.solidCoverage);
    readDouble(edges, "min_coverage", config.edges.minCoverage);

    const QJsonObject text = obj.value(QStringLiteral("text")).toObject();
    readBool(text, "enabled", config.text.enabled);
    if (text.value(QStringLiteral("languages")).isArray()) {
        config.text.languages.clear();
        for (const QJsonValue &value : text.value(QStringLiteral("languages")).toArray()) {
            config.text.languages.append(value.toString());
        }
    }
    readString(text, "tessdata_path", config.text.tessdataPath);
    readDouble(text, "min_confidence", config.text.minConfidence);
    readDouble(text, "claim_distance", config.text.claimDistance);
    readInt(text, "timeout_ms", config.text.timeoutMs);
    if (text.contains(QStringLiteral("crop_mode"))) {
        config.text.cropMode = textCropModeFromString(text.value(QStringLiteral("crop_mode")).toString(),
                                                      config.text.cropMode);
    }
    readInt(text, "crop_padding", config.text.cropPadding);

    const QJsonObject cache = obj.value(QStringLiteral("cache")).toObject();
    readBool(cache, "enabled", config.cache.enabled);
    readString(cache, "directory", config.cache.directory);
    readInt64(cache, "ttl_seconds", config.cache.ttlSeconds);
    readInt(cache, "max_memory_entries", config.cache.maxMemoryEntries);
    readInt(cache, "hash_size", config.cache.hashSize);

    const QJsonObject concurrency = obj.value(QStringLiteral("concurrency")).toObject();
    readInt(concurrency, "worker_threads", config.concurrency.workerThreads);
    readInt(concurrency, "ocr_threads", config.concurrency.ocrThreads);
}

QJsonObject pipelineConfigToJson(const PipelineConfig &config)
{
    QJsonObject quality;
    quality.insert(QStringLiteral("histogram_tail"), config.quality.histogramTail);
    quality.insert(QStringLiteral("noise_median_kernel"), config.quality.noiseMedianKernel);
    quality.insert(QStringLiteral("noise_floor"), config.quality.noiseFloor);
    quality.insert(QStringLiteral("noise_ceiling"), config.quality.noiseCeiling);
    quality.insert(QStringLiteral("weak_gradient"), config.quality.weakGradient);
    quality.insert(QStringLiteral("strong_gradient"), config.quality.strongGradient);
    quality.insert(QStringLiteral("contrast_weight"), config.quality.contrastWeight);
    quality.insert(QStringLiteral("sharpness_weight"), config.quality.sharpnessWeight);
    quality.insert(QStringLiteral("high_threshold"), config.quality.highThreshold);
    quality.insert(QStringLiteral("medium_threshold"), config.quality.mediumThreshold);
    quality.insert(QStringLiteral("low_threshold"), config.quality.lowThreshold);
    quality.insert(QStringLiteral("canny_low"), config.quality.cannyLow);
    quality.insert(QStringLiteral("canny_high"), config.quality.cannyHigh);

    QJsonObject enhancement;
    enhancement.insert(QStringLiteral("contrast_low_percentile"), config.enhancement.contrastLowPercentile);
    enhancement.insert(QStringLiteral("contrast_high_percentile"), config.enhancement.contrastHighPercentile);
    enhancement.insert(QStringLiteral("contrast_tolerance"), config.enhancement.contrastTolerance);
    enhancement.insert(QStringLiteral("denoise_median_kernel"), config.enhancement.denoiseMedianKernel);
    enhancement.insert(QStringLiteral("denoise_strength"), config.enhancement.denoiseStrength);
    enhancement.insert(QStringLiteral("strong_denoise_median_kernel"), config.enhancement.strongDenoiseMedianKernel);
    enhancement.insert(QStringLiteral("strong_denoise_strength"), config.enhancement.strongDenoiseStrength);
    enhancement.insert(QStringLiteral("nlm_template_window"), config.enhancement.nlmTemplateWindow);
    enhancement.insert(QStringLiteral("nlm_search_window"), config.enhancement.nlmSearchWindow);
    enhancement.insert(QStringLiteral("clahe_clip_limit"), config.enhancement.claheClipLimit);
    enhancement.insert(QStringLiteral("clahe_tile_grid"), sizeToJson(config.enhancement.claheTileGrid));
    enhancement.insert(QStringLiteral("sharpen_sigma"), config.enhancement.sharpenSigma);
    enhancement.insert(QStringLiteral("sharpen_amount"), config.enhancement.sharpenAmount);
    enhancement.insert(QStringLiteral("min_binarize_spread"), config.enhancement.minBinarizeSpread);

    QJsonObject nodes;
    nodes.insert(QStringLiteral("min_area"), config.nodes.minArea);
    nodes.insert(QStringLiteral("max_area"), config.nodes.maxArea);
    nodes.insert(QStringLiteral("max_area_ratio"), config.nodes.maxAreaRatio);
    nodes.insert(QStringLiteral("circularity_threshold"), config.nodes.circularityThreshold);
    nodes.insert(QStringLiteral("circle_fill_ratio"), config.nodes.circleFillRatio);
    nodes.insert(QStringLiteral("polygon_epsilon_ratio"), config.nodes.polygonEpsilonRatio);
    nodes.insert(QStringLiteral("max_polygon_vertices"), config.nodes.maxPolygonVertices);
    nodes.insert(QStringLiteral("rectangle_fill_ratio"), config.nodes.rectangleFillRatio);
    nodes.insert(QStringLiteral("suppression_iou"), config.nodes.suppressionIoU);
    nodes.insert(QStringLiteral("close_kernel"), config.nodes.closeKernel);
    nodes.insert(QStringLiteral("open_kernel"), config.nodes.openKernel);
    nodes.insert(QStringLiteral("detect_hollow_shapes"), config.nodes.detectHollowShapes);
    nodes.insert(QStringLiteral("hollow_touch_distance"), config.nodes.hollowTouchDistance);

    QJsonObject edges;
    edges.insert(QStringLiteral("node_mask_margin"), config.edges.nodeMaskMargin);
    edges.insert(QStringLiteral("hough_rho"), config.edges.houghRho);
    edges.insert(QStringLiteral("hough_theta_deg"), config.edges.houghThetaDeg);
    edges.insert(QStringLiteral("hough_votes"), config.edges.houghVotes);
    edges.insert(QStringLiteral("min_segment_length"), config.edges.minSegmentLength);
    edges.insert(QStringLiteral("max_segment_gap"), config.edges.maxSegmentGap);
    edges.insert(QStringLiteral("merge_angle_tol_deg"), config.edges.mergeAngleTolDeg);
    edges.insert(QStringLiteral("merge_distance"), config.edges.mergeDistance);
    edges.insert(QStringLiteral("merge_gap"), config.edges.mergeGap);
    edges.insert(QStringLiteral("endpoint_distance"), config.edges.endpointDistance);
    edges.insert(QStringLiteral("arrow_probe_length"), config.edges.arrowProbeLength);
    edges.insert(QStringLiteral("arrow_probe_half_width"), config.edges.arrowProbeHalfWidth);
    edges.insert(QStringLiteral("arrow_spread_ratio"), config.edges.arrowSpreadRatio);
    edges.insert(QStringLiteral("arrow_min_spread"), config.edges.arrowMinSpread);
    edges.insert(QStringLiteral("solid_coverage"), config.edges.solidCoverage);
    edges.insert(QStringLiteral("min_coverage"), config.edges.minCoverage);

    QJsonObject text;
    text.insert(QStringLiteral("enabled"), config.text.enabled);
    text.insert(QStringLiteral("languages"), QJsonArray::fromStringList(config.text.languages));
    if (!config.text.tessdataPath.isEmpty()) {
        text.insert(QStringLiteral("tessdata_path"), config.text.tessdataPath);
    }
    text.insert(QStringLiteral("min_confidence"), config.text.minConfidence);
    text.insert(QStringLiteral("claim_distance"), config.text.claimDistance);
    text.insert(QStringLiteral("timeout_ms"), config.text.timeoutMs);
    text.insert(QStringLiteral("crop_mode"), toString(config.text.cropMode));
    text.insert(QStringLiteral("crop_padding"), config.text.cropPadding);

    QJsonObject cache;
    cache.insert(QStringLiteral("enabled"), config.cache.enabled);
    cache.insert(QStringLiteral("directory"), config.cache.directory);
    cache.insert(QStringLiteral("ttl_seconds"), config.cache.ttlSeconds);
    cache.insert(QStringLiteral("max_memory_entries"), config.cache.maxMemoryEntries);
    cache.insert(QStringLiteral("hash_size"), config.cache.hashSize);

    QJsonObject concurrency;
    concurrency.insert(QStringLiteral("worker_threads"), config.concurrency.workerThreads);
    concurrency.insert(QStringLiteral("ocr_threads"), config.concurrency.ocrThreads);

    QJsonObject root;
    root.insert(QStringLiteral("quality"), quality);
    root.insert(QStringLiteral("enhancement"), enhancement);
    root.insert(QStringLiteral("nodes"), nodes);
    root.insert(QStringLiteral("edges"), edges);
    root.insert(QStringLiteral("text"), text);
    root.insert(QStringLiteral("cache"), cache);
    root.insert(QStringLiteral("concurrency"), concurrency);
    return root;
}

bool loadPipelineConfig(const QString &path, PipelineConfig &config, QString *errorMessage)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Config file not found: %1").arg(path);
        }
        return false;
    }

    QFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to open config file: %1").arg(file.errorString());
        }
        return false;
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid config JSON: %1").arg(parseError.errorString());
        }
        return false;
    }

    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Config file is not a JSON object");
        }
        return false;
    }

    PipelineConfig loaded = config;
    pipelineConfigFromJson(doc.object(), loaded);
    config = sanitizeConfig(loaded);
    return true;
}

QString toString(TextCropMode mode)
{
    return mode == TextCropMode::ElementCrops ? QStringLiteral("element_crops") : QStringLiteral("whole_image");
}

TextCropMode textCropModeFromString(const QString &value, TextCropMode fallback)
{
    if (value == QStringLiteral("whole_image")) {
        return TextCropMode::WholeImage;
    }
    if (value == QStringLiteral("element_crops")) {
        return TextCropMode::ElementCrops;
    }
    return fallback;
}

} // namespace graphscan
