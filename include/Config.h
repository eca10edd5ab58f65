#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <opencv2/core.hpp>

namespace graphscan {

struct QualityConfig {
    double histogramTail {0.01};        // fraction trimmed from each end of the luminance histogram
    int noiseMedianKernel {3};
    double noiseFloor {1.5};            // mean |residual| treated as noise-free
    double noiseCeiling {12.0};         // mean |residual| treated as fully noisy
    double weakGradient {40.0};         // Sobel magnitude counted as an edge pixel
    double strongGradient {200.0};      // Sobel magnitude counted as a crisp edge pixel
    double contrastWeight {0.6};
    double sharpnessWeight {0.4};
    double highThreshold {0.75};
    double mediumThreshold {0.55};
    double lowThreshold {0.30};
    double cannyLow {100.0};
    double cannyHigh {200.0};
};

struct EnhancementConfig {
    double contrastLowPercentile {0.005};
    double contrastHighPercentile {0.995};
    int contrastTolerance {2};          // stretch skipped when the range already spans [tol, 255 - tol]
    int denoiseMedianKernel {3};
    double denoiseStrength {7.0};
    int strongDenoiseMedianKernel {5};
    double strongDenoiseStrength {25.0};
    int nlmTemplateWindow {7};
    int nlmSearchWindow {21};
    double claheClipLimit {2.0};
    cv::Size claheTileGrid {8, 8};
    double sharpenSigma {1.0};
    double sharpenAmount {0.8};
    int minBinarizeSpread {10};
};

struct NodeDetectionConfig {
    double minArea {150.0};
    double maxArea {60000.0};
    double maxAreaRatio {0.25};
    double circularityThreshold {0.75};
    double circleFillRatio {0.85};      // contour area over its minimum enclosing circle
    double polygonEpsilonRatio {0.02};
    int maxPolygonVertices {8};
    double rectangleFillRatio {0.85};
    double suppressionIoU {0.3};
    int closeKernel {3};
    int openKernel {9};
    bool detectHollowShapes {true};
    double hollowTouchDistance {6.0};   // an enclosed region touching a smaller node is a cycle of edges
};

struct EdgeDetectionConfig {
    int nodeMaskMargin {6};
    double houghRho {1.0};
    double houghThetaDeg {1.0};
    int houghVotes {20};
    double minSegmentLength {20.0};
    double maxSegmentGap {8.0};
    double mergeAngleTolDeg {6.0};
    double mergeDistance {6.0};
    double mergeGap {14.0};
    double endpointDistance {25.0};
    double arrowProbeLength {18.0};
    double arrowProbeHalfWidth {18.0};
    double arrowSpreadRatio {2.5};
    double arrowMinSpread {10.0};
    double solidCoverage {0.85};
    double minCoverage {0.25};
};

enum class TextCropMode {
    WholeImage,
    ElementCrops
};

struct TextConfig {
    bool enabled {true};
    QStringList languages {QStringLiteral("eng")};
    QString tessdataPath;
    double minConfidence {0.3};
    double claimDistance {50.0};
    int timeoutMs {10000};
    TextCropMode cropMode {TextCropMode::WholeImage};
    int cropPadding {12};
};

struct CacheConfig {
    bool enabled {true};
    QString directory {QStringLiteral("cache")};
    qint64 ttlSeconds {3600};           // 0 keeps entries forever
    int maxMemoryEntries {256};
    int hashSize {16};                  // perceptual hash grid edge; each half of the key has hashSize^2 bits
};

struct ConcurrencyConfig {
    int workerThreads {0};              // 0 = QThread::idealThreadCount()
    int ocrThreads {2};
};

struct PipelineConfig {
    QualityConfig quality;
    EnhancementConfig enhancement;
    NodeDetectionConfig nodes;
    EdgeDetectionConfig edges;
    TextConfig text;
    CacheConfig cache;
    ConcurrencyConfig concurrency;
};

QualityConfig sanitizeConfig(const QualityConfig &config);
EnhancementConfig sanitizeConfig(const EnhancementConfig &config);
NodeDetectionConfig sanitizeConfig(const NodeDetectionConfig &config);
EdgeDetectionConfig sanitizeConfig(const EdgeDetectionConfig &config);
TextConfig sanitizeConfig(const TextConfig &config);
CacheConfig sanitizeConfig(const CacheConfig &config);
ConcurrencyConfig sanitizeConfig(const ConcurrencyConfig &config);
PipelineConfig sanitizeConfig(const PipelineConfig &config);

// Missing keys keep the values already present in config.
void pipelineConfigFromJson(const QJsonObject &obj, PipelineConfig &config);
QJsonObject pipelineConfigToJson(const PipelineConfig &config);

bool loadPipelineConfig(const QString &path, PipelineConfig &config, QString *errorMessage = nullptr);

QString toString(TextCropMode mode);
TextCropMode textCropModeFromString(const QString &value, TextCropMode fallback = TextCropMode::WholeImage);

} // namespace graphscan
