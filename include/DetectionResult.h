#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "GraphElements.h"

namespace graphscan {

// Ordinal: a larger value means a more usable image.
enum class QualityLevel {
    VeryLow = 0,
    Low = 1,
    Medium = 2,
    High = 3
};

struct QualityReport {
    QualityLevel level {QualityLevel::VeryLow};
    double contrast {0.0};
    double noise {0.0};
    double sharpness {0.0};

    // Diagnostics only; the level is derived from the three scores above.
    double brightness {0.0};
    double edgeDensity {0.0};
    double compositeScore {0.0};

    bool operator==(const QualityReport &other) const;
    bool operator!=(const QualityReport &other) const { return !(*this == other); }
};

struct StageTiming {
    std::string stage;
    std::chrono::milliseconds elapsed {0};
};

struct DetectionDiagnostics {
    std::string imageHash;
    cv::Size resolution {0, 0};
    std::chrono::milliseconds elapsed {0};
    std::vector<StageTiming> timings;
    bool cacheHit {false};
    bool labelsUnavailable {false};
    int textRegionCount {0};
    int unclaimedTextRegions {0};
    std::vector<std::string> notes;
};

struct DetectionResult {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    QualityReport quality;
    DetectionDiagnostics diagnostics;

    [[nodiscard]] const Node *findNode(int id) const;
    [[nodiscard]] int labelCount() const;

    // Compares graph content and quality, ignoring timings and cache bookkeeping.
    [[nodiscard]] bool sameContent(const DetectionResult &other) const;
};

using DetectionResultPtr = std::shared_ptr<const DetectionResult>;

std::string toString(QualityLevel level);
QualityLevel qualityLevelFromString(const std::string &value, QualityLevel fallback = QualityLevel::VeryLow);

inline const Node *DetectionResult::findNode(int id) const
{
    for (const auto &node : nodes) {
        if (node.id == id) {
            return &node;
        }
    }
    return nullptr;
}

inline int DetectionResult::labelCount() const
{
    int count = 0;
    for (const auto &node : nodes) {
        count += node.label ? 1 : 0;
    }
    for (const auto &edge : edges) {
        count += edge.label ? 1 : 0;
    }
    return count;
}

inline bool QualityReport::operator==(const QualityReport &other) const
{
    return level == other.level && contrast == other.contrast && noise == other.noise &&
           sharpness == other.sharpness && brightness == other.brightness &&
           edgeDensity == other.edgeDensity && compositeScore == other.compositeScore;
}

inline bool DetectionResult::sameContent(const DetectionResult &other) const
{
    return nodes == other.nodes && edges == other.edges && quality == other.quality &&
           diagnostics.labelsUnavailable == other.diagnostics.labelsUnavailable;
}

inline std::string toString(QualityLevel level)
{
    switch (level) {
    case QualityLevel::High:
        return "HIGH";
    case QualityLevel::Medium:
        return "MEDIUM";
    case QualityLevel::Low:
        return "LOW";
    case QualityLevel::VeryLow:
    default:
        return "VERY_LOW";
    }
}

inline QualityLevel qualityLevelFromString(const std::string &value, QualityLevel fallback)
{
    if (value == "HIGH") {
        return QualityLevel::High;
    }
    if (value == "MEDIUM") {
        return QualityLevel::Medium;
    }
    if (value == "LOW") {
        return QualityLevel::Low;
    }
    if (value == "VERY_LOW") {
        return QualityLevel::VeryLow;
    }
    return fallback;
}

} // namespace graphscan
