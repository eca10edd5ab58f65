#include "NodeDetector.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

#include <opencv2/imgproc.hpp>

#include "ImageUtils.h"
#include "Logger.h"

namespace graphscan {

namespace {

using Contour = std::vector<cv::Point>;

struct NodeCandidate {
    Shape shape;
    Contour contour;
    double area {0.0};
    double circularity {0.0};
    double confidence {0.0};
    bool hollow {false};
};

double contour_circularity(const Contour &contour, double area)
{
    Contour hull;
    cv::convexHull(contour, hull);
    const double perimeter = cv::arcLength(hull, true);
    if (perimeter <= 1e-6) {
        return 0.0;
    }
    return std::clamp(4.0 * CV_PI * area / (perimeter * perimeter), 0.0, 1.0);
}

double contour_solidity(const Contour &contour, double area)
{
    Contour hull;
    cv::convexHull(contour, hull);
    const double hullArea = cv::contourArea(hull);
    return hullArea <= 1e-6 ? 0.0 : std::clamp(area / hullArea, 0.0, 1.0);
}

std::optional<NodeCandidate> classify_contour(const Contour &contour, double maxArea, const NodeDetectionConfig &cfg)
{
    const double area = std::abs(cv::contourArea(contour));
    if (area < cfg.minArea || area > maxArea) {
        return std::nullopt;
    }

    NodeCandidate candidate;
    candidate.contour = contour;
    candidate.area = area;
    candidate.circularity = contour_circularity(contour, area);

    Contour approx;
    cv::approxPolyDP(contour, approx, cfg.polygonEpsilonRatio * cv::arcLength(contour, true), true);
    const bool convex = approx.size() >= 3 && cv::isContourConvex(approx);

    const cv::Rect box = cv::boundingRect(contour);
    const double boxFill = area / std::max(1.0, static_cast<double>(box.area()));
    if (approx.size() == 4 && convex && boxFill >= cfg.rectangleFillRatio) {
        candidate.shape = Shape::rectangle(cv::Rect2f(box));
        candidate.confidence = boxFill;
        return candidate;
    }

    cv::Point2f enclosingCenter;
    float enclosingRadius = 0.0F;
    cv::minEnclosingCircle(contour, enclosingCenter, enclosingRadius);
    const double circleFill =
        area / std::max(1.0, CV_PI * static_cast<double>(enclosingRadius) * static_cast<double>(enclosingRadius));
    if (candidate.circularity >= cfg.circularityThreshold && circleFill >= cfg.circleFillRatio) {
        const cv::Moments m = cv::moments(contour);
        cv::Point2f center = enclosingCenter;
        if (std::abs(m.m00) > 1e-6) {
            center = cv::Point2f(static_cast<float>(m.m10 / m.m00), static_cast<float>(m.m01 / m.m00));
        }
        candidate.shape = Shape::circle(center, static_cast<float>(std::sqrt(area / CV_PI)));
        candidate.confidence = candidate.circularity;
        return candidate;
    }

    if (convex && static_cast<int>(approx.size()) <= cfg.maxPolygonVertices) {
        std::vector<cv::Point2f> vertices;
        vertices.reserve(approx.size());
        for (const auto &p : approx) {
            vertices.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
        }
        candidate.shape = Shape::polygon(std::move(vertices));
        candidate.confidence = contour_solidity(contour, area);
        return candidate;
    }

    return std::nullopt;
}

// Smallest distance between the outline of small and the contour of region.
double boundary_gap(const NodeCandidate &small, const Contour &region)
{
    double best = std::numeric_limits<double>::max();
    for (const auto &p : small.shape.outline()) {
        const double d = std::abs(cv::pointPolygonTest(region, cv::Point2f(p), true));
        best = std::min(best, d);
    }
    return best;
}

// An enclosed region bordered by smaller nodes is the inside of an edge cycle,
// not an outlined node.
void drop_edge_cycles(std::vector<NodeCandidate> &candidates, const NodeDetectionConfig &cfg)
{
    std::vector<bool> drop(candidates.size(), false);
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!candidates[i].hollow) {
            continue;
        }
        for (size_t j = 0; j < candidates.size(); ++j) {
            if (i == j || candidates[j].area >= candidates[i].area) {
                continue;
            }
            if (intersectionOverUnion(candidates[i].shape.bounds, candidates[j].shape.bounds) >= cfg.suppressionIoU) {
                continue;
            }
            if (boundary_gap(candidates[j], candidates[i].contour) <= cfg.hollowTouchDistance) {
                drop[i] = true;
                break;
            }
        }
    }

    std::vector<NodeCandidate> kept;
    kept.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!drop[i]) {
            kept.push_back(std::move(candidates[i]));
        }
    }
    candidates = std::move(kept);
}

std::vector<NodeCandidate> suppress_overlaps(std::vector<NodeCandidate> candidates, double iouThreshold)
{
    std::stable_sort(candidates.begin(), candidates.end(), [](const NodeCandidate &a, const NodeCandidate &b) {
        if (a.circularity != b.circularity) {
            return a.circularity > b.circularity;
        }
        return a.area > b.area;
    });

    std::vector<NodeCandidate> kept;
    for (auto &candidate : candidates) {
        const bool overlaps = std::any_of(kept.begin(), kept.end(), [&](const NodeCandidate &other) {
            return intersectionOverUnion(candidate.shape.bounds, other.shape.bounds) >= iouThreshold;
        });
        if (!overlaps) {
            kept.push_back(std::move(candidate));
        }
    }
    return kept;
}

} // namespace

NodeDetector::NodeDetector(const NodeDetectionConfig &config) : m_cfg(sanitizeConfig(config)) {}

std::vector<Node> NodeDetector::detect(const cv::Mat &image) const
{
    validateImage(image, "NodeDetector");
    const cv::Mat gray = ensureGray(image);
    const cv::Mat binary = inkMask(gray);
    if (cv::countNonZero(binary) == 0) {
        return {};
    }

    const double maxArea = std::min(m_cfg.maxArea, m_cfg.maxAreaRatio * static_cast<double>(gray.total()));

    cv::Mat closed;
    cv::morphologyEx(binary, closed, cv::MORPH_CLOSE,
                     cv::getStructuringElement(cv::MORPH_RECT, cv::Size(m_cfg.closeKernel, m_cfg.closeKernel)));

    // Opening strips strokes thinner than the kernel so filled shapes separate from their edges.
    cv::Mat opened;
    cv::morphologyEx(closed, opened, cv::MORPH_OPEN,
                     cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(m_cfg.openKernel, m_cfg.openKernel)));

    std::vector<NodeCandidate> candidates;

    std::vector<Contour> filled;
    cv::findContours(opened, filled, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
    for (const auto &contour : filled) {
        if (auto candidate = classify_contour(contour, maxArea, m_cfg)) {
            candidates.push_back(std::move(*candidate));
        }
    }
    const size_t filledCount = candidates.size();

    if (m_cfg.detectHollowShapes) {
        std::vector<Contour> contours;
        std::vector<cv::Vec4i> hierarchy;
        cv::findContours(closed, contours, hierarchy, cv::RETR_CCOMP, cv::CHAIN_APPROX_NONE);
        for (size_t i = 0; i < contours.size(); ++i) {
            if (hierarchy[i][3] < 0) {
                continue;
            }
            if (auto candidate = classify_contour(contours[i], maxArea, m_cfg)) {
                candidate->hollow = true;
                candidates.push_back(std::move(*candidate));
            }
        }
        drop_edge_cycles(candidates, m_cfg);
    }

    auto kept = suppress_overlaps(std::move(candidates), m_cfg.suppressionIoU);
    std::sort(kept.begin(), kept.end(), [](const NodeCandidate &a, const NodeCandidate &b) {
        if (a.shape.center.y != b.shape.center.y) {
            return a.shape.center.y < b.shape.center.y;
        }
        return a.shape.center.x < b.shape.center.x;
    });

    std::vector<Node> nodes;
    nodes.reserve(kept.size());
    for (auto &candidate : kept) {
        Node node;
        node.id = static_cast<int>(nodes.size());
        node.shape = std::move(candidate.shape);
        node.confidence = std::clamp(candidate.confidence, 0.0, 1.0);
        nodes.push_back(std::move(node));
    }

    Logger::info(QStringLiteral("NodeDetector: %1 nodes (%2 filled candidates) | %3x%4")
                     .arg(static_cast<int>(nodes.size()))
                     .arg(static_cast<int>(filledCount))
                     .arg(gray.cols)
                     .arg(gray.rows));
    return nodes;
}

} // namespace graphscan
