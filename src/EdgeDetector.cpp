#include "EdgeDetector.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <utility>

#include <opencv2/imgproc.hpp>

#include "ImageUtils.h"
#include "Logger.h"

namespace graphscan {

namespace {

using Point2 = cv::Point2f;

struct Segment {
    Point2 a;
    Point2 b;
};

struct EndpointMatch {
    int nodeId {-1};
    double distance {0.0};
};

constexpr float kCenterLineTolerance = 2.0F;

Point2 unit(const Point2 &v)
{
    const double len = cv::norm(v);
    if (len <= 1e-9) {
        return {1.0F, 0.0F};
    }
    return v * static_cast<float>(1.0 / len);
}

double segment_angle_deg(const Segment &s)
{
    double angle = std::atan2(s.b.y - s.a.y, s.b.x - s.a.x) * 180.0 / CV_PI;
    if (angle < 0.0) {
        angle += 180.0;
    }
    if (angle >= 180.0) {
        angle -= 180.0;
    }
    return angle;
}

double deg_diff(double a, double b)
{
    const double d = std::abs(a - b);
    return std::min(d, 180.0 - d);
}

double perpendicular_distance(const Segment &line, const Point2 &p)
{
    const Point2 dir = unit(line.b - line.a);
    const Point2 rel = p - line.a;
    return std::abs(rel.x * dir.y - rel.y * dir.x);
}

std::optional<Segment> try_merge(const Segment &s, const Segment &t, const EdgeDetectionConfig &cfg)
{
    if (deg_diff(segment_angle_deg(s), segment_angle_deg(t)) > cfg.mergeAngleTolDeg) {
        return std::nullopt;
    }
    if (perpendicular_distance(s, t.a) > cfg.mergeDistance || perpendicular_distance(s, t.b) > cfg.mergeDistance) {
        return std::nullopt;
    }

    const Point2 dir = unit(s.b - s.a);
    const auto project = [&](const Point2 &p) { return static_cast<double>((p - s.a).dot(dir)); };
    const double s0 = 0.0;
    const double s1 = project(s.b);
    const double t0 = std::min(project(t.a), project(t.b));
    const double t1 = std::max(project(t.a), project(t.b));
    const double gap = std::max(t0 - s1, s0 - t1);
    if (gap > cfg.mergeGap) {
        return std::nullopt;
    }

    const std::array<Point2, 4> points {s.a, s.b, t.a, t.b};
    size_t lo = 0;
    size_t hi = 0;
    for (size_t i = 1; i < points.size(); ++i) {
        if (project(points[i]) < project(points[lo])) {
            lo = i;
        }
        if (project(points[i]) > project(points[hi])) {
            hi = i;
        }
    }
    return Segment {points[lo], points[hi]};
}

std::vector<Segment> merge_colinear(std::vector<Segment> segments, const EdgeDetectionConfig &cfg)
{
    bool merged = true;
    while (merged) {
        merged = false;
        for (size_t i = 0; i < segments.size() && !merged; ++i) {
            for (size_t j = i + 1; j < segments.size(); ++j) {
                const auto joined = try_merge(segments[i], segments[j], cfg);
                if (joined) {
                    segments[i] = *joined;
                    segments.erase(segments.begin() + static_cast<std::ptrdiff_t>(j));
                    merged = true;
                    break;
                }
            }
        }
    }
    return segments;
}

std::vector<Segment> detect_segments(const cv::Mat &mask, const EdgeDetectionConfig &cfg)
{
    std::vector<cv::Vec4i> lines;
    cv::HoughLinesP(mask, lines, cfg.houghRho, cfg.houghThetaDeg * CV_PI / 180.0, cfg.houghVotes,
                    cfg.minSegmentLength, cfg.maxSegmentGap);

    std::vector<Segment> result;
    result.reserve(lines.size());
    for (const auto &l : lines) {
        result.push_back({Point2(static_cast<float>(l[0]), static_cast<float>(l[1])),
                          Point2(static_cast<float>(l[2]), static_cast<float>(l[3]))});
    }
    return result;
}

bool ink_at(const cv::Mat &mask, const Point2 &p)
{
    const int x = cvRound(p.x);
    const int y = cvRound(p.y);
    if (x < 0 || y < 0 || x >= mask.cols || y >= mask.rows) {
        return false;
    }
    return mask.at<uchar>(y, x) != 0;
}

// Length of the ink run crossing the perpendicular through p, limited to
// halfWidth on either side. Separate strokes nearby are not counted.
int perpendicular_spread(const cv::Mat &mask, const Point2 &p, const Point2 &normal, double halfWidth)
{
    const int steps = static_cast<int>(std::floor(halfWidth));
    int seed = std::numeric_limits<int>::max();
    for (int k = 0; k <= static_cast<int>(kCenterLineTolerance); ++k) {
        if (ink_at(mask, p + normal * static_cast<float>(k))) {
            seed = k;
            break;
        }
        if (ink_at(mask, p - normal * static_cast<float>(k))) {
            seed = -k;
            break;
        }
    }
    if (seed == std::numeric_limits<int>::max()) {
        return 0;
    }

    int low = seed;
    while (low - 1 >= -steps && ink_at(mask, p + normal * static_cast<float>(low - 1))) {
        --low;
    }
    int high = seed;
    while (high + 1 <= steps && ink_at(mask, p + normal * static_cast<float>(high + 1))) {
        ++high;
    }
    return high - low + 1;
}

bool ink_near_line(const cv::Mat &mask, const Point2 &p, const Point2 &normal)
{
    for (float k = -kCenterLineTolerance; k <= kCenterLineTolerance; k += 1.0F) {
        if (ink_at(mask, p + normal * k)) {
            return true;
        }
    }
    return false;
}

// Fraction of the centre line backed by ink.
double line_coverage(const cv::Mat &mask, const Segment &s)
{
    const double length = cv::norm(s.b - s.a);
    if (length < 1.0) {
        return 0.0;
    }
    const Point2 dir = unit(s.b - s.a);
    const Point2 normal(-dir.y, dir.x);
    const int samples = static_cast<int>(std::floor(length)) + 1;
    int covered = 0;
    for (int i = 0; i < samples; ++i) {
        if (ink_near_line(mask, s.a + dir * static_cast<float>(i), normal)) {
            ++covered;
        }
    }
    return static_cast<double>(covered) / static_cast<double>(samples);
}

// Typical stroke width along the body of the segment, ignoring gaps.
double body_spread(const cv::Mat &mask, const Segment &s, const EdgeDetectionConfig &cfg)
{
    const double length = cv::norm(s.b - s.a);
    const Point2 dir = unit(s.b - s.a);
    const Point2 normal(-dir.y, dir.x);
    std::vector<int> spreads;
    for (double t = cfg.arrowProbeLength; t <= length - cfg.arrowProbeLength; t += 1.0) {
        const int spread = perpendicular_spread(mask, s.a + dir * static_cast<float>(t), normal, cfg.arrowProbeHalfWidth);
        if (spread > 0) {
            spreads.push_back(spread);
        }
    }
    if (spreads.empty()) {
        return 1.0;
    }
    std::nth_element(spreads.begin(), spreads.begin() + static_cast<std::ptrdiff_t>(spreads.size() / 2), spreads.end());
    return std::max(1.0, static_cast<double>(spreads[spreads.size() / 2]));
}

// Widest perpendicular ink run around an endpoint, probing both inward and past the tip.
double end_spread(const cv::Mat &mask, const Point2 &end, const Point2 &outward, const EdgeDetectionConfig &cfg)
{
    const Point2 normal(-outward.y, outward.x);
    int best = 0;
    for (double t = -cfg.arrowProbeLength; t <= cfg.arrowProbeLength; t += 1.0) {
        best = std::max(best, perpendicular_spread(mask, end + outward * static_cast<float>(t), normal, cfg.arrowProbeHalfWidth));
    }
    return static_cast<double>(best);
}

EndpointMatch match_endpoint(const Point2 &p, const std::vector<Node> &nodes, double maxDistance)
{
    EndpointMatch best;
    double bestDistance = std::numeric_limits<double>::max();
    for (const auto &node : nodes) {
        const double d = node.shape.contains(p) ? 0.0 : node.shape.distanceToBoundary(p);
        if (d < bestDistance) {
            bestDistance = d;
            best.nodeId = node.id;
            best.distance = d;
        }
    }
    if (best.nodeId < 0 || bestDistance > maxDistance) {
        return {};
    }
    return best;
}

cv::Mat node_mask(const cv::Size &size, const std::vector<Node> &nodes, int margin)
{
    cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
    for (const auto &node : nodes) {
        if (node.shape.kind == ShapeKind::Circle) {
            cv::circle(mask, cv::Point(cvRound(node.shape.center.x), cvRound(node.shape.center.y)),
                       cvRound(node.shape.radius), cv::Scalar(255), cv::FILLED);
        } else {
            const std::vector<std::vector<cv::Point>> polys {node.shape.outline()};
            cv::fillPoly(mask, polys, cv::Scalar(255));
        }
    }
    if (margin > 0) {
        cv::dilate(mask, mask, cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(2 * margin + 1, 2 * margin + 1)));
    }
    return mask;
}

} // namespace

EdgeDetector::EdgeDetector(const EdgeDetectionConfig &config) : m_cfg(sanitizeConfig(config)) {}

std::vector<Edge> EdgeDetector::detect(const cv::Mat &image, const std::vector<Node> &nodes) const
{
    validateImage(image, "EdgeDetector");
    if (nodes.size() < 2) {
        return {};
    }

    const cv::Mat gray = ensureGray(image);
    const cv::Mat binary = inkMask(gray);
    cv::Mat outsideNodes;
    cv::bitwise_not(node_mask(gray.size(), nodes, m_cfg.nodeMaskMargin), outsideNodes);
    cv::Mat strokes;
    cv::bitwise_and(binary, outsideNodes, strokes);
    if (cv::countNonZero(strokes) == 0) {
        return {};
    }

    const auto raw = detect_segments(strokes, m_cfg);
    const auto segments = merge_colinear(raw, m_cfg);

    std::map<std::pair<int, int>, Edge> unique;
    int discarded = 0;
    for (const auto &segment : segments) {
        const auto startMatch = match_endpoint(segment.a, nodes, m_cfg.endpointDistance);
        const auto endMatch = match_endpoint(segment.b, nodes, m_cfg.endpointDistance);
        if (startMatch.nodeId < 0 || endMatch.nodeId < 0 || startMatch.nodeId == endMatch.nodeId) {
            ++discarded;
            continue;
        }

        const double coverage = line_coverage(strokes, segment);
        if (coverage < m_cfg.minCoverage) {
            ++discarded;
            continue;
        }

        const Point2 dir = unit(segment.b - segment.a);
        const double baseline = body_spread(strokes, segment, m_cfg);
        const auto isArrow = [&](double spread) {
            return spread >= m_cfg.arrowMinSpread && spread >= m_cfg.arrowSpreadRatio * baseline;
        };
        const bool arrowAtStart = isArrow(end_spread(strokes, segment.a, -dir, m_cfg));
        const bool arrowAtEnd = isArrow(end_spread(strokes, segment.b, dir, m_cfg));

        Edge edge;
        edge.directed = arrowAtStart != arrowAtEnd;
        edge.style = coverage >= m_cfg.solidCoverage ? EdgeStyle::Solid : EdgeStyle::Dashed;
        if (edge.directed && arrowAtStart) {
            edge.source = endMatch.nodeId;
            edge.target = startMatch.nodeId;
            edge.sourcePoint = segment.b;
            edge.targetPoint = segment.a;
        } else {
            edge.source = startMatch.nodeId;
            edge.target = endMatch.nodeId;
            edge.sourcePoint = segment.a;
            edge.targetPoint = segment.b;
        }
        if (!edge.directed && edge.source > edge.target) {
            std::swap(edge.source, edge.target);
            std::swap(edge.sourcePoint, edge.targetPoint);
        }

        const double inkScore = std::min(1.0, coverage / m_cfg.solidCoverage);
        const double reach = 1.0 - 0.5 * (startMatch.distance + endMatch.distance) / (2.0 * m_cfg.endpointDistance);
        edge.confidence = std::clamp((0.5 + 0.5 * inkScore) * reach, 0.0, 1.0);

        const auto key = std::make_pair(edge.source, edge.target);
        const auto it = unique.find(key);
        if (it == unique.end()) {
            unique.emplace(key, edge);
        } else if (edge.confidence > it->second.confidence) {
            it->second = edge;
        }
    }

    std::vector<Edge> edges;
    edges.reserve(unique.size());
    for (auto &entry : unique) {
        entry.second.id = static_cast<int>(edges.size());
        edges.push_back(entry.second);
    }

    Logger::info(QStringLiteral("EdgeDetector: %1 edges | raw segments=%2 merged=%3 discarded=%4")
                     .arg(static_cast<int>(edges.size()))
                     .arg(static_cast<int>(raw.size()))
                     .arg(static_cast<int>(segments.size()))
                     .arg(discarded));
    return edges;
}

} // namespace graphscan
