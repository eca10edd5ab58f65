#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace graphscan {

enum class ShapeKind {
    Circle,
    Rectangle,
    Polygon
};

// Geometry of a detected node. Rectangles and polygons keep their vertices in
// contour order; circles keep centre and radius only.
struct Shape {
    ShapeKind kind {ShapeKind::Circle};
    cv::Point2f center {0.0F, 0.0F};
    float radius {0.0F};
    cv::Rect2f bounds {};
    std::vector<cv::Point2f> vertices;

    static Shape circle(const cv::Point2f &center, float radius);
    static Shape rectangle(const cv::Rect2f &box);
    static Shape polygon(std::vector<cv::Point2f> vertices);

    [[nodiscard]] double area() const;
    [[nodiscard]] bool contains(const cv::Point2f &point) const;
    // Unsigned distance from point to the outline.
    [[nodiscard]] double distanceToBoundary(const cv::Point2f &point) const;
    // Integer outline for rasterising masks.
    [[nodiscard]] std::vector<cv::Point> outline() const;

    bool operator==(const Shape &other) const;
    bool operator!=(const Shape &other) const { return !(*this == other); }
};

struct TextLabel {
    std::string text;
    double confidence {0.0};
    double distance {0.0};

    bool operator==(const TextLabel &other) const;
};

struct Node {
    int id {0};
    Shape shape;
    double confidence {0.0};
    std::optional<TextLabel> label;

    bool operator==(const Node &other) const;
    bool operator!=(const Node &other) const { return !(*this == other); }
};

enum class EdgeStyle {
    Solid,
    Dashed
};

struct Edge {
    int id {0};
    int source {0};
    int target {0};
    bool directed {false};
    EdgeStyle style {EdgeStyle::Solid};
    double confidence {0.0};
    cv::Point2f sourcePoint {0.0F, 0.0F};
    cv::Point2f targetPoint {0.0F, 0.0F};
    std::optional<TextLabel> label;

    [[nodiscard]] double length() const;
    [[nodiscard]] cv::Point2f midpoint() const;
    [[nodiscard]] cv::Rect2f boundingBox(float padding = 0.0F) const;

    bool operator==(const Edge &other) const;
    bool operator!=(const Edge &other) const { return !(*this == other); }
};

struct TextRegion {
    std::string text;
    double confidence {0.0};
    cv::Rect2f box {};

    [[nodiscard]] cv::Point2f center() const;

    bool operator==(const TextRegion &other) const;
};

std::string toString(ShapeKind kind);
ShapeKind shapeKindFromString(const std::string &value, ShapeKind fallback = ShapeKind::Polygon);

std::string toString(EdgeStyle style);
EdgeStyle edgeStyleFromString(const std::string &value, EdgeStyle fallback = EdgeStyle::Solid);

double intersectionOverUnion(const cv::Rect2f &a, const cv::Rect2f &b);
double overlapArea(const cv::Rect2f &a, const cv::Rect2f &b);

} // namespace graphscan
