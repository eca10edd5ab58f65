#include "GraphElements.h"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace graphscan {

namespace {

constexpr int kCircleOutlineSegments = 64;

cv::Rect2f boundsOf(const std::vector<cv::Point2f> &points)
{
    if (points.empty()) {
        return {};
    }
    float minX = points.front().x;
    float maxX = points.front().x;
    float minY = points.front().y;
    float maxY = points.front().y;
    for (const auto &p : points) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }
    return {minX, minY, maxX - minX, maxY - minY};
}

cv::Point2f centroidOf(const std::vector<cv::Point2f> &points)
{
    if (points.empty()) {
        return {0.0F, 0.0F};
    }
    const cv::Moments m = cv::moments(points);
    if (std::abs(m.m00) > 1e-6) {
        return {static_cast<float>(m.m10 / m.m00), static_cast<float>(m.m01 / m.m00)};
    }
    cv::Point2f sum(0.0F, 0.0F);
    for (const auto &p : points) {
        sum += p;
    }
    return sum * (1.0F / static_cast<float>(points.size()));
}

} // namespace

Shape Shape::circle(const cv::Point2f &center, float radius)
{
    Shape shape;
    shape.kind = ShapeKind::Circle;
    shape.center = center;
    shape.radius = std::max(radius, 0.0F);
    shape.bounds = cv::Rect2f(center.x - shape.radius, center.y - shape.radius,
                              2.0F * shape.radius, 2.0F * shape.radius);
    return shape;
}

Shape Shape::rectangle(const cv::Rect2f &box)
{
    Shape shape;
    shape.kind = ShapeKind::Rectangle;
    shape.bounds = box;
    shape.center = cv::Point2f(box.x + box.width * 0.5F, box.y + box.height * 0.5F);
    shape.vertices = {
        {box.x, box.y},
        {box.x + box.width, box.y},
        {box.x + box.width, box.y + box.height},
        {box.x, box.y + box.height},
    };
    return shape;
}

Shape Shape::polygon(std::vector<cv::Point2f> vertices)
{
    Shape shape;
    shape.kind = ShapeKind::Polygon;
    shape.bounds = boundsOf(vertices);
    shape.center = centroidOf(vertices);
    shape.vertices = std::move(vertices);
    return shape;
}

double Shape::area() const
{
    switch (kind) {
    case ShapeKind::Circle:
        return CV_PI * static_cast<double>(radius) * static_cast<double>(radius);
    case ShapeKind::Rectangle:
        return static_cast<double>(bounds.area());
    case ShapeKind::Polygon:
    default:
        return vertices.size() < 3 ? 0.0 : std::abs(cv::contourArea(vertices));
    }
}

bool Shape::contains(const cv::Point2f &point) const
{
    switch (kind) {
    case ShapeKind::Circle:
        return cv::norm(point - center) <= static_cast<double>(radius);
    case ShapeKind::Rectangle:
        return point.x >= bounds.x && point.x <= bounds.x + bounds.width &&
               point.y >= bounds.y && point.y <= bounds.y + bounds.height;
    case ShapeKind::Polygon:
    default:
        return vertices.size() >= 3 && cv::pointPolygonTest(vertices, point, false) >= 0.0;
    }
}

double Shape::distanceToBoundary(const cv::Point2f &point) const
{
    if (kind == ShapeKind::Circle) {
        return std::abs(cv::norm(point - center) - static_cast<double>(radius));
    }
    if (vertices.size() < 3) {
        return cv::norm(point - center);
    }
    return std::abs(cv::pointPolygonTest(vertices, point, true));
}

std::vector<cv::Point> Shape::outline() const
{
    std::vector<cv::Point> points;
    if (kind == ShapeKind::Circle) {
        points.reserve(kCircleOutlineSegments);
        for (int i = 0; i < kCircleOutlineSegments; ++i) {
            const double angle = 2.0 * CV_PI * static_cast<double>(i) / kCircleOutlineSegments;
            points.emplace_back(cvRound(center.x + radius * std::cos(angle)),
                                cvRound(center.y + radius * std::sin(angle)));
        }
        return points;
    }
    points.reserve(vertices.size());
    for (const auto &v : vertices) {
        points.emplace_back(cvRound(v.x), cvRound(v.y));
    }
    return points;
}

bool Shape::operator==(const Shape &other) const
{
    return kind == other.kind && center == other.center && radius == other.radius &&
           bounds == other.bounds && vertices == other.vertices;
}

bool TextLabel::operator==(const TextLabel &other) const
{
    return text == other.text && confidence == other.confidence && distance == other.distance;
}

bool Node::operator==(const Node &other) const
{
    return id == other.id && shape == other.shape && confidence == other.confidence && label == other.label;
}

double Edge::length() const
{
    return cv::norm(targetPoint - sourcePoint);
}

cv::Point2f Edge::midpoint() const
{
    return (sourcePoint + targetPoint) * 0.5F;
}

cv::Rect2f Edge::boundingBox(float padding) const
{
    const float minX = std::min(sourcePoint.x, targetPoint.x) - padding;
    const float minY = std::min(sourcePoint.y, targetPoint.y) - padding;
    const float maxX = std::max(sourcePoint.x, targetPoint.x) + padding;
    const float maxY = std::max(sourcePoint.y, targetPoint.y) + padding;
    return {minX, minY, maxX - minX, maxY - minY};
}

bool Edge::operator==(const Edge &other) const
{
    return id == other.id && source == other.source && target == other.target &&
           directed == other.directed && style == other.style && confidence == other.confidence &&
           sourcePoint == other.sourcePoint && targetPoint == other.targetPoint && label == other.label;
}

cv::Point2f TextRegion::center() const
{
    return {box.x + box.width * 0.5F, box.y + box.height * 0.5F};
}

bool TextRegion::operator==(const TextRegion &other) const
{
    return text == other.text && confidence == other.confidence && box == other.box;
}

std::string toString(ShapeKind kind)
{
    switch (kind) {
    case ShapeKind::Circle:
        return "circle";
    case ShapeKind::Rectangle:
        return "rectangle";
    case ShapeKind::Polygon:
    default:
        return "polygon";
    }
}

ShapeKind shapeKindFromString(const std::string &value, ShapeKind fallback)
{
    if (value == "circle") {
        return ShapeKind::Circle;
    }
    if (value == "rectangle") {
        return ShapeKind::Rectangle;
    }
    if (value == "polygon") {
        return ShapeKind::Polygon;
    }
    return fallback;
}

std::string toString(EdgeStyle style)
{
    return style == EdgeStyle::Dashed ? "dashed" : "solid";
}

EdgeStyle edgeStyleFromString(const std::string &value, EdgeStyle fallback)
{
    if (value == "solid") {
        return EdgeStyle::Solid;
    }
    if (value == "dashed") {
        return EdgeStyle::Dashed;
    }
    return fallback;
}

double overlapArea(const cv::Rect2f &a, const cv::Rect2f &b)
{
    const cv::Rect2f inter = a & b;
    return inter.empty() ? 0.0 : static_cast<double>(inter.area());
}

double intersectionOverUnion(const cv::Rect2f &a, const cv::Rect2f &b)
{
    const double inter = overlapArea(a, b);
    const double uni = static_cast<double>(a.area()) + static_cast<double>(b.area()) - inter;
    if (uni <= 1e-9) {
        return 0.0;
    }
    return inter / uni;
}

} // namespace graphscan
