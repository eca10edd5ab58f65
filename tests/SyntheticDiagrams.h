#pragma once

#include <algorithm>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

// Hand-drawn fixtures with known ground truth. Two nodes sit on the row y=150,
// left at x=100 and right at x=300, radius 30, joined by a horizontal connector.
namespace fixtures {

constexpr int kWidth = 400;
constexpr int kHeight = 300;
const cv::Point kLeft(100, 150);
const cv::Point kRight(300, 150);
constexpr int kRadius = 30;
constexpr int kStroke = 4;

inline cv::Mat blank(int width = kWidth, int height = kHeight)
{
    return cv::Mat(height, width, CV_8UC3, cv::Scalar::all(255));
}

inline void drawNodes(cv::Mat &image, int thickness = cv::FILLED)
{
    cv::circle(image, kLeft, kRadius, cv::Scalar::all(0), thickness, cv::LINE_8);
    cv::circle(image, kRight, kRadius, cv::Scalar::all(0), thickness, cv::LINE_8);
}

inline cv::Mat twoCirclesJoined()
{
    cv::Mat image = blank();
    drawNodes(image);
    cv::line(image, {kLeft.x + kRadius, kLeft.y}, {kRight.x - kRadius, kRight.y}, cv::Scalar::all(0), kStroke,
             cv::LINE_8);
    return image;
}

inline cv::Mat twoCirclesArrow()
{
    cv::Mat image = twoCirclesJoined();
    const std::vector<cv::Point> head {{kRight.x - kRadius - 4, kRight.y},
                                       {kRight.x - kRadius - 30, kRight.y - 12},
                                       {kRight.x - kRadius - 30, kRight.y + 12}};
    cv::fillConvexPoly(image, head, cv::Scalar::all(0), cv::LINE_8);
    return image;
}

inline cv::Mat twoCirclesDashed()
{
    cv::Mat image = blank();
    drawNodes(image);
    for (int x = kLeft.x + kRadius; x < kRight.x - kRadius; x += 18) {
        const int end = std::min(x + 12, kRight.x - kRadius);
        cv::line(image, {x, kLeft.y}, {end, kLeft.y}, cv::Scalar::all(0), kStroke, cv::LINE_8);
    }
    return image;
}

inline cv::Mat twoHollowCirclesJoined()
{
    cv::Mat image = blank();
    drawNodes(image, 3);
    cv::line(image, {kLeft.x + kRadius, kLeft.y}, {kRight.x - kRadius, kRight.y}, cv::Scalar::all(0), kStroke,
             cv::LINE_8);
    return image;
}

inline cv::Mat twoRectanglesJoined()
{
    cv::Mat image = blank();
    cv::rectangle(image, cv::Rect(60, 120, 80, 60), cv::Scalar::all(0), cv::FILLED, cv::LINE_8);
    cv::rectangle(image, cv::Rect(260, 120, 80, 60), cv::Scalar::all(0), cv::FILLED, cv::LINE_8);
    cv::line(image, {140, 150}, {260, 150}, cv::Scalar::all(0), kStroke, cv::LINE_8);
    return image;
}

// Gaussian noise plus salt and pepper, seeded so every run sees the same pixels.
inline cv::Mat degraded(const cv::Mat &clean, double sigma = 50.0, double saltPepper = 0.05)
{
    cv::RNG rng(0x5eed);
    cv::Mat noise(clean.size(), CV_32FC3);
    rng.fill(noise, cv::RNG::NORMAL, cv::Scalar::all(0.0), cv::Scalar::all(sigma));

    cv::Mat noisy;
    clean.convertTo(noisy, CV_32FC3);
    noisy += noise;
    noisy.convertTo(noisy, CV_8UC3);

    const int flips = static_cast<int>(saltPepper * clean.total());
    for (int i = 0; i < flips; ++i) {
        const int x = rng.uniform(0, clean.cols);
        const int y = rng.uniform(0, clean.rows);
        noisy.at<cv::Vec3b>(y, x) = (i % 2 == 0) ? cv::Vec3b(0, 0, 0) : cv::Vec3b(255, 255, 255);
    }
    return noisy;
}

} // namespace fixtures
