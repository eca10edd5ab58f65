#pragma once

#include <string>
#include <vector>

#include <QByteArray>

#include <opencv2/core.hpp>

namespace graphscan {

// Reads diagram images as 8-bit BGR (or BGRA when the file carries alpha).
// Failures throw InvalidImage.
class ImageLoader {
public:
    ImageLoader() = default;

    [[nodiscard]] std::vector<std::string> gatherImageFiles(const std::string &directory) const;

    [[nodiscard]] cv::Mat loadImage(const std::string &path) const;
    [[nodiscard]] cv::Mat decodeImage(const QByteArray &bytes) const;

    [[nodiscard]] static bool isSupported(const std::string &path);
};

} // namespace graphscan
