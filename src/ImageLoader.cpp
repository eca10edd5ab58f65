#include "ImageLoader.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>

#include <QImage>
#include <QImageReader>
#include <QString>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "Errors.h"

namespace fs = std::filesystem;

namespace graphscan {

namespace {
constexpr const char *kExtensions[] = {".png", ".jpg", ".jpeg", ".bmp", ".tif", ".tiff", ".webp", ".gif"};

std::string lowered_extension(const fs::path &path)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// OpenCV has no GIF reader in most builds.
bool prefers_qt_reader(const fs::path &path)
{
    return lowered_extension(path) == ".gif";
}

cv::Mat from_qimage(QImage qimage, const std::string &origin)
{
    const bool alpha = qimage.hasAlphaChannel();
    qimage = qimage.convertToFormat(alpha ? QImage::Format_RGBA8888 : QImage::Format_RGB888);
    if (qimage.isNull()) {
        throw InvalidImage("Failed to convert image to RGB: " + origin);
    }
    cv::Mat wrapped(qimage.height(), qimage.width(), alpha ? CV_8UC4 : CV_8UC3,
                    const_cast<uchar *>(qimage.bits()), qimage.bytesPerLine());
    cv::Mat converted;
    cv::cvtColor(wrapped, converted, alpha ? cv::COLOR_RGBA2BGRA : cv::COLOR_RGB2BGR);
    return converted;
}

cv::Mat load_with_qt_reader(const std::string &path)
{
    QImageReader reader(QString::fromStdString(path));
    reader.setAutoTransform(true);
    QImage qimage = reader.read();
    if (qimage.isNull()) {
        throw InvalidImage("Failed to read image: " + path + ", error: " + reader.errorString().toStdString());
    }
    return from_qimage(std::move(qimage), path);
}

cv::Mat to_eight_bit(cv::Mat image)
{
    if (image.depth() == CV_8U) {
        return image;
    }
    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(image.reshape(1), &minVal, &maxVal);
    const double scale = maxVal > minVal ? 255.0 / (maxVal - minVal) : 1.0;
    cv::Mat converted;
    image.convertTo(converted, CV_8U, scale, -minVal * scale);
    return converted;
}

} // namespace

bool ImageLoader::isSupported(const std::string &path)
{
    const std::string ext = lowered_extension(fs::path(path));
    return std::any_of(std::begin(kExtensions), std::end(kExtensions),
                       [&ext](const char *candidate) { return ext == candidate; });
}

std::vector<std::string> ImageLoader::gatherImageFiles(const std::string &directory) const
{
    std::vector<std::string> files;
    fs::path dirPath(directory);
    if (!fs::exists(dirPath) || !fs::is_directory(dirPath)) {
        throw InvalidImage("Directory does not exist: " + directory);
    }

    for (const auto &entry : fs::directory_iterator(dirPath)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (isSupported(entry.path().string())) {
            files.emplace_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

cv::Mat ImageLoader::loadImage(const std::string &path) const
{
    fs::path filePath(path);
    if (!fs::exists(filePath)) {
        throw InvalidImage("Image does not exist: " + path);
    }
    if (prefers_qt_reader(filePath)) {
        return load_with_qt_reader(path);
    }

    cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (!image.empty() && image.dims == 2) {
        image = to_eight_bit(std::move(image));
        if (image.channels() == 1) {
            cv::cvtColor(image, image, cv::COLOR_GRAY2BGR);
        }
        return image;
    }

    return load_with_qt_reader(path);
}

cv::Mat ImageLoader::decodeImage(const QByteArray &bytes) const
{
    if (bytes.isEmpty()) {
        throw InvalidImage("Empty image buffer");
    }
    const cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<char *>(bytes.constData()));
    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (!image.empty()) {
        return image;
    }

    QImage qimage;
    if (!qimage.loadFromData(bytes)) {
        throw InvalidImage("Buffer is not a decodable image");
    }
    return from_qimage(std::move(qimage), "<buffer>");
}

} // namespace graphscan
