#include "ImageHasher.h"

#include <QStringList>

#include <algorithm>
#include <bitset>
#include <vector>

#include <opencv2/imgproc.hpp>

#include "ImageUtils.h"

namespace graphscan {

namespace {

constexpr int kNormalisedSize = 256;
constexpr int kDctOversample = 4;

QString bits_to_hex(const std::vector<bool> &bits)
{
    QString hex;
    hex.reserve(static_cast<int>(bits.size() / 4));
    for (size_t i = 0; i + 3 < bits.size(); i += 4) {
        const int nibble = (bits[i] ? 8 : 0) | (bits[i + 1] ? 4 : 0) | (bits[i + 2] ? 2 : 0) | (bits[i + 3] ? 1 : 0);
        hex.append(QString::number(nibble, 16));
    }
    return hex;
}

int hex_distance(const QString &a, const QString &b)
{
    if (a.size() != b.size() || a.isEmpty()) {
        return -1;
    }
    int distance = 0;
    for (int i = 0; i < a.size(); ++i) {
        bool okA = false;
        bool okB = false;
        const int va = QString(a.at(i)).toInt(&okA, 16);
        const int vb = QString(b.at(i)).toInt(&okB, 16);
        if (!okA || !okB) {
            return -1;
        }
        distance += static_cast<int>(std::bitset<4>(static_cast<unsigned long>(va ^ vb)).count());
    }
    return distance;
}

} // namespace

ImageHasher::ImageHasher(int hashSize) : m_hashSize(std::max(2, hashSize + (hashSize % 2))) {}

QString ImageHasher::compute(const cv::Mat &image) const
{
    validateImage(image, "ImageHasher");
    const cv::Mat gray = ensureGray(image);
    cv::Mat normalised;
    cv::resize(gray, normalised, cv::Size(kNormalisedSize, kNormalisedSize), 0.0, 0.0, cv::INTER_AREA);
    return perceptualHash(normalised) + QLatin1Char('_') + differenceHash(normalised);
}

// Low-frequency DCT coefficients compared against their median.
QString ImageHasher::perceptualHash(const cv::Mat &gray) const
{
    const int side = m_hashSize * kDctOversample;
    cv::Mat small;
    cv::resize(gray, small, cv::Size(side, side), 0.0, 0.0, cv::INTER_AREA);
    cv::Mat floating;
    small.convertTo(floating, CV_32F);
    cv::Mat spectrum;
    cv::dct(floating, spectrum);

    const cv::Mat low = spectrum(cv::Rect(0, 0, m_hashSize, m_hashSize)).clone();
    std::vector<float> values(low.begin<float>(), low.end<float>());
    std::vector<float> sorted = values;
    std::nth_element(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(sorted.size() / 2), sorted.end());
    const float median = sorted[sorted.size() / 2];

    std::vector<bool> bits;
    bits.reserve(values.size());
    for (const float v : values) {
        bits.push_back(v > median);
    }
    return bits_to_hex(bits);
}

// Horizontal gradient sign on a (hashSize + 1) x hashSize thumbnail.
QString ImageHasher::differenceHash(const cv::Mat &gray) const
{
    cv::Mat small;
    cv::resize(gray, small, cv::Size(m_hashSize + 1, m_hashSize), 0.0, 0.0, cv::INTER_AREA);

    std::vector<bool> bits;
    bits.reserve(static_cast<size_t>(m_hashSize * m_hashSize));
    for (int y = 0; y < small.rows; ++y) {
        const uchar *row = small.ptr<uchar>(y);
        for (int x = 0; x < m_hashSize; ++x) {
            bits.push_back(row[x + 1] > row[x]);
        }
    }
    return bits_to_hex(bits);
}

int ImageHasher::hammingDistance(const QString &a, const QString &b)
{
    const QStringList partsA = a.split(QLatin1Char('_'));
    const QStringList partsB = b.split(QLatin1Char('_'));
    if (partsA.size() != 2 || partsB.size() != 2) {
        return -1;
    }
    const int phash = hex_distance(partsA.at(0), partsB.at(0));
    const int dhash = hex_distance(partsA.at(1), partsB.at(1));
    if (phash < 0 || dhash < 0) {
        return -1;
    }
    return (phash + dhash) / 2;
}

bool ImageHasher::areSimilar(const QString &a, const QString &b, int threshold)
{
    const int distance = hammingDistance(a, b);
    return distance >= 0 && distance <= threshold;
}

} // namespace graphscan
