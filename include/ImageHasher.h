#pragma once

#include <QString>

#include <opencv2/core.hpp>

namespace graphscan {

// Perceptual content key "<phash>_<dhash>" (hex). Stable under re-encoding and
// mild noise; distinct for visibly different drawings.
class ImageHasher {
public:
    explicit ImageHasher(int hashSize = 16);

    // Throws InvalidImage on malformed input.
    QString compute(const cv::Mat &image) const;

    // Mean Hamming distance of the two halves; -1 when either key is malformed
    // or the keys have different lengths.
    static int hammingDistance(const QString &a, const QString &b);
    static bool areSimilar(const QString &a, const QString &b, int threshold = 10);

    [[nodiscard]] int hashSize() const { return m_hashSize; }

private:
    QString perceptualHash(const cv::Mat &gray) const;
    QString differenceHash(const cv::Mat &gray) const;

    int m_hashSize {16};
};

} // namespace graphscan
