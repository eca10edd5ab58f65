#include "TextLocalizer.h"

#include <QSemaphore>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>

#include "Errors.h"
#include "Logger.h"

namespace graphscan {

namespace {

// Same text recognised twice at this overlap is one word seen through two crops.
constexpr double kDuplicateIoU = 0.5;

struct OcrOutcome {
    std::vector<TextRegion> regions;
    bool ok {false};
    QString error;
};

cv::Rect padded(const cv::Rect2f &box, int padding, const cv::Size &size)
{
    cv::Rect rect(cvFloor(box.x) - padding, cvFloor(box.y) - padding, cvCeil(box.width) + 2 * padding,
                  cvCeil(box.height) + 2 * padding);
    return rect & cv::Rect(0, 0, size.width, size.height);
}

OcrOutcome run_engine(OcrEngine &engine, const cv::Mat &image, const std::vector<cv::Rect> &crops,
                      const QStringList &languages)
{
    OcrOutcome outcome;
    try {
        for (const auto &crop : crops) {
            auto found = engine.recognize(image(crop), languages);
            for (auto &region : found) {
                region.box.x += static_cast<float>(crop.x);
                region.box.y += static_cast<float>(crop.y);
                outcome.regions.push_back(std::move(region));
            }
        }
        outcome.ok = true;
    } catch (const EngineUnavailable &ex) {
        outcome.error = QString::fromUtf8(ex.what());
    } catch (const cv::Exception &ex) {
        outcome.error = QStringLiteral("OpenCV error during OCR: %1").arg(QString::fromUtf8(ex.what()));
    } catch (const std::exception &ex) {
        outcome.error = QStringLiteral("OCR engine error: %1").arg(QString::fromUtf8(ex.what()));
    }
    return outcome;
}

std::vector<TextRegion> merge_duplicates(std::vector<TextRegion> regions)
{
    std::vector<size_t> order(regions.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return regions[a].confidence > regions[b].confidence; });

    std::vector<bool> keep(regions.size(), false);
    std::vector<size_t> kept;
    for (const size_t i : order) {
        const bool duplicate = std::any_of(kept.begin(), kept.end(), [&](size_t k) {
            return regions[k].text == regions[i].text &&
                   intersectionOverUnion(regions[k].box, regions[i].box) >= kDuplicateIoU;
        });
        if (!duplicate) {
            keep[i] = true;
            kept.push_back(i);
        }
    }

    std::vector<TextRegion> merged;
    merged.reserve(kept.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        if (keep[i]) {
            merged.push_back(std::move(regions[i]));
        }
    }
    return merged;
}

} // namespace

TextLocalizer::TextLocalizer(std::shared_ptr<OcrEngine> engine, QThreadPool *pool, const TextConfig &config)
    : m_engine(std::move(engine))
    , m_pool(pool)
    , m_cfg(sanitizeConfig(config))
{
}

std::vector<cv::Rect> TextLocalizer::cropsFor(const cv::Size &size, const std::vector<Node> &nodes,
                                              const std::vector<Edge> &edges) const
{
    const cv::Rect whole(0, 0, size.width, size.height);
    if (m_cfg.cropMode == TextCropMode::WholeImage) {
        return {whole};
    }

    std::vector<cv::Rect> crops;
    const auto addCrop = [&](const cv::Rect &rect) {
        if (rect.width <= 0 || rect.height <= 0) {
            return;
        }
        if (std::find(crops.begin(), crops.end(), rect) == crops.end()) {
            crops.push_back(rect);
        }
    };
    for (const auto &node : nodes) {
        addCrop(padded(node.shape.bounds, m_cfg.cropPadding, size));
    }
    for (const auto &edge : edges) {
        addCrop(padded(edge.boundingBox(), m_cfg.cropPadding, size));
    }
    return crops;
}

TextLocalization TextLocalizer::localize(const cv::Mat &image, const std::vector<Node> &nodes,
                                         const std::vector<Edge> &edges) const
{
    TextLocalization result;
    if (!m_cfg.enabled || !m_engine) {
        result.available = false;
        result.note = QStringLiteral("OCR disabled");
        return result;
    }

    const auto crops = cropsFor(image.size(), nodes, edges);
    if (crops.empty()) {
        return result;
    }

    // Shared with the task so a timed-out recognition can still finish safely.
    auto done = std::make_shared<QSemaphore>(0);
    auto engine = m_engine;
    const QStringList languages = m_cfg.languages;
    QThreadPool *pool = m_pool ? m_pool : QThreadPool::globalInstance();
    QFuture<OcrOutcome> future = QtConcurrent::run(pool, [engine, image, crops, languages, done]() {
        OcrOutcome outcome = run_engine(*engine, image, crops, languages);
        done->release();
        return outcome;
    });

    if (!done->tryAcquire(1, m_cfg.timeoutMs)) {
        result.available = false;
        result.note = QStringLiteral("OCR timed out after %1 ms").arg(m_cfg.timeoutMs);
        Logger::warning(QStringLiteral("TextLocalizer: %1; continuing without labels").arg(result.note));
        return result;
    }

    OcrOutcome outcome = future.result();
    if (!outcome.ok) {
        result.available = false;
        result.note = QStringLiteral("OCR unavailable: %1").arg(outcome.error);
        Logger::warning(QStringLiteral("TextLocalizer: %1; continuing without labels").arg(result.note));
        return result;
    }

    const size_t recognised = outcome.regions.size();
    for (auto &region : outcome.regions) {
        if (region.confidence < m_cfg.minConfidence) {
            continue;
        }
        const QString trimmed = QString::fromStdString(region.text).trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }
        region.text = trimmed.toStdString();
        result.regions.push_back(std::move(region));
    }
    result.regions = merge_duplicates(std::move(result.regions));

    Logger::info(QStringLiteral("TextLocalizer: %1 regions kept of %2 | crops=%3")
                     .arg(static_cast<int>(result.regions.size()))
                     .arg(static_cast<int>(recognised))
                     .arg(static_cast<int>(crops.size())));
    return result;
}

} // namespace graphscan
