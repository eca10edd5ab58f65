#pragma once

#include <QString>

#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "Config.h"
#include "GraphElements.h"
#include "OcrEngine.h"

class QThreadPool;

namespace graphscan {

struct TextLocalization {
    std::vector<TextRegion> regions;
    bool available {true};
    QString note;
};

// Runs the OCR engine on its own pool so slow recognition never occupies the
// geometric workers. Engine failure or timeout yields an empty, unavailable result.
class TextLocalizer {
public:
    TextLocalizer(std::shared_ptr<OcrEngine> engine, QThreadPool *pool, const TextConfig &config = TextConfig());

    TextLocalization localize(const cv::Mat &image, const std::vector<Node> &nodes, const std::vector<Edge> &edges) const;

    [[nodiscard]] const TextConfig &config() const { return m_cfg; }

private:
    std::vector<cv::Rect> cropsFor(const cv::Size &size, const std::vector<Node> &nodes, const std::vector<Edge> &edges) const;

    std::shared_ptr<OcrEngine> m_engine;
    QThreadPool *m_pool {nullptr};
    TextConfig m_cfg;
};

} // namespace graphscan
