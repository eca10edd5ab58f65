#pragma once

#include <QStringList>

#include <vector>

#include <opencv2/core.hpp>

#include "GraphElements.h"

namespace graphscan {

// Black-box text recogniser. Boxes are in the coordinates of the region passed in.
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    // Throws EngineUnavailable when the engine cannot serve the request.
    virtual std::vector<TextRegion> recognize(const cv::Mat &region, const QStringList &languages) = 0;
};

} // namespace graphscan
