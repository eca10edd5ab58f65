#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "Config.h"
#include "GraphElements.h"

namespace graphscan {

// Finds closed shapes (filled or outlined) that act as graph vertices.
class NodeDetector {
public:
    explicit NodeDetector(const NodeDetectionConfig &config = NodeDetectionConfig());

    // Nodes ordered top-to-bottom then left-to-right, ids 0..n-1. Empty when
    // nothing qualifies.
    std::vector<Node> detect(const cv::Mat &image) const;

    [[nodiscard]] const NodeDetectionConfig &config() const { return m_cfg; }

private:
    NodeDetectionConfig m_cfg;
};

} // namespace graphscan
