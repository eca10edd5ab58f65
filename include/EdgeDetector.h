#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "Config.h"
#include "GraphElements.h"

namespace graphscan {

// Finds straight connectors between detected nodes.
class EdgeDetector {
public:
    explicit EdgeDetector(const EdgeDetectionConfig &config = EdgeDetectionConfig());

    // Every returned edge joins two distinct ids taken from nodes. Undirected
    // edges are stored with source < target. Ordered by (source, target).
    std::vector<Edge> detect(const cv::Mat &image, const std::vector<Node> &nodes) const;

    [[nodiscard]] const EdgeDetectionConfig &config() const { return m_cfg; }

private:
    EdgeDetectionConfig m_cfg;
};

} // namespace graphscan
