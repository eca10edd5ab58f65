#pragma once

#include <vector>

#include "Config.h"
#include "GraphElements.h"

namespace graphscan {

struct TextMapping {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    int unclaimed {0};
};

// Attaches recognised text to the nearest node or edge. Pairs are claimed in
// globally ascending distance order, so one region labels at most one element
// and one element carries at most one label.
class TextMapper {
public:
    explicit TextMapper(const TextConfig &config = TextConfig());

    TextMapping map(const std::vector<TextRegion> &regions, std::vector<Node> nodes, std::vector<Edge> edges) const;

    // Distance used for claiming; exposed for diagnostics.
    static double distanceToNode(const TextRegion &region, const Node &node);
    static double distanceToEdge(const TextRegion &region, const Edge &edge);

private:
    double m_claimDistance {50.0};
};

} // namespace graphscan
