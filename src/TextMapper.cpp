#include "TextMapper.h"

#include <algorithm>
#include <cmath>
#include <tuple>

#include "Logger.h"

namespace graphscan {

namespace {

enum class TargetKind {
    Node = 0,
    Edge = 1
};

struct ClaimCandidate {
    double distance {0.0};
    double overlap {0.0};
    size_t region {0};
    TargetKind kind {TargetKind::Node};
    size_t index {0};
};

constexpr float kEdgeBoxPadding = 2.0F;

} // namespace

TextMapper::TextMapper(const TextConfig &config) : m_claimDistance(sanitizeConfig(config).claimDistance) {}

double TextMapper::distanceToNode(const TextRegion &region, const Node &node)
{
    const cv::Point2f c = region.center();
    const double toCenter = cv::norm(c - node.shape.center);
    const double toBoundary = node.shape.distanceToBoundary(c);
    return std::min(toCenter, toBoundary);
}

double TextMapper::distanceToEdge(const TextRegion &region, const Edge &edge)
{
    return cv::norm(region.center() - edge.midpoint());
}

TextMapping TextMapper::map(const std::vector<TextRegion> &regions, std::vector<Node> nodes, std::vector<Edge> edges) const
{
    std::vector<ClaimCandidate> pairs;
    for (size_t r = 0; r < regions.size(); ++r) {
        const auto &region = regions[r];
        for (size_t n = 0; n < nodes.size(); ++n) {
            const double d = distanceToNode(region, nodes[n]);
            if (d < m_claimDistance) {
                pairs.push_back({d, overlapArea(region.box, nodes[n].shape.bounds), r, TargetKind::Node, n});
            }
        }
        for (size_t e = 0; e < edges.size(); ++e) {
            const double d = distanceToEdge(region, edges[e]);
            if (d < m_claimDistance) {
                pairs.push_back({d, overlapArea(region.box, edges[e].boundingBox(kEdgeBoxPadding)), r, TargetKind::Edge, e});
            }
        }
    }

    std::sort(pairs.begin(), pairs.end(), [](const ClaimCandidate &a, const ClaimCandidate &b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        if (a.overlap != b.overlap) {
            return a.overlap > b.overlap;
        }
        return std::tie(a.region, a.kind, a.index) < std::tie(b.region, b.kind, b.index);
    });

    std::vector<bool> claimed(regions.size(), false);
    for (const auto &pair : pairs) {
        if (claimed[pair.region]) {
            continue;
        }
        std::optional<TextLabel> &slot =
            pair.kind == TargetKind::Node ? nodes[pair.index].label : edges[pair.index].label;
        if (slot) {
            continue;
        }
        const auto &region = regions[pair.region];
        slot = TextLabel {region.text, region.confidence, pair.distance};
        claimed[pair.region] = true;
    }

    TextMapping mapping;
    mapping.unclaimed = static_cast<int>(std::count(claimed.begin(), claimed.end(), false));
    mapping.nodes = std::move(nodes);
    mapping.edges = std::move(edges);
    if (!regions.empty()) {
        Logger::info(QStringLiteral("TextMapper: %1 of %2 regions claimed")
                         .arg(static_cast<int>(regions.size()) - mapping.unclaimed)
                         .arg(static_cast<int>(regions.size())));
    }
    return mapping;
}

} // namespace graphscan
