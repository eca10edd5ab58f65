#include "GraphAssembler.h"

#include <unordered_map>
#include <unordered_set>

#include "Errors.h"

namespace graphscan {

DetectionResultPtr GraphAssembler::assemble(std::vector<Node> nodes,
                                            std::vector<Edge> edges,
                                            const QualityReport &quality,
                                            DetectionDiagnostics diagnostics) const
{
    std::unordered_map<int, int> remap;
    remap.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        const bool inserted = remap.emplace(nodes[i].id, static_cast<int>(i)).second;
        if (!inserted) {
            throw InconsistentGraph("duplicate node id " + std::to_string(nodes[i].id));
        }
    }

    for (auto &edge : edges) {
        const auto source = remap.find(edge.source);
        const auto target = remap.find(edge.target);
        if (source == remap.end() || target == remap.end()) {
            throw InconsistentGraph("edge " + std::to_string(edge.id) + " references missing node " +
                                    std::to_string(source == remap.end() ? edge.source : edge.target));
        }
        if (source->second == target->second) {
            throw InconsistentGraph("edge " + std::to_string(edge.id) + " is a self loop on node " +
                                    std::to_string(edge.source));
        }
        edge.source = source->second;
        edge.target = target->second;
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        nodes[i].id = static_cast<int>(i);
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        edges[i].id = static_cast<int>(i);
    }

    auto result = std::make_shared<DetectionResult>();
    result->nodes = std::move(nodes);
    result->edges = std::move(edges);
    result->quality = quality;
    result->diagnostics = std::move(diagnostics);
    return result;
}

void GraphAssembler::verify(const DetectionResult &result)
{
    std::unordered_set<int> nodeIds;
    nodeIds.reserve(result.nodes.size());
    for (const auto &node : result.nodes) {
        if (!nodeIds.insert(node.id).second) {
            throw InconsistentGraph("duplicate node id " + std::to_string(node.id));
        }
    }

    std::unordered_set<int> edgeIds;
    edgeIds.reserve(result.edges.size());
    for (const auto &edge : result.edges) {
        if (!edgeIds.insert(edge.id).second) {
            throw InconsistentGraph("duplicate edge id " + std::to_string(edge.id));
        }
        const bool hasSource = nodeIds.count(edge.source) > 0;
        if (!hasSource || nodeIds.count(edge.target) == 0) {
            throw InconsistentGraph("edge " + std::to_string(edge.id) + " references missing node " +
                                    std::to_string(hasSource ? edge.target : edge.source));
        }
        if (edge.source == edge.target) {
            throw InconsistentGraph("edge " + std::to_string(edge.id) + " is a self loop on node " +
                                    std::to_string(edge.source));
        }
    }
}

} // namespace graphscan
