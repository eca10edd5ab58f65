#pragma once

#include <vector>

#include "DetectionResult.h"

namespace graphscan {

// Validates referential integrity and packages the immutable result.
class GraphAssembler {
public:
    // Node ids are re-sequenced to 0..n-1 in input order and edges remapped;
    // edge ids follow edge order. Throws InconsistentGraph on duplicate node ids,
    // dangling edge endpoints or self loops.
    DetectionResultPtr assemble(std::vector<Node> nodes,
                                std::vector<Edge> edges,
                                const QualityReport &quality,
                                DetectionDiagnostics diagnostics) const;

    // Checks an already assembled graph without re-sequencing it: node ids and
    // edge ids unique, every endpoint present, no self loops.
    static void verify(const DetectionResult &result);
};

} // namespace graphscan
