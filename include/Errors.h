#pragma once

#include <stdexcept>
#include <string>

namespace graphscan {

class GraphScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed input; aborts the pipeline before any stage runs.
class InvalidImage : public GraphScanError {
public:
    using GraphScanError::GraphScanError;
};

// OCR engine unreachable or timed out. Recovered by the text localizer.
class EngineUnavailable : public GraphScanError {
public:
    using GraphScanError::GraphScanError;
};

// Assembly found an edge or id that violates referential integrity.
class InconsistentGraph : public GraphScanError {
public:
    using GraphScanError::GraphScanError;
};

// Durable cache store could not be read or written. Recovered by ContentCache.
class CacheUnavailable : public GraphScanError {
public:
    using GraphScanError::GraphScanError;
};

} // namespace graphscan
