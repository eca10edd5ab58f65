#pragma once

#include <QFuture>
#include <QString>
#include <QThreadPool>

#include <atomic>
#include <memory>

#include <opencv2/core.hpp>

#include "CacheStore.h"
#include "Config.h"
#include "ContentCache.h"
#include "DetectionResult.h"
#include "EdgeDetector.h"
#include "GraphAssembler.h"
#include "ImageEnhancer.h"
#include "ImageHasher.h"
#include "NodeDetector.h"
#include "OcrEngine.h"
#include "QualityAnalyzer.h"
#include "TextLocalizer.h"
#include "TextMapper.h"

namespace graphscan {

// Image in, typed graph out. Owns the stages, a CPU-sized worker pool, a
// separate OCR pool and, when enabled, the content cache keyed by the
// perceptual hash of the original image.
class GraphExtractor {
public:
    // A null store with caching enabled uses a FileCacheStore on config.cache.directory.
    explicit GraphExtractor(const PipelineConfig &config = PipelineConfig(),
                            std::shared_ptr<OcrEngine> ocrEngine = nullptr,
                            std::shared_ptr<CacheStore> store = nullptr);
    ~GraphExtractor();

    GraphExtractor(const GraphExtractor &) = delete;
    GraphExtractor &operator=(const GraphExtractor &) = delete;

    // Throws InvalidImage or InconsistentGraph; every other failure degrades
    // into diagnostics on the result.
    DetectionResultPtr extract(const cv::Mat &image);

    // Runs extract() on the worker pool.
    QFuture<DetectionResultPtr> extractAsync(const cv::Mat &image);

    // The full stage chain without the cache.
    DetectionResultPtr runPipeline(const cv::Mat &image, const QString &imageHash = QString());

    [[nodiscard]] int pipelineRuns() const { return m_pipelineRuns.load(); }
    // Threads serving extractAsync(); callers bound their in-flight work to this.
    [[nodiscard]] int workerCount() const { return m_workerPool.maxThreadCount(); }
    [[nodiscard]] const PipelineConfig &config() const { return m_cfg; }
    [[nodiscard]] ContentCache *cache() const { return m_cache.get(); }
    [[nodiscard]] QString hashOf(const cv::Mat &image) const;

    // Drains pending asynchronous work and closes the cache.
    void shutdown();

private:
    PipelineConfig m_cfg;
    QThreadPool m_workerPool;
    QThreadPool m_ocrPool;

    QualityAnalyzer m_quality;
    ImageEnhancer m_enhancer;
    NodeDetector m_nodes;
    EdgeDetector m_edges;
    TextLocalizer m_text;
    TextMapper m_mapper;
    GraphAssembler m_assembler;
    ImageHasher m_hasher;
    std::unique_ptr<ContentCache> m_cache;

    std::atomic_int m_pipelineRuns {0};
};

} // namespace graphscan
