#include "GraphExtractor.h"

#include <QElapsedTimer>
#include <QThread>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "ImageUtils.h"
#include "Logger.h"

namespace graphscan {

namespace {

class StageClock {
public:
    explicit StageClock(std::vector<StageTiming> &timings) : m_timings(timings) {}

    void start() { m_timer.start(); }

    void stop(const char *stage)
    {
        m_timings.push_back({stage, std::chrono::milliseconds(m_timer.elapsed())});
    }

private:
    std::vector<StageTiming> &m_timings;
    QElapsedTimer m_timer;
};

template <typename T, typename Fn>
T guarded_stage(const char *stage, const cv::Mat &image, std::vector<std::string> &notes, T fallback, Fn &&fn)
{
    try {
        return fn();
    } catch (const cv::Exception &ex) {
        Logger::warning(QStringLiteral("%1 failed: %2 | type=%3 | size=%4x%5")
                            .arg(QString::fromUtf8(stage))
                            .arg(QString::fromUtf8(ex.what()))
                            .arg(matTypeToString(image.type()))
                            .arg(image.cols)
                            .arg(image.rows));
        notes.push_back(std::string(stage) + " failed: " + ex.err);
        return fallback;
    }
}

} // namespace

GraphExtractor::GraphExtractor(const PipelineConfig &config,
                               std::shared_ptr<OcrEngine> ocrEngine,
                               std::shared_ptr<CacheStore> store)
    : m_cfg(sanitizeConfig(config))
    , m_quality(m_cfg.quality)
    , m_enhancer(m_cfg.enhancement)
    , m_nodes(m_cfg.nodes)
    , m_edges(m_cfg.edges)
    , m_text(std::move(ocrEngine), &m_ocrPool, m_cfg.text)
    , m_mapper(m_cfg.text)
    , m_hasher(m_cfg.cache.hashSize)
{
    const int workers = m_cfg.concurrency.workerThreads > 0 ? m_cfg.concurrency.workerThreads
                                                            : std::max(1, QThread::idealThreadCount());
    m_workerPool.setMaxThreadCount(workers);
    m_ocrPool.setMaxThreadCount(m_cfg.concurrency.ocrThreads);

    if (m_cfg.cache.enabled) {
        if (!store) {
            store = std::make_shared<FileCacheStore>(m_cfg.cache.directory);
        }
        m_cache = std::make_unique<ContentCache>(std::move(store), m_cfg.cache);
    }

    Logger::debug(QStringLiteral("GraphExtractor ready: workers=%1 ocr_threads=%2 cache=%3 ocr=%4")
                      .arg(workers)
                      .arg(m_cfg.concurrency.ocrThreads)
                      .arg(m_cache ? m_cfg.cache.directory : QStringLiteral("off"))
                      .arg(m_cfg.text.enabled ? m_cfg.text.languages.join(QLatin1Char('+')) : QStringLiteral("off")));
}

GraphExtractor::~GraphExtractor()
{
    shutdown();
}

void GraphExtractor::shutdown()
{
    m_workerPool.waitForDone();
    if (m_cache) {
        m_cache->close();
    }
    m_ocrPool.waitForDone();
}

QString GraphExtractor::hashOf(const cv::Mat &image) const
{
    return m_hasher.compute(image);
}

DetectionResultPtr GraphExtractor::extract(const cv::Mat &image)
{
    validateImage(image, "GraphExtractor");
    const QString key = m_hasher.compute(image);
    if (!m_cache) {
        return runPipeline(image, key);
    }
    return m_cache->fetchOrCompute(key, [this, image, key]() { return runPipeline(image, key); });
}

QFuture<DetectionResultPtr> GraphExtractor::extractAsync(const cv::Mat &image)
{
    return QtConcurrent::run(&m_workerPool, [this, image]() { return extract(image); });
}

DetectionResultPtr GraphExtractor::runPipeline(const cv::Mat &image, const QString &imageHash)
{
    ++m_pipelineRuns;
    QElapsedTimer total;
    total.start();

    DetectionDiagnostics diagnostics;
    diagnostics.resolution = image.size();
    StageClock clock(diagnostics.timings);

    clock.start();
    const QualityReport quality = m_quality.analyze(image);
    clock.stop("quality");

    diagnostics.imageHash = (imageHash.isEmpty() ? m_hasher.compute(image) : imageHash).toStdString();

    clock.start();
    const cv::Mat enhanced = guarded_stage("enhancement", image, diagnostics.notes, image,
                                           [&]() { return m_enhancer.enhance(image, quality); });
    clock.stop("enhancement");

    clock.start();
    std::vector<Node> nodes = guarded_stage("node_detection", enhanced, diagnostics.notes, std::vector<Node>(),
                                            [&]() { return m_nodes.detect(enhanced); });
    clock.stop("node_detection");

    clock.start();
    std::vector<Edge> edges = guarded_stage("edge_detection", enhanced, diagnostics.notes, std::vector<Edge>(),
                                            [&]() { return m_edges.detect(enhanced, nodes); });
    clock.stop("edge_detection");

    clock.start();
    const TextLocalization text = m_text.localize(enhanced, nodes, edges);
    clock.stop("text_localization");
    diagnostics.labelsUnavailable = !text.available;
    diagnostics.textRegionCount = static_cast<int>(text.regions.size());
    if (!text.note.isEmpty()) {
        diagnostics.notes.push_back(text.note.toStdString());
    }

    clock.start();
    TextMapping mapping = m_mapper.map(text.regions, std::move(nodes), std::move(edges));
    clock.stop("text_mapping");
    diagnostics.unclaimedTextRegions = mapping.unclaimed;

    // Diagnostics are frozen into the result, so assembly itself is not timed.
    diagnostics.elapsed = std::chrono::milliseconds(total.elapsed());
    auto result = m_assembler.assemble(std::move(mapping.nodes), std::move(mapping.edges), quality,
                                       std::move(diagnostics));

    Logger::info(QStringLiteral("Extracted %1 nodes, %2 edges, %3 labels in %4 ms | quality=%5 | %6x%7")
                     .arg(static_cast<int>(result->nodes.size()))
                     .arg(static_cast<int>(result->edges.size()))
                     .arg(result->labelCount())
                     .arg(total.elapsed())
                     .arg(QString::fromStdString(toString(quality.level)))
                     .arg(image.cols)
                     .arg(image.rows));
    return result;
}

} // namespace graphscan
