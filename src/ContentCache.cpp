#include "ContentCache.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPromise>

#include "Errors.h"
#include "GraphAssembler.h"
#include "Logger.h"
#include "ResultSerializer.h"

namespace graphscan {

namespace {

constexpr int kEntryFormat = 1;

QByteArray encode_entry(const QString &key, const DetectionResult &result, qint64 createdAtMs)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("format"), kEntryFormat);
    obj.insert(QStringLiteral("key"), key);
    obj.insert(QStringLiteral("created_at_ms"), createdAtMs);
    obj.insert(QStringLiteral("result"), ResultSerializer::toJson(result));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

bool decode_entry(const QByteArray &blob, DetectionResult &result, qint64 &createdAtMs, QString *errorMessage)
{
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(blob, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("unparseable entry: %1").arg(parseError.errorString());
        }
        return false;
    }
    const QJsonObject obj = doc.object();
    if (obj.value(QStringLiteral("format")).toInt() != kEntryFormat) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("unsupported entry format");
        }
        return false;
    }
    createdAtMs = obj.value(QStringLiteral("created_at_ms")).toInteger();
    if (!ResultSerializer::fromJson(obj.value(QStringLiteral("result")).toObject(), result, errorMessage)) {
        return false;
    }
    try {
        GraphAssembler::verify(result);
    } catch (const InconsistentGraph &ex) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("inconsistent graph: %1").arg(QString::fromUtf8(ex.what()));
        }
        return false;
    }
    return true;
}

} // namespace

ContentCache::ContentCache(std::shared_ptr<CacheStore> store, const CacheConfig &config)
    : m_store(std::move(store))
    , m_cfg(sanitizeConfig(config))
{
}

ContentCache::~ContentCache()
{
    close();
}

bool ContentCache::isExpired(qint64 createdAtMs) const
{
    if (m_cfg.ttlSeconds <= 0) {
        return false;
    }
    return QDateTime::currentMSecsSinceEpoch() - createdAtMs > m_cfg.ttlSeconds * 1000;
}

DetectionResultPtr ContentCache::markHit(const DetectionResultPtr &result)
{
    auto copy = std::make_shared<DetectionResult>(*result);
    copy->diagnostics.cacheHit = true;
    return copy;
}

DetectionResultPtr ContentCache::lookupMemory(const QString &key)
{
    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(m_memoryMutex);
        auto it = m_memory.find(key);
        if (it == m_memory.end()) {
            return nullptr;
        }
        if (!isExpired(it->createdAtMs)) {
            m_lru.splice(m_lru.begin(), m_lru, it->lruPosition);
            return it->result;
        }
        m_lru.erase(it->lruPosition);
        m_memory.erase(it);
        expired = true;
    }
    if (expired) {
        dropFromStore(key);
    }
    return nullptr;
}

DetectionResultPtr ContentCache::lookupStore(const QString &key)
{
    if (!m_store) {
        return nullptr;
    }

    std::optional<QByteArray> blob;
    try {
        blob = m_store->read(key);
    } catch (const CacheUnavailable &ex) {
        Logger::warning(QStringLiteral("Cache store read failed for %1: %2").arg(key, QString::fromUtf8(ex.what())));
        return nullptr;
    }
    if (!blob) {
        return nullptr;
    }

    auto result = std::make_shared<DetectionResult>();
    qint64 createdAtMs = 0;
    QString error;
    if (!decode_entry(*blob, *result, createdAtMs, &error)) {
        Logger::warning(QStringLiteral("Discarding corrupt cache entry %1: %2").arg(key, error));
        dropFromStore(key);
        return nullptr;
    }
    if (isExpired(createdAtMs)) {
        dropFromStore(key);
        return nullptr;
    }

    DetectionResultPtr shared = std::move(result);
    insertMemory(key, shared, createdAtMs);
    return shared;
}

void ContentCache::insertMemory(const QString &key, const DetectionResultPtr &result, qint64 createdAtMs)
{
    std::lock_guard<std::mutex> lock(m_memoryMutex);
    auto it = m_memory.find(key);
    if (it != m_memory.end()) {
        m_lru.erase(it->lruPosition);
        m_memory.erase(it);
    }
    m_lru.push_front(key);
    m_memory.insert(key, MemoryEntry {result, createdAtMs, m_lru.begin()});

    // Evicted entries stay in the durable store.
    while (static_cast<int>(m_memory.size()) > m_cfg.maxMemoryEntries && !m_lru.empty()) {
        m_memory.remove(m_lru.back());
        m_lru.pop_back();
    }
}

void ContentCache::dropFromStore(const QString &key)
{
    if (!m_store) {
        return;
    }
    try {
        m_store->remove(key);
    } catch (const CacheUnavailable &ex) {
        Logger::warning(QStringLiteral("Cache store remove failed for %1: %2").arg(key, QString::fromUtf8(ex.what())));
    }
}

DetectionResultPtr ContentCache::get(const QString &key)
{
    if (auto hit = lookupMemory(key)) {
        ++m_memoryHits;
        return hit;
    }
    if (auto hit = lookupStore(key)) {
        ++m_storeHits;
        return hit;
    }
    ++m_misses;
    return nullptr;
}

void ContentCache::set(const QString &key, const DetectionResultPtr &result)
{
    if (!result) {
        return;
    }
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    insertMemory(key, result, now);
    if (!m_store) {
        return;
    }
    try {
        m_store->write(key, encode_entry(key, *result, now));
    } catch (const CacheUnavailable &ex) {
        Logger::warning(QStringLiteral("Cache store write failed for %1, keeping entry in memory only: %2")
                            .arg(key, QString::fromUtf8(ex.what())));
    }
}

void ContentCache::invalidate(const QString &key)
{
    {
        std::lock_guard<std::mutex> lock(m_memoryMutex);
        auto it = m_memory.find(key);
        if (it != m_memory.end()) {
            m_lru.erase(it->lruPosition);
            m_memory.erase(it);
        }
    }
    dropFromStore(key);
}

void ContentCache::invalidateAll()
{
    {
        std::lock_guard<std::mutex> lock(m_memoryMutex);
        m_memory.clear();
        m_lru.clear();
    }
    if (!m_store) {
        return;
    }
    QStringList keys;
    try {
        keys = m_store->listKeys();
    } catch (const CacheUnavailable &ex) {
        Logger::warning(QStringLiteral("Cache store listing failed: %1").arg(QString::fromUtf8(ex.what())));
        return;
    }
    for (const auto &key : keys) {
        dropFromStore(key);
    }
    Logger::info(QStringLiteral("Cache cleared (%1 stored entries)").arg(keys.size()));
}

DetectionResultPtr ContentCache::fetchOrCompute(const QString &key, const Computation &computation)
{
    if (auto hit = get(key)) {
        return markHit(hit);
    }

    QPromise<ComputeOutcome> promise;
    QFuture<ComputeOutcome> pending;
    bool owner = false;
    bool bypass = false;
    {
        std::lock_guard<std::mutex> lock(m_inflightMutex);
        if (m_closed) {
            bypass = true;
        } else if (m_inflight.contains(key)) {
            pending = m_inflight.value(key);
        } else {
            // A computation may have completed between the lookup above and taking the lock,
            // and its entry may already have been evicted from memory.
            if (auto hit = lookupMemory(key)) {
                ++m_memoryHits;
                return markHit(hit);
            }
            if (auto hit = lookupStore(key)) {
                ++m_storeHits;
                return markHit(hit);
            }
            pending = promise.future();
            promise.start();
            m_inflight.insert(key, pending);
            owner = true;
        }
    }

    if (bypass) {
        Logger::debug(QStringLiteral("Cache closed; computing %1 without caching").arg(key));
        return computation();
    }

    if (!owner) {
        ++m_joinedWaiters;
        const ComputeOutcome outcome = pending.result();
        if (outcome.error) {
            std::rethrow_exception(outcome.error);
        }
        return outcome.result;
    }

    ++m_computations;
    ComputeOutcome outcome;
    try {
        outcome.result = computation();
        if (outcome.result) {
            set(key, outcome.result);
        }
    } catch (...) {
        outcome.error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(m_inflightMutex);
        m_inflight.remove(key);
    }
    promise.addResult(outcome);
    promise.finish();

    if (outcome.error) {
        std::rethrow_exception(outcome.error);
    }
    return outcome.result;
}

void ContentCache::close()
{
    QList<QFuture<ComputeOutcome>> pending;
    {
        std::lock_guard<std::mutex> lock(m_inflightMutex);
        m_closed = true;
        pending = m_inflight.values();
    }
    for (auto &future : pending) {
        future.waitForFinished();
    }
}

ContentCache::Stats ContentCache::stats() const
{
    Stats s;
    s.memoryHits = m_memoryHits.load();
    s.storeHits = m_storeHits.load();
    s.misses = m_misses.load();
    s.computations = m_computations.load();
    s.joinedWaiters = m_joinedWaiters.load();
    return s;
}

int ContentCache::memoryEntryCount() const
{
    std::lock_guard<std::mutex> lock(m_memoryMutex);
    return static_cast<int>(m_memory.size());
}

} // namespace graphscan
