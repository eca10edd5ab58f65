#pragma once

#include <QFuture>
#include <QHash>
#include <QString>

#include <atomic>
#include <exception>
#include <functional>
#include <list>
#include <memory>
#include <mutex>

#include "CacheStore.h"
#include "Config.h"
#include "DetectionResult.h"

namespace graphscan {

// Memoises pipeline results by perceptual image key. A bounded in-memory LRU
// sits in front of a durable CacheStore. Store failures are logged and the
// cache degrades to memory only; they never fail a request.
class ContentCache {
public:
    using Computation = std::function<DetectionResultPtr()>;

    struct Stats {
        int memoryHits {0};
        int storeHits {0};
        int misses {0};
        int computations {0};
        int joinedWaiters {0};
    };

    ContentCache(std::shared_ptr<CacheStore> store, const CacheConfig &config = CacheConfig());
    ~ContentCache();

    ContentCache(const ContentCache &) = delete;
    ContentCache &operator=(const ContentCache &) = delete;

    // nullptr on a miss or an expired entry.
    DetectionResultPtr get(const QString &key);
    void set(const QString &key, const DetectionResultPtr &result);
    void invalidate(const QString &key);
    void invalidateAll();

    // At most one computation per key runs at a time. The first caller computes
    // on its own thread; concurrent callers for the same key wait for and share
    // that outcome, including its exception. Cached results come back as copies
    // flagged cacheHit.
    DetectionResultPtr fetchOrCompute(const QString &key, const Computation &computation);

    // Waits for in-flight computations. Later fetches compute without caching.
    void close();

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] int memoryEntryCount() const;
    [[nodiscard]] const CacheConfig &config() const { return m_cfg; }

private:
    struct MemoryEntry {
        DetectionResultPtr result;
        qint64 createdAtMs {0};
        std::list<QString>::iterator lruPosition;
    };

    struct ComputeOutcome {
        DetectionResultPtr result;
        std::exception_ptr error;
    };

    DetectionResultPtr lookupMemory(const QString &key);
    DetectionResultPtr lookupStore(const QString &key);
    void insertMemory(const QString &key, const DetectionResultPtr &result, qint64 createdAtMs);
    void dropFromStore(const QString &key);
    bool isExpired(qint64 createdAtMs) const;

    static DetectionResultPtr markHit(const DetectionResultPtr &result);

    std::shared_ptr<CacheStore> m_store;
    CacheConfig m_cfg;

    mutable std::mutex m_memoryMutex;
    QHash<QString, MemoryEntry> m_memory;
    std::list<QString> m_lru;

    std::mutex m_inflightMutex;
    QHash<QString, QFuture<ComputeOutcome>> m_inflight;
    bool m_closed {false};

    std::atomic_int m_memoryHits {0};
    std::atomic_int m_storeHits {0};
    std::atomic_int m_misses {0};
    std::atomic_int m_computations {0};
    std::atomic_int m_joinedWaiters {0};
};

} // namespace graphscan
