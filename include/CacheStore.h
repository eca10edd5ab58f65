#pragma once

#include <QByteArray>
#include <QDir>
#include <QString>
#include <QStringList>

#include <mutex>
#include <optional>

namespace graphscan {

// Durable key -> blob store backing the content cache. Implementations throw
// CacheUnavailable when the medium cannot be read or written.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<QByteArray> read(const QString &key) = 0;
    // Replaces the entry atomically; readers never observe a partial blob.
    virtual void write(const QString &key, const QByteArray &blob) = 0;
    virtual void remove(const QString &key) = 0;
    virtual QStringList listKeys() = 0;
};

// One "<key>.json" file per entry under a directory, written through QSaveFile.
class FileCacheStore : public CacheStore {
public:
    explicit FileCacheStore(const QString &directory);

    std::optional<QByteArray> read(const QString &key) override;
    void write(const QString &key, const QByteArray &blob) override;
    void remove(const QString &key) override;
    QStringList listKeys() override;

    [[nodiscard]] QString directory() const { return m_dir.absolutePath(); }
    [[nodiscard]] QString pathFor(const QString &key) const;

private:
    void ensureDirectory();

    QDir m_dir;
    std::mutex m_dirMutex;
};

} // namespace graphscan
