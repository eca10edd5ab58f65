#include "CacheStore.h"

#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>

#include "Errors.h"

namespace graphscan {

namespace {

const QString kEntrySuffix = QStringLiteral(".json");

void require_valid_key(const QString &key)
{
    static const QRegularExpression pattern(QStringLiteral("^[A-Za-z0-9_-]+$"));
    if (!pattern.match(key).hasMatch()) {
        throw CacheUnavailable("invalid cache key '" + key.toStdString() + "'");
    }
}

} // namespace

FileCacheStore::FileCacheStore(const QString &directory) : m_dir(directory) {}

QString FileCacheStore::pathFor(const QString &key) const
{
    return m_dir.absoluteFilePath(key + kEntrySuffix);
}

void FileCacheStore::ensureDirectory()
{
    std::lock_guard<std::mutex> lock(m_dirMutex);
    if (m_dir.exists()) {
        return;
    }
    if (!QDir().mkpath(m_dir.absolutePath())) {
        throw CacheUnavailable("cannot create cache directory " + m_dir.absolutePath().toStdString());
    }
}

std::optional<QByteArray> FileCacheStore::read(const QString &key)
{
    require_valid_key(key);
    QFile file(pathFor(key));
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw CacheUnavailable("cannot read cache entry " + file.fileName().toStdString() + ": " +
                               file.errorString().toStdString());
    }
    return file.readAll();
}

void FileCacheStore::write(const QString &key, const QByteArray &blob)
{
    require_valid_key(key);
    ensureDirectory();

    QSaveFile file(pathFor(key));
    if (!file.open(QIODevice::WriteOnly)) {
        throw CacheUnavailable("cannot open cache entry " + file.fileName().toStdString() + ": " +
                               file.errorString().toStdString());
    }
    if (file.write(blob) != blob.size()) {
        file.cancelWriting();
        throw CacheUnavailable("short write to cache entry " + file.fileName().toStdString());
    }
    if (!file.commit()) {
        throw CacheUnavailable("cannot commit cache entry " + file.fileName().toStdString() + ": " +
                               file.errorString().toStdString());
    }
}

void FileCacheStore::remove(const QString &key)
{
    require_valid_key(key);
    QFile file(pathFor(key));
    if (file.exists() && !file.remove()) {
        throw CacheUnavailable("cannot remove cache entry " + file.fileName().toStdString() + ": " +
                               file.errorString().toStdString());
    }
}

QStringList FileCacheStore::listKeys()
{
    if (!m_dir.exists()) {
        return {};
    }
    const QFileInfoList entries = m_dir.entryInfoList(QStringList {QStringLiteral("*") + kEntrySuffix},
                                                      QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    QStringList keys;
    keys.reserve(entries.size());
    for (const auto &entry : entries) {
        keys << entry.completeBaseName();
    }
    return keys;
}

} // namespace graphscan
