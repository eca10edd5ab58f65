#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "CacheStore.h"
#include "Errors.h"

using namespace graphscan;

class FileCacheStoreTest : public ::testing::Test {
protected:
    QTemporaryDir tmp;
};

TEST_F(FileCacheStoreTest, WriteThenReadReturnsBlob)
{
    ASSERT_TRUE(tmp.isValid());
    FileCacheStore store(tmp.filePath(QStringLiteral("entries")));
    store.write(QStringLiteral("abc_123"), QByteArrayLiteral("{\"x\":1}"));

    const auto blob = store.read(QStringLiteral("abc_123"));
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(*blob, QByteArrayLiteral("{\"x\":1}"));
    EXPECT_TRUE(QFile::exists(store.pathFor(QStringLiteral("abc_123"))));
}

TEST_F(FileCacheStoreTest, MissingKeyReadsAsNothing)
{
    FileCacheStore store(tmp.path());
    EXPECT_FALSE(store.read(QStringLiteral("never-written")).has_value());
}

TEST_F(FileCacheStoreTest, OverwriteReplacesEntry)
{
    FileCacheStore store(tmp.path());
    store.write(QStringLiteral("k"), QByteArrayLiteral("first"));
    store.write(QStringLiteral("k"), QByteArrayLiteral("second"));
    EXPECT_EQ(store.read(QStringLiteral("k")).value(), QByteArrayLiteral("second"));
    EXPECT_EQ(store.listKeys(), QStringList {QStringLiteral("k")});
}

TEST_F(FileCacheStoreTest, RemoveAndListKeys)
{
    FileCacheStore store(tmp.path());
    store.write(QStringLiteral("b"), QByteArrayLiteral("2"));
    store.write(QStringLiteral("a"), QByteArrayLiteral("1"));
    EXPECT_EQ(store.listKeys(), (QStringList {QStringLiteral("a"), QStringLiteral("b")}));

    store.remove(QStringLiteral("a"));
    store.remove(QStringLiteral("not-there"));
    EXPECT_EQ(store.listKeys(), QStringList {QStringLiteral("b")});
}

TEST_F(FileCacheStoreTest, MissingDirectoryListsNothing)
{
    FileCacheStore store(tmp.filePath(QStringLiteral("does/not/exist")));
    EXPECT_TRUE(store.listKeys().isEmpty());
}

TEST_F(FileCacheStoreTest, PathLikeKeysAreRejected)
{
    FileCacheStore store(tmp.path());
    EXPECT_THROW(store.write(QStringLiteral("../escape"), QByteArrayLiteral("x")), CacheUnavailable);
    EXPECT_THROW(store.read(QString()), CacheUnavailable);
}

TEST_F(FileCacheStoreTest, UnwritableLocationThrows)
{
    const QString blocker = tmp.filePath(QStringLiteral("blocker"));
    QFile file(blocker);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.close();

    FileCacheStore store(blocker + QStringLiteral("/sub"));
    EXPECT_THROW(store.write(QStringLiteral("k"), QByteArrayLiteral("x")), CacheUnavailable);
}
