#include <gtest/gtest.h>
#include <QString>

import emularr.core.downloadtypes;
import emularr.core.taskregistry;

namespace {

TaskSnapshot row(const QString& id)
{
    TaskSnapshot s;
    s.id = id;
    s.displayName = id.toUpper();
    return s;
}

} // namespace

TEST(TaskRegistry, InsertRejectsEmptyAndDuplicateIds)
{
    TaskRegistry registry;
    EXPECT_TRUE(registry.insert(row(QStringLiteral("a"))));
    EXPECT_FALSE(registry.insert(row(QStringLiteral("a"))));
    EXPECT_FALSE(registry.insert(row(QString())));
    EXPECT_EQ(registry.size(), 1);
}

TEST(TaskRegistry, KeepsCreationOrder)
{
    TaskRegistry registry;
    registry.insert(row(QStringLiteral("c")));
    registry.insert(row(QStringLiteral("a")));
    registry.insert(row(QStringLiteral("b")));

    EXPECT_EQ(registry.ids(), QStringList({ QStringLiteral("c"), QStringLiteral("a"), QStringLiteral("b") }));
    const QList<TaskSnapshot> rows = registry.all();
    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[1].displayName, QStringLiteral("A"));
}

TEST(TaskRegistry, FindReturnsCopy)
{
    TaskRegistry registry;
    registry.insert(row(QStringLiteral("a")));

    auto snapshot = registry.find(QStringLiteral("a"));
    ASSERT_TRUE(snapshot.has_value());
    snapshot->downloadedBytes = 999;
    snapshot->status = DownloadStatus::Error;

    const auto fresh = registry.find(QStringLiteral("a"));
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->downloadedBytes, 0);
    EXPECT_EQ(fresh->status, DownloadStatus::Downloading);
    EXPECT_FALSE(registry.find(QStringLiteral("missing")).has_value());
}

TEST(TaskRegistry, UpdateAppliesMutator)
{
    TaskRegistry registry;
    registry.insert(row(QStringLiteral("a")));

    EXPECT_TRUE(registry.update(QStringLiteral("a"), [](TaskSnapshot& s) {
        s.status = DownloadStatus::Paused;
        s.downloadedBytes = 42;
    }));
    EXPECT_FALSE(registry.update(QStringLiteral("b"), [](TaskSnapshot& s) { s.downloadedBytes = 1; }));

    const auto snapshot = registry.find(QStringLiteral("a"));
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->status, DownloadStatus::Paused);
    EXPECT_EQ(snapshot->downloadedBytes, 42);
}

TEST(TaskRegistry, AppendLogIsBounded)
{
    TaskRegistry registry;
    registry.insert(row(QStringLiteral("a")));
    for (int i = 0; i < kTaskLogLimit + 10; ++i) {
        EXPECT_TRUE(registry.appendLog(QStringLiteral("a"), QStringLiteral("event %1").arg(i)));
    }
    EXPECT_FALSE(registry.appendLog(QStringLiteral("b"), QStringLiteral("lost")));

    const auto snapshot = registry.find(QStringLiteral("a"));
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->logLines.size(), kTaskLogLimit);
    EXPECT_TRUE(snapshot->logLines.first().endsWith(QStringLiteral("event 10")));
}

TEST(TaskRegistry, Remove)
{
    TaskRegistry registry;
    registry.insert(row(QStringLiteral("a")));
    registry.insert(row(QStringLiteral("b")));

    EXPECT_TRUE(registry.remove(QStringLiteral("a")));
    EXPECT_FALSE(registry.remove(QStringLiteral("a")));
    EXPECT_FALSE(registry.contains(QStringLiteral("a")));
    EXPECT_TRUE(registry.contains(QStringLiteral("b")));
    EXPECT_EQ(registry.size(), 1);
}
