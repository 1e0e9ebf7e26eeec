#include <gtest/gtest.h>
#include <variant>
#include <QFile>
#include <QFileInfo>
#include <QList>
#include <QTemporaryDir>

#include "http_test_server.h"

import emularr.core.downloadtypes;
import emularr.core.capabilityprober;
import emularr.core.taskregistry;
import emularr.core.transfercontroller;

using emularr::test::HttpTestServer;
using emularr::test::makePattern;
using emularr::test::readFile;
using emularr::test::waitUntil;

namespace {

RangeCapability capability(bool ranges, qint64 length)
{
    RangeCapability c;
    c.supportsRange = ranges;
    c.contentLength = length;
    return c;
}

class TransferControllerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        TaskSnapshot s;
        s.id = QStringLiteral("task-1");
        ASSERT_TRUE(m_registry.insert(s));
    }

    TransferController::Options options(const QUrl& url, int threads, StrategyHint hint = StrategyHint::Auto) const
    {
        TransferController::Options o;
        o.url = url;
        o.filePath = m_dir.filePath(QStringLiteral("game.zip"));
        o.threadCount = threads;
        o.hint = hint;
        return o;
    }

    TaskSnapshot snapshot() const { return *m_registry.find(QStringLiteral("task-1")); }

    QTemporaryDir m_dir;
    TaskRegistry m_registry;
};

} // namespace

TEST(SelectStrategy, ChunkedWhenRangesAndLengthKnown)
{
    EXPECT_EQ(TransferController::selectStrategy(capability(true, 800000000), 8, StrategyHint::Auto),
              TransferStrategy(Chunked{ 8 }));
}

TEST(SelectStrategy, ChunkCountNeverExceedsLength)
{
    EXPECT_EQ(TransferController::selectStrategy(capability(true, 3), 8, StrategyHint::Auto),
              TransferStrategy(Chunked{ 3 }));
}

TEST(SelectStrategy, SingleStreamFallbacks)
{
    EXPECT_TRUE(std::holds_alternative<SingleStream>(
        TransferController::selectStrategy(capability(false, 1000), 8, StrategyHint::Auto)));
    EXPECT_TRUE(std::holds_alternative<SingleStream>(
        TransferController::selectStrategy(capability(true, 0), 8, StrategyHint::Auto)));
    EXPECT_TRUE(std::holds_alternative<SingleStream>(
        TransferController::selectStrategy(capability(true, 1000), 1, StrategyHint::Auto)));
    EXPECT_TRUE(std::holds_alternative<SingleStream>(
        TransferController::selectStrategy(capability(true, 1000), 8, StrategyHint::SingleStream)));
}

TEST_F(TransferControllerTest, StartReservesFileAndRunsOnce)
{
    HttpTestServer server;
    server.setBody(makePattern(32 * 1024));
    ASSERT_TRUE(server.listen());

    TransferController controller(QStringLiteral("task-1"), options(server.url(), 4), m_registry);
    EXPECT_FALSE(controller.pause());
    EXPECT_TRUE(controller.start());
    EXPECT_TRUE(QFileInfo::exists(controller.filePath()));
    EXPECT_FALSE(controller.start());

    ASSERT_TRUE(waitUntil([&] { return isTerminal(controller.status()); }));
    EXPECT_EQ(controller.status(), DownloadStatus::Completed);
    EXPECT_EQ(controller.strategy(), TransferStrategy(Chunked{ 4 }));
    EXPECT_EQ(readFile(controller.filePath()), server.body());

    const TaskSnapshot s = snapshot();
    EXPECT_EQ(s.status, DownloadStatus::Completed);
    EXPECT_EQ(s.totalBytes, server.body().size());
    EXPECT_EQ(s.downloadedBytes, server.body().size());
    EXPECT_DOUBLE_EQ(s.progressFraction, 1.0);
    EXPECT_EQ(s.chunks.size(), 4);
    EXPECT_FALSE(s.errorDetail.has_value());
    EXPECT_FALSE(s.logLines.isEmpty());
}

TEST_F(TransferControllerTest, SingleStreamHintSendsNoRange)
{
    HttpTestServer server;
    server.setBody(makePattern(20000));
    ASSERT_TRUE(server.listen());

    TransferController controller(QStringLiteral("task-1"), options(server.url(), 8, StrategyHint::SingleStream), m_registry);
    QList<bool> finished;
    QObject::connect(&controller, &TransferController::finished, [&](bool ok) { finished << ok; });
    controller.start();

    ASSERT_TRUE(waitUntil([&] { return finished.size() == 1; }));
    EXPECT_TRUE(finished.first());
    EXPECT_TRUE(std::holds_alternative<SingleStream>(controller.strategy()));
    ASSERT_EQ(server.rangeHeaders().size(), 1);
    EXPECT_TRUE(server.rangeHeaders().first().isEmpty());
    EXPECT_EQ(readFile(controller.filePath()), server.body());
    EXPECT_TRUE(snapshot().chunks.isEmpty());
}

TEST_F(TransferControllerTest, HttpErrorBecomesErrorState)
{
    HttpTestServer server;
    server.setBody(makePattern(1000));
    server.options().getStatus = 404;
    ASSERT_TRUE(server.listen());

    TransferController controller(QStringLiteral("task-1"), options(server.url(), 1), m_registry);
    controller.start();

    ASSERT_TRUE(waitUntil([&] { return isTerminal(controller.status()); }));
    EXPECT_EQ(controller.status(), DownloadStatus::Error);
    const TaskSnapshot s = snapshot();
    ASSERT_TRUE(s.errorDetail.has_value());
    EXPECT_TRUE(s.errorDetail->contains(QStringLiteral("404")));
    EXPECT_FALSE(controller.pause());
    EXPECT_FALSE(controller.resume());
    EXPECT_FALSE(controller.cancel());
}

TEST_F(TransferControllerTest, CancelDeletesPartialFile)
{
    HttpTestServer server;
    server.setBody(makePattern(256 * 1024));
    server.options().bytesPerTick = 2048;
    ASSERT_TRUE(server.listen());

    TransferController controller(QStringLiteral("task-1"), options(server.url(), 2), m_registry);
    QList<bool> finished;
    QObject::connect(&controller, &TransferController::finished, [&](bool ok) { finished << ok; });
    controller.start();
    ASSERT_TRUE(waitUntil([&] { return controller.downloadedBytes() > 0; }));

    EXPECT_TRUE(controller.cancel());
    EXPECT_EQ(controller.status(), DownloadStatus::Cancelled);
    EXPECT_FALSE(QFileInfo::exists(controller.filePath()));
    ASSERT_EQ(finished.size(), 1);
    EXPECT_FALSE(finished.first());
    EXPECT_FALSE(controller.cancel());
    EXPECT_TRUE(waitUntil([&] { return server.openConnections() == 0; }));
}

TEST_F(TransferControllerTest, FailedHeadStillResumesWithRange)
{
    HttpTestServer server;
    server.setBody(makePattern(160 * 1024));
    server.options().headStatus = 405;
    server.options().bytesPerTick = 2048;
    ASSERT_TRUE(server.listen());

    TransferController controller(QStringLiteral("task-1"), options(server.url(), 4), m_registry);
    controller.start();
    ASSERT_TRUE(waitUntil([&] { return controller.downloadedBytes() >= 16 * 1024; }));
    EXPECT_TRUE(std::holds_alternative<SingleStream>(controller.strategy()));
    EXPECT_EQ(snapshot().totalBytes, server.body().size());

    ASSERT_TRUE(controller.pause());
    const qint64 pausedAt = QFileInfo(controller.filePath()).size();
    ASSERT_LT(pausedAt, server.body().size());
    EXPECT_EQ(controller.downloadedBytes(), pausedAt);

    ASSERT_TRUE(controller.resume());
    EXPECT_EQ(controller.status(), DownloadStatus::Downloading);
    ASSERT_TRUE(waitUntil([&] { return isTerminal(controller.status()); }));

    EXPECT_EQ(controller.status(), DownloadStatus::Completed);
    EXPECT_EQ(server.headCount(), 2);
    EXPECT_EQ(server.rangeHeaders().last(), QByteArray("bytes=") + QByteArray::number(pausedAt) + "-");
    EXPECT_EQ(readFile(controller.filePath()), server.body());
    EXPECT_FALSE(snapshot().errorDetail.has_value());
}
