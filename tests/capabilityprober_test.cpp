#include <gtest/gtest.h>
#include <optional>
#include <QHostAddress>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTcpServer>
#include <QUrl>

#include "http_test_server.h"

import emularr.core.capabilityprober;

using emularr::test::HttpTestServer;
using emularr::test::makePattern;
using emularr::test::waitUntil;

namespace {

std::optional<RangeCapability> probeOnce(const QUrl& url)
{
    QNetworkAccessManager manager;
    CapabilityProber prober(&manager);
    std::optional<RangeCapability> result;
    QObject::connect(&prober, &CapabilityProber::probed, [&](const RangeCapability& capability) {
        result = capability;
    });
    prober.probe(url);
    waitUntil([&] { return result.has_value(); });
    return result;
}

} // namespace

TEST(RangeCapability, RequiresBytesUnitAndLength)
{
    const RangeCapability ok = RangeCapability::fromHeaders("bytes", 1024);
    EXPECT_TRUE(ok.supportsRange);
    EXPECT_EQ(ok.contentLength, 1024);

    EXPECT_TRUE(RangeCapability::fromHeaders("none, Bytes", 10).supportsRange);
    EXPECT_FALSE(RangeCapability::fromHeaders("none", 1024).supportsRange);
    EXPECT_FALSE(RangeCapability::fromHeaders("", 1024).supportsRange);

    const RangeCapability noLength = RangeCapability::fromHeaders("bytes", -1);
    EXPECT_FALSE(noLength.supportsRange);
    EXPECT_EQ(noLength.contentLength, 0);
}

TEST(CapabilityProber, ReportsRangeSupport)
{
    HttpTestServer server;
    server.setBody(makePattern(4096));
    ASSERT_TRUE(server.listen());

    const auto capability = probeOnce(server.url());
    ASSERT_TRUE(capability.has_value());
    EXPECT_TRUE(capability->supportsRange);
    EXPECT_EQ(capability->contentLength, 4096);
    EXPECT_EQ(server.headCount(), 1);
    EXPECT_EQ(server.getCount(), 0);
}

TEST(CapabilityProber, LengthWithoutAcceptRanges)
{
    HttpTestServer server;
    server.setBody(makePattern(2048));
    server.options().acceptRanges = false;
    ASSERT_TRUE(server.listen());

    const auto capability = probeOnce(server.url());
    ASSERT_TRUE(capability.has_value());
    EXPECT_FALSE(capability->supportsRange);
    EXPECT_EQ(capability->contentLength, 2048);
    EXPECT_FALSE(capability->probeFailed);
}

TEST(CapabilityProber, MissingLengthMeansNoRanges)
{
    HttpTestServer server;
    server.setBody(makePattern(2048));
    server.options().sendContentLength = false;
    ASSERT_TRUE(server.listen());

    const auto capability = probeOnce(server.url());
    ASSERT_TRUE(capability.has_value());
    EXPECT_FALSE(capability->supportsRange);
    EXPECT_EQ(capability->contentLength, 0);
}

TEST(CapabilityProber, UnreachableHostYieldsEmptyCapability)
{
    // Grab a free port, then close it so nothing listens there.
    quint16 port = 0;
    {
        QTcpServer reserved;
        ASSERT_TRUE(reserved.listen(QHostAddress::LocalHost, 0));
        port = reserved.serverPort();
    }
    QUrl url(QStringLiteral("http://127.0.0.1/game.zip"));
    url.setPort(port);

    const auto capability = probeOnce(url);
    ASSERT_TRUE(capability.has_value());
    EXPECT_FALSE(capability->supportsRange);
    EXPECT_EQ(capability->contentLength, 0);
    EXPECT_TRUE(capability->probeFailed);
}

TEST(CapabilityProber, RejectedHeadIsReportedAsFailure)
{
    HttpTestServer server;
    server.setBody(makePattern(2048));
    server.options().headStatus = 405;
    ASSERT_TRUE(server.listen());

    const auto capability = probeOnce(server.url());
    ASSERT_TRUE(capability.has_value());
    EXPECT_TRUE(capability->probeFailed);
    EXPECT_FALSE(capability->supportsRange);
    EXPECT_EQ(capability->contentLength, 0);
}

TEST(CapabilityProber, AbortSuppressesSignal)
{
    HttpTestServer server;
    server.setBody(makePattern(128));
    ASSERT_TRUE(server.listen());

    QNetworkAccessManager manager;
    CapabilityProber prober(&manager);
    int calls = 0;
    QObject::connect(&prober, &CapabilityProber::probed, [&](const RangeCapability&) { ++calls; });
    prober.probe(server.url());
    EXPECT_TRUE(prober.isRunning());
    prober.abort();
    EXPECT_FALSE(prober.isRunning());
    emularr::test::spinFor(200);
    EXPECT_EQ(calls, 0);
}
