#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QHttp1Configuration>
#include <QNetworkRequest>
#include <QTemporaryDir>
#include <QUrl>

import emularr.utils.download_utils;
import emularr.utils.archive_utils;
import emularr.utils.network_utils;

namespace utils = emularr::utils;

namespace {

void touch(const QString& path)
{
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("x");
}

} // namespace

TEST(DownloadUtils, FileNameFromUrlDecodesPath)
{
    EXPECT_EQ(utils::fileNameFromUrl(QUrl("https://example.org/roms/Super%20Game%20(USA).zip")),
              QStringLiteral("Super Game (USA).zip"));
}

TEST(DownloadUtils, FileNameFromUrlPrefersDisposition)
{
    const QUrl url("https://cdn.example.org/get?id=42&response-content-disposition=attachment%3B%20filename%3D%22Zelda.7z%22");
    EXPECT_EQ(utils::fileNameFromUrl(url), QStringLiteral("Zelda.7z"));
}

TEST(DownloadUtils, FileNameFromUrlUsesFilenameQuery)
{
    EXPECT_EQ(utils::fileNameFromUrl(QUrl("https://example.org/dl.php?filename=Metroid+Prime.rar")),
              QStringLiteral("Metroid Prime.rar"));
}

TEST(DownloadUtils, FileNameFromUrlEmptyForBarePath)
{
    EXPECT_TRUE(utils::fileNameFromUrl(QUrl("https://example.org/")).isEmpty());
}

TEST(DownloadUtils, SanitizeFileNameReplacesReservedCharacters)
{
    EXPECT_EQ(utils::sanitizeFileName(QStringLiteral("Sonic: The \"Hedgehog\"?")),
              QStringLiteral("Sonic_ The _Hedgehog__"));
    EXPECT_EQ(utils::sanitizeFileName(QStringLiteral("a/b\\c")), QStringLiteral("a_b_c"));
    EXPECT_EQ(utils::sanitizeFileName(QStringLiteral("  ..hidden.  ")), QStringLiteral("hidden"));
    EXPECT_EQ(utils::sanitizeFileName(QString(300, QLatin1Char('a'))).size(), 120);
}

TEST(DownloadUtils, UniqueFilePathKeepsFreePath)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("game.zip"));
    EXPECT_EQ(utils::uniqueFilePath(path), path);
}

TEST(DownloadUtils, UniqueFilePathNumbersCollisions)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    touch(dir.filePath(QStringLiteral("game.zip")));
    EXPECT_EQ(utils::uniqueFilePath(dir.filePath(QStringLiteral("game.zip"))), dir.filePath(QStringLiteral("game (1).zip")));

    touch(dir.filePath(QStringLiteral("game (1).zip")));
    EXPECT_EQ(utils::uniqueFilePath(dir.filePath(QStringLiteral("game.zip"))), dir.filePath(QStringLiteral("game (2).zip")));
}

TEST(DownloadUtils, UniqueFilePathKeepsTarSuffixTogether)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    touch(dir.filePath(QStringLiteral("pack.tar.gz")));
    EXPECT_EQ(utils::uniqueFilePath(dir.filePath(QStringLiteral("pack.tar.gz"))), dir.filePath(QStringLiteral("pack (1).tar.gz")));
}

TEST(DownloadUtils, FileSizeOnDiskTracksLiveSize)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("grow.bin"));
    EXPECT_EQ(utils::fileSizeOnDisk(path), 0);

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(QByteArray(10, 'a'));
    f.flush();
    EXPECT_EQ(utils::fileSizeOnDisk(path), 10);
    f.write(QByteArray(5, 'b'));
    f.flush();
    EXPECT_EQ(utils::fileSizeOnDisk(path), 15);
}

TEST(ArchiveUtils, AllowList)
{
    for (const char* name : { "a.zip", "a.rar", "a.7z", "a.tar", "a.gz", "a.tar.gz", "a.tgz", "A.ZIP" }) {
        EXPECT_TRUE(utils::shouldExtract(QString::fromLatin1(name))) << name;
    }
    EXPECT_FALSE(utils::shouldExtract(QStringLiteral("a.nes")));
    EXPECT_FALSE(utils::shouldExtract(QStringLiteral("readme.txt")));
}

TEST(ArchiveUtils, DenyListWinsOverAllowList)
{
    for (const char* name : { "disc.iso", "disc.nkit", "disc.ciso", "disc.wbfs", "channel.wad" }) {
        EXPECT_TRUE(utils::isDiskImage(QString::fromLatin1(name))) << name;
        EXPECT_FALSE(utils::shouldExtract(QString::fromLatin1(name))) << name;
    }
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("disc.iso")), utils::ArchiveKind::None);
}

TEST(ArchiveUtils, DetectArchiveKind)
{
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("x.zip")), utils::ArchiveKind::Zip);
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("x.tar.gz")), utils::ArchiveKind::Tar);
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("x.tgz")), utils::ArchiveKind::Tar);
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("x.gz")), utils::ArchiveKind::Gzip);
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("x.7z")), utils::ArchiveKind::SevenZip);
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("x.rar")), utils::ArchiveKind::Rar);
    EXPECT_EQ(utils::detectArchiveKind(QStringLiteral("x.bin")), utils::ArchiveKind::None);
}

TEST(ArchiveUtils, ArchiveBaseName)
{
    EXPECT_EQ(utils::archiveBaseName(QStringLiteral("/d/Game (USA).tar.gz")), QStringLiteral("Game (USA)"));
    EXPECT_EQ(utils::archiveBaseName(QStringLiteral("Game.zip")), QStringLiteral("Game"));
    EXPECT_EQ(utils::archiveBaseName(QStringLiteral("Game.v1.bin")), QStringLiteral("Game.v1"));
}

TEST(NetworkUtils, RangeHeaderValue)
{
    EXPECT_EQ(utils::rangeHeaderValue(0, 99), QByteArray("bytes=0-99"));
    EXPECT_EQ(utils::rangeHeaderValue(500), QByteArray("bytes=500-"));
}

TEST(NetworkUtils, ContentRangeStart)
{
    EXPECT_EQ(utils::contentRangeStart("bytes 100-199/1000"), 100);
    EXPECT_EQ(utils::contentRangeStart("bytes 0-0/*"), 0);
    EXPECT_EQ(utils::contentRangeStart(""), -1);
    EXPECT_EQ(utils::contentRangeStart("items 1-2/3"), -1);
}

TEST(NetworkUtils, TransferRequestDefaults)
{
    const QNetworkRequest req = utils::makeTransferRequest(QUrl("http://example.org/a.zip"), 4);
    EXPECT_EQ(req.rawHeader("User-Agent"), QByteArray("emularr/1.0"));
    EXPECT_EQ(req.rawHeader("Accept-Encoding"), QByteArray("identity"));
    EXPECT_EQ(req.maximumRedirectsAllowed(), utils::kMaxRedirects);
    EXPECT_EQ(req.http1Configuration().numberOfConnectionsPerHost(), 4);
}
