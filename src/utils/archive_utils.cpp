module;
#include <algorithm>
#include <QFileInfo>
#include <QString>
#include <QStringList>

module emularr.utils.archive_utils;

namespace emularr::utils {

QStringList extractableSuffixes()
{
    return { ".zip", ".rar", ".7z", ".tar", ".gz", ".tar.gz", ".tgz" };
}

QStringList diskImageSuffixes()
{
    return { ".iso", ".nkit", ".ciso", ".wbfs", ".wad" };
}

bool isDiskImage(const QString& filePath)
{
    const QString lower = filePath.toLower();
    for (const QString& suffix : diskImageSuffixes()) {
        if (lower.endsWith(suffix)) return true;
    }
    return false;
}

ArchiveKind detectArchiveKind(const QString& filePath)
{
    if (isDiskImage(filePath)) return ArchiveKind::None;

    const QString lower = filePath.toLower();
    if (lower.endsWith(".zip")) return ArchiveKind::Zip;
    if (lower.endsWith(".7z")) return ArchiveKind::SevenZip;
    if (lower.endsWith(".rar")) return ArchiveKind::Rar;
    if (lower.endsWith(".tar") || lower.endsWith(".tar.gz") || lower.endsWith(".tgz"))
        return ArchiveKind::Tar;
    if (lower.endsWith(".gz")) return ArchiveKind::Gzip;
    return ArchiveKind::None;
}

bool shouldExtract(const QString& filePath)
{
    if (isDiskImage(filePath)) return false;
    const QString lower = filePath.toLower();
    for (const QString& suffix : extractableSuffixes()) {
        if (lower.endsWith(suffix)) return true;
    }
    return false;
}

QString archiveBaseName(const QString& filePath)
{
    const QString name = QFileInfo(filePath).fileName();
    const QString lower = name.toLower();

    // Longest suffixes first so ".tar.gz" wins over ".gz".
    QStringList suffixes = extractableSuffixes();
    std::sort(suffixes.begin(), suffixes.end(), [](const QString& a, const QString& b) {
        return a.size() > b.size();
    });
    for (const QString& suffix : suffixes) {
        if (lower.endsWith(suffix) && name.size() > suffix.size())
            return name.left(name.size() - suffix.size());
    }
    return QFileInfo(filePath).completeBaseName();
}

} // namespace emularr::utils
