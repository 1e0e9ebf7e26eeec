module;
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrlQuery>
#include <QtGlobal>

module emularr.utils.download_utils;

namespace emularr::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString decodeQueryValue(const QString& value)
{
    QString v = value;
    v.replace('+', ' ');
    return QUrl::fromPercentEncoding(v.toUtf8());
}

QString filenameFromDisposition(const QString& value)
{
    const QString decoded = decodeQueryValue(value);
    if (decoded.isEmpty()) return QString();
    static const QRegularExpression re(QStringLiteral("filename\\*?=(?:UTF-8''|\"?)([^\";]+)"));
    auto match = re.match(decoded);
    if (match.hasMatch()) return match.captured(1).trimmed();
    return QString();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    QUrlQuery query(url);
    QString disp = query.queryItemValue(QStringLiteral("response-content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("content-disposition"));
    if (!disp.isEmpty()) {
        const QString fromDisp = sanitizeFileName(filenameFromDisposition(disp));
        if (!fromDisp.isEmpty()) return fromDisp;
    }
    const QString filename = query.queryItemValue(QStringLiteral("filename"));
    if (!filename.isEmpty()) {
        const QString fromQuery = sanitizeFileName(decodeQueryValue(filename));
        if (!fromQuery.isEmpty()) return fromQuery;
    }

    // Path segments arrive percent-encoded ("Super%20Game.zip").
    const QString path = url.path(QUrl::FullyDecoded);
    return sanitizeFileName(QFileInfo(path).fileName());
}

QString sanitizeFileName(const QString& name)
{
    QString out;
    out.reserve(name.size());
    for (const QChar c : name) {
        if (c.unicode() < 0x20 || QStringLiteral("<>:\"/\\|?*").contains(c)) {
            out.append('_');
        } else {
            out.append(c);
        }
    }
    out = out.trimmed();
    while (out.startsWith('.') || out.endsWith('.')) {
        out = out.startsWith('.') ? out.mid(1) : out.chopped(1);
        out = out.trimmed();
    }
    if (out.size() > 120) out.truncate(120);
    return out;
}

QString uniqueFilePath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return normalized;
    if (!QFile::exists(normalized)) return normalized;

    QFileInfo info(normalized);
    QString base = info.completeBaseName();
    QString suffix = info.suffix();
    if (base.endsWith(QStringLiteral(".tar"), Qt::CaseInsensitive)) {
        suffix = base.right(3) + '.' + suffix;
        base.chop(4);
    }
    QDir dir(info.absolutePath());
    for (int i = 1; i < 10000; ++i) {
        const QString name = suffix.isEmpty()
            ? QString("%1 (%2)").arg(base).arg(i)
            : QString("%1 (%2).%3").arg(base).arg(i).arg(suffix);
        const QString candidate = dir.filePath(name);
        if (!QFile::exists(candidate)) return candidate;
    }
    return normalized;
}

qint64 fileSizeOnDisk(const QString& path)
{
    // QFileInfo caches by default; progress sampling needs the live size.
    QFileInfo info(normalizeFilePath(path));
    info.setCaching(false);
    if (!info.exists() || !info.isFile()) return 0;
    return info.size();
}

} // namespace emularr::utils
