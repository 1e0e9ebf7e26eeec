module;
#include <variant>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>

module emularr.core.downloadtypes;

QString statusToString(DownloadStatus status)
{
    switch (status) {
    case DownloadStatus::Downloading: return QStringLiteral("Downloading");
    case DownloadStatus::Paused: return QStringLiteral("Paused");
    case DownloadStatus::Completed: return QStringLiteral("Completed");
    case DownloadStatus::Error: return QStringLiteral("Error");
    case DownloadStatus::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

bool isTerminal(DownloadStatus status)
{
    return status == DownloadStatus::Completed
        || status == DownloadStatus::Error
        || status == DownloadStatus::Cancelled;
}

QString strategyToString(const TransferStrategy& strategy)
{
    if (const auto* chunked = std::get_if<Chunked>(&strategy)) {
        return QStringLiteral("chunked(%1)").arg(chunked->count);
    }
    return QStringLiteral("single");
}

void appendLogLine(QStringList& lines, const QString& line)
{
    if (line.trimmed().isEmpty()) return;
    const QString stamp = QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss"));
    lines.append(QStringLiteral("[%1] %2").arg(stamp, line));
    while (lines.size() > kTaskLogLimit) {
        lines.removeFirst();
    }
}

double progressFractionFor(qint64 downloaded, qint64 total, DownloadStatus status)
{
    if (status == DownloadStatus::Completed) return 1.0;
    if (total <= 0) return -1.0;
    if (downloaded <= 0) return 0.0;
    if (downloaded >= total) return 1.0;
    return static_cast<double>(downloaded) / static_cast<double>(total);
}
