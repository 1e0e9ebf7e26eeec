module;
#include <expected>
#include <optional>
#include <utility>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QUuid>
#include <QVariantMap>

module emularr.core.downloadmanager;

import emularr.utils.download_utils;
import emularr.utils.archive_utils;

namespace utils = emularr::utils;

DownloadManager::DownloadManager(EngineSettings& settings,
                                 ArchiveExtractor* extractor,
                                 GameCatalog* catalog,
                                 QObject* parent)
    : QObject(parent),
    m_settings(settings),
    m_extractor(extractor),
    m_catalog(catalog)
{
}

DownloadManager::~DownloadManager()
{
    // Controllers are children; make sure none publishes into a dying registry.
    for (TransferController* controller : std::as_const(m_controllers)) {
        QObject::disconnect(controller, nullptr, this, nullptr);
        delete controller;
    }
    m_controllers.clear();
}

QString DownloadManager::startDownload(const QString& urlStr, StrategyHint hint, const GameInfo& game)
{
    const QUrl url(urlStr.trimmed());
    if (!url.isValid() || url.host().isEmpty()) {
        qWarning() << "Invalid URL:" << urlStr;
        return {};
    }
    const QString scheme = url.scheme().toLower();
    if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https")) {
        qWarning() << "Unsupported URL scheme:" << url.scheme();
        return {};
    }
    if (url.path().toLower().endsWith(QStringLiteral(".torrent"))) {
        qWarning() << "Torrent downloads are not supported:" << urlStr;
        return {};
    }

    // Configuration is read once, here.
    const QString directory = utils::normalizeFilePath(m_settings.downloadDirectory());
    const int threads = qMax(1, m_settings.chunkThreadCount());

    QString displayName = game.name.trimmed();
    if (displayName.isEmpty()) {
        displayName = utils::archiveBaseName(utils::fileNameFromUrl(url));
    }

    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const QString filePath = resolveDownloadPath(url, directory, displayName);

    TaskSnapshot snapshot;
    snapshot.id = id;
    snapshot.sourceUrl = url;
    snapshot.destinationDir = directory;
    snapshot.displayName = displayName;
    snapshot.platform = game.platform;
    snapshot.metadata = game.extra;
    snapshot.filePath = filePath;
    snapshot.status = DownloadStatus::Downloading;
    snapshot.createdAt = QDateTime::currentMSecsSinceEpoch();
    appendLogLine(snapshot.logLines, QStringLiteral("Queued %1 -> %2").arg(url.toString(), filePath));
    if (!m_registry.insert(snapshot)) {
        qWarning() << "Duplicate task id" << id;
        return {};
    }

    TransferController::Options options;
    options.url = url;
    options.filePath = filePath;
    options.threadCount = threads;
    options.hint = hint;

    TransferController* controller = createController(id, options);
    qDebug() << "Starting task" << id << "for" << url << "threads" << threads;
    emit taskStatusChanged(id, DownloadStatus::Downloading);
    controller->start();
    return id;
}

QString DownloadManager::resolveDownloadPath(const QUrl& url, const QString& directory, const QString& displayName) const
{
    QString fileName = utils::fileNameFromUrl(url);
    if (fileName.isEmpty()) fileName = utils::sanitizeFileName(displayName);
    if (fileName.isEmpty()) fileName = QStringLiteral("download.bin");
    return utils::uniqueFilePath(QDir(directory).filePath(fileName));
}

TransferController* DownloadManager::createController(const QString& id, const TransferController::Options& options)
{
    auto* controller = new TransferController(id, options, m_registry, this);
    controller->setSampleIntervalMs(m_sampleIntervalMs);
    m_controllers.insert(id, controller);

    connect(controller, &TransferController::statusChanged, this, [this, id](DownloadStatus status) {
        onControllerStatusChanged(id, status);
    });
    return controller;
}

void DownloadManager::onControllerStatusChanged(const QString& id, DownloadStatus status)
{
    emit taskStatusChanged(id, status);
    if (status == DownloadStatus::Completed) {
        postProcess(id);
    }
}

std::optional<TaskSnapshot> DownloadManager::getProgress(const QString& id) const
{
    return m_registry.find(id);
}

QList<TaskSnapshot> DownloadManager::getAllTasks() const
{
    return m_registry.all();
}

QStringList DownloadManager::activeTaskIds() const
{
    QStringList ids;
    for (const TaskSnapshot& s : m_registry.all()) {
        if (s.status == DownloadStatus::Downloading || s.status == DownloadStatus::Paused)
            ids << s.id;
    }
    return ids;
}

bool DownloadManager::pause(const QString& id)
{
    TransferController* controller = m_controllers.value(id, nullptr);
    return controller && controller->pause();
}

bool DownloadManager::resume(const QString& id)
{
    TransferController* controller = m_controllers.value(id, nullptr);
    return controller && controller->resume();
}

bool DownloadManager::cancel(const QString& id)
{
    TransferController* controller = m_controllers.value(id, nullptr);
    if (!controller) return false;
    if (!controller->cancel()) return false;
    dropTask(id);
    return true;
}

bool DownloadManager::prune(const QString& id)
{
    const auto snapshot = m_registry.find(id);
    if (!snapshot) return false;
    if (snapshot->status != DownloadStatus::Completed && snapshot->status != DownloadStatus::Error)
        return false;
    dropTask(id);
    return true;
}

int DownloadManager::pruneFinished()
{
    int removed = 0;
    for (const QString& id : m_registry.ids()) {
        if (prune(id)) ++removed;
    }
    return removed;
}

void DownloadManager::dropTask(const QString& id)
{
    m_registry.remove(id);
    if (TransferController* controller = m_controllers.take(id)) {
        QObject::disconnect(controller, nullptr, this, nullptr);
        controller->deleteLater();
    }
}

void DownloadManager::postProcess(const QString& id)
{
    const auto snapshot = m_registry.find(id);
    if (!snapshot) return;

    const QString filePath = snapshot->filePath;
    if (!m_extractor || !m_extractor->shouldExtract(filePath)) {
        if (utils::isDiskImage(filePath)) {
            m_registry.appendLog(id, QStringLiteral("Disk image kept as is"));
        }
        finishPostProcess(id, filePath, false);
        return;
    }

    QString folder = utils::sanitizeFileName(snapshot->displayName);
    if (folder.isEmpty()) folder = utils::archiveBaseName(filePath);
    const QString extractDir = QDir(snapshot->destinationDir).filePath(folder);
    m_registry.appendLog(id, QStringLiteral("Extracting to %1").arg(extractDir));

    QPointer<DownloadManager> self(this);
    m_extractor->extract(filePath, extractDir, [self, id, filePath](const ArchiveExtractor::Result& result) {
        if (!self || !self->m_registry.contains(id)) return;
        if (result) {
            self->m_registry.appendLog(id, QStringLiteral("Extracted to %1").arg(*result));
            self->finishPostProcess(id, *result, true);
            return;
        }
        qWarning() << "Extraction failed for" << filePath << ":" << result.error();
        self->m_registry.appendLog(id, QStringLiteral("Extraction failed: %1").arg(result.error()));
        self->finishPostProcess(id, filePath, false);
    });
}

void DownloadManager::finishPostProcess(const QString& id, const QString& resolvedPath, bool extracted)
{
    const auto snapshot = m_registry.find(id);
    if (!snapshot) return;

    QString entryId;
    if (m_catalog) {
        CatalogEntryRequest request;
        request.name = snapshot->displayName;
        request.platform = snapshot->platform;
        request.filePath = resolvedPath;
        request.sourceDownloadDir = snapshot->destinationDir;
        request.metadata = snapshot->metadata;
        request.metadata.insert(QStringLiteral("originalFileName"), QFileInfo(snapshot->filePath).fileName());
        request.metadata.insert(QStringLiteral("extracted"), extracted);
        request.metadata.insert(QStringLiteral("size"), snapshot->totalBytes);
        request.metadata.insert(QStringLiteral("sourceUrl"), snapshot->sourceUrl.toString());

        const auto entry = m_catalog->registerEntry(request);
        if (entry) {
            entryId = entry->id;
            m_registry.appendLog(id, QStringLiteral("Added to library: %1").arg(entryId));
        } else {
            qWarning() << "Cataloging failed for" << snapshot->displayName << ":" << entry.error();
            m_registry.appendLog(id, QStringLiteral("Catalog failed: %1").arg(entry.error()));
        }
    }

    m_registry.update(id, [&](TaskSnapshot& s) {
        s.resolvedPath = resolvedPath;
        s.extracted = extracted;
        s.catalogEntryId = entryId;
    });
    qInfo() << "Post-processed" << id << "->" << resolvedPath << (extracted ? "(extracted)" : "");
    emit taskPostProcessed(id);
}
