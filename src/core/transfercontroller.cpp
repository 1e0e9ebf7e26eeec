module;
#include <memory>
#include <optional>
#include <variant>
#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QVariant>

module emularr.core.transfercontroller;

import emularr.utils.download_utils;
import emularr.utils.network_utils;

namespace utils = emularr::utils;

TransferController::TransferController(const QString& taskId,
                                       const Options& options,
                                       TaskRegistry& registry,
                                       QObject* parent)
    : QObject(parent),
    m_taskId(taskId),
    m_options(options),
    m_registry(registry),
    m_token(std::make_shared<CancellationToken>())
{
    m_options.filePath = utils::normalizeFilePath(m_options.filePath);
    m_options.threadCount = qMax(1, m_options.threadCount);
    resetNetworkManager();

    connect(&m_aggregator, &ProgressAggregator::sampled, this, [this](const ProgressSample&) {
        if (m_status == DownloadStatus::Downloading) publish();
    });
}

TransferController::~TransferController()
{
    m_token->cancel();
    stopTransfers();
}

void TransferController::resetNetworkManager()
{
    if (m_manager) {
        m_manager->deleteLater();
        m_manager = nullptr;
    }
    m_manager = new QNetworkAccessManager(this);
}

TransferStrategy TransferController::selectStrategy(const RangeCapability& capability, int threadCount, StrategyHint hint)
{
    if (hint == StrategyHint::SingleStream) return SingleStream{};
    if (!capability.supportsRange || capability.contentLength <= 0) return SingleStream{};
    if (threadCount <= 1) return SingleStream{};
    return Chunked{ static_cast<int>(qMin<qint64>(threadCount, capability.contentLength)) };
}

qint64 TransferController::downloadedBytes() const
{
    if (m_scheduler) return m_baseBytes + m_scheduler->downloadedBytes();
    if (std::holds_alternative<Chunked>(m_strategy) && !m_chunks.isEmpty()) {
        qint64 sum = m_baseBytes;
        for (const Chunk& c : m_chunks) sum += c.downloaded;
        return sum;
    }
    if (!m_started || m_status == DownloadStatus::Cancelled) return 0;
    // Single stream: the destination file is the progress record.
    return utils::fileSizeOnDisk(m_options.filePath);
}

bool TransferController::start()
{
    if (m_started) return false;
    m_started = true;

    qDebug() << "TransferController::start for" << m_options.url;
    appendLog(QStringLiteral("Start: %1").arg(m_options.url.toString()));

    // Reserve the output path right away so concurrent tasks never share it.
    const QString dir = QFileInfo(m_options.filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        fail(QStringLiteral("Cannot create directory %1").arg(dir));
        return true;
    }
    QFile reserve(m_options.filePath);
    if (!reserve.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        fail(QStringLiteral("Cannot create %1: %2").arg(m_options.filePath, reserve.errorString()));
        return true;
    }
    reserve.close();

    setStatus(DownloadStatus::Downloading);
    m_aggregator.start([this] { return downloadedBytes(); }, m_total);
    beginProbe(ProbeMode::Fresh);
    return true;
}

bool TransferController::pause()
{
    if (m_status != DownloadStatus::Downloading || !m_started)
        return false;

    qDebug() << "Pause requested for" << m_options.filePath;
    appendLog(QStringLiteral("Paused"));
    stopTransfers();
    m_aggregator.stop();

    // Reusing a manager right after aborting its replies can stall the next request.
    resetNetworkManager();

    if (std::holds_alternative<SingleStream>(m_strategy)) {
        m_singleWritten = utils::fileSizeOnDisk(m_options.filePath);
    }
    setStatus(DownloadStatus::Paused);
    return true;
}

bool TransferController::resume()
{
    if (m_status != DownloadStatus::Paused)
        return false;

    if (m_transferStarted) {
        if (m_rangeSupported.has_value() && !*m_rangeSupported) {
            fail(QStringLiteral("cannot resume: server does not support byte ranges"));
            return false;
        }
        if (m_total <= 0) {
            fail(QStringLiteral("cannot resume: total size is unknown"));
            return false;
        }
    }

    qDebug() << "Resume requested for" << m_options.filePath;
    ++m_resumeCount;
    appendLog(QStringLiteral("Resumed"));
    setStatus(DownloadStatus::Downloading);
    m_aggregator.start([this] { return downloadedBytes(); }, m_total);
    beginProbe(m_transferStarted ? ProbeMode::Resume : ProbeMode::Fresh);
    return true;
}

bool TransferController::cancel()
{
    if (isTerminal(m_status))
        return false;

    qDebug() << "Cancel requested for" << m_options.filePath;
    appendLog(QStringLiteral("Canceled"));
    m_token->cancel();
    stopTransfers();
    m_aggregator.stop();

    if (QFile::exists(m_options.filePath) && !QFile::remove(m_options.filePath)) {
        qWarning() << "Cannot remove partial file" << m_options.filePath;
    }
    m_chunks.clear();
    setStatus(DownloadStatus::Cancelled);
    emit finished(false);
    return true;
}

void TransferController::beginProbe(ProbeMode mode)
{
    if (m_prober) {
        m_prober->abort();
        m_prober->deleteLater();
    }
    m_prober = new CapabilityProber(m_manager, this);
    connect(m_prober, &CapabilityProber::probed, this, [this, mode](const RangeCapability& capability) {
        onProbed(capability, mode);
    });
    m_prober->probe(m_options.url);
}

void TransferController::onProbed(const RangeCapability& capability, ProbeMode mode)
{
    if (m_prober) {
        m_prober->deleteLater();
        m_prober = nullptr;
    }
    if (m_status != DownloadStatus::Downloading || m_token->isCancelled())
        return;

    // A failed HEAD says nothing about range support; GET may still honor it.
    if (capability.probeFailed) {
        m_rangeSupported.reset();
    } else {
        m_rangeSupported = capability.supportsRange;
    }
    if (mode == ProbeMode::Fresh) {
        startFresh(capability);
    } else {
        continueTransfer(capability);
    }
}

void TransferController::startFresh(const RangeCapability& capability)
{
    m_resumed = false;
    m_baseBytes = 0;
    m_chunks.clear();
    m_total = capability.contentLength;
    m_aggregator.setTotalBytes(m_total);
    m_strategy = selectStrategy(capability, m_options.threadCount, m_options.hint);
    m_transferStarted = true;

    appendLog(QStringLiteral("Probe: length %1, ranges %2, strategy %3")
                  .arg(m_total)
                  .arg(capability.supportsRange ? QStringLiteral("yes") : QStringLiteral("no"))
                  .arg(strategyToString(m_strategy)));

    if (const auto* chunked = std::get_if<Chunked>(&m_strategy)) {
        if (!preallocate(m_total)) return;
        m_chunks = planChunks(0, m_total, chunked->count);
        startChunked();
        return;
    }
    startSingleStream(0);
}

void TransferController::continueTransfer(const RangeCapability& capability)
{
    const bool probed = !capability.probeFailed;
    if (probed && !capability.supportsRange) {
        fail(QStringLiteral("cannot resume: server does not support byte ranges"));
        return;
    }
    if (probed && capability.contentLength != m_total) {
        fail(QStringLiteral("cannot resume: remote size changed from %1 to %2")
                 .arg(m_total).arg(capability.contentLength));
        return;
    }
    m_resumed = true;

    if (std::holds_alternative<Chunked>(m_strategy)) {
        startChunked();
        return;
    }

    const qint64 offset = utils::fileSizeOnDisk(m_options.filePath);
    m_singleWritten = offset;
    if (offset >= m_total) {
        complete();
        return;
    }
    if (!probed) appendLog(QStringLiteral("Probe failed; trying a range request from %1").arg(offset));
    if (!probed || m_options.threadCount <= 1 || m_options.hint == StrategyHint::SingleStream) {
        startSingleStream(offset);
        return;
    }

    // Split the missing tail into ranges.
    if (!preallocate(m_total)) return;
    m_baseBytes = offset;
    m_chunks = planChunks(offset, m_total, m_options.threadCount);
    m_strategy = Chunked{ static_cast<int>(m_chunks.size()) };
    appendLog(QStringLiteral("Resuming tail [%1, %2) as %3")
                  .arg(offset).arg(m_total).arg(strategyToString(m_strategy)));
    startChunked();
}

bool TransferController::preallocate(qint64 bytes)
{
    QFile file(m_options.filePath);
    if (!file.open(QIODevice::ReadWrite)) {
        fail(QStringLiteral("Cannot open %1: %2").arg(m_options.filePath, file.errorString()));
        return false;
    }
    if (!file.resize(bytes)) {
        fail(QStringLiteral("Cannot allocate %1 bytes for %2: %3")
                 .arg(bytes).arg(m_options.filePath, file.errorString()));
        return false;
    }
    file.close();
    return true;
}

void TransferController::startChunked()
{
    m_scheduler = new ChunkScheduler(m_manager, m_options.url, m_options.filePath, m_chunks, m_token, this);
    connect(m_scheduler, &ChunkScheduler::finished, this, &TransferController::onSchedulerFinished);
    connect(m_scheduler, &ChunkScheduler::failed, this, [this](const QString& reason) {
        fail(reason);
    });
    connect(m_scheduler, &ChunkScheduler::cancelled, this, [this]() {
        // Only the cancellation token gets here; cancel() already cleaned up.
        if (m_status == DownloadStatus::Downloading) cancel();
    });
    connect(m_scheduler, &ChunkScheduler::rangeIgnored, this, &TransferController::onSchedulerRangeIgnored);
    publish();
    m_scheduler->start();
}

void TransferController::onSchedulerFinished()
{
    if (!m_scheduler) return;
    m_chunks = m_scheduler->chunks();
    complete();
}

void TransferController::onSchedulerRangeIgnored()
{
    if (m_resumed) {
        fail(QStringLiteral("cannot resume: server ignored the byte range"));
        return;
    }

    qWarning() << "Range ignored; switching to single stream for" << m_options.filePath;
    appendLog(QStringLiteral("Range ignored; switched to single stream"));
    stopTransfers();
    m_chunks.clear();
    m_baseBytes = 0;
    m_strategy = SingleStream{};
    m_rangeSupported = false;
    if (!preallocate(0)) return;
    startSingleStream(0);
}

void TransferController::startSingleStream(qint64 offset)
{
    const bool resuming = offset > 0;
    m_singleOffset = offset;

    m_singleFile = std::make_unique<QFile>(m_options.filePath);
    const QIODevice::OpenMode mode = QIODevice::WriteOnly | (resuming ? QIODevice::Append : QIODevice::Truncate);
    if (!m_singleFile->open(mode)) {
        const QString reason = QStringLiteral("Cannot open %1: %2").arg(m_options.filePath, m_singleFile->errorString());
        m_singleFile.reset();
        fail(reason);
        return;
    }
    m_singleWritten = resuming ? offset : 0;

    QNetworkRequest req = utils::makeTransferRequest(m_options.url);
    if (resuming) {
        req.setRawHeader("Range", utils::rangeHeaderValue(offset));
        appendLog(QStringLiteral("Requesting bytes from %1").arg(offset));
    }

    QNetworkReply* reply = m_manager->get(req);
    m_singleReply = reply;
    utils::relaxTlsVerification(reply);
    QPointer<QNetworkReply> replyPtr(reply);
    publish();

    connect(reply, &QNetworkReply::metaDataChanged, this, [this, replyPtr, resuming, offset]() {
        if (!replyPtr || replyPtr != m_singleReply) return;
        const int status = utils::httpStatus(replyPtr);
        if (status == 0) return;

        if (status >= 400) {
            fail(QStringLiteral("HTTP %1").arg(status));
            return;
        }
        if (resuming) {
            if (status != 206) {
                fail(QStringLiteral("cannot resume: server answered %1 to a range request").arg(status));
                return;
            }
            const qint64 start = utils::contentRangeStart(replyPtr->rawHeader("Content-Range"));
            if (start >= 0 && start != offset) {
                fail(QStringLiteral("cannot resume: server returned range starting at %1, expected %2")
                         .arg(start).arg(offset));
                return;
            }
        }
        if (m_total <= 0) {
            const QVariant cl = replyPtr->header(QNetworkRequest::ContentLengthHeader);
            if (cl.isValid() && cl.toLongLong() > 0) {
                m_total = offset + cl.toLongLong();
                m_aggregator.setTotalBytes(m_total);
                appendLog(QStringLiteral("Length learned from response: %1").arg(m_total));
                publish();
            }
        }
    });

    connect(reply, &QNetworkReply::readyRead, this, [this, replyPtr]() {
        if (!replyPtr || replyPtr != m_singleReply) return;
        if (m_token->isCancelled()) return;
        writeSingle(replyPtr->readAll());
    });

    connect(reply, &QNetworkReply::finished, this, [this, replyPtr]() {
        if (!replyPtr) return;
        if (replyPtr != m_singleReply) {
            replyPtr->deleteLater();
            return;
        }
        if (m_status != DownloadStatus::Downloading) return;

        if (replyPtr->error() != QNetworkReply::NoError) {
            qWarning() << "GET error:" << replyPtr->errorString();
            fail(replyPtr->errorString());
            return;
        }
        if (!writeSingle(replyPtr->readAll())) return;

        if (m_total > 0 && m_singleWritten != m_total) {
            fail(QStringLiteral("Connection closed after %1 of %2 bytes").arg(m_singleWritten).arg(m_total));
            return;
        }
        if (m_total <= 0) {
            m_total = m_singleWritten;
        }
        complete();
    });
}

bool TransferController::writeSingle(const QByteArray& data)
{
    if (data.isEmpty() || !m_singleFile) return true;

    QByteArray body = data;
    if (m_total > 0 && m_singleWritten + body.size() > m_total) {
        body.truncate(static_cast<int>(m_total - m_singleWritten));
    }
    const qint64 written = m_singleFile->write(body);
    if (written != body.size()) {
        fail(QStringLiteral("Write failed: %1").arg(m_singleFile->errorString()));
        return false;
    }
    m_singleFile->flush();
    m_singleWritten += written;
    return true;
}

void TransferController::stopTransfers()
{
    if (m_prober) {
        m_prober->abort();
        QObject::disconnect(m_prober, nullptr, this, nullptr);
        m_prober->deleteLater();
        m_prober = nullptr;
    }
    if (m_scheduler) {
        QObject::disconnect(m_scheduler, nullptr, this, nullptr);
        m_scheduler->cancelAll();
        m_chunks = m_scheduler->chunks();
        for (Chunk& c : m_chunks) c.cancelled = false;
        m_scheduler->deleteLater();
        m_scheduler = nullptr;
    }
    if (m_singleReply) {
        QNetworkReply* reply = m_singleReply;
        m_singleReply = nullptr;
        QObject::disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
    }
    if (m_singleFile) {
        m_singleFile->flush();
        m_singleFile->close();
        m_singleFile.reset();
    }
}

void TransferController::complete()
{
    stopTransfers();
    m_aggregator.stop();

    const qint64 onDisk = utils::fileSizeOnDisk(m_options.filePath);
    if (m_total > 0 && onDisk != m_total) {
        fail(QStringLiteral("Size mismatch: %1 bytes on disk, expected %2").arg(onDisk).arg(m_total));
        return;
    }
    if (std::holds_alternative<SingleStream>(m_strategy)) {
        m_singleWritten = onDisk;
    }

    qDebug() << "Download complete:" << m_options.filePath;
    appendLog(QStringLiteral("Completed: %1 bytes").arg(onDisk));
    setStatus(DownloadStatus::Completed);
    emit finished(true);
}

void TransferController::fail(const QString& reason)
{
    if (isTerminal(m_status))
        return;

    qWarning() << "Download failed:" << m_options.filePath << reason;
    m_error = reason;
    appendLog(QStringLiteral("Error: %1").arg(reason));
    stopTransfers();
    m_aggregator.stop();
    setStatus(DownloadStatus::Error);
    emit finished(false);
}

void TransferController::setStatus(DownloadStatus status)
{
    const bool changed = m_status != status;
    m_status = status;
    publish();
    if (changed) emit statusChanged(m_status);
}

void TransferController::publish()
{
    const qint64 downloaded = downloadedBytes();
    const ProgressSample sample = m_aggregator.lastSample();
    const bool live = m_status == DownloadStatus::Downloading;

    m_registry.update(m_taskId, [&](TaskSnapshot& s) {
        s.filePath = m_options.filePath;
        s.status = m_status;
        s.strategy = m_strategy;
        s.totalBytes = m_total;
        s.downloadedBytes = downloaded;
        s.progressFraction = progressFractionFor(downloaded, m_total, m_status);
        s.bytesPerSecond = live ? sample.bytesPerSecond : 0;
        s.etaSeconds = live ? sample.etaSeconds : -1;
        s.resumeCount = m_resumeCount;
        s.chunks = m_scheduler ? m_scheduler->chunks() : m_chunks;
        if (m_status == DownloadStatus::Error) {
            s.errorDetail = m_error;
        } else {
            s.errorDetail.reset();
        }
    });
}

void TransferController::appendLog(const QString& line)
{
    m_registry.appendLog(m_taskId, line);
}
