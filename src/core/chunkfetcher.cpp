module;
#include <memory>
#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

module emularr.core.chunkfetcher;

import emularr.utils.network_utils;

namespace utils = emularr::utils;

ChunkFetcher::ChunkFetcher(QNetworkAccessManager* manager,
                           const QUrl& url,
                           const QString& filePath,
                           Chunk* chunk,
                           std::shared_ptr<const CancellationToken> token,
                           int connectionsPerHost,
                           QObject* parent)
    : QObject(parent),
    m_manager(manager),
    m_url(url),
    m_filePath(filePath),
    m_chunk(chunk),
    m_token(std::move(token)),
    m_connectionsPerHost(connectionsPerHost)
{
}

ChunkFetcher::~ChunkFetcher()
{
    releaseTransfer();
}

bool ChunkFetcher::shouldStop() const
{
    return m_chunk->cancelled || (m_token && m_token->isCancelled());
}

void ChunkFetcher::start()
{
    m_settled = false;
    if (shouldStop()) {
        settleCancelled();
        return;
    }
    if (m_chunk->isComplete()) {
        settleFinished();
        return;
    }

    // ReadWrite never truncates, so sibling chunks keep their bytes.
    m_file = std::make_unique<QFile>(m_filePath);
    if (!m_file->open(QIODevice::ReadWrite)) {
        settleFailed(QStringLiteral("Cannot open %1: %2").arg(m_filePath, m_file->errorString()));
        return;
    }
    if (!m_file->seek(m_chunk->nextOffset())) {
        settleFailed(QStringLiteral("Cannot seek to %1: %2").arg(m_chunk->nextOffset()).arg(m_file->errorString()));
        return;
    }

    QNetworkRequest req = utils::makeTransferRequest(m_url, m_connectionsPerHost);
    req.setRawHeader("Range", utils::rangeHeaderValue(m_chunk->nextOffset(), m_chunk->endOffset));

    QNetworkReply* reply = m_manager->get(req);
    m_reply = reply;
    utils::relaxTlsVerification(reply);

    connect(reply, &QNetworkReply::metaDataChanged, this, &ChunkFetcher::onMetaDataChanged);
    connect(reply, &QNetworkReply::readyRead, this, &ChunkFetcher::onReadyRead);
    connect(reply, &QNetworkReply::finished, this, &ChunkFetcher::onReplyFinished);
}

void ChunkFetcher::cancel()
{
    m_chunk->cancelled = true;
    if (m_settled) return;
    settleCancelled();
}

void ChunkFetcher::onMetaDataChanged()
{
    if (!m_reply) return;
    if (shouldStop()) {
        settleCancelled();
        return;
    }

    const int status = utils::httpStatus(m_reply);
    if (status == 0) return; // not available yet

    if (status >= 400) {
        settleFailed(QStringLiteral("Chunk %1: HTTP %2").arg(m_chunk->index).arg(status));
        return;
    }
    if (status == 206) {
        const qint64 start = utils::contentRangeStart(m_reply->rawHeader("Content-Range"));
        if (start >= 0 && start != m_chunk->nextOffset()) {
            settleFailed(QStringLiteral("Chunk %1: server returned range starting at %2, expected %3")
                             .arg(m_chunk->index).arg(start).arg(m_chunk->nextOffset()));
        }
        return;
    }
    // A full body that starts at byte 0 still fills this chunk correctly.
    if (status == 200 && m_chunk->nextOffset() != 0) {
        qWarning() << "Chunk" << m_chunk->index << "got 200 for a range request";
        releaseTransfer();
        m_settled = true;
        emit rangeIgnored(m_chunk->index);
    }
}

void ChunkFetcher::onReadyRead()
{
    if (!m_reply) return;
    if (shouldStop()) {
        settleCancelled();
        return;
    }
    if (!writeBody(m_reply->readAll())) return;
    if (m_chunk->isComplete()) {
        settleFinished();
    }
}

void ChunkFetcher::onReplyFinished()
{
    if (!m_reply || m_settled) return;
    if (shouldStop()) {
        settleCancelled();
        return;
    }
    if (m_reply->error() != QNetworkReply::NoError) {
        settleFailed(QStringLiteral("Chunk %1: %2").arg(m_chunk->index).arg(m_reply->errorString()));
        return;
    }
    if (!writeBody(m_reply->readAll())) return;
    if (!m_chunk->isComplete()) {
        settleFailed(QStringLiteral("Chunk %1: connection closed after %2 of %3 bytes")
                         .arg(m_chunk->index).arg(m_chunk->downloaded).arg(m_chunk->length()));
        return;
    }
    settleFinished();
}

bool ChunkFetcher::writeBody(const QByteArray& data)
{
    if (data.isEmpty() || !m_file) return true;

    const qint64 room = m_chunk->remaining();
    const qint64 toWrite = qMin<qint64>(room, data.size());
    if (toWrite <= 0) return true;

    const qint64 written = m_file->write(data.constData(), toWrite);
    if (written != toWrite) {
        settleFailed(QStringLiteral("Chunk %1: write failed: %2").arg(m_chunk->index).arg(m_file->errorString()));
        return false;
    }
    m_chunk->downloaded += written;
    return true;
}

void ChunkFetcher::releaseTransfer()
{
    if (m_reply) {
        QNetworkReply* reply = m_reply;
        m_reply = nullptr;
        QObject::disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
    }
    if (m_file) {
        m_file->flush();
        m_file->close();
        m_file.reset();
    }
}

void ChunkFetcher::settleFinished()
{
    if (m_settled) return;
    releaseTransfer();
    m_settled = true;
    emit finished(m_chunk->index);
}

void ChunkFetcher::settleFailed(const QString& reason)
{
    if (m_settled) return;
    qWarning() << "Chunk fetch failed:" << reason;
    releaseTransfer();
    m_settled = true;
    emit failed(m_chunk->index, reason);
}

void ChunkFetcher::settleCancelled()
{
    if (m_settled) return;
    releaseTransfer();
    m_settled = true;
    emit cancelled(m_chunk->index);
}
