module;
#include <memory>
#include <QDebug>
#include <QNetworkAccessManager>
#include <QVector>
#include <QtGlobal>

module emularr.core.chunkscheduler;

QVector<Chunk> planChunks(qint64 start, qint64 total, int count)
{
    QVector<Chunk> chunks;
    const qint64 region = total - start;
    if (start < 0 || region <= 0) return chunks;

    const int n = static_cast<int>(qBound<qint64>(1, count, region));
    const qint64 size = region / n;
    chunks.reserve(n);
    for (int i = 0; i < n; ++i) {
        Chunk c;
        c.index = i;
        c.startOffset = start + i * size;
        c.endOffset = (i == n - 1) ? (total - 1) : (c.startOffset + size - 1);
        chunks.push_back(c);
    }
    return chunks;
}

ChunkScheduler::ChunkScheduler(QNetworkAccessManager* manager,
                               const QUrl& url,
                               const QString& filePath,
                               const QVector<Chunk>& chunks,
                               std::shared_ptr<const CancellationToken> token,
                               QObject* parent)
    : QObject(parent),
    m_manager(manager),
    m_url(url),
    m_filePath(filePath),
    m_chunks(chunks),
    m_token(std::move(token))
{
    for (int i = 0; i < m_chunks.size(); ++i) {
        m_chunks[i].index = i;
        m_chunks[i].cancelled = false;
    }
}

void ChunkScheduler::start()
{
    m_settled = false;
    m_pending = 0;

    QVector<ChunkFetcher*> toStart;
    for (Chunk& c : m_chunks) {
        if (c.isComplete()) continue;
        auto* fetcher = new ChunkFetcher(m_manager, m_url, m_filePath, &c, m_token,
                                         static_cast<int>(m_chunks.size()), this);
        connect(fetcher, &ChunkFetcher::finished, this, &ChunkScheduler::onFetcherFinished);
        connect(fetcher, &ChunkFetcher::failed, this, &ChunkScheduler::onFetcherFailed);
        connect(fetcher, &ChunkFetcher::cancelled, this, &ChunkScheduler::onFetcherCancelled);
        connect(fetcher, &ChunkFetcher::rangeIgnored, this, &ChunkScheduler::onFetcherRangeIgnored);
        m_fetchers.push_back(fetcher);
        toStart.push_back(fetcher);
    }
    m_pending = static_cast<int>(toStart.size());

    if (m_pending == 0) {
        // All chunks already on disk.
        m_settled = true;
        emit finished();
        return;
    }

    qDebug() << "Starting" << m_pending << "of" << m_chunks.size() << "chunks for" << m_filePath;
    for (ChunkFetcher* fetcher : toStart) {
        if (m_settled) break;
        fetcher->start();
    }
}

void ChunkScheduler::cancelAll()
{
    m_settled = true;
    for (ChunkFetcher* fetcher : m_fetchers) {
        QObject::disconnect(fetcher, nullptr, this, nullptr);
        fetcher->cancel();
    }
    m_pending = 0;
}

QVector<Chunk> ChunkScheduler::chunks() const
{
    return QVector<Chunk>(m_chunks.cbegin(), m_chunks.cend());
}

qint64 ChunkScheduler::downloadedBytes() const
{
    qint64 total = 0;
    for (const Chunk& c : m_chunks) total += c.downloaded;
    return total;
}

void ChunkScheduler::onFetcherFinished(int index)
{
    Q_UNUSED(index)
    if (m_settled) return;
    if (--m_pending > 0) return;

    for (const Chunk& c : m_chunks) {
        if (!c.isComplete()) {
            settle();
            emit failed(QStringLiteral("Chunk %1 ended incomplete").arg(c.index));
            return;
        }
    }
    m_settled = true;
    emit finished();
}

void ChunkScheduler::onFetcherFailed(int index, const QString& reason)
{
    Q_UNUSED(index)
    if (m_settled) return;
    settle();
    emit failed(reason);
}

void ChunkScheduler::onFetcherCancelled(int index)
{
    Q_UNUSED(index)
    if (m_settled) return;
    settle();
    emit cancelled();
}

void ChunkScheduler::onFetcherRangeIgnored(int index)
{
    Q_UNUSED(index)
    if (m_settled) return;
    settle();
    emit rangeIgnored();
}

void ChunkScheduler::settle()
{
    m_settled = true;
    for (ChunkFetcher* fetcher : m_fetchers) {
        QObject::disconnect(fetcher, nullptr, this, nullptr);
        fetcher->cancel();
    }
    // Stopping siblings marks their chunks cancelled; the records stay reusable.
    for (Chunk& c : m_chunks) c.cancelled = false;
    m_pending = 0;
}
