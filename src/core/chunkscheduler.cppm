/*!
 * @file        chunkscheduler.cppm
 * @brief       Range partitioning and concurrent chunk fetching.
 * @details     Splits a byte region into contiguous, disjoint chunks and runs
 *              one ChunkFetcher per unfinished chunk, all at once. The
 *              scheduler joins its fetchers with an all-or-error barrier:
 *              finished() only when every chunk is complete, failed() on the
 *              first real failure, after which the remaining fetchers are
 *              stopped quietly.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <memory>
#include <QObject>
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>
#include <QVector>

#ifndef Q_MOC_RUN
export module emularr.core.chunkscheduler;
import emularr.core.downloadtypes;
import emularr.core.chunkfetcher;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Splits [start, total) into approximately equal contiguous chunks.
 *
 * The last chunk absorbs the remainder. The count is clamped to
 * [1, total - start] so every chunk holds at least one byte; an empty
 * region yields no chunks.
 *
 * @param start First byte of the region.
 * @param total Resource length (region end, exclusive).
 * @param count Requested number of chunks.
 * @return Chunk records with downloaded = 0, indexed from 0.
 */
EMULARR_MODULE_EXPORT QVector<Chunk> planChunks(qint64 start, qint64 total, int count);

/**
 * @brief Runs the fetchers of one chunked transfer.
 *
 * The scheduler owns the chunk records for the duration of the transfer;
 * callers read them back through chunks() (e.g. to keep progress across
 * a pause).
 */
EMULARR_MODULE_EXPORT class ChunkScheduler : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a scheduler.
     * @param manager Network access manager shared by the fetchers (not owned).
     * @param url Source URL.
     * @param filePath Pre-allocated destination file.
     * @param chunks Chunk records; partially downloaded chunks resume at their offset.
     * @param token Task-wide cancellation token.
     * @param parent Optional parent QObject.
     */
    ChunkScheduler(QNetworkAccessManager* manager,
                   const QUrl& url,
                   const QString& filePath,
                   const QVector<Chunk>& chunks,
                   std::shared_ptr<const CancellationToken> token,
                   QObject* parent = nullptr);

    //!< @brief Launch a fetcher for every incomplete chunk.
    void start();

    /**
     * @brief Stop every fetcher immediately.
     *
     * Closes sockets and writers without emitting any signal; bytes
     * already written stay counted in the chunk records.
     */
    void cancelAll();

    /**
     * @brief Deep copy of the chunk records.
     *
     * Fetchers update the records in place, so the copy never shares
     * storage with them.
     */
    QVector<Chunk> chunks() const;

    //!< @brief Sum of the chunks' downloaded counters.
    qint64 downloadedBytes() const;

    //!< @brief Number of fetchers that have not settled yet.
    int activeCount() const { return m_pending; }

signals:
    //!< @brief Every chunk is complete.
    void finished();

    //!< @brief A chunk failed; the other fetchers were stopped.
    void failed(const QString& reason);

    //!< @brief A fetcher observed the cancellation token.
    void cancelled();

    //!< @brief The server ignored a range request (answered 200).
    void rangeIgnored();

private:
    void onFetcherFinished(int index);
    void onFetcherFailed(int index, const QString& reason);
    void onFetcherCancelled(int index);
    void onFetcherRangeIgnored(int index);

    //!< @brief Mark the barrier as resolved and stop the remaining fetchers.
    void settle();

    QNetworkAccessManager* m_manager = nullptr;         //!< Borrowed network manager.
    QUrl m_url;                                         //!< Source URL.
    QString m_filePath;                                 //!< Destination file.
    QVector<Chunk> m_chunks;                            //!< Chunk records (never resized after start).
    std::shared_ptr<const CancellationToken> m_token;   //!< Task cancellation token.
    QVector<ChunkFetcher*> m_fetchers;                  //!< Fetchers, parented to this.
    int m_pending = 0;                                  //!< Fetchers not settled yet.
    bool m_settled = false;                             //!< Barrier resolved.
};

#include "chunkscheduler.moc"
