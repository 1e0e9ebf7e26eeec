/*!
 * @file        chunkfetcher.cppm
 * @brief       Single byte-range transfer into a shared destination file.
 * @details     A ChunkFetcher requests one inclusive byte range and streams
 *              the response body straight into the destination file at the
 *              chunk's offset. Several fetchers share one pre-allocated file;
 *              their ranges are disjoint, so no locking is needed.
 *
 *              Each fetcher checks its own stop flag and the task-wide
 *              cancellation token before sending the request, when response
 *              metadata arrives and on every received data unit. Stopping is
 *              reported through cancelled(), never through failed().
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <memory>
#include <QObject>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module emularr.core.chunkfetcher;
import emularr.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Fetches one chunk of a download.
 *
 * The fetcher updates the Chunk record it was given in place; the record
 * must outlive the fetcher. Exactly one of finished(), failed(),
 * cancelled() or rangeIgnored() is emitted per start().
 */
EMULARR_MODULE_EXPORT class ChunkFetcher : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a fetcher.
     * @param manager Network access manager (not owned).
     * @param url Source URL.
     * @param filePath Pre-allocated destination file.
     * @param chunk Chunk record to fill; offsets are absolute file positions.
     * @param token Task-wide cancellation token.
     * @param connectionsPerHost Connection budget passed to the request.
     * @param parent Optional parent QObject.
     */
    ChunkFetcher(QNetworkAccessManager* manager,
                 const QUrl& url,
                 const QString& filePath,
                 Chunk* chunk,
                 std::shared_ptr<const CancellationToken> token,
                 int connectionsPerHost,
                 QObject* parent = nullptr);
    ~ChunkFetcher() override;

    //!< @brief Open the writer and issue the range request.
    void start();

    //!< @brief Set the chunk's stop flag and close the stream and writer at once.
    void cancel();

    //!< @brief The chunk being fetched.
    const Chunk& chunk() const { return *m_chunk; }

    //!< @brief Whether a request is in flight.
    bool isActive() const { return !m_reply.isNull(); }

signals:
    //!< @brief The whole range is on disk.
    void finished(int index);

    //!< @brief The transfer failed for a reason other than cancellation.
    void failed(int index, const QString& reason);

    //!< @brief The transfer stopped because of a stop flag.
    void cancelled(int index);

    //!< @brief The server answered 200 to a range request for a non-zero offset.
    void rangeIgnored(int index);

private:
    //!< @brief True when either stop flag is set.
    bool shouldStop() const;

    void onMetaDataChanged();
    void onReadyRead();
    void onReplyFinished();

    /**
     * @brief Write received bytes at the chunk's current position.
     *
     * Bytes past the chunk's end are discarded.
     * @return false on a write error (already reported).
     */
    bool writeBody(const QByteArray& data);

    //!< @brief Disconnect, abort and release the reply; flush and close the writer.
    void releaseTransfer();

    void settleFinished();
    void settleFailed(const QString& reason);
    void settleCancelled();

    QNetworkAccessManager* m_manager = nullptr;         //!< Borrowed network manager.
    QUrl m_url;                                         //!< Source URL.
    QString m_filePath;                                 //!< Destination file.
    Chunk* m_chunk = nullptr;                           //!< Chunk record (not owned).
    std::shared_ptr<const CancellationToken> m_token;   //!< Task cancellation token.
    int m_connectionsPerHost = 1;                       //!< Request connection budget.
    QPointer<QNetworkReply> m_reply;                    //!< Active range reply.
    std::unique_ptr<QFile> m_file;                      //!< Positioned writer.
    bool m_settled = false;                             //!< Terminal signal emitted.
};

#include "chunkfetcher.moc"
