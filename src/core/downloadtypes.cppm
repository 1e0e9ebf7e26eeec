/*!
 * @file        downloadtypes.cppm
 * @brief       Value types shared by the download engine components.
 * @details     Declares the task status machine states, the transfer strategy
 *              variant, chunk records, caller-supplied game metadata, the
 *              caller-visible task snapshot and the cooperative cancellation
 *              token shared between a task and its chunk fetchers.
 *
 *              Everything here is a plain value type except CancellationToken,
 *              which is shared through std::shared_ptr and is safe to read
 *              from any thread.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <atomic>
#include <optional>
#include <variant>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVariantMap>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module emularr.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Lifecycle state of a download task.
 *
 * Completed, Error and Cancelled are terminal for one invocation.
 */
EMULARR_MODULE_EXPORT enum class DownloadStatus {
    Downloading,    //!< Bytes are being transferred (or the probe is running).
    Paused,         //!< Transfer stopped by the caller; partial data kept.
    Completed,      //!< All bytes are on disk.
    Error,          //!< Transfer failed; see TaskSnapshot::errorDetail.
    Cancelled       //!< Transfer cancelled; partial file deleted.
};

//!< @brief Human-readable status label ("Downloading", "Paused", ...).
EMULARR_MODULE_EXPORT QString statusToString(DownloadStatus status);

//!< @brief True for Completed, Error and Cancelled.
EMULARR_MODULE_EXPORT bool isTerminal(DownloadStatus status);

//!< @brief One sequential stream, no byte ranges.
EMULARR_MODULE_EXPORT struct SingleStream {
    bool operator==(const SingleStream&) const = default;
};

//!< @brief N concurrent byte-range transfers.
EMULARR_MODULE_EXPORT struct Chunked {
    int count = 1;
    bool operator==(const Chunked&) const = default;
};

/**
 * @brief Transfer mode chosen for a task.
 *
 * The controller branches on the held alternative rather than on strings.
 */
EMULARR_MODULE_EXPORT using TransferStrategy = std::variant<SingleStream, Chunked>;

//!< @brief "single" or "chunked(n)".
EMULARR_MODULE_EXPORT QString strategyToString(const TransferStrategy& strategy);

/**
 * @brief Caller preference for the transfer mode.
 *
 * Auto lets the engine pick chunked transfers when the server allows it.
 */
EMULARR_MODULE_EXPORT enum class StrategyHint {
    Auto,
    SingleStream
};

/**
 * @brief Caller-supplied description of the game being downloaded.
 */
EMULARR_MODULE_EXPORT struct GameInfo {
    QString name;       //!< Display name; names the extraction folder.
    QString platform;   //!< Target platform (e.g. "SNES"), may be empty.
    QVariantMap extra;  //!< Free-form metadata forwarded to the catalog.
};

/**
 * @brief One byte-range sub-transfer of a chunked download.
 *
 * Offsets are absolute positions in the destination file, endOffset
 * inclusive. The record is exclusively owned by its task.
 */
EMULARR_MODULE_EXPORT struct Chunk {
    int index = 0;                  //!< Position within the task's chunk list.
    qint64 startOffset = 0;         //!< First byte of the range.
    qint64 endOffset = -1;          //!< Last byte of the range (inclusive).
    qint64 downloaded = 0;          //!< Bytes written so far from startOffset.
    bool cancelled = false;         //!< Per-chunk stop flag.

    qint64 length() const { return endOffset - startOffset + 1; }
    qint64 remaining() const { return length() - downloaded; }
    qint64 nextOffset() const { return startOffset + downloaded; }
    bool isComplete() const { return downloaded >= length(); }
};

/**
 * @brief Caller-visible, read-only view of a download task.
 *
 * Snapshots are copies; they never alias engine state.
 */
EMULARR_MODULE_EXPORT struct TaskSnapshot {
    QString id;                                 //!< Opaque task identifier.
    QUrl sourceUrl;                             //!< Requested URL.
    QString destinationDir;                     //!< Directory receiving the file.
    QString displayName;                        //!< Game name used for folders.
    QString platform;                           //!< Platform from GameInfo.
    QVariantMap metadata;                       //!< Extra caller metadata.
    QString filePath;                           //!< Output file path.

    DownloadStatus status = DownloadStatus::Downloading;
    TransferStrategy strategy = SingleStream{};
    qint64 totalBytes = 0;                      //!< 0 when unknown.
    qint64 downloadedBytes = 0;                 //!< Bytes on disk.
    double progressFraction = -1.0;             //!< [0,1], -1 when indeterminate.
    qint64 bytesPerSecond = 0;                  //!< Last sampled throughput.
    qint64 etaSeconds = -1;                     //!< -1 when indeterminate.
    std::optional<QString> errorDetail;         //!< Set only when status is Error.
    int resumeCount = 0;                        //!< Successful resume requests.
    QVector<Chunk> chunks;                      //!< Empty unless chunked.

    QString resolvedPath;                       //!< Extracted dir or original file.
    bool extracted = false;                     //!< Whether extraction succeeded.
    QString catalogEntryId;                     //!< Library entry id, if cataloged.

    QStringList logLines;                       //!< Bounded activity log.
    qint64 createdAt = 0;                       //!< Creation time (epoch ms).

    bool isIndeterminate() const { return progressFraction < 0.0; }
};

//!< @brief Maximum number of lines kept in TaskSnapshot::logLines.
EMULARR_MODULE_EXPORT constexpr int kTaskLogLimit = 200;

/**
 * @brief Appends a timestamped line to a bounded task log.
 * @param lines Log buffer to modify.
 * @param line Message without timestamp.
 */
EMULARR_MODULE_EXPORT void appendLogLine(QStringList& lines, const QString& line);

/**
 * @brief Progress ratio for a byte count.
 * @return downloaded/total clamped to [0,1], 1 for Completed, -1 when unknown.
 */
EMULARR_MODULE_EXPORT double progressFractionFor(qint64 downloaded, qint64 total, DownloadStatus status);

/**
 * @brief Shared cooperative cancellation flag.
 *
 * One token per task; every chunk fetcher of the task holds a reference
 * and polls it at each suspension point.
 */
EMULARR_MODULE_EXPORT class CancellationToken {
public:
    //!< @brief Request cancellation. Idempotent.
    void cancel() noexcept { m_cancelled.store(true, std::memory_order_release); }

    //!< @brief Whether cancellation was requested.
    bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic_bool m_cancelled{false};
};
