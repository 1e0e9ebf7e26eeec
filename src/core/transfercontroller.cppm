/*!
 * @file        transfercontroller.cppm
 * @brief       Lifecycle of a single download task.
 * @details     A TransferController drives one task through its state
 *              machine: it probes the server, picks a transfer strategy,
 *              runs either a single stream or a chunk scheduler, samples
 *              progress and publishes every change to the task registry.
 *
 *              Pause keeps every flushed byte and the per-chunk counters;
 *              resume re-probes the server and continues each chunk (or the
 *              single stream) from where it stopped. Cancel aborts every
 *              stream and deletes the partial file.
 *
 *              The controller never removes its own registry row; that is
 *              the caller's decision.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <memory>
#include <optional>
#include <QObject>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QString>
#include <QUrl>
#include <QVector>

#ifndef Q_MOC_RUN
export module emularr.core.transfercontroller;
import emularr.core.downloadtypes;
import emularr.core.capabilityprober;
import emularr.core.chunkscheduler;
import emularr.core.progressaggregator;
import emularr.core.taskregistry;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Runs one download task.
 *
 * States: Downloading -> {Paused, Completed, Error}; Paused -> {Downloading,
 * Cancelled}; any non-terminal state -> Cancelled.
 */
EMULARR_MODULE_EXPORT class TransferController : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Per-task transfer settings, fixed at task creation.
     */
    struct Options {
        QUrl url;                                   //!< Source URL.
        QString filePath;                           //!< Output file (already unique).
        int threadCount = 8;                        //!< Maximum concurrent chunks.
        StrategyHint hint = StrategyHint::Auto;     //!< Caller preference.
    };

    /**
     * @brief Construct a controller for an already registered task.
     * @param taskId Registry row this controller owns.
     * @param options Transfer settings.
     * @param registry Shared task registry; must outlive the controller.
     * @param parent Optional parent QObject.
     */
    TransferController(const QString& taskId,
                       const Options& options,
                       TaskRegistry& registry,
                       QObject* parent = nullptr);
    ~TransferController() override;

    /**
     * @brief Begin the transfer. Returns immediately; work continues on the
     *        event loop.
     * @return false when the task was already started.
     */
    bool start();

    /**
     * @brief Stop all streams, keeping flushed bytes.
     * @return false unless the task is Downloading.
     */
    bool pause();

    /**
     * @brief Continue a paused task from its recorded position.
     *
     * Fails synchronously (and moves the task to Error) when the server is
     * already known not to support byte ranges or the total size was never
     * known. Otherwise the server is re-probed; a negative answer moves the
     * task to Error later.
     *
     * @return false unless the task is Paused and resumable.
     */
    bool resume();

    /**
     * @brief Abort every stream and delete the partial file.
     * @return false when the task is already terminal.
     */
    bool cancel();

    const QString& taskId() const { return m_taskId; }
    DownloadStatus status() const { return m_status; }
    const TransferStrategy& strategy() const { return m_strategy; }
    const QString& filePath() const { return m_options.filePath; }
    qint64 totalBytes() const { return m_total; }

    //!< @brief Bytes currently on disk for this task.
    qint64 downloadedBytes() const;

    //!< @brief Change the progress sampling interval (default 500 ms).
    void setSampleIntervalMs(int ms) { m_aggregator.setIntervalMs(ms); }

    /**
     * @brief Strategy selection rule.
     *
     * Chunked only when ranges are supported, the length is positive, more
     * than one thread is configured and the caller did not ask for a single
     * stream. The chunk count never exceeds the length.
     */
    static TransferStrategy selectStrategy(const RangeCapability& capability, int threadCount, StrategyHint hint);

signals:
    void statusChanged(DownloadStatus status);
    void finished(bool success);

private:
    enum class ProbeMode {
        Fresh,      //!< First attempt (or resumed before any byte was requested).
        Resume      //!< Continue recorded progress.
    };

    void resetNetworkManager();
    void beginProbe(ProbeMode mode);
    void onProbed(const RangeCapability& capability, ProbeMode mode);
    void startFresh(const RangeCapability& capability);
    void continueTransfer(const RangeCapability& capability);

    //!< @brief Grow (or shrink) the output file to exactly bytes.
    bool preallocate(qint64 bytes);

    void startChunked();
    void onSchedulerFinished();
    void onSchedulerRangeIgnored();

    /**
     * @brief Start a single sequential GET.
     * @param offset First byte to request; >0 sends an open-ended Range.
     */
    void startSingleStream(qint64 offset);
    bool writeSingle(const QByteArray& data);

    //!< @brief Abort the probe and every stream; flush and close writers.
    void stopTransfers();

    void complete();
    void fail(const QString& reason);
    void setStatus(DownloadStatus status);

    //!< @brief Copy the current state into the registry row.
    void publish();
    void appendLog(const QString& line);

    QString m_taskId;                                   //!< Registry key.
    Options m_options;                                  //!< Transfer settings.
    TaskRegistry& m_registry;                           //!< Shared registry.

    DownloadStatus m_status = DownloadStatus::Downloading;
    bool m_started = false;                             //!< start() was called.
    bool m_transferStarted = false;                     //!< A strategy was chosen and bytes requested.
    bool m_resumed = false;                             //!< Current attempt continues recorded progress.
    int m_resumeCount = 0;                              //!< Successful resume() calls.
    QString m_error;                                    //!< Error detail when status is Error.

    TransferStrategy m_strategy = SingleStream{};       //!< Chosen strategy.
    qint64 m_total = 0;                                 //!< Known length, 0 when unknown.
    std::optional<bool> m_rangeSupported;               //!< Last probe verdict.
    qint64 m_baseBytes = 0;                             //!< Bytes before the first chunk's range.
    QVector<Chunk> m_chunks;                            //!< Chunk records kept across pauses.

    QNetworkAccessManager* m_manager = nullptr;         //!< Owned, recreated after pause.
    CapabilityProber* m_prober = nullptr;               //!< Active probe.
    ChunkScheduler* m_scheduler = nullptr;              //!< Active chunked transfer.
    QPointer<QNetworkReply> m_singleReply;              //!< Active single-stream reply.
    std::unique_ptr<QFile> m_singleFile;                //!< Single-stream writer.
    qint64 m_singleOffset = 0;                          //!< Offset of the current single request.
    qint64 m_singleWritten = 0;                         //!< Bytes on disk in single-stream mode.

    std::shared_ptr<CancellationToken> m_token;         //!< Task-wide cancellation token.
    ProgressAggregator m_aggregator;                    //!< Throughput sampler.
};

#include "transfercontroller.moc"
