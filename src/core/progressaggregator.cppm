/*!
 * @file        progressaggregator.cppm
 * @brief       Periodic throughput and ETA sampling for a download task.
 * @details     The aggregator polls a byte counter on a fixed interval and
 *              turns consecutive readings into speed and remaining-time
 *              estimates. It knows nothing about chunks or files; the owner
 *              supplies the counter as a callable.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <functional>
#include <QObject>
#include <QTimer>
#include <QElapsedTimer>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module emularr.core.progressaggregator;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief One throughput reading.
 */
EMULARR_MODULE_EXPORT struct ProgressSample {
    qint64 downloadedBytes = 0;     //!< Cumulative bytes at sampling time.
    qint64 bytesPerSecond = 0;      //!< Throughput since the previous sample.
    qint64 etaSeconds = -1;         //!< Remaining time, -1 when indeterminate.
    double fraction = -1.0;         //!< downloaded/total, -1 when total is unknown.
};

/**
 * @brief Samples a byte counter every interval and emits sampled().
 */
EMULARR_MODULE_EXPORT class ProgressAggregator : public QObject {

    Q_OBJECT

public:
    //!< @brief Source of the cumulative byte count.
    using ByteSource = std::function<qint64()>;

    //!< @brief Default sampling interval in milliseconds.
    static constexpr int kDefaultIntervalMs = 500;

    explicit ProgressAggregator(QObject* parent = nullptr);

    /**
     * @brief Begin sampling.
     * @param source Callable returning the bytes on disk so far.
     * @param totalBytes Expected total, 0 when unknown.
     */
    void start(ByteSource source, qint64 totalBytes);

    //!< @brief Stop sampling. The last sample stays readable.
    void stop();

    //!< @brief Update the expected total (learned after start).
    void setTotalBytes(qint64 totalBytes) { m_total = totalBytes; }

    bool isRunning() const { return m_timer.isActive(); }

    void setIntervalMs(int ms);
    int intervalMs() const { return m_timer.interval(); }

    const ProgressSample& lastSample() const { return m_last; }

    /**
     * @brief Pure sampling rule.
     * @param previousBytes Counter at the previous sample.
     * @param bytes Counter now.
     * @param elapsedMs Time between the two readings.
     * @param totalBytes Expected total, 0 when unknown.
     */
    static ProgressSample compute(qint64 previousBytes, qint64 bytes, qint64 elapsedMs, qint64 totalBytes);

signals:
    void sampled(const ProgressSample& sample);

private:
    void onTick();

    QTimer m_timer;                 //!< Sampling timer.
    QElapsedTimer m_clock;          //!< Time since the previous sample.
    ByteSource m_source;            //!< Byte counter.
    qint64 m_total = 0;             //!< Expected total bytes.
    qint64 m_previousBytes = 0;     //!< Counter at the previous sample.
    ProgressSample m_last;          //!< Most recent sample.
};

#include "progressaggregator.moc"
