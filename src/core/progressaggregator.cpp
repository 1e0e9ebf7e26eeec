module;
#include <functional>
#include <QDebug>
#include <QTimer>
#include <QElapsedTimer>

module emularr.core.progressaggregator;

ProgressAggregator::ProgressAggregator(QObject* parent)
    : QObject(parent)
{
    m_timer.setInterval(kDefaultIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &ProgressAggregator::onTick);
}

void ProgressAggregator::start(ByteSource source, qint64 totalBytes)
{
    m_source = std::move(source);
    m_total = totalBytes;
    m_previousBytes = m_source ? m_source() : 0;
    m_last = compute(m_previousBytes, m_previousBytes, 0, m_total);
    m_clock.start();
    m_timer.start();
}

void ProgressAggregator::stop()
{
    m_timer.stop();
    m_last.bytesPerSecond = 0;
    m_last.etaSeconds = -1;
}

void ProgressAggregator::setIntervalMs(int ms)
{
    m_timer.setInterval(qMax(1, ms));
}

ProgressSample ProgressAggregator::compute(qint64 previousBytes, qint64 bytes, qint64 elapsedMs, qint64 totalBytes)
{
    ProgressSample sample;
    sample.downloadedBytes = bytes;

    const qint64 delta = bytes - previousBytes;
    if (elapsedMs > 0 && delta > 0) {
        sample.bytesPerSecond = (delta * 1000) / elapsedMs;
    }

    if (totalBytes > 0) {
        sample.fraction = qBound(0.0, static_cast<double>(bytes) / static_cast<double>(totalBytes), 1.0);
        const qint64 left = totalBytes - bytes;
        if (sample.bytesPerSecond > 0 && left >= 0) {
            sample.etaSeconds = left / sample.bytesPerSecond;
        }
    }
    return sample;
}

void ProgressAggregator::onTick()
{
    if (!m_source) return;

    const qint64 elapsed = m_clock.restart();
    const qint64 bytes = m_source();
    m_last = compute(m_previousBytes, bytes, elapsed, m_total);
    m_previousBytes = bytes;
    emit sampled(m_last);
}
