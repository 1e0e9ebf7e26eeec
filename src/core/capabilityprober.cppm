/*!
 * @file        capabilityprober.cppm
 * @brief       Metadata-only probe for size and byte-range support.
 * @details     Issues a HEAD request and reports whether the resource can be
 *              fetched in byte ranges and how large it is. Probing never
 *              fails loudly: any network problem simply yields "no range
 *              support, unknown size", which downgrades the transfer to a
 *              single stream.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <QObject>
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QUrl>

#ifndef Q_MOC_RUN
export module emularr.core.capabilityprober;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Result of a capability probe.
 */
EMULARR_MODULE_EXPORT struct RangeCapability {
    bool supportsRange = false;     //!< Server accepts byte ranges and reports a size.
    qint64 contentLength = 0;       //!< Reported size, 0 when unknown.
    bool probeFailed = false;       //!< The HEAD request itself failed; nothing is known.

    /**
     * @brief Classifies raw response headers.
     *
     * Range support requires both an Accept-Ranges value listing "bytes"
     * and a positive length.
     *
     * @param acceptRanges Raw Accept-Ranges header value (may be empty).
     * @param contentLength Parsed Content-Length, or <= 0 when absent.
     */
    static RangeCapability fromHeaders(const QByteArray& acceptRanges, qint64 contentLength);
};

/**
 * @brief Asynchronous HEAD prober.
 *
 * One probe at a time; starting a new probe aborts the previous one.
 * The probe has a bounded transfer timeout, unlike data transfers.
 */
EMULARR_MODULE_EXPORT class CapabilityProber : public QObject {

    Q_OBJECT

public:
    //!< @brief Probe timeout in milliseconds.
    static constexpr int kTimeoutMs = 30000;

    /**
     * @brief Construct a prober.
     * @param manager Network access manager used for the request (not owned).
     * @param parent Optional parent QObject.
     */
    explicit CapabilityProber(QNetworkAccessManager* manager, QObject* parent = nullptr);
    ~CapabilityProber() override;

    /**
     * @brief Start probing a URL.
     *
     * Emits probed() exactly once unless abort() is called first.
     */
    void probe(const QUrl& url);

    //!< @brief Abort an in-flight probe without emitting probed().
    void abort();

    //!< @brief Whether a probe is in flight.
    bool isRunning() const { return !m_reply.isNull(); }

signals:
    /**
     * @brief Emitted when the probe completes or fails.
     * @param capability Probe outcome; {false, 0} with probeFailed set on any failure.
     */
    void probed(const RangeCapability& capability);

private:
    QNetworkAccessManager* m_manager = nullptr;     //!< Borrowed network manager.
    QPointer<QNetworkReply> m_reply;                //!< In-flight HEAD reply.
};

#include "capabilityprober.moc"
