/*!
 * @file        network_utils.cppm
 * @brief       Request construction and response helpers for transfers.
 * @details     Centralizes the request options every engine request carries
 *              (user agent, identity encoding, redirect policy, per-host
 *              connection budget) and the permissive TLS handling used for
 *              archive hosts with misconfigured certificates.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <QByteArray>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module emularr.utils.network_utils;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

EMULARR_MODULE_EXPORT namespace emularr::utils {

//!< @brief Maximum number of redirect hops followed by any request.
constexpr int kMaxRedirects = 10;

/**
 * @brief Builds a GET/HEAD request with the engine's default options.
 *
 * Sets the user agent, disables content encoding so Content-Length and
 * byte ranges refer to the raw resource, and follows at most kMaxRedirects
 * redirects.
 *
 * @param url Target URL.
 * @param connectionsPerHost HTTP/1 connection budget for the host; chunked
 *        transfers pass their chunk count so all chunks run at once.
 * @return Configured request.
 */
QNetworkRequest makeTransferRequest(const QUrl& url, int connectionsPerHost = 1);

/**
 * @brief Formats a Range header value.
 * @param start First byte.
 * @param end Last byte (inclusive), or -1 for an open-ended range.
 * @return e.g. "bytes=100-199" or "bytes=100-".
 */
QByteArray rangeHeaderValue(qint64 start, qint64 end = -1);

/**
 * @brief Parses the first byte position out of a Content-Range header.
 * @param value Header value such as "bytes 100-199/1000".
 * @return The start offset, or -1 when the header is missing or malformed.
 */
qint64 contentRangeStart(const QByteArray& value);

/**
 * @brief Accepts any TLS certificate presented to this reply.
 *
 * Mirrors real-world hosting of ROM archives behind broken certificates.
 * Errors are still logged.
 */
void relaxTlsVerification(QNetworkReply* reply);

//!< @brief HTTP status code of a reply, 0 when not yet known.
int httpStatus(const QNetworkReply* reply);

} // namespace emularr::utils
