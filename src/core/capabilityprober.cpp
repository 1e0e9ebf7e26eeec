module;
#include <QByteArray>
#include <QDebug>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QVariant>

module emularr.core.capabilityprober;

import emularr.utils.network_utils;

namespace utils = emularr::utils;

RangeCapability RangeCapability::fromHeaders(const QByteArray& acceptRanges, qint64 contentLength)
{
    RangeCapability capability;
    capability.contentLength = contentLength > 0 ? contentLength : 0;

    bool bytes = false;
    const QList<QByteArray> units = acceptRanges.toLower().split(',');
    for (const QByteArray& unit : units) {
        if (unit.trimmed() == "bytes") {
            bytes = true;
            break;
        }
    }
    capability.supportsRange = bytes && capability.contentLength > 0;
    return capability;
}

CapabilityProber::CapabilityProber(QNetworkAccessManager* manager, QObject* parent)
    : QObject(parent),
    m_manager(manager)
{
}

CapabilityProber::~CapabilityProber()
{
    abort();
}

void CapabilityProber::probe(const QUrl& url)
{
    abort();

    QNetworkRequest req = utils::makeTransferRequest(url);
    req.setTransferTimeout(kTimeoutMs);

    QNetworkReply* reply = m_manager->head(req);
    m_reply = reply;
    utils::relaxTlsVerification(reply);

    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        if (reply != m_reply) {
            reply->deleteLater();
            return;
        }
        m_reply = nullptr;
        reply->deleteLater();

        if (reply->error() != QNetworkReply::NoError) {
            qDebug() << "HEAD failed, assuming no range support:" << reply->errorString();
            RangeCapability unknown;
            unknown.probeFailed = true;
            emit probed(unknown);
            return;
        }

        const QVariant cl = reply->header(QNetworkRequest::ContentLengthHeader);
        const qint64 length = cl.isValid() ? cl.toLongLong() : 0;
        const RangeCapability capability = RangeCapability::fromHeaders(reply->rawHeader("Accept-Ranges"), length);
        qDebug() << "HEAD" << reply->url() << "length" << capability.contentLength
                 << "ranges" << capability.supportsRange;
        emit probed(capability);
    });
}

void CapabilityProber::abort()
{
    if (!m_reply) return;
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    QObject::disconnect(reply, nullptr, this, nullptr);
    reply->abort();
    reply->deleteLater();
}
