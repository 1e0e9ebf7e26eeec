module;
#include <QByteArray>
#include <QDebug>
#include <QHttp1Configuration>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRegularExpression>
#include <QSslError>
#include <QtGlobal>

module emularr.utils.network_utils;

namespace emularr::utils {

QNetworkRequest makeTransferRequest(const QUrl& url, int connectionsPerHost)
{
    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setMaximumRedirectsAllowed(kMaxRedirects);
    req.setRawHeader("User-Agent", "emularr/1.0");
    req.setRawHeader("Accept", "*/*");
    req.setRawHeader("Accept-Encoding", "identity");

    if (connectionsPerHost > 1) {
        QHttp1Configuration http1;
        http1.setNumberOfConnectionsPerHost(static_cast<qsizetype>(connectionsPerHost));
        req.setHttp1Configuration(http1);
    }
    return req;
}

QByteArray rangeHeaderValue(qint64 start, qint64 end)
{
    QByteArray value = QByteArray("bytes=") + QByteArray::number(start) + '-';
    if (end >= 0) value += QByteArray::number(end);
    return value;
}

qint64 contentRangeStart(const QByteArray& value)
{
    static const QRegularExpression re(QStringLiteral("^\\s*bytes\\s+(\\d+)-(\\d+)/(\\d+|\\*)\\s*$"),
                                       QRegularExpression::CaseInsensitiveOption);
    const auto match = re.match(QString::fromLatin1(value));
    if (!match.hasMatch()) return -1;
    bool ok = false;
    const qint64 start = match.captured(1).toLongLong(&ok);
    return ok ? start : -1;
}

void relaxTlsVerification(QNetworkReply* reply)
{
#if QT_CONFIG(ssl)
    if (!reply) return;
    QObject::connect(reply, &QNetworkReply::sslErrors, reply, [reply](const QList<QSslError>& errors) {
        qWarning() << "Ignoring SSL errors for" << reply->url().host() << errors;
        reply->ignoreSslErrors();
    });
#else
    Q_UNUSED(reply)
#endif
}

int httpStatus(const QNetworkReply* reply)
{
    if (!reply) return 0;
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

} // namespace emularr::utils
