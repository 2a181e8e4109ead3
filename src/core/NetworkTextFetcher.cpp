#include "core/NetworkTextFetcher.h"
#include "core/Logging.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSharedPointer>
#include <QTimer>

static const int FETCH_TIMEOUT_MS = 15000;
static const qint64 MAX_DOWNLOAD_SIZE = 10 * 1024 * 1024;

NetworkTextFetcher::NetworkTextFetcher(QObject* parent)
    : QObject(parent), m_nam(new QNetworkAccessManager(this)),
      m_timeoutMs(FETCH_TIMEOUT_MS), m_maxBytes(MAX_DOWNLOAD_SIZE) {}

void NetworkTextFetcher::fetchText(const QUrl& url, const HttpHeaders& headers,
                                   const TextHandler& onText, const ErrorHandler& onError) {
    if (!url.isValid()) {
        onError(QStringLiteral("Invalid URL: %1").arg(url.toString()));
        return;
    }

    QNetworkRequest req;
    req.setUrl(url);
    req.setAttribute(QNetworkRequest::FollowRedirectsAttribute, true);
    for (int i = 0; i < headers.size(); ++i)
        req.setRawHeader(headers[i].first, headers[i].second);

    QNetworkReply* reply = m_nam->get(req);
    qCDebug(lcPlaylist) << "GET" << url.toString();

    QSharedPointer<qint64> received(new qint64(0));
    QSharedPointer<bool> tooLarge(new bool(false));
    QSharedPointer<bool> timedOut(new bool(false));
    const qint64 maxBytes = m_maxBytes;

    QTimer* timeout = new QTimer(reply);
    timeout->setSingleShot(true);
    connect(timeout, &QTimer::timeout, reply, [reply, timedOut]() {
        if (!reply->isRunning()) return;
        *timedOut = true;
        reply->abort();
    });
    timeout->start(m_timeoutMs);

    connect(reply, &QNetworkReply::readyRead, reply, [reply, received, tooLarge, maxBytes]() {
        *received = reply->bytesAvailable();
        if (*received > maxBytes) {
            *tooLarge = true;
            reply->abort();
        }
    });

    connect(reply, &QNetworkReply::finished, this, [reply, timeout, tooLarge, timedOut, onText, onError]() {
        timeout->stop();
        reply->deleteLater();

        if (*tooLarge) {
            onError(QStringLiteral("Response too large."));
            return;
        }
        if (*timedOut) {
            qCWarning(lcPlaylist) << "fetch timed out:" << reply->url().toString();
            onError(QStringLiteral("Request timed out."));
            return;
        }
        if (reply->error() != QNetworkReply::NoError) {
            qCWarning(lcPlaylist) << "fetch failed:" << reply->url().toString() << reply->errorString();
            onError(reply->errorString());
            return;
        }
        QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (status.isValid()) {
            int code = status.toInt();
            if (code < 200 || code >= 300) {
                onError(QStringLiteral("HTTP %1 %2").arg(code)
                        .arg(reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString()));
                return;
            }
        }
        onText(QString::fromUtf8(reply->readAll()));
    });
}
