#ifndef TVDECK_NETWORKTEXTFETCHER_H
#define TVDECK_NETWORKTEXTFETCHER_H

#include "core/TextFetcher.h"

#include <QObject>

class QNetworkAccessManager;

class NetworkTextFetcher : public QObject, public TextFetcher {
    Q_OBJECT
public:
    explicit NetworkTextFetcher(QObject* parent = nullptr);

    void fetchText(const QUrl& url, const HttpHeaders& headers,
                   const TextHandler& onText, const ErrorHandler& onError) override;

    void setTimeout(int ms) { m_timeoutMs = ms; }
    void setMaxBytes(qint64 bytes) { m_maxBytes = bytes; }

private:
    QNetworkAccessManager* m_nam;
    int m_timeoutMs;
    qint64 m_maxBytes;
};

#endif // TVDECK_NETWORKTEXTFETCHER_H
