#ifndef TVDECK_TEXTFETCHER_H
#define TVDECK_TEXTFETCHER_H

#include "core/PlaybackEngine.h"

#include <QString>
#include <QUrl>

#include <functional>

// Network collaborator: GET a URL as text. Exactly one of the two handlers
// runs, always on the thread that owns the fetcher.
class TextFetcher {
public:
    typedef std::function<void(const QString& text)> TextHandler;
    typedef std::function<void(const QString& message)> ErrorHandler;

    virtual ~TextFetcher() {}

    virtual void fetchText(const QUrl& url, const HttpHeaders& headers,
                           const TextHandler& onText, const ErrorHandler& onError) = 0;
};

#endif // TVDECK_TEXTFETCHER_H
