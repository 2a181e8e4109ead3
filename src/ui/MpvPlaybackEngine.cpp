#include "ui/MpvPlaybackEngine.h"
#include "ui/VideoWidget.h"
#include "core/AdaptiveManifest.h"
#include "core/Logging.h"
#include "core/TextFetcher.h"

#include <QMetaObject>
#include <QStringList>
#include <QUrl>

#include <mpv/client.h>

MpvPlaybackEngine::MpvPlaybackEngine(TextFetcher* fetcher, QObject* parent)
    : PlaybackEngine(parent), m_mpv(nullptr), m_initialized(false), m_fetcher(fetcher),
      m_video(new VideoWidget()), m_hasSource(false), m_loaded(false), m_paused(false),
      m_cacheStalled(false), m_haveState(false), m_lastState(EngineState::Opening),
      m_volume(100), m_muted(false) {}

MpvPlaybackEngine::~MpvPlaybackEngine() {
    if (m_mpv) {
        mpv_set_wakeup_callback(m_mpv, nullptr, nullptr);
        mpv_terminate_destroy(m_mpv);
        m_mpv = nullptr;
    }
    // mpv is gone, so its window can go too.
    delete m_video.data();
}

QObject* MpvPlaybackEngine::renderTarget() const {
    return m_video.data();
}

bool MpvPlaybackEngine::ensureInitialized() {
    if (m_initialized) return true;
    if (!m_video || !m_video->parentWidget()) {
        qCWarning(lcEngine) << "engine has no host to render into";
        return false;
    }

    m_mpv = mpv_create();
    if (!m_mpv) {
        qCWarning(lcEngine) << "mpv_create failed";
        return false;
    }

    mpv_set_option_string(m_mpv, "vo", "gpu");
    mpv_set_option_string(m_mpv, "hwdec", "auto-safe");
    mpv_set_option_string(m_mpv, "gpu-context", "auto");

#ifdef Q_OS_WIN
    mpv_set_option_string(m_mpv, "ao", "wasapi,sdl,openal");
#elif defined(Q_OS_LINUX)
    mpv_set_option_string(m_mpv, "ao", "pulse,alsa,sdl");
#elif defined(Q_OS_MAC)
    mpv_set_option_string(m_mpv, "ao", "coreaudio,sdl");
#else
    mpv_set_option_string(m_mpv, "ao", "auto");
#endif

    mpv_set_option_string(m_mpv, "keep-open", "yes");
    mpv_set_option_string(m_mpv, "idle", "yes");
    mpv_set_option_string(m_mpv, "input-default-bindings", "no");
    mpv_set_option_string(m_mpv, "input-vo-keyboard", "no");
    mpv_set_option_string(m_mpv, "osc", "no");
    mpv_set_option_string(m_mpv, "osd-level", "0");

    mpv_set_option_string(m_mpv, "cache", "yes");
    mpv_set_option_string(m_mpv, "demuxer-max-bytes", "80MiB");
    mpv_set_option_string(m_mpv, "demuxer-max-back-bytes", "20MiB");
    mpv_set_option_string(m_mpv, "cache-secs", "15");
    mpv_set_option_string(m_mpv, "network-timeout", "15");
    mpv_set_option_string(m_mpv, "demuxer-lavf-analyzeduration", "2");
    mpv_set_option_string(m_mpv, "demuxer-lavf-probesize", "500000");

    int64_t wid = static_cast<int64_t>(m_video->winId());
    mpv_set_option(m_mpv, "wid", MPV_FORMAT_INT64, &wid);

    int err = mpv_initialize(m_mpv);
    if (err < 0) {
        qCWarning(lcEngine) << "mpv_initialize failed:" << mpv_error_string(err);
        mpv_terminate_destroy(m_mpv);
        m_mpv = nullptr;
        return false;
    }

    double vol = m_volume;
    mpv_set_property(m_mpv, "volume", MPV_FORMAT_DOUBLE, &vol);
    int muteFlag = m_muted ? 1 : 0;
    mpv_set_property(m_mpv, "mute", MPV_FORMAT_FLAG, &muteFlag);

    mpv_observe_property(m_mpv, 0, "pause", MPV_FORMAT_FLAG);
    mpv_observe_property(m_mpv, 0, "paused-for-cache", MPV_FORMAT_FLAG);

    mpv_set_wakeup_callback(m_mpv, [](void* ctx) {
        QMetaObject::invokeMethod(static_cast<MpvPlaybackEngine*>(ctx), "onMpvWakeup", Qt::QueuedConnection);
    }, this);

    m_initialized = true;
    return true;
}

void MpvPlaybackEngine::applyHeaders(const HttpHeaders& headers) {
    QStringList fields;
    for (int i = 0; i < headers.size(); ++i) {
        const QByteArray& name = headers[i].first;
        if (name.compare("User-Agent", Qt::CaseInsensitive) == 0) {
            mpv_set_property_string(m_mpv, "user-agent", headers[i].second.constData());
            continue;
        }
        // mpv splits the list on commas
        QString value = QString::fromUtf8(headers[i].second);
        value.replace(QLatin1Char(','), QLatin1String("\\,"));
        fields << QString::fromUtf8(name) + QLatin1String(": ") + value;
    }
    QByteArray joined = fields.join(QLatin1Char(',')).toUtf8();
    mpv_set_property_string(m_mpv, "http-header-fields", joined.constData());
}

bool MpvPlaybackEngine::loadFile(const QString& url, const HttpHeaders& headers) {
    if (!ensureInitialized()) return false;
    applyHeaders(headers);

    QByteArray urlBytes = url.toUtf8();
    const char* cmd[] = {"loadfile", urlBytes.constData(), "replace", nullptr};
    int err = mpv_command(m_mpv, cmd);
    if (err < 0) {
        qCWarning(lcEngine) << "loadfile failed:" << mpv_error_string(err);
        return false;
    }
    m_hasSource = true;
    m_loaded = false;
    m_haveState = false;
    return true;
}

void MpvPlaybackEngine::resolveAdaptive(const QString& url, const HttpHeaders& headers) {
    QPointer<MpvPlaybackEngine> self(this);
    m_fetcher->fetchText(QUrl(url), headers,
        [self, url, headers](const QString& text) {
            if (!self) return;
            if (!looksLikeAdaptiveManifest(text)) {
                emit self->adaptiveResolved(false, QStringLiteral("not an adaptive manifest"));
                return;
            }
            if (!self->loadFile(url, headers)) {
                emit self->adaptiveResolved(false, QStringLiteral("engine rejected manifest"));
                return;
            }
            emit self->adaptiveResolved(true, QString());
        },
        [self](const QString& message) {
            if (!self) return;
            emit self->adaptiveResolved(false, message);
        });
}

bool MpvPlaybackEngine::openDirect(const QString& url, const HttpHeaders& headers) {
    return loadFile(url, headers);
}

void MpvPlaybackEngine::setPauseFlag(bool paused) {
    if (!m_initialized) return;
    int flag = paused ? 1 : 0;
    int err = mpv_set_property(m_mpv, "pause", MPV_FORMAT_FLAG, &flag);
    if (err < 0) qCWarning(lcEngine) << "setting pause failed:" << mpv_error_string(err);
}

void MpvPlaybackEngine::play() { setPauseFlag(false); }
void MpvPlaybackEngine::pause() { setPauseFlag(true); }

void MpvPlaybackEngine::releaseSource() {
    if (m_initialized && m_hasSource) {
        const char* cmd[] = {"stop", nullptr};
        int err = mpv_command(m_mpv, cmd);
        if (err < 0) qCWarning(lcEngine) << "stop failed:" << mpv_error_string(err);
    }
    m_hasSource = false;
    m_loaded = false;
}

void MpvPlaybackEngine::setVolume(int volume) {
    m_volume = volume;
    if (!m_initialized) return;
    double vol = volume;
    mpv_set_property(m_mpv, "volume", MPV_FORMAT_DOUBLE, &vol);
}

void MpvPlaybackEngine::setMuted(bool muted) {
    m_muted = muted;
    if (!m_initialized) return;
    int muteFlag = muted ? 1 : 0;
    mpv_set_property(m_mpv, "mute", MPV_FORMAT_FLAG, &muteFlag);
}

void MpvPlaybackEngine::publishState() {
    EngineState state;
    if (!m_loaded) state = EngineState::Opening;
    else if (m_cacheStalled) state = EngineState::Buffering;
    else if (m_paused) state = EngineState::Paused;
    else state = EngineState::Playing;

    if (m_haveState && state == m_lastState) return;
    m_haveState = true;
    m_lastState = state;
    emit stateChanged(state);
}

void MpvPlaybackEngine::onMpvWakeup() {
    while (m_mpv) {
        mpv_event* event = mpv_wait_event(m_mpv, 0);
        if (!event || event->event_id == MPV_EVENT_NONE) break;
        switch (event->event_id) {
            case MPV_EVENT_START_FILE:
                m_loaded = false;
                publishState();
                break;
            case MPV_EVENT_FILE_LOADED:
                m_loaded = true;
                emit opened();
                publishState();
                break;
            case MPV_EVENT_PROPERTY_CHANGE: {
                mpv_event_property* prop = static_cast<mpv_event_property*>(event->data);
                if (!prop || prop->format != MPV_FORMAT_FLAG || !prop->data) break;
                bool flag = *static_cast<int*>(prop->data) != 0;
                if (qstrcmp(prop->name, "pause") == 0) m_paused = flag;
                else if (qstrcmp(prop->name, "paused-for-cache") == 0) m_cacheStalled = flag;
                if (m_loaded) publishState();
                break;
            }
            case MPV_EVENT_END_FILE: {
                mpv_event_end_file* ef = static_cast<mpv_event_end_file*>(event->data);
                if (ef && ef->reason == MPV_END_FILE_REASON_ERROR) {
                    m_hasSource = false;
                    m_loaded = false;
                    qCWarning(lcEngine) << "end of file with error:" << mpv_error_string(ef->error);
                    emit failed(ef->error, QString::fromUtf8(mpv_error_string(ef->error)));
                }
                break;
            }
            case MPV_EVENT_SHUTDOWN:
                return;
            default:
                break;
        }
    }
}
