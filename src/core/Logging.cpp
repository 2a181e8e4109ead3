#include "core/Logging.h"

Q_LOGGING_CATEGORY(lcPlaylist, "tvdeck.playlist", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCatalog, "tvdeck.catalog", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlayback, "tvdeck.playback", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEngine, "tvdeck.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSurface, "tvdeck.surface", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "tvdeck.config", QtInfoMsg)
