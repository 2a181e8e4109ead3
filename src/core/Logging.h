#ifndef TVDECK_LOGGING_H
#define TVDECK_LOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPlaylist)
Q_DECLARE_LOGGING_CATEGORY(lcCatalog)
Q_DECLARE_LOGGING_CATEGORY(lcPlayback)
Q_DECLARE_LOGGING_CATEGORY(lcEngine)
Q_DECLARE_LOGGING_CATEGORY(lcSurface)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

#endif // TVDECK_LOGGING_H
