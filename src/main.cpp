#include "ui/MainWindow.h"
#include "core/AppError.h"
#include "core/Channel.h"
#include "core/Logging.h"
#include "core/OverlayState.h"
#include "core/PlaybackEngine.h"
#include "core/PlaybackState.h"
#include "core/Surface.h"

#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>

#ifdef Q_OS_WIN
#include <QtPlugin>
Q_IMPORT_PLUGIN(QWindowsIntegrationPlugin)
#endif

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("tvdeck");
    app.setOrganizationName("tvdeck");
    app.setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Live TV player for M3U playlists");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("source", "Playlist URL or path to a .m3u/.m3u8 file.", "[source]");
    QCommandLineOption verboseOption(QStringList() << "verbose", "Enable debug logging.");
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules("tvdeck.*.debug=true");

    qRegisterMetaType<Channel>();
    qRegisterMetaType<ChannelList>();
    qRegisterMetaType<AppError>();
    qRegisterMetaType<PlaybackState>();
    qRegisterMetaType<EngineState>();
    qRegisterMetaType<OverlayState>();
    qRegisterMetaType<Surface>();

    MainWindow w;
    w.show();

    const QStringList args = parser.positionalArguments();
    w.loadStartupSource(args.isEmpty() ? QString() : args.first());

    qCInfo(lcConfig) << "tvdeck started";
    return app.exec();
}
