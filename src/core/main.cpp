#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QTextStream>
#include <QTimer>
#include <QLocale>
#include <memory>

import emularr.core.downloadtypes;
import emularr.core.downloadmanager;
import emularr.services.settings_store;
import emularr.services.archive_extractor;
import emularr.services.game_catalog;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

QString formatEta(qint64 seconds)
{
    if (seconds < 0) return QStringLiteral("--:--");
    return QStringLiteral("%1:%2")
        .arg(seconds / 60, 2, 10, QLatin1Char('0'))
        .arg(seconds % 60, 2, 10, QLatin1Char('0'));
}

QString statusLine(const TaskSnapshot& s)
{
    const QLocale locale;
    const QString progress = s.isIndeterminate()
        ? locale.formattedDataSize(s.downloadedBytes)
        : QStringLiteral("%1% of %2")
              .arg(s.progressFraction * 100.0, 0, 'f', 1)
              .arg(locale.formattedDataSize(s.totalBytes));
    return QStringLiteral("[%1] %2 %3  %4/s  ETA %5")
        .arg(statusToString(s.status), strategyToString(s.strategy), progress,
             locale.formattedDataSize(s.bytesPerSecond), formatEta(s.etaSeconds));
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Emularr"));
    QCoreApplication::setApplicationName(QStringLiteral("Emularr"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Download a game archive, extract it and add it to the library."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("http(s) URL of the archive."));

    const QCommandLineOption nameOpt(QStringLiteral("name"), QStringLiteral("Game name."), QStringLiteral("name"));
    const QCommandLineOption platformOpt(QStringLiteral("platform"), QStringLiteral("Platform."), QStringLiteral("platform"));
    const QCommandLineOption dirOpt(QStringLiteral("dir"), QStringLiteral("Download directory (not saved)."), QStringLiteral("dir"));
    const QCommandLineOption threadsOpt(QStringLiteral("threads"), QStringLiteral("Chunk count (not saved)."), QStringLiteral("n"));
    const QCommandLineOption singleOpt(QStringLiteral("single"), QStringLiteral("Force a single stream."));
    const QCommandLineOption noExtractOpt(QStringLiteral("no-extract"), QStringLiteral("Keep archives packed."));
    const QCommandLineOption catalogOpt(QStringLiteral("catalog"), QStringLiteral("Library JSON file."), QStringLiteral("file"));
    parser.addOptions({ nameOpt, platformOpt, dirOpt, threadsOpt, singleOpt, noExtractOpt, catalogOpt });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << parser.helpText();
        return 2;
    }

    int threads = 0;
    if (parser.isSet(threadsOpt)) {
        bool ok = false;
        threads = parser.value(threadsOpt).toInt(&ok);
        if (!ok || threads < 1) {
            err << "Invalid --threads value: " << parser.value(threadsOpt) << Qt::endl;
            return 2;
        }
    }

    SettingsStore settings;
    settings.setOverrides(parser.value(dirOpt), threads);

    ProcessArchiveExtractor extractor;
    JsonGameCatalog catalog(parser.isSet(catalogOpt) ? parser.value(catalogOpt) : JsonGameCatalog::defaultCatalogPath());

    DownloadManager manager(settings, parser.isSet(noExtractOpt) ? nullptr : &extractor, &catalog);

    GameInfo game;
    game.name = parser.value(nameOpt);
    game.platform = parser.value(platformOpt);

    const QString id = manager.startDownload(args.first(),
                                             parser.isSet(singleOpt) ? StrategyHint::SingleStream : StrategyHint::Auto,
                                             game);
    if (id.isEmpty()) {
        err << "Unsupported or invalid URL: " << args.first() << Qt::endl;
        return 2;
    }
    if (const auto s = manager.getProgress(id); s && s->status == DownloadStatus::Error) {
        err << "Download failed: " << s->errorDetail.value_or(QStringLiteral("unknown error")) << Qt::endl;
        return 1;
    }

    QTimer poll;
    poll.setInterval(500);
    QObject::connect(&poll, &QTimer::timeout, &app, [&]() {
        if (const auto s = manager.getProgress(id)) {
            out << statusLine(*s) << Qt::endl;
        }
    });
    poll.start();

    QObject::connect(&manager, &DownloadManager::taskStatusChanged, &app, [&](const QString& taskId, DownloadStatus status) {
        if (taskId != id) return;
        if (status == DownloadStatus::Error) {
            const auto s = manager.getProgress(id);
            err << "Download failed: " << (s && s->errorDetail ? *s->errorDetail : QStringLiteral("unknown error")) << Qt::endl;
            QCoreApplication::exit(1);
        }
    });
    QObject::connect(&manager, &DownloadManager::taskPostProcessed, &app, [&](const QString& taskId) {
        if (taskId != id) return;
        if (const auto s = manager.getProgress(id)) {
            out << statusLine(*s) << Qt::endl;
            out << "Saved to " << s->resolvedPath << (s->extracted ? " (extracted)" : "") << Qt::endl;
            if (!s->catalogEntryId.isEmpty()) out << "Library entry " << s->catalogEntryId << Qt::endl;
        }
        QCoreApplication::exit(0);
    });

    return app.exec();
}
