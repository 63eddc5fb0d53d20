// transmit: select a server/remote for a working root and push uploads or
// removals through the worker.
#include "SessionOrchestrator.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTextStream>
#include <QTimer>

Q_LOGGING_CATEGORY(tmCli, "transmit.cli")

namespace {

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& err() {
    static QTextStream s(stderr);
    return s;
}

QString defaultConfigPath() {
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation))
        .filePath("servers.json");
}

int runSelect(const QStringList& args, const ServerConfig& config,
              SelectionStore& selections, const QString& root) {
    if (args.size() == 1 && args.at(0) == QLatin1String("none")) {
        selections.setSelection(root, QStringLiteral("none"));
    } else if (args.size() == 2) {
        const ServerEntry* server = config.server(args.at(0));
        if (!server) {
            err() << "Unknown server: " << args.at(0)
                  << " (known: " << config.serverNames().join(QStringLiteral(", ")) << ")"
                  << Qt::endl;
            return 1;
        }
        if (!server->remotes.contains(args.at(1))) {
            err() << "Unknown remote '" << args.at(1) << "' for server "
                  << args.at(0) << Qt::endl;
            return 1;
        }
        selections.setSelection(root, args.at(0), args.at(1));
    } else {
        err() << "Usage: transmit select <server> <remote> | select none" << Qt::endl;
        return 1;
    }
    QString why;
    if (!selections.save(&why)) {
        err() << why << Qt::endl;
        return 1;
    }
    qCInfo(tmCli) << "Selection for" << root << "saved to" << selections.path();
    return 0;
}

int runShow(const SelectionStore& selections, const QString& root) {
    const auto sel = selections.selectionFor(root);
    if (!sel) {
        out() << "Server: none" << Qt::endl;
        return 0;
    }
    out() << "Server: " << sel->serverName << Qt::endl;
    out() << "Remote: " << sel->remoteName << Qt::endl;
    return 0;
}

int runTransfers(QCoreApplication& app, QueuedOperation::Kind kind,
                 const QStringList& paths, const ServerConfig& config,
                 const SelectionStore& selections, const QString& root) {
    SessionOrchestrator orchestrator(&config, &selections, SessionSettings::load());
    QHash<quint64, QString> pending;
    bool failed = false;
    bool draining = false;

    auto finish = [&]() {
        if (draining)
            return;
        draining = true;
        orchestrator.disconnectSession();
        if (orchestrator.phase() == SessionPhase::Disconnected)
            QTimer::singleShot(0, &app, &QCoreApplication::quit);
        // A worker that ignores "exit" must not keep the CLI alive.
        QTimer::singleShot(5000, &app, &QCoreApplication::quit);
    };

    QObject::connect(&orchestrator, &SessionOrchestrator::operationFinished, &app,
                     [&](quint64 id, bool ok, const QString& message) {
                         const QString path = pending.take(id);
                         if (ok) {
                             out() << "OK     " << path << Qt::endl;
                         } else {
                             failed = true;
                             out() << "FAILED " << path << ": " << message << Qt::endl;
                         }
                         if (pending.isEmpty())
                             finish();
                     });
    QObject::connect(&orchestrator, &SessionOrchestrator::progressChanged, &app, [&]() {
        const ProgressSnapshot p = orchestrator.progress();
        if (p.file && p.percent)
            out() << "  " << *p.file << " " << *p.percent << "%" << Qt::endl;
    });
    QObject::connect(&orchestrator, &SessionOrchestrator::connectionStatusChanged, &app,
                     [&](bool ready, bool connecting) {
                         if (draining && !ready && !connecting)
                             app.quit();
                     });
    QObject::connect(&orchestrator, &SessionOrchestrator::connectionFailed, &app,
                     [&](const QString& reason) {
                         err() << "Connection failed: " << reason << Qt::endl;
                         failed = true;
                         finish();
                     });
    QObject::connect(&orchestrator, &SessionOrchestrator::warning, &app,
                     [&](const QString& message) { err() << message << Qt::endl; });

    for (const QString& p : paths) {
        const QString local = QFileInfo(p).absoluteFilePath();
        QString why;
        const quint64 id = orchestrator.enqueue(kind, local, root, &why);
        if (id == 0) {
            failed = true;
            err() << "Cannot queue " << p << ": " << why << Qt::endl;
            continue;
        }
        pending.insert(id, p);
    }
    if (pending.isEmpty())
        return failed ? 1 : 0;
    if (!draining)
        app.exec();
    if (!pending.isEmpty())
        failed = true;
    return failed ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Transmit");
    QCoreApplication::setApplicationName("Transmit");

    QCommandLineParser parser;
    parser.setApplicationDescription("Queue SFTP uploads and removals for a working root");
    parser.addHelpOption();
    QCommandLineOption configOption("config", "Servers JSON file.", "file",
                                    defaultConfigPath());
    QCommandLineOption selectionsOption("selections", "Selection store JSON file.",
                                        "file", SelectionStore::defaultPath());
    QCommandLineOption rootOption("root", "Working root (default: current directory).",
                                  "dir", QDir::currentPath());
    parser.addOption(configOption);
    parser.addOption(selectionsOption);
    parser.addOption(rootOption);
    parser.addPositionalArgument("command", "select | show | upload | remove");
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.takeFirst();
    const QString root = SelectionStore::normalizeRoot(parser.value(rootOption));

    SelectionStore selections(parser.value(selectionsOption));
    QString why;
    if (!selections.load(&why)) {
        err() << why << Qt::endl;
        return 1;
    }
    if (command == QLatin1String("show"))
        return runShow(selections, root);

    ServerConfig config;
    if (!config.loadFromFile(parser.value(configOption), &why)) {
        err() << why << Qt::endl;
        return 1;
    }

    if (command == QLatin1String("select"))
        return runSelect(args, config, selections, root);
    if (command == QLatin1String("upload") || command == QLatin1String("remove")) {
        if (args.isEmpty()) {
            err() << "Usage: transmit " << command << " <paths...>" << Qt::endl;
            return 1;
        }
        const auto kind = command == QLatin1String("upload")
                              ? QueuedOperation::Kind::Upload
                              : QueuedOperation::Kind::Remove;
        return runTransfers(app, kind, args, config, selections, root);
    }
    err() << "Unknown command: " << command << Qt::endl;
    return 1;
}
