#include "ServerConfig.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QStandardPaths>
#include <utility>

Q_LOGGING_CATEGORY(tmConfig, "transmit.config")

static const char* kNoneSelection = "none";

static bool readJsonObject(const QString& path, QJsonObject& out, QString* why) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (why)
            *why = QString("Could not open %1: %2").arg(path, f.errorString());
        return false;
    }
    const QByteArray data = f.readAll();
    f.close();

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (why)
            *why = QString("Invalid JSON in %1: %2")
                       .arg(path, perr.error != QJsonParseError::NoError
                                      ? perr.errorString()
                                      : QString("top level is not an object"));
        return false;
    }
    out = doc.object();
    return true;
}

static ServerCredentials credentialsFromJson(const QJsonObject& o) {
    ServerCredentials c;
    c.host = o.value("host").toString();
    const int port = o.value("port").toInt(22);
    c.port = (port > 0 && port <= 65535) ? quint16(port) : quint16(22);
    c.username = o.value("username").toString();
    c.identityFile = o.value("identity_file").toString();
    c.password = o.value("password").toString();

    const QString method = o.value("auth_method").toString().trimmed().toLower();
    if (method == QLatin1String("password"))
        c.authMethod = transmit::AuthMethod::Password;
    else if (method == QLatin1String("key"))
        c.authMethod = transmit::AuthMethod::PrivateKey;
    else if (!c.password.isEmpty() && c.identityFile.isEmpty())
        c.authMethod = transmit::AuthMethod::Password;
    else
        c.authMethod = transmit::AuthMethod::PrivateKey;
    return c;
}

bool ServerConfig::loadFromFile(const QString& path, QString* why) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (why)
            *why = QString("Could not open %1: %2").arg(path, f.errorString());
        return false;
    }
    QString err;
    if (!loadFromJson(f.readAll(), &err)) {
        if (why)
            *why = QString("%1: %2").arg(path, err);
        return false;
    }
    qCInfo(tmConfig) << "Loaded" << servers_.size() << "server(s) from" << path;
    return true;
}

bool ServerConfig::loadFromJson(const QByteArray& json, QString* why) {
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError) {
        if (why)
            *why = QString("Invalid JSON: %1").arg(perr.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (why)
            *why = QString("Invalid JSON: top level is not an object");
        return false;
    }

    QMap<QString, ServerEntry> parsed;
    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it.value().isObject()) {
            qCWarning(tmConfig) << "Skipping server entry" << it.key()
                                << "(not an object)";
            continue;
        }
        const QJsonObject entry = it.value().toObject();
        ServerEntry s;
        s.name = it.key();
        s.credentials = credentialsFromJson(entry.value("credentials").toObject());
        const QJsonObject remotes = entry.value("remotes").toObject();
        for (auto r = remotes.begin(); r != remotes.end(); ++r) {
            if (r.value().isString())
                s.remotes.insert(r.key(), r.value().toString());
        }
        parsed.insert(s.name, s);
    }
    servers_.swap(parsed);
    if (why)
        why->clear();
    return true;
}

const ServerEntry* ServerConfig::server(const QString& name) const {
    auto it = servers_.constFind(name);
    if (it == servers_.constEnd())
        return nullptr;
    return &it.value();
}

SelectionStore::SelectionStore(QString path) : path_(std::move(path)) {}

QString SelectionStore::defaultPath() {
    const QString base =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(base).filePath("transmit.json");
}

QString SelectionStore::normalizeRoot(const QString& root) {
    return QDir::cleanPath(QFileInfo(root).absoluteFilePath());
}

bool SelectionStore::load(QString* why) {
    selections_.clear();
    if (!QFileInfo::exists(path_)) {
        if (why)
            why->clear();
        return true;
    }
    QJsonObject root;
    if (!readJsonObject(path_, root, why))
        return false;
    for (auto it = root.begin(); it != root.end(); ++it) {
        const QJsonObject o = it.value().toObject();
        RootSelection sel;
        sel.serverName = o.value("server_name").toString();
        sel.remoteName = o.value("remote").toString();
        if (sel.serverName.isEmpty() || sel.serverName == kNoneSelection)
            continue;
        selections_.insert(normalizeRoot(it.key()), sel);
    }
    if (why)
        why->clear();
    return true;
}

bool SelectionStore::save(QString* why) const {
    QJsonObject root;
    for (auto it = selections_.begin(); it != selections_.end(); ++it) {
        QJsonObject o;
        o["server_name"] = it.value().serverName;
        o["remote"] = it.value().remoteName;
        root[it.key()] = o;
    }

    const QString dir = QFileInfo(path_).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (why)
            *why = QString("Could not create directory %1").arg(dir);
        return false;
    }
    QSaveFile f(path_);
    if (!f.open(QIODevice::WriteOnly)) {
        if (why)
            *why = QString("Could not write %1: %2").arg(path_, f.errorString());
        return false;
    }
    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        if (why)
            *why = QString("Could not write %1: %2").arg(path_, f.errorString());
        return false;
    }
    if (why)
        why->clear();
    return true;
}

std::optional<RootSelection> SelectionStore::selectionFor(const QString& root) const {
    auto it = selections_.constFind(normalizeRoot(root));
    if (it == selections_.constEnd())
        return std::nullopt;
    return it.value();
}

void SelectionStore::setSelection(const QString& root, const QString& serverName,
                                  const QString& remoteName) {
    const QString key = normalizeRoot(root);
    if (serverName.isEmpty() || serverName == kNoneSelection) {
        selections_.remove(key);
        return;
    }
    selections_.insert(key, RootSelection{serverName, remoteName});
}

std::optional<ResolvedTarget> resolveTarget(const ServerConfig& config,
                                            const SelectionStore& selections,
                                            const QString& root, QString* why) {
    const auto sel = selections.selectionFor(root);
    if (!sel) {
        if (why)
            *why = QString("No server selected for %1").arg(root);
        return std::nullopt;
    }
    const ServerEntry* server = config.server(sel->serverName);
    if (!server) {
        if (why)
            *why = QString("Unknown server: %1").arg(sel->serverName);
        return std::nullopt;
    }
    auto remote = server->remotes.constFind(sel->remoteName);
    if (remote == server->remotes.constEnd()) {
        if (why)
            *why = QString("Unknown remote '%1' for server %2")
                       .arg(sel->remoteName, sel->serverName);
        return std::nullopt;
    }
    ResolvedTarget t;
    t.serverName = server->name;
    t.remoteName = sel->remoteName;
    t.credentials = server->credentials;
    t.remoteBase = remote.value();
    return t;
}

std::optional<QString> mapToRemote(const ResolvedTarget& target,
                                   const QString& localPath,
                                   const QString& root, QString* why) {
    const QString cleanRoot = SelectionStore::normalizeRoot(root);
    const QString cleanLocal = SelectionStore::normalizeRoot(localPath);

    QString relative;
    if (cleanLocal == cleanRoot) {
        relative.clear();
    } else if (cleanRoot == QLatin1String("/")) {
        relative = cleanLocal;
    } else if (cleanLocal.startsWith(cleanRoot + QLatin1Char('/'))) {
        relative = cleanLocal.mid(cleanRoot.size());
    } else {
        if (why)
            *why = QString("%1 is outside working root %2").arg(localPath, root);
        return std::nullopt;
    }

    QString base = target.remoteBase;
    while (base.size() > 1 && base.endsWith(QLatin1Char('/')))
        base.chop(1);
    if (base == QLatin1String("/"))
        return relative.isEmpty() ? base : relative;
    if (relative.isEmpty() && base.isEmpty()) {
        if (why)
            *why = QString("Empty remote path for %1").arg(localPath);
        return std::nullopt;
    }
    return base + relative;
}
