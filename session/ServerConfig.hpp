// Server/remote configuration and per-working-root selections.
#pragma once
#include "transmit/TransferTypes.hpp"
#include <QMap>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

struct ServerCredentials {
    QString host;
    quint16 port = 22;
    QString username;
    QString identityFile;
    QString password;
    transmit::AuthMethod authMethod = transmit::AuthMethod::PrivateKey;

    bool operator==(const ServerCredentials& o) const {
        return host == o.host && port == o.port && username == o.username &&
               identityFile == o.identityFile && password == o.password &&
               authMethod == o.authMethod;
    }
    bool operator!=(const ServerCredentials& o) const { return !(*this == o); }
};

struct ServerEntry {
    QString name;
    ServerCredentials credentials;
    QMap<QString, QString> remotes; // remote name -> base remote path
};

// Read-only view of the servers JSON document.
class ServerConfig {
public:
    bool loadFromFile(const QString& path, QString* why = nullptr);
    bool loadFromJson(const QByteArray& json, QString* why = nullptr);

    const ServerEntry* server(const QString& name) const;
    QStringList serverNames() const { return servers_.keys(); }

private:
    QMap<QString, ServerEntry> servers_;
};

struct RootSelection {
    QString serverName;
    QString remoteName;
};

// Persisted mapping local working root -> (server, remote).
class SelectionStore {
public:
    explicit SelectionStore(QString path = defaultPath());

    static QString defaultPath();
    static QString normalizeRoot(const QString& root);

    const QString& path() const { return path_; }

    // A missing file is an empty store.
    bool load(QString* why = nullptr);
    bool save(QString* why = nullptr) const;

    std::optional<RootSelection> selectionFor(const QString& root) const;
    // serverName "none" clears the root's selection.
    void setSelection(const QString& root, const QString& serverName,
                      const QString& remoteName = QString());

private:
    QString path_;
    QMap<QString, RootSelection> selections_;
};

struct ResolvedTarget {
    QString serverName;
    QString remoteName;
    ServerCredentials credentials;
    QString remoteBase;
};

// Looks up the selection for `root` and the server/remote it names.
std::optional<ResolvedTarget> resolveTarget(const ServerConfig& config,
                                            const SelectionStore& selections,
                                            const QString& root,
                                            QString* why = nullptr);

// remote base + path of `localPath` relative to `root`.
std::optional<QString> mapToRemote(const ResolvedTarget& target,
                                   const QString& localPath,
                                   const QString& root, QString* why = nullptr);
