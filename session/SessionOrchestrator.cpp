#include "SessionOrchestrator.hpp"
#include "transmit/LineProtocol.hpp"
#include "transmit/RuntimeLogging.hpp"
#include <QDir>
#include <QLoggingCategory>
#include <utility>

Q_LOGGING_CATEGORY(tmSession, "transmit.session")

namespace protocol = transmit::protocol;

SessionOrchestrator::SessionOrchestrator(const ServerConfig* config,
                                         const SelectionStore* selections,
                                         SessionSettings settings, QObject* parent)
    : QObject(parent), config_(config), selections_(selections),
      settings_(std::move(settings)) {
    const QString program = settings_.workerProgram.isEmpty()
                                ? SessionSettings::defaultWorkerProgram()
                                : settings_.workerProgram;
    factory_ = [program]() -> std::unique_ptr<WorkerProcess> {
        return std::make_unique<QProcessWorker>(program);
    };

    idleTimer_.setSingleShot(true);
    authTimer_.setSingleShot(true);
    connect(&idleTimer_, &QTimer::timeout, this, &SessionOrchestrator::onIdleTimeout);
    connect(&authTimer_, &QTimer::timeout, this, &SessionOrchestrator::onAuthTimeout);
}

SessionOrchestrator::~SessionOrchestrator() {
    idleTimer_.stop();
    authTimer_.stop();
    if (worker_) {
        QObject::disconnect(worker_.get(), nullptr, this, nullptr);
        if (phase_ == SessionPhase::Active)
            worker_->sendLine(QString::fromLatin1(protocol::kExitCommand));
    }
}

ConnectionStatus SessionOrchestrator::connectionStatus() const {
    ConnectionStatus st;
    st.ready = phase_ == SessionPhase::Active;
    st.connecting = phase_ != SessionPhase::Active &&
                    phase_ != SessionPhase::Disconnected;
    return st;
}

quint64 SessionOrchestrator::enqueue(QueuedOperation::Kind kind,
                                     const QString& localPath,
                                     const QString& workingRoot, QString* why) {
    const QString root = SelectionStore::normalizeRoot(workingRoot);
    QString err;
    const auto target = resolveTarget(*config_, *selections_, root, &err);
    if (!target || !mapToRemote(*target, localPath, root, &err)) {
        qCWarning(tmSession) << "Rejected" << operationKindName(kind) << localPath
                             << ":" << err;
        if (why)
            *why = err;
        return 0;
    }

    const quint64 id =
        queue_.enqueue(kind, SelectionStore::normalizeRoot(localPath), root);
    lastRoot_ = root;
    qCDebug(tmSession) << "Queued" << operationKindName(kind) << "#" << id
                       << localPath;
    emit queueChanged();

    ensureConnection([this]() { processNext(); });
    if (why)
        why->clear();
    return id;
}

bool SessionOrchestrator::cancel(quint64 id) {
    if (!queue_.cancel(id))
        return false;
    emit queueChanged();
    return true;
}

int SessionOrchestrator::clearPending() {
    const int removed = queue_.clearPending();
    if (removed > 0)
        emit queueChanged();
    return removed;
}

QString SessionOrchestrator::currentRoot() const {
    if (const QueuedOperation* head = queue_.head())
        return head->workingRoot;
    return lastRoot_;
}

SessionOrchestrator::ConnectResult
SessionOrchestrator::ensureConnection(std::function<void()> callback) {
    if (phase_ == SessionPhase::Active) {
        resetIdleTimer();
        if (callback)
            callback();
        return ConnectResult::Ready;
    }
    if (phase_ != SessionPhase::Disconnected)
        return ConnectResult::Busy;

    const QString root = currentRoot();
    QString why;
    std::optional<ResolvedTarget> target;
    if (!root.isEmpty())
        target = resolveTarget(*config_, *selections_, root, &why);
    if (!target) {
        if (why.isEmpty())
            why = QStringLiteral("No working root to connect for");
        failAttempt(why);
        return ConnectResult::NoConfiguration;
    }

    std::unique_ptr<WorkerProcess> worker = factory_ ? factory_() : nullptr;
    if (!worker) {
        failAttempt(QStringLiteral("No worker available"));
        return ConnectResult::NoConfiguration;
    }

    const quint64 gen = ++generation_;
    connect(worker.get(), &WorkerProcess::lineReceived, this,
            [this, gen](const QString& line) { onWorkerLine(gen, line); });
    connect(worker.get(), &WorkerProcess::finished, this,
            [this, gen](int code, bool crashed) { onWorkerFinished(gen, code, crashed); });
    connect(worker.get(), &WorkerProcess::failedToStart, this,
            [this, gen](const QString& reason) { onWorkerFailedToStart(gen, reason); });

    worker_ = std::move(worker);
    target_ = std::move(target);
    exitRequested_ = false;
    reachedActive_ = false;
    lastFailure_.clear();
    pendingCallback_ = std::move(callback);

    qCInfo(tmSession) << "Connecting to" << target_->serverName << "("
                      << target_->credentials.host << ")";
    setPhase(SessionPhase::AwaitingHost);
    authGeneration_ = gen;
    authTimer_.start(settings_.authTimeoutMs);

    QStringList args = settings_.workerArguments;
    args << QStringLiteral("--port") << QString::number(target_->credentials.port);
    worker_->start(args);
    return ConnectResult::Started;
}

void SessionOrchestrator::disconnectSession() {
    if (!worker_ || phase_ == SessionPhase::Disconnected)
        return;
    exitRequested_ = true;
    if (phase_ == SessionPhase::Active) {
        sendLine(QString::fromLatin1(protocol::kExitCommand));
    } else {
        // Mid-handshake the worker would read "exit" as a credential.
        worker_->kill();
    }
}

void SessionOrchestrator::processNext() {
    // Once exit is on the wire the worker reads nothing else.
    while (phase_ == SessionPhase::Active && !exitRequested_) {
        const QueuedOperation* head = queue_.head();
        if (!head || head->processing)
            return;

        QString why;
        const auto target = resolveTarget(*config_, *selections_, head->workingRoot, &why);
        std::optional<QString> remote;
        if (target)
            remote = mapToRemote(*target, head->localPath, head->workingRoot, &why);
        if (!remote) {
            const auto dropped = queue_.dropHead();
            qCWarning(tmSession) << "Dropping #" << dropped->id << ":" << why;
            emit queueChanged();
            emit operationFinished(dropped->id, false, why);
            continue;
        }

        if (target->serverName != target_->serverName ||
            target->credentials != target_->credentials) {
            qCInfo(tmSession) << "Switching session from" << target_->serverName
                              << "to" << target->serverName;
            retireWorker(false);
            resetSessionState();
            ensureConnection([this]() { processNext(); });
            return;
        }

        queue_.markHeadProcessing();
        inFlightRemoteBase_ = target->remoteBase;
        std::vector<std::string> words;
        if (head->kind == QueuedOperation::Kind::Upload) {
            words = {protocol::kUploadCommand, head->localPath.toStdString(),
                     remote->toStdString()};
        } else {
            words = {protocol::kRemoveCommand, remote->toStdString()};
        }
        qCInfo(tmSession) << "Sending" << operationKindName(head->kind) << "#"
                          << head->id << "->" << *remote;
        sendLine(QString::fromStdString(protocol::formatCommand(words)));
        emit queueChanged();
        return;
    }
}

void SessionOrchestrator::onWorkerLine(quint64 generation, const QString& line) {
    if (generation != generation_)
        return;
    qCDebug(tmWorker) << "<" << line;

    if (phase_ == SessionPhase::Active) {
        handleActiveLine(line);
        return;
    }
    if (phase_ == SessionPhase::Disconnected || !target_)
        return;

    if (const auto st = protocol::parseStatusLine(line.toStdString()); st && !st->ok)
        lastFailure_ = QString::fromStdString(st->message);

    const HandshakeStep step = Handshake::advance(phase_, line, target_->credentials);
    if (step.reply)
        sendLine(*step.reply, step.sensitive);
    if (step.next != phase_)
        setPhase(step.next);
    if (!step.connected)
        return;

    authTimer_.stop();
    reachedActive_ = true;
    qCInfo(tmSession) << "Session active on" << target_->serverName;
    resetIdleTimer();
    auto callback = std::move(pendingCallback_);
    pendingCallback_ = nullptr;
    if (callback)
        callback();
    processNext();
}

void SessionOrchestrator::handleActiveLine(const QString& line) {
    const std::string raw = line.toStdString();
    if (const auto p = protocol::parseProgressLine(raw)) {
        progress_.file = relativeToBase(QString::fromStdString(p->file));
        progress_.percent = p->percent;
        emit progressChanged();
        return;
    }
    if (!protocol::isTerminalStatus(raw))
        return;

    const auto done = queue_.retireHead();
    if (!done) {
        qCDebug(tmSession) << "Status with nothing in flight:" << line;
        return;
    }
    const auto st = protocol::parseStatusLine(raw);
    const bool ok = st && st->ok;
    const QString message = st ? QString::fromStdString(st->message) : line;
    if (ok)
        qCInfo(tmSession) << operationKindName(done->kind) << "#" << done->id << "done";
    else
        qCWarning(tmSession) << operationKindName(done->kind) << "#" << done->id
                             << "failed:" << message;

    inFlightRemoteBase_.clear();
    clearProgress();
    resetIdleTimer();
    emit queueChanged();
    emit operationFinished(done->id, ok, message);
    processNext();
}

void SessionOrchestrator::onWorkerFinished(quint64 generation, int exitCode,
                                           bool crashed) {
    if (generation != generation_)
        return;
    const bool requested = exitRequested_;
    const bool wasActive = reachedActive_;

    if (worker_) {
        WorkerProcess* w = worker_.release();
        QObject::disconnect(w, nullptr, this, nullptr);
        w->deleteLater();
    }
    resetSessionState();

    if (requested) {
        qCInfo(tmSession) << "Worker exited";
        return;
    }
    if (wasActive) {
        const QString msg =
            QString("Worker exited unexpectedly (exit code %1%2), reconnecting")
                .arg(exitCode)
                .arg(crashed ? QStringLiteral(", crashed") : QString());
        qCWarning(tmSession).noquote() << msg;
        emit warning(msg);
        ensureConnection([this]() { processNext(); });
        return;
    }
    failAttempt(lastFailure_.isEmpty()
                    ? QString("Worker exited before the session was ready (exit code %1)")
                          .arg(exitCode)
                    : lastFailure_);
}

void SessionOrchestrator::onWorkerFailedToStart(quint64 generation,
                                                const QString& reason) {
    if (generation != generation_)
        return;
    if (worker_) {
        WorkerProcess* w = worker_.release();
        QObject::disconnect(w, nullptr, this, nullptr);
        w->deleteLater();
    }
    resetSessionState();
    failAttempt(QString("Could not start worker: %1").arg(reason));
}

void SessionOrchestrator::onIdleTimeout() {
    if (idleGeneration_ != generation_ || phase_ != SessionPhase::Active)
        return;
    if (queue_.headProcessing()) {
        resetIdleTimer();
        return;
    }
    qCInfo(tmSession) << "Closing idle session";
    retireWorker(false);
    resetSessionState();
}

void SessionOrchestrator::onAuthTimeout() {
    if (authGeneration_ != generation_ || phase_ == SessionPhase::Active ||
        phase_ == SessionPhase::Disconnected)
        return;
    const QString reason =
        QString("Authentication timed out after %1 ms").arg(settings_.authTimeoutMs);
    retireWorker(true);
    resetSessionState();
    failAttempt(reason);
}

void SessionOrchestrator::retireWorker(bool kill) {
    if (!worker_)
        return;
    WorkerProcess* w = worker_.release();
    QObject::disconnect(w, nullptr, this, nullptr);
    if (kill) {
        w->kill();
        w->deleteLater();
        return;
    }
    if (phase_ == SessionPhase::Active && w->isRunning()) {
        w->sendLine(QString::fromLatin1(protocol::kExitCommand));
        w->setParent(this);
        connect(w, &WorkerProcess::finished, w, &QObject::deleteLater);
        connect(w, &WorkerProcess::failedToStart, w, &QObject::deleteLater);
    } else {
        w->kill();
        w->deleteLater();
    }
}

void SessionOrchestrator::resetSessionState() {
    idleTimer_.stop();
    authTimer_.stop();
    pendingCallback_ = nullptr;
    inFlightRemoteBase_.clear();
    exitRequested_ = false;
    reachedActive_ = false;
    clearProgress();
    const bool hadInFlight = queue_.headProcessing();
    queue_.resetProcessing();
    setPhase(SessionPhase::Disconnected);
    if (hadInFlight)
        emit queueChanged();
}

void SessionOrchestrator::failAttempt(const QString& reason) {
    qCWarning(tmSession).noquote() << "Connection attempt failed:" << reason;
    emit connectionFailed(reason);
}

void SessionOrchestrator::sendLine(const QString& line, bool sensitive) {
    if (!worker_)
        return;
    if (sensitive)
        qCDebug(tmWorker) << ">"
                            << QString::fromStdString(transmit::redacted(line.toStdString()));
    else
        qCDebug(tmWorker) << ">" << line;
    worker_->sendLine(line);
}

void SessionOrchestrator::setPhase(SessionPhase phase) {
    if (phase_ == phase)
        return;
    qCDebug(tmSession) << "Phase" << sessionPhaseName(phase_) << "->"
                       << sessionPhaseName(phase);
    phase_ = phase;
    const ConnectionStatus st = connectionStatus();
    emit connectionStatusChanged(st.ready, st.connecting);
}

void SessionOrchestrator::resetIdleTimer() {
    idleGeneration_ = generation_;
    idleTimer_.start(settings_.idleTimeoutMs);
}

void SessionOrchestrator::clearProgress() {
    if (!progress_.file && !progress_.percent)
        return;
    progress_ = ProgressSnapshot{};
    emit progressChanged();
}

QString SessionOrchestrator::relativeToBase(const QString& remoteFile) const {
    QString base = inFlightRemoteBase_;
    while (base.size() > 1 && base.endsWith(QLatin1Char('/')))
        base.chop(1);
    if (base.isEmpty())
        return remoteFile;
    if (base == QLatin1String("/"))
        return remoteFile.startsWith(QLatin1Char('/')) ? remoteFile.mid(1) : remoteFile;
    if (remoteFile.startsWith(base + QLatin1Char('/')))
        return remoteFile.mid(base.size() + 1);
    return remoteFile;
}
