// Serial queue of uploads/removals driven through one long-lived worker
// process. Everything runs on the Qt event loop of the owning thread.
#pragma once
#include "HandshakeMachine.hpp"
#include "OperationQueue.hpp"
#include "ServerConfig.hpp"
#include "SessionSettings.hpp"
#include "WorkerProcess.hpp"
#include <QObject>
#include <QString>
#include <QTimer>
#include <QVector>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

// Last progress report of the in-flight operation.
struct ProgressSnapshot {
    std::optional<QString> file; // relative to the remote base when under it
    std::optional<int> percent;
};

struct ConnectionStatus {
    bool ready = false;
    bool connecting = false;
};

class SessionOrchestrator : public QObject {
    Q_OBJECT
public:
    using WorkerFactory = std::function<std::unique_ptr<WorkerProcess>()>;
    enum class ConnectResult { Ready, Started, Busy, NoConfiguration };

    // config and selections are not owned and must outlive the orchestrator
    SessionOrchestrator(const ServerConfig* config, const SelectionStore* selections,
                        SessionSettings settings, QObject* parent = nullptr);
    ~SessionOrchestrator() override;

    // Defaults to a QProcessWorker running settings.workerProgram
    void setWorkerFactory(WorkerFactory factory) { factory_ = std::move(factory); }

    // Returns the new id, or 0 with `why` set when the root cannot be routed
    quint64 enqueue(QueuedOperation::Kind kind, const QString& localPath,
                    const QString& workingRoot, QString* why = nullptr);
    bool cancel(quint64 id);
    int clearPending();
    QVector<QueuedOperation> queue() const { return queue_.snapshot(); }
    ProgressSnapshot progress() const { return progress_; }
    ConnectionStatus connectionStatus() const;
    SessionPhase phase() const { return phase_; }
    quint64 generation() const { return generation_; }

    // Asks an active worker to exit; teardown happens when it does.
    void disconnectSession();
    // Never blocks: `callback` runs once the session is Active.
    ConnectResult ensureConnection(std::function<void()> callback = {});

signals:
    void queueChanged();
    void progressChanged();
    void connectionStatusChanged(bool ready, bool connecting);
    void operationFinished(quint64 id, bool ok, const QString& message);
    void connectionFailed(const QString& reason);
    void warning(const QString& message);

public slots:
    void processNext();

private:
    void onWorkerLine(quint64 generation, const QString& line);
    void onWorkerFinished(quint64 generation, int exitCode, bool crashed);
    void onWorkerFailedToStart(quint64 generation, const QString& reason);
    void onIdleTimeout();
    void onAuthTimeout();

    void handleActiveLine(const QString& line);
    void sendLine(const QString& line, bool sensitive = false);
    void setPhase(SessionPhase phase);
    void resetIdleTimer();
    void clearProgress();
    void resetSessionState();
    // Detaches the current worker; it is deleted once it has exited
    void retireWorker(bool kill);
    void failAttempt(const QString& reason);
    QString currentRoot() const;
    QString relativeToBase(const QString& remoteFile) const;

    const ServerConfig* config_;
    const SelectionStore* selections_;
    SessionSettings settings_;
    WorkerFactory factory_;

    OperationQueue queue_;
    ProgressSnapshot progress_;

    std::unique_ptr<WorkerProcess> worker_;
    SessionPhase phase_ = SessionPhase::Disconnected;
    quint64 generation_ = 0;
    std::optional<ResolvedTarget> target_;
    bool exitRequested_ = false;
    bool reachedActive_ = false;
    QString lastFailure_;
    std::function<void()> pendingCallback_;
    QString lastRoot_;
    QString inFlightRemoteBase_;

    QTimer idleTimer_;
    QTimer authTimer_;
    quint64 idleGeneration_ = 0;
    quint64 authGeneration_ = 0;
};
