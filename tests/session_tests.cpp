// Session orchestrator, handshake machine, queue and configuration, driven
// through a scripted in-process worker.
#include "TestContext.hpp"
#include "HandshakeMachine.hpp"
#include "OperationQueue.hpp"
#include "ServerConfig.hpp"
#include "SessionOrchestrator.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QPointer>
#include <QTemporaryDir>
#include <QTimer>

#include <memory>
#include <string>
#include <vector>

namespace {

// Records what the orchestrator sends; the test plays the worker's side.
class FakeWorker : public WorkerProcess {
public:
    QStringList arguments;
    QStringList sent;
    bool started = false;
    bool running = false;
    bool killed = false;

    void start(const QStringList &args) override {
        arguments = args;
        started = true;
        running = true;
    }
    bool isRunning() const override { return running; }
    void sendLine(const QString &line) override { sent << line; }
    void kill() override {
        killed = true;
        running = false;
    }

    void feed(const QString &line) { emit lineReceived(line); }
    void exitWith(int code, bool crashed = false) {
        running = false;
        emit finished(code, crashed);
    }
    QString lastSent() const { return sent.isEmpty() ? QString() : sent.last(); }
};

const char *kServers = R"({
  "s1": { "credentials": { "host": "h1.example", "port": 2222, "username": "deploy",
                           "identity_file": "/keys/id_s1" },
          "remotes": { "r1": "/srv/app", "r2": "/srv/other/" } },
  "s2": { "credentials": { "host": "h2.example", "username": "web",
                           "password": "pw2" },
          "remotes": { "r1": "/var/www" } }
})";

std::string str(const QString &s) { return s.toStdString(); }

void spin(int ms) {
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

struct Fixture {
    QTemporaryDir dir;
    ServerConfig config;
    std::unique_ptr<SelectionStore> selections;
    std::unique_ptr<SessionOrchestrator> orch;
    std::vector<QPointer<FakeWorker>> workers;
    std::vector<std::pair<quint64, bool>> finished;
    QStringList finishMessages;
    QStringList failures;
    QStringList warnings;

    explicit Fixture(int idleMs = 60000, int authMs = 60000) {
        QString why;
        config.loadFromJson(QByteArray(kServers), &why);
        selections = std::make_unique<SelectionStore>(dir.filePath("transmit.json"));
        selections->setSelection("/proj", "s1", "r1");
        selections->setSelection("/other", "s1", "r2");
        selections->setSelection("/site", "s2", "r1");
        selections->setSelection("/broken", "s1", "nope");

        SessionSettings settings;
        settings.idleTimeoutMs = idleMs;
        settings.authTimeoutMs = authMs;
        orch = std::make_unique<SessionOrchestrator>(&config, selections.get(), settings);
        orch->setWorkerFactory([this]() -> std::unique_ptr<WorkerProcess> {
            auto w = std::make_unique<FakeWorker>();
            workers.emplace_back(w.get());
            return w;
        });
        QObject::connect(orch.get(), &SessionOrchestrator::operationFinished,
                         [this](quint64 id, bool ok, const QString &msg) {
                             finished.emplace_back(id, ok);
                             finishMessages << msg;
                         });
        QObject::connect(orch.get(), &SessionOrchestrator::connectionFailed,
                         [this](const QString &reason) { failures << reason; });
        QObject::connect(orch.get(), &SessionOrchestrator::warning,
                         [this](const QString &msg) { warnings << msg; });
    }

    FakeWorker *worker() const {
        return workers.empty() ? nullptr : workers.back().data();
    }

    // Plays the key-auth handshake on the newest worker.
    void handshake() {
        FakeWorker *w = worker();
        w->feed("Enter SSH hostname:");
        w->feed("Enter SSH username:");
        w->feed("Authentication method (key/password):");
        w->feed("Enter path to private key:");
        w->feed("1|Connected to h1.example as deploy");
    }

    int processingCount() const {
        int n = 0;
        for (const auto &op : orch->queue())
            if (op.processing)
                ++n;
        return n;
    }
};

void test_queue_basics(TestContext &t) {
    OperationQueue q;
    const quint64 a = q.enqueue(QueuedOperation::Kind::Upload, "/p/a", "/p");
    const quint64 b = q.enqueue(QueuedOperation::Kind::Remove, "/p/b", "/p");
    const quint64 c = q.enqueue(QueuedOperation::Kind::Upload, "/p/c", "/p");
    t.check(a < b && b < c, "ids should increase");
    t.check(q.markHeadProcessing(), "head can be marked in flight");
    t.check(!q.markHeadProcessing(), "head cannot be marked twice");

    t.check(!q.cancel(a), "in-flight item cannot be cancelled");
    t.check(q.size() == 3, "refused cancel changes nothing");
    t.check(q.cancel(b), "queued item can be cancelled");
    t.check(!q.cancel(999), "unknown id cannot be cancelled");
    const auto snap = q.snapshot();
    t.check(snap.size() == 2 && snap[0].id == a && snap[1].id == c,
            "cancel keeps the order of the rest");

    t.check(!q.dropHead(), "in-flight head is not dropped");
    q.enqueue(QueuedOperation::Kind::Upload, "/p/d", "/p");
    t.check(q.clearPending() == 2, "clearPending removes everything queued");
    t.check(q.size() == 1 && q.head()->id == a, "only the in-flight item remains");
    q.resetProcessing();
    t.check(!q.headProcessing(), "resetProcessing clears the flag");
    t.check(!q.retireHead(), "nothing to retire once reset");
}

void test_handshake_machine(TestContext &t) {
    ServerCredentials key;
    key.host = "h";
    key.username = "u";
    key.identityFile = "/k";
    ServerCredentials pw = key;
    pw.authMethod = transmit::AuthMethod::Password;
    pw.password = "secret";

    auto s = Handshake::advance(SessionPhase::AwaitingHost, "Enter SSH hostname:", key);
    t.check(s.next == SessionPhase::AwaitingUser && s.reply && *s.reply == "h",
            "hostname prompt answered with host");
    s = Handshake::advance(SessionPhase::AwaitingHost, "Enter SSH username:", key);
    t.check(s.next == SessionPhase::AwaitingHost && !s.reply,
            "out-of-order prompt is ignored");
    s = Handshake::advance(SessionPhase::AwaitingUser, "Enter SSH username:", key);
    t.check(s.next == SessionPhase::AwaitingCredential && s.reply && *s.reply == "u",
            "username prompt answered");
    s = Handshake::advance(SessionPhase::AwaitingCredential,
                           "Authentication method (key/password):", pw);
    t.check(s.next == SessionPhase::AwaitingCredential && s.reply &&
                *s.reply == "password",
            "auth method prompt answered without leaving the phase");
    s = Handshake::advance(SessionPhase::AwaitingCredential, "Enter path to private key:", pw);
    t.check(!s.reply, "key prompt ignored for password auth");
    s = Handshake::advance(SessionPhase::AwaitingCredential, "Enter password:", pw);
    t.check(s.next == SessionPhase::Ready && s.reply && *s.reply == "secret" && s.sensitive,
            "password prompt answered");
    s = Handshake::advance(SessionPhase::AwaitingCredential, "Enter path to private key:", key);
    t.check(s.next == SessionPhase::Ready && s.reply && *s.reply == "/k",
            "key prompt answered");
    s = Handshake::advance(SessionPhase::Ready, "0|Failed to establish SFTP session: x", key);
    t.check(s.next == SessionPhase::Ready && !s.connected, "failure does not connect");
    s = Handshake::advance(SessionPhase::Ready, "1|Connected to h as u", key);
    t.check(s.next == SessionPhase::Active && s.connected, "banner activates");
    s = Handshake::advance(SessionPhase::Active, "Enter SSH hostname:", key);
    t.check(s.next == SessionPhase::Active && !s.reply, "Active is never changed");
    s = Handshake::advance(SessionPhase::Disconnected, "1|Connected to h as u", key);
    t.check(s.next == SessionPhase::Disconnected && !s.connected,
            "Disconnected is never changed");
}

void test_config_and_mapping(TestContext &t) {
    ServerConfig config;
    QString why;
    t.check(config.loadFromJson(QByteArray(kServers), &why), "servers JSON loads");
    const ServerEntry *s1 = config.server("s1");
    const ServerEntry *s2 = config.server("s2");
    t.check(s1 && s1->credentials.port == 2222 &&
                s1->credentials.authMethod == transmit::AuthMethod::PrivateKey,
            "s1 uses key auth on port 2222");
    t.check(s2 && s2->credentials.port == 22 &&
                s2->credentials.authMethod == transmit::AuthMethod::Password,
            "password-only server defaults to password auth");
    t.check(!config.loadFromJson("{ nope", &why) && !why.isEmpty(),
            "bad JSON is reported");
    t.check(config.server("s1") != nullptr, "failed load keeps the previous config");

    QTemporaryDir dir;
    const QString path = dir.filePath("nested/transmit.json");
    SelectionStore store(path);
    t.check(store.load(&why), "missing selection file is an empty store");
    store.setSelection("/proj/", "s1", "r1");
    store.setSelection("/tmpdir", "s2", "r1");
    store.setSelection("/tmpdir", "none");
    t.check(store.save(&why), str("selections save: " + why));

    SelectionStore reloaded(path);
    t.check(reloaded.load(&why), "selections reload");
    auto sel = reloaded.selectionFor("/proj");
    t.check(sel && sel->serverName == "s1" && sel->remoteName == "r1",
            "selection survives a round trip");
    t.check(!reloaded.selectionFor("/tmpdir"), "'none' clears a root");

    auto target = resolveTarget(config, reloaded, "/proj", &why);
    t.check(target.has_value(), "target resolves");
    if (target) {
        t.check(mapToRemote(*target, "/proj/a.txt", "/proj").value_or("") ==
                    "/srv/app/a.txt",
                "file under the root maps below the base");
        t.check(mapToRemote(*target, "/proj/sub/b.txt", "/proj").value_or("") ==
                    "/srv/app/sub/b.txt",
                "nested file keeps its relative path");
        t.check(mapToRemote(*target, "/proj", "/proj").value_or("") == "/srv/app",
                "root maps to the base itself");
        t.check(!mapToRemote(*target, "/elsewhere/a.txt", "/proj", &why),
                "path outside the root is rejected");
        t.check(!mapToRemote(*target, "/project/a.txt", "/proj"),
                "sibling with a common prefix is rejected");
    }
    t.check(!resolveTarget(config, reloaded, "/unselected", &why),
            "unselected root fails");
    t.checkContains(str(why), "No server selected", "reason names the problem");
}

void test_upload_dispatch_and_progress(TestContext &t) {
    Fixture f;
    QString why;
    const quint64 id =
        f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a.txt", "/proj", &why);
    t.check(id != 0, "enqueue for a selected root succeeds");
    t.check(f.worker() && f.worker()->started, "a worker is spawned");
    t.check(f.worker() && f.worker()->arguments.contains("2222"),
            "worker receives the configured port");
    t.check(f.orch->connectionStatus().connecting, "status reports connecting");

    f.handshake();
    FakeWorker *w = f.worker();
    t.check(w->sent.size() >= 4 && w->sent[0] == "h1.example" && w->sent[1] == "deploy" &&
                w->sent[2] == "key" && w->sent[3] == "/keys/id_s1",
            "handshake answers are sent in order");
    t.check(f.orch->phase() == SessionPhase::Active, "session is active");
    t.checkEquals(str(w->lastSent()), "upload /proj/a.txt /srv/app/a.txt",
                  "worker receives the mapped upload command");
    t.check(f.processingCount() == 1, "exactly one item in flight");

    w->feed("PROGRESS|/srv/app/a.txt|42");
    const ProgressSnapshot p = f.orch->progress();
    t.check(p.file && *p.file == "a.txt" && p.percent && *p.percent == 42,
            "progress is relative to the remote base");

    w->feed("1|Upload succeeded");
    t.check(f.orch->queue().isEmpty(), "completed item is removed");
    t.check(!f.orch->progress().file && !f.orch->progress().percent,
            "progress resets after completion");
    t.check(f.finished.size() == 1 && f.finished[0].first == id && f.finished[0].second,
            "success is reported");
}

void test_serial_dispatch_and_failures(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a.txt", "/proj");
    f.orch->enqueue(QueuedOperation::Kind::Remove, "/proj/old dir", "/proj");
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/c.txt", "/proj");
    t.check(f.workers.size() == 1, "only one worker for concurrent enqueues");
    f.handshake();
    FakeWorker *w = f.worker();
    const int before = w->sent.size();
    t.check(f.processingCount() == 1, "one item in flight");

    w->feed("1|Upload succeeded");
    t.checkEquals(str(w->lastSent()), "remove \"/srv/app/old dir\"",
                  "next item is dispatched with a quoted path");
    t.check(f.processingCount() == 1, "still one item in flight");

    w->feed("0|Failed to remove directory: /srv/app/old dir");
    t.check(f.finished.size() == 2 && !f.finished[1].second, "failure is reported");
    t.checkContains(str(f.finishMessages.value(1)), "Failed to remove directory",
                    "failure message is forwarded");
    t.checkEquals(str(w->lastSent()), "upload /proj/c.txt /srv/app/c.txt",
                  "failed item is not retried");
    t.check(w->sent.size() == before + 2, "one command per completion");

    w->feed("1|Upload succeeded");
    w->feed("1|Upload succeeded");
    t.check(f.finished.size() == 3, "stray status with nothing in flight is ignored");
}

void test_enqueue_rejections(TestContext &t) {
    Fixture f;
    QString why;
    t.check(f.orch->enqueue(QueuedOperation::Kind::Upload, "/nowhere/a", "/nowhere", &why) == 0,
            "unselected root is rejected");
    t.check(!why.isEmpty(), "rejection has a reason");
    t.check(f.orch->enqueue(QueuedOperation::Kind::Upload, "/broken/a", "/broken", &why) == 0,
            "unknown remote is rejected");
    t.check(f.orch->enqueue(QueuedOperation::Kind::Upload, "/elsewhere/a", "/proj", &why) == 0,
            "path outside its root is rejected");
    t.check(f.workers.empty(), "no worker is spawned for rejected work");
    t.check(f.orch->queue().isEmpty(), "nothing is queued");
}

void test_cancel_and_clear(TestContext &t) {
    Fixture f;
    const quint64 a = f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    const quint64 b = f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/b", "/proj");
    const quint64 c = f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/c", "/proj");
    f.handshake();
    t.check(!f.orch->cancel(a), "in-flight item cannot be cancelled");
    t.check(f.orch->cancel(b), "queued item is cancelled");
    auto q = f.orch->queue();
    t.check(q.size() == 2 && q[0].id == a && q[1].id == c, "order of the rest kept");
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/d", "/proj");
    t.check(f.orch->clearPending() == 2, "clearPending drops queued items");
    t.check(f.orch->queue().size() == 1 && f.processingCount() == 1,
            "in-flight item survives clearPending");
}

void test_crash_reconnects_and_resends(TestContext &t) {
    Fixture f;
    const quint64 a = f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/b", "/proj");
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/c", "/proj");
    f.handshake();
    QPointer<FakeWorker> first = f.worker();
    const QString firstCommand = first->lastSent();

    first->exitWith(2);
    t.check(f.workers.size() == 2, "a new worker is spawned after a crash");
    t.check(f.warnings.size() == 1, "crash emits a warning");
    t.check(f.orch->queue().size() == 3 && f.processingCount() == 0,
            "all items are reset to not processing");

    f.handshake();
    t.checkEquals(str(f.worker()->lastSent()), str(firstCommand),
                  "head item is resent unchanged");
    t.check(f.orch->queue().front().id == a && f.processingCount() == 1,
            "original head is in flight again");
    t.check(f.failures.isEmpty(), "a crash is not a failed attempt");

    spin(20);
    t.check(first.isNull(), "the dead worker is deleted");
}

void test_auth_failure_does_not_respawn(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    FakeWorker *w = f.worker();
    w->feed("Enter SSH hostname:");
    w->feed("Enter SSH username:");
    w->feed("Authentication method (key/password):");
    w->feed("Enter path to private key:");
    w->feed("0|Failed to establish SFTP session: Authentication failed");
    w->exitWith(1);

    t.check(f.workers.size() == 1, "no respawn after a failed handshake");
    t.check(f.failures.size() == 1, "connectionFailed is emitted");
    t.checkContains(str(f.failures.value(0)), "Authentication failed",
                    "worker's reason is forwarded");
    t.check(f.orch->queue().size() == 1, "queue survives the failed attempt");
    t.check(f.orch->phase() == SessionPhase::Disconnected, "session is reset");

    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/b", "/proj");
    t.check(f.workers.size() == 2, "next enqueue starts a fresh attempt");
}

void test_spawn_failure(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    emit f.worker()->failedToStart("No such file or directory");
    t.check(f.failures.size() == 1, "spawn failure fails the attempt");
    t.check(f.orch->phase() == SessionPhase::Disconnected, "session is reset");
    t.check(f.orch->queue().size() == 1, "queue is intact");
}

void test_busy_and_ready(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    t.check(f.orch->ensureConnection() == SessionOrchestrator::ConnectResult::Busy,
            "second attempt while connecting is rejected");
    t.check(f.workers.size() == 1, "no second spawn");
    f.handshake();
    int calls = 0;
    t.check(f.orch->ensureConnection([&calls]() { ++calls; }) ==
                SessionOrchestrator::ConnectResult::Ready,
            "active session reports ready");
    t.check(calls == 1, "callback runs immediately when ready");
}

void test_idle_timeout_closes_session(TestContext &t) {
    Fixture f(50);
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    f.handshake();
    QPointer<FakeWorker> w = f.worker();
    spin(100);
    t.check(f.orch->phase() == SessionPhase::Active,
            "idle timer does not close a session with work in flight");

    w->feed("1|Upload succeeded");
    spin(150);
    t.check(f.orch->phase() == SessionPhase::Disconnected, "idle session is closed");
    t.check(w && w->lastSent() == "exit", "worker is asked to exit");
    t.check(f.failures.isEmpty() && f.warnings.isEmpty(), "idle close is not an error");

    if (w)
        w->exitWith(0);
    t.check(f.workers.size() == 1, "retired worker exit does not reconnect");

    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/b", "/proj");
    t.check(f.workers.size() == 2, "next enqueue spawns a fresh worker");
    spin(20);
    t.check(w.isNull(), "retired worker is deleted once it exits");
}

void test_auth_timeout(TestContext &t) {
    Fixture f(60000, 50);
    int callbacks = 0;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    QPointer<FakeWorker> w = f.worker();
    w->feed("Enter SSH hostname:");
    spin(150);
    t.check(w.isNull() || w->killed, "stalled worker is killed");
    t.check(f.orch->phase() == SessionPhase::Disconnected, "session is reset");
    t.check(f.failures.size() == 1, "timeout is reported");
    t.check(f.orch->queue().size() == 1 && f.processingCount() == 0,
            "nothing was sent and the queue is intact");

    // A later attempt whose callback must never fire.
    f.orch->clearPending();
    f.orch->ensureConnection([&callbacks]() { ++callbacks; });
    spin(150);
    t.check(callbacks == 0, "pending callback is never invoked after a timeout");
}

void test_disconnect_is_intentional(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    f.handshake();
    f.worker()->feed("1|Upload succeeded");
    f.orch->disconnectSession();
    t.checkEquals(str(f.worker()->lastSent()), "exit", "disconnect sends exit");
    t.check(f.orch->phase() == SessionPhase::Active, "teardown waits for the exit");
    f.worker()->feed("1|Exiting shell");
    f.worker()->exitWith(0);
    t.check(f.orch->phase() == SessionPhase::Disconnected, "session is down");
    t.check(f.workers.size() == 1 && f.warnings.isEmpty(), "no reconnect after disconnect");
}

void test_disconnect_holds_the_queue(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/b", "/proj");
    f.handshake();
    FakeWorker *w = f.worker();
    const int sentBefore = w->sent.size();
    f.orch->disconnectSession();
    w->feed("1|Upload succeeded");
    t.checkEquals(str(w->lastSent()), "exit", "nothing follows exit");
    t.check(w->sent.size() == sentBefore + 1, "only exit was written after disconnect");
    t.check(f.orch->queue().size() == 1, "second item is still queued");
    t.check(f.processingCount() == 0, "second item is not marked processing");
    t.check(f.finished.size() == 1, "running item still completes");
    w->feed("1|Exiting shell");
    w->exitWith(0);
    t.check(f.orch->phase() == SessionPhase::Disconnected, "session is down");
    t.check(f.workers.size() == 1 && f.warnings.isEmpty(), "no reconnect after disconnect");
    t.check(f.orch->queue().size() == 1 && f.processingCount() == 0,
            "queued item waits for the next attempt");
}

void test_server_switch(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/other/b", "/other");
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/site/index.html", "/site");
    f.handshake();
    FakeWorker *first = f.worker();
    first->feed("1|Upload succeeded");
    t.checkEquals(str(first->lastSent()), "upload /other/b /srv/other/b",
                  "same server with another remote reuses the session");
    first->feed("1|Upload succeeded");
    t.checkEquals(str(first->lastSent()), "exit", "server switch closes the session");
    t.check(f.workers.size() == 2, "a worker for the new server is spawned");

    FakeWorker *second = f.worker();
    second->feed("Enter SSH hostname:");
    second->feed("Enter SSH username:");
    second->feed("Authentication method (key/password):");
    second->feed("Enter password:");
    second->feed("1|Connected to h2.example as web");
    t.check(second->sent.size() >= 5 && second->sent[0] == "h2.example" &&
                second->sent[2] == "password" && second->sent[3] == "pw2",
            "second server uses its own credentials");
    t.checkEquals(str(second->lastSent()), "upload /site/index.html /var/www/index.html",
                  "head item goes to the new server");

    first->exitWith(0);
    t.check(f.orch->phase() == SessionPhase::Active,
            "exit of the retired worker does not affect the new session");
}

void test_stale_generation_ignored(TestContext &t) {
    Fixture f;
    f.orch->enqueue(QueuedOperation::Kind::Upload, "/proj/a", "/proj");
    f.handshake();
    QPointer<FakeWorker> first = f.worker();
    first->exitWith(2);
    t.check(f.workers.size() == 2, "reconnect started");
    if (first)
        first->feed("1|Connected to h1.example as deploy");
    t.check(f.orch->phase() == SessionPhase::AwaitingHost,
            "lines from a superseded worker are ignored");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_queue_basics(t);
    test_handshake_machine(t);
    test_config_and_mapping(t);
    test_upload_dispatch_and_progress(t);
    test_serial_dispatch_and_failures(t);
    test_enqueue_rejections(t);
    test_cancel_and_clear(t);
    test_crash_reconnects_and_resends(t);
    test_auth_failure_does_not_respawn(t);
    test_spawn_failure(t);
    test_busy_and_ready(t);
    test_idle_timeout_closes_session(t);
    test_auth_timeout(t);
    test_disconnect_is_intentional(t);
    test_disconnect_holds_the_queue(t);
    test_server_switch(t);
    test_stale_generation_ignored(t);
    return t.finish("transmit_session_tests");
}
