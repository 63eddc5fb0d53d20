// Handle to the worker subprocess: line-oriented stdin/stdout plus exit
// notification.
#pragma once
#include <QByteArray>
#include <QLoggingCategory>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

Q_DECLARE_LOGGING_CATEGORY(tmWorker)

class WorkerProcess : public QObject {
    Q_OBJECT
public:
    explicit WorkerProcess(QObject* parent = nullptr) : QObject(parent) {}
    ~WorkerProcess() override = default;

    virtual void start(const QStringList& arguments) = 0;
    virtual bool isRunning() const = 0;
    virtual void sendLine(const QString& line) = 0;
    virtual void kill() = 0;

signals:
    void lineReceived(const QString& line);
    void finished(int exitCode, bool crashed);
    void failedToStart(const QString& reason);
};

class QProcessWorker : public WorkerProcess {
    Q_OBJECT
public:
    explicit QProcessWorker(QString program, QObject* parent = nullptr);
    ~QProcessWorker() override;

    void start(const QStringList& arguments) override;
    bool isRunning() const override;
    void sendLine(const QString& line) override;
    void kill() override;

private:
    void onStdout();
    void onStderr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onError(QProcess::ProcessError error);
    void flushLines(QByteArray& buffer, bool toProtocol, bool all);

    QString program_;
    QProcess process_;
    QByteArray stdoutBuffer_;
    QByteArray stderrBuffer_;
};
