#include "WorkerProcess.hpp"
#include <utility>

Q_LOGGING_CATEGORY(tmWorker, "transmit.worker")

QProcessWorker::QProcessWorker(QString program, QObject* parent)
    : WorkerProcess(parent), program_(std::move(program)) {
    process_.setProcessChannelMode(QProcess::SeparateChannels);
    connect(&process_, &QProcess::readyReadStandardOutput, this,
            &QProcessWorker::onStdout);
    connect(&process_, &QProcess::readyReadStandardError, this,
            &QProcessWorker::onStderr);
    connect(&process_, &QProcess::finished, this, &QProcessWorker::onFinished);
    connect(&process_, &QProcess::errorOccurred, this, &QProcessWorker::onError);
}

QProcessWorker::~QProcessWorker() {
    process_.disconnect(this);
    if (process_.state() != QProcess::NotRunning) {
        // EOF on stdin makes the worker exit on its own.
        process_.closeWriteChannel();
        if (!process_.waitForFinished(1000)) {
            process_.kill();
            process_.waitForFinished(1000);
        }
    }
}

void QProcessWorker::start(const QStringList& arguments) {
    qCDebug(tmWorker) << "Starting" << program_ << arguments;
    process_.start(program_, arguments);
}

bool QProcessWorker::isRunning() const {
    return process_.state() != QProcess::NotRunning;
}

void QProcessWorker::sendLine(const QString& line) {
    if (process_.state() != QProcess::Running) {
        qCWarning(tmWorker) << "Dropping line for a worker that is not running";
        return;
    }
    QByteArray data = line.toUtf8();
    data.append('\n');
    process_.write(data);
}

void QProcessWorker::kill() {
    if (process_.state() != QProcess::NotRunning)
        process_.kill();
}

void QProcessWorker::flushLines(QByteArray& buffer, bool toProtocol, bool all) {
    int idx;
    while ((idx = buffer.indexOf('\n')) >= 0 || (all && !buffer.isEmpty())) {
        QByteArray line;
        if (idx >= 0) {
            line = buffer.left(idx);
            buffer.remove(0, idx + 1);
        } else {
            line.swap(buffer);
        }
        if (line.endsWith('\r'))
            line.chop(1);
        if (toProtocol)
            emit lineReceived(QString::fromUtf8(line));
        else
            qCDebug(tmWorker).noquote() << "stderr:" << QString::fromUtf8(line);
    }
}

void QProcessWorker::onStdout() {
    stdoutBuffer_.append(process_.readAllStandardOutput());
    flushLines(stdoutBuffer_, true, false);
}

void QProcessWorker::onStderr() {
    stderrBuffer_.append(process_.readAllStandardError());
    flushLines(stderrBuffer_, false, false);
}

void QProcessWorker::onFinished(int exitCode, QProcess::ExitStatus status) {
    stdoutBuffer_.append(process_.readAllStandardOutput());
    flushLines(stdoutBuffer_, true, true);
    stderrBuffer_.append(process_.readAllStandardError());
    flushLines(stderrBuffer_, false, true);
    qCDebug(tmWorker) << "Worker finished, exit code" << exitCode
                      << (status == QProcess::CrashExit ? "(crashed)" : "");
    emit finished(exitCode, status == QProcess::CrashExit);
}

void QProcessWorker::onError(QProcess::ProcessError error) {
    if (error != QProcess::FailedToStart)
        return;
    qCWarning(tmWorker) << "Could not start" << program_ << ":"
                        << process_.errorString();
    emit failedToStart(process_.errorString());
}
