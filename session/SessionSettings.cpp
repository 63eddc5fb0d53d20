#include "SessionSettings.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QSettings>

QString SessionSettings::defaultWorkerProgram() {
    return QDir(QCoreApplication::applicationDirPath()).filePath("transmit-worker");
}

SessionSettings SessionSettings::load() {
    SessionSettings out;
    QSettings s("Transmit", "Transmit");
    out.workerProgram =
        s.value("Worker/program", defaultWorkerProgram()).toString();
    out.workerArguments = s.value("Worker/arguments").toStringList();
    out.idleTimeoutMs = s.value("Session/idleTimeoutMs", out.idleTimeoutMs).toInt();
    out.authTimeoutMs = s.value("Session/authTimeoutMs", out.authTimeoutMs).toInt();
    if (out.idleTimeoutMs <= 0)
        out.idleTimeoutMs = 5 * 60 * 1000;
    if (out.authTimeoutMs <= 0)
        out.authTimeoutMs = 30 * 1000;
    return out;
}
