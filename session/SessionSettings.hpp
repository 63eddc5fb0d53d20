// Orchestrator tunables persisted through QSettings.
#pragma once
#include <QString>
#include <QStringList>

struct SessionSettings {
    QString workerProgram;
    QStringList workerArguments;
    int idleTimeoutMs = 5 * 60 * 1000;
    int authTimeoutMs = 30 * 1000;

    static SessionSettings load();
    static QString defaultWorkerProgram();
};
