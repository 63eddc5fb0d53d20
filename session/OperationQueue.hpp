// FIFO of pending upload/remove operations with at most one item in flight.
#pragma once
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

// Queue element. `processing` is only ever set on the head.
struct QueuedOperation {
    enum class Kind { Upload, Remove };
    quint64 id = 0;
    Kind kind = Kind::Upload;
    QString localPath;   // local file/dir; for removals the local counterpart
    QString workingRoot; // local root the server/remote selection applies to
    bool processing = false;
};

const char* operationKindName(QueuedOperation::Kind kind);

class OperationQueue {
public:
    // Appends a new operation and returns its id (strictly increasing)
    quint64 enqueue(QueuedOperation::Kind kind, const QString& localPath,
                    const QString& workingRoot);

    int size() const { return items_.size(); }
    const QueuedOperation* head() const;
    bool headProcessing() const;

    // Marks the head as in flight; false when empty or already in flight
    bool markHeadProcessing();
    // Removes and returns the in-flight head, if any
    std::optional<QueuedOperation> retireHead();
    // Removes and returns a head that is not in flight (unroutable items)
    std::optional<QueuedOperation> dropHead();

    // Removes a queued item by id; refuses the in-flight one
    bool cancel(quint64 id);
    // Removes every item that is not in flight; returns how many
    int clearPending();
    // After a lost session: nothing is in flight anymore
    void resetProcessing();

    QVector<QueuedOperation> snapshot() const { return items_; }

private:
    QVector<QueuedOperation> items_;
    quint64 nextId_ = 1;
};
