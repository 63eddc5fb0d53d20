#include "OperationQueue.hpp"

const char* operationKindName(QueuedOperation::Kind kind) {
    switch (kind) {
    case QueuedOperation::Kind::Upload:
        return "upload";
    case QueuedOperation::Kind::Remove:
        return "remove";
    }
    return "unknown";
}

quint64 OperationQueue::enqueue(QueuedOperation::Kind kind,
                                const QString& localPath,
                                const QString& workingRoot) {
    QueuedOperation op;
    op.id = nextId_++;
    op.kind = kind;
    op.localPath = localPath;
    op.workingRoot = workingRoot;
    items_.push_back(op);
    return op.id;
}

const QueuedOperation* OperationQueue::head() const {
    if (items_.isEmpty())
        return nullptr;
    return &items_.front();
}

bool OperationQueue::headProcessing() const {
    return !items_.isEmpty() && items_.front().processing;
}

bool OperationQueue::markHeadProcessing() {
    if (items_.isEmpty() || items_.front().processing)
        return false;
    items_.front().processing = true;
    return true;
}

std::optional<QueuedOperation> OperationQueue::retireHead() {
    if (!headProcessing())
        return std::nullopt;
    QueuedOperation op = items_.takeFirst();
    return op;
}

std::optional<QueuedOperation> OperationQueue::dropHead() {
    if (items_.isEmpty() || items_.front().processing)
        return std::nullopt;
    QueuedOperation op = items_.takeFirst();
    return op;
}

bool OperationQueue::cancel(quint64 id) {
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].id != id)
            continue;
        if (items_[i].processing)
            return false;
        items_.removeAt(i);
        return true;
    }
    return false;
}

int OperationQueue::clearPending() {
    int removed = 0;
    QVector<QueuedOperation> next;
    next.reserve(items_.size());
    for (const auto& op : items_) {
        if (op.processing)
            next.push_back(op);
        else
            ++removed;
    }
    items_.swap(next);
    return removed;
}

void OperationQueue::resetProcessing() {
    for (auto& op : items_)
        op.processing = false;
}
