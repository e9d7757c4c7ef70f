#include "workerpool.h"
#include "pathenumerator.h"
#include "transfercommand.h"
#include "utils/logging.h"

#include <QMutexLocker>
#include <memory>
#include <vector>

WorkerPool::WorkerPool(IProcessRunner *runner, const SendOptions &options, QObject *parent)
    : QObject(parent)
    , runner_(runner)
    , options_(options)
{
}

WorkerPool::~WorkerPool() = default;

std::optional<TransferError> WorkerPool::run(const QStringList &paths,
                                             const QString &destinationRoot,
                                             int workerCount)
{
    const int count = qMax(1, workerCount > 0 ? workerCount : options_.workerCount);

    PathEnumerator enumerator(paths);
    const TransferCommand command(destinationRoot, options_);

    {
        QMutexLocker locker(&resultMutex_);
        firstError_.reset();
        failureCount_ = 0;
        skippedPaths_.clear();
    }

    context_.enumerator = &enumerator;
    context_.runner = runner_;
    context_.command = &command;
    context_.cancelled.storeRelease(0);
    context_.active.storeRelease(0);
    context_.transferred.storeRelease(0);
    running_.storeRelease(1);

    std::vector<std::unique_ptr<TransferWorker>> workers;
    workers.reserve(count);
    for (int i = 0; i < count; ++i) {
        auto worker = std::make_unique<TransferWorker>(i, &context_);
        connect(worker.get(), &TransferWorker::transferFailed,
                this, &WorkerPool::recordFailure, Qt::DirectConnection);
        workers.push_back(std::move(worker));
    }

    LOG_VERBOSE() << "WorkerPool: sending" << paths << "to" << destinationRoot
                  << "with" << count << "workers";
    for (const auto &worker : workers) {
        worker->start();
    }
    emit runStarted(count);

    for (const auto &worker : workers) {
        worker->wait();
    }
    workers.clear();

    context_.enumerator = nullptr;
    context_.command = nullptr;

    std::optional<TransferError> result;
    {
        QMutexLocker locker(&resultMutex_);
        skippedPaths_ = enumerator.skippedPaths();
        result = firstError_;
    }
    running_.storeRelease(0);

    LOG_VERBOSE() << "WorkerPool: run finished," << transferredCount() << "transferred,"
                  << failureCount() << "failed";
    emit runFinished(!result.has_value());
    return result;
}

void WorkerPool::recordFailure(const TransferError &error)
{
    QMutexLocker locker(&resultMutex_);
    ++failureCount_;

    if (!firstError_) {
        firstError_ = error;
        if (options_.cancelOnFailure) {
            context_.cancelled.storeRelease(1);
        }
        return;
    }

    qWarning().noquote() << "Additional transfer failure:" << error.toString();
}

int WorkerPool::failureCount() const
{
    QMutexLocker locker(&resultMutex_);
    return failureCount_;
}

QStringList WorkerPool::skippedPaths() const
{
    QMutexLocker locker(&resultMutex_);
    return skippedPaths_;
}
