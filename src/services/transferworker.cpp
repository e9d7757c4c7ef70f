#include "transferworker.h"
#include "iprocessrunner.h"
#include "pathenumerator.h"
#include "transfercommand.h"
#include "utils/logging.h"

#include <QMutexLocker>

TransferWorker::TransferWorker(int id, WorkerContext *context, QObject *parent)
    : QThread(parent)
    , id_(id)
    , context_(context)
{
    setObjectName(QString("TransferWorker-%1").arg(id));
}

TransferWorker::~TransferWorker()
{
    wait();
}

void TransferWorker::run()
{
    LOG_VERBOSE() << "TransferWorker" << id_ << "started";

    while (!isCancelled()) {
        std::optional<TransferUnit> unit = context_->enumerator->next();
        if (!unit) {
            break;
        }
        emit unitPulled(*unit);

        if (isCancelled()) {
            LOG_VERBOSE() << "TransferWorker" << id_ << "cancelled, not sending" << *unit;
            break;
        }

        std::optional<TransferError> failure = transfer(*unit);
        if (failure) {
            {
                QMutexLocker locker(&stateMutex_);
                error_ = failure;
            }
            emit transferFailed(*failure);
            break;
        }
    }

    LOG_VERBOSE() << "TransferWorker" << id_ << "finished after" << transferredCount() << "transfers";
}

std::optional<TransferError> TransferWorker::transfer(const TransferUnit &unit)
{
    const QStringList commandLine = context_->command->commandLine(unit);
    const QString program = commandLine.first();
    const QStringList arguments = commandLine.mid(1);

    {
        QMutexLocker locker(&stateMutex_);
        current_ = unit;
    }
    context_->active.ref();

    LOG_VERBOSE() << "TransferWorker" << id_ << "sending" << unit.source << "to" << arguments.last();
    const ProcessResult result = context_->runner->run(program, arguments);

    context_->active.deref();
    {
        QMutexLocker locker(&stateMutex_);
        current_.reset();
    }

    if (!result.started) {
        return TransferError::failedToStart(result.errorString, commandLine, unit);
    }
    if (result.crashed) {
        return TransferError::crashed(result.errorString, commandLine, unit);
    }
    if (result.exitCode != 0) {
        return TransferError::fromExitStatus(result.exitCode, commandLine, unit);
    }

    transferred_.ref();
    context_->transferred.ref();
    return std::nullopt;
}

std::optional<TransferError> TransferWorker::error() const
{
    QMutexLocker locker(&stateMutex_);
    return error_;
}

std::optional<TransferUnit> TransferWorker::currentUnit() const
{
    QMutexLocker locker(&stateMutex_);
    return current_;
}

bool TransferWorker::isCancelled() const
{
    return context_->cancelled.loadAcquire() != 0;
}
