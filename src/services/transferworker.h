/**
 * @file transferworker.h
 * @brief Thread that drives the transfer tool for units pulled from an enumerator.
 */

#ifndef TRANSFERWORKER_H
#define TRANSFERWORKER_H

#include <QAtomicInt>
#include <QMutex>
#include <QThread>
#include <optional>

#include "models/transfererror.h"
#include "models/transferunit.h"

class IProcessRunner;
class PathEnumerator;
class TransferCommand;

/**
 * @brief State shared by every worker of one run.
 *
 * The pointers are set by the owner before the workers start and stay valid
 * until they have all finished. The counters are updated by the workers.
 */
struct WorkerContext {
    PathEnumerator *enumerator = nullptr;
    IProcessRunner *runner = nullptr;
    const TransferCommand *command = nullptr;

    QAtomicInt cancelled;    ///< Non-zero once no new transfer may start
    QAtomicInt active;       ///< Transfers currently running
    QAtomicInt transferred;  ///< Transfers completed successfully
};

/**
 * @brief Pulls units from the shared enumerator and transfers them one by one.
 *
 * The loop in run() stops when the enumerator is exhausted, when the context
 * is cancelled (checked before every pull and again before every spawn), or
 * after the first failed transfer. A failure is stored in error() and
 * announced with transferFailed(), which is emitted from the worker thread.
 *
 * transfer() may also be called directly to send a single unit on the
 * calling thread.
 */
class TransferWorker : public QThread
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a worker.
     * @param id Index of the worker in its pool, used in log output.
     * @param context Shared run state (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    TransferWorker(int id, WorkerContext *context, QObject *parent = nullptr);

    /**
     * @brief Destructor. Waits for the thread if it is still running.
     */
    ~TransferWorker() override;

    /**
     * @brief Transfers one unit synchronously.
     * @param unit The unit to transfer.
     * @return std::nullopt on success, otherwise the failure.
     */
    [[nodiscard]] std::optional<TransferError> transfer(const TransferUnit &unit);

    /**
     * @brief Returns the failure that stopped this worker, if any.
     */
    [[nodiscard]] std::optional<TransferError> error() const;

    /**
     * @brief Returns the unit being transferred right now, if any.
     */
    [[nodiscard]] std::optional<TransferUnit> currentUnit() const;

    /**
     * @brief Returns the number of units this worker transferred successfully.
     */
    [[nodiscard]] int transferredCount() const { return transferred_.loadAcquire(); }

signals:
    /**
     * @brief Emitted from the worker thread right after a unit is pulled,
     *        before the cancellation check that precedes its transfer.
     * @param unit The pulled unit.
     */
    void unitPulled(const TransferUnit &unit);

    /**
     * @brief Emitted from the worker thread when a transfer fails.
     * @param error The failure.
     */
    void transferFailed(const TransferError &error);

protected:
    void run() override;

private:
    [[nodiscard]] bool isCancelled() const;

    const int id_;
    WorkerContext *context_ = nullptr;

    QAtomicInt transferred_;

    mutable QMutex stateMutex_;
    std::optional<TransferUnit> current_;
    std::optional<TransferError> error_;
};

#endif // TRANSFERWORKER_H
