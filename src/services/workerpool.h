/**
 * @file workerpool.h
 * @brief Fixed-size pool of transfer workers sharing one path enumerator.
 */

#ifndef WORKERPOOL_H
#define WORKERPOOL_H

#include <QAtomicInt>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <optional>

#include "models/sendoptions.h"
#include "models/transfererror.h"
#include "transferworker.h"

class IProcessRunner;

/**
 * @brief Sends a set of files and directory trees with N parallel workers.
 *
 * Each call to run() builds a fresh PathEnumerator over the requested paths
 * and a fresh set of TransferWorker threads bound to it, starts them all, and
 * blocks until every worker has finished.
 *
 * Failure handling:
 * - The first failure recorded (first to fail by wall clock) becomes the
 *   result of the run. Later failures are only logged.
 * - With SendOptions::cancelOnFailure set, the first failure also cancels
 *   the run: workers finish the transfer they are running and then stop
 *   pulling. Otherwise the other workers keep going until the enumerator is
 *   exhausted or they fail themselves.
 * - Nothing is retried.
 *
 * @par Example usage:
 * @code
 * ProcessRunner runner;
 * WorkerPool pool(&runner, SendOptions::load());
 *
 * std::optional<TransferError> error = pool.run({"/data/run1"}, "user@host:incoming");
 * if (error) {
 *     qCritical() << error->toString();
 * }
 * @endcode
 */
class WorkerPool : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a worker pool.
     * @param runner Process layer used by every worker (not owned, must be thread-safe).
     * @param options Tool, arguments, default worker count and cancellation policy.
     * @param parent Optional parent QObject for memory management.
     */
    explicit WorkerPool(IProcessRunner *runner,
                        const SendOptions &options = SendOptions(),
                        QObject *parent = nullptr);

    ~WorkerPool() override;

    /**
     * @brief Transfers every file reachable from @p paths and waits for completion.
     * @param paths Files and directories to send.
     * @param destinationRoot Local path or user\@host:path receiving the files.
     * @param workerCount Number of workers, 0 for SendOptions::workerCount.
     * @return std::nullopt on success, otherwise the run's error.
     */
    [[nodiscard]] std::optional<TransferError> run(const QStringList &paths,
                                                   const QString &destinationRoot,
                                                   int workerCount = 0);

    /// @name Run State
    /// @{

    /**
     * @brief Checks if a run is in progress.
     */
    [[nodiscard]] bool isRunning() const { return running_.loadAcquire() != 0; }

    /**
     * @brief Returns the number of transfers running right now.
     */
    [[nodiscard]] int activeCount() const { return context_.active.loadAcquire(); }

    /**
     * @brief Returns the number of units transferred by the current or last run.
     */
    [[nodiscard]] int transferredCount() const { return context_.transferred.loadAcquire(); }

    /**
     * @brief Returns the number of failures seen by the current or last run.
     */
    [[nodiscard]] int failureCount() const;

    /**
     * @brief Returns the inputs the last run skipped because they do not exist.
     */
    [[nodiscard]] QStringList skippedPaths() const;
    /// @}

signals:
    /**
     * @brief Emitted when a run has started its workers.
     * @param workerCount Number of workers started.
     */
    void runStarted(int workerCount);

    /**
     * @brief Emitted when every worker of a run has finished.
     * @param success True if no transfer failed.
     */
    void runFinished(bool success);

private:
    void recordFailure(const TransferError &error);

    IProcessRunner *runner_ = nullptr;
    SendOptions options_;

    WorkerContext context_;
    QAtomicInt running_;

    mutable QMutex resultMutex_;
    std::optional<TransferError> firstError_;
    int failureCount_ = 0;
    QStringList skippedPaths_;
};

#endif // WORKERPOOL_H
