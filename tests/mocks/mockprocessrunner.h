/**
 * @file mockprocessrunner.h
 * @brief Mock process runner for pipeline testing.
 *
 * This mock implements IProcessRunner and can be injected into workers and
 * pools so no real transfer tool is spawned.
 */

#ifndef MOCKPROCESSRUNNER_H
#define MOCKPROCESSRUNNER_H

#include <QAtomicInt>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QSet>

#include "services/iprocessrunner.h"

/**
 * @brief Mock process runner implementing IProcessRunner for testing.
 *
 * Every call is recorded. The source argument of a call is the second to
 * last argument, as built by TransferCommand.
 *
 * @par Features:
 * - Per-source exit codes, launch failures and crashes
 * - Optional delay per call to force overlap between workers
 * - Peak concurrency tracking
 *
 * @par Example usage:
 * @code
 * MockProcessRunner runner;
 * runner.mockSetExitCode("/data/bad.dat", 23);
 *
 * WorkerPool pool(&runner);
 * std::optional<TransferError> error = pool.run({"/data"}, "host:dst");
 *
 * QCOMPARE(runner.mockInvocationCount(), 3);
 * @endcode
 */
class MockProcessRunner : public IProcessRunner
{
public:
    struct Invocation {
        QString program;
        QStringList arguments;

        [[nodiscard]] QString source() const { return arguments.value(arguments.size() - 2); }
        [[nodiscard]] QString destination() const { return arguments.value(arguments.size() - 1); }
    };

    MockProcessRunner() = default;
    ~MockProcessRunner() override = default;

    ProcessResult run(const QString &program, const QStringList &arguments) override;

    /// @name Mock Control
    /// @{
    void mockSetExitCode(const QString &source, int exitCode);
    void mockSetFailToStart(const QString &source);
    void mockSetCrash(const QString &source);
    void mockSetDelay(unsigned long milliseconds) { delayMs_ = milliseconds; }
    /// @}

    /// @name Verification
    /// @{
    [[nodiscard]] QList<Invocation> mockInvocations() const;
    [[nodiscard]] QStringList mockSources() const;
    [[nodiscard]] int mockInvocationCount() const;
    [[nodiscard]] int mockPeakConcurrency() const { return peak_.loadAcquire(); }
    /// @}

private:
    mutable QMutex mutex_;
    QList<Invocation> invocations_;
    QHash<QString, int> exitCodes_;
    QSet<QString> failToStart_;
    QSet<QString> crashes_;
    unsigned long delayMs_ = 0;

    QAtomicInt running_;
    QAtomicInt peak_;
};

#endif // MOCKPROCESSRUNNER_H
