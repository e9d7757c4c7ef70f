/**
 * @file iprocessrunner.h
 * @brief Interface for running external programs to completion.
 *
 * This interface allows dependency injection of the process layer, so the
 * transfer pipeline can be exercised without spawning the real transfer tool.
 */

#ifndef IPROCESSRUNNER_H
#define IPROCESSRUNNER_H

#include <QString>
#include <QStringList>

/**
 * @brief How a program run ended.
 */
struct ProcessResult {
    bool started = false;   ///< False if the program could not be launched
    bool crashed = false;   ///< True if the program did not exit normally
    int exitCode = -1;      ///< Exit code, meaningful only for a normal exit
    QString errorString;    ///< Description from the process layer on failure

    /// True if the program ran and exited with status 0
    [[nodiscard]] bool succeeded() const { return started && !crashed && exitCode == 0; }
};

/**
 * @brief Abstract interface for synchronous program execution.
 *
 * run() blocks the calling thread until the program has terminated. Standard
 * input, output and error of the program are not surfaced to the caller.
 *
 * Implementations must allow run() to be called from several threads at the
 * same time.
 *
 * @par Example usage:
 * @code
 * // Production code
 * std::unique_ptr<IProcessRunner> runner = std::make_unique<ProcessRunner>();
 *
 * // Test code
 * std::unique_ptr<IProcessRunner> runner = std::make_unique<MockProcessRunner>();
 *
 * ProcessResult result = runner->run("rsync", {"-c", "--partial", src, dst});
 * @endcode
 */
class IProcessRunner
{
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Runs a program and waits for it to terminate.
     * @param program Program name or path, looked up in PATH if relative.
     * @param arguments Arguments passed to the program, unquoted.
     * @return How the run ended.
     */
    virtual ProcessResult run(const QString &program, const QStringList &arguments) = 0;
};

#endif // IPROCESSRUNNER_H
