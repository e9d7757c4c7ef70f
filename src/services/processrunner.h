/**
 * @file processrunner.h
 * @brief QProcess-backed implementation of IProcessRunner.
 */

#ifndef PROCESSRUNNER_H
#define PROCESSRUNNER_H

#include "iprocessrunner.h"

/**
 * @brief Runs programs with QProcess, standard streams bound to the null device.
 *
 * Each call uses its own QProcess on the calling thread, so no state is shared
 * between concurrent calls. There is no timeout: run() returns only when the
 * program has terminated.
 */
class ProcessRunner : public IProcessRunner
{
public:
    ProcessRunner() = default;
    ~ProcessRunner() override = default;

    ProcessResult run(const QString &program, const QStringList &arguments) override;
};

#endif // PROCESSRUNNER_H
