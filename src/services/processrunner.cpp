#include "processrunner.h"
#include "utils/logging.h"

#include <QProcess>

ProcessResult ProcessRunner::run(const QString &program, const QStringList &arguments)
{
    ProcessResult result;

    QProcess process;
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());

    process.start(program, arguments);
    if (!process.waitForStarted(-1)) {
        result.errorString = process.errorString();
        LOG_VERBOSE() << "ProcessRunner: failed to start" << program << "-" << result.errorString;
        return result;
    }
    result.started = true;

    // Blocks until the program terminates, however long the transfer takes
    if (!process.waitForFinished(-1) && process.state() != QProcess::NotRunning) {
        result.crashed = true;
        result.errorString = process.errorString();
        return result;
    }

    if (process.exitStatus() == QProcess::CrashExit) {
        result.crashed = true;
        result.errorString = process.errorString();
        return result;
    }

    result.exitCode = process.exitCode();
    return result;
}
