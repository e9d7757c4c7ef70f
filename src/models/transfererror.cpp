#include "transfererror.h"

TransferError TransferError::fromExitStatus(int exitStatus,
                                            const QStringList &command,
                                            const TransferUnit &unit)
{
    TransferError error;
    error.kind = Kind::ExitStatus;
    error.exitStatus = exitStatus;
    error.message = describeExitStatus(exitStatus);
    error.command = command;
    error.unit = unit;
    return error;
}

TransferError TransferError::failedToStart(const QString &reason,
                                           const QStringList &command,
                                           const TransferUnit &unit)
{
    TransferError error;
    error.kind = Kind::FailedToStart;
    error.exitStatus = -1;
    error.message = reason.isEmpty() ? QStringLiteral("Failed to start transfer tool") : reason;
    error.command = command;
    error.unit = unit;
    return error;
}

TransferError TransferError::crashed(const QString &reason,
                                     const QStringList &command,
                                     const TransferUnit &unit)
{
    TransferError error;
    error.kind = Kind::Crashed;
    error.exitStatus = -1;
    error.message = reason.isEmpty() ? QStringLiteral("Transfer tool terminated abnormally") : reason;
    error.command = command;
    error.unit = unit;
    return error;
}

QString TransferError::describeExitStatus(int exitStatus)
{
    // Exit values documented in rsync(1)
    switch (exitStatus) {
    case 0:
        return QStringLiteral("Success");
    case 1:
        return QStringLiteral("Syntax or usage error");
    case 2:
        return QStringLiteral("Protocol incompatibility");
    case 3:
        return QStringLiteral("Errors selecting input/output files, dirs");
    case 4:
        return QStringLiteral("Requested action not supported");
    case 5:
        return QStringLiteral("Error starting client-server protocol");
    case 6:
        return QStringLiteral("Daemon unable to append to log-file");
    case 10:
        return QStringLiteral("Error in socket I/O");
    case 11:
        return QStringLiteral("Error in file I/O");
    case 12:
        return QStringLiteral("Error in rsync protocol data stream");
    case 13:
        return QStringLiteral("Errors with program diagnostics");
    case 14:
        return QStringLiteral("Error in IPC code");
    case 20:
        return QStringLiteral("Received SIGUSR1 or SIGINT");
    case 21:
        return QStringLiteral("Some error returned by waitpid()");
    case 22:
        return QStringLiteral("Error allocating core memory buffers");
    case 23:
        return QStringLiteral("Partial transfer due to error");
    case 24:
        return QStringLiteral("Partial transfer due to vanished source files");
    case 25:
        return QStringLiteral("The --max-delete limit stopped deletions");
    case 30:
        return QStringLiteral("Timeout in data send/receive");
    case 35:
        return QStringLiteral("Timeout waiting for daemon connection");
    case 255:
        return QStringLiteral("Remote shell failed");
    default:
        return QStringLiteral("Transfer tool exited with status %1").arg(exitStatus);
    }
}

QString TransferError::commandLine() const
{
    QStringList quoted;
    quoted.reserve(command.size());
    for (const QString &argument : command) {
        if (argument.isEmpty() || argument.contains(' ') || argument.contains('\'')) {
            QString escaped = argument;
            escaped.replace('\'', QStringLiteral("'\\''"));
            quoted << QString("'%1'").arg(escaped);
        } else {
            quoted << argument;
        }
    }
    return quoted.join(' ');
}

QString TransferError::toString() const
{
    if (kind == Kind::ExitStatus) {
        return QString("%1 (exit status %2): %3").arg(message).arg(exitStatus).arg(commandLine());
    }
    return QString("%1 (%2): %3").arg(message, kindToString(kind), commandLine());
}

QString TransferError::kindToString(Kind kind)
{
    switch (kind) {
    case Kind::ExitStatus:
        return QStringLiteral("exit status");
    case Kind::FailedToStart:
        return QStringLiteral("failed to start");
    case Kind::Crashed:
        return QStringLiteral("crashed");
    }
    return QStringLiteral("unknown");
}
