/**
 * @file transfererror.h
 * @brief Failure of one invocation of the external transfer tool.
 */

#ifndef TRANSFERERROR_H
#define TRANSFERERROR_H

#include <QString>
#include <QStringList>

#include "models/transferunit.h"

/**
 * @brief Value describing why a unit could not be transferred.
 *
 * A TransferError is produced by a worker and handed to the pool as-is; it is
 * never retried or modified afterwards. The @c kind tag tells which of the
 * remaining fields carry information:
 * - ExitStatus: the tool ran and exited with a non-zero @c exitStatus.
 * - FailedToStart: the tool could not be launched, @c exitStatus is -1.
 * - Crashed: the tool was killed by a signal, @c exitStatus is -1.
 */
struct TransferError {
    enum class Kind { ExitStatus, FailedToStart, Crashed };

    Kind kind = Kind::ExitStatus;
    int exitStatus = -1;
    QString message;
    QStringList command;  ///< Program followed by its arguments, as attempted
    TransferUnit unit;

    /**
     * @brief Builds an error for a tool that exited with a non-zero status.
     * @param exitStatus The tool's exit code.
     * @param command The attempted command line.
     * @param unit The unit being transferred.
     */
    [[nodiscard]] static TransferError fromExitStatus(int exitStatus,
                                                      const QStringList &command,
                                                      const TransferUnit &unit);

    /**
     * @brief Builds an error for a tool that could not be launched.
     * @param reason Description reported by the process layer.
     * @param command The attempted command line.
     * @param unit The unit being transferred.
     */
    [[nodiscard]] static TransferError failedToStart(const QString &reason,
                                                     const QStringList &command,
                                                     const TransferUnit &unit);

    /**
     * @brief Builds an error for a tool that terminated abnormally.
     * @param reason Description reported by the process layer.
     * @param command The attempted command line.
     * @param unit The unit being transferred.
     */
    [[nodiscard]] static TransferError crashed(const QString &reason,
                                               const QStringList &command,
                                               const TransferUnit &unit);

    /**
     * @brief Describes a documented rsync exit code.
     * @param exitStatus The exit code.
     * @return Human-readable meaning, or a generic text for unknown codes.
     */
    [[nodiscard]] static QString describeExitStatus(int exitStatus);

    /// Command as a single shell-like line, for diagnostics
    [[nodiscard]] QString commandLine() const;

    /// One-line summary: message, status and command
    [[nodiscard]] QString toString() const;

    [[nodiscard]] static QString kindToString(Kind kind);
};

#endif // TRANSFERERROR_H
