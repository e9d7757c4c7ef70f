/**
 * @file transfercommand.h
 * @brief Builds the transfer tool command line for a unit.
 */

#ifndef TRANSFERCOMMAND_H
#define TRANSFERCOMMAND_H

#include <QString>
#include <QStringList>

#include "models/sendoptions.h"
#include "models/transferunit.h"

/**
 * @brief Command line factory bound to one destination root.
 *
 * The tool is always asked to verify content by checksum (-c) and to keep
 * partially transferred files so an interrupted transfer can resume
 * (--partial). Extra arguments from SendOptions follow, then the source and
 * the destination.
 *
 * @par Example usage:
 * @code
 * TransferCommand command("backup@host:incoming", SendOptions());
 * command.arguments({"/data/run1/a.dat", "run1"});
 * // -> {"-c", "--partial", "--mkpath", "/data/run1/a.dat", "backup@host:incoming/run1/"}
 * @endcode
 */
class TransferCommand
{
public:
    /**
     * @brief Constructs a command factory.
     * @param destinationRoot Local path or user\@host:path under which units land.
     * @param options Program and extra arguments to use.
     */
    TransferCommand(const QString &destinationRoot, const SendOptions &options);

    [[nodiscard]] QString program() const { return program_; }

    /**
     * @brief Returns the arguments for transferring one unit.
     * @param unit The unit to transfer.
     */
    [[nodiscard]] QStringList arguments(const TransferUnit &unit) const;

    /**
     * @brief Returns the program followed by its arguments.
     * @param unit The unit to transfer.
     */
    [[nodiscard]] QStringList commandLine(const TransferUnit &unit) const;

    /**
     * @brief Returns the destination argument for one unit.
     * @param unit The unit to transfer.
     */
    [[nodiscard]] QString destinationFor(const TransferUnit &unit) const;

    /**
     * @brief Joins a destination root and a relative directory.
     * @param root Local path, user\@host:path or host: form.
     * @param suffix Relative directory, may be empty.
     * @return Root and suffix separated by exactly one '/', with a trailing
     *         '/' so the tool treats the result as a directory. No separator
     *         is added after a root ending in '/' or ':'.
     */
    [[nodiscard]] static QString joinDestination(const QString &root, const QString &suffix);

private:
    QString destinationRoot_;
    QString program_;
    QStringList extraArguments_;
};

#endif // TRANSFERCOMMAND_H
