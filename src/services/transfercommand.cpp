#include "transfercommand.h"

TransferCommand::TransferCommand(const QString &destinationRoot, const SendOptions &options)
    : destinationRoot_(destinationRoot)
    , program_(options.program)
    , extraArguments_(options.extraArguments)
{
}

QStringList TransferCommand::arguments(const TransferUnit &unit) const
{
    QStringList args;
    args << QStringLiteral("-c") << QStringLiteral("--partial");
    args << extraArguments_;
    args << unit.source << destinationFor(unit);
    return args;
}

QStringList TransferCommand::commandLine(const TransferUnit &unit) const
{
    return QStringList{program_} + arguments(unit);
}

QString TransferCommand::destinationFor(const TransferUnit &unit) const
{
    return joinDestination(destinationRoot_, unit.destination);
}

QString TransferCommand::joinDestination(const QString &root, const QString &suffix)
{
    // The root is always a directory, even for bare files
    if (suffix.isEmpty()) {
        if (root.isEmpty() || root.endsWith('/') || root.endsWith(':')) {
            return root;
        }
        return root + '/';
    }

    QString relative = suffix;
    while (relative.startsWith('/')) {
        relative.remove(0, 1);
    }
    if (!relative.endsWith('/')) {
        relative += '/';
    }

    if (root.isEmpty() || root.endsWith('/') || root.endsWith(':')) {
        return root + relative;
    }
    return root + '/' + relative;
}
