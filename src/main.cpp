#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include <cerrno>
#include <cstdio>
#include <optional>

#include "models/publickey.h"
#include "models/sendoptions.h"
#include "services/errorhandler.h"
#include "services/keyauthorizer.h"
#include "services/processrunner.h"
#include "services/workerpool.h"
#include "utils/logging.h"
#include "version.h"

namespace {

constexpr int ExitUsage = 2;

int usageError(QCommandLineParser &parser, const QString &message)
{
    QTextStream(stderr) << message << "\n\n" << parser.helpText();
    return ExitUsage;
}

// Re-parses the command line once the command-specific options are known
bool parseCommand(QCommandLineParser &parser, const QCoreApplication &app, int *exitCode)
{
    if (!parser.parse(app.arguments())) {
        *exitCode = usageError(parser, parser.errorText());
        return false;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(0);
    }
    mercurio::verboseLogging = parser.isSet(QStringLiteral("verbose"));
    return true;
}

int send(QCommandLineParser &parser, const QCoreApplication &app, ErrorHandler &errors)
{
    parser.clearPositionalArguments();
    parser.setApplicationDescription("Send one or many files over the network");
    parser.addPositionalArgument("send", "Send files.", "send");
    parser.addPositionalArgument("paths", "File(s) or director{y,ies} to send.", "PATH...");
    parser.addPositionalArgument("destination", "Destination of the form 'user@host:path'.",
                                 "DESTINATION");

    QCommandLineOption jobsOption(QStringList() << "j" << "jobs",
                                  "Number of parallel transfers (default: number of CPUs).",
                                  "N");
    parser.addOption(jobsOption);

    int exitCode = 0;
    if (!parseCommand(parser, app, &exitCode)) {
        return exitCode;
    }

    QStringList arguments = parser.positionalArguments();
    arguments.removeFirst();
    if (arguments.size() < 2) {
        return usageError(parser, "send: expected at least one PATH and a DESTINATION");
    }
    const QString destination = arguments.takeLast();

    SendOptions options = SendOptions::load();
    if (parser.isSet(jobsOption)) {
        bool ok = false;
        const int jobs = parser.value(jobsOption).toInt(&ok);
        if (!ok || jobs < 1) {
            return usageError(parser, QString("send: invalid number of jobs '%1'")
                                          .arg(parser.value(jobsOption)));
        }
        options.workerCount = jobs;
    }

    ProcessRunner runner;
    WorkerPool pool(&runner, options);
    const std::optional<TransferError> error = pool.run(arguments, destination);
    if (error) {
        errors.handleTransferError(*error);
        return 1;
    }

    LOG_VERBOSE() << "Sent" << pool.transferredCount() << "file(s) to" << destination;
    return 0;
}

int authorize(QCommandLineParser &parser, const QCoreApplication &app, ErrorHandler &errors)
{
    QSettings settings;

    parser.clearPositionalArguments();
    parser.setApplicationDescription("Authorize the owner of a given public key to write "
                                     "(and read) data under a specific directory");
    parser.addPositionalArgument("authorize", "Authorize a key.", "authorize");
    parser.addPositionalArgument("keyfile", "Public key to authorize.", "KEYFILE");

    QCommandLineOption destdirOption(
        QStringList() << "d" << "destdir",
        "Path where the owner of the key will be able to write (and read) data. "
        "It defaults to ~/mercurio/<owner>. If the owner of the key is not provided on "
        "the command line, and cannot be guessed, the command will fail.",
        "TEMPLATE",
        settings.value("keys/destinationTemplate",
                       KeyAuthorizer::defaultDestinationTemplate()).toString());
    QCommandLineOption ownerOption(
        QStringList() << "o" << "owner",
        "A string identifying the owner of the public key. If no value is provided, "
        "mercurio will try to guess one from the comment in the key file.",
        "OWNER");
    parser.addOption(destdirOption);
    parser.addOption(ownerOption);

    int exitCode = 0;
    if (!parseCommand(parser, app, &exitCode)) {
        return exitCode;
    }

    const QStringList arguments = parser.positionalArguments();
    if (arguments.size() != 2) {
        return usageError(parser, "authorize: expected exactly one KEYFILE");
    }

    QString error;
    const PublicKey key = PublicKey::fromFile(arguments.at(1), &error);
    if (!key.isValid()) {
        errors.handleValidationError(error);
        return ExitUsage;
    }

    KeyAuthorizer authorizer(settings.value("keys/authorizedKeysPath",
                                            KeyAuthorizer::defaultAuthorizedKeysPath()).toString());
    const KeyAuthorizer::AuthorizeResult result =
        authorizer.authorize(key, parser.value(ownerOption), parser.value(destdirOption));

    QTextStream out(stdout);
    switch (result.status) {
    case KeyAuthorizer::Status::Success:
        if (result.ownerGuessed) {
            out << "Guessed the owner of the key: " << result.owner << '\n';
        }
        return 0;
    case KeyAuthorizer::Status::OwnerUnknown:
        errors.handleValidationError(result.errorString);
        return EINVAL;
    case KeyAuthorizer::Status::KeyAlreadyPresent:
        errors.handleValidationError(result.errorString);
        return EEXIST;
    case KeyAuthorizer::Status::NoMatchingKey:
    case KeyAuthorizer::Status::IoError:
        break;
    }
    errors.handleOperationFailed("authorize", result.errorString);
    return 1;
}

int revoke(QCommandLineParser &parser, const QCoreApplication &app, ErrorHandler &errors)
{
    QSettings settings;

    parser.clearPositionalArguments();
    parser.setApplicationDescription("Revoke a previously authorized identity");
    parser.addPositionalArgument("revoke", "Revoke keys.", "revoke");

    QCommandLineOption keyFileOption(QStringList() << "k" << "key-file",
                                     "File containing the public key to revoke.", "KEYFILE");
    QCommandLineOption ownerOption(QStringList() << "o" << "owner",
                                   "Owner whose keys are to be revoked.", "OWNER");
    parser.addOption(keyFileOption);
    parser.addOption(ownerOption);

    int exitCode = 0;
    if (!parseCommand(parser, app, &exitCode)) {
        return exitCode;
    }

    if (parser.isSet(keyFileOption) == parser.isSet(ownerOption)) {
        return usageError(parser, "revoke: exactly one of --key-file and --owner is required");
    }
    if (parser.positionalArguments().size() != 1) {
        return usageError(parser, "revoke: unexpected arguments");
    }

    KeyAuthorizer authorizer(settings.value("keys/authorizedKeysPath",
                                            KeyAuthorizer::defaultAuthorizedKeysPath()).toString());

    KeyAuthorizer::RevokeResult result;
    if (parser.isSet(keyFileOption)) {
        QString error;
        const PublicKey key = PublicKey::fromFile(parser.value(keyFileOption), &error);
        if (!key.isValid()) {
            errors.handleValidationError(error);
            return ExitUsage;
        }
        result = authorizer.revokeKey(key);
    } else {
        result = authorizer.revokeOwner(parser.value(ownerOption));
    }

    QTextStream out(stdout);
    switch (result.status) {
    case KeyAuthorizer::Status::NoMatchingKey:
        out << "No matching key found\n";
        return 0;
    case KeyAuthorizer::Status::Success:
        out << "Revoked " << result.revoked.size() << " key(s):\n";
        for (const AuthorizedKeyEntry &entry : result.revoked) {
            out << entry.toString() << '\n';
        }
        return 0;
    case KeyAuthorizer::Status::OwnerUnknown:
    case KeyAuthorizer::Status::KeyAlreadyPresent:
    case KeyAuthorizer::Status::IoError:
        break;
    }
    errors.handleOperationFailed("revoke", result.errorString);
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("mercurio");
    app.setApplicationVersion(MERCURIO_VERSION);
    app.setOrganizationName("mercurio");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("A file transfer tool");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    parser.addPositionalArgument("command",
                                 "One of:\n"
                                 "  send       sends a list of files over the network\n"
                                 "  authorize  inserts an entry in authorized_keys\n"
                                 "  revoke     removes entries from authorized_keys",
                                 "<command> [<args>]");

    // First pass only identifies the command, its own options are added below
    if (!parser.parse(app.arguments())) {
        const QStringList positional = parser.positionalArguments();
        if (positional.isEmpty()) {
            return usageError(parser, parser.errorText());
        }
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    const QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString() : positional.first();

    ErrorHandler errors;
    if (command == QLatin1String("send")) {
        return send(parser, app, errors);
    }
    if (command == QLatin1String("authorize")) {
        return authorize(parser, app, errors);
    }
    if (command == QLatin1String("revoke")) {
        return revoke(parser, app, errors);
    }

    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(0);
    }
    return usageError(parser, command.isEmpty() ? QString("Choose an action")
                                                : QString("Unknown command '%1'").arg(command));
}
