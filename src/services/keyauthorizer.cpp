#include "keyauthorizer.h"
#include "utils/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace {

bool templateNeedsOwner(const QString &destinationTemplate)
{
    return destinationTemplate.contains(QLatin1String("$owner"))
        || destinationTemplate.contains(QLatin1String("${owner}"));
}

} // namespace

KeyAuthorizer::KeyAuthorizer(const QString &authorizedKeysPath)
    : path_(authorizedKeysPath)
{
}

QString KeyAuthorizer::defaultAuthorizedKeysPath()
{
    return expandHome(QStringLiteral("~/.ssh/authorized_keys"));
}

QString KeyAuthorizer::defaultDestinationTemplate()
{
    return QStringLiteral("~/mercurio/$owner");
}

QString KeyAuthorizer::substituteOwner(const QString &destinationTemplate, const QString &owner)
{
    QString result = destinationTemplate;
    result.replace(QLatin1String("${owner}"), owner);
    result.replace(QLatin1String("$owner"), owner);
    return result;
}

QString KeyAuthorizer::expandHome(const QString &path)
{
    if (path != QLatin1String("~") && !path.startsWith(QLatin1String("~/"))) {
        return path;
    }
    const QString home = QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
    return home + path.mid(1);
}

KeyAuthorizer::AuthorizeResult KeyAuthorizer::authorize(const PublicKey &key,
                                                        const QString &owner,
                                                        const QString &destinationTemplate)
{
    AuthorizeResult result;
    PublicKey authorized = key;

    if (!owner.isEmpty()) {
        authorized.setOwner(owner);
    } else if (templateNeedsOwner(destinationTemplate)) {
        if (authorized.owner().isEmpty()) {
            result.status = Status::OwnerUnknown;
            result.errorString = QString("Was not able to guess the name of the key's owner which "
                                         "is required to compute the destination directory: '%1'")
                                     .arg(destinationTemplate);
            return result;
        }
        result.ownerGuessed = true;
    }
    result.owner = authorized.owner();

    const QString destination = substituteOwner(destinationTemplate, result.owner);
    result.destinationDir = expandHome(destination);

    // Only allow rrsync to be run for this key
    result.entry = AuthorizedKeyEntry(authorized, {
        QString("command=\"/bin/rrsync %1\"").arg(destination),
        QStringLiteral("no-port-forwarding"),
        QStringLiteral("no-X11-forwarding"),
        QStringLiteral("no-pty"),
    });

    QFile file(path_);
    const bool existed = file.exists();
    if (!file.open(QIODevice::ReadWrite | QIODevice::Text)) {
        result.status = Status::IoError;
        result.errorString = QString("%1: %2").arg(path_, file.errorString());
        return result;
    }
    if (!existed && !file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        qWarning().noquote() << "Failed to restrict permissions of" << path_;
    }

    const QByteArray content = file.readAll();
    if (content.contains(authorized.key().toUtf8())) {
        result.status = Status::KeyAlreadyPresent;
        result.errorString = QStringLiteral("The key provided is already being used");
        return result;
    }

    QByteArray line = result.entry.toString().toUtf8() + '\n';
    if (!content.isEmpty() && !content.endsWith('\n')) {
        line.prepend('\n');
    }
    if (file.write(line) != line.size() || !file.flush()) {
        result.status = Status::IoError;
        result.errorString = QString("%1: %2").arg(path_, file.errorString());
        return result;
    }
    file.close();

    if (!QDir().mkpath(result.destinationDir)) {
        result.status = Status::IoError;
        result.errorString = QString("Failed to create directory '%1'").arg(result.destinationDir);
        return result;
    }
    if (!QFile::setPermissions(result.destinationDir,
                               QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
                               | QFileDevice::ReadGroup | QFileDevice::ExeGroup
                               | QFileDevice::ReadOther | QFileDevice::ExeOther)) {
        qWarning().noquote() << "Failed to set permissions of" << result.destinationDir;
    }

    LOG_VERBOSE() << "KeyAuthorizer: authorized" << result.owner << "to" << result.destinationDir;
    return result;
}

KeyAuthorizer::RevokeResult KeyAuthorizer::revokeKey(const PublicKey &key)
{
    const QString keyString = key.key();
    return revoke([&keyString](const AuthorizedKeyEntry &entry) {
        return entry.publicKey().key() == keyString;
    });
}

KeyAuthorizer::RevokeResult KeyAuthorizer::revokeOwner(const QString &owner)
{
    return revoke([&owner](const AuthorizedKeyEntry &entry) {
        if (entry.publicKey().owner().isEmpty()) {
            qWarning().noquote() << "Could not guess the owner of" << entry.toString();
            return false;
        }
        return entry.publicKey().owner() == owner;
    });
}

KeyAuthorizer::RevokeResult KeyAuthorizer::revoke(
    const std::function<bool(const AuthorizedKeyEntry &)> &matches)
{
    RevokeResult result;
    const QString temporaryPath = path_ + '~';
    const QString backupPath = path_ + '-';

    QFile source(path_);
    if (!source.open(QIODevice::ReadOnly)) {
        result.status = Status::IoError;
        result.errorString = QString("%1: %2").arg(path_, source.errorString());
        return result;
    }

    QFile temporary(temporaryPath);
    if (!temporary.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        result.status = Status::IoError;
        result.errorString = QString("%1: %2").arg(temporaryPath, temporary.errorString());
        return result;
    }
    if (!temporary.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        result.status = Status::IoError;
        result.errorString = QString("%1: %2").arg(temporaryPath, temporary.errorString());
        temporary.remove();
        return result;
    }

    while (!source.atEnd()) {
        const QByteArray line = source.readLine();
        QString error;
        const AuthorizedKeyEntry entry =
            AuthorizedKeyEntry::fromLine(QString::fromUtf8(line).trimmed(), &error);

        const bool keep = !entry.isValid() || !entry.isManaged() || !matches(entry);
        if (!entry.isValid()) {
            qWarning().noquote() << error;
        }
        if (!keep) {
            result.revoked.append(entry);
            continue;
        }

        if (temporary.write(line) != line.size()) {
            result.status = Status::IoError;
            result.errorString = QString("%1: %2").arg(temporaryPath, temporary.errorString());
            temporary.remove();
            return result;
        }
    }
    source.close();

    if (!temporary.flush()) {
        result.status = Status::IoError;
        result.errorString = QString("%1: %2").arg(temporaryPath, temporary.errorString());
        temporary.remove();
        return result;
    }
    temporary.close();

    if (result.revoked.isEmpty()) {
        if (!temporary.remove()) {
            qWarning().noquote() << "Failed to remove" << temporaryPath << "-" << temporary.errorString();
        }
        result.status = Status::NoMatchingKey;
        return result;
    }

    // Backup first, the original must stay intact until the rename below
    if (QFile::exists(backupPath) && !QFile::remove(backupPath)) {
        result.status = Status::IoError;
        result.errorString = QString("Failed to remove old backup '%1'").arg(backupPath);
        temporary.remove();
        return result;
    }
    if (!QFile::copy(path_, backupPath)) {
        result.status = Status::IoError;
        result.errorString = QString("Failed to back up '%1' to '%2'").arg(path_, backupPath);
        temporary.remove();
        return result;
    }

    if (std::rename(QFile::encodeName(temporaryPath).constData(),
                    QFile::encodeName(path_).constData()) != 0) {
        result.status = Status::IoError;
        result.errorString = QString("Failed to replace '%1': %2")
                                 .arg(path_, QString::fromLocal8Bit(std::strerror(errno)));
        temporary.remove();
        return result;
    }

    LOG_VERBOSE() << "KeyAuthorizer: revoked" << result.revoked.size() << "entries from" << path_;
    return result;
}
