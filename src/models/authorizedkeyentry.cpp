#include "authorizedkeyentry.h"

AuthorizedKeyEntry::AuthorizedKeyEntry(const PublicKey &publicKey, const QStringList &options)
    : publicKey_(publicKey)
{
    for (const QString &option : options) {
        if (!option.isEmpty()) {
            options_.append(option);
        }
    }
}

AuthorizedKeyEntry AuthorizedKeyEntry::fromLine(const QString &line, QString *error)
{
    for (const QString &header : PublicKey::supportedFormats()) {
        const qsizetype position = line.lastIndexOf(header);
        if (position < 0) {
            continue;
        }

        const QStringList options = line.left(position).trimmed().split(',');
        const PublicKey key = PublicKey::fromLine(line.mid(position), error);
        if (!key.isValid()) {
            return AuthorizedKeyEntry();
        }
        return AuthorizedKeyEntry(key, options);
    }

    if (error) {
        *error = QString("Unrecognized entry format '%1'").arg(line);
    }
    return AuthorizedKeyEntry();
}

bool AuthorizedKeyEntry::isManaged() const
{
    for (const QString &option : options_) {
        if (option.startsWith(QLatin1String(ManagedCommandPrefix))) {
            return true;
        }
    }
    return false;
}

QString AuthorizedKeyEntry::toString() const
{
    const QString text = options_.join(',') + ' ' + publicKey_.toString();
    return text.trimmed();
}
