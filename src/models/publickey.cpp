#include "publickey.h"

#include <QFile>
#include <QRegularExpression>

namespace {

// Splits at the first run of whitespace, like a single-split on spaces
QStringList splitOnce(const QString &text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QString trimmed = text.trimmed();
    const QRegularExpressionMatch match = whitespace.match(trimmed);
    if (!match.hasMatch()) {
        return trimmed.isEmpty() ? QStringList() : QStringList{trimmed};
    }
    return {trimmed.left(match.capturedStart()), trimmed.mid(match.capturedEnd())};
}

} // namespace

PublicKey::PublicKey(const QString &header, const QString &key,
                     const QString &owner, const QString &origin)
    : header_(header)
    , key_(key)
    , owner_(owner)
    , origin_(origin)
{
}

const QStringList &PublicKey::supportedFormats()
{
    static const QStringList formats = {
        QStringLiteral("ssh-rsa"),
        QStringLiteral("ssh-dss"),
        QStringLiteral("ssh-ed25519"),
        QStringLiteral("ecdsa-sha2-nistp256"),
        QStringLiteral("ecdsa-sha2-nistp384"),
        QStringLiteral("ecdsa-sha2-nistp521"),
    };
    return formats;
}

PublicKey PublicKey::fromLine(const QString &line, QString *error)
{
    const QStringList headerAndRest = splitOnce(line);
    if (headerAndRest.size() != 2) {
        if (error) {
            *error = QString("Unknown keyfile format '%1'").arg(line);
        }
        return PublicKey();
    }

    const QString &header = headerAndRest.at(0);
    if (!supportedFormats().contains(header)) {
        if (error) {
            *error = QString("Unrecognized keyfile header '%1'").arg(header);
        }
        return PublicKey();
    }

    const QStringList keyAndComment = splitOnce(headerAndRest.at(1));
    if (keyAndComment.size() < 2) {
        return PublicKey(header, keyAndComment.value(0));
    }

    const QString &comment = keyAndComment.at(1);
    const QStringList ownerAndOrigin = comment.split('@');
    if (ownerAndOrigin.size() == 2) {
        return PublicKey(header, keyAndComment.at(0), ownerAndOrigin.at(0), ownerAndOrigin.at(1));
    }
    return PublicKey(header, keyAndComment.at(0), comment);
}

PublicKey PublicKey::fromFile(const QString &path, QString *error)
{
    QString keyPath = path;
    if (!keyPath.endsWith(QLatin1String(".pub"))) {
        keyPath += QLatin1String(".pub");
    }

    QFile file(keyPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error) {
            *error = QString("%1: %2").arg(keyPath, file.errorString());
        }
        return PublicKey();
    }

    const QString line = QString::fromUtf8(file.readLine()).trimmed();
    return fromLine(line, error);
}

QString PublicKey::toString() const
{
    QString comment = owner_;
    if (!origin_.isEmpty()) {
        comment = owner_ + '@' + origin_;
    }

    if (!comment.isEmpty()) {
        return QStringList{header_, key_, comment}.join(' ');
    }
    return QStringList{header_, key_}.join(' ');
}
