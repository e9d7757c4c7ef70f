/**
 * @file authorizedkeyentry.h
 * @brief One entry of an SSH authorized_keys file.
 */

#ifndef AUTHORIZEDKEYENTRY_H
#define AUTHORIZEDKEYENTRY_H

#include <QString>
#include <QStringList>

#include "publickey.h"

/**
 * @brief Options list followed by a public key, as found in authorized_keys.
 *
 * Options are the comma-separated text before the key type. Empty options are
 * dropped on construction.
 */
class AuthorizedKeyEntry
{
public:
    /// Option prefix of entries written by the authorize command
    static constexpr const char *ManagedCommandPrefix = "command=\"/bin/rrsync ";

    AuthorizedKeyEntry() = default;
    explicit AuthorizedKeyEntry(const PublicKey &publicKey,
                                const QStringList &options = QStringList());

    /**
     * @brief Parses one line of an authorized_keys file.
     * @param line The line, without trailing newline.
     * @param error Receives a description on failure (may be nullptr).
     * @return The entry; invalid on failure.
     */
    [[nodiscard]] static AuthorizedKeyEntry fromLine(const QString &line, QString *error = nullptr);

    [[nodiscard]] bool isValid() const { return publicKey_.isValid(); }

    [[nodiscard]] PublicKey publicKey() const { return publicKey_; }
    [[nodiscard]] QStringList options() const { return options_; }

    /**
     * @brief Checks whether the entry restricts the key to the rrsync command.
     * @return True for entries created by the authorize command.
     */
    [[nodiscard]] bool isManaged() const;

    [[nodiscard]] QString toString() const;

private:
    PublicKey publicKey_;
    QStringList options_;
};

#endif // AUTHORIZEDKEYENTRY_H
