/**
 * @file keyauthorizer.h
 * @brief Grants and revokes transfer access in an authorized_keys file.
 */

#ifndef KEYAUTHORIZER_H
#define KEYAUTHORIZER_H

#include <QList>
#include <QString>
#include <functional>

#include "models/authorizedkeyentry.h"
#include "models/publickey.h"

/**
 * @brief Edits an authorized_keys file on behalf of the authorize and revoke commands.
 *
 * Authorized keys are restricted to running rrsync against a per-owner
 * destination directory, without port forwarding, X11 forwarding or pty.
 *
 * Revocation only touches entries carrying that rrsync restriction; other
 * entries and unparseable lines are preserved verbatim. The new file is
 * written next to the original as `<file>~`, the original is copied to
 * `<file>-`, then `<file>~` atomically replaces the original.
 *
 * @par Example usage:
 * @code
 * KeyAuthorizer authorizer(KeyAuthorizer::defaultAuthorizedKeysPath());
 *
 * KeyAuthorizer::AuthorizeResult granted =
 *     authorizer.authorize(key, QString(), "~/mercurio/$owner");
 *
 * KeyAuthorizer::RevokeResult revoked = authorizer.revokeOwner("alice");
 * @endcode
 */
class KeyAuthorizer
{
public:
    enum class Status {
        Success,            ///< The file was updated
        OwnerUnknown,       ///< The destination needs an owner and none is known
        KeyAlreadyPresent,  ///< The key already appears in the file
        NoMatchingKey,      ///< Nothing to revoke, the file is unchanged
        IoError             ///< Reading or writing a file failed
    };

    struct AuthorizeResult {
        Status status = Status::Success;
        QString owner;           ///< Owner used for the destination
        bool ownerGuessed = false;
        QString destinationDir;  ///< Destination directory, home expanded
        AuthorizedKeyEntry entry;
        QString errorString;
    };

    struct RevokeResult {
        Status status = Status::Success;
        QList<AuthorizedKeyEntry> revoked;
        QString errorString;
    };

    /**
     * @brief Constructs an authorizer.
     * @param authorizedKeysPath The file to edit.
     */
    explicit KeyAuthorizer(const QString &authorizedKeysPath);

    /// ~/.ssh/authorized_keys of the current user
    [[nodiscard]] static QString defaultAuthorizedKeysPath();

    /// ~/mercurio/$owner
    [[nodiscard]] static QString defaultDestinationTemplate();

    /**
     * @brief Appends an entry granting @p key access to its destination directory.
     * @param key The public key to authorize.
     * @param owner Owner override; empty to use the owner from the key comment.
     * @param destinationTemplate Directory template, `$owner` is substituted.
     * @return The outcome; the destination directory is created on success.
     */
    [[nodiscard]] AuthorizeResult authorize(const PublicKey &key,
                                            const QString &owner,
                                            const QString &destinationTemplate);

    /**
     * @brief Removes every managed entry whose key string equals @p key's.
     */
    [[nodiscard]] RevokeResult revokeKey(const PublicKey &key);

    /**
     * @brief Removes every managed entry owned by @p owner.
     */
    [[nodiscard]] RevokeResult revokeOwner(const QString &owner);

    /**
     * @brief Substitutes the owner into a destination template.
     * @param destinationTemplate Template containing `$owner` or `${owner}`.
     * @param owner Value to substitute.
     * @return The substituted path, without home expansion.
     */
    [[nodiscard]] static QString substituteOwner(const QString &destinationTemplate,
                                                 const QString &owner);

    /**
     * @brief Expands a leading `~` to the user's home directory.
     */
    [[nodiscard]] static QString expandHome(const QString &path);

private:
    RevokeResult revoke(const std::function<bool(const AuthorizedKeyEntry &)> &matches);

    QString path_;
};

#endif // KEYAUTHORIZER_H
