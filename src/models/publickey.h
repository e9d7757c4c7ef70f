/**
 * @file publickey.h
 * @brief Modest representation of an SSH public key line.
 */

#ifndef PUBLICKEY_H
#define PUBLICKEY_H

#include <QString>
#include <QStringList>

/**
 * @brief An SSH public key as written by ssh-keygen.
 *
 * Format: `<header> <key> [<owner>[@<origin>]]`. The comment is split into
 * owner and origin only when it contains exactly one '@'; otherwise the whole
 * comment is taken as the owner.
 *
 * Parsing failures leave the key invalid; check isValid() and the error
 * string passed to fromLine().
 */
class PublicKey
{
public:
    PublicKey() = default;
    PublicKey(const QString &header, const QString &key,
              const QString &owner = QString(), const QString &origin = QString());

    /**
     * @brief Returns the key types this parser accepts.
     */
    [[nodiscard]] static const QStringList &supportedFormats();

    /**
     * @brief Parses one line of a public key file.
     * @param line The line, without trailing newline.
     * @param error Receives a description on failure (may be nullptr).
     * @return The key; invalid on failure.
     */
    [[nodiscard]] static PublicKey fromLine(const QString &line, QString *error = nullptr);

    /**
     * @brief Reads the first line of a key file and parses it.
     * @param path File path; ".pub" is appended if missing.
     * @param error Receives a description on failure (may be nullptr).
     * @return The key; invalid on failure.
     */
    [[nodiscard]] static PublicKey fromFile(const QString &path, QString *error = nullptr);

    [[nodiscard]] bool isValid() const { return !header_.isEmpty() && !key_.isEmpty(); }

    [[nodiscard]] QString header() const { return header_; }
    [[nodiscard]] QString key() const { return key_; }
    [[nodiscard]] QString owner() const { return owner_; }
    [[nodiscard]] QString origin() const { return origin_; }

    void setOwner(const QString &owner) { owner_ = owner; }

    /// Serializes back to the one-line format
    [[nodiscard]] QString toString() const;

private:
    QString header_;
    QString key_;
    QString owner_;
    QString origin_;
};

#endif // PUBLICKEY_H
