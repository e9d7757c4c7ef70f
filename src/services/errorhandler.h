/**
 * @file errorhandler.h
 * @brief Centralized error reporting for the command line front end.
 *
 * This service standardizes how errors are categorized and logged across the
 * commands, so every failure reaches the user in the same shape.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

struct TransferError;

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Transfer,       ///< External transfer tool failures
    FileOperation,  ///< Reading or writing local files
    Validation,     ///< Command line input, key files, configuration
    System          ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are logged.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - logged with qInfo
    Warning,   ///< Warning - logged with qWarning, the command carries on
    Critical   ///< Critical - logged with qCritical, the command fails
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error presentation across the commands:
 * - Categorizes errors for appropriate handling
 * - Logs them as `[Category/SEVERITY] title: details`
 * - Emits errorLogged() for listeners
 *
 * @par Example usage:
 * @code
 * ErrorHandler handler;
 *
 * handler.handleError(ErrorCategory::Validation,
 *                     ErrorSeverity::Critical,
 *                     "Invalid key file",
 *                     "Unrecognized keyfile header 'ssh-foo'");
 *
 * if (std::optional<TransferError> error = pool.run(paths, destination)) {
 *     handler.handleTransferError(*error);
 * }
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    ~ErrorHandler() override = default;

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles the failure of a send run (critical severity).
     * @param error The run's error.
     */
    void handleTransferError(const TransferError &error);

    /**
     * @brief Handles a local file operation error (critical severity).
     * @param operation The operation that failed (e.g., "authorize", "revoke").
     * @param error The error message.
     */
    void handleOperationFailed(const QString &operation, const QString &error);

    /**
     * @brief Handles invalid user input (critical severity).
     * @param message The error message.
     */
    void handleValidationError(const QString &message);
    /// @}

    /**
     * @brief Returns the number of critical errors handled so far.
     */
    [[nodiscard]] int criticalCount() const { return criticalCount_; }

    /**
     * @brief Converts category to string for logging.
     */
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /**
     * @brief Converts severity to string for logging.
     */
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted when an error is logged.
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    int criticalCount_ = 0;
};

#endif // ERRORHANDLER_H
