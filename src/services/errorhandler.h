/**
 * @file errorhandler.h
 * @brief Side channel for errors that no transfer caller is waiting for.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QMetaType>
#include <QObject>
#include <QString>

/**
 * @brief Where an error came from.
 */
enum class ErrorCategory {
    Storage,        ///< Container resolution and synchronization
    FileOperation,  ///< Uploads and downloads
    Validation,     ///< Command-line arguments and settings
    System          ///< Anything else
};

/**
 * @brief How loudly an error is reported.
 */
enum class ErrorSeverity {
    Info,      ///< Logged, short status message
    Warning,   ///< Logged, longer status message
    Critical   ///< Logged, sticky status message and an alert
};

/// @brief Convert ErrorCategory to string for logging
[[nodiscard]] inline const char* errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Storage: return "Storage";
        case ErrorCategory::FileOperation: return "FileOperation";
        case ErrorCategory::Validation: return "Validation";
        case ErrorCategory::System: return "System";
    }
    return "Unknown";
}

/// @brief Convert ErrorSeverity to string for logging
[[nodiscard]] inline const char* errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Info: return "Info";
        case ErrorSeverity::Warning: return "Warning";
        case ErrorSeverity::Critical: return "Critical";
    }
    return "Unknown";
}

/**
 * @brief One reported error.
 */
struct ErrorReport {
    ErrorCategory category = ErrorCategory::System;
    ErrorSeverity severity = ErrorSeverity::Info;
    QString title;
    QString details;

    /// Title and details joined for a one-line status message
    [[nodiscard]] QString summary() const;
};

Q_DECLARE_METATYPE(ErrorCategory)
Q_DECLARE_METATYPE(ErrorSeverity)
Q_DECLARE_METATYPE(ErrorReport)

/**
 * @brief Routes errors to the log, the status line and the alert channel.
 *
 * Transfer outcomes never pass through here; they go to the delegate of
 * the request. This handler is for the errors nobody asked for, such as a
 * Documents directory that could not be created or a failed
 * synchronization trigger.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(resolver, &ContainerResolver::errorOccurred,
 *         handler, &ErrorHandler::handleStorageError);
 * connect(handler, &ErrorHandler::alertRaised,
 *         this, &MyApp::showAlert);
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /**
     * @brief Logs a report and publishes it on the signals its severity calls for.
     */
    void report(const ErrorReport &report);

    /// Status message display time for a severity, 0 meaning until replaced
    [[nodiscard]] static int statusTimeout(ErrorSeverity severity);

    [[nodiscard]] int reportCount() const { return reportCount_; }
    [[nodiscard]] ErrorReport lastReport() const { return lastReport_; }

public slots:
    /// Critical: the container or its synchronization is broken
    void handleStorageError(const QString &title, const QString &details);

    /// Warning: a transfer finished with an error
    void handleTransferFailed(const QString &fileName, const QString &error);

    /// Warning: a command or setting was rejected
    void handleValidationError(const QString &message);

signals:
    /**
     * @brief Emitted for every report.
     * @param message One-line summary.
     * @param timeout Display time in milliseconds, 0 for no timeout.
     */
    void statusMessage(const QString &message, int timeout);

    /// Emitted for critical reports only
    void alertRaised(const QString &title, const QString &message);

    void errorReported(const ErrorReport &report);

private:
    void log(const ErrorReport &report) const;

    int reportCount_ = 0;
    ErrorReport lastReport_;
};

#endif // ERRORHANDLER_H
