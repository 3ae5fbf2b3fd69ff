#include "errorhandler.h"

#include <QDebug>

QString ErrorReport::summary() const
{
    if (details.isEmpty() || details == title) {
        return title;
    }
    return QStringLiteral("%1: %2").arg(title, details);
}

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::report(const ErrorReport &report)
{
    ++reportCount_;
    lastReport_ = report;
    log(report);

    emit errorReported(report);
    emit statusMessage(report.summary(), statusTimeout(report.severity));

    if (report.severity == ErrorSeverity::Critical) {
        emit alertRaised(report.title, report.details.isEmpty() ? report.title : report.details);
    }
}

int ErrorHandler::statusTimeout(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;
    }
    return 5000;
}

void ErrorHandler::handleStorageError(const QString &title, const QString &details)
{
    report({ErrorCategory::Storage, ErrorSeverity::Critical, title, details});
}

void ErrorHandler::handleTransferFailed(const QString &fileName, const QString &error)
{
    report({ErrorCategory::FileOperation, ErrorSeverity::Warning,
            tr("Transfer of %1 failed").arg(fileName), error});
}

void ErrorHandler::handleValidationError(const QString &message)
{
    report({ErrorCategory::Validation, ErrorSeverity::Warning, tr("Invalid input"), message});
}

void ErrorHandler::log(const ErrorReport &report) const
{
    const QString line = QStringLiteral("ErrorHandler: %1 %2: %3")
        .arg(QLatin1String(errorSeverityToString(report.severity)),
             QLatin1String(errorCategoryToString(report.category)),
             report.summary());

    switch (report.severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << line;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << line;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << line;
        break;
    }
}
