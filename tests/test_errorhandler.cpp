/**
 * @file test_errorhandler.cpp
 * @brief Unit tests for ErrorHandler.
 *
 * Tests verify:
 * - Every report reaches the status line with a severity-based timeout
 * - Only critical reports raise an alert
 * - The convenience slots pick the right category and severity
 */

#include <QtTest/QtTest>
#include <QSignalSpy>

#include "services/errorhandler.h"

class TestErrorHandler : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // Summaries
    void testSummaryJoinsTitleAndDetails();
    void testSummaryWithoutDetails();

    // Status messages
    void testStatusTimeouts();
    void testReportEmitsStatusMessage();

    // Alerts
    void testCriticalRaisesAlert();
    void testCriticalAlertFallsBackToTitle();
    void testNonCriticalDoesNotAlert();

    // Convenience slots
    void testStorageErrorIsCritical();
    void testTransferFailedIsWarning();
    void testValidationErrorIsWarning();

    // Bookkeeping
    void testReportCountAndLastReport();

private:
    ErrorHandler *handler_ = nullptr;
};

void TestErrorHandler::initTestCase()
{
    qRegisterMetaType<ErrorReport>();
}

void TestErrorHandler::init()
{
    handler_ = new ErrorHandler(this);
}

void TestErrorHandler::cleanup()
{
    delete handler_;
    handler_ = nullptr;
}

void TestErrorHandler::testSummaryJoinsTitleAndDetails()
{
    const ErrorReport report{ErrorCategory::System, ErrorSeverity::Info, "Title", "Details"};

    QCOMPARE(report.summary(), QString("Title: Details"));
}

void TestErrorHandler::testSummaryWithoutDetails()
{
    const ErrorReport empty{ErrorCategory::System, ErrorSeverity::Info, "Title", QString()};
    const ErrorReport repeated{ErrorCategory::System, ErrorSeverity::Info, "Title", "Title"};

    QCOMPARE(empty.summary(), QString("Title"));
    QCOMPARE(repeated.summary(), QString("Title"));
}

void TestErrorHandler::testStatusTimeouts()
{
    QCOMPARE(ErrorHandler::statusTimeout(ErrorSeverity::Info), 3000);
    QCOMPARE(ErrorHandler::statusTimeout(ErrorSeverity::Warning), 5000);
    QCOMPARE(ErrorHandler::statusTimeout(ErrorSeverity::Critical), 0);
}

void TestErrorHandler::testReportEmitsStatusMessage()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->report({ErrorCategory::System, ErrorSeverity::Warning, "Disk almost full", "95% used"});

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("Disk almost full: 95% used"));
    QCOMPARE(spy.at(0).at(1).toInt(), 5000);
}

void TestErrorHandler::testCriticalRaisesAlert()
{
    QSignalSpy alerts(handler_, &ErrorHandler::alertRaised);

    handler_->report({ErrorCategory::System, ErrorSeverity::Critical, "Broken", "Something broke"});

    QCOMPARE(alerts.count(), 1);
    QCOMPARE(alerts.at(0).at(0).toString(), QString("Broken"));
    QCOMPARE(alerts.at(0).at(1).toString(), QString("Something broke"));
}

void TestErrorHandler::testCriticalAlertFallsBackToTitle()
{
    QSignalSpy alerts(handler_, &ErrorHandler::alertRaised);

    handler_->report({ErrorCategory::System, ErrorSeverity::Critical, "Broken", QString()});

    QCOMPARE(alerts.at(0).at(1).toString(), QString("Broken"));
}

void TestErrorHandler::testNonCriticalDoesNotAlert()
{
    QSignalSpy alerts(handler_, &ErrorHandler::alertRaised);
    QSignalSpy messages(handler_, &ErrorHandler::statusMessage);

    handler_->report({ErrorCategory::System, ErrorSeverity::Warning, "Minor", QString()});
    handler_->report({ErrorCategory::System, ErrorSeverity::Info, "Note", QString()});

    QCOMPARE(alerts.count(), 0);
    QCOMPARE(messages.count(), 2);
}

void TestErrorHandler::testStorageErrorIsCritical()
{
    QSignalSpy alerts(handler_, &ErrorHandler::alertRaised);
    QSignalSpy reports(handler_, &ErrorHandler::errorReported);

    handler_->handleStorageError("Cloud Storage Error", "Could not create directory");

    QCOMPARE(alerts.count(), 1);
    QCOMPARE(alerts.at(0).at(0).toString(), QString("Cloud Storage Error"));
    const auto report = reports.at(0).at(0).value<ErrorReport>();
    QCOMPARE(report.category, ErrorCategory::Storage);
    QCOMPARE(report.severity, ErrorSeverity::Critical);
}

void TestErrorHandler::testTransferFailedIsWarning()
{
    QSignalSpy messages(handler_, &ErrorHandler::statusMessage);

    handler_->handleTransferFailed("index.org", "Permission denied");

    const QString message = messages.at(0).at(0).toString();
    QVERIFY(message.contains("index.org"));
    QVERIFY(message.contains("failed"));
    QVERIFY(message.contains("Permission denied"));
    QCOMPARE(handler_->lastReport().category, ErrorCategory::FileOperation);
    QCOMPARE(handler_->lastReport().severity, ErrorSeverity::Warning);
}

void TestErrorHandler::testValidationErrorIsWarning()
{
    QSignalSpy alerts(handler_, &ErrorHandler::alertRaised);

    handler_->handleValidationError("Source file \"a.org\" does not exist");

    QCOMPARE(alerts.count(), 0);
    QCOMPARE(handler_->lastReport().category, ErrorCategory::Validation);
    QCOMPARE(handler_->lastReport().details, QString("Source file \"a.org\" does not exist"));
}

void TestErrorHandler::testReportCountAndLastReport()
{
    QCOMPARE(handler_->reportCount(), 0);

    handler_->report({ErrorCategory::Storage, ErrorSeverity::Info, "first", QString()});
    handler_->report({ErrorCategory::System, ErrorSeverity::Warning, "second", QString()});

    QCOMPARE(handler_->reportCount(), 2);
    QCOMPARE(handler_->lastReport().title, QString("second"));
    QCOMPARE(QString(errorCategoryToString(handler_->lastReport().category)), QString("System"));
}

QTEST_MAIN(TestErrorHandler)
#include "test_errorhandler.moc"
