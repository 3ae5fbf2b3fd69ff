#include "syncapplication.h"
#include "models/cloudtransferqueue.h"
#include "services/containerresolver.h"
#include "services/errorhandler.h"
#include "services/localcloudstorage.h"
#include "services/localfilecopier.h"
#include "services/transferservice.h"
#include "services/transferstatus.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>
#include <utility>

SyncApplication::SyncApplication(const SyncSettings &settings, QObject *parent)
    : QObject(parent)
    , settings_(settings)
    , storage_(std::make_unique<LocalCloudStorage>(settings.rootPath, settings.accountIdentity))
    , resolver_(new ContainerResolver(storage_.get(), settings.containerIdentifier, this))
    , copier_(new LocalFileCopier(this))
    , status_(new TransferStatus(this))
    , errorHandler_(new ErrorHandler(this))
    , queue_(new CloudTransferQueue(resolver_, copier_, status_, this))
    , transferService_(new TransferService(resolver_, queue_, this))
    , synchronizationTimer_(new QTimer(this))
{
    resolver_->setIndexFilename(settings_.indexFilename);

    connect(resolver_, &ContainerResolver::resolutionFinished,
            this, &SyncApplication::onContainerResolved);
    connect(resolver_, &ContainerResolver::errorOccurred,
            errorHandler_, &ErrorHandler::handleStorageError);

    connect(errorHandler_, &ErrorHandler::alertRaised, this, [](const QString &title, const QString &message) {
        QTextStream(stderr) << title << ": " << message << Qt::endl;
    });
    connect(errorHandler_, &ErrorHandler::statusMessage, this, [](const QString &message, int) {
        LOG_VERBOSE() << "Status:" << message;
    });
    connect(transferService_, &TransferService::statusMessage, this, [](const QString &message, int) {
        LOG_VERBOSE() << "Status:" << message;
    });

    connect(status_, &TransferStatus::statusUpdated, this, [](const QString &filename, int current, int total) {
        if (total > 0) {
            qInfo().noquote() << QString("%1: %2/%3").arg(filename).arg(current).arg(total);
        } else {
            qInfo().noquote() << QString("%1: started").arg(filename);
        }
    });

    connect(queue_, &CloudTransferQueue::pendingDiscarded, this, [this](int count) {
        droppedCount_ += count;
    });
    connect(queue_, &CloudTransferQueue::allTransfersCompleted,
            this, &SyncApplication::onAllTransfersCompleted);

    if (settings_.syncIntervalSeconds > 0) {
        synchronizationTimer_->setInterval(settings_.syncIntervalSeconds * 1000);
        connect(synchronizationTimer_, &QTimer::timeout,
                resolver_, &ContainerResolver::requestSynchronization);
    }

    // Resolution is awaited lazily by run()
    resolver_->resolve();
}

SyncApplication::~SyncApplication()
{
    // Children that reference the storage must go before it does
    delete transferService_;
    delete queue_;
    delete copier_;
    delete resolver_;
}

void SyncApplication::run(const QList<SyncCommand> &commands, bool abortOnFailure)
{
    commands_ = commands;
    abortOnFailure_ = abortOnFailure;
    running_ = true;

    if (resolutionDone_) {
        queueCommands();
    }
}

void SyncApplication::onContainerResolved(const ResolutionOutcome &outcome)
{
    resolutionDone_ = true;
    qInfo() << "SyncApplication: Container resolution finished:" << resolutionKindToString(outcome.kind);

    if (outcome.isUsable() && settings_.syncIntervalSeconds > 0) {
        synchronizationTimer_->start();
    }

    if (running_) {
        queueCommands();
    }
}

void SyncApplication::queueCommands()
{
    if (!running_ || queuing_ || finished_) {
        return;
    }

    queuing_ = true;
    for (const SyncCommand &command : std::as_const(commands_)) {
        switch (command.type) {
        case SyncCommand::Type::Download:
            transferService_->downloadFile(TransferService::remoteLocator(command.remotePath),
                                           command.localPath, this, abortOnFailure_);
            break;
        case SyncCommand::Type::Upload: {
            // The copier asserts that upload sources exist and are readable
            const QFileInfo source(command.localPath);
            if (!source.isFile() || !source.isReadable()) {
                ++failureCount_;
                errorHandler_->handleValidationError(
                    tr("Source file \"%1\" does not exist or is not readable").arg(command.localPath));
                break;
            }
            transferService_->uploadFile(command.localPath,
                                         TransferService::remoteLocator(command.remotePath),
                                         this, abortOnFailure_);
            break;
        }
        case SyncCommand::Type::Index:
            transferService_->downloadIndex(command.localPath, this);
            break;
        case SyncCommand::Type::Status:
            printStatus();
            break;
        }
    }
    commands_.clear();
    queuing_ = false;

    if (!transferService_->isBusy()) {
        finish();
    }
}

void SyncApplication::printStatus()
{
    QTextStream out(stdout);
    out << "Account available: " << (transferService_->isAvailable() ? "yes" : "no") << Qt::endl;
    out << "Container ready:   " << (transferService_->isContainerReady() ? "yes" : "no") << Qt::endl;
    if (transferService_->isContainerReady()) {
        out << "Documents:         " << transferService_->documentsPath() << Qt::endl;
        out << "Index:             " << resolver_->indexPath() << Qt::endl;
    }
    if (!transferService_->isContainerReady()) {
        ++failureCount_;
    }
}

void SyncApplication::onAllTransfersCompleted()
{
    if (queuing_) {
        return;
    }
    finish();
}

void SyncApplication::finish()
{
    if (finished_) {
        return;
    }
    finished_ = true;

    if (droppedCount_ > 0) {
        qWarning() << "SyncApplication:" << droppedCount_ << "transfers were not attempted";
    }

    const int exitCode = (failureCount_ > 0 || droppedCount_ > 0) ? 1 : 0;
    emit finished(exitCode);
}

void SyncApplication::transferComplete(TransferRequest &request)
{
    QTextStream(stdout) << "OK     " << request.remoteFileName() << Qt::endl;
}

void SyncApplication::transferFailed(TransferRequest &request)
{
    ++failureCount_;
    QTextStream(stdout) << "FAILED " << request.remoteFileName()
                        << " (" << request.statusCode() << ") " << request.errorText() << Qt::endl;
    errorHandler_->handleTransferFailed(request.remoteFileName(), request.errorText());
}
