#include "cloudtransferqueue.h"
#include "../services/containerresolver.h"
#include "../services/ifilecopier.h"
#include "../services/transferstatus.h"
#include "../utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QMetaObject>
#include <QThread>

CloudTransferQueue::CloudTransferQueue(ContainerResolver *resolver,
                                       IFileCopier *copier,
                                       TransferStatus *status,
                                       QObject *parent)
    : QObject(parent)
    , resolver_(resolver)
    , copier_(copier)
    , status_(status)
{
    Q_ASSERT(resolver_ && "ContainerResolver is required");
    Q_ASSERT(copier_ && "IFileCopier is required");
    Q_ASSERT(status_ && "TransferStatus is required");

    connect(copier_, &IFileCopier::copySucceeded,
            this, &CloudTransferQueue::onCopySucceeded);
    connect(copier_, &IFileCopier::copyFailed,
            this, &CloudTransferQueue::onCopyFailed);
}

CloudTransferQueue::~CloudTransferQueue()
{
    // The copier may outlive us; stop results from reaching a dead queue
    if (copier_) {
        disconnect(copier_, nullptr, this, nullptr);
    }
}

bool CloudTransferQueue::isOwnerThread() const
{
    return QThread::currentThread() == thread();
}

void CloudTransferQueue::transitionTo(TransferQueueState newState)
{
    if (state_ == newState) {
        return;
    }

    qDebug() << "CloudTransferQueue: State transition"
             << transferQueueStateToString(state_) << "->" << transferQueueStateToString(newState);

    state_ = newState;
}

void CloudTransferQueue::enqueue(const TransferRequestPtr &request)
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, request]() { enqueue(request); }, Qt::QueuedConnection);
        return;
    }

    if (!request) {
        qWarning() << "CloudTransferQueue::enqueue - null request";
        return;
    }

    if (request->isEnqueued()) {
        qWarning() << "CloudTransferQueue::enqueue - request" << request->id() << "was already enqueued";
        return;
    }

    request->assignId(nextId_++);
    pending_.enqueue(request);

    LOG_VERBOSE() << "CloudTransferQueue: Enqueued" << request->id()
                  << directionToString(request->direction()) << request->remoteLocator().toString()
                  << "pending:" << pending_.size();

    status_->showActivity();
    emit queueChanged();

    dispatchNext();
}

void CloudTransferQueue::pause()
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { pause(); }, Qt::QueuedConnection);
        return;
    }

    paused_ = true;
    qInfo() << "CloudTransferQueue: Paused with" << pending_.size() << "pending";
}

void CloudTransferQueue::resume()
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { resume(); }, Qt::QueuedConnection);
        return;
    }

    paused_ = false;
    qInfo() << "CloudTransferQueue: Resumed with" << pending_.size() << "pending";
    dispatchNext();
}

void CloudTransferQueue::abort()
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { abort(); }, Qt::QueuedConnection);
        return;
    }

    const int dropped = pending_.size();
    pending_.clear();

    if (dropped > 0) {
        qInfo() << "CloudTransferQueue: Aborted" << dropped << "pending transfers";
        emit pendingDiscarded(dropped);
        emit queueChanged();
    }

    if (!busy()) {
        transferFinished_ = false;
        emit allTransfersCompleted();
    }
}

bool CloudTransferQueue::busy() const
{
    Q_ASSERT(isOwnerThread());
    return !pending_.isEmpty() || active_ != nullptr;
}

int CloudTransferQueue::queueSize() const
{
    Q_ASSERT(isOwnerThread());
    return pending_.size();
}

void CloudTransferQueue::dispatchNext()
{
    if (dispatching_) {
        redispatchRequested_ = true;
        return;
    }

    dispatching_ = true;
    do {
        redispatchRequested_ = false;
        startHead();
    } while (redispatchRequested_);
    dispatching_ = false;

    // Only the outermost call reports the drain, once per run of finishes
    if (transferFinished_ && !busy()) {
        transferFinished_ = false;
        emit allTransfersCompleted();
    }
}

void CloudTransferQueue::startHead()
{
    if (paused_ || pending_.isEmpty() || active_) {
        return;
    }

    // A request without a remote locator blocks the queue until it is aborted
    if (pending_.head()->remoteLocator().isEmpty()) {
        LOG_VERBOSE() << "CloudTransferQueue: Head request" << pending_.head()->id() << "has no remote locator";
        return;
    }

    transitionTo(TransferQueueState::Dispatching);

    TransferRequestPtr request = pending_.dequeue();
    active_ = request;

    const QString fileName = request->remoteFileName();
    status_->setTransferFilename(fileName);
    status_->setProgressTotal(0);
    status_->setProgressCurrent(0);
    status_->updateStatus();

    emit transferStarted(request->id(), fileName);
    emit queueChanged();

    process(request);
}

void CloudTransferQueue::process(const TransferRequestPtr &request)
{
    transitionTo(TransferQueueState::Executing);

    if (request->isDummy()) {
        request->markSucceeded();
        finish(request);
        return;
    }

    if (!resolver_->isResolved()) {
        request->markFailed(tr("Cannot reach cloud storage."), TransferRequest::ServiceUnavailable);
        finish(request);
        return;
    }

    const QString remotePath = remotePathFor(resolver_->documentsPath(), request->remoteLocator());
    if (remotePath.isEmpty()) {
        qFatal("CloudTransferQueue: Cannot create remote path from %s",
               qPrintable(request->remoteLocator().toString()));
    }
    const QString localPath = resolveLocalPath(request->localPath());
    if (localPath.isEmpty()) {
        qFatal("CloudTransferQueue: Cannot create local path from \"%s\"", qPrintable(request->localPath()));
    }

    switch (request->direction()) {
    case TransferDirection::Download:
        copier_->download(request->id(), remotePath, localPath);
        break;
    case TransferDirection::Upload:
        copier_->upload(request->id(), localPath, remotePath);
        break;
    default:
        qFatal("CloudTransferQueue: Unsupported transfer direction %d", static_cast<int>(request->direction()));
    }
}

void CloudTransferQueue::onCopySucceeded(quint64 id)
{
    if (!active_ || active_->id() != id) {
        qWarning() << "CloudTransferQueue: Ignoring copy result for inactive transfer" << id;
        return;
    }

    TransferRequestPtr request = active_;
    request->markSucceeded();
    publishCopyCompleted();
    finish(request);
}

void CloudTransferQueue::onCopyFailed(quint64 id, const QString &errorString)
{
    if (!active_ || active_->id() != id) {
        qWarning() << "CloudTransferQueue: Ignoring copy failure for inactive transfer" << id;
        return;
    }

    TransferRequestPtr request = active_;
    request->markFailed(errorString, TransferRequest::FileOperationFailed);
    publishCopyCompleted();
    finish(request);
}

void CloudTransferQueue::publishCopyCompleted()
{
    status_->setProgressTotal(100);
    status_->setProgressCurrent(100);
    status_->updateStatus();
}

void CloudTransferQueue::finish(const TransferRequestPtr &request)
{
    transitionTo(TransferQueueState::Finishing);

    if (!request->succeeded() && request->abortOnFailure() && !pending_.isEmpty()) {
        const int dropped = pending_.size();
        pending_.clear();
        qWarning() << "CloudTransferQueue: Transfer" << request->id() << "failed, dropping"
                   << dropped << "pending transfers";
        emit pendingDiscarded(dropped);
    }

    notifyOutcome(request);

    active_.reset();
    transitionTo(TransferQueueState::Idle);
    emit queueChanged();

    transferFinished_ = true;
    dispatchNext();
}

void CloudTransferQueue::notifyOutcome(const TransferRequestPtr &request)
{
    if (!request->claimNotification()) {
        qWarning() << "CloudTransferQueue: Transfer" << request->id() << "was already notified";
        Q_ASSERT_X(false, "CloudTransferQueue::notifyOutcome", "outcome delivered twice");
        return;
    }

    TransferDelegate *delegate = request->delegate();
    if (request->succeeded()) {
        LOG_VERBOSE() << "CloudTransferQueue: Transfer" << request->id() << "completed";
        if (delegate) {
            delegate->transferComplete(*request);
        }
        emit transferCompleted(request->id());
    } else {
        qWarning().noquote() << "CloudTransferQueue: Transfer" << request->id() << "failed with status"
                             << request->statusCode() << "-" << request->errorText();
        if (delegate) {
            delegate->transferFailed(*request);
        }
        emit transferFailed(request->id(), request->errorText(), request->statusCode());
    }
}

QString CloudTransferQueue::remotePathFor(const QString &documentsPath, const QUrl &remoteLocator)
{
    const QString path = remoteLocator.path(QUrl::FullyDecoded);
    if (path.isEmpty()) {
        return QString();
    }
    if (QDir::isAbsolutePath(path)) {
        return QDir::cleanPath(path);
    }

    // Relative locators must stay inside Documents
    const QString documents = QDir::cleanPath(documentsPath);
    const QString resolved = QDir::cleanPath(QDir(documents).filePath(path));
    if (resolved == documents || !resolved.startsWith(documents + QLatin1Char('/'))) {
        qWarning() << "CloudTransferQueue: Remote locator" << path << "leaves" << documents;
        return QString();
    }
    return resolved;
}

QString CloudTransferQueue::resolveLocalPath(const QString &localPath)
{
    return QUrl::fromPercentEncoding(localPath.toUtf8());
}
