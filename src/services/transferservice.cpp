#include "transferservice.h"
#include "containerresolver.h"
#include "models/cloudtransferqueue.h"

#include <QFileInfo>

TransferService::TransferService(ContainerResolver *resolver,
                                 CloudTransferQueue *queue,
                                 QObject *parent)
    : QObject(parent)
    , resolver_(resolver)
    , queue_(queue)
{
    Q_ASSERT(resolver_ && "ContainerResolver is required");
    Q_ASSERT(queue_ && "CloudTransferQueue is required");

    // Forward signals from CloudTransferQueue
    connect(queue_, &CloudTransferQueue::transferStarted,
            this, &TransferService::transferStarted);
    connect(queue_, &CloudTransferQueue::transferCompleted,
            this, &TransferService::transferCompleted);
    connect(queue_, &CloudTransferQueue::transferFailed,
            this, &TransferService::transferFailed);
    connect(queue_, &CloudTransferQueue::allTransfersCompleted,
            this, &TransferService::allTransfersCompleted);
    connect(queue_, &CloudTransferQueue::queueChanged,
            this, &TransferService::queueChanged);
}

TransferService::~TransferService() = default;

TransferRequestPtr TransferService::submit(const TransferRequestPtr &request,
                                           TransferDelegate *delegate,
                                           bool abortOnFailure)
{
    request->setDelegate(delegate);
    request->setAbortOnFailure(abortOnFailure);
    queue_->enqueue(request);
    return request;
}

TransferRequestPtr TransferService::downloadFile(const QUrl &remote,
                                                 const QString &localPath,
                                                 TransferDelegate *delegate,
                                                 bool abortOnFailure)
{
    auto request = TransferRequest::create(TransferDirection::Download, remote, localPath);
    emit statusMessage(tr("Queued download: %1 -> %2").arg(request->remoteFileName(), localPath), 3000);
    return submit(request, delegate, abortOnFailure);
}

TransferRequestPtr TransferService::uploadFile(const QString &localPath,
                                               const QUrl &remote,
                                               TransferDelegate *delegate,
                                               bool abortOnFailure)
{
    auto request = TransferRequest::create(TransferDirection::Upload, remote, localPath);
    emit statusMessage(tr("Queued upload: %1 -> %2").arg(QFileInfo(localPath).fileName(),
                                                         request->remoteFileName()), 3000);
    return submit(request, delegate, abortOnFailure);
}

TransferRequestPtr TransferService::downloadIndex(const QString &localPath, TransferDelegate *delegate)
{
    return downloadFile(remoteLocator(resolver_->indexFilename()), localPath, delegate);
}

TransferRequestPtr TransferService::enqueueDummy(TransferDelegate *delegate)
{
    auto request = TransferRequest::createDummy(remoteLocator(resolver_->indexFilename()), delegate);
    queue_->enqueue(request);
    return request;
}

QUrl TransferService::remoteLocator(const QString &path)
{
    QUrl url;
    url.setPath(path, QUrl::DecodedMode);
    return url;
}

void TransferService::pause()
{
    queue_->pause();
}

void TransferService::resume()
{
    queue_->resume();
}

void TransferService::abort()
{
    queue_->abort();
}

bool TransferService::isBusy() const
{
    return queue_->busy();
}

int TransferService::queueSize() const
{
    return queue_->queueSize();
}

bool TransferService::isPaused() const
{
    return queue_->isPaused();
}

bool TransferService::isAvailable() const
{
    return resolver_->isAvailable();
}

bool TransferService::isContainerReady() const
{
    return resolver_->isResolved();
}

QString TransferService::documentsPath() const
{
    return resolver_->documentsPath();
}

QString TransferService::indexFilename() const
{
    return resolver_->indexFilename();
}
