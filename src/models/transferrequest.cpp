#include "transferrequest.h"

#include <QFileInfo>

TransferRequest::TransferRequest(TransferDirection direction, const QUrl &remoteLocator, const QString &localPath)
    : direction_(direction)
    , remoteLocator_(remoteLocator)
    , localPath_(localPath)
{
}

TransferRequestPtr TransferRequest::create(TransferDirection direction,
                                           const QUrl &remoteLocator,
                                           const QString &localPath)
{
    return std::make_shared<TransferRequest>(direction, remoteLocator, localPath);
}

TransferRequestPtr TransferRequest::createDummy(const QUrl &remoteLocator, TransferDelegate *delegate)
{
    auto request = create(TransferDirection::Download, remoteLocator, QString());
    request->setDummy(true);
    request->setDelegate(delegate);
    return request;
}

QString TransferRequest::remoteFileName() const
{
    return QFileInfo(remoteLocator_.path(QUrl::FullyDecoded)).fileName();
}

void TransferRequest::markSucceeded()
{
    Q_ASSERT_X(!hasOutcome_, "TransferRequest::markSucceeded", "outcome already recorded");
    hasOutcome_ = true;
    success_ = true;
    errorText_.clear();
    statusCode_ = 0;
}

void TransferRequest::markFailed(const QString &errorText, int statusCode)
{
    Q_ASSERT_X(!hasOutcome_, "TransferRequest::markFailed", "outcome already recorded");
    hasOutcome_ = true;
    success_ = false;
    errorText_ = errorText;
    statusCode_ = statusCode;
}

bool TransferRequest::claimNotification()
{
    if (notified_) {
        return false;
    }
    notified_ = true;
    return true;
}
