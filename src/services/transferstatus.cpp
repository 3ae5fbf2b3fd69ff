#include "transferstatus.h"
#include "../utils/logging.h"

#include <QtGlobal>

TransferStatus::TransferStatus(QObject *parent)
    : QObject(parent)
{
}

void TransferStatus::setProgressTotal(int total)
{
    progressTotal_ = qBound(0, total, 100);
}

void TransferStatus::setProgressCurrent(int current)
{
    progressCurrent_ = qBound(0, current, 100);
}

int TransferStatus::progressPercent() const
{
    if (progressTotal_ <= 0) {
        return 0;
    }
    return qMin(100, progressCurrent_ * 100 / progressTotal_);
}

void TransferStatus::updateStatus()
{
    ++updateCount_;
    LOG_VERBOSE() << "TransferStatus:" << transferFilename_ << progressCurrent_ << "/" << progressTotal_;
    emit statusUpdated(transferFilename_, progressCurrent_, progressTotal_);
}

void TransferStatus::showActivity()
{
    emit activityShown();
}
