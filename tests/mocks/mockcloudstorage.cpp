#include "mockcloudstorage.h"

#include <QMutexLocker>

QString MockCloudStorage::containerPath(const QString &identifier) const
{
    QMutexLocker locker(&mutex_);
    containerQueries_.append(identifier);
    return containerPath_;
}

QString MockCloudStorage::identityToken() const
{
    QMutexLocker locker(&mutex_);
    return identityToken_;
}

bool MockCloudStorage::startSynchronizing(const QString &path, QString *errorString)
{
    QMutexLocker locker(&mutex_);
    synchronizationRequests_.append(path);
    if (!synchronizationError_.isEmpty()) {
        if (errorString) {
            *errorString = synchronizationError_;
        }
        return false;
    }
    return true;
}

// === Mock control methods ===

void MockCloudStorage::mockSetContainerPath(const QString &path)
{
    QMutexLocker locker(&mutex_);
    containerPath_ = path;
}

void MockCloudStorage::mockSetIdentityToken(const QString &token)
{
    QMutexLocker locker(&mutex_);
    identityToken_ = token;
}

void MockCloudStorage::mockSetSynchronizationError(const QString &errorMessage)
{
    QMutexLocker locker(&mutex_);
    synchronizationError_ = errorMessage;
}

int MockCloudStorage::mockContainerQueryCount() const
{
    QMutexLocker locker(&mutex_);
    return containerQueries_.size();
}

QStringList MockCloudStorage::mockContainerQueryIdentifiers() const
{
    QMutexLocker locker(&mutex_);
    return containerQueries_;
}

QStringList MockCloudStorage::mockSynchronizationRequests() const
{
    QMutexLocker locker(&mutex_);
    return synchronizationRequests_;
}
