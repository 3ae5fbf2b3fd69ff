#include "localcloudstorage.h"
#include "../utils/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

LocalCloudStorage::LocalCloudStorage(const QString &rootPath, const QString &accountIdentity)
    : rootPath_(QDir::cleanPath(rootPath))
    , accountIdentity_(accountIdentity)
{
}

QString LocalCloudStorage::containerPath(const QString &identifier) const
{
    if (rootPath_.isEmpty() || !QFileInfo(rootPath_).isDir()) {
        return QString();
    }

    if (identifier.isEmpty()) {
        return QFileInfo(rootPath_).absoluteFilePath();
    }

    // Identifiers name an existing container, never a path
    if (identifier.contains('/') || identifier == QLatin1String("..")) {
        qWarning() << "LocalCloudStorage: Rejecting container identifier" << identifier;
        return QString();
    }

    QFileInfo container(QDir(rootPath_).filePath(identifier));
    if (!container.isDir()) {
        return QString();
    }
    return container.absoluteFilePath();
}

QString LocalCloudStorage::identityToken() const
{
    if (accountIdentity_.isEmpty() || !QFileInfo(rootPath_).isDir()) {
        return QString();
    }
    return accountIdentity_;
}

bool LocalCloudStorage::startSynchronizing(const QString &path, QString *errorString)
{
    QFileInfo target(path);
    if (!target.exists()) {
        if (errorString) {
            *errorString = QCoreApplication::translate("LocalCloudStorage", "\"%1\" does not exist")
                               .arg(path);
        }
        return false;
    }

    if (!target.isDir()) {
        if (!target.isReadable()) {
            if (errorString) {
                *errorString = QCoreApplication::translate("LocalCloudStorage", "\"%1\" is not readable")
                                   .arg(path);
            }
            return false;
        }
        return true;
    }

    // The sync client materializes placeholders when they are touched, so
    // walking the tree is enough to get it started.
    int visited = 0;
    QDirIterator it(path, QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        QFileInfo entry(it.next());
        if (!entry.isReadable()) {
            if (errorString) {
                *errorString = QCoreApplication::translate("LocalCloudStorage", "\"%1\" is not readable")
                                   .arg(entry.filePath());
            }
            return false;
        }
        ++visited;
    }

    LOG_VERBOSE() << "LocalCloudStorage: Synchronization pass visited" << visited << "items under" << path;
    return true;
}
