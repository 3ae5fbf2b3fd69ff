#include "localfilecopier.h"
#include "../utils/logging.h"

#include <QFile>
#include <QFileInfo>
#include <QtConcurrent/QtConcurrentRun>
#include <utility>

LocalFileCopier::LocalFileCopier(QObject *parent)
    : IFileCopier(parent)
{
}

LocalFileCopier::~LocalFileCopier()
{
    for (auto *watcher : std::as_const(watchers_)) {
        watcher->disconnect(this);
        watcher->waitForFinished();
    }
}

void LocalFileCopier::upload(quint64 id, const QString &from, const QString &to)
{
    startCopy(id, from, to, true);
}

void LocalFileCopier::download(quint64 id, const QString &from, const QString &to)
{
    startCopy(id, from, to, false);
}

bool LocalFileCopier::copyReplacing(const QString &from, const QString &to, QString *errorString)
{
    if (QFileInfo::exists(to)) {
        QFile existing(to);
        if (!existing.remove()) {
            if (errorString) {
                *errorString = tr("Could not remove \"%1\": %2").arg(to, existing.errorString());
            }
            return false;
        }
    }

    QFile source(from);
    if (!source.copy(to)) {
        if (errorString) {
            *errorString = source.errorString();
        }
        return false;
    }
    return true;
}

void LocalFileCopier::startCopy(quint64 id, const QString &from, const QString &to, bool isUpload)
{
    LOG_VERBOSE() << "LocalFileCopier:" << (isUpload ? "upload" : "download") << id << from << "->" << to;

    auto *watcher = new QFutureWatcher<CopyResult>(this);
    watchers_.append(watcher);

    connect(watcher, &QFutureWatcher<CopyResult>::finished, this, [this, watcher, id]() {
        const CopyResult result = watcher->result();
        watchers_.removeOne(watcher);
        watcher->deleteLater();
        if (result.success) {
            emit copySucceeded(id);
        } else {
            emit copyFailed(id, result.error);
        }
    });

    watcher->setFuture(QtConcurrent::run([from, to, isUpload]() {
        if (isUpload) {
            // Callers only upload files they have just written
            Q_ASSERT_X(QFileInfo::exists(from), "LocalFileCopier::upload", "source file does not exist");
            Q_ASSERT_X(QFileInfo(from).isReadable(), "LocalFileCopier::upload", "source file is not readable");
        }

        CopyResult result;
        result.success = copyReplacing(from, to, &result.error);
        if (!result.success) {
            qWarning().noquote() << "LocalFileCopier: Copy of" << from << "failed:" << result.error;
        }
        return result;
    }));
}
