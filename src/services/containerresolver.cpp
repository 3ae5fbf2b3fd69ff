#include "containerresolver.h"
#include "icloudstorage.h"
#include "../utils/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QThread>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

ContainerResolver::ContainerResolver(ICloudStorage *storage,
                                     const QString &containerIdentifier,
                                     QObject *parent)
    : QObject(parent)
    , storage_(storage)
    , containerIdentifier_(containerIdentifier)
    , resolutionWatcher_(new QFutureWatcher<ResolutionOutcome>(this))
    , synchronizationPool_(new QThreadPool(this))
{
    Q_ASSERT(storage_ && "ICloudStorage is required");

    // Synchronization requests are serialized and run at background priority
    synchronizationPool_->setMaxThreadCount(1);
    synchronizationPool_->setThreadPriority(QThread::LowPriority);

    connect(resolutionWatcher_, &QFutureWatcher<ResolutionOutcome>::finished,
            this, &ContainerResolver::onResolutionFinished);
}

ContainerResolver::~ContainerResolver()
{
    // Worker jobs hold the storage pointer, which may die with our owner
    resolutionWatcher_->disconnect(this);
    resolutionWatcher_->waitForFinished();
    synchronizationPool_->waitForDone();
}

void ContainerResolver::resolve()
{
    if (isResolved()) {
        ResolutionOutcome outcome;
        outcome.kind = ResolutionOutcome::Kind::AlreadyResolved;
        outcome.path = documentsPath_;
        emit resolutionFinished(outcome);
        return;
    }

    if (resolving_) {
        LOG_VERBOSE() << "ContainerResolver: Resolution already in flight";
        return;
    }

    resolving_ = true;
    qInfo() << "ContainerResolver: Resolving container"
            << (containerIdentifier_.isEmpty() ? QStringLiteral("<default>") : containerIdentifier_);

    ICloudStorage *storage = storage_;
    const QString identifier = containerIdentifier_;
    resolutionWatcher_->setFuture(QtConcurrent::run([storage, identifier]() {
        return resolveContainer(storage, identifier);
    }));
}

ResolutionOutcome ContainerResolver::resolveContainer(ICloudStorage *storage, const QString &identifier)
{
    ResolutionOutcome outcome;

    const QString root = storage->containerPath(identifier);
    if (root.isEmpty()) {
        outcome.kind = ResolutionOutcome::Kind::Unavailable;
        return outcome;
    }

    const QString documents = QDir::cleanPath(QDir(root).filePath(QString::fromLatin1(DocumentsDirectoryName)));
    QFileInfo info(documents);
    if (info.exists() && !info.isDir()) {
        outcome.kind = ResolutionOutcome::Kind::Failed;
        outcome.error = tr("\"%1\" exists but is not a directory").arg(documents);
        return outcome;
    }

    if (!info.exists() && !QDir().mkpath(documents)) {
        outcome.kind = ResolutionOutcome::Kind::Failed;
        outcome.error = tr("Could not create directory \"%1\"").arg(documents);
        return outcome;
    }

    outcome.kind = ResolutionOutcome::Kind::Resolved;
    outcome.path = documents;
    return outcome;
}

void ContainerResolver::onResolutionFinished()
{
    resolving_ = false;
    const ResolutionOutcome outcome = resolutionWatcher_->result();

    switch (outcome.kind) {
    case ResolutionOutcome::Kind::Resolved:
        documentsPath_ = outcome.path;
        qInfo() << "ContainerResolver: Documents directory is" << documentsPath_;
        break;
    case ResolutionOutcome::Kind::Unavailable:
        qWarning() << "ContainerResolver: Cloud storage container is unavailable";
        break;
    case ResolutionOutcome::Kind::Failed:
        emit errorOccurred(tr("Cloud Storage Error"), outcome.error);
        break;
    case ResolutionOutcome::Kind::AlreadyResolved:
        break;
    }

    emit resolutionFinished(outcome);

    if (outcome.kind == ResolutionOutcome::Kind::Resolved) {
        requestSynchronization();
    }
}

bool ContainerResolver::isAvailable() const
{
    Q_ASSERT(QThread::currentThread() == thread());
    return !storage_->identityToken().isEmpty();
}

void ContainerResolver::setIndexFilename(const QString &filename)
{
    if (filename.isEmpty()) {
        qWarning() << "ContainerResolver: Ignoring empty index filename";
        return;
    }
    indexFilename_ = filename;
}

QString ContainerResolver::indexPath() const
{
    if (!isResolved()) {
        return QString();
    }
    return QDir(documentsPath_).filePath(indexFilename_);
}

void ContainerResolver::requestSynchronization()
{
    if (!isResolved()) {
        return;
    }

    LOG_VERBOSE() << "ContainerResolver: Requesting synchronization of" << documentsPath_;

    ICloudStorage *storage = storage_;
    const QString path = documentsPath_;
    auto *watcher = new QFutureWatcher<SyncResult>(this);
    connect(watcher, &QFutureWatcher<SyncResult>::finished, this, [this, watcher]() {
        const SyncResult result = watcher->result();
        watcher->deleteLater();
        if (!result.success) {
            emit errorOccurred(tr("Cloud Synchronization Error"), result.error);
        }
        emit synchronizationFinished(result.success);
    });
    watcher->setFuture(QtConcurrent::run(synchronizationPool_, [storage, path]() {
        SyncResult result;
        result.success = storage->startSynchronizing(path, &result.error);
        return result;
    }));
}
