/**
 * @file containerresolver.h
 * @brief Resolves and prepares the Documents directory of the sync container.
 */

#ifndef CONTAINERRESOLVER_H
#define CONTAINERRESOLVER_H

#include <QFutureWatcher>
#include <QMetaType>
#include <QObject>
#include <QString>

class ICloudStorage;
class QThreadPool;

/**
 * @brief Result of a single ContainerResolver::resolve() call.
 */
struct ResolutionOutcome {
    enum class Kind {
        AlreadyResolved,  ///< Container was resolved earlier, nothing done
        Resolved,         ///< Container resolved now, path is set
        Unavailable,      ///< Store could not provide a container root
        Failed            ///< Documents directory could not be prepared, error is set
    };

    Kind kind = Kind::Unavailable;
    QString path;
    QString error;

    [[nodiscard]] bool isUsable() const { return kind == Kind::AlreadyResolved || kind == Kind::Resolved; }
};

Q_DECLARE_METATYPE(ResolutionOutcome)

/// @brief Convert ResolutionOutcome::Kind to string for debugging
[[nodiscard]] inline const char* resolutionKindToString(ResolutionOutcome::Kind kind) {
    switch (kind) {
        case ResolutionOutcome::Kind::AlreadyResolved: return "AlreadyResolved";
        case ResolutionOutcome::Kind::Resolved: return "Resolved";
        case ResolutionOutcome::Kind::Unavailable: return "Unavailable";
        case ResolutionOutcome::Kind::Failed: return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Locates the container root and creates its Documents directory.
 *
 * Resolution runs once per process. The store is queried and the directory
 * created on a worker thread; the resulting path is published on the thread
 * that owns the resolver, which is the only thread allowed to read it.
 *
 * Failures are not retried automatically. A failed creation is reported on
 * errorOccurred() and leaves the resolver unresolved, so every real transfer
 * completes with "service unavailable" until a later resolve() succeeds.
 *
 * @par Example usage:
 * @code
 * ContainerResolver *resolver = new ContainerResolver(storage, QString(), this);
 * connect(resolver, &ContainerResolver::resolutionFinished,
 *         this, &MyClass::onContainerReady);
 * connect(resolver, &ContainerResolver::errorOccurred,
 *         errorHandler, &ErrorHandler::handleStorageError);
 * resolver->resolve();
 * @endcode
 */
class ContainerResolver : public QObject
{
    Q_OBJECT

public:
    /// Subdirectory of the container root that holds all transferred files
    static constexpr const char *DocumentsDirectoryName = "Documents";
    /// Index document looked up inside the Documents directory
    static constexpr const char *DefaultIndexFilename = "index.org";

    /**
     * @brief Constructs a resolver.
     * @param storage The backing store (not owned, must outlive the resolver).
     * @param containerIdentifier Container to resolve, empty for the default.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ContainerResolver(ICloudStorage *storage,
                               const QString &containerIdentifier = QString(),
                               QObject *parent = nullptr);

    /**
     * @brief Destructor. Waits for outstanding worker jobs.
     */
    ~ContainerResolver() override;

    /**
     * @brief Starts resolving the container.
     *
     * Reports AlreadyResolved synchronously when the path is known. Otherwise
     * the outcome arrives later through resolutionFinished(). Calling this
     * while a resolution is in flight does nothing.
     */
    void resolve();

    [[nodiscard]] bool isResolved() const { return !documentsPath_.isEmpty(); }
    [[nodiscard]] bool isResolving() const { return resolving_; }

    /**
     * @brief Returns the resolved Documents directory.
     * @return Absolute path, or an empty string while unresolved.
     */
    [[nodiscard]] QString documentsPath() const { return documentsPath_; }

    /**
     * @brief Checks whether the store reports a signed-in account.
     *
     * Must be called on the thread that owns the resolver.
     */
    [[nodiscard]] bool isAvailable() const;

    [[nodiscard]] QString indexFilename() const { return indexFilename_; }
    void setIndexFilename(const QString &filename);

    /**
     * @brief Returns the index document path inside Documents.
     * @return Absolute path, or an empty string while unresolved.
     */
    [[nodiscard]] QString indexPath() const;

public slots:
    /**
     * @brief Asks the store to synchronize the Documents directory.
     *
     * Fire-and-forget: the request runs on a serial background pool and a
     * failure is only reported through errorOccurred(). Does nothing while
     * unresolved.
     */
    void requestSynchronization();

signals:
    /**
     * @brief Emitted when a resolve() call has an outcome.
     * @param outcome What the call did.
     */
    void resolutionFinished(const ResolutionOutcome &outcome);

    /**
     * @brief Emitted when a synchronization request has been handled.
     * @param success True if the store accepted the request.
     */
    void synchronizationFinished(bool success);

    /**
     * @brief Emitted for errors that should be shown to the user.
     * @param title Short error title.
     * @param details Error description.
     */
    void errorOccurred(const QString &title, const QString &details);

private:
    static ResolutionOutcome resolveContainer(ICloudStorage *storage, const QString &identifier);
    void onResolutionFinished();

    struct SyncResult {
        bool success = false;
        QString error;
    };

    ICloudStorage *storage_ = nullptr;
    const QString containerIdentifier_;
    QString indexFilename_ = QString::fromLatin1(DefaultIndexFilename);

    QString documentsPath_;
    bool resolving_ = false;
    QFutureWatcher<ResolutionOutcome> *resolutionWatcher_ = nullptr;

    QThreadPool *synchronizationPool_ = nullptr;
};

#endif // CONTAINERRESOLVER_H
