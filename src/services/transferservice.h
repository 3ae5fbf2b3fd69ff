/**
 * @file transferservice.h
 * @brief Service for coordinating file transfers with the sync container.
 *
 * This service encapsulates building and queuing transfer requests, providing
 * a high-level API for callers instead of direct CloudTransferQueue coupling.
 */

#ifndef TRANSFERSERVICE_H
#define TRANSFERSERVICE_H

#include <QObject>
#include <QString>
#include <QUrl>

#include "models/transferrequest.h"

class CloudTransferQueue;
class ContainerResolver;

/**
 * @brief Service for coordinating file transfer operations.
 *
 * TransferService provides the caller-facing interface of the transfer
 * subsystem. Benefits include:
 * - Callers never build TransferRequest objects by hand
 * - Index document naming is centralized
 * - Queue control is available without the queue type
 *
 * Requests are always queued. When the container is not ready the queue
 * reports them as failed with status 503, so callers retry by enqueuing again.
 *
 * @par Example usage:
 * @code
 * TransferService *service = new TransferService(resolver, queue, this);
 *
 * connect(service, &TransferService::transferFailed,
 *         this, &MyClass::onTransferFailed);
 *
 * service->downloadIndex("/tmp/index.org", this);
 * service->uploadFile("/tmp/notes.org", QUrl("notes.org"), this);
 * @endcode
 */
class TransferService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transfer service.
     * @param resolver The container resolver for readiness checks (not owned).
     * @param queue The transfer queue to delegate operations to (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferService(ContainerResolver *resolver,
                             CloudTransferQueue *queue,
                             QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~TransferService() override;

    /// @name Transfer Operations
    /// @{

    /**
     * @brief Downloads a file from the container.
     * @param remote Remote locator, relative to Documents or absolute.
     * @param localPath Local destination path.
     * @param delegate Receiver of the outcome (not owned, may be null).
     * @param abortOnFailure Drop all pending requests if this one fails.
     * @return The queued request.
     */
    TransferRequestPtr downloadFile(const QUrl &remote,
                                    const QString &localPath,
                                    TransferDelegate *delegate = nullptr,
                                    bool abortOnFailure = false);

    /**
     * @brief Uploads a local file into the container.
     * @param localPath Local source path. Must exist and be readable.
     * @param remote Remote locator, relative to Documents or absolute.
     * @param delegate Receiver of the outcome (not owned, may be null).
     * @param abortOnFailure Drop all pending requests if this one fails.
     * @return The queued request.
     */
    TransferRequestPtr uploadFile(const QString &localPath,
                                  const QUrl &remote,
                                  TransferDelegate *delegate = nullptr,
                                  bool abortOnFailure = false);

    /**
     * @brief Downloads the index document.
     * @param localPath Local destination path.
     * @param delegate Receiver of the outcome (not owned, may be null).
     * @return The queued request.
     */
    TransferRequestPtr downloadIndex(const QString &localPath, TransferDelegate *delegate = nullptr);

    /**
     * @brief Queues a request that moves no data and reports success.
     *
     * Its outcome arrives after everything queued before it has finished.
     * @param delegate Receiver of the outcome (not owned, may be null).
     * @return The queued request.
     */
    TransferRequestPtr enqueueDummy(TransferDelegate *delegate = nullptr);

    /**
     * @brief Builds a remote locator from a plain path.
     * @param path Path relative to Documents, or absolute. Not percent-encoded.
     * @return Locator suitable for downloadFile() and uploadFile().
     */
    [[nodiscard]] static QUrl remoteLocator(const QString &path);
    /// @}

    /// @name Queue Management
    /// @{
    void pause();
    void resume();

    /**
     * @brief Drops all pending requests. The active one still completes.
     */
    void abort();
    /// @}

    /// @name Queue State
    /// @{
    [[nodiscard]] bool isBusy() const;
    [[nodiscard]] int queueSize() const;
    [[nodiscard]] bool isPaused() const;
    /// @}

    /// @name Container State
    /// @{
    [[nodiscard]] bool isAvailable() const;
    [[nodiscard]] bool isContainerReady() const;
    [[nodiscard]] QString documentsPath() const;
    [[nodiscard]] QString indexFilename() const;
    /// @}

signals:
    void transferStarted(quint64 id, const QString &fileName);
    void transferCompleted(quint64 id);
    void transferFailed(quint64 id, const QString &errorText, int statusCode);
    void allTransfersCompleted();
    void queueChanged();

    /**
     * @brief Emitted when a status message should be displayed.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout = 0);

private:
    TransferRequestPtr submit(const TransferRequestPtr &request,
                              TransferDelegate *delegate,
                              bool abortOnFailure);

    ContainerResolver *resolver_ = nullptr;
    CloudTransferQueue *queue_ = nullptr;
};

#endif // TRANSFERSERVICE_H
