#ifndef CLOUDTRANSFERQUEUE_H
#define CLOUDTRANSFERQUEUE_H

#include <QObject>
#include <QQueue>
#include <QString>
#include <QUrl>

#include "transferrequest.h"

class ContainerResolver;
class IFileCopier;
class TransferStatus;

/**
 * @brief State machine states for CloudTransferQueue.
 *
 * The queue is Idle between transfers. Dispatching covers promoting the head
 * of the pending queue, Executing the copy in flight, and Finishing the
 * delivery of the outcome before the next dispatch.
 */
enum class TransferQueueState {
    Idle,          ///< No active transfer
    Dispatching,   ///< Promoting the head of the pending queue
    Executing,     ///< Copy operation of the active transfer in flight
    Finishing,     ///< Outcome being delivered to the caller
};

/// @brief Convert TransferQueueState to string for debugging
[[nodiscard]] inline const char* transferQueueStateToString(TransferQueueState state) {
    switch (state) {
        case TransferQueueState::Idle: return "Idle";
        case TransferQueueState::Dispatching: return "Dispatching";
        case TransferQueueState::Executing: return "Executing";
        case TransferQueueState::Finishing: return "Finishing";
    }
    return "Unknown";
}

/**
 * @brief Single-flight FIFO queue of uploads and downloads.
 *
 * At most one request is active at a time. All queue state belongs to the
 * thread that owns the queue; enqueue(), pause(), resume() and abort() called
 * from another thread are re-posted to it. Copy results come back through
 * the IFileCopier signals on the same thread.
 *
 * Every enqueued request gets exactly one outcome notification unless it is
 * dropped while pending by abort() or by a failed abort-on-failure request.
 *
 * @par Example usage:
 * @code
 * CloudTransferQueue *queue = new CloudTransferQueue(resolver, copier, status, this);
 * auto request = TransferRequest::create(TransferDirection::Download,
 *                                        QUrl("index.org"), "/tmp/index.org");
 * request->setDelegate(this);
 * queue->enqueue(request);
 * @endcode
 */
class CloudTransferQueue : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs the queue.
     * @param resolver Provides the container directory (not owned).
     * @param copier Executes the copies (not owned).
     * @param status Progress observer (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    CloudTransferQueue(ContainerResolver *resolver,
                       IFileCopier *copier,
                       TransferStatus *status,
                       QObject *parent = nullptr);
    ~CloudTransferQueue() override;

    /**
     * @brief Appends a request and tries to start it.
     *
     * A request can only be enqueued once; further attempts are logged and
     * ignored. Safe to call from any thread.
     */
    void enqueue(const TransferRequestPtr &request);

    /// Stops dispatching new requests. The active transfer keeps running.
    void pause();

    /// Allows dispatching again and starts the next request.
    void resume();

    /// Drops every pending request without notifying it. The active transfer keeps running.
    void abort();

    [[nodiscard]] bool busy() const;
    [[nodiscard]] int queueSize() const;
    [[nodiscard]] bool isPaused() const { return paused_; }
    [[nodiscard]] TransferQueueState state() const { return state_; }
    [[nodiscard]] TransferRequestPtr activeRequest() const { return active_; }

    /**
     * @brief Resolves a remote locator to a path in the container.
     *
     * Relative locators are resolved against @p documentsPath and must stay
     * below it. Absolute locators are only normalized.
     * @return The decoded path, or an empty string if it is empty or
     *         escapes @p documentsPath.
     */
    [[nodiscard]] static QString remotePathFor(const QString &documentsPath, const QUrl &remoteLocator);

signals:
    void transferStarted(quint64 id, const QString &fileName);
    void transferCompleted(quint64 id);
    void transferFailed(quint64 id, const QString &errorText, int statusCode);

    /// Emitted when pending requests are dropped by abort() or a failure cascade
    void pendingDiscarded(int count);

    void queueChanged();

    /// Emitted when the last transfer finishes and nothing is pending
    void allTransfersCompleted();

private:
    void dispatchNext();
    void startHead();
    void process(const TransferRequestPtr &request);
    void finish(const TransferRequestPtr &request);
    void notifyOutcome(const TransferRequestPtr &request);

    void onCopySucceeded(quint64 id);
    void onCopyFailed(quint64 id, const QString &errorString);
    void publishCopyCompleted();

    [[nodiscard]] static QString resolveLocalPath(const QString &localPath);
    [[nodiscard]] bool isOwnerThread() const;

    void transitionTo(TransferQueueState newState);

    ContainerResolver *resolver_ = nullptr;
    IFileCopier *copier_ = nullptr;
    TransferStatus *status_ = nullptr;

    QQueue<TransferRequestPtr> pending_;
    TransferRequestPtr active_;
    bool paused_ = false;
    quint64 nextId_ = 1;

    // dispatchNext() is re-entered from finish(); nested calls only set the flag
    bool dispatching_ = false;
    bool redispatchRequested_ = false;
    // Set by finish(), cleared when allTransfersCompleted() is emitted
    bool transferFinished_ = false;

    TransferQueueState state_ = TransferQueueState::Idle;
};

#endif // CLOUDTRANSFERQUEUE_H
