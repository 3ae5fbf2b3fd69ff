/**
 * @file transferrequest.h
 * @brief A single upload or download handed to the CloudTransferQueue.
 */

#ifndef TRANSFERREQUEST_H
#define TRANSFERREQUEST_H

#include <QString>
#include <QUrl>
#include <memory>

enum class TransferDirection { Upload, Download };

/// @brief Convert TransferDirection to string for logging
[[nodiscard]] inline const char* directionToString(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::Upload: return "Upload";
        case TransferDirection::Download: return "Download";
    }
    return "Unknown";
}

class TransferRequest;
using TransferRequestPtr = std::shared_ptr<TransferRequest>;

/**
 * @brief Receives the final outcome of a transfer.
 *
 * Exactly one of the two methods is called, once, on the thread that owns
 * the queue. The delegate is not owned by the request and must outlive it
 * while the request is queued.
 */
class TransferDelegate
{
public:
    virtual ~TransferDelegate() = default;

    virtual void transferComplete(TransferRequest &request) = 0;
    virtual void transferFailed(TransferRequest &request) = 0;
};

/**
 * @brief Describes one whole-file copy between local storage and the container.
 *
 * The request is shared between the caller and the queue. The queue assigns
 * the id on enqueue and records the outcome exactly once before notifying
 * the delegate.
 */
class TransferRequest
{
public:
    /// Status code reported when the container was never resolved
    static constexpr int ServiceUnavailable = 503;
    /// Status code reported when the copy operation failed
    static constexpr int FileOperationFailed = 404;

    TransferRequest(TransferDirection direction, const QUrl &remoteLocator, const QString &localPath);

    [[nodiscard]] static TransferRequestPtr create(TransferDirection direction,
                                                   const QUrl &remoteLocator,
                                                   const QString &localPath);

    /**
     * @brief Creates a request that needs no I/O and reports success.
     * @param remoteLocator Locator shown in the status while the request is active.
     * @param delegate Receiver of the outcome (not owned, may be null).
     */
    [[nodiscard]] static TransferRequestPtr createDummy(const QUrl &remoteLocator,
                                                        TransferDelegate *delegate = nullptr);

    [[nodiscard]] quint64 id() const { return id_; }
    [[nodiscard]] bool isEnqueued() const { return id_ != 0; }

    [[nodiscard]] TransferDirection direction() const { return direction_; }
    [[nodiscard]] QUrl remoteLocator() const { return remoteLocator_; }
    [[nodiscard]] QString localPath() const { return localPath_; }

    /// Last path component of the remote locator, used for status display
    [[nodiscard]] QString remoteFileName() const;

    [[nodiscard]] bool isDummy() const { return dummy_; }
    void setDummy(bool dummy) { dummy_ = dummy; }

    [[nodiscard]] bool abortOnFailure() const { return abortOnFailure_; }
    void setAbortOnFailure(bool abort) { abortOnFailure_ = abort; }

    [[nodiscard]] TransferDelegate *delegate() const { return delegate_; }
    void setDelegate(TransferDelegate *delegate) { delegate_ = delegate; }

    /// @name Outcome
    /// @{
    [[nodiscard]] bool hasOutcome() const { return hasOutcome_; }
    [[nodiscard]] bool succeeded() const { return success_; }
    [[nodiscard]] QString errorText() const { return errorText_; }
    [[nodiscard]] int statusCode() const { return statusCode_; }

    void markSucceeded();
    void markFailed(const QString &errorText, int statusCode);
    /// @}

private:
    friend class CloudTransferQueue;

    void assignId(quint64 id) { id_ = id; }

    /// Returns false if a delegate notification was already delivered
    bool claimNotification();

    quint64 id_ = 0;
    TransferDirection direction_;
    QUrl remoteLocator_;
    QString localPath_;
    bool dummy_ = false;
    bool abortOnFailure_ = false;
    TransferDelegate *delegate_ = nullptr;

    bool hasOutcome_ = false;
    bool success_ = false;
    QString errorText_;
    int statusCode_ = 0;
    bool notified_ = false;
};

#endif // TRANSFERREQUEST_H
