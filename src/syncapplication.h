/**
 * @file syncapplication.h
 * @brief Wires the sync services together and runs command-line requests.
 */

#ifndef SYNCAPPLICATION_H
#define SYNCAPPLICATION_H

#include <QList>
#include <QObject>
#include <QString>
#include <memory>

#include "models/transferrequest.h"
#include "services/syncsettings.h"

class CloudTransferQueue;
class ContainerResolver;
class ErrorHandler;
class LocalCloudStorage;
class LocalFileCopier;
class QTimer;
class TransferService;
class TransferStatus;

struct ResolutionOutcome;

/**
 * @brief One unit of work requested on the command line.
 */
struct SyncCommand {
    enum class Type { Download, Upload, Index, Status };

    Type type = Type::Status;
    QString remotePath;  // Relative to Documents unless absolute
    QString localPath;
};

/**
 * @brief Owns the service graph for one process.
 *
 * Construction kicks off container resolution. run() waits for it, queues
 * the commands, and emits finished() once the queue has drained.
 */
class SyncApplication : public QObject, public TransferDelegate
{
    Q_OBJECT

public:
    explicit SyncApplication(const SyncSettings &settings, QObject *parent = nullptr);
    ~SyncApplication() override;

    /**
     * @brief Queues the commands once the container has been resolved.
     * @param commands Work to perform, in order.
     * @param abortOnFailure Stop the remaining transfers after the first failure.
     */
    void run(const QList<SyncCommand> &commands, bool abortOnFailure);

    [[nodiscard]] TransferService *transferService() const { return transferService_; }
    [[nodiscard]] int failureCount() const { return failureCount_; }

    void transferComplete(TransferRequest &request) override;
    void transferFailed(TransferRequest &request) override;

signals:
    /// @param exitCode 0 if everything succeeded, 1 otherwise
    void finished(int exitCode);

private:
    void onContainerResolved(const ResolutionOutcome &outcome);
    void onAllTransfersCompleted();
    void queueCommands();
    void printStatus();
    void finish();

    SyncSettings settings_;

    std::unique_ptr<LocalCloudStorage> storage_;
    ContainerResolver *resolver_ = nullptr;
    LocalFileCopier *copier_ = nullptr;
    TransferStatus *status_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;
    CloudTransferQueue *queue_ = nullptr;
    TransferService *transferService_ = nullptr;
    QTimer *synchronizationTimer_ = nullptr;

    QList<SyncCommand> commands_;
    bool abortOnFailure_ = false;
    bool running_ = false;
    bool resolutionDone_ = false;
    bool queuing_ = false;
    bool finished_ = false;
    int failureCount_ = 0;
    int droppedCount_ = 0;
};

#endif // SYNCAPPLICATION_H
