/**
 * @file transferstatus.h
 * @brief Observable progress state of the transfer currently in flight.
 */

#ifndef TRANSFERSTATUS_H
#define TRANSFERSTATUS_H

#include <QObject>
#include <QString>

/**
 * @brief Holds the name and progress of the active transfer.
 *
 * The queue writes the fields and then calls updateStatus(), so observers
 * see a consistent snapshot. showActivity() is the global busy indicator
 * raised whenever work is queued.
 *
 * @par Example usage:
 * @code
 * TransferStatus *status = new TransferStatus(this);
 * connect(status, &TransferStatus::statusUpdated, this, [status]() {
 *     qInfo() << status->transferFilename() << status->progressPercent();
 * });
 * @endcode
 */
class TransferStatus : public QObject
{
    Q_OBJECT

public:
    explicit TransferStatus(QObject *parent = nullptr);
    ~TransferStatus() override = default;

    [[nodiscard]] QString transferFilename() const { return transferFilename_; }
    void setTransferFilename(const QString &filename) { transferFilename_ = filename; }

    [[nodiscard]] int progressTotal() const { return progressTotal_; }
    void setProgressTotal(int total);

    [[nodiscard]] int progressCurrent() const { return progressCurrent_; }
    void setProgressCurrent(int current);

    /// Progress as 0..100, 0 while the total is unknown
    [[nodiscard]] int progressPercent() const;

    [[nodiscard]] int updateCount() const { return updateCount_; }

public slots:
    /// Publishes the current fields to observers
    void updateStatus();

    /// Raises the busy indicator
    void showActivity();

signals:
    void statusUpdated(const QString &filename, int current, int total);
    void activityShown();

private:
    QString transferFilename_;
    int progressTotal_ = 0;
    int progressCurrent_ = 0;
    int updateCount_ = 0;
};

#endif // TRANSFERSTATUS_H
