/**
 * @file localfilecopier.h
 * @brief IFileCopier that copies files on worker threads with QFile.
 */

#ifndef LOCALFILECOPIER_H
#define LOCALFILECOPIER_H

#include <QFutureWatcher>
#include <QList>

#include "ifilecopier.h"

/**
 * @brief Copies whole files on the global thread pool.
 *
 * An existing destination file is removed before copying. Results are
 * delivered through a QFutureWatcher, so the signals always fire on the
 * copier's own thread and never from the worker.
 */
class LocalFileCopier : public IFileCopier
{
    Q_OBJECT

public:
    explicit LocalFileCopier(QObject *parent = nullptr);
    ~LocalFileCopier() override;

    void upload(quint64 id, const QString &from, const QString &to) override;
    void download(quint64 id, const QString &from, const QString &to) override;

    /**
     * @brief Replaces the file at @p to with a copy of @p from.
     * @param from Source path.
     * @param to Destination path.
     * @param errorString Receives the failure description (may be null).
     * @return True on success.
     */
    static bool copyReplacing(const QString &from, const QString &to, QString *errorString);

private:
    struct CopyResult {
        bool success = false;
        QString error;
    };

    void startCopy(quint64 id, const QString &from, const QString &to, bool isUpload);

    QList<QFutureWatcher<CopyResult> *> watchers_;
};

#endif // LOCALFILECOPIER_H
