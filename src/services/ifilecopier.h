/**
 * @file ifilecopier.h
 * @brief Interface for whole-file copy operations used by the transfer queue.
 */

#ifndef IFILECOPIER_H
#define IFILECOPIER_H

#include <QObject>
#include <QString>

/**
 * @brief Abstract interface for asynchronous single-file copies.
 *
 * Both operations return immediately. Exactly one of copySucceeded() or
 * copyFailed() is emitted later for each call, on the thread that owns the
 * copier, carrying the id the caller passed in.
 *
 * @par Example usage:
 * @code
 * IFileCopier *copier = new LocalFileCopier(this);   // production
 * IFileCopier *copier = new MockFileCopier(this);    // tests
 *
 * connect(copier, &IFileCopier::copySucceeded, this, &MyClass::onCopied);
 * copier->download(1, "/cloud/Documents/index.org", "/tmp/index.org");
 * @endcode
 */
class IFileCopier : public QObject
{
    Q_OBJECT

public:
    explicit IFileCopier(QObject *parent = nullptr) : QObject(parent) {}
    ~IFileCopier() override = default;

    /**
     * @brief Copies a local file into the container.
     * @pre @p from exists and is readable. Only checked by Q_ASSERT; release
     *      builds report a violation as an ordinary copy failure.
     * @param id Caller-chosen operation id echoed in the result signal.
     * @param from Absolute local source path. Must exist and be readable.
     * @param to Absolute destination path inside the container.
     */
    virtual void upload(quint64 id, const QString &from, const QString &to) = 0;

    /**
     * @brief Copies a file out of the container.
     * @param id Caller-chosen operation id echoed in the result signal.
     * @param from Absolute source path inside the container.
     * @param to Absolute local destination path.
     */
    virtual void download(quint64 id, const QString &from, const QString &to) = 0;

signals:
    void copySucceeded(quint64 id);
    void copyFailed(quint64 id, const QString &errorString);
};

#endif // IFILECOPIER_H
