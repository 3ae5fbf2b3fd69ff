/**
 * @file localcloudstorage.h
 * @brief Cloud store backed by a locally mounted sync directory.
 */

#ifndef LOCALCLOUDSTORAGE_H
#define LOCALCLOUDSTORAGE_H

#include <QString>

#include "icloudstorage.h"

/**
 * @brief ICloudStorage over a directory kept in sync by a desktop client.
 *
 * Containers are subdirectories of the root path. The default container is
 * the root itself. The store reports an identity only when an account name is
 * configured and the root directory exists.
 */
class LocalCloudStorage : public ICloudStorage
{
public:
    LocalCloudStorage(const QString &rootPath, const QString &accountIdentity);
    ~LocalCloudStorage() override = default;

    [[nodiscard]] QString rootPath() const { return rootPath_; }

    [[nodiscard]] QString containerPath(const QString &identifier) const override;
    [[nodiscard]] QString identityToken() const override;
    bool startSynchronizing(const QString &path, QString *errorString) override;

private:
    const QString rootPath_;
    const QString accountIdentity_;
};

#endif // LOCALCLOUDSTORAGE_H
