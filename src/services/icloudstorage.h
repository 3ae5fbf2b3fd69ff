/**
 * @file icloudstorage.h
 * @brief Interface for the backing cloud store.
 *
 * This interface allows dependency injection of the storage backend, enabling
 * runtime swapping between the production store and mock implementations.
 */

#ifndef ICLOUDSTORAGE_H
#define ICLOUDSTORAGE_H

#include <QString>

/**
 * @brief Abstract interface for the store that hosts the sync container.
 *
 * containerPath() and startSynchronizing() are called from worker threads,
 * so implementations must be safe to call concurrently with themselves.
 * identityToken() is only queried from the thread that owns the resolver.
 *
 * @par Example usage:
 * @code
 * // Production code
 * ICloudStorage *storage = new LocalCloudStorage(settings.rootPath, settings.accountIdentity);
 *
 * // Test code
 * ICloudStorage *storage = new MockCloudStorage();
 *
 * ContainerResolver resolver(storage, settings.containerIdentifier);
 * @endcode
 */
class ICloudStorage
{
public:
    virtual ~ICloudStorage() = default;

    /**
     * @brief Returns the root location of a container.
     * @param identifier Container identifier, empty for the default container.
     * @return Absolute path of the container root, or an empty string when
     *         the store cannot provide one.
     */
    [[nodiscard]] virtual QString containerPath(const QString &identifier) const = 0;

    /**
     * @brief Returns the identity token of the signed-in account.
     * @return Opaque token, empty when no account is active.
     */
    [[nodiscard]] virtual QString identityToken() const = 0;

    /**
     * @brief Asks the store to bring a path up to date with the cloud.
     * @param path The item or directory to synchronize.
     * @param errorString Receives a description on failure (may be null).
     * @return True if the request was accepted.
     */
    virtual bool startSynchronizing(const QString &path, QString *errorString) = 0;
};

#endif // ICLOUDSTORAGE_H
