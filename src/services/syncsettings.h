/**
 * @file syncsettings.h
 * @brief Persistent configuration of the sync storage and queue.
 */

#ifndef SYNCSETTINGS_H
#define SYNCSETTINGS_H

#include <QString>

/**
 * @brief Settings persisted with QSettings.
 *
 * Uses the application's default QSettings location unless an INI file is
 * given, which is how tests and --config select their own file.
 *
 * Keys:
 * - storage/rootPath: directory standing in for the cloud store root
 * - storage/containerIdentifier: container to use, empty for the default
 * - storage/accountIdentity: signed-in account, empty when signed out
 * - storage/indexFilename: index document inside Documents
 * - sync/intervalSeconds: periodic synchronization, 0 disables it
 * - general/verbose: verbose logging
 */
class SyncSettings
{
public:
    static constexpr int DefaultSyncIntervalSeconds = 300;

    SyncSettings() = default;

    /**
     * @brief Loads settings from the default location.
     */
    [[nodiscard]] static SyncSettings load();

    /**
     * @brief Loads settings from an INI file.
     * @param iniPath Path of the INI file. Missing files yield defaults.
     */
    [[nodiscard]] static SyncSettings loadFrom(const QString &iniPath);

    void save() const;
    void saveTo(const QString &iniPath) const;

    [[nodiscard]] static QString defaultRootPath();

    QString rootPath = defaultRootPath();
    QString containerIdentifier;
    QString accountIdentity;
    QString indexFilename = QStringLiteral("index.org");
    int syncIntervalSeconds = DefaultSyncIntervalSeconds;
    bool verbose = false;
};

#endif // SYNCSETTINGS_H
