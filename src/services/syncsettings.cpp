#include "syncsettings.h"

#include <QDebug>
#include <QDir>
#include <QSettings>

namespace {

SyncSettings readSettings(const QSettings &settings)
{
    SyncSettings result;
    result.rootPath = settings.value("storage/rootPath", SyncSettings::defaultRootPath()).toString();
    result.containerIdentifier = settings.value("storage/containerIdentifier").toString();
    result.accountIdentity = settings.value("storage/accountIdentity").toString();
    result.indexFilename = settings.value("storage/indexFilename", result.indexFilename).toString().trimmed();
    result.verbose = settings.value("general/verbose", false).toBool();

    bool ok = false;
    const int interval = settings.value("sync/intervalSeconds",
                                        SyncSettings::DefaultSyncIntervalSeconds).toInt(&ok);
    if (!ok || interval < 0) {
        qWarning() << "SyncSettings: Invalid sync/intervalSeconds, using"
                   << SyncSettings::DefaultSyncIntervalSeconds;
        result.syncIntervalSeconds = SyncSettings::DefaultSyncIntervalSeconds;
    } else {
        result.syncIntervalSeconds = interval;
    }

    if (result.indexFilename.isEmpty() || result.indexFilename.contains('/')) {
        qWarning() << "SyncSettings: Invalid storage/indexFilename" << result.indexFilename;
        result.indexFilename = QStringLiteral("index.org");
    }

    return result;
}

void writeSettings(QSettings &settings, const SyncSettings &values)
{
    settings.setValue("storage/rootPath", values.rootPath);
    settings.setValue("storage/containerIdentifier", values.containerIdentifier);
    settings.setValue("storage/accountIdentity", values.accountIdentity);
    settings.setValue("storage/indexFilename", values.indexFilename);
    settings.setValue("sync/intervalSeconds", values.syncIntervalSeconds);
    settings.setValue("general/verbose", values.verbose);
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qWarning() << "SyncSettings: Failed to write" << settings.fileName();
    }
}

} // namespace

SyncSettings SyncSettings::load()
{
    QSettings settings;
    return readSettings(settings);
}

SyncSettings SyncSettings::loadFrom(const QString &iniPath)
{
    QSettings settings(iniPath, QSettings::IniFormat);
    return readSettings(settings);
}

void SyncSettings::save() const
{
    QSettings settings;
    writeSettings(settings, *this);
}

void SyncSettings::saveTo(const QString &iniPath) const
{
    QSettings settings(iniPath, QSettings::IniFormat);
    writeSettings(settings, *this);
}

QString SyncSettings::defaultRootPath()
{
    return QDir::home().filePath(QStringLiteral("CloudDrive"));
}
