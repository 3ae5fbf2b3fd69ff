#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include "syncapplication.h"
#include "services/syncsettings.h"
#include "utils/logging.h"
#include "version.h"

namespace {

bool parseCommands(const QStringList &args, QList<SyncCommand> &commands, QString &error)
{
    if (args.isEmpty()) {
        error = QStringLiteral("No command given");
        return false;
    }

    const QString command = args.first();
    const QStringList operands = args.mid(1);

    if (command == QLatin1String("status")) {
        if (!operands.isEmpty()) {
            error = QStringLiteral("status takes no arguments");
            return false;
        }
        commands.append(SyncCommand{SyncCommand::Type::Status, QString(), QString()});
        return true;
    }

    if (command == QLatin1String("index")) {
        if (operands.size() != 1) {
            error = QStringLiteral("index takes exactly one local path");
            return false;
        }
        commands.append(SyncCommand{SyncCommand::Type::Index, QString(), operands.first()});
        return true;
    }

    if (command == QLatin1String("download") || command == QLatin1String("upload")) {
        if (operands.isEmpty() || operands.size() % 2 != 0) {
            error = QStringLiteral("%1 takes pairs of paths").arg(command);
            return false;
        }
        const bool isUpload = command == QLatin1String("upload");
        for (int i = 0; i < operands.size(); i += 2) {
            SyncCommand entry;
            if (isUpload) {
                entry.type = SyncCommand::Type::Upload;
                entry.localPath = QFileInfo(operands.at(i)).absoluteFilePath();
                entry.remotePath = operands.at(i + 1);
            } else {
                entry.type = SyncCommand::Type::Download;
                entry.remotePath = operands.at(i);
                entry.localPath = QFileInfo(operands.at(i + 1)).absoluteFilePath();
            }
            commands.append(entry);
        }
        return true;
    }

    error = QStringLiteral("Unknown command \"%1\"").arg(command);
    return false;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("orgsync");
    app.setApplicationVersion(ORGSYNC_VERSION);
    app.setOrganizationName("orgsync");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Copies org documents to and from a cloud-synced folder");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Read settings from <file> instead of the default location",
        "file");
    parser.addOption(configOption);

    QCommandLineOption abortOption(
        QStringList() << "a" << "abort-on-failure",
        "Skip the remaining transfers after the first failure");
    parser.addOption(abortOption);

    parser.addPositionalArgument("command", "status | index <local> | download <remote> <local>... | upload <local> <remote>...");

    parser.process(app);

    const SyncSettings settings = parser.isSet(configOption)
        ? SyncSettings::loadFrom(parser.value(configOption))
        : SyncSettings::load();

    // Set verbose logging flag
    orgsync::verboseLogging = parser.isSet(verboseOption) || settings.verbose;

    if (orgsync::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    QList<SyncCommand> commands;
    QString error;
    if (!parseCommands(parser.positionalArguments(), commands, error)) {
        qCritical().noquote() << error;
        qCritical().noquote() << parser.helpText();
        return 2;
    }

    SyncApplication syncApp(settings);
    QObject::connect(&syncApp, &SyncApplication::finished, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    }, Qt::QueuedConnection);
    syncApp.run(commands, parser.isSet(abortOption));

    return app.exec();
}
