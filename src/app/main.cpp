#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QLoggingCategory>
#include <QTextStream>

#include <memory>

import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.settings;
import keeper.core.jobregistry;
import keeper.core.backupengine;
import keeper.services.log_sink;
import keeper.services.state_writer;
import keeper.services.business_monitor;
import keeper.services.network_monitor;
import keeper.services.remote_server;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

Q_LOGGING_CATEGORY(lcApp, "keeper.app")

static int persistJobs(const QString& path, const JobRegistry& registry)
{
    QString error;
    if (!saveJobs(path, registry.jobs(), &error)) {
        qCCritical(lcApp).noquote() << error;
        return 1;
    }
    return 0;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Keeper"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Multi-job backup engine"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption settingsOption(QStringList{ "s", "settings" },
                                           QStringLiteral("Settings file."), QStringLiteral("path"));
    const QCommandLineOption addOption(QStringLiteral("add"),
                                       QStringLiteral("Add a job: name,source,target[,Full|Differential]."),
                                       QStringLiteral("definition"));
    const QCommandLineOption removeOption(QStringLiteral("remove"), QStringLiteral("Remove a job."), QStringLiteral("name"));
    const QCommandLineOption listOption(QStringLiteral("list"), QStringLiteral("List configured jobs."));
    const QCommandLineOption onceOption(QStringLiteral("once"), QStringLiteral("Exit when the started jobs are finished."));
    parser.addOptions({ settingsOption, addOption, removeOption, listOption, onceOption });
    parser.addPositionalArgument(QStringLiteral("jobs"), QStringLiteral("Jobs to start (default: all)."), QStringLiteral("[jobs...]"));
    parser.process(app);

    Settings settings;
    QString error;
    const QString settingsPath = parser.isSet(settingsOption) ? parser.value(settingsOption) : defaultSettingsPath();
    if (!loadSettings(settingsPath, settings, &error)) {
        qCCritical(lcApp).noquote() << error;
        return 1;
    }

    EventBus bus;
    CategoryLogSink journal;
    bus.addSink(&journal);

    JobRegistry registry(&bus);
    const QString jobsPath = QDir(settings.stateDirectory).filePath(QStringLiteral("jobs.json"));
    QList<BackupJob> definitions;
    if (!loadJobs(jobsPath, definitions, &error)) {
        qCCritical(lcApp).noquote() << error;
        return 1;
    }
    for (const BackupJob& job : definitions) {
        const ControlResult result = registry.addJob(job);
        if (!result.ok()) qCWarning(lcApp).noquote() << "Ignoring job" << job.name << ":" << result.message;
    }

    BackupEngine engine(&registry, &bus, settings);

    // Job list management
    if (parser.isSet(addOption)) {
        const QStringList fields = parser.value(addOption).split(',');
        const auto type = backupTypeFromString(fields.value(3, QStringLiteral("Full")));
        if (fields.size() < 3 || !type) {
            qCCritical(lcApp) << "Expected name,source,target[,Full|Differential]";
            return 1;
        }
        const ControlResult result = engine.addJob(BackupJob{ fields.at(0).trimmed(), fields.at(1), fields.at(2), *type });
        if (!result.ok()) {
            qCCritical(lcApp).noquote() << result.message;
            return 1;
        }
        return persistJobs(jobsPath, registry);
    }
    if (parser.isSet(removeOption)) {
        const ControlResult result = engine.removeJob(parser.value(removeOption));
        if (!result.ok()) {
            qCCritical(lcApp).noquote() << result.message;
            return 1;
        }
        return persistJobs(jobsPath, registry);
    }
    if (parser.isSet(listOption)) {
        QTextStream out(stdout);
        for (const BackupJob& job : registry.jobs()) {
            out << job.name << '\t' << backupTypeToString(job.type) << '\t'
                << job.sourcePath << " -> " << job.targetPath << '\n';
        }
        return 0;
    }

    StateWriter stateWriter(&registry, &bus, QDir(settings.stateDirectory).filePath(QStringLiteral("state.json")));

    BusinessSoftwareMonitor businessMonitor(std::make_unique<SystemProcessObserver>(),
                                            settings.businessSoftware,
                                            settings.businessPollIntervalMs);
    QObject::connect(&businessMonitor, &BusinessSoftwareMonitor::businessSoftwareRunningChanged,
                     &engine, &BackupEngine::setBusinessSoftwareActive);

    NetworkLoadMonitor networkMonitor([&engine]() { return engine.bytesTransferred(); },
                                      [&engine]() { return engine.runningCount(); },
                                      settings.networkLoadThresholdBytesPerSec,
                                      settings.maxConcurrentJobs,
                                      settings.networkPollIntervalMs);
    QObject::connect(&networkMonitor, &NetworkLoadMonitor::budgetChanged,
                     &engine, &BackupEngine::setConcurrencyBudget);

    RemoteControlServer remote(&registry, &engine);
    if (!remote.listen(settings.remotePort)) {
        qCWarning(lcApp).noquote() << "Remote control disabled:" << remote.errorString();
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&]() {
        businessMonitor.stop();
        networkMonitor.stop();
        remote.close();
        engine.shutdown();
        engine.waitForDone();
        stateWriter.save();
    });

    if (parser.isSet(onceOption)) {
        QObject::connect(&engine, &BackupEngine::countsChanged, &app, [&engine]() {
            if (engine.runningCount() == 0 && engine.queuedCount() == 0) QCoreApplication::quit();
        }, Qt::QueuedConnection);
    }

    businessMonitor.start();
    networkMonitor.start();

    const QStringList requested = parser.positionalArguments();
    if (requested.isEmpty()) {
        engine.startAll();
    } else {
        const ControlResult result = engine.startSelected(requested);
        if (!result.ok()) qCWarning(lcApp).noquote() << result.message;
    }
    stateWriter.scheduleSave();

    if (parser.isSet(onceOption) && engine.runningCount() == 0 && engine.queuedCount() == 0) return 0;

    const int rc = app.exec();
    bus.removeSink(&journal);
    return rc;
}
