module;
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>

module keeper.services.state_writer;

import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.jobregistry;

Q_LOGGING_CATEGORY(lcState, "keeper.state")

StateWriter::StateWriter(JobRegistry* registry, EventBus* bus, const QString& path, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_path(path)
{
    m_saveTimer.setSingleShot(true);
    m_saveTimer.setInterval(400);
    connect(&m_saveTimer, &QTimer::timeout, this, &StateWriter::save);
    if (bus) connect(bus, &EventBus::jobStateChanged, this, &StateWriter::scheduleSave);
    if (auto* app = QCoreApplication::instance()) {
        connect(app, &QCoreApplication::aboutToQuit, this, &StateWriter::save);
    }
}

void StateWriter::scheduleSave()
{
    if (!m_saveTimer.isActive()) m_saveTimer.start();
}

bool StateWriter::save()
{
    if (m_path.isEmpty()) return false;

    QJsonArray jobs;
    const QList<JobSnapshot> snapshots = m_registry->snapshot();
    for (const JobSnapshot& snap : snapshots) {
        QJsonObject obj;
        obj.insert("name", snap.job.name);
        obj.insert("type", backupTypeToString(snap.job.type));
        obj.insert("sourcePath", snap.job.sourcePath);
        obj.insert("targetPath", snap.job.targetPath);
        obj.insert("status", jobStatusToString(snap.state.status));
        obj.insert("progress", snap.state.progressPercentage);
        obj.insert("filesTotal", snap.state.filesTotal);
        obj.insert("filesDone", snap.state.filesDone);
        obj.insert("filesRemaining", snap.state.filesTotal - snap.state.filesDone);
        obj.insert("totalBytes", static_cast<double>(snap.state.totalBytes));
        obj.insert("bytesCopied", static_cast<double>(snap.state.bytesCopied));
        obj.insert("bytesRemaining", static_cast<double>(snap.state.totalBytes - snap.state.bytesCopied));
        obj.insert("currentFile", snap.state.currentFile);
        obj.insert("pausedByBusinessSoftware", snap.state.pausedByBusinessSoftware);
        obj.insert("error", snap.state.errorMessage);
        obj.insert("lastActionTime", snap.state.lastActionTime.toString(Qt::ISODateWithMs));
        jobs.append(obj);
    }

    QJsonObject root;
    root.insert("version", 1);
    root.insert("jobs", jobs);

    QDir().mkpath(QFileInfo(m_path).absolutePath());
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcState) << "Cannot write state file" << m_path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCWarning(lcState) << "Cannot commit state file" << m_path << file.errorString();
        return false;
    }
    return true;
}
