module;
#include <QObject>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QMutexLocker>
#include <QString>

module keeper.core.eventbus;

QString logTypeToString(LogType type)
{
    switch (type) {
    case LogType::Info: return QStringLiteral("INFO");
    case LogType::Warning: return QStringLiteral("WARNING");
    case LogType::Error: return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString actionTypeToString(ActionType type)
{
    switch (type) {
    case ActionType::BackupStarted: return QStringLiteral("BACKUP_STARTED");
    case ActionType::BackupCompleted: return QStringLiteral("BACKUP_COMPLETED");
    case ActionType::BackupPaused: return QStringLiteral("BACKUP_PAUSED");
    case ActionType::BackupResumed: return QStringLiteral("BACKUP_RESUMED");
    case ActionType::BackupStopped: return QStringLiteral("BACKUP_STOPPED");
    case ActionType::BackupCancelled: return QStringLiteral("BACKUP_CANCELLED");
    case ActionType::BackupError: return QStringLiteral("BACKUP_ERROR");
    case ActionType::FileCopy: return QStringLiteral("FILE_COPY");
    case ActionType::FileEncrypt: return QStringLiteral("FILE_ENCRYPT");
    case ActionType::FileSkipped: return QStringLiteral("FILE_SKIPPED");
    case ActionType::DirCreate: return QStringLiteral("DIR_CREATE");
    case ActionType::BusinessSoftwareDetected: return QStringLiteral("BUSINESS_SOFTWARE_DETECTED");
    case ActionType::BusinessSoftwareCleared: return QStringLiteral("BUSINESS_SOFTWARE_CLEARED");
    case ActionType::JobCreated: return QStringLiteral("JOB_CREATED");
    case ActionType::JobDeleted: return QStringLiteral("JOB_DELETED");
    case ActionType::JobEdited: return QStringLiteral("JOB_EDITED");
    }
    return QStringLiteral("UNKNOWN");
}

EventBus::EventBus(QObject* parent) : QObject(parent)
{
    qRegisterMetaType<LogEvent>();
    qRegisterMetaType<JobSnapshot>();
}

void EventBus::addSink(LogSink* sink)
{
    if (!sink) return;
    QMutexLocker locker(&m_mutex);
    if (!m_sinks.contains(sink)) m_sinks.append(sink);
}

void EventBus::removeSink(LogSink* sink)
{
    QMutexLocker locker(&m_mutex);
    m_sinks.removeAll(sink);
}

void EventBus::publish(LogEvent event)
{
    if (!event.timestamp.isValid()) event.timestamp = QDateTime::currentDateTime();

    QList<LogSink*> sinks;
    {
        QMutexLocker locker(&m_mutex);
        sinks = m_sinks;
    }
    for (LogSink* sink : sinks) sink->write(event);

    emit logEventPublished(event);
}

void EventBus::publishState(const JobSnapshot& snapshot)
{
    emit jobStateChanged(snapshot);
}
