/*!
 * @file        eventbus.cppm
 * @brief       Structured backup log events and the publish/subscribe bus.
 * @details     The engine reports every notable action as a LogEvent and every
 *              job state mutation as a JobSnapshot. Both travel through a
 *              single EventBus that any consumer (console sink, state file
 *              writer, remote server, future UI) can subscribe to without
 *              reaching into engine internals.
 *
 *              Publishing is thread-safe and may happen from worker threads.
 *              Registered LogSink instances are called synchronously on the
 *              publishing thread; QObject subscribers receive the signals
 *              through normal Qt connections (queued across threads).
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QDateTime>
#include <QList>
#include <QMutex>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module keeper.core.eventbus;
import keeper.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

//!< @brief Severity of a log event.
KEEPER_MODULE_EXPORT enum class LogType {
    Info,
    Warning,
    Error
};

//!< @brief What happened.
KEEPER_MODULE_EXPORT enum class ActionType {
    BackupStarted,
    BackupCompleted,
    BackupPaused,
    BackupResumed,
    BackupStopped,
    BackupCancelled,
    BackupError,
    FileCopy,
    FileEncrypt,
    FileSkipped,
    DirCreate,
    BusinessSoftwareDetected,
    BusinessSoftwareCleared,
    JobCreated,
    JobDeleted,
    JobEdited
};

/**
 * @brief One structured log record.
 *
 * Times are in milliseconds. transferTimeMs is -1 for a failed copy;
 * encryptionTimeMs is 0 when no encryption ran and -1 when it failed.
 */
KEEPER_MODULE_EXPORT struct LogEvent {
    QDateTime timestamp;
    QString backupName;
    BackupType backupType = BackupType::Full;
    QString sourcePath;
    QString targetPath;
    qint64 fileSize = 0;
    qint64 transferTimeMs = 0;
    qint64 encryptionTimeMs = 0;
    QString message;
    LogType logType = LogType::Info;
    ActionType actionType = ActionType::FileCopy;
};

//!< @brief Returns "INFO", "WARNING" or "ERROR".
KEEPER_MODULE_EXPORT QString logTypeToString(LogType type);

//!< @brief Returns the upper-case action name, e.g. "FILE_COPY".
KEEPER_MODULE_EXPORT QString actionTypeToString(ActionType type);

/**
 * @brief Write-only logging interface consumed by the engine.
 */
KEEPER_MODULE_EXPORT class LogSink {
public:
    virtual ~LogSink() = default;

    /**
     * @brief Receives one event.
     *
     * Called on the publishing thread; implementations must be thread-safe.
     *
     * @param event Event to record.
     */
    virtual void write(const LogEvent& event) = 0;
};

/**
 * @brief Publish/subscribe hub for log events and job state changes.
 */
KEEPER_MODULE_EXPORT class EventBus : public QObject {

    Q_OBJECT

public:
    explicit EventBus(QObject* parent = nullptr);

    /**
     * @brief Registers a sink. The bus does not take ownership.
     * @param sink Sink to call for every published event.
     */
    void addSink(LogSink* sink);

    //!< @brief Unregisters a sink.
    void removeSink(LogSink* sink);

    /**
     * @brief Publishes a log event to all sinks and subscribers.
     *
     * A missing timestamp is filled with the current time.
     *
     * @param event Event to publish.
     */
    void publish(LogEvent event);

    //!< @brief Publishes a job state change.
    void publishState(const JobSnapshot& snapshot);

signals:
    //!< @brief Emitted for every published log event.
    void logEventPublished(const LogEvent& event);

    //!< @brief Emitted whenever a job's definition or state changes.
    void jobStateChanged(const JobSnapshot& snapshot);

private:
    QMutex m_mutex;             //!< Guards m_sinks.
    QList<LogSink*> m_sinks;    //!< Registered sinks (not owned).
};

#include "eventbus.moc"
