/*!
 * @file        jobregistry.cppm
 * @brief       Authoritative store of backup job definitions and live state.
 * @details     JobRegistry maps job names to their definition and current
 *              state. It is the single source of truth read by the remote
 *              control server and any UI, and written by the engine and its
 *              workers. Every access is serialized by a short-held mutex and
 *              readers always receive copies, so a reader never observes a
 *              half-updated job.
 *
 *              Status changes are validated against the job state machine;
 *              an invalid request leaves the state untouched and returns a
 *              typed ControlResult. Every mutation is published on the
 *              EventBus after the lock is released.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QList>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module keeper.core.jobregistry;
import keeper.core.jobtypes;
import keeper.core.eventbus;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Thread-safe registry of jobs and their live state.
 */
KEEPER_MODULE_EXPORT class JobRegistry {
public:
    /**
     * @brief Construct an empty registry.
     * @param bus Optional bus receiving state changes and CRUD events (not owned).
     */
    explicit JobRegistry(EventBus* bus = nullptr);

    /**
     * @brief Adds a job in the Ready state.
     *
     * Rejects empty names, empty paths, identical source and target and
     * names already present.
     *
     * @param job Job definition.
     * @return Success or DuplicateJob / InvalidJob.
     */
    ControlResult addJob(const BackupJob& job);

    /**
     * @brief Replaces a job definition.
     *
     * The job keeps its name unless @p job carries a different, unused one.
     * Refused while the job is Active or Paused.
     *
     * @param name Current job name.
     * @param job New definition.
     * @return Success or UnknownJob / JobBusy / DuplicateJob / InvalidJob.
     */
    ControlResult updateJob(const QString& name, const BackupJob& job);

    /**
     * @brief Removes a job. Refused while the job is Active or Paused.
     * @param name Job name.
     * @return Success or UnknownJob / JobBusy.
     */
    ControlResult removeJob(const QString& name);

    //!< @brief True if a job with this name exists.
    bool contains(const QString& name) const;

    //!< @brief Number of registered jobs.
    int count() const;

    //!< @brief Job names in insertion order.
    QStringList names() const;

    //!< @brief Job definitions in insertion order.
    QList<BackupJob> jobs() const;

    //!< @brief Definition of one job, if present.
    std::optional<BackupJob> job(const QString& name) const;

    //!< @brief State of one job, if present.
    std::optional<JobState> state(const QString& name) const;

    //!< @brief Consistent copy of every job, in insertion order.
    QList<JobSnapshot> snapshot() const;

    /**
     * @brief Moves a job to a new status.
     *
     * The request is validated with isValidTransition(). Leaving Paused
     * clears the business software marker. Moving to Ready starts a fresh
     * run and clears counters and the error message.
     *
     * @param name Job name.
     * @param to Requested status.
     * @param errorMessage Stored when @p to is Error.
     * @return Success or UnknownJob / InvalidTransition.
     */
    ControlResult transition(const QString& name, JobStatus to, const QString& errorMessage = QString());

    /**
     * @brief Pauses an Active job on behalf of the business software monitor.
     * @param name Job name.
     * @return true if the job was Active and is now Paused with the marker set.
     */
    bool pauseForBusinessSoftware(const QString& name);

    /**
     * @brief Resumes a job paused by the business software monitor.
     * @param name Job name.
     * @return true if the job was Paused with the marker and is now Active.
     */
    bool resumeFromBusinessSoftware(const QString& name);

    /**
     * @brief Clears the business software marker of a paused job.
     * @param name Job name.
     * @return true if the marker was set.
     */
    bool clearBusinessSoftwareMarker(const QString& name);

    /**
     * @brief Applies a progress update without changing the status.
     *
     * The callback runs under the registry lock and must stay short.
     * Status changes made by the callback are ignored.
     *
     * @param name Job name.
     * @param update Mutator for the job state.
     * @return false if the job does not exist.
     */
    bool updateProgress(const QString& name, const std::function<void(JobState&)>& update);

private:
    struct Entry {
        BackupJob job;
        JobState state;
    };

    ControlResult validateDefinition(const BackupJob& job) const;
    void publish(const JobSnapshot& snapshot) const;
    void publishAction(const BackupJob& job, ActionType action, const QString& message) const;

    mutable QMutex m_mutex;             //!< Guards m_entries and m_order.
    QHash<QString, Entry> m_entries;    //!< Jobs by name.
    QStringList m_order;                //!< Insertion order.
    EventBus* m_bus = nullptr;          //!< Not owned.
};
