/*!
 * @file        prioritygate.cppm
 * @brief       Cross-job admission gate for priority extension files.
 * @details     Keeps a live count of not-yet-transferred priority files for
 *              every running job. While that count is above zero no
 *              non-priority transfer may begin anywhere. Priority requests
 *              never wait on the count; they only wait for non-priority
 *              transfers that were already in flight when the count rose, so
 *              priority and non-priority copies never overlap.
 *
 *              A job blocked on a user or business pause is suspended from
 *              the count, so a paused job does not starve every other job.
 *              Stopped or failed jobs retract their contribution entirely.
 *
 *              Priority files of different jobs are not arbitrated against
 *              each other: each job hands them in its own order (FIFO per
 *              job) and they may copy concurrently across jobs.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QMutex>
#include <QString>
#include <QWaitCondition>

#ifndef Q_MOC_RUN
export module keeper.core.prioritygate;
import keeper.core.jobcontrol;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Global priority preemption gate. Thread-safe.
 */
KEEPER_MODULE_EXPORT class PriorityGate {
public:
    /**
     * @brief Sets the number of pending priority files of a job.
     *
     * Called once a job has enumerated its file list. Replaces any
     * previous value for the job.
     *
     * @param job Job name.
     * @param count Pending priority files.
     */
    void registerPending(const QString& job, int count);

    //!< @brief Decrements a job's pending count after one priority file finished (or failed).
    void completeOne(const QString& job);

    //!< @brief Removes a job's contribution entirely (stop, error, completion).
    void retract(const QString& job);

    /**
     * @brief Excludes or re-includes a job's pending files while it is paused.
     * @param job Job name.
     * @param suspended true while the job waits on a pause.
     */
    void setSuspended(const QString& job, bool suspended);

    /**
     * @brief Blocks until a transfer of the given class may begin.
     *
     * Non-priority requests wait while any counted priority file is pending
     * or being transferred. Priority requests wait only for in-flight
     * non-priority transfers to drain. Waits wake periodically to observe
     * cancellation.
     *
     * @param isPriority Transfer class.
     * @param control Token of the requesting run.
     * @return false if the run was cancelled while waiting; no permit is held then.
     */
    bool acquire(bool isPriority, const JobControl& control);

    /**
     * @brief Admits a transfer only if it may begin right now.
     * @param isPriority Transfer class.
     * @return true if a permit was taken.
     */
    bool tryAcquire(bool isPriority);

    /**
     * @brief Blocks until a transfer of the given class could begin, without taking a permit.
     *
     * Used by callers that must hold no permit of this gate while they
     * wait on another one. Also returns when the run is paused.
     *
     * @param isPriority Transfer class.
     * @param control Token of the requesting run.
     * @return false if the run was cancelled while waiting.
     */
    bool waitUntilAdmissible(bool isPriority, const JobControl& control);

    //!< @brief Ends a transfer admitted by acquire() or tryAcquire().
    void release(bool isPriority);

    //!< @brief Counted pending priority files (suspended jobs excluded).
    int pendingCount() const;

    //!< @brief Non-priority transfers in flight.
    int activeNormalCount() const;

    //!< @brief Priority transfers in flight.
    int activePriorityCount() const;

private:
    struct JobEntry {
        int pending = 0;
        bool suspended = false;
    };

    int countedPendingLocked() const;
    bool admissibleLocked(bool isPriority) const;

    mutable QMutex m_mutex;             //!< Guards all members.
    QWaitCondition m_changed;           //!< Signalled on every change.
    QHash<QString, JobEntry> m_jobs;    //!< Per-job pending counts.
    int m_activeNormal = 0;             //!< Non-priority transfers in flight.
    int m_activePriority = 0;           //!< Priority transfers in flight.
};
