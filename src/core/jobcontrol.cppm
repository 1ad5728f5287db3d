/*!
 * @file        jobcontrol.cppm
 * @brief       Pause and cancellation token shared by a job and its worker.
 * @details     JobControl replaces scattered boolean flags with one object
 *              carrying the pause and cancellation requests of a single run.
 *              The orchestrator writes it; the worker observes it at its
 *              check points: before admission to the gates, during gate
 *              waits, and at every chunk boundary of a streaming copy.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QMutex>
#include <QWaitCondition>

#ifndef Q_MOC_RUN
export module keeper.core.jobcontrol;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Cooperative pause/cancel token for one job run.
 *
 * All members are thread-safe.
 */
KEEPER_MODULE_EXPORT class JobControl {
public:
    //!< @brief Why a run was cancelled.
    enum class CancelReason {
        None,       //!< Not cancelled.
        Stop,       //!< User stop request.
        Shutdown    //!< Engine shutdown.
    };

    //!< @brief Request a pause at the next check point.
    void pause();

    //!< @brief Clear a pause request and wake the worker.
    void resume();

    /**
     * @brief Request cancellation and wake the worker.
     *
     * The first reason wins; later requests do not change it.
     *
     * @param reason Stop or Shutdown.
     */
    void cancel(CancelReason reason = CancelReason::Stop);

    //!< @brief True while a pause is requested.
    bool isPaused() const;

    //!< @brief True once cancellation was requested.
    bool isCancelled() const;

    //!< @brief Reason of the cancellation, None if not cancelled.
    CancelReason cancelReason() const;

    /**
     * @brief Blocks while paused.
     *
     * Returns as soon as the pause is lifted or the run is cancelled.
     *
     * @return false if the run was cancelled.
     */
    bool waitWhilePaused();

    /**
     * @brief Sleeps up to @p ms milliseconds, waking early on cancellation.
     * @param ms Sleep duration.
     * @return false if the run was cancelled.
     */
    bool sleepFor(int ms);

private:
    mutable QMutex m_mutex;                         //!< Guards all flags.
    QWaitCondition m_changed;                       //!< Signalled on every change.
    bool m_paused = false;                          //!< Pause requested.
    CancelReason m_cancel = CancelReason::None;     //!< Cancellation reason.
};
