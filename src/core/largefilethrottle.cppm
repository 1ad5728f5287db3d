/*!
 * @file        largefilethrottle.cppm
 * @brief       Global one-at-a-time admission gate for large files.
 * @details     Files whose size exceeds the configured threshold take the
 *              single permit of this gate before copying, so at most one
 *              large transfer is in flight system-wide. Normal-size files
 *              pass straight through and run fully in parallel.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QSemaphore>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module keeper.core.largefilethrottle;
import keeper.core.jobcontrol;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Single-permit semaphore for large transfers. Thread-safe.
 */
KEEPER_MODULE_EXPORT class LargeFileThrottle {
public:
    /**
     * @brief Takes the large file permit.
     *
     * A no-op returning true for non-large files. Waits wake periodically
     * to observe cancellation.
     *
     * @param isLarge Whether the file exceeds the threshold.
     * @param control Token of the requesting run.
     * @return false if the run was cancelled while waiting; no permit is held then.
     */
    bool acquire(bool isLarge, const JobControl& control);

    //!< @brief Returns the permit taken for a large file; no-op otherwise.
    void release(bool isLarge);

    //!< @brief True while a large transfer holds the permit.
    bool isHeld() const { return m_permit.available() == 0; }

private:
    QSemaphore m_permit{ 1 };   //!< The single large file permit.
};
