/*!
 * @file        state_writer.cppm
 * @brief       Real-time job state file.
 * @details     Subscribes to job state changes and keeps a JSON document with
 *              the state of every job up to date on disk. Writes are debounced
 *              and atomic, so readers never see a partial file.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QTimer>

#ifndef Q_MOC_RUN
export module keeper.services.state_writer;
import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.jobregistry;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Writes the registry state to a JSON file after every change.
 */
KEEPER_MODULE_EXPORT class StateWriter : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a writer.
     * @param registry Job store to serialize (not owned).
     * @param bus Source of change notifications (not owned).
     * @param path Output file.
     * @param parent Optional parent QObject.
     */
    StateWriter(JobRegistry* registry, EventBus* bus, const QString& path, QObject* parent = nullptr);

    //!< @brief Output file.
    QString path() const { return m_path; }

    //!< @brief Debounce delay in milliseconds.
    void setDelay(int ms) { m_saveTimer.setInterval(ms); }

public slots:
    //!< @brief Schedule a write after the debounce delay.
    void scheduleSave();

    /**
     * @brief Write immediately.
     * @return false if the file could not be written.
     */
    bool save();

private:
    JobRegistry* m_registry = nullptr;  //!< Not owned.
    QString m_path;                     //!< Output file.
    QTimer m_saveTimer;                 //!< Debounce timer.
};

#include "state_writer.moc"
