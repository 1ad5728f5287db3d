/*!
 * @file        business_monitor.cppm
 * @brief       Periodic detection of configured business applications.
 * @details     Provides a platform-agnostic observer of running processes and a
 *              monitor that polls it on a fixed interval. Whenever one of the
 *              configured business applications starts or the last one exits,
 *              the monitor reports the change; the backup engine reacts by
 *              force-pausing or resuming its jobs.
 *
 *              Process enumeration sits behind the ProcessObserver interface
 *              so it can be replaced in tests without spawning processes.
 *              When the platform backend cannot list processes the monitor
 *              treats the list as empty.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <memory>
#include <optional>

#ifndef Q_MOC_RUN
export module keeper.services.business_monitor;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Source of running process names.
 */
KEEPER_MODULE_EXPORT class ProcessObserver {
public:
    virtual ~ProcessObserver() = default;

    /**
     * @brief Lists the names of running processes.
     * @return Raw process names, or std::nullopt when listing failed.
     */
    virtual std::optional<QStringList> runningProcessNames() const = 0;
};

/**
 * @brief Platform process observer.
 *
 * Reads /proc on Linux, runs `ps` on other POSIX systems and `tasklist`
 * on Windows.
 */
KEEPER_MODULE_EXPORT class SystemProcessObserver : public ProcessObserver {
public:
    std::optional<QStringList> runningProcessNames() const override;
};

/**
 * @brief Polls a ProcessObserver for configured business applications.
 */
KEEPER_MODULE_EXPORT class BusinessSoftwareMonitor : public QObject {

    Q_OBJECT

    //!< @brief True while any configured application runs.
    Q_PROPERTY(bool businessSoftwareRunning READ isBusinessSoftwareRunning NOTIFY businessSoftwareRunningChanged)

    //!< @brief Name of the first detected application.
    Q_PROPERTY(QString detectedName READ detectedName NOTIFY businessSoftwareRunningChanged)

public:
    /**
     * @brief Construct a monitor.
     * @param observer Process source (owned).
     * @param names Business application names; normalized internally.
     * @param intervalMs Poll interval in milliseconds.
     * @param parent Optional parent QObject.
     */
    BusinessSoftwareMonitor(std::unique_ptr<ProcessObserver> observer,
                            const QStringList& names,
                            int intervalMs = 2000,
                            QObject* parent = nullptr);

    //!< @brief Poll immediately, then on every interval.
    void start();

    //!< @brief Stop polling. The last known state is kept.
    void stop();

    //!< @brief True while the timer runs.
    bool isActive() const { return m_timer.isActive(); }

    //!< @brief Poll interval in milliseconds.
    int interval() const { return m_timer.interval(); }

    //!< @brief Normalized business application names.
    QStringList names() const { return m_names; }

    //!< @brief True while any configured application runs.
    bool isBusinessSoftwareRunning() const { return m_running; }

    //!< @brief Name of the first detected application, empty when none.
    QString detectedName() const { return m_detectedName; }

public slots:
    //!< @brief Scan processes once and report changes.
    void poll();

signals:
    //!< @brief Emitted when the running state flips.
    void businessSoftwareRunningChanged(bool running);

    //!< @brief Emitted when an application is first detected.
    void businessSoftwareDetected(const QString& name);

    //!< @brief Emitted when the last application exits.
    void businessSoftwareCleared();

private:
    std::unique_ptr<ProcessObserver> m_observer;    //!< Process source.
    QStringList m_names;                            //!< Normalized names.
    QTimer m_timer;                                 //!< Poll timer.
    bool m_running = false;                         //!< Last known state.
    QString m_detectedName;                         //!< Detected application.
};

#include "business_monitor.moc"
