/*!
 * @file        network_monitor.cppm
 * @brief       Throughput sampling and the global concurrent job budget.
 * @details     Samples a cumulative transferred-bytes counter on a fixed
 *              interval. When the measured throughput exceeds the configured
 *              threshold the budget of concurrently running jobs shrinks to
 *              one less than the jobs currently running (never below one);
 *              the first sample under the threshold restores the configured
 *              maximum. The orchestrator consults the budget only when
 *              starting queued jobs; running jobs are never interrupted.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QElapsedTimer>
#include <QObject>
#include <QTimer>
#include <QtGlobal>
#include <functional>

#ifndef Q_MOC_RUN
export module keeper.services.network_monitor;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Adjusts the concurrent job budget from measured throughput.
 */
KEEPER_MODULE_EXPORT class NetworkLoadMonitor : public QObject {

    Q_OBJECT

    //!< @brief Current concurrent job budget (0 = unlimited).
    Q_PROPERTY(int budget READ budget NOTIFY budgetChanged)

    //!< @brief Last measured throughput in bytes/sec.
    Q_PROPERTY(qint64 throughput READ throughput NOTIFY sampled)

public:
    /**
     * @brief Construct a monitor.
     * @param bytesCounter Returns the cumulative transferred byte count.
     * @param runningJobs Returns the number of jobs currently running.
     * @param thresholdBytesPerSec Load threshold; 0 keeps the monitor idle.
     * @param configuredMaxJobs Budget restored when load subsides (0 = unlimited).
     * @param intervalMs Sampling interval.
     * @param parent Optional parent QObject.
     */
    NetworkLoadMonitor(std::function<qint64()> bytesCounter,
                       std::function<int()> runningJobs,
                       qint64 thresholdBytesPerSec,
                       int configuredMaxJobs,
                       int intervalMs = 1000,
                       QObject* parent = nullptr);

    //!< @brief Start sampling. Does nothing when the threshold is 0.
    void start();

    //!< @brief Stop sampling and restore the configured budget.
    void stop();

    //!< @brief True while sampling.
    bool isActive() const { return m_timer.isActive(); }

    //!< @brief Current budget (0 = unlimited).
    int budget() const { return m_budget; }

    //!< @brief True while the last sample exceeded the threshold.
    bool isOverloaded() const { return m_overloaded; }

    //!< @brief Last measured throughput in bytes/sec.
    qint64 throughput() const { return m_throughput; }

    /**
     * @brief Feeds one measurement and updates the budget.
     * @param bytes Bytes transferred during the window.
     * @param elapsedMs Window length in milliseconds.
     */
    void recordSample(qint64 bytes, qint64 elapsedMs);

public slots:
    //!< @brief Read the counter and record the delta since the last sample.
    void sample();

signals:
    //!< @brief Emitted when the budget changes.
    void budgetChanged(int budget);

    //!< @brief Emitted after every sample.
    void sampled();

private:
    void setBudget(int budget);

    std::function<qint64()> m_bytesCounter;     //!< Cumulative byte source.
    std::function<int()> m_runningJobs;         //!< Running job count source.
    qint64 m_threshold = 0;                     //!< Bytes/sec threshold.
    int m_configuredMax = 0;                    //!< Budget when calm.
    int m_budget = 0;                           //!< Current budget.
    bool m_overloaded = false;                  //!< Last sample over threshold.
    qint64 m_throughput = 0;                    //!< Last throughput.
    qint64 m_lastBytes = 0;                     //!< Counter at last sample.
    QElapsedTimer m_clock;                      //!< Window clock.
    QTimer m_timer;                             //!< Sampling timer.
};

#include "network_monitor.moc"
