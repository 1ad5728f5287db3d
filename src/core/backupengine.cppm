/*!
 * @file        backupengine.cppm
 * @brief       Orchestration of backup runs across jobs.
 * @details     BackupEngine owns the shared admission gates, the encryptor
 *              proxy and the worker pool. It turns control requests (start,
 *              pause, resume, stop) into validated job state transitions and
 *              signals to the per-run JobControl tokens, and it applies the
 *              global policies layered above ordinary pauses:
 *              - the concurrent job budget, consulted when starting queued jobs
 *              - the business software pause, which only resumes the jobs it
 *                paused itself
 *
 *              Each running job has exactly one worker, executed on the
 *              engine's thread pool. Control methods must be called from the
 *              thread owning the engine; workers communicate only through
 *              JobRegistry, the gates and the EventBus.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QAtomicInteger>
#include <QFutureWatcher>
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <memory>

#ifndef Q_MOC_RUN
export module keeper.core.backupengine;
import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.jobregistry;
import keeper.core.jobcontrol;
import keeper.core.prioritygate;
import keeper.core.largefilethrottle;
import keeper.core.snapshotstore;
import keeper.core.settings;
import keeper.core.backupworker;
import keeper.services.crypto_gateway;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Starts, controls and supervises backup runs.
 */
KEEPER_MODULE_EXPORT class BackupEngine : public QObject {

    Q_OBJECT

    //!< @brief Number of jobs with a live worker.
    Q_PROPERTY(int runningCount READ runningCount NOTIFY countsChanged)

    //!< @brief Number of jobs waiting for a slot.
    Q_PROPERTY(int queuedCount READ queuedCount NOTIFY countsChanged)

    //!< @brief Concurrent job budget (0 = unlimited).
    Q_PROPERTY(int concurrencyBudget READ concurrencyBudget WRITE setConcurrencyBudget NOTIFY concurrencyBudgetChanged)

    //!< @brief True while business software forces jobs to pause.
    Q_PROPERTY(bool businessSoftwareActive READ businessSoftwareActive NOTIFY businessSoftwareActiveChanged)

public:
    /**
     * @brief Construct an engine.
     * @param registry Job store (not owned, must outlive the engine).
     * @param bus Event destination (not owned, must outlive the engine).
     * @param settings Settings used by every run.
     * @param parent Optional parent QObject.
     */
    BackupEngine(JobRegistry* registry, EventBus* bus, const Settings& settings, QObject* parent = nullptr);

    //!< @brief Cancels every run and waits for the workers.
    ~BackupEngine() override;

    //!< @brief Settings used by every run.
    const Settings& settings() const { return m_settings; }

    /**
     * @brief Starts a job, or queues it when the budget is exhausted.
     *
     * A job in a terminal state is reset to Ready first.
     *
     * @param name Job name.
     * @return Success, UnknownJob, or InvalidTransition when already running or queued.
     */
    ControlResult start(const QString& name);

    /**
     * @brief Pauses an Active job at its next check point.
     *
     * Pausing a job already paused by business software turns it into a
     * user pause, so it is not resumed automatically.
     *
     * @param name Job name.
     * @return Success, UnknownJob or InvalidTransition.
     */
    ControlResult pause(const QString& name);

    /**
     * @brief Resumes a Paused job.
     *
     * Refused while business software is running.
     *
     * @param name Job name.
     * @return Success, UnknownJob or InvalidTransition.
     */
    ControlResult resume(const QString& name);

    /**
     * @brief Stops a running job at the next chunk boundary, or removes it from the queue.
     * @param name Job name.
     * @return Success, UnknownJob or InvalidTransition.
     */
    ControlResult stop(const QString& name);

    /**
     * @brief Starts several jobs.
     *
     * Nothing is started when a name is unknown.
     *
     * @param names Job names.
     * @return Success, or the first failure.
     */
    ControlResult startSelected(const QStringList& names);

    /**
     * @brief Adds a job definition.
     *
     * Differential state left behind by an earlier job of the same name is
     * discarded, so the new job starts with a full copy.
     *
     * @param job New definition.
     * @return Result of JobRegistry::addJob().
     */
    ControlResult addJob(const BackupJob& job);

    /**
     * @brief Replaces a job definition.
     *
     * Refused with JobBusy while the job runs or waits in the queue. A
     * rename keeps the differential state when source and target are
     * unchanged; a new source or target drops it.
     *
     * @param name Current job name.
     * @param job New definition.
     * @return Success, UnknownJob, JobBusy, DuplicateJob or InvalidJob.
     */
    ControlResult updateJob(const QString& name, const BackupJob& job);

    /**
     * @brief Deletes a job and its differential state.
     * @param name Job name.
     * @return Success, UnknownJob or JobBusy while it runs or waits in the queue.
     */
    ControlResult removeJob(const QString& name);

    //!< @brief Differential state of every job.
    const SnapshotStore& snapshots() const { return m_snapshots; }

    //!< @brief Starts every job not already running or queued.
    void startAll();

    //!< @brief Pauses every Active job.
    void pauseAll();

    //!< @brief Stops every running job and clears the queue.
    void stopAll();

    //!< @brief Cancels every running job (status Cancelled) and clears the queue.
    void shutdown();

    /**
     * @brief Waits for all workers to return.
     * @param msecs Time limit, -1 for none.
     * @return true if no worker is left.
     */
    bool waitForDone(int msecs = -1);

    //!< @brief True if the job has a live worker.
    bool isRunning(const QString& name) const { return m_running.contains(name); }

    //!< @brief True if the job waits for a slot.
    bool isQueued(const QString& name) const { return m_queue.contains(name); }

    //!< @brief Number of jobs with a live worker.
    int runningCount() const { return m_running.size(); }

    //!< @brief Number of queued jobs.
    int queuedCount() const { return m_queue.size(); }

    //!< @brief Bytes copied by every run since construction.
    qint64 bytesTransferred() const { return m_bytesCounter.loadRelaxed(); }

    //!< @brief Concurrent job budget (0 = unlimited).
    int concurrencyBudget() const { return m_budget; }

    //!< @brief True while business software forces jobs to pause.
    bool businessSoftwareActive() const { return m_businessActive; }

    //!< @brief Shared priority gate.
    PriorityGate& priorityGate() { return m_priorityGate; }

    //!< @brief Shared large file gate.
    LargeFileThrottle& largeFileThrottle() { return m_largeFileThrottle; }

public slots:
    /**
     * @brief Sets the concurrent job budget and starts queued jobs that now fit.
     * @param budget New budget (0 = unlimited).
     */
    void setConcurrencyBudget(int budget);

    /**
     * @brief Applies or lifts the business software pause.
     *
     * Active jobs are paused and marked; on release only marked jobs
     * resume.
     *
     * @param active True while business software runs.
     */
    void setBusinessSoftwareActive(bool active);

signals:
    void countsChanged();
    void concurrencyBudgetChanged();
    void businessSoftwareActiveChanged();

    //!< @brief Emitted once a job's worker has returned.
    void jobFinished(const QString& name);

private:
    struct RunningJob {
        std::shared_ptr<JobControl> control;        //!< Token of the run.
        QFutureWatcher<void>* watcher = nullptr;    //!< Completion watcher.
    };

    void startQueued();
    void launch(const QString& name);
    void onWorkerFinished(const QString& name);
    void publish(ActionType action, LogType type, const QString& name, const QString& message);

    JobRegistry* m_registry = nullptr;          //!< Not owned.
    EventBus* m_bus = nullptr;                  //!< Not owned.
    Settings m_settings;                        //!< Run settings.
    PriorityGate m_priorityGate;                //!< Priority preemption.
    LargeFileThrottle m_largeFileThrottle;      //!< One large file at a time.
    CryptoGateway m_crypto;                     //!< Encryptor proxy.
    SnapshotStore m_snapshots;                  //!< Differential state.
    QAtomicInteger<qint64> m_bytesCounter{ 0 }; //!< Bytes copied by all runs.
    QHash<QString, RunningJob> m_running;       //!< Live workers by job.
    QStringList m_queue;                        //!< Jobs waiting for a slot.
    int m_budget = 0;                           //!< Concurrent job budget.
    bool m_businessActive = false;              //!< Business software running.
    QThreadPool m_pool;                         //!< Worker threads.
};

#include "backupengine.moc"
