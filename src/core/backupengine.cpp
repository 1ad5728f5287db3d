module;
#include <QFutureWatcher>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QtConcurrent>
#include <memory>

module keeper.core.backupengine;

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

Q_LOGGING_CATEGORY(lcEngine, "keeper.engine")

BackupEngine::BackupEngine(JobRegistry* registry, EventBus* bus, const Settings& settings, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_bus(bus)
    , m_settings(settings)
    , m_crypto(settings.encryptorProgram,
               settings.encryptorArguments,
               settings.encryptionKey,
               settings.encryptorTimeoutMs,
               settings.encryptorLockFile)
    , m_snapshots(settings.stateDirectory)
    , m_budget(qMax(0, settings.maxConcurrentJobs))
{
    // One pool thread per running job
    m_pool.setMaxThreadCount(256);
    m_pool.setExpiryTimeout(30000);
}

BackupEngine::~BackupEngine()
{
    shutdown();
    m_pool.waitForDone();
    for (auto it = m_running.begin(); it != m_running.end(); ++it) {
        delete it->watcher;
    }
    m_running.clear();
}

ControlResult BackupEngine::start(const QString& name)
{
    const auto state = m_registry->state(name);
    if (!state) return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));

    if (m_running.contains(name) || state->status == JobStatus::Active || state->status == JobStatus::Paused) {
        return ControlResult::failure(ControlError::InvalidTransition, QString("Job '%1' is already running").arg(name));
    }
    if (m_queue.contains(name)) {
        return ControlResult::failure(ControlError::InvalidTransition, QString("Job '%1' is already queued").arg(name));
    }
    if (isTerminal(state->status)) {
        const ControlResult reset = m_registry->transition(name, JobStatus::Ready);
        if (!reset.ok()) return reset;
    }

    m_queue.append(name);
    startQueued();
    emit countsChanged();
    return ControlResult::success();
}

ControlResult BackupEngine::pause(const QString& name)
{
    const auto state = m_registry->state(name);
    if (!state) return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));

    auto it = m_running.find(name);
    if (it == m_running.end() || state->status != JobStatus::Active) {
        if (it != m_running.end() && state->status == JobStatus::Paused && state->pausedByBusinessSoftware) {
            m_registry->clearBusinessSoftwareMarker(name);
            publish(ActionType::BackupPaused, LogType::Info, name, QStringLiteral("Paused by user"));
            return ControlResult::success();
        }
        return ControlResult::failure(ControlError::InvalidTransition,
                                      QString("Job '%1' is %2, not Active").arg(name, jobStatusToString(state->status)));
    }

    it->control->pause();
    const ControlResult r = m_registry->transition(name, JobStatus::Paused);
    if (!r.ok()) {
        it->control->resume();
        return r;
    }
    publish(ActionType::BackupPaused, LogType::Info, name, QStringLiteral("Paused by user"));
    return r;
}

ControlResult BackupEngine::resume(const QString& name)
{
    const auto state = m_registry->state(name);
    if (!state) return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));

    auto it = m_running.find(name);
    if (it == m_running.end() || state->status != JobStatus::Paused) {
        return ControlResult::failure(ControlError::InvalidTransition,
                                      QString("Job '%1' is %2, not Paused").arg(name, jobStatusToString(state->status)));
    }
    if (m_businessActive) {
        return ControlResult::failure(ControlError::InvalidTransition,
                                      QString("Job '%1' cannot resume while business software is running").arg(name));
    }

    const ControlResult r = m_registry->transition(name, JobStatus::Active);
    if (!r.ok()) return r;
    it->control->resume();
    publish(ActionType::BackupResumed, LogType::Info, name, QStringLiteral("Resumed by user"));
    return r;
}

ControlResult BackupEngine::stop(const QString& name)
{
    const auto state = m_registry->state(name);
    if (!state) return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));

    if (m_queue.removeAll(name) > 0) {
        publish(ActionType::BackupStopped, LogType::Info, name, QStringLiteral("Removed from queue"));
        emit countsChanged();
        return ControlResult::success();
    }

    auto it = m_running.find(name);
    if (it == m_running.end()) {
        return ControlResult::failure(ControlError::InvalidTransition,
                                      QString("Job '%1' is %2, not running").arg(name, jobStatusToString(state->status)));
    }
    it->control->cancel(JobControl::CancelReason::Stop);
    qCInfo(lcEngine) << "Stop requested for" << name;
    return ControlResult::success();
}

ControlResult BackupEngine::startSelected(const QStringList& names)
{
    for (const QString& name : names) {
        if (!m_registry->contains(name)) {
            return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));
        }
    }

    ControlResult first = ControlResult::success();
    for (const QString& name : names) {
        const ControlResult r = start(name);
        if (!r.ok() && first.ok()) first = r;
    }
    return first;
}

ControlResult BackupEngine::addJob(const BackupJob& job)
{
    const ControlResult r = m_registry->addJob(job);
    if (!r.ok()) return r;
    if (!m_snapshots.remove(job.name)) {
        qCWarning(lcEngine) << "Cannot discard stale differential state of" << job.name;
    }
    return r;
}

ControlResult BackupEngine::updateJob(const QString& name, const BackupJob& job)
{
    const auto previous = m_registry->job(name);
    if (!previous) return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));
    if (m_running.contains(name) || m_queue.contains(name)) {
        return ControlResult::failure(ControlError::JobBusy, QString("Job '%1' is running or queued").arg(name));
    }

    const ControlResult r = m_registry->updateJob(name, job);
    if (!r.ok()) return r;

    const bool samePaths = previous->sourcePath == job.sourcePath && previous->targetPath == job.targetPath;
    QString error;
    bool ok = true;
    if (!samePaths) {
        ok = m_snapshots.remove(name) && m_snapshots.remove(job.name);
    } else if (job.name != name) {
        ok = m_snapshots.rename(name, job.name, &error);
    }
    if (!ok) qCWarning(lcEngine) << "Cannot update differential state of" << job.name << error;
    return r;
}

ControlResult BackupEngine::removeJob(const QString& name)
{
    if (m_running.contains(name) || m_queue.contains(name)) {
        return ControlResult::failure(ControlError::JobBusy, QString("Job '%1' is running or queued").arg(name));
    }
    const ControlResult r = m_registry->removeJob(name);
    if (!r.ok()) return r;
    if (!m_snapshots.remove(name)) {
        qCWarning(lcEngine) << "Cannot delete differential state of" << name;
    }
    return r;
}

void BackupEngine::startAll()
{
    const QStringList names = m_registry->names();
    for (const QString& name : names) {
        if (m_running.contains(name) || m_queue.contains(name)) continue;
        const ControlResult r = start(name);
        if (!r.ok()) qCWarning(lcEngine) << r.message;
    }
}

void BackupEngine::pauseAll()
{
    const QStringList names = m_running.keys();
    for (const QString& name : names) {
        const auto state = m_registry->state(name);
        if (!state || state->status != JobStatus::Active) continue;
        const ControlResult r = pause(name);
        if (!r.ok()) qCWarning(lcEngine) << r.message;
    }
}

void BackupEngine::stopAll()
{
    m_queue.clear();
    for (auto it = m_running.begin(); it != m_running.end(); ++it) {
        it->control->cancel(JobControl::CancelReason::Stop);
    }
    emit countsChanged();
}

void BackupEngine::shutdown()
{
    m_queue.clear();
    for (auto it = m_running.begin(); it != m_running.end(); ++it) {
        it->control->cancel(JobControl::CancelReason::Shutdown);
    }
}

bool BackupEngine::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

void BackupEngine::setConcurrencyBudget(int budget)
{
    budget = qMax(0, budget);
    if (m_budget == budget) return;
    m_budget = budget;
    qCInfo(lcEngine) << "Concurrent job budget set to" << (m_budget == 0 ? QStringLiteral("unlimited") : QString::number(m_budget));
    emit concurrencyBudgetChanged();
    startQueued();
}

void BackupEngine::setBusinessSoftwareActive(bool active)
{
    if (m_businessActive == active) return;
    m_businessActive = active;

    publish(active ? ActionType::BusinessSoftwareDetected : ActionType::BusinessSoftwareCleared,
            active ? LogType::Warning : LogType::Info,
            QString(),
            active ? QStringLiteral("Business software running, pausing active jobs")
                   : QStringLiteral("Business software stopped, resuming jobs it paused"));

    for (auto it = m_running.begin(); it != m_running.end(); ++it) {
        const QString& name = it.key();
        if (active) {
            it->control->pause();
            if (m_registry->pauseForBusinessSoftware(name)) {
                publish(ActionType::BackupPaused, LogType::Info, name, QStringLiteral("Paused: business software running"));
            } else {
                const auto state = m_registry->state(name);
                if (!state || state->status != JobStatus::Paused) it->control->resume();
            }
        } else if (m_registry->resumeFromBusinessSoftware(name)) {
            it->control->resume();
            publish(ActionType::BackupResumed, LogType::Info, name, QStringLiteral("Resumed: business software stopped"));
        }
    }
    emit businessSoftwareActiveChanged();
}

void BackupEngine::startQueued()
{
    bool launched = false;
    while (!m_queue.isEmpty()) {
        if (m_budget > 0 && m_running.size() >= m_budget) break;
        const QString name = m_queue.takeFirst();
        if (!m_registry->contains(name)) continue;
        launch(name);
        launched = true;
    }
    if (launched) emit countsChanged();
}

void BackupEngine::launch(const QString& name)
{
    const auto job = m_registry->job(name);
    if (!job) return;

    const ControlResult r = m_registry->transition(name, JobStatus::Active);
    if (!r.ok()) {
        qCWarning(lcEngine) << "Cannot start" << name << r.message;
        return;
    }

    WorkerContext context;
    context.registry = m_registry;
    context.bus = m_bus;
    context.priorityGate = &m_priorityGate;
    context.largeFileThrottle = &m_largeFileThrottle;
    context.crypto = &m_crypto;
    context.snapshots = &m_snapshots;
    context.bytesCounter = &m_bytesCounter;
    context.settings = m_settings;

    auto control = std::make_shared<JobControl>();
    auto worker = std::make_shared<BackupWorker>(*job, control, context);

    auto* watcher = new QFutureWatcher<void>(this);
    connect(watcher, &QFutureWatcher<void>::finished, this, [this, name]() { onWorkerFinished(name); });
    m_running.insert(name, RunningJob{ control, watcher });

    if (m_businessActive) {
        control->pause();
        if (m_registry->pauseForBusinessSoftware(name)) {
            publish(ActionType::BackupPaused, LogType::Info, name, QStringLiteral("Paused: business software running"));
        }
    }

    qCInfo(lcEngine) << "Starting" << backupTypeToString(job->type) << "backup" << name;
    watcher->setFuture(QtConcurrent::run(&m_pool, [worker]() { worker->run(); }));
}

void BackupEngine::onWorkerFinished(const QString& name)
{
    auto it = m_running.find(name);
    if (it == m_running.end()) return;
    it->watcher->deleteLater();
    m_running.erase(it);

    const auto state = m_registry->state(name);
    if (state && (state->status == JobStatus::Active || state->status == JobStatus::Paused)) {
        const QString message = QStringLiteral("Worker ended without reaching a final state");
        const ControlResult r = m_registry->transition(name, JobStatus::Error, message);
        if (!r.ok()) qCWarning(lcEngine) << r.message;
        m_priorityGate.retract(name);
        publish(ActionType::BackupError, LogType::Error, name, message);
    }

    emit jobFinished(name);
    startQueued();
    emit countsChanged();
}

void BackupEngine::publish(ActionType action, LogType type, const QString& name, const QString& message)
{
    if (!m_bus) return;
    LogEvent event;
    event.backupName = name;
    event.message = message;
    event.logType = type;
    event.actionType = action;
    if (const auto job = m_registry->job(name)) {
        event.backupType = job->type;
        event.sourcePath = job->sourcePath;
        event.targetPath = job->targetPath;
    }
    m_bus->publish(event);
}
