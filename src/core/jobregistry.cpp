module;
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

module keeper.core.jobregistry;

import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.utils.path_utils;

namespace utils = keeper::utils;

JobRegistry::JobRegistry(EventBus* bus) : m_bus(bus) {}

ControlResult JobRegistry::validateDefinition(const BackupJob& job) const
{
    if (job.name.trimmed().isEmpty())
        return ControlResult::failure(ControlError::InvalidJob, QStringLiteral("Job name is required"));
    if (job.sourcePath.isEmpty() || job.targetPath.isEmpty())
        return ControlResult::failure(ControlError::InvalidJob, QStringLiteral("Source and target paths are required"));
    if (utils::isSamePath(job.sourcePath, job.targetPath))
        return ControlResult::failure(ControlError::InvalidJob, QStringLiteral("Source and target must differ"));
    return ControlResult::success();
}

ControlResult JobRegistry::addJob(const BackupJob& job)
{
    const ControlResult valid = validateDefinition(job);
    if (!valid.ok()) return valid;

    JobSnapshot snap;
    {
        QMutexLocker locker(&m_mutex);
        if (m_entries.contains(job.name)) {
            return ControlResult::failure(ControlError::DuplicateJob,
                                          QString("Job '%1' already exists").arg(job.name));
        }
        Entry entry;
        entry.job = job;
        entry.state.lastActionTime = QDateTime::currentDateTime();
        m_entries.insert(job.name, entry);
        m_order.append(job.name);
        snap = JobSnapshot{ entry.job, entry.state };
    }
    publishAction(job, ActionType::JobCreated, QStringLiteral("Job created"));
    publish(snap);
    return ControlResult::success();
}

ControlResult JobRegistry::updateJob(const QString& name, const BackupJob& job)
{
    const ControlResult valid = validateDefinition(job);
    if (!valid.ok()) return valid;

    JobSnapshot snap;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(name);
        if (it == m_entries.end())
            return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));
        const JobStatus status = it->state.status;
        if (status == JobStatus::Active || status == JobStatus::Paused)
            return ControlResult::failure(ControlError::JobBusy, QString("Job '%1' is running").arg(name));

        if (job.name != name) {
            if (m_entries.contains(job.name)) {
                return ControlResult::failure(ControlError::DuplicateJob,
                                              QString("Job '%1' already exists").arg(job.name));
            }
            Entry entry = it.value();
            m_entries.erase(it);
            entry.job = job;
            m_entries.insert(job.name, entry);
            m_order[m_order.indexOf(name)] = job.name;
            snap = JobSnapshot{ entry.job, entry.state };
        } else {
            it->job = job;
            snap = JobSnapshot{ it->job, it->state };
        }
    }
    publishAction(job, ActionType::JobEdited, QString("Job '%1' edited").arg(name));
    publish(snap);
    return ControlResult::success();
}

ControlResult JobRegistry::removeJob(const QString& name)
{
    BackupJob removed;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(name);
        if (it == m_entries.end())
            return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));
        const JobStatus status = it->state.status;
        if (status == JobStatus::Active || status == JobStatus::Paused)
            return ControlResult::failure(ControlError::JobBusy, QString("Job '%1' is running").arg(name));
        removed = it->job;
        m_entries.erase(it);
        m_order.removeAll(name);
    }
    publishAction(removed, ActionType::JobDeleted, QStringLiteral("Job deleted"));
    return ControlResult::success();
}

bool JobRegistry::contains(const QString& name) const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.contains(name);
}

int JobRegistry::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_order.size();
}

QStringList JobRegistry::names() const
{
    QMutexLocker locker(&m_mutex);
    return m_order;
}

QList<BackupJob> JobRegistry::jobs() const
{
    QMutexLocker locker(&m_mutex);
    QList<BackupJob> out;
    out.reserve(m_order.size());
    for (const QString& name : m_order) out.append(m_entries.value(name).job);
    return out;
}

std::optional<BackupJob> JobRegistry::job(const QString& name) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.constFind(name);
    if (it == m_entries.constEnd()) return std::nullopt;
    return it->job;
}

std::optional<JobState> JobRegistry::state(const QString& name) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.constFind(name);
    if (it == m_entries.constEnd()) return std::nullopt;
    return it->state;
}

QList<JobSnapshot> JobRegistry::snapshot() const
{
    QMutexLocker locker(&m_mutex);
    QList<JobSnapshot> out;
    out.reserve(m_order.size());
    for (const QString& name : m_order) {
        const Entry& entry = m_entries[name];
        out.append(JobSnapshot{ entry.job, entry.state });
    }
    return out;
}

ControlResult JobRegistry::transition(const QString& name, JobStatus to, const QString& errorMessage)
{
    JobSnapshot snap;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(name);
        if (it == m_entries.end())
            return ControlResult::failure(ControlError::UnknownJob, QString("Unknown job '%1'").arg(name));

        JobState& state = it->state;
        if (!isValidTransition(state.status, to)) {
            return ControlResult::failure(ControlError::InvalidTransition,
                                          QString("Cannot move job '%1' from %2 to %3")
                                              .arg(name, jobStatusToString(state.status), jobStatusToString(to)));
        }

        if (state.status == JobStatus::Paused) state.pausedByBusinessSoftware = false;
        state.status = to;
        state.lastActionTime = QDateTime::currentDateTime();

        switch (to) {
        case JobStatus::Ready:
            state = JobState{};
            state.lastActionTime = QDateTime::currentDateTime();
            break;
        case JobStatus::Completed:
            state.progressPercentage = 100;
            state.currentFile.clear();
            break;
        case JobStatus::Error:
            state.errorMessage = errorMessage;
            state.currentFile.clear();
            break;
        case JobStatus::Stopped:
        case JobStatus::Cancelled:
            state.currentFile.clear();
            break;
        case JobStatus::Active:
        case JobStatus::Paused:
            break;
        }
        snap = JobSnapshot{ it->job, state };
    }
    publish(snap);
    return ControlResult::success();
}

bool JobRegistry::pauseForBusinessSoftware(const QString& name)
{
    JobSnapshot snap;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(name);
        if (it == m_entries.end() || it->state.status != JobStatus::Active) return false;
        it->state.status = JobStatus::Paused;
        it->state.pausedByBusinessSoftware = true;
        it->state.lastActionTime = QDateTime::currentDateTime();
        snap = JobSnapshot{ it->job, it->state };
    }
    publish(snap);
    return true;
}

bool JobRegistry::resumeFromBusinessSoftware(const QString& name)
{
    JobSnapshot snap;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(name);
        if (it == m_entries.end()) return false;
        if (it->state.status != JobStatus::Paused || !it->state.pausedByBusinessSoftware) return false;
        it->state.status = JobStatus::Active;
        it->state.pausedByBusinessSoftware = false;
        it->state.lastActionTime = QDateTime::currentDateTime();
        snap = JobSnapshot{ it->job, it->state };
    }
    publish(snap);
    return true;
}

bool JobRegistry::clearBusinessSoftwareMarker(const QString& name)
{
    JobSnapshot snap;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(name);
        if (it == m_entries.end() || !it->state.pausedByBusinessSoftware) return false;
        it->state.pausedByBusinessSoftware = false;
        it->state.lastActionTime = QDateTime::currentDateTime();
        snap = JobSnapshot{ it->job, it->state };
    }
    publish(snap);
    return true;
}

bool JobRegistry::updateProgress(const QString& name, const std::function<void(JobState&)>& update)
{
    JobSnapshot snap;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(name);
        if (it == m_entries.end()) return false;
        const JobStatus status = it->state.status;
        const bool pausedByBusiness = it->state.pausedByBusinessSoftware;
        update(it->state);
        it->state.status = status;
        it->state.pausedByBusinessSoftware = pausedByBusiness;
        it->state.progressPercentage = qBound(0, it->state.progressPercentage, 100);
        it->state.lastActionTime = QDateTime::currentDateTime();
        snap = JobSnapshot{ it->job, it->state };
    }
    publish(snap);
    return true;
}

void JobRegistry::publish(const JobSnapshot& snapshot) const
{
    if (m_bus) m_bus->publishState(snapshot);
}

void JobRegistry::publishAction(const BackupJob& job, ActionType action, const QString& message) const
{
    if (!m_bus) return;
    LogEvent event;
    event.backupName = job.name;
    event.backupType = job.type;
    event.sourcePath = job.sourcePath;
    event.targetPath = job.targetPath;
    event.message = message;
    event.actionType = action;
    m_bus->publish(event);
}
