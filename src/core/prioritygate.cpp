module;
#include <QDeadlineTimer>
#include <QHash>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QString>
#include <QtGlobal>

module keeper.core.prioritygate;

import keeper.core.jobcontrol;

Q_LOGGING_CATEGORY(lcGate, "keeper.gate")

static constexpr int gateWakeIntervalMs = 50;

int PriorityGate::countedPendingLocked() const
{
    int total = 0;
    for (auto it = m_jobs.constBegin(); it != m_jobs.constEnd(); ++it) {
        if (!it->suspended) total += it->pending;
    }
    return total;
}

void PriorityGate::registerPending(const QString& job, int count)
{
    QMutexLocker locker(&m_mutex);
    if (count <= 0) {
        m_jobs.remove(job);
    } else {
        JobEntry& entry = m_jobs[job];
        entry.pending = count;
        entry.suspended = false;
    }
    qCDebug(lcGate) << "Job" << job << "registered" << count << "priority files";
    m_changed.wakeAll();
}

void PriorityGate::completeOne(const QString& job)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.find(job);
    if (it == m_jobs.end()) return;
    if (--it->pending <= 0) m_jobs.erase(it);
    m_changed.wakeAll();
}

void PriorityGate::retract(const QString& job)
{
    QMutexLocker locker(&m_mutex);
    if (m_jobs.remove(job) > 0) {
        qCDebug(lcGate) << "Job" << job << "retracted its pending priority files";
    }
    m_changed.wakeAll();
}

void PriorityGate::setSuspended(const QString& job, bool suspended)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.find(job);
    if (it == m_jobs.end() || it->suspended == suspended) return;
    it->suspended = suspended;
    m_changed.wakeAll();
}

bool PriorityGate::admissibleLocked(bool isPriority) const
{
    if (isPriority) return m_activeNormal == 0;
    return m_activePriority == 0 && countedPendingLocked() == 0;
}

bool PriorityGate::acquire(bool isPriority, const JobControl& control)
{
    QMutexLocker locker(&m_mutex);
    for (;;) {
        if (control.isCancelled()) return false;
        if (admissibleLocked(isPriority)) {
            ++(isPriority ? m_activePriority : m_activeNormal);
            return true;
        }
        m_changed.wait(&m_mutex, QDeadlineTimer(gateWakeIntervalMs));
    }
}

bool PriorityGate::tryAcquire(bool isPriority)
{
    QMutexLocker locker(&m_mutex);
    if (!admissibleLocked(isPriority)) return false;
    ++(isPriority ? m_activePriority : m_activeNormal);
    return true;
}

bool PriorityGate::waitUntilAdmissible(bool isPriority, const JobControl& control)
{
    QMutexLocker locker(&m_mutex);
    while (!admissibleLocked(isPriority) && !control.isPaused()) {
        if (control.isCancelled()) return false;
        m_changed.wait(&m_mutex, QDeadlineTimer(gateWakeIntervalMs));
    }
    return !control.isCancelled();
}

void PriorityGate::release(bool isPriority)
{
    QMutexLocker locker(&m_mutex);
    if (isPriority) {
        m_activePriority = qMax(0, m_activePriority - 1);
    } else {
        m_activeNormal = qMax(0, m_activeNormal - 1);
    }
    m_changed.wakeAll();
}

int PriorityGate::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return countedPendingLocked();
}

int PriorityGate::activeNormalCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_activeNormal;
}

int PriorityGate::activePriorityCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_activePriority;
}
