module;
#include <QDeadlineTimer>
#include <QMutexLocker>
#include <QWaitCondition>

module keeper.core.jobcontrol;

void JobControl::pause()
{
    QMutexLocker locker(&m_mutex);
    m_paused = true;
    m_changed.wakeAll();
}

void JobControl::resume()
{
    QMutexLocker locker(&m_mutex);
    m_paused = false;
    m_changed.wakeAll();
}

void JobControl::cancel(CancelReason reason)
{
    QMutexLocker locker(&m_mutex);
    if (m_cancel == CancelReason::None) m_cancel = reason;
    m_changed.wakeAll();
}

bool JobControl::isPaused() const
{
    QMutexLocker locker(&m_mutex);
    return m_paused;
}

bool JobControl::isCancelled() const
{
    QMutexLocker locker(&m_mutex);
    return m_cancel != CancelReason::None;
}

JobControl::CancelReason JobControl::cancelReason() const
{
    QMutexLocker locker(&m_mutex);
    return m_cancel;
}

bool JobControl::waitWhilePaused()
{
    QMutexLocker locker(&m_mutex);
    while (m_paused && m_cancel == CancelReason::None) {
        m_changed.wait(&m_mutex);
    }
    return m_cancel == CancelReason::None;
}

bool JobControl::sleepFor(int ms)
{
    QDeadlineTimer deadline(ms);
    QMutexLocker locker(&m_mutex);
    while (m_cancel == CancelReason::None && !deadline.hasExpired()) {
        m_changed.wait(&m_mutex, deadline);
    }
    return m_cancel == CancelReason::None;
}
