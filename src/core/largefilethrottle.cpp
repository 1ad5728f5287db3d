module;
#include <QSemaphore>

module keeper.core.largefilethrottle;

import keeper.core.jobcontrol;

static constexpr int throttleWakeIntervalMs = 50;

bool LargeFileThrottle::acquire(bool isLarge, const JobControl& control)
{
    if (!isLarge) return true;
    while (!m_permit.tryAcquire(1, throttleWakeIntervalMs)) {
        if (control.isCancelled()) return false;
    }
    if (control.isCancelled()) {
        m_permit.release();
        return false;
    }
    return true;
}

void LargeFileThrottle::release(bool isLarge)
{
    if (!isLarge) return;
    m_permit.release();
}
