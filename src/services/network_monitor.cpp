module;
#include <QLoggingCategory>
#include <QtGlobal>
#include <functional>

module keeper.services.network_monitor;

Q_LOGGING_CATEGORY(lcNetwork, "keeper.monitor")

NetworkLoadMonitor::NetworkLoadMonitor(std::function<qint64()> bytesCounter,
                                       std::function<int()> runningJobs,
                                       qint64 thresholdBytesPerSec,
                                       int configuredMaxJobs,
                                       int intervalMs,
                                       QObject* parent)
    : QObject(parent)
    , m_bytesCounter(std::move(bytesCounter))
    , m_runningJobs(std::move(runningJobs))
    , m_threshold(qMax<qint64>(0, thresholdBytesPerSec))
    , m_configuredMax(qMax(0, configuredMaxJobs))
    , m_budget(m_configuredMax)
{
    m_timer.setInterval(qMax(50, intervalMs));
    connect(&m_timer, &QTimer::timeout, this, &NetworkLoadMonitor::sample);
}

void NetworkLoadMonitor::start()
{
    if (m_threshold <= 0) return;
    m_lastBytes = m_bytesCounter ? m_bytesCounter() : 0;
    m_clock.start();
    m_timer.start();
}

void NetworkLoadMonitor::stop()
{
    m_timer.stop();
    m_overloaded = false;
    setBudget(m_configuredMax);
}

void NetworkLoadMonitor::sample()
{
    const qint64 now = m_bytesCounter ? m_bytesCounter() : 0;
    const qint64 elapsed = m_clock.isValid() ? m_clock.restart() : 0;
    const qint64 delta = qMax<qint64>(0, now - m_lastBytes);
    m_lastBytes = now;
    if (!m_clock.isValid()) m_clock.start();
    recordSample(delta, elapsed);
}

void NetworkLoadMonitor::recordSample(qint64 bytes, qint64 elapsedMs)
{
    if (elapsedMs <= 0) return;
    m_throughput = bytes * 1000 / elapsedMs;

    const bool overloaded = m_threshold > 0 && m_throughput > m_threshold;
    if (overloaded) {
        const int running = m_runningJobs ? m_runningJobs() : 0;
        const int reduced = qMax(1, running - 1);
        if (!m_overloaded) {
            qCInfo(lcNetwork) << "Network load" << m_throughput << "B/s over threshold, budget" << reduced;
        }
        setBudget(m_configuredMax > 0 ? qMin(m_configuredMax, reduced) : reduced);
    } else if (m_overloaded) {
        qCInfo(lcNetwork) << "Network load back to" << m_throughput << "B/s, budget restored";
        setBudget(m_configuredMax);
    }
    m_overloaded = overloaded;
    emit sampled();
}

void NetworkLoadMonitor::setBudget(int budget)
{
    if (m_budget == budget) return;
    m_budget = budget;
    emit budgetChanged(m_budget);
}
