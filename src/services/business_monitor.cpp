module;
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <memory>
#include <optional>

module keeper.services.business_monitor;

import keeper.utils.path_utils;

namespace utils = keeper::utils;

Q_LOGGING_CATEGORY(lcMonitor, "keeper.monitor")

#if !defined(Q_OS_LINUX)
static std::optional<QStringList> runCommandLines(const QString& program, const QStringList& args)
{
    QProcess proc;
    proc.start(program, args);
    if (!proc.waitForFinished(2000) || proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        return std::nullopt;
    }
    const QString output = QString::fromLocal8Bit(proc.readAllStandardOutput());
    return output.split('\n', Qt::SkipEmptyParts);
}
#endif

std::optional<QStringList> SystemProcessObserver::runningProcessNames() const
{
#if defined(Q_OS_LINUX)
    // Linux: one directory per pid under /proc, the short name in "comm"
    QDir proc(QStringLiteral("/proc"));
    if (!proc.exists()) return std::nullopt;

    QStringList names;
    const QStringList entries = proc.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        bool isPid = false;
        entry.toInt(&isPid);
        if (!isPid) continue;
        QFile comm(proc.filePath(entry + "/comm"));
        if (!comm.open(QIODevice::ReadOnly)) continue;
        const QString name = QString::fromLocal8Bit(comm.readAll()).trimmed();
        if (!name.isEmpty()) names.append(name);
    }
    return names;

#elif defined(Q_OS_WIN)
    // Windows: CSV output, first column is the image name
    const auto lines = runCommandLines(QStringLiteral("tasklist"), { "/FO", "CSV", "/NH" });
    if (!lines) return std::nullopt;
    QStringList names;
    for (const QString& line : *lines) {
        const QString first = line.section(',', 0, 0).trimmed();
        QString name = first;
        name.remove('"');
        if (!name.isEmpty()) names.append(name);
    }
    return names;

#else
    // macOS and other POSIX systems
    const auto lines = runCommandLines(QStringLiteral("ps"), { "-A", "-o", "comm=" });
    if (!lines) return std::nullopt;
    QStringList names;
    for (const QString& line : *lines) {
        const QString name = line.trimmed();
        if (!name.isEmpty()) names.append(name);
    }
    return names;
#endif
}

BusinessSoftwareMonitor::BusinessSoftwareMonitor(std::unique_ptr<ProcessObserver> observer,
                                                 const QStringList& names,
                                                 int intervalMs,
                                                 QObject* parent)
    : QObject(parent)
    , m_observer(std::move(observer))
    , m_names(utils::normalizeProcessNames(names))
{
    m_timer.setInterval(qMax(50, intervalMs));
    connect(&m_timer, &QTimer::timeout, this, &BusinessSoftwareMonitor::poll);
}

void BusinessSoftwareMonitor::start()
{
    poll();
    m_timer.start();
}

void BusinessSoftwareMonitor::stop()
{
    m_timer.stop();
}

void BusinessSoftwareMonitor::poll()
{
    QString found;
    if (m_observer && !m_names.isEmpty()) {
        const auto processes = m_observer->runningProcessNames();
        if (!processes) {
            qCWarning(lcMonitor) << "Process listing failed, assuming no business software";
        } else {
            for (const QString& raw : *processes) {
                const QString name = utils::normalizeProcessName(raw);
                if (m_names.contains(name)) {
                    found = name;
                    break;
                }
            }
        }
    }

    const bool next = !found.isEmpty();
    if (next == m_running) return;

    m_running = next;
    m_detectedName = found;
    if (m_running) {
        qCInfo(lcMonitor) << "Business software detected:" << found;
        emit businessSoftwareDetected(found);
    } else {
        qCInfo(lcMonitor) << "Business software no longer running";
        emit businessSoftwareCleared();
    }
    emit businessSoftwareRunningChanged(m_running);
}
