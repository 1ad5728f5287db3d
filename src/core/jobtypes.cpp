module;
#include <QString>
#include <optional>

module keeper.core.jobtypes;

QString backupTypeToString(BackupType type)
{
    return type == BackupType::Differential ? QStringLiteral("Differential") : QStringLiteral("Full");
}

std::optional<BackupType> backupTypeFromString(const QString& value)
{
    const QString v = value.trimmed();
    if (v.compare(QStringLiteral("Full"), Qt::CaseInsensitive) == 0) return BackupType::Full;
    if (v.compare(QStringLiteral("Differential"), Qt::CaseInsensitive) == 0) return BackupType::Differential;
    return std::nullopt;
}

QString jobStatusToString(JobStatus status)
{
    switch (status) {
    case JobStatus::Ready: return QStringLiteral("Ready");
    case JobStatus::Active: return QStringLiteral("Active");
    case JobStatus::Paused: return QStringLiteral("Paused");
    case JobStatus::Stopped: return QStringLiteral("Stopped");
    case JobStatus::Cancelled: return QStringLiteral("Cancelled");
    case JobStatus::Completed: return QStringLiteral("Completed");
    case JobStatus::Error: return QStringLiteral("Error");
    }
    return QStringLiteral("Unknown");
}

bool isTerminal(JobStatus status)
{
    return status == JobStatus::Stopped
        || status == JobStatus::Cancelled
        || status == JobStatus::Completed
        || status == JobStatus::Error;
}

bool isValidTransition(JobStatus from, JobStatus to)
{
    switch (from) {
    case JobStatus::Ready:
        return to == JobStatus::Active;
    case JobStatus::Active:
        return to == JobStatus::Paused
            || to == JobStatus::Stopped
            || to == JobStatus::Cancelled
            || to == JobStatus::Completed
            || to == JobStatus::Error;
    case JobStatus::Paused:
        return to == JobStatus::Active
            || to == JobStatus::Stopped
            || to == JobStatus::Cancelled
            || to == JobStatus::Error;
    case JobStatus::Stopped:
    case JobStatus::Cancelled:
    case JobStatus::Completed:
    case JobStatus::Error:
        return to == JobStatus::Ready;
    }
    return false;
}
