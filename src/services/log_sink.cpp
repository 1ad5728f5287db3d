module;
#include <QDateTime>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

module keeper.services.log_sink;

import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.utils.path_utils;

namespace utils = keeper::utils;

Q_LOGGING_CATEGORY(lcJournal, "keeper.journal")

QString CategoryLogSink::formatLine(const LogEvent& event)
{
    QStringList parts;
    parts << event.timestamp.toString(Qt::ISODateWithMs)
          << actionTypeToString(event.actionType);
    if (!event.backupName.isEmpty()) {
        parts << QString("[%1/%2]").arg(event.backupName, backupTypeToString(event.backupType));
    }
    if (event.fileSize > 0 || event.transferTimeMs != 0) {
        parts << QString("%1 -> %2").arg(event.sourcePath, event.targetPath)
              << utils::formatFileSize(event.fileSize)
              << QString("transfer=%1ms").arg(event.transferTimeMs);
        if (event.encryptionTimeMs != 0) parts << QString("encryption=%1ms").arg(event.encryptionTimeMs);
    }
    if (!event.message.isEmpty()) parts << event.message;
    return parts.join(' ');
}

void CategoryLogSink::write(const LogEvent& event)
{
    const QString line = formatLine(event);
    switch (event.logType) {
    case LogType::Info:
        qCInfo(lcJournal).noquote() << line;
        break;
    case LogType::Warning:
        qCWarning(lcJournal).noquote() << line;
        break;
    case LogType::Error:
        qCCritical(lcJournal).noquote() << line;
        break;
    }
}
