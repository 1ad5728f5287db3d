module;
#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <optional>

module keeper.services.remote_command;

import keeper.core.jobtypes;

static CommandParseResult failure(CommandError error, const QString& message)
{
    CommandParseResult result;
    result.error = error;
    result.message = message;
    return result;
}

QString commandKindToString(CommandKind kind)
{
    switch (kind) {
    case CommandKind::GetStatus: return QStringLiteral("GET_STATUS");
    case CommandKind::Pause: return QStringLiteral("PAUSE");
    case CommandKind::Resume: return QStringLiteral("RESUME");
    case CommandKind::Stop: return QStringLiteral("STOP");
    }
    return QString();
}

CommandParseResult parseRemoteCommand(const QByteArray& line)
{
    if (line.size() > maxCommandLineLength) {
        return failure(CommandError::Malformed, QStringLiteral("Request line too long"));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return failure(CommandError::Malformed, QStringLiteral("Invalid command format"));
    }

    const QJsonObject obj = doc.object();
    const QJsonValue commandValue = obj.value("Command");
    if (!commandValue.isString() || commandValue.toString().trimmed().isEmpty()) {
        return failure(CommandError::Malformed, QStringLiteral("Invalid command format"));
    }

    const QString verb = commandValue.toString().trimmed().toUpper();
    RemoteCommand command;
    if (verb == QLatin1String("GET_STATUS")) {
        command.kind = CommandKind::GetStatus;
    } else if (verb == QLatin1String("PAUSE")) {
        command.kind = CommandKind::Pause;
    } else if (verb == QLatin1String("RESUME")) {
        command.kind = CommandKind::Resume;
    } else if (verb == QLatin1String("STOP")) {
        command.kind = CommandKind::Stop;
    } else {
        return failure(CommandError::UnknownCommand, QString("Unknown command: %1").arg(commandValue.toString()));
    }

    if (command.kind != CommandKind::GetStatus) {
        const QJsonValue jobValue = obj.value("JobName");
        if (!jobValue.isString() || jobValue.toString().trimmed().isEmpty()) {
            return failure(CommandError::MissingJobName, QStringLiteral("Job name is required"));
        }
        command.jobName = jobValue.toString();
    }

    CommandParseResult result;
    result.command = command;
    return result;
}

QString commandErrorToString(CommandError error)
{
    switch (error) {
    case CommandError::None: return QStringLiteral("None");
    case CommandError::Malformed: return QStringLiteral("Malformed");
    case CommandError::UnknownCommand: return QStringLiteral("UnknownCommand");
    case CommandError::MissingJobName: return QStringLiteral("MissingJobName");
    case CommandError::UnknownJob: return QStringLiteral("UnknownJob");
    case CommandError::InvalidTransition: return QStringLiteral("InvalidTransition");
    }
    return QStringLiteral("Unknown");
}

CommandError commandErrorFor(ControlError error)
{
    switch (error) {
    case ControlError::None:
        return CommandError::None;
    case ControlError::UnknownJob:
        return CommandError::UnknownJob;
    case ControlError::InvalidTransition:
    case ControlError::DuplicateJob:
    case ControlError::InvalidJob:
    case ControlError::JobBusy:
        return CommandError::InvalidTransition;
    }
    return CommandError::InvalidTransition;
}

bool closesConnection(CommandError error)
{
    return error == CommandError::Malformed;
}

QByteArray errorResponse(const QString& message)
{
    QJsonObject obj;
    obj.insert("error", message);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}
