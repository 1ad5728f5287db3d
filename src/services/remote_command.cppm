/*!
 * @file        remote_command.cppm
 * @brief       Typed decoding of remote control requests.
 * @details     Each request line is a JSON object {"Command": ..., "JobName": ...}.
 *              Decoding validates the schema and yields either a RemoteCommand
 *              or a CommandError; malformed input never throws.
 *
 *              Command names are matched case-insensitively. JobName is
 *              required for every command except GET_STATUS.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QString>
#include <optional>

#ifndef Q_MOC_RUN
export module keeper.services.remote_command;
import keeper.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

//!< @brief Remote command verbs.
KEEPER_MODULE_EXPORT enum class CommandKind {
    GetStatus,
    Pause,
    Resume,
    Stop
};

//!< @brief A validated remote request.
KEEPER_MODULE_EXPORT struct RemoteCommand {
    CommandKind kind = CommandKind::GetStatus;  //!< Verb.
    QString jobName;                            //!< Empty for GET_STATUS.
};

//!< @brief Remote protocol failure kinds.
KEEPER_MODULE_EXPORT enum class CommandError {
    None,
    Malformed,          //!< Not a JSON object, no string Command, or line too long.
    UnknownCommand,     //!< Command is not one of the four verbs.
    MissingJobName,     //!< JobName absent or empty.
    UnknownJob,         //!< No job with that name.
    InvalidTransition   //!< The job cannot perform the request in its state.
};

/**
 * @brief Result of decoding one request line.
 */
KEEPER_MODULE_EXPORT struct CommandParseResult {
    std::optional<RemoteCommand> command;       //!< Set on success.
    CommandError error = CommandError::None;    //!< Failure kind.
    QString message;                            //!< Failure description.

    //!< @brief True when a command was decoded.
    bool ok() const { return command.has_value(); }
};

//!< @brief Maximum accepted request line length in bytes.
KEEPER_MODULE_EXPORT constexpr qsizetype maxCommandLineLength = 64 * 1024;

//!< @brief Wire name of a verb, e.g. "GET_STATUS".
KEEPER_MODULE_EXPORT QString commandKindToString(CommandKind kind);

/**
 * @brief Decodes one request line (without the trailing newline).
 * @param line Raw bytes.
 * @return Command or typed error.
 */
KEEPER_MODULE_EXPORT CommandParseResult parseRemoteCommand(const QByteArray& line);

//!< @brief Short name of a failure kind, e.g. "UnknownJob".
KEEPER_MODULE_EXPORT QString commandErrorToString(CommandError error);

/**
 * @brief Maps the result of an engine control call to a protocol error.
 * @param error Engine failure kind.
 * @return UnknownJob, InvalidTransition or None.
 */
KEEPER_MODULE_EXPORT CommandError commandErrorFor(ControlError error);

/**
 * @brief True if the server should close the connection after this error.
 * @param error Failure kind.
 */
KEEPER_MODULE_EXPORT bool closesConnection(CommandError error);

/**
 * @brief Encodes an error response line {"error": message}.
 * @param message Error text.
 * @return Compact JSON without trailing newline.
 */
KEEPER_MODULE_EXPORT QByteArray errorResponse(const QString& message);
