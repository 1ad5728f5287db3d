/*!
 * @file        jobtypes.cppm
 * @brief       Backup job definitions, live job state and control results.
 * @details     Declares the value types shared by every backup component:
 *              the immutable job definition, the live state owned by the
 *              engine, the per-file transfer task derived at enumeration
 *              time, and the typed result returned by control operations.
 *
 *              The job state machine is:
 *              Ready -> Active -> {Paused, Stopped, Cancelled, Completed, Error}
 *              Paused -> {Active, Stopped, Cancelled, Error}
 *              Terminal states only leave through an explicit reset to Ready
 *              when a new run of the same job is requested.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QDateTime>
#include <QString>
#include <QtGlobal>
#include <optional>

#ifndef Q_MOC_RUN
export module keeper.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

//!< @brief Kind of backup run.
KEEPER_MODULE_EXPORT enum class BackupType {
    Full,           //!< Copy every file on each run.
    Differential    //!< Copy only files changed since the last completed run.
};

//!< @brief Lifecycle status of a backup job.
KEEPER_MODULE_EXPORT enum class JobStatus {
    Ready,
    Active,
    Paused,
    Stopped,
    Cancelled,
    Completed,
    Error
};

/**
 * @brief Immutable definition of a backup job.
 *
 * Created, edited and deleted by the orchestrator. The engine never
 * mutates it; a run works on a copy taken at start.
 */
KEEPER_MODULE_EXPORT struct BackupJob {
    QString name;                       //!< Unique job key.
    QString sourcePath;                 //!< Directory to back up.
    QString targetPath;                 //!< Destination directory.
    BackupType type = BackupType::Full; //!< Full or differential.
};

/**
 * @brief Live state of a backup job.
 *
 * Owned by the engine and published through JobRegistry.
 */
KEEPER_MODULE_EXPORT struct JobState {
    JobStatus status = JobStatus::Ready;    //!< Current lifecycle status.
    int progressPercentage = 0;             //!< 0..100.
    QString currentFile;                    //!< Relative path of the file in flight.
    qint64 bytesCopied = 0;                 //!< Bytes processed in this run.
    qint64 totalBytes = 0;                  //!< Bytes selected for this run.
    int filesDone = 0;                      //!< Files processed in this run.
    int filesTotal = 0;                     //!< Files selected for this run.
    QString errorMessage;                   //!< Set when status is Error.
    bool pausedByBusinessSoftware = false;  //!< Automatic pause marker.
    QDateTime lastActionTime;               //!< Last state mutation.
};

//!< @brief Consistent copy of one job definition with its state.
KEEPER_MODULE_EXPORT struct JobSnapshot {
    BackupJob job;
    JobState state;
};

/**
 * @brief One file selected for transfer during a run.
 */
KEEPER_MODULE_EXPORT struct FileTransferTask {
    QString relativePath;               //!< Path relative to the job source.
    QString sourcePath;                 //!< Absolute source file path.
    QString targetPath;                 //!< Absolute target file path.
    qint64 size = 0;                    //!< Size in bytes at enumeration time.
    qint64 modifiedMs = 0;              //!< Modification time (epoch ms).
    bool isPriorityExtension = false;   //!< Extension is in the priority set.
    bool isLarge = false;               //!< Size exceeds the large file threshold.
    bool needsEncryption = false;       //!< Extension is in the encryption set.
};

//!< @brief Failure kinds returned by control operations.
KEEPER_MODULE_EXPORT enum class ControlError {
    None,
    UnknownJob,
    InvalidTransition,
    DuplicateJob,
    InvalidJob,
    JobBusy
};

/**
 * @brief Result of a job control or job management operation.
 */
KEEPER_MODULE_EXPORT struct ControlResult {
    ControlError error = ControlError::None;    //!< Failure kind.
    QString message;                            //!< Human readable reason.

    //!< @brief True when the operation succeeded.
    bool ok() const { return error == ControlError::None; }

    //!< @brief Successful result.
    static ControlResult success() { return ControlResult{}; }

    /**
     * @brief Failed result.
     * @param error Failure kind.
     * @param message Reason text.
     */
    static ControlResult failure(ControlError error, const QString& message)
    {
        return ControlResult{ error, message };
    }
};

//!< @brief Returns "Full" or "Differential".
KEEPER_MODULE_EXPORT QString backupTypeToString(BackupType type);

/**
 * @brief Parses a backup type name (case-insensitive).
 * @param value "Full" or "Differential".
 * @return Parsed type, or std::nullopt for unknown names.
 */
KEEPER_MODULE_EXPORT std::optional<BackupType> backupTypeFromString(const QString& value);

//!< @brief Returns the status name, e.g. "Active".
KEEPER_MODULE_EXPORT QString jobStatusToString(JobStatus status);

//!< @brief True for Stopped, Cancelled, Completed and Error.
KEEPER_MODULE_EXPORT bool isTerminal(JobStatus status);

/**
 * @brief Checks whether a status change is an edge of the job state machine.
 * @param from Current status.
 * @param to Requested status.
 * @return true if the transition is allowed.
 */
KEEPER_MODULE_EXPORT bool isValidTransition(JobStatus from, JobStatus to);
