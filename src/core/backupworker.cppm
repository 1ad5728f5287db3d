/*!
 * @file        backupworker.cppm
 * @brief       Execution of a single backup run.
 * @details     A BackupWorker performs one run of one job on a pool thread:
 *              it enumerates the source tree, selects the files to transfer
 *              (all of them for a full backup, changed ones for a
 *              differential backup), and copies them one by one through the
 *              global admission gates.
 *
 *              Before each file the worker passes its check point (pause and
 *              cancellation), then the PriorityGate and the LargeFileThrottle.
 *              Files are streamed in bounded chunks into a temporary part file
 *              that is renamed over the target only once complete, so a stop
 *              never leaves a half-written file in place. Files with an
 *              encryption extension are then handed to the CryptoGateway.
 *
 *              Per-file failures are logged and skipped; an unreadable source
 *              directory or an unexpected exception ends the run in Error.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QAtomicInteger>
#include <QDateTime>
#include <QElapsedTimer>
#include <QList>
#include <QString>
#include <QtGlobal>
#include <memory>

#ifndef Q_MOC_RUN
export module keeper.core.backupworker;
import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.jobregistry;
import keeper.core.jobcontrol;
import keeper.core.prioritygate;
import keeper.core.largefilethrottle;
import keeper.core.snapshotstore;
import keeper.core.settings;
import keeper.services.crypto_gateway;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Shared collaborators of every worker. None are owned.
 */
KEEPER_MODULE_EXPORT struct WorkerContext {
    JobRegistry* registry = nullptr;                //!< Job state store.
    EventBus* bus = nullptr;                        //!< Log event destination.
    PriorityGate* priorityGate = nullptr;           //!< Priority preemption gate.
    LargeFileThrottle* largeFileThrottle = nullptr; //!< Large file gate.
    CryptoGateway* crypto = nullptr;                //!< Encryptor proxy, may be null.
    SnapshotStore* snapshots = nullptr;             //!< Differential state.
    QAtomicInteger<qint64>* bytesCounter = nullptr; //!< Engine-wide transferred bytes.
    Settings settings;                              //!< Settings for this run.
};

/**
 * @brief Selects the files of a run.
 *
 * Files are ordered by relative path, then priority files are moved to the
 * front keeping that order.
 *
 * @param job Job definition.
 * @param settings Priority, encryption and large file settings.
 * @param previous Manifest of the last completed run (differential only).
 * @param selected Receives the files to transfer.
 * @param unchanged Receives fingerprints of files skipped as unchanged.
 * @param errorString Set when the source cannot be read.
 * @return false if the source directory is missing or unreadable.
 */
KEEPER_MODULE_EXPORT bool planTransfers(const BackupJob& job,
                                        const Settings& settings,
                                        const FileManifest& previous,
                                        QList<FileTransferTask>& selected,
                                        FileManifest& unchanged,
                                        QString* errorString = nullptr);

/**
 * @brief Runs one backup of one job.
 */
KEEPER_MODULE_EXPORT class BackupWorker {
public:
    /**
     * @brief Construct a worker.
     * @param job Job definition copied for the run.
     * @param control Pause/cancel token shared with the orchestrator.
     * @param context Shared collaborators.
     */
    BackupWorker(const BackupJob& job, std::shared_ptr<JobControl> control, const WorkerContext& context);

    /**
     * @brief Executes the run to a terminal state.
     *
     * Never throws: exceptions are turned into Status=Error.
     */
    void run();

private:
    enum class CopyOutcome { Copied, Failed, Cancelled };

    void execute();
    bool waitIfPaused();
    bool admit(const FileTransferTask& task);
    void releasePermits(const FileTransferTask& task);
    CopyOutcome copyFile(const FileTransferTask& task, QString* errorString);
    bool encryptFile(const FileTransferTask& task, qint64* elapsedMs, QString* errorString);
    void throttle(qint64 bytes);
    void reportProgress(const QString& currentFile, bool force);
    void finishCancelled(int filesDone, int filesTotal);
    void fail(const QString& message);
    void log(ActionType action,
             LogType type,
             const QString& message,
             const FileTransferTask* task = nullptr,
             qint64 transferMs = 0,
             qint64 encryptionMs = 0,
             const QDateTime& at = QDateTime());

    BackupJob m_job;                        //!< Job definition.
    std::shared_ptr<JobControl> m_control;  //!< Pause/cancel token.
    WorkerContext m_ctx;                    //!< Collaborators.
    qint64 m_bytesDone = 0;                 //!< Bytes processed in this run.
    qint64 m_totalBytes = 0;                //!< Bytes selected for this run.
    int m_filesDone = 0;                    //!< Files processed in this run.
    int m_filesTotal = 0;                   //!< Files selected for this run.
    QElapsedTimer m_progressTimer;          //!< Progress publish rate limiter.
    QElapsedTimer m_throttleTimer;          //!< Transfer rate window.
    qint64 m_throttleBytes = 0;             //!< Bytes in the current window.
};
