module;
#include <QAtomicInteger>
#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>
#include <algorithm>
#include <exception>
#include <memory>

module keeper.core.backupworker;

import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.jobregistry;
import keeper.core.jobcontrol;
import keeper.core.prioritygate;
import keeper.core.largefilethrottle;
import keeper.core.snapshotstore;
import keeper.core.settings;
import keeper.services.crypto_gateway;
import keeper.utils.path_utils;

namespace utils = keeper::utils;

Q_LOGGING_CATEGORY(lcWorker, "keeper.engine")

static const QString partSuffix = QStringLiteral(".keeper-part");
static const QString encryptedSuffix = QStringLiteral(".keeper-enc");
static constexpr qint64 progressIntervalMs = 200;

bool planTransfers(const BackupJob& job,
                   const Settings& settings,
                   const FileManifest& previous,
                   QList<FileTransferTask>& selected,
                   FileManifest& unchanged,
                   QString* errorString)
{
    selected.clear();
    unchanged.clear();

    const QFileInfo sourceInfo(job.sourcePath);
    if (!sourceInfo.exists() || !sourceInfo.isDir() || !sourceInfo.isReadable()) {
        if (errorString) *errorString = QString("Source directory not found or unreadable: %1").arg(job.sourcePath);
        return false;
    }

    const QDir sourceDir(sourceInfo.absoluteFilePath());
    const QDir targetDir(QFileInfo(job.targetPath).absoluteFilePath());
    const QString targetPrefix = QDir::cleanPath(targetDir.absolutePath()) + '/';
    const qint64 largeThreshold = settings.largeFileThresholdBytes();
    const bool encrypt = settings.encryptionEnabled();

    QStringList relativePaths;
    QDirIterator it(sourceDir.absolutePath(), QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (QDir::cleanPath(path).startsWith(targetPrefix)) continue;
        relativePaths.append(sourceDir.relativeFilePath(path));
    }
    relativePaths.sort();

    for (const QString& rel : relativePaths) {
        const QFileInfo info(sourceDir.filePath(rel));
        FileTransferTask task;
        task.relativePath = rel;
        task.sourcePath = info.absoluteFilePath();
        task.targetPath = targetDir.filePath(rel);
        task.size = info.size();
        task.modifiedMs = info.lastModified().toMSecsSinceEpoch();
        task.isPriorityExtension = utils::hasExtension(rel, settings.priorityExtensions);
        task.isLarge = largeThreshold > 0 && task.size > largeThreshold;
        task.needsEncryption = encrypt && utils::hasExtension(rel, settings.encryptionExtensions);

        if (job.type == BackupType::Differential) {
            const FileFingerprint current{ task.size, task.modifiedMs };
            auto recorded = previous.constFind(rel);
            if (recorded != previous.constEnd() && recorded.value() == current && QFileInfo::exists(task.targetPath)) {
                unchanged.insert(rel, current);
                continue;
            }
        }
        selected.append(task);
    }

    std::stable_sort(selected.begin(), selected.end(), [](const FileTransferTask& a, const FileTransferTask& b) {
        return a.isPriorityExtension && !b.isPriorityExtension;
    });
    return true;
}

BackupWorker::BackupWorker(const BackupJob& job, std::shared_ptr<JobControl> control, const WorkerContext& context)
    : m_job(job)
    , m_control(std::move(control))
    , m_ctx(context)
{
}

void BackupWorker::run()
{
    try {
        execute();
    } catch (const std::exception& e) {
        qCCritical(lcWorker) << "Job" << m_job.name << "aborted:" << e.what();
        fail(QString("Unexpected failure: %1").arg(QString::fromLocal8Bit(e.what())));
    }
}

void BackupWorker::execute()
{
    QList<FileTransferTask> tasks;
    FileManifest manifest;
    QString error;

    const FileManifest previous = m_job.type == BackupType::Differential && m_ctx.snapshots
                                      ? m_ctx.snapshots->load(m_job.name)
                                      : FileManifest();
    if (!planTransfers(m_job, m_ctx.settings, previous, tasks, manifest, &error)) {
        fail(error);
        return;
    }

    if (!QDir().mkpath(m_job.targetPath)) {
        fail(QString("Cannot create target directory: %1").arg(m_job.targetPath));
        return;
    }

    int priorityCount = 0;
    m_filesTotal = tasks.size();
    for (const FileTransferTask& task : tasks) {
        m_totalBytes += task.size;
        if (task.isPriorityExtension) priorityCount++;
    }

    m_ctx.registry->updateProgress(m_job.name, [this](JobState& s) {
        s.filesTotal = m_filesTotal;
        s.totalBytes = m_totalBytes;
        s.filesDone = 0;
        s.bytesCopied = 0;
        s.progressPercentage = 0;
        s.currentFile.clear();
        s.errorMessage.clear();
    });
    m_ctx.priorityGate->registerPending(m_job.name, priorityCount);
    log(ActionType::BackupStarted, LogType::Info,
        QString("%1 files (%2) selected, %3 priority, %4 unchanged")
            .arg(m_filesTotal)
            .arg(utils::formatFileSize(m_totalBytes))
            .arg(priorityCount)
            .arg(manifest.size()));

    int failures = 0;
    for (const FileTransferTask& task : tasks) {
        if (!admit(task)) {
            finishCancelled(m_filesDone, m_filesTotal);
            return;
        }

        reportProgress(task.relativePath, true);

        const qint64 bytesBefore = m_bytesDone;
        QElapsedTimer transferTimer;
        transferTimer.start();
        const CopyOutcome outcome = copyFile(task, &error);
        const qint64 transferMs = transferTimer.elapsed();

        if (outcome == CopyOutcome::Cancelled) {
            releasePermits(task);
            finishCancelled(m_filesDone, m_filesTotal);
            return;
        }

        bool recorded = outcome == CopyOutcome::Copied;
        qint64 encryptionMs = 0;
        if (outcome == CopyOutcome::Copied && task.needsEncryption) {
            QString encryptError;
            if (!encryptFile(task, &encryptionMs, &encryptError)) {
                recorded = false;
                failures++;
            }
        }
        const QDateTime finishedAt = QDateTime::currentDateTime();
        releasePermits(task);

        if (outcome == CopyOutcome::Copied) {
            log(ActionType::FileCopy, LogType::Info, QStringLiteral("File copied"), &task, transferMs, encryptionMs, finishedAt);
        } else {
            failures++;
            log(ActionType::FileSkipped, LogType::Error, error, &task, -1, 0);
        }

        if (recorded) manifest.insert(task.relativePath, FileFingerprint{ task.size, task.modifiedMs });
        if (task.isPriorityExtension) m_ctx.priorityGate->completeOne(m_job.name);

        m_filesDone++;
        m_bytesDone = qMin(m_totalBytes, bytesBefore + task.size);
        reportProgress(QString(), true);
    }

    m_ctx.priorityGate->retract(m_job.name);

    // A pause requested during the last file still holds the run
    for (;;) {
        if (!waitIfPaused()) {
            finishCancelled(m_filesDone, m_filesTotal);
            return;
        }
        const ControlResult done = m_ctx.registry->transition(m_job.name, JobStatus::Completed);
        if (done.ok()) break;
        const auto state = m_ctx.registry->state(m_job.name);
        if (!state || state->status != JobStatus::Paused) {
            qCWarning(lcWorker) << done.message;
            break;
        }
    }

    QString message = failures > 0 ? QString("Completed with %1 failed files").arg(failures)
                                   : QStringLiteral("Completed");
    bool saved = true;
    if (m_ctx.snapshots) {
        QString saveError;
        saved = m_ctx.snapshots->save(m_job.name, manifest, &saveError);
        if (!saved) message += QString(", cannot record differential state: %1").arg(saveError);
    }

    log(ActionType::BackupCompleted, failures > 0 || !saved ? LogType::Warning : LogType::Info, message);
}

bool BackupWorker::waitIfPaused()
{
    if (!m_control->isPaused()) return !m_control->isCancelled();

    m_ctx.priorityGate->setSuspended(m_job.name, true);
    const bool proceed = m_control->waitWhilePaused();
    m_ctx.priorityGate->setSuspended(m_job.name, false);
    return proceed;
}

bool BackupWorker::admit(const FileTransferTask& task)
{
    for (;;) {
        if (!waitIfPaused()) return false;

        // No permit of one gate is held while blocked on the other
        if (!m_ctx.largeFileThrottle->acquire(task.isLarge, *m_control)) return false;
        if (!m_ctx.priorityGate->tryAcquire(task.isPriorityExtension)) {
            m_ctx.largeFileThrottle->release(task.isLarge);
            if (!m_ctx.priorityGate->waitUntilAdmissible(task.isPriorityExtension, *m_control)) return false;
            continue;
        }
        if (m_control->isCancelled()) {
            releasePermits(task);
            return false;
        }
        if (!m_control->isPaused()) return true;

        // Paused while waiting on a gate: hand the permits back before blocking
        releasePermits(task);
    }
}

void BackupWorker::releasePermits(const FileTransferTask& task)
{
    m_ctx.largeFileThrottle->release(task.isLarge);
    m_ctx.priorityGate->release(task.isPriorityExtension);
}

BackupWorker::CopyOutcome BackupWorker::copyFile(const FileTransferTask& task, QString* errorString)
{
    const QString targetDir = QFileInfo(task.targetPath).absolutePath();
    if (!QDir(targetDir).exists()) {
        if (!QDir().mkpath(targetDir)) {
            *errorString = QString("Cannot create directory %1").arg(targetDir);
            return CopyOutcome::Failed;
        }
        log(ActionType::DirCreate, LogType::Info, targetDir);
    }

    QFile in(task.sourcePath);
    if (!in.open(QIODevice::ReadOnly)) {
        *errorString = QString("Cannot open %1: %2").arg(task.sourcePath, in.errorString());
        return CopyOutcome::Failed;
    }

    const QString partPath = task.targetPath + partSuffix;
    QFile out(partPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        *errorString = QString("Cannot write %1: %2").arg(partPath, out.errorString());
        return CopyOutcome::Failed;
    }

    const qint64 chunkSize = qMax<qint64>(512, m_ctx.settings.chunkSize);
    QByteArray buffer(static_cast<int>(chunkSize), Qt::Uninitialized);
    const qint64 baseBytes = m_bytesDone;
    qint64 copied = 0;

    for (;;) {
        if (m_control->isCancelled()) {
            out.close();
            QFile::remove(partPath);
            return CopyOutcome::Cancelled;
        }

        const qint64 n = in.read(buffer.data(), chunkSize);
        if (n < 0) {
            *errorString = QString("Read error on %1: %2").arg(task.sourcePath, in.errorString());
            out.close();
            QFile::remove(partPath);
            return CopyOutcome::Failed;
        }
        if (n == 0) break;

        if (out.write(buffer.constData(), n) != n) {
            *errorString = QString("Write error on %1: %2").arg(partPath, out.errorString());
            out.close();
            QFile::remove(partPath);
            return CopyOutcome::Failed;
        }

        copied += n;
        if (m_ctx.bytesCounter) m_ctx.bytesCounter->fetchAndAddRelaxed(n);
        m_bytesDone = baseBytes + qMin(copied, task.size);
        reportProgress(task.relativePath, false);
        throttle(n);
    }

    out.setFileTime(QDateTime::fromMSecsSinceEpoch(task.modifiedMs), QFileDevice::FileModificationTime);
    out.close();
    if (out.error() != QFileDevice::NoError) {
        *errorString = QString("Cannot finalize %1: %2").arg(partPath, out.errorString());
        QFile::remove(partPath);
        return CopyOutcome::Failed;
    }
    if (!utils::replaceFile(partPath, task.targetPath, errorString)) {
        QFile::remove(partPath);
        return CopyOutcome::Failed;
    }
    return CopyOutcome::Copied;
}

bool BackupWorker::encryptFile(const FileTransferTask& task, qint64* elapsedMs, QString* errorString)
{
    if (!m_ctx.crypto) {
        *elapsedMs = -1;
        *errorString = QStringLiteral("No encryptor available");
        log(ActionType::FileEncrypt, LogType::Error, *errorString, &task, 0, -1);
        return false;
    }

    const QString encryptedPath = task.targetPath + encryptedSuffix;
    const EncryptionResult result = m_ctx.crypto->encrypt(task.targetPath, encryptedPath);
    if (result.ok() && utils::replaceFile(encryptedPath, task.targetPath, errorString)) {
        *elapsedMs = qMax<qint64>(1, result.elapsedMs);
        log(ActionType::FileEncrypt, LogType::Info, QStringLiteral("File encrypted"), &task, 0, *elapsedMs);
        return true;
    }

    QFile::remove(encryptedPath);
    if (!result.ok()) {
        *errorString = QString("%1: %2").arg(encryptionErrorToString(result.error), result.message);
    }
    *elapsedMs = -1;
    log(ActionType::FileEncrypt, LogType::Error, *errorString, &task, 0, -1);
    return false;
}

void BackupWorker::throttle(qint64 bytes)
{
    const qint64 limit = m_ctx.settings.transferRateLimit;
    if (limit <= 0) return;

    if (!m_throttleTimer.isValid()) {
        m_throttleTimer.start();
        m_throttleBytes = 0;
    }
    m_throttleBytes += bytes;

    const qint64 elapsed = m_throttleTimer.elapsed();
    const qint64 expected = m_throttleBytes * 1000 / limit;
    if (expected > elapsed) m_control->sleepFor(static_cast<int>(expected - elapsed));

    if (m_throttleTimer.elapsed() >= 1000) {
        m_throttleTimer.restart();
        m_throttleBytes = 0;
    }
}

void BackupWorker::reportProgress(const QString& currentFile, bool force)
{
    if (!force && m_progressTimer.isValid() && m_progressTimer.elapsed() < progressIntervalMs) return;
    m_progressTimer.start();

    const int percent = m_totalBytes > 0
                            ? static_cast<int>(m_bytesDone * 100 / m_totalBytes)
                            : (m_filesTotal > 0 ? m_filesDone * 100 / m_filesTotal : 0);
    m_ctx.registry->updateProgress(m_job.name, [&](JobState& s) {
        s.currentFile = currentFile;
        s.bytesCopied = m_bytesDone;
        s.filesDone = m_filesDone;
        s.progressPercentage = percent;
    });
}

void BackupWorker::finishCancelled(int filesDone, int filesTotal)
{
    m_ctx.priorityGate->retract(m_job.name);

    const bool shutdown = m_control->cancelReason() == JobControl::CancelReason::Shutdown;
    const JobStatus status = shutdown ? JobStatus::Cancelled : JobStatus::Stopped;
    const ControlResult r = m_ctx.registry->transition(m_job.name, status);
    if (!r.ok()) qCWarning(lcWorker) << r.message;

    log(shutdown ? ActionType::BackupCancelled : ActionType::BackupStopped, LogType::Warning,
        QString("%1 after %2 of %3 files").arg(shutdown ? QStringLiteral("Cancelled") : QStringLiteral("Stopped"))
            .arg(filesDone)
            .arg(filesTotal));
}

void BackupWorker::fail(const QString& message)
{
    m_ctx.priorityGate->retract(m_job.name);
    const ControlResult r = m_ctx.registry->transition(m_job.name, JobStatus::Error, message);
    if (!r.ok()) qCWarning(lcWorker) << r.message;
    log(ActionType::BackupError, LogType::Error, message);
}

void BackupWorker::log(ActionType action,
                       LogType type,
                       const QString& message,
                       const FileTransferTask* task,
                       qint64 transferMs,
                       qint64 encryptionMs,
                       const QDateTime& at)
{
    if (!m_ctx.bus) return;
    LogEvent event;
    event.timestamp = at.isValid() ? at : QDateTime::currentDateTime();
    event.backupName = m_job.name;
    event.backupType = m_job.type;
    event.sourcePath = task ? task->sourcePath : m_job.sourcePath;
    event.targetPath = task ? task->targetPath : m_job.targetPath;
    event.fileSize = task ? task->size : 0;
    event.transferTimeMs = transferMs;
    event.encryptionTimeMs = encryptionMs;
    event.message = message;
    event.logType = type;
    event.actionType = action;
    m_ctx.bus->publish(event);
}
