module;
#include <QDir>
#include <QElapsedTimer>
#include <QLockFile>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QProcess>
#include <QProcessEnvironment>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

module keeper.services.crypto_gateway;

Q_LOGGING_CATEGORY(lcCrypto, "keeper.crypto")

QString encryptionErrorToString(EncryptionError error)
{
    switch (error) {
    case EncryptionError::None: return QStringLiteral("None");
    case EncryptionError::NotConfigured: return QStringLiteral("NotConfigured");
    case EncryptionError::Conflict: return QStringLiteral("EncryptionConflict");
    case EncryptionError::LaunchFailed: return QStringLiteral("LaunchFailed");
    case EncryptionError::Timeout: return QStringLiteral("Timeout");
    case EncryptionError::Failed: return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

CryptoGateway::CryptoGateway(const QString& program,
                             const QStringList& arguments,
                             const QString& key,
                             int timeoutMs,
                             const QString& lockPath)
    : m_program(program)
    , m_arguments(arguments)
    , m_key(key)
    , m_timeoutMs(qMax(1, timeoutMs))
    , m_lockPath(lockPath.isEmpty() ? defaultLockPath() : lockPath)
{
}

QString CryptoGateway::defaultLockPath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    if (dir.isEmpty()) dir = QDir::tempPath();
    return QDir(dir).filePath(QStringLiteral("keeper-crypt.lock"));
}

EncryptionResult CryptoGateway::encrypt(const QString& source, const QString& destination)
{
    EncryptionResult result;
    if (!isConfigured()) {
        result.error = EncryptionError::NotConfigured;
        result.message = QStringLiteral("Encryptor program or key not configured");
        return result;
    }

    QMutexLocker locker(&m_mutex);

    QLockFile lock(m_lockPath);
    lock.setStaleLockTime(0);
    if (!lock.tryLock(0)) {
        qint64 pid = 0;
        QString host;
        QString app;
        lock.getLockInfo(&pid, &host, &app);
        result.error = EncryptionError::Conflict;
        result.message = QString("Encryptor already running (pid %1, %2)").arg(pid).arg(app.isEmpty() ? QStringLiteral("unknown") : app);
        qCWarning(lcCrypto) << "Encryption conflict for" << source << result.message;
        return result;
    }

    QProcess proc;
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("KEEPER_ENCRYPTION_KEY"), m_key);
    proc.setProcessEnvironment(env);
    proc.setProcessChannelMode(QProcess::ForwardedErrorChannel);

    QStringList args = m_arguments;
    args << QStringLiteral("encrypt") << source << destination;

    QElapsedTimer timer;
    timer.start();
    proc.start(m_program, args);
    if (!proc.waitForStarted(m_timeoutMs)) {
        result.error = EncryptionError::LaunchFailed;
        result.message = QString("Cannot start %1: %2").arg(m_program, proc.errorString());
    } else if (!proc.waitForFinished(m_timeoutMs)) {
        proc.kill();
        proc.waitForFinished(1000);
        result.error = EncryptionError::Timeout;
        result.message = QString("Encryptor timed out after %1 ms").arg(m_timeoutMs);
    } else if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        result.error = EncryptionError::Failed;
        result.exitCode = proc.exitCode();
        result.message = proc.exitStatus() == QProcess::NormalExit
                             ? QString("Encryptor exited with code %1").arg(proc.exitCode())
                             : QStringLiteral("Encryptor crashed");
    }
    result.elapsedMs = timer.elapsed();
    lock.unlock();

    if (result.ok()) {
        qCDebug(lcCrypto) << "Encrypted" << source << "in" << result.elapsedMs << "ms";
    } else {
        qCWarning(lcCrypto) << "Encryption of" << source << "failed:" << result.message;
    }
    return result;
}
