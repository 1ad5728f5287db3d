module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <QStandardPaths>
#include <QtGlobal>
#include <QtNumeric>

module keeper.core.settings;

import keeper.core.jobtypes;
import keeper.utils.path_utils;

namespace utils = keeper::utils;

static QStringList stringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& v : array) {
        if (v.isString()) out.append(v.toString());
    }
    return out;
}

// JSON numbers are doubles; anything outside [minimum, maximum] is pinned to the bound
static qint64 boundedCount(const QJsonValue& value, qint64 fallback, qint64 minimum, qint64 maximum)
{
    const double d = value.toDouble(static_cast<double>(fallback));
    if (qIsNaN(d)) return fallback;
    if (d <= static_cast<double>(minimum)) return minimum;
    if (d >= static_cast<double>(maximum)) return maximum;
    return static_cast<qint64>(d);
}

static QJsonArray jsonArray(const QStringList& values)
{
    QJsonArray out;
    for (const QString& v : values) out.append(v);
    return out;
}

static void setError(QString* errorString, const QString& message)
{
    if (errorString) *errorString = message;
}

Settings Settings::fromJson(const QJsonObject& root)
{
    Settings s;
    s.priorityExtensions = utils::normalizeExtensions(stringList(root.value("priorityExtensions")));
    s.encryptionExtensions = utils::normalizeExtensions(stringList(root.value("encryptionExtensions")));
    s.encryptionKey = root.value("encryptionKey").toString();
    s.encryptorProgram = root.value("encryptorProgram").toString();
    s.encryptorArguments = stringList(root.value("encryptorArguments"));
    s.encryptorTimeoutMs = qMax(1, root.value("encryptorTimeoutMs").toInt(s.encryptorTimeoutMs));
    s.encryptorLockFile = root.value("encryptorLockFile").toString();
    s.businessSoftware = utils::normalizeProcessNames(stringList(root.value("businessSoftware")));
    s.businessPollIntervalMs = qMax(100, root.value("businessPollIntervalMs").toInt(s.businessPollIntervalMs));
    s.largeFileThresholdKb = boundedCount(root.value("largeFileThresholdKb"), 0, 0, Settings::kMaxThresholdKb);
    s.networkLoadThresholdBytesPerSec = boundedCount(root.value("networkLoadThresholdBytesPerSec"), 0, 0, Settings::kMaxByteCount);
    s.networkPollIntervalMs = qMax(100, root.value("networkPollIntervalMs").toInt(s.networkPollIntervalMs));
    s.maxConcurrentJobs = qMax(0, root.value("maxConcurrentJobs").toInt(0));
    const int port = root.value("remotePort").toInt(s.remotePort);
    if (port > 0 && port <= 65535) s.remotePort = static_cast<quint16>(port);
    s.chunkSize = boundedCount(root.value("chunkSize"), s.chunkSize, 512, 64 * 1024 * 1024);
    s.transferRateLimit = boundedCount(root.value("transferRateLimit"), 0, 0, Settings::kMaxByteCount);
    s.stateDirectory = root.value("stateDirectory").toString();

    const QString envStateDir = qEnvironmentVariable("KEEPER_STATE_DIR");
    if (!envStateDir.isEmpty()) s.stateDirectory = envStateDir;
    if (s.stateDirectory.isEmpty()) s.stateDirectory = defaultStateDirectory();

    if (!s.encryptionKey.isEmpty() && s.encryptionKey.size() < kMinimumKeyLength) {
        qWarning() << "Encryption key shorter than" << kMinimumKeyLength << "characters, encryption disabled";
    }
    return s;
}

QJsonObject Settings::toJson() const
{
    QJsonObject root;
    root.insert("priorityExtensions", jsonArray(priorityExtensions));
    root.insert("encryptionExtensions", jsonArray(encryptionExtensions));
    root.insert("encryptionKey", encryptionKey);
    root.insert("encryptorProgram", encryptorProgram);
    root.insert("encryptorArguments", jsonArray(encryptorArguments));
    root.insert("encryptorTimeoutMs", encryptorTimeoutMs);
    root.insert("encryptorLockFile", encryptorLockFile);
    root.insert("businessSoftware", jsonArray(businessSoftware));
    root.insert("businessPollIntervalMs", businessPollIntervalMs);
    root.insert("largeFileThresholdKb", static_cast<double>(largeFileThresholdKb));
    root.insert("networkLoadThresholdBytesPerSec", static_cast<double>(networkLoadThresholdBytesPerSec));
    root.insert("networkPollIntervalMs", networkPollIntervalMs);
    root.insert("maxConcurrentJobs", maxConcurrentJobs);
    root.insert("remotePort", remotePort);
    root.insert("chunkSize", static_cast<double>(chunkSize));
    root.insert("transferRateLimit", static_cast<double>(transferRateLimit));
    root.insert("stateDirectory", stateDirectory);
    return root;
}

QString defaultSettingsPath()
{
    const QString env = qEnvironmentVariable("KEEPER_SETTINGS");
    if (!env.isEmpty()) return env;
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return base.isEmpty() ? QStringLiteral("settings.json") : base + "/settings.json";
}

QString defaultStateDirectory()
{
    const QString env = qEnvironmentVariable("KEEPER_STATE_DIR");
    if (!env.isEmpty()) return env;
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return base.isEmpty() ? QDir::currentPath() : base;
}

bool loadSettings(const QString& path, Settings& settings, QString* errorString)
{
    QFile file(path);
    if (!file.exists()) {
        settings = Settings::fromJson(QJsonObject());
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorString, QString("Cannot open %1: %2").arg(path, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorString, QString("Invalid settings JSON in %1: %2").arg(path, parseError.errorString()));
        return false;
    }
    if (!doc.isObject()) {
        setError(errorString, QString("Settings file %1 must contain a JSON object").arg(path));
        return false;
    }

    settings = Settings::fromJson(doc.object());
    return true;
}

bool loadJobs(const QString& path, QList<BackupJob>& jobs, QString* errorString)
{
    jobs.clear();
    QFile file(path);
    if (!file.exists()) return true;
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorString, QString("Cannot open %1: %2").arg(path, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        setError(errorString, QString("Job list %1 must contain a JSON array").arg(path));
        return false;
    }

    const QJsonArray items = doc.array();
    for (const QJsonValue& v : items) {
        if (!v.isObject()) continue;
        const QJsonObject obj = v.toObject();
        BackupJob job;
        job.name = obj.value("name").toString().trimmed();
        job.sourcePath = obj.value("sourcePath").toString();
        job.targetPath = obj.value("targetPath").toString();
        const auto type = backupTypeFromString(obj.value("type").toString(QStringLiteral("Full")));
        if (job.name.isEmpty() || job.sourcePath.isEmpty() || job.targetPath.isEmpty() || !type) {
            qWarning() << "Skipping invalid job entry in" << path << job.name;
            continue;
        }
        job.type = *type;
        jobs.append(job);
    }
    return true;
}

bool saveJobs(const QString& path, const QList<BackupJob>& jobs, QString* errorString)
{
    QJsonArray items;
    for (const BackupJob& job : jobs) {
        QJsonObject obj;
        obj.insert("name", job.name);
        obj.insert("sourcePath", job.sourcePath);
        obj.insert("targetPath", job.targetPath);
        obj.insert("type", backupTypeToString(job.type));
        items.append(obj);
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorString, QString("Cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(items).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(errorString, QString("Cannot commit %1: %2").arg(path, file.errorString()));
        return false;
    }
    return true;
}
