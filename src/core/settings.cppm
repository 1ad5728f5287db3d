/*!
 * @file        settings.cppm
 * @brief       Engine configuration and job list persistence.
 * @details     Settings is a plain value handed to the engine at construction
 *              time; the engine reads it for the duration of a run and never
 *              writes it back. Values are loaded from a JSON document, with
 *              environment overrides for the state directory.
 *
 *              The job list is stored separately as a JSON array so the
 *              orchestrator can add, edit and remove jobs without touching
 *              engine settings.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module keeper.core.settings;
import keeper.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Engine settings.
 *
 * Extension and process name lists are kept normalized (see
 * keeper::utils::normalizeExtensions and normalizeProcessNames).
 */
KEEPER_MODULE_EXPORT struct Settings {
    QStringList priorityExtensions;                 //!< Extensions preempting other transfers.
    QStringList encryptionExtensions;               //!< Extensions routed through the encryptor.
    QString encryptionKey;                          //!< Key handed to the encryptor.
    QString encryptorProgram;                       //!< External encryptor executable.
    QStringList encryptorArguments;                 //!< Arguments placed before the verb.
    int encryptorTimeoutMs = 60000;                 //!< Encryptor run time limit.
    QString encryptorLockFile;                      //!< System-wide lock file, empty for the default.
    QStringList businessSoftware;                   //!< Process names forcing a pause.
    int businessPollIntervalMs = 2000;              //!< Process scan interval.
    qint64 largeFileThresholdKb = 0;                //!< 0 disables the large file throttle.
    qint64 networkLoadThresholdBytesPerSec = 0;     //!< 0 disables the network monitor.
    int networkPollIntervalMs = 1000;               //!< Throughput sampling interval.
    int maxConcurrentJobs = 0;                      //!< 0 means unlimited.
    quint16 remotePort = 12345;                     //!< Remote control TCP port.
    qint64 chunkSize = 64 * 1024;                   //!< Copy buffer size in bytes.
    qint64 transferRateLimit = 0;                   //!< Bytes/sec per job, 0 = unlimited.
    QString stateDirectory;                         //!< Snapshots, job list and state file.

    //!< @brief Minimum accepted encryption key length.
    static constexpr int kMinimumKeyLength = 8;

    //!< @brief Upper bound for byte counts and rates read from JSON.
    static constexpr qint64 kMaxByteCount = Q_INT64_C(1000000000000000000);

    //!< @brief Upper bound for largeFileThresholdKb.
    static constexpr qint64 kMaxThresholdKb = kMaxByteCount / 1000;

    //!< @brief Large file threshold in bytes (1 KB = 1000 bytes), 0 when disabled.
    qint64 largeFileThresholdBytes() const
    {
        if (largeFileThresholdKb <= 0) return 0;
        return largeFileThresholdKb >= kMaxThresholdKb ? kMaxByteCount : largeFileThresholdKb * 1000;
    }

    //!< @brief True when encryption can run (program set and key long enough).
    bool encryptionEnabled() const
    {
        return !encryptorProgram.isEmpty()
            && encryptionKey.size() >= kMinimumKeyLength
            && !encryptionExtensions.isEmpty();
    }

    /**
     * @brief Builds settings from a JSON object, normalizing every list.
     *
     * Unknown keys are ignored; missing keys keep their defaults.
     *
     * @param root JSON object.
     * @return Parsed settings.
     */
    static Settings fromJson(const QJsonObject& root);

    //!< @brief Serializes settings to JSON.
    QJsonObject toJson() const;
};

/**
 * @brief Returns the default settings file path.
 *
 * Uses $KEEPER_SETTINGS when set, otherwise settings.json in the
 * application configuration location.
 */
KEEPER_MODULE_EXPORT QString defaultSettingsPath();

/**
 * @brief Returns the default state directory.
 *
 * Uses $KEEPER_STATE_DIR when set, otherwise the application data location.
 */
KEEPER_MODULE_EXPORT QString defaultStateDirectory();

/**
 * @brief Loads settings from a JSON file.
 *
 * A missing file is not an error and yields defaults. A file that exists
 * but cannot be read or parsed is reported through errorString.
 *
 * @param path Settings file path.
 * @param settings Receives the parsed settings.
 * @param errorString Optional error description.
 * @return true on success.
 */
KEEPER_MODULE_EXPORT bool loadSettings(const QString& path, Settings& settings, QString* errorString = nullptr);

/**
 * @brief Loads a job list from a JSON array file.
 *
 * Entries without a name, with an empty path or an unknown type are
 * skipped with a warning.
 *
 * @param path Job list file path.
 * @param jobs Receives the jobs.
 * @param errorString Optional error description.
 * @return true on success (a missing file yields an empty list).
 */
KEEPER_MODULE_EXPORT bool loadJobs(const QString& path, QList<BackupJob>& jobs, QString* errorString = nullptr);

/**
 * @brief Saves a job list atomically.
 * @param path Job list file path.
 * @param jobs Jobs to store.
 * @param errorString Optional error description.
 * @return true on success.
 */
KEEPER_MODULE_EXPORT bool saveJobs(const QString& path, const QList<BackupJob>& jobs, QString* errorString = nullptr);
