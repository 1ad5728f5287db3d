/*!
 * @file        crypto_gateway.cppm
 * @brief       Mono-instance proxy around the external encryption utility.
 * @details     The encryptor is a black-box program invoked as
 *              "<program> <arguments...> encrypt <source> <destination>" with
 *              the key passed in the KEEPER_ENCRYPTION_KEY environment
 *              variable. Only one encryption may run on the machine at a time:
 *              requests from this process are serialized by a mutex, and a
 *              lock file recording the owner PID guards against other
 *              processes. When the lock file is held elsewhere the request
 *              fails immediately with a conflict instead of waiting.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module keeper.services.crypto_gateway;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

//!< @brief Failure kinds of an encryption request.
KEEPER_MODULE_EXPORT enum class EncryptionError {
    None,           //!< Encrypted successfully.
    NotConfigured,  //!< No program or key configured.
    Conflict,       //!< The system-wide lock is held by another process.
    LaunchFailed,   //!< The program could not be started.
    Timeout,        //!< The program did not finish in time.
    Failed          //!< The program crashed or exited with a non-zero code.
};

/**
 * @brief Outcome of one encryption request.
 */
KEEPER_MODULE_EXPORT struct EncryptionResult {
    EncryptionError error = EncryptionError::None;  //!< Failure kind.
    qint64 elapsedMs = 0;                           //!< Time spent in the encryptor.
    int exitCode = 0;                               //!< Encryptor exit code.
    QString message;                                //!< Failure description.

    //!< @brief True on success.
    bool ok() const { return error == EncryptionError::None; }
};

//!< @brief Returns a short name for an encryption error.
KEEPER_MODULE_EXPORT QString encryptionErrorToString(EncryptionError error);

/**
 * @brief Serializes access to the external encryptor. Thread-safe.
 */
KEEPER_MODULE_EXPORT class CryptoGateway {
public:
    /**
     * @brief Construct a gateway.
     * @param program Encryptor executable.
     * @param arguments Arguments placed before the "encrypt" verb.
     * @param key Encryption key.
     * @param timeoutMs Run time limit per file.
     * @param lockPath System-wide lock file, defaultLockPath() when empty.
     */
    CryptoGateway(const QString& program,
                  const QStringList& arguments,
                  const QString& key,
                  int timeoutMs = 60000,
                  const QString& lockPath = QString());

    //!< @brief Lock file shared by every keeper process of this user.
    static QString defaultLockPath();

    //!< @brief Lock file used by this gateway.
    QString lockPath() const { return m_lockPath; }

    //!< @brief True if a program and a key are set.
    bool isConfigured() const { return !m_program.isEmpty() && !m_key.isEmpty(); }

    /**
     * @brief Encrypts @p source into @p destination.
     *
     * The lock is released as soon as the encryptor exits, whatever the
     * outcome.
     *
     * @param source Plain input file.
     * @param destination Encrypted output file.
     * @return Result with elapsed time, or the failure kind.
     */
    EncryptionResult encrypt(const QString& source, const QString& destination);

private:
    QString m_program;          //!< Encryptor executable.
    QStringList m_arguments;    //!< Leading arguments.
    QString m_key;              //!< Key passed through the environment.
    int m_timeoutMs = 60000;    //!< Per-file time limit.
    QString m_lockPath;         //!< System-wide lock file.
    QMutex m_mutex;             //!< Serializes requests of this process.
};
