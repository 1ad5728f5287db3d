/*!
 * @file        snapshotstore.cppm
 * @brief       Per-job record of the files transferred by the last completed run.
 * @details     Differential runs compare each source file against the
 *              fingerprint (size and modification time) recorded when the
 *              job last completed. Snapshots are JSON documents stored under
 *              "<state directory>/snapshots" and written atomically.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module keeper.core.snapshotstore;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

//!< @brief Recorded identity of one transferred file.
KEEPER_MODULE_EXPORT struct FileFingerprint {
    qint64 size = 0;        //!< Size in bytes.
    qint64 modifiedMs = 0;  //!< Modification time (epoch ms).

    bool operator==(const FileFingerprint& other) const = default;
};

//!< @brief Fingerprints keyed by path relative to the job source.
KEEPER_MODULE_EXPORT using FileManifest = QHash<QString, FileFingerprint>;

/**
 * @brief Loads and saves per-job manifests. Safe for concurrent use by different jobs.
 */
KEEPER_MODULE_EXPORT class SnapshotStore {
public:
    /**
     * @brief Construct a store rooted at a state directory.
     * @param stateDirectory Directory holding the "snapshots" folder.
     */
    explicit SnapshotStore(const QString& stateDirectory);

    //!< @brief Path of a job's snapshot file, named after a digest of the job name.
    QString pathFor(const QString& job) const;

    /**
     * @brief Loads a job's manifest.
     * @param job Job name.
     * @return Recorded manifest, empty when none exists or it is unreadable.
     */
    FileManifest load(const QString& job) const;

    /**
     * @brief Replaces a job's manifest.
     * @param job Job name.
     * @param manifest Files of the completed run.
     * @param errorString Optional error description.
     * @return true on success.
     */
    bool save(const QString& job, const FileManifest& manifest, QString* errorString = nullptr) const;

    //!< @brief Deletes a job's manifest; the next differential run copies everything.
    bool remove(const QString& job) const;

    /**
     * @brief Moves a manifest to a renamed job, replacing any manifest of the new name.
     * @param from Old job name.
     * @param to New job name.
     * @param errorString Optional error description.
     * @return true on success.
     */
    bool rename(const QString& from, const QString& to, QString* errorString = nullptr) const;

private:
    QString m_directory;    //!< Snapshot folder.
};
