/*!
 * @file        path_utils.cppm
 * @brief       Common utility helpers for backup paths, extensions and names.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across backup core components. These utilities handle common
 *              tasks such as extension normalization, process name cleanup,
 *              path comparison, and human-readable size formatting.
 *
 *              All helpers except replaceFile are side-effect free, and all
 *              are safe to call from any worker thread.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module keeper.utils.path_utils;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

KEEPER_MODULE_EXPORT namespace keeper::utils {

/**
 * @brief Normalizes a file extension.
 *
 * Trims whitespace, lowercases the value and makes sure it starts with a
 * single dot, so "DOCX", ".docx" and " docx " all become ".docx".
 *
 * @param extension Raw extension string.
 * @return Normalized extension, or an empty string for blank input.
 */
QString normalizeExtension(const QString& extension);

/**
 * @brief Normalizes a list of extensions and removes duplicates.
 * @param extensions Raw extension list.
 * @return Normalized, de-duplicated list preserving first occurrence order.
 */
QStringList normalizeExtensions(const QStringList& extensions);

/**
 * @brief Returns the normalized extension of a file path.
 * @param path File path or name.
 * @return Extension with leading dot in lowercase, or an empty string.
 */
QString extensionOf(const QString& path);

/**
 * @brief Checks whether a path carries one of the given extensions.
 * @param path File path.
 * @param normalizedExtensions Extensions already passed through normalizeExtensions().
 * @return true if the path extension is listed.
 */
bool hasExtension(const QString& path, const QStringList& normalizedExtensions);

/**
 * @brief Normalizes a process name for comparison.
 *
 * Strips any directory part and a trailing ".exe", then lowercases the
 * result so names reported by different platforms compare equal.
 *
 * @param name Raw process or executable name.
 * @return Normalized process name.
 */
QString normalizeProcessName(const QString& name);

//!< @brief Normalizes a list of process names and removes duplicates and blanks.
QStringList normalizeProcessNames(const QStringList& names);

/**
 * @brief Checks whether two paths refer to the same directory.
 * @param a First path.
 * @param b Second path.
 * @return true if both resolve to the same absolute clean path.
 */
bool isSamePath(const QString& a, const QString& b);


/**
 * @brief Moves a finished file over its destination.
 *
 * An existing destination is moved aside first and put back if the move
 * fails, so a failed replace never loses the previous file.
 *
 * @param from Finished file.
 * @param to Destination path.
 * @param errorString Optional error description.
 * @return true if from now lives at to.
 */
bool replaceFile(const QString& from, const QString& to, QString* errorString = nullptr);

/**
 * @brief Formats a byte count for humans (B, KB, MB, GB, TB).
 * @param bytes Byte count.
 * @return Formatted string with two decimals above one kilobyte.
 */
QString formatFileSize(qint64 bytes);

} // namespace keeper::utils
