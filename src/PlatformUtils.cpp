/************************************************************************\

    Tandem - Dual-pane terminal file manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace PlatformUtils {

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Normalized absolute path using forward separators.
 */
QString normalizePath(const QString &path)
{
    QString normalized = QDir::fromNativeSeparators(path);
    normalized = QDir::cleanPath(QDir(normalized).absolutePath());
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Resolves symlinks and relative parts, falling back to the normalized path.
 * @param path Input path, which does not need to exist.
 * @return Canonical path when the path exists, normalized path otherwise.
 */
QString canonicalOrNormalized(const QString &path)
{
    const QString canonical = QFileInfo(path).canonicalFilePath();
    return canonical.isEmpty() ? normalizePath(path) : canonical;
}

/**
 * @brief Deletes a file or a whole folder tree without using the trash.
 * @param path File or folder path to remove.
 * @param error Optional output error message.
 * @return True if removal succeeds, false otherwise.
 */
bool deletePermanently(const QString &path, QString *error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is empty");
        }
        return false;
    }
    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }
    bool ok = false;
    if (info.isDir() && !info.isSymLink()) {
        QDir dir(path);
        ok = dir.removeRecursively();
    } else {
        ok = QFile::remove(path);
    }
    if (!ok && error) {
        *error = QCoreApplication::translate("PlatformUtils", "Failed to delete %1").arg(path);
    }
    return ok;
}

/**
 * @brief Renames or relocates a file or folder.
 * @param path Existing file or folder path.
 * @param targetPath Full path the entry should have afterwards.
 * @param error Optional output error message.
 * @return True if rename succeeds, false otherwise.
 */
bool renamePath(const QString &path, const QString &targetPath, QString *error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }
    const QString trimmedName = QFileInfo(targetPath).fileName().trimmed();
    if (trimmedName.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Name cannot be empty");
        }
        return false;
    }

    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }

    if (QDir::cleanPath(targetPath) == QDir::cleanPath(path)) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Name unchanged");
        }
        return false;
    }
    if (QFileInfo::exists(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Target already exists");
        }
        return false;
    }

    // QFile::rename falls back to copy and remove across file systems; folders cannot.
    const bool ok = (info.isDir() && !info.isSymLink())
        ? QDir().rename(path, targetPath)
        : QFile::rename(path, targetPath);
    if (!ok) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Rename failed");
        }
        return false;
    }
    return true;
}

} // namespace PlatformUtils
