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

#include "FileOperationUtils.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>

namespace {
const QChar separator = QLatin1Char('/');
} // namespace

namespace FileOperationUtils {

/**
 * @brief Copies the modification time of a source file onto a target file.
 * @param sourceInfo Source file information.
 * @param targetPath Target file path.
 * @return True when the time was applied.
 */
bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath)
{
    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::ReadWrite)) {
        return false;
    }
    const bool ok = targetFile.setFileTime(sourceInfo.lastModified(), QFileDevice::FileModificationTime);
    targetFile.close();
    return ok;
}

/**
 * @brief Counts path components of a cleaned path.
 * @param path Path to inspect.
 * @return Number of non-empty components.
 */
int pathDepth(const QString &path)
{
    return QDir::cleanPath(QDir::fromNativeSeparators(path)).split(separator, Qt::SkipEmptyParts).size();
}

bool isSameOrAncestor(const QString &ancestor, const QString &path)
{
    const QString cleanAncestor = QDir::cleanPath(ancestor);
    const QString cleanPath = QDir::cleanPath(path);
    if (cleanAncestor == cleanPath) {
        return true;
    }
    const QString prefix = cleanAncestor.endsWith(separator) ? cleanAncestor : cleanAncestor + separator;
    return cleanPath.startsWith(prefix);
}

/**
 * @brief Maps a path below sourceRoot to the same relative location below targetRoot.
 * @param sourceRoot Root the path is relative to.
 * @param path Path inside sourceRoot.
 * @param targetRoot Root of the relocated tree.
 * @return Relocated path.
 */
QString relocatedPath(const QString &sourceRoot, const QString &path, const QString &targetRoot)
{
    const QString relative = QDir(sourceRoot).relativeFilePath(path);
    return QDir::cleanPath(QDir(targetRoot).filePath(relative));
}

} // namespace FileOperationUtils
