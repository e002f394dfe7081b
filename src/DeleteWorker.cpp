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

#include "DeleteWorker.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>

#include <algorithm>

#include "FileOperationUtils.h"
#include "Logging.h"

namespace {

// Special files and links count as files; links are removed, never followed.
QDir::Filters walkFilters()
{
    return QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot;
}

bool isFolder(const QFileInfo &info)
{
    return info.isDir() && !info.isSymLink();
}

quint64 countedSize(const QFileInfo &info)
{
    return info.isSymLink() ? 0 : static_cast<quint64>(info.size());
}

} // namespace

DeleteWorker::DeleteWorker(JobId jobId,
                           const QStringList &paths,
                           const ChannelSender<JobUpdate> &updates,
                           const WorkerFlags &flags,
                           QObject *parent)
    : JobWorker(jobId, updates, flags, parent)
    , m_paths(paths)
{
}

/**
 * @brief Sums sizes and counts of every non-folder entry below the given paths.
 * @param totalBytes Receives the byte total.
 * @param totalFiles Receives the file count.
 * @return False when cancellation interrupted the scan.
 */
bool DeleteWorker::scan(quint64 &totalBytes, quint64 &totalFiles)
{
    for (const QString &path : m_paths) {
        if (isCancelled()) {
            return false;
        }
        const QFileInfo info(path);
        if (!isFolder(info)) {
            if (info.exists() || info.isSymLink()) {
                totalBytes += countedSize(info);
                totalFiles += 1;
            }
            continue;
        }
        QDirIterator it(path, walkFilters(), QDirIterator::Subdirectories);
        while (it.hasNext()) {
            if (isCancelled()) {
                return false;
            }
            it.next();
            const QFileInfo entry = it.fileInfo();
            if (isFolder(entry)) {
                if (!entry.isReadable()) {
                    qCWarning(lcWorkers) << "scan skipped unreadable folder" << entry.absoluteFilePath();
                }
                continue;
            }
            totalBytes += countedSize(entry);
            totalFiles += 1;
        }
    }
    return true;
}

DeleteWorker::StepResult DeleteWorker::deleteFile(const QString &path, QString &error)
{
    if (isCancelled() || !waitWhilePaused()) {
        return StepResult::Interrupted;
    }

    const QFileInfo info(path);
    const quint64 size = countedSize(info);
    QFile file(path);
    if (!file.remove()) {
        error = tr("Cannot delete %1: %2").arg(path, file.errorString());
        return StepResult::Failed;
    }

    m_processedBytes += size;
    m_filesProcessed += 1;
    post(JobUpdate::progress(jobId(), m_processedBytes, info.fileName(), m_filesProcessed));
    return StepResult::Ok;
}

/**
 * @brief Deletes one top-level path: files first, then folders deepest first.
 * @param path File or folder to delete.
 * @param error Receives the message of a failure.
 * @return Result of the deletion.
 */
DeleteWorker::StepResult DeleteWorker::deletePath(const QString &path, QString &error)
{
    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        error = tr("Source not found: %1").arg(path);
        return StepResult::Failed;
    }
    if (!isFolder(info)) {
        return deleteFile(path, error);
    }

    QStringList files;
    QStringList folders;
    folders.append(info.absoluteFilePath());

    QDirIterator it(path, walkFilters(), QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (isCancelled()) {
            return StepResult::Interrupted;
        }
        it.next();
        const QFileInfo entry = it.fileInfo();
        if (isFolder(entry)) {
            folders.append(entry.absoluteFilePath());
        } else {
            files.append(entry.absoluteFilePath());
        }
    }

    for (const QString &file : files) {
        const StepResult result = deleteFile(file, error);
        if (result != StepResult::Ok) {
            return result;
        }
    }

    std::stable_sort(folders.begin(), folders.end(), [](const QString &left, const QString &right) {
        return FileOperationUtils::pathDepth(left) > FileOperationUtils::pathDepth(right);
    });
    for (const QString &folder : folders) {
        if (isCancelled()) {
            return StepResult::Interrupted;
        }
        if (!QDir().rmdir(folder)) {
            error = tr("Cannot delete folder %1").arg(folder);
            return StepResult::Failed;
        }
    }
    return StepResult::Ok;
}

/**
 * @brief Executes the scan and delete phases over all paths.
 */
void DeleteWorker::run()
{
    quint64 totalBytes = 0;
    quint64 totalFiles = 0;
    if (!scan(totalBytes, totalFiles)) {
        return;
    }
    post(JobUpdate::scanComplete(jobId(), totalBytes, totalFiles));

    for (const QString &path : m_paths) {
        QString error;
        const StepResult result = deletePath(path, error);
        if (result == StepResult::Interrupted) {
            qCInfo(lcWorkers) << "job" << jobId().value << "cancelled";
            post(JobUpdate::cancelled(jobId()));
            return;
        }
        if (result == StepResult::Failed) {
            qCWarning(lcWorkers) << "job" << jobId().value << "failed:" << error;
            post(JobUpdate::failed(jobId(), error));
            return;
        }
    }

    post(JobUpdate::completed(jobId()));
}
