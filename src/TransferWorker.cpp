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

#include "TransferWorker.h"

#include <QByteArray>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include "FileOperationUtils.h"
#include "Logging.h"
#include "PlatformUtils.h"

namespace {

struct TransferConstants {
    static constexpr int minimumBufferSize = 4096;
};

// Symlinks below the source root are neither followed nor copied.
QDir::Filters walkFilters()
{
    return QDir::Dirs | QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot | QDir::NoSymLinks;
}

} // namespace

/**
 * @brief Creates a transfer worker for one source path.
 * @param jobId Job the updates are tagged with.
 * @param mode Copy or move.
 * @param sourcePath File or folder to transfer.
 * @param targetDir Folder receiving the source under its own name.
 * @param updates Shared update channel.
 * @param flags Cancel and pause flags of the job.
 * @param conflicts Receiving end of the conflict resolution channel.
 * @param bufferSize Size of a single read/write chunk.
 * @param parent Parent QObject for ownership.
 */
TransferWorker::TransferWorker(JobId jobId,
                               OperationMode mode,
                               const QString &sourcePath,
                               const QString &targetDir,
                               const ChannelSender<JobUpdate> &updates,
                               const WorkerFlags &flags,
                               ChannelReceiver<ConflictResolution> conflicts,
                               int bufferSize,
                               QObject *parent)
    : JobWorker(jobId, updates, flags, parent)
    , m_mode(mode)
    , m_sourcePath(sourcePath)
    , m_targetDir(targetDir)
    , m_conflicts(std::move(conflicts))
    , m_bufferSize(qMax(bufferSize, TransferConstants::minimumBufferSize))
{
}

/**
 * @brief Sums the size and count of regular files below the source.
 * @param totalBytes Receives the byte total.
 * @param totalFiles Receives the file count.
 * @return False when cancellation interrupted the scan.
 */
bool TransferWorker::scan(quint64 &totalBytes, quint64 &totalFiles)
{
    const QFileInfo info(m_sourcePath);
    if (info.isFile()) {
        totalBytes = static_cast<quint64>(info.size());
        totalFiles = 1;
        return !isCancelled();
    }

    QDirIterator it(m_sourcePath, walkFilters(), QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (isCancelled()) {
            return false;
        }
        it.next();
        const QFileInfo entry = it.fileInfo();
        if (entry.isDir() && !entry.isReadable()) {
            qCWarning(lcWorkers) << "scan skipped unreadable folder" << entry.absoluteFilePath();
            continue;
        }
        if (entry.isFile()) {
            totalBytes += static_cast<quint64>(entry.size());
            totalFiles += 1;
        }
    }
    return true;
}

/**
 * @brief Sends a progress update for a file that was counted without being copied.
 * @param sourcePath Skipped source file.
 */
void TransferWorker::reportSkipped(const QString &sourcePath)
{
    m_filesProcessed += 1;
    post(JobUpdate::progress(jobId(), m_processedBytes, QFileInfo(sourcePath).fileName(), m_filesProcessed));
}

/**
 * @brief Asks the user how to handle an existing target and waits for the answer.
 * @param targetPath Target file that already exists.
 * @param skip Set to true when the file must be left alone.
 * @return Interrupted when the user cancelled or the channel closed.
 */
TransferWorker::StepResult TransferWorker::resolveConflict(const QString &targetPath, bool &skip)
{
    skip = false;
    if (m_skipAll) {
        skip = true;
        return StepResult::Ok;
    }
    if (m_overwriteAll) {
        return StepResult::Ok;
    }

    post(JobUpdate::conflictDetected(jobId(), targetPath));

    ConflictResolution resolution = ConflictResolution::Cancel;
    if (!m_conflicts.receive(resolution)) {
        qCDebug(lcWorkers) << "conflict channel closed for job" << jobId().value;
        return StepResult::Interrupted;
    }

    switch (resolution) {
    case ConflictResolution::Overwrite:
        return StepResult::Ok;
    case ConflictResolution::Skip:
        skip = true;
        return StepResult::Ok;
    case ConflictResolution::OverwriteAll:
        m_overwriteAll = true;
        return StepResult::Ok;
    case ConflictResolution::SkipAll:
        m_skipAll = true;
        skip = true;
        return StepResult::Ok;
    case ConflictResolution::Cancel:
        break;
    }
    return StepResult::Interrupted;
}

TransferWorker::StepResult TransferWorker::abortCopy(QFile &target, const QString &targetPath)
{
    target.close();
    QFile::remove(targetPath);
    return StepResult::Interrupted;
}

/**
 * @brief Copies one regular file in fixed-size chunks, reporting each chunk.
 * @param sourcePath Source file path.
 * @param targetPath Target file path.
 * @param error Receives the message of a failure.
 * @return Result of the copy.
 */
TransferWorker::StepResult TransferWorker::copyFile(const QString &sourcePath, const QString &targetPath, QString &error)
{
    if (QFileInfo::exists(targetPath)) {
        bool skip = false;
        const StepResult decision = resolveConflict(targetPath, skip);
        if (decision != StepResult::Ok) {
            return decision;
        }
        if (skip) {
            reportSkipped(sourcePath);
            return StepResult::Ok;
        }
    }

    const QFileInfo sourceInfo(sourcePath);
    const QString fileName = sourceInfo.fileName();

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly)) {
        error = tr("Cannot open %1: %2").arg(sourcePath, source.errorString());
        return StepResult::Failed;
    }
    QFile target(targetPath);
    if (!target.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        error = tr("Cannot create %1: %2").arg(targetPath, target.errorString());
        return StepResult::Failed;
    }

    QByteArray buffer(m_bufferSize, Qt::Uninitialized);
    for (;;) {
        if (isCancelled() || !waitWhilePaused()) {
            return abortCopy(target, targetPath);
        }

        const qint64 bytesRead = source.read(buffer.data(), buffer.size());
        if (bytesRead < 0) {
            error = tr("Cannot read %1: %2").arg(sourcePath, source.errorString());
            target.close();
            QFile::remove(targetPath);
            return StepResult::Failed;
        }
        if (bytesRead == 0) {
            break;
        }
        if (target.write(buffer.constData(), bytesRead) != bytesRead) {
            error = tr("Cannot write %1: %2").arg(targetPath, target.errorString());
            target.close();
            QFile::remove(targetPath);
            return StepResult::Failed;
        }

        m_processedBytes += static_cast<quint64>(bytesRead);
        post(JobUpdate::progress(jobId(), m_processedBytes, fileName, m_filesProcessed));
    }

    if (!target.flush()) {
        error = tr("Cannot write %1: %2").arg(targetPath, target.errorString());
        target.close();
        return StepResult::Failed;
    }
    target.close();
    source.close();
    if (!FileOperationUtils::applyFileTimes(sourceInfo, targetPath)) {
        qCDebug(lcWorkers) << "could not preserve modification time of" << targetPath;
    }

    m_filesProcessed += 1;
    post(JobUpdate::progress(jobId(), m_processedBytes, fileName, m_filesProcessed));
    return StepResult::Ok;
}

/**
 * @brief Recreates the source folder below the target root, file by file.
 * @param targetRoot Folder corresponding to the source folder.
 * @param error Receives the message of a failure.
 * @return Result of the copy.
 */
TransferWorker::StepResult TransferWorker::copyTree(const QString &targetRoot, QString &error)
{
    const QFileInfo sourceInfo(m_sourcePath);
    if (!sourceInfo.isReadable() || !sourceInfo.isExecutable()) {
        error = tr("Cannot read folder %1").arg(m_sourcePath);
        return StepResult::Failed;
    }
    if (!QDir().mkpath(targetRoot)) {
        error = tr("Cannot create target folder %1").arg(targetRoot);
        return StepResult::Failed;
    }

    QDirIterator it(m_sourcePath, walkFilters(), QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (isCancelled()) {
            return StepResult::Interrupted;
        }
        it.next();
        const QFileInfo entry = it.fileInfo();
        const QString targetPath = FileOperationUtils::relocatedPath(m_sourcePath, entry.absoluteFilePath(), targetRoot);

        if (entry.isDir()) {
            // The iterator cannot descend into it, so its files would go missing.
            if (!entry.isReadable() || !entry.isExecutable()) {
                error = tr("Cannot read folder %1").arg(entry.absoluteFilePath());
                return StepResult::Failed;
            }
            if (!QDir().mkpath(targetPath)) {
                error = tr("Cannot create target folder %1").arg(targetPath);
                return StepResult::Failed;
            }
            continue;
        }
        if (!entry.isFile()) {
            continue;
        }
        if (!QDir().mkpath(QFileInfo(targetPath).absolutePath())) {
            error = tr("Cannot create target folder %1").arg(QFileInfo(targetPath).absolutePath());
            return StepResult::Failed;
        }
        const StepResult result = copyFile(entry.absoluteFilePath(), targetPath, error);
        if (result != StepResult::Ok) {
            return result;
        }
    }
    return StepResult::Ok;
}

/**
 * @brief Executes scan, copy and, for moves, source removal.
 */
void TransferWorker::run()
{
    quint64 totalBytes = 0;
    quint64 totalFiles = 0;
    if (!scan(totalBytes, totalFiles)) {
        return;
    }
    post(JobUpdate::scanComplete(jobId(), totalBytes, totalFiles));

    const QFileInfo sourceInfo(m_sourcePath);
    const QString sourceRoot = PlatformUtils::normalizePath(m_sourcePath);
    const QString targetRoot = PlatformUtils::normalizePath(QDir(m_targetDir).filePath(sourceInfo.fileName()));

    if (!sourceInfo.exists()) {
        post(JobUpdate::failed(jobId(), tr("Source not found")));
        return;
    }
    if (sourceRoot == targetRoot) {
        post(JobUpdate::failed(jobId(), tr("Source and target are the same")));
        return;
    }
    if (sourceInfo.isDir() && FileOperationUtils::isSameOrAncestor(sourceRoot, targetRoot)) {
        post(JobUpdate::failed(jobId(), tr("Cannot copy a folder into itself")));
        return;
    }

    QString error;
    const StepResult result = sourceInfo.isDir()
        ? copyTree(targetRoot, error)
        : copyFile(m_sourcePath, targetRoot, error);

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

    if (m_mode == OperationMode::Move) {
        QString deleteError;
        if (!PlatformUtils::deletePermanently(m_sourcePath, &deleteError)) {
            qCWarning(lcWorkers) << "job" << jobId().value << "copied but kept source:" << deleteError;
            post(JobUpdate::failed(jobId(), tr("Copied but failed to delete source: %1").arg(deleteError)));
            return;
        }
    }

    post(JobUpdate::completed(jobId()));
}
