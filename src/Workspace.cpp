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

#include "Workspace.h"

#include <QDir>
#include <QFileInfo>

#include "Logging.h"

/**
 * @brief Creates both panes; the right pane starts in the remembered folder when there is one.
 * @param leftPath Folder shown in the left pane.
 * @param settings Options shared with the job manager and panes.
 * @param parent Parent QObject for ownership.
 */
Workspace::Workspace(const QString &leftPath, const AppSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_jobs(settings)
    , m_left(leftPath, settings.showHidden, settings.sizeMode)
    , m_right(settings.rightPanePath.isEmpty() ? leftPath : settings.rightPanePath,
              settings.showHidden,
              settings.sizeMode)
{
}

/**
 * @brief Loads both panes synchronously; the right pane falls back to the left folder.
 * @param error Optional output error message.
 * @return False when the left folder cannot be listed.
 */
bool Workspace::initialize(QString *error)
{
    if (!m_left.loadEntries(error)) {
        return false;
    }
    QString rightError;
    if (!m_right.loadEntries(&rightError)) {
        qCWarning(lcApp) << "right pane falls back to" << m_left.path() << ":" << rightError;
        m_right.setPath(m_left.path());
        return m_right.loadEntries(error);
    }
    return true;
}

JobManager &Workspace::jobs()
{
    return m_jobs;
}

PaneState &Workspace::pane(Side side)
{
    return side == Side::Left ? m_left : m_right;
}

PaneState &Workspace::activePane()
{
    return pane(m_active);
}

PaneState &Workspace::otherPane()
{
    return pane(m_active == Side::Left ? Side::Right : Side::Left);
}

Workspace::Side Workspace::activeSide() const
{
    return m_active;
}

void Workspace::toggleActivePane()
{
    m_active = m_active == Side::Left ? Side::Right : Side::Left;
}

void Workspace::pageUp()
{
    activePane().pageUp(m_settings.pageSize);
}

void Workspace::pageDown()
{
    activePane().pageDown(m_settings.pageSize);
}

void Workspace::tick()
{
    tick(ThroughputTracker::nowMs());
}

/**
 * @brief Runs one iteration of the interactive loop.
 * @param nowMs Monotonic timestamp in milliseconds.
 */
void Workspace::tick(qint64 nowMs)
{
    const JobManager::CompletedPaths completed = m_jobs.processUpdates();
    refreshPanesFor(completed.destinations);
    refreshPanesFor(completed.sources);

    pollPane(m_left, nowMs);
    pollPane(m_right, nowMs);

    m_jobs.updateVisibility(nowMs);

    if (!m_hasConflict && !m_renaming && m_jobs.nextPendingConflict(&m_conflict)) {
        m_hasConflict = true;
        emit conflictRaised(m_conflict.filePath);
    }

    checkRenameProgress(nowMs);

    if (!m_error.isEmpty() && nowMs - m_errorSinceMs > m_settings.errorDisplayMs) {
        m_error.clear();
    }
}

void Workspace::refreshPanesFor(const QStringList &paths)
{
    for (const QString &path : paths) {
        const QString cleaned = QDir::cleanPath(path);
        for (PaneState *pane : {&m_left, &m_right}) {
            if (pane->path() == cleaned && !pane->isLoadingAny()) {
                pane->loadEntriesAsync();
            }
        }
    }
}

void Workspace::pollPane(PaneState &pane, qint64 nowMs)
{
    QString error;
    if (pane.pollLoadResult(&error) == PaneState::LoadStatus::Failed) {
        setError(error, nowMs);
    }
    pane.pollSizeResults();
}

void Workspace::setError(const QString &message, qint64 nowMs)
{
    m_error = message;
    m_errorSinceMs = nowMs;
    emit errorRaised(message);
}

/**
 * @brief Starts one copy or move job per selected entry of the active pane.
 * @param type JobType::Copy or JobType::Move.
 * @return Ids of the started jobs.
 */
QVector<JobId> Workspace::transferSelectedToOtherPane(JobType type)
{
    QVector<JobId> started;
    const QVector<Entry> entries = activePane().selectedEntries();
    const QString targetDir = otherPane().path();
    activePane().clearSelection();
    for (const Entry &entry : entries) {
        if (entry.name == DirectoryUtils::parentEntryName) {
            continue;
        }
        started.append(m_jobs.startJob(type, entry.path, targetDir));
    }
    return started;
}

QStringList Workspace::deletablePaths() const
{
    const PaneState &pane = m_active == Side::Left ? m_left : m_right;
    QStringList paths;
    for (const Entry &entry : pane.selectedEntries()) {
        if (entry.name != DirectoryUtils::parentEntryName) {
            paths.append(entry.path);
        }
    }
    return paths;
}

bool Workspace::deleteConflictsWithJobs(const QStringList &paths) const
{
    return m_jobs.pathsConflictWithActiveJobs(paths);
}

JobId Workspace::startDelete(const QStringList &paths)
{
    const JobId id = m_jobs.startDeleteJob(paths, activePane().path());
    activePane().clearSelection();
    return id;
}

/**
 * @brief Renames the entry under the cursor of the active pane in the background.
 * @param newName New name inside the same folder.
 * @param nowMs Monotonic timestamp in milliseconds.
 * @return False when there is nothing to rename or the name is unchanged.
 */
bool Workspace::beginRename(const QString &newName, qint64 nowMs)
{
    const Entry *entry = activePane().selectedEntry();
    if (!entry || entry->name == DirectoryUtils::parentEntryName || newName.isEmpty()) {
        return false;
    }
    const QString original = entry->path;
    const QString target = QDir(QFileInfo(original).absolutePath()).filePath(newName);
    if (QDir::cleanPath(target) == QDir::cleanPath(original)) {
        return false;
    }

    m_renameJob = m_jobs.startRenameJob(original, target, activePane().path());
    m_renaming = true;
    m_renameStartedMs = nowMs;
    return true;
}

bool Workspace::isRenaming() const
{
    return m_renaming;
}

JobId Workspace::renameJob() const
{
    return m_renameJob;
}

void Workspace::cancelRename()
{
    if (!m_renaming) {
        return;
    }
    m_jobs.cancelJob(m_renameJob);
    m_renaming = false;

    // The rename may already have happened on disk.
    const Job *job = m_jobs.job(m_renameJob);
    if (job) {
        refreshPanesFor({job->destination});
    }
}

/**
 * @brief Leaves the renaming state once the job ends, or backgrounds it after the timeout.
 * @param nowMs Monotonic timestamp in milliseconds.
 */
void Workspace::checkRenameProgress(qint64 nowMs)
{
    if (!m_renaming) {
        return;
    }
    const Job *job = m_jobs.job(m_renameJob);
    if (!job) {
        m_renaming = false;
        return;
    }

    switch (job->status.state) {
    case JobStatus::State::Completed:
    case JobStatus::State::Cancelled:
        m_jobs.dismissJob(m_renameJob);
        m_renaming = false;
        break;
    case JobStatus::State::Failed:
        setError(tr("Rename failed: %1").arg(job->status.error), nowMs);
        m_jobs.dismissJob(m_renameJob);
        m_renaming = false;
        break;
    default:
        if (nowMs - m_renameStartedMs >= m_settings.renameDialogTimeoutMs) {
            qCInfo(lcApp) << "rename job" << m_renameJob.value << "continues in the background";
            m_renaming = false;
        }
        break;
    }
}

bool Workspace::hasActiveConflict() const
{
    return m_hasConflict;
}

PendingConflict Workspace::activeConflict() const
{
    return m_conflict;
}

void Workspace::resolveConflict(ConflictResolution resolution)
{
    if (!m_hasConflict) {
        return;
    }
    m_jobs.sendConflictResolution(m_conflict.jobId, resolution);
    m_hasConflict = false;
}

QString Workspace::errorMessage() const
{
    return m_error;
}

bool Workspace::confirmQuitNeeded() const
{
    return m_jobs.visibleJobCount() > 0;
}

/**
 * @brief Cancels every job and remembers the right pane folder.
 */
void Workspace::quit()
{
    m_jobs.cancelAllJobs();
    AppSettings::saveRightPanePath(m_right.path());
}
