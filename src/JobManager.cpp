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

#include "JobManager.h"

#include <QDir>
#include <QFileInfo>
#include <QThread>

#include <algorithm>
#include <utility>

#include "DeleteWorker.h"
#include "FileOperationUtils.h"
#include "Logging.h"
#include "PlatformUtils.h"
#include "RenameWorker.h"
#include "TransferWorker.h"

namespace {
struct JobManagerConstants {
    static constexpr int flagCleared = 0;
    static constexpr int flagSet = 1;
    static constexpr int singleItem = 1;
};

QString displayName(const QString &path)
{
    const QString name = QFileInfo(path).fileName();
    return name.isEmpty() ? path : name;
}
} // namespace

/**
 * @brief Creates an empty job registry with its shared update channel.
 * @param settings Tuning values handed to workers and used for visibility.
 * @param parent Parent QObject for ownership.
 */
JobManager::JobManager(const AppSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
{
    ChannelEnds<JobUpdate> channel = makeChannel<JobUpdate>();
    m_updateSender = std::move(channel.sender);
    m_updateReceiver = std::move(channel.receiver);
}

/**
 * @brief Cancels every running worker and waits for all worker threads.
 */
JobManager::~JobManager()
{
    for (auto it = m_workers.begin(); it != m_workers.end(); ++it) {
        it.value().flags.cancelled->storeRelaxed(JobManagerConstants::flagSet);
        it.value().conflicts.close();
    }
    m_workers.clear();
    for (QThread *thread : std::as_const(m_threads)) {
        thread->wait();
        delete thread;
    }
    m_threads.clear();
}

JobId JobManager::registerJob(JobType type, const QString &description, const QString &source, const QString &destination)
{
    const JobId id{m_nextId++};
    const qint64 now = ThroughputTracker::nowMs();

    Job job;
    job.id = id;
    job.type = type;
    job.description = description;
    job.source = source;
    job.destination = destination;
    job.status = JobStatus::running(now);
    job.throughput = ThroughputTracker(now, m_settings.throughputHistory, m_settings.throughputSampleMs);
    m_jobs.insert(id, job);

    qCInfo(lcJobs) << "job" << id.value << "started:" << description;
    return id;
}

/**
 * @brief Moves a worker onto its own thread and starts it.
 * @param worker Worker to run; deleted when its thread finishes.
 */
void JobManager::spawnWorker(JobWorker *worker)
{
    auto *thread = new QThread(this);
    worker->moveToThread(thread);

    connect(thread, &QThread::started, worker, &JobWorker::start);
    connect(worker, &JobWorker::finished, thread, &QThread::quit, Qt::DirectConnection);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);

    m_threads.append(thread);
    thread->start();
}

/**
 * @brief Starts a copy or move of one file or folder into a target folder.
 * @param type JobType::Copy or JobType::Move.
 * @param sourcePath File or folder to transfer.
 * @param destPath Folder receiving the source under its own name.
 * @return Id of the new job.
 */
JobId JobManager::startJob(JobType type, const QString &sourcePath, const QString &destPath)
{
    const QString source = QDir::cleanPath(sourcePath);
    const QString destDir = QDir::cleanPath(destPath);
    const bool move = type == JobType::Move;
    const QString description = move
        ? tr("Moving '%1' to %2").arg(displayName(source), destDir)
        : tr("Copying '%1' to %2").arg(displayName(source), destDir);
    const JobId id = registerJob(type, description, source, destDir);

    if (type != JobType::Copy && type != JobType::Move) {
        qCWarning(lcJobs) << "job" << id.value << "has no transfer mode";
        m_jobs[id].status = JobStatus::failed(tr("Unsupported job type"));
        return id;
    }

    ChannelEnds<ConflictResolution> conflicts = makeChannel<ConflictResolution>();
    WorkerHandle handle;
    handle.flags = WorkerFlags::create(m_settings.pausePollMs);
    handle.conflicts = std::move(conflicts.sender);

    auto *worker = new TransferWorker(id,
                                      move ? TransferWorker::OperationMode::Move : TransferWorker::OperationMode::Copy,
                                      source,
                                      destDir,
                                      m_updateSender,
                                      handle.flags,
                                      std::move(conflicts.receiver),
                                      m_settings.copyBufferSize);
    m_workers.insert(id, handle);
    spawnWorker(worker);
    return id;
}

/**
 * @brief Starts deleting one or more entries of a folder as a single job.
 * @param paths Top-level files or folders to delete.
 * @param parentDir Folder containing the entries, refreshed on completion.
 * @return Id of the new job.
 */
JobId JobManager::startDeleteJob(const QStringList &paths, const QString &parentDir)
{
    const QString description = paths.size() == JobManagerConstants::singleItem
        ? tr("Deleting '%1'").arg(displayName(paths.first()))
        : tr("Deleting %1 items").arg(paths.size());
    const JobId id = registerJob(JobType::Delete, description, parentDir, QString());

    WorkerHandle handle;
    handle.flags = WorkerFlags::create(m_settings.pausePollMs);
    auto *worker = new DeleteWorker(id, paths, m_updateSender, handle.flags);
    m_workers.insert(id, handle);
    spawnWorker(worker);
    return id;
}

/**
 * @brief Starts renaming an entry in the background.
 * @param original Existing path.
 * @param newPath Path the entry should have afterwards.
 * @param parentDir Folder refreshed on completion.
 * @return Id of the new job.
 */
JobId JobManager::startRenameJob(const QString &original, const QString &newPath, const QString &parentDir)
{
    const QString description = tr("Renaming '%1' to '%2'").arg(displayName(original), displayName(newPath));
    const JobId id = registerJob(JobType::Rename, description, original, parentDir);

    WorkerHandle handle;
    handle.flags = WorkerFlags::create(m_settings.pausePollMs);
    auto *worker = new RenameWorker(id, original, newPath, m_updateSender, handle.flags);
    m_workers.insert(id, handle);
    spawnWorker(worker);
    return id;
}

/**
 * @brief Requests cancellation and marks the job cancelled without waiting for the worker.
 * @param id Job to cancel.
 */
void JobManager::cancelJob(JobId id)
{
    auto it = m_jobs.find(id);
    if (it == m_jobs.end() || it.value().status.isTerminal()) {
        return;
    }
    it.value().status = JobStatus::of(JobStatus::State::Cancelled);
    releaseWorker(id);
    qCInfo(lcJobs) << "job" << id.value << "cancelled";
}

void JobManager::cancelAllJobs()
{
    const QList<JobId> ids = m_jobs.keys();
    for (const JobId &id : ids) {
        cancelJob(id);
    }
}

/**
 * @brief Pauses a running or visible job, or resumes a paused one.
 * @param id Job to toggle.
 */
void JobManager::togglePauseJob(JobId id)
{
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return;
    }
    Job &job = it.value();
    const auto handle = m_workers.constFind(id);
    switch (job.status.state) {
    case JobStatus::State::Running:
    case JobStatus::State::Visible:
        if (handle != m_workers.constEnd()) {
            handle.value().flags.paused->storeRelaxed(JobManagerConstants::flagSet);
        }
        job.status = JobStatus::of(JobStatus::State::Paused);
        break;
    case JobStatus::State::Paused:
        if (handle != m_workers.constEnd()) {
            handle.value().flags.paused->storeRelaxed(JobManagerConstants::flagCleared);
        }
        job.status = JobStatus::of(JobStatus::State::Visible);
        break;
    default:
        break;
    }
}

void JobManager::sendConflictResolution(JobId id, ConflictResolution resolution)
{
    const auto handle = m_workers.constFind(id);
    if (handle == m_workers.constEnd()) {
        return;
    }
    if (!handle.value().conflicts.send(resolution)) {
        qCDebug(lcJobs) << "job" << id.value << "no longer waits for a conflict decision";
    }
}

void JobManager::releaseWorker(JobId id)
{
    auto handle = m_workers.find(id);
    if (handle == m_workers.end()) {
        return;
    }
    handle.value().flags.cancelled->storeRelaxed(JobManagerConstants::flagSet);
    handle.value().conflicts.close();
    m_workers.erase(handle);
}

void JobManager::collectCompletedPaths(const Job &job, CompletedPaths &completed) const
{
    switch (job.type) {
    case JobType::Copy:
        completed.destinations.append(job.destination);
        break;
    case JobType::Move:
        completed.destinations.append(job.destination);
        completed.sources.append(QFileInfo(job.source).absolutePath());
        break;
    case JobType::Delete:
        completed.sources.append(job.source);
        break;
    case JobType::Rename:
        completed.sources.append(job.destination);
        break;
    }
}

void JobManager::applyUpdate(const JobUpdate &update, CompletedPaths &completed)
{
    auto it = m_jobs.find(update.jobId);
    if (it == m_jobs.end()) {
        return;
    }
    Job &job = it.value();
    if (job.status.isTerminal()) {
        // A cancelled rename cannot be stopped once issued; its folder still needs a refresh.
        if (update.kind == JobUpdate::Kind::Completed && job.type == JobType::Rename
            && job.status.state == JobStatus::State::Cancelled) {
            collectCompletedPaths(job, completed);
        }
        return;
    }

    switch (update.kind) {
    case JobUpdate::Kind::ScanComplete:
        job.progress.totalBytes = update.totalBytes;
        job.progress.totalFiles = update.totalFiles;
        break;
    case JobUpdate::Kind::Progress:
        job.progress.processedBytes = qMax(job.progress.processedBytes, update.processedBytes);
        job.progress.filesProcessed = qMax(job.progress.filesProcessed, update.filesProcessed);
        job.progress.currentFile = update.currentFile;
        job.throughput.update(job.progress.processedBytes);
        break;
    case JobUpdate::Kind::Completed:
        collectCompletedPaths(job, completed);
        job.status = JobStatus::of(JobStatus::State::Completed);
        releaseWorker(job.id);
        qCInfo(lcJobs) << "job" << job.id.value << "completed";
        break;
    case JobUpdate::Kind::Failed:
        job.status = JobStatus::failed(update.error);
        releaseWorker(job.id);
        qCWarning(lcJobs) << "job" << job.id.value << "failed:" << update.error;
        break;
    case JobUpdate::Kind::Cancelled:
        job.status = JobStatus::of(JobStatus::State::Cancelled);
        releaseWorker(job.id);
        qCInfo(lcJobs) << "job" << job.id.value << "cancelled by worker";
        break;
    case JobUpdate::Kind::ConflictDetected:
        m_pendingConflicts.enqueue(PendingConflict{job.id, update.filePath});
        break;
    }
}

/**
 * @brief Applies every buffered worker update without blocking.
 * @return Folders touched by jobs that completed during this call.
 */
JobManager::CompletedPaths JobManager::processUpdates()
{
    CompletedPaths completed;
    JobUpdate update;
    while (m_updateReceiver.tryReceive(update)) {
        applyUpdate(update, completed);
    }
    reapFinishedThreads();
    return completed;
}

void JobManager::reapFinishedThreads()
{
    for (auto it = m_threads.begin(); it != m_threads.end();) {
        QThread *thread = *it;
        if (thread->isFinished()) {
            thread->wait();
            delete thread;
            it = m_threads.erase(it);
        } else {
            ++it;
        }
    }
}

/**
 * @brief Pops the oldest conflict whose job is still waiting for a decision.
 * @param conflict Receives the conflict.
 * @return True when a conflict was returned.
 */
bool JobManager::nextPendingConflict(PendingConflict *conflict)
{
    while (!m_pendingConflicts.isEmpty()) {
        const PendingConflict next = m_pendingConflicts.dequeue();
        const Job *owner = job(next.jobId);
        if (owner && owner->status.isActive()) {
            *conflict = next;
            return true;
        }
    }
    return false;
}

void JobManager::updateVisibility()
{
    updateVisibility(ThroughputTracker::nowMs());
}

/**
 * @brief Promotes running jobs older than the visibility threshold.
 * @param nowMs Monotonic timestamp in milliseconds.
 */
void JobManager::updateVisibility(qint64 nowMs)
{
    for (auto it = m_jobs.begin(); it != m_jobs.end(); ++it) {
        JobStatus &status = it.value().status;
        if (status.state == JobStatus::State::Running
            && nowMs - status.startedAtMs >= m_settings.visibilityThresholdMs) {
            status = JobStatus::of(JobStatus::State::Visible);
        }
    }
}

int JobManager::activeJobCount() const
{
    return static_cast<int>(std::count_if(m_jobs.cbegin(), m_jobs.cend(), [](const Job &job) {
        return job.status.isActive();
    }));
}

int JobManager::visibleJobCount() const
{
    return static_cast<int>(std::count_if(m_jobs.cbegin(), m_jobs.cend(), [](const Job &job) {
        return job.status.state == JobStatus::State::Visible || job.status.state == JobStatus::State::Paused;
    }));
}

/**
 * @brief Lists every job, newest first.
 * @return Pointers valid until the registry is next modified.
 */
QVector<const Job *> JobManager::allJobs() const
{
    QVector<const Job *> jobs;
    jobs.reserve(m_jobs.size());
    for (auto it = m_jobs.cbegin(); it != m_jobs.cend(); ++it) {
        jobs.append(&it.value());
    }
    std::sort(jobs.begin(), jobs.end(), [](const Job *left, const Job *right) {
        return left->id > right->id;
    });
    return jobs;
}

const Job *JobManager::job(JobId id) const
{
    const auto it = m_jobs.constFind(id);
    return it == m_jobs.constEnd() ? nullptr : &it.value();
}

bool JobManager::dismissJob(JobId id)
{
    const auto it = m_jobs.find(id);
    if (it == m_jobs.end() || !it.value().status.isTerminal()) {
        return false;
    }
    m_jobs.erase(it);
    return true;
}

bool JobManager::hasWorker(JobId id) const
{
    return m_workers.contains(id);
}

/**
 * @brief Checks whether any path overlaps the source or target of an active transfer.
 * @param paths Candidate paths, typically about to be deleted.
 * @return True when a path is an ancestor or descendant of an active transfer path.
 */
bool JobManager::pathsConflictWithActiveJobs(const QStringList &paths) const
{
    QStringList activePaths;
    for (auto it = m_jobs.cbegin(); it != m_jobs.cend(); ++it) {
        const Job &job = it.value();
        if (!job.status.isActive() || (job.type != JobType::Copy && job.type != JobType::Move)) {
            continue;
        }
        activePaths.append(PlatformUtils::canonicalOrNormalized(job.source));
        activePaths.append(PlatformUtils::canonicalOrNormalized(job.destination));
    }
    if (activePaths.isEmpty()) {
        return false;
    }

    for (const QString &path : paths) {
        const QString candidate = PlatformUtils::canonicalOrNormalized(path);
        for (const QString &active : std::as_const(activePaths)) {
            if (FileOperationUtils::isSameOrAncestor(candidate, active)
                || FileOperationUtils::isSameOrAncestor(active, candidate)) {
                return true;
            }
        }
    }
    return false;
}
