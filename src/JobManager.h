#pragma once

#include <QHash>
#include <QList>
#include <QObject>
#include <QQueue>
#include <QStringList>
#include <QVector>

#include "AppSettings.h"
#include "Channel.h"
#include "JobTypes.h"
#include "JobWorker.h"

class QThread;

class JobManager : public QObject
{
    Q_OBJECT

public:
    struct CompletedPaths {
        QStringList destinations;
        QStringList sources;
    };

    explicit JobManager(const AppSettings &settings = AppSettings(), QObject *parent = nullptr);
    ~JobManager() override;

    JobId startJob(JobType type, const QString &source, const QString &destDir);
    JobId startDeleteJob(const QStringList &paths, const QString &parentDir);
    JobId startRenameJob(const QString &original, const QString &newPath, const QString &parentDir);

    void cancelJob(JobId id);
    void cancelAllJobs();
    void togglePauseJob(JobId id);
    void sendConflictResolution(JobId id, ConflictResolution resolution);

    CompletedPaths processUpdates();
    bool nextPendingConflict(PendingConflict *conflict);
    void updateVisibility();
    void updateVisibility(qint64 nowMs);

    int activeJobCount() const;
    int visibleJobCount() const;
    QVector<const Job *> allJobs() const;
    const Job *job(JobId id) const;
    bool dismissJob(JobId id);
    bool hasWorker(JobId id) const;
    bool pathsConflictWithActiveJobs(const QStringList &paths) const;

private:
    struct WorkerHandle {
        WorkerFlags flags;
        ChannelSender<ConflictResolution> conflicts;
    };

    JobId registerJob(JobType type, const QString &description, const QString &source, const QString &destination);
    void spawnWorker(JobWorker *worker);
    void applyUpdate(const JobUpdate &update, CompletedPaths &completed);
    void collectCompletedPaths(const Job &job, CompletedPaths &completed) const;
    void releaseWorker(JobId id);
    void reapFinishedThreads();

    AppSettings m_settings;
    QHash<JobId, Job> m_jobs;
    QHash<JobId, WorkerHandle> m_workers;
    ChannelSender<JobUpdate> m_updateSender;
    ChannelReceiver<JobUpdate> m_updateReceiver;
    QQueue<PendingConflict> m_pendingConflicts;
    QList<QThread *> m_threads;
    quint64 m_nextId = 0;
};
