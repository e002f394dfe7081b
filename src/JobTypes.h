#pragma once

#include <QHashFunctions>
#include <QString>
#include <QtGlobal>

#include "ThroughputTracker.h"

struct JobId {
    quint64 value = 0;

    bool operator==(const JobId &other) const { return value == other.value; }
    bool operator!=(const JobId &other) const { return value != other.value; }
    bool operator<(const JobId &other) const { return value < other.value; }
    bool operator>(const JobId &other) const { return value > other.value; }
};

inline size_t qHash(const JobId &id, size_t seed = 0)
{
    return ::qHash(id.value, seed);
}

enum class JobType {
    Copy,
    Move,
    Delete,
    Rename
};

enum class ConflictResolution {
    Overwrite,
    Skip,
    OverwriteAll,
    SkipAll,
    Cancel
};

struct JobStatus {
    enum class State {
        Running,
        Visible,
        Paused,
        Completed,
        Failed,
        Cancelled
    };

    State state = State::Running;
    qint64 startedAtMs = 0;
    QString error;

    static JobStatus running(qint64 startedAtMs)
    {
        JobStatus status;
        status.state = State::Running;
        status.startedAtMs = startedAtMs;
        return status;
    }

    static JobStatus of(State state)
    {
        JobStatus status;
        status.state = state;
        return status;
    }

    static JobStatus failed(const QString &message)
    {
        JobStatus status;
        status.state = State::Failed;
        status.error = message;
        return status;
    }

    bool isTerminal() const
    {
        return state == State::Completed || state == State::Failed || state == State::Cancelled;
    }

    bool isActive() const { return !isTerminal(); }
};

struct JobProgress {
    quint64 totalBytes = 0;
    quint64 processedBytes = 0;
    QString currentFile;
    quint64 filesProcessed = 0;
    quint64 totalFiles = 0;
};

struct JobUpdate {
    enum class Kind {
        ScanComplete,
        Progress,
        Completed,
        Failed,
        ConflictDetected,
        Cancelled
    };

    Kind kind = Kind::Progress;
    JobId jobId;
    quint64 totalBytes = 0;
    quint64 totalFiles = 0;
    quint64 processedBytes = 0;
    quint64 filesProcessed = 0;
    QString currentFile;
    QString error;
    QString filePath;

    static JobUpdate scanComplete(JobId id, quint64 totalBytes, quint64 totalFiles)
    {
        JobUpdate update;
        update.kind = Kind::ScanComplete;
        update.jobId = id;
        update.totalBytes = totalBytes;
        update.totalFiles = totalFiles;
        return update;
    }

    static JobUpdate progress(JobId id, quint64 processedBytes, const QString &currentFile, quint64 filesProcessed)
    {
        JobUpdate update;
        update.kind = Kind::Progress;
        update.jobId = id;
        update.processedBytes = processedBytes;
        update.currentFile = currentFile;
        update.filesProcessed = filesProcessed;
        return update;
    }

    static JobUpdate completed(JobId id)
    {
        JobUpdate update;
        update.kind = Kind::Completed;
        update.jobId = id;
        return update;
    }

    static JobUpdate failed(JobId id, const QString &error)
    {
        JobUpdate update;
        update.kind = Kind::Failed;
        update.jobId = id;
        update.error = error;
        return update;
    }

    static JobUpdate conflictDetected(JobId id, const QString &filePath)
    {
        JobUpdate update;
        update.kind = Kind::ConflictDetected;
        update.jobId = id;
        update.filePath = filePath;
        return update;
    }

    static JobUpdate cancelled(JobId id)
    {
        JobUpdate update;
        update.kind = Kind::Cancelled;
        update.jobId = id;
        return update;
    }
};

struct Job {
    JobId id;
    JobType type = JobType::Copy;
    QString description;
    QString source;
    QString destination;
    JobStatus status;
    JobProgress progress;
    ThroughputTracker throughput;
};

struct PendingConflict {
    JobId jobId;
    QString filePath;
};
