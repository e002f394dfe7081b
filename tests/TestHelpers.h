#pragma once

#include <QByteArray>
#include <QDeadlineTimer>
#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QString>
#include <QThread>
#include <QVector>

#include <functional>

#include "Channel.h"
#include "JobManager.h"
#include "JobTypes.h"

namespace test_helpers {

inline constexpr int kWaitTimeoutMs = 10000;
inline constexpr int kWaitStepMs = 5;

// Writes `size` bytes of `fill`, creating parent folders as needed.
inline bool writeFile(const QString &path, qint64 size, char fill = 'x') {
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data(static_cast<int>(size), fill);
    return file.write(data) == size;
}

// Applies permissions to a path and puts the original ones back on destruction.
class PermissionGuard {
public:
    PermissionGuard(const QString &path, QFileDevice::Permissions permissions)
        : m_path(path)
        , m_original(QFile::permissions(path)) {
        QFile::setPermissions(m_path, permissions);
    }

    ~PermissionGuard() {
        QFile::setPermissions(m_path, m_original);
    }

    PermissionGuard(const PermissionGuard &) = delete;
    PermissionGuard &operator=(const PermissionGuard &) = delete;

private:
    QString m_path;
    QFileDevice::Permissions m_original;
};

inline QByteArray readFile(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

inline QVector<JobUpdate> drain(ChannelReceiver<JobUpdate> &receiver) {
    QVector<JobUpdate> updates;
    JobUpdate update;
    while (receiver.tryReceive(update)) {
        updates.append(update);
    }
    return updates;
}

inline int countKind(const QVector<JobUpdate> &updates, JobUpdate::Kind kind) {
    int count = 0;
    for (const JobUpdate &update : updates) {
        if (update.kind == kind) {
            ++count;
        }
    }
    return count;
}

inline bool waitUntil(const std::function<bool()> &condition, int timeoutMs = kWaitTimeoutMs) {
    QDeadlineTimer deadline(timeoutMs);
    while (!condition()) {
        if (deadline.hasExpired()) {
            return false;
        }
        QThread::msleep(kWaitStepMs);
    }
    return true;
}

// Pumps the manager until the job reaches a terminal state.
inline bool waitForJob(JobManager &jobs, JobId id, int timeoutMs = kWaitTimeoutMs) {
    return waitUntil(
        [&jobs, id]() {
            jobs.processUpdates();
            const Job *job = jobs.job(id);
            return job && job->status.isTerminal();
        },
        timeoutMs);
}

inline JobStatus::State stateOf(const JobManager &jobs, JobId id) {
    const Job *job = jobs.job(id);
    return job ? job->status.state : JobStatus::State::Failed;
}

} // namespace test_helpers
