#pragma once

#include <QAtomicInt>
#include <QObject>
#include <QSharedPointer>

#include "Channel.h"
#include "JobTypes.h"

struct WorkerFlags {
    QSharedPointer<QAtomicInt> cancelled;
    QSharedPointer<QAtomicInt> paused;
    int pausePollMs = 100;

    static WorkerFlags create(int pausePollMs);
};

class JobWorker : public QObject
{
    Q_OBJECT

public:
    JobWorker(JobId jobId,
              const ChannelSender<JobUpdate> &updates,
              const WorkerFlags &flags,
              QObject *parent = nullptr);

    JobId jobId() const;

public slots:
    void start();

signals:
    void finished();

protected:
    virtual void run() = 0;

    bool isCancelled() const;
    bool isPaused() const;
    bool waitWhilePaused() const;
    void post(const JobUpdate &update) const;

private:
    JobId m_jobId;
    ChannelSender<JobUpdate> m_updates;
    WorkerFlags m_flags;
};
