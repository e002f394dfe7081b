#pragma once

#include <QString>

#include "JobWorker.h"

class RenameWorker : public JobWorker
{
    Q_OBJECT

public:
    RenameWorker(JobId jobId,
                 const QString &originalPath,
                 const QString &targetPath,
                 const ChannelSender<JobUpdate> &updates,
                 const WorkerFlags &flags,
                 QObject *parent = nullptr);

protected:
    void run() override;

private:
    QString m_originalPath;
    QString m_targetPath;
};
