#pragma once

#include <QStringList>

#include "JobWorker.h"

class DeleteWorker : public JobWorker
{
    Q_OBJECT

public:
    DeleteWorker(JobId jobId,
                 const QStringList &paths,
                 const ChannelSender<JobUpdate> &updates,
                 const WorkerFlags &flags,
                 QObject *parent = nullptr);

protected:
    void run() override;

private:
    enum class StepResult {
        Ok,
        Interrupted,
        Failed
    };

    bool scan(quint64 &totalBytes, quint64 &totalFiles);
    StepResult deletePath(const QString &path, QString &error);
    StepResult deleteFile(const QString &path, QString &error);

    QStringList m_paths;
    quint64 m_processedBytes = 0;
    quint64 m_filesProcessed = 0;
};
