#pragma once

#include <QFile>
#include <QString>

#include "JobWorker.h"

class TransferWorker : public JobWorker
{
    Q_OBJECT

public:
    enum class OperationMode {
        Copy,
        Move
    };

    static constexpr int defaultBufferSize = 64 * 1024;

    TransferWorker(JobId jobId,
                   OperationMode mode,
                   const QString &sourcePath,
                   const QString &targetDir,
                   const ChannelSender<JobUpdate> &updates,
                   const WorkerFlags &flags,
                   ChannelReceiver<ConflictResolution> conflicts,
                   int bufferSize = defaultBufferSize,
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
    StepResult copyTree(const QString &targetRoot, QString &error);
    StepResult copyFile(const QString &sourcePath, const QString &targetPath, QString &error);
    StepResult resolveConflict(const QString &targetPath, bool &skip);
    void reportSkipped(const QString &sourcePath);
    StepResult abortCopy(QFile &target, const QString &targetPath);

    OperationMode m_mode = OperationMode::Copy;
    QString m_sourcePath;
    QString m_targetDir;
    ChannelReceiver<ConflictResolution> m_conflicts;
    int m_bufferSize = defaultBufferSize;

    quint64 m_processedBytes = 0;
    quint64 m_filesProcessed = 0;
    bool m_overwriteAll = false;
    bool m_skipAll = false;
};
