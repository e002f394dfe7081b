#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "AppSettings.h"
#include "JobManager.h"
#include "PaneState.h"

class Workspace : public QObject
{
    Q_OBJECT

public:
    enum class Side {
        Left,
        Right
    };

    explicit Workspace(const QString &leftPath,
                       const AppSettings &settings = AppSettings(),
                       QObject *parent = nullptr);

    bool initialize(QString *error);

    JobManager &jobs();
    PaneState &pane(Side side);
    PaneState &activePane();
    PaneState &otherPane();
    Side activeSide() const;
    void toggleActivePane();
    void pageUp();
    void pageDown();

    void tick();
    void tick(qint64 nowMs);

    QVector<JobId> transferSelectedToOtherPane(JobType type);
    QStringList deletablePaths() const;
    bool deleteConflictsWithJobs(const QStringList &paths) const;
    JobId startDelete(const QStringList &paths);

    bool beginRename(const QString &newName, qint64 nowMs);
    bool isRenaming() const;
    JobId renameJob() const;
    void cancelRename();

    bool hasActiveConflict() const;
    PendingConflict activeConflict() const;
    void resolveConflict(ConflictResolution resolution);

    QString errorMessage() const;
    bool confirmQuitNeeded() const;
    void quit();

signals:
    void conflictRaised(const QString &filePath);
    void errorRaised(const QString &message);

private:
    void refreshPanesFor(const QStringList &paths);
    void pollPane(PaneState &pane, qint64 nowMs);
    void checkRenameProgress(qint64 nowMs);
    void setError(const QString &message, qint64 nowMs);

    AppSettings m_settings;
    JobManager m_jobs;
    PaneState m_left;
    PaneState m_right;
    Side m_active = Side::Left;

    bool m_hasConflict = false;
    PendingConflict m_conflict;

    bool m_renaming = false;
    JobId m_renameJob;
    qint64 m_renameStartedMs = 0;

    QString m_error;
    qint64 m_errorSinceMs = 0;
};
