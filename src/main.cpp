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

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <QThread>
#include <QTimer>

#include "AppSettings.h"
#include "FormatUtils.h"
#include "JobManager.h"
#include "Logging.h"
#include "PaneState.h"

namespace {

struct ExitCodes {
    static constexpr int success = 0;
    static constexpr int failed = 1;
    static constexpr int cancelled = 2;
    static constexpr int usage = 3;
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

ConflictResolution askConflictResolution(const QString &filePath)
{
    QTextStream input(stdin);
    for (;;) {
        out() << Qt::endl
              << QCoreApplication::translate("main", "%1 already exists.").arg(filePath) << Qt::endl
              << QCoreApplication::translate("main", "[o]verwrite, [s]kip, [O]verwrite all, [S]kip all, [c]ancel? ")
              << Qt::flush;
        const QString answer = input.readLine().trimmed();
        if (answer.isNull() || answer == QLatin1String("c")) {
            return ConflictResolution::Cancel;
        }
        if (answer == QLatin1String("o")) {
            return ConflictResolution::Overwrite;
        }
        if (answer == QLatin1String("s")) {
            return ConflictResolution::Skip;
        }
        if (answer == QLatin1String("O")) {
            return ConflictResolution::OverwriteAll;
        }
        if (answer == QLatin1String("S")) {
            return ConflictResolution::SkipAll;
        }
    }
}

QString progressLine(const Job &job)
{
    const JobProgress &progress = job.progress;
    QString line = QStringLiteral("%1  %2/%3  %4/%5 files  %6/s")
        .arg(job.description,
             FormatUtils::formatBytes(progress.processedBytes),
             FormatUtils::formatBytes(progress.totalBytes))
        .arg(progress.filesProcessed)
        .arg(progress.totalFiles)
        .arg(FormatUtils::formatBytes(job.throughput.currentThroughput()));
    if (job.status.state == JobStatus::State::Paused) {
        line += QCoreApplication::translate("main", "  (paused)");
    }
    return line;
}

int summarize(const JobManager &jobs)
{
    int code = ExitCodes::success;
    const QVector<const Job *> all = jobs.allJobs();
    for (auto it = all.crbegin(); it != all.crend(); ++it) {
        const Job *job = *it;
        switch (job->status.state) {
        case JobStatus::State::Completed:
            out() << QCoreApplication::translate("main", "done: %1").arg(job->description) << Qt::endl;
            break;
        case JobStatus::State::Failed:
            err() << QCoreApplication::translate("main", "failed: %1: %2").arg(job->description, job->status.error)
                  << Qt::endl;
            code = ExitCodes::failed;
            break;
        case JobStatus::State::Cancelled:
            out() << QCoreApplication::translate("main", "cancelled: %1").arg(job->description) << Qt::endl;
            if (code == ExitCodes::success) {
                code = ExitCodes::cancelled;
            }
            break;
        default:
            break;
        }
    }
    return code;
}

/**
 * @brief Drives the job manager from a poll timer until every job has ended.
 * @param app Application whose event loop runs the timer.
 * @param jobs Manager holding the started jobs.
 * @param settings Provides the poll interval.
 * @return Process exit code.
 */
int runJobs(QCoreApplication &app, JobManager &jobs, const AppSettings &settings)
{
    QTimer timer;
    timer.setInterval(settings.eventPollMs);
    QObject::connect(&timer, &QTimer::timeout, &app, [&app, &jobs]() {
        jobs.processUpdates();
        jobs.updateVisibility();

        PendingConflict conflict;
        while (jobs.nextPendingConflict(&conflict)) {
            jobs.sendConflictResolution(conflict.jobId, askConflictResolution(conflict.filePath));
        }

        for (const Job *job : jobs.allJobs()) {
            if (job->status.state == JobStatus::State::Visible || job->status.state == JobStatus::State::Paused) {
                out() << '\r' << progressLine(*job) << Qt::flush;
            }
        }

        if (jobs.activeJobCount() == 0) {
            out() << Qt::endl;
            app.exit(summarize(jobs));
        }
    });
    timer.start();
    return app.exec();
}

int listFolder(const QString &path, bool showHidden, SizeDisplayMode sizeMode, const AppSettings &settings)
{
    PaneState pane(QDir(path).absolutePath(), showHidden, sizeMode);
    QString error;
    if (!pane.loadEntries(&error)) {
        err() << error << Qt::endl;
        return ExitCodes::failed;
    }
    while (pane.isCalculatingSizes()) {
        QThread::msleep(static_cast<unsigned long>(settings.eventPollMs));
        pane.pollSizeResults();
    }
    pane.pollSizeResults();

    for (const Entry &entry : pane.entries()) {
        const QString name = entry.isDir ? entry.name + QLatin1Char('/') : entry.name;
        if (sizeMode == SizeDisplayMode::None) {
            out() << name << Qt::endl;
            continue;
        }
        const QString size = entry.hasSize ? FormatUtils::formatSize(entry.size) : QString();
        out() << QStringLiteral("%1 %2").arg(size, 8).arg(name) << Qt::endl;
    }
    return ExitCodes::success;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tandem"));
    QCoreApplication::setOrganizationName(QStringLiteral("Tandem"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Dual-pane file manager job runner"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QCoreApplication::translate("main", "copy, move, delete, rename or list"));
    parser.addPositionalArgument(QStringLiteral("paths"),
                                 QCoreApplication::translate("main", "Paths the command works on"),
                                 QStringLiteral("[paths...]"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QCoreApplication::translate("main", "Print debug output"));
    const QCommandLineOption allOption(QStringList{QStringLiteral("a"), QStringLiteral("all")},
                                       QCoreApplication::translate("main", "Include hidden entries"));
    const QCommandLineOption sizesOption(QStringLiteral("sizes"),
                                         QCoreApplication::translate("main", "Size display: none, quick or full"),
                                         QStringLiteral("mode"));
    parser.addOption(verboseOption);
    parser.addOption(allOption);
    parser.addOption(sizesOption);
    parser.process(app);

    Logging::enableVerbose(parser.isSet(verboseOption));
    AppSettings settings = AppSettings::load();

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(ExitCodes::usage);
    }
    const QString command = arguments.first();
    const QStringList paths = arguments.mid(1);

    if (command == QLatin1String("list")) {
        SizeDisplayMode sizeMode = settings.sizeMode;
        if (parser.isSet(sizesOption) && !DirectoryUtils::parseSizeMode(parser.value(sizesOption), &sizeMode)) {
            err() << QCoreApplication::translate("main", "Unknown size mode %1").arg(parser.value(sizesOption))
                  << Qt::endl;
            return ExitCodes::usage;
        }
        const QString folder = paths.isEmpty() ? QDir::currentPath() : paths.first();
        return listFolder(folder, parser.isSet(allOption) || settings.showHidden, sizeMode, settings);
    }

    JobManager jobs(settings);
    if (command == QLatin1String("copy") || command == QLatin1String("move")) {
        if (paths.size() < 2) {
            parser.showHelp(ExitCodes::usage);
        }
        const JobType type = command == QLatin1String("move") ? JobType::Move : JobType::Copy;
        const QString target = QFileInfo(paths.last()).absoluteFilePath();
        for (const QString &source : paths.mid(0, paths.size() - 1)) {
            jobs.startJob(type, QFileInfo(source).absoluteFilePath(), target);
        }
    } else if (command == QLatin1String("delete")) {
        if (paths.isEmpty()) {
            parser.showHelp(ExitCodes::usage);
        }
        QStringList absolute;
        for (const QString &path : paths) {
            absolute.append(QFileInfo(path).absoluteFilePath());
        }
        jobs.startDeleteJob(absolute, QFileInfo(absolute.first()).absolutePath());
    } else if (command == QLatin1String("rename")) {
        if (paths.size() != 2) {
            parser.showHelp(ExitCodes::usage);
        }
        const QString original = QFileInfo(paths.at(0)).absoluteFilePath();
        jobs.startRenameJob(original, QFileInfo(paths.at(1)).absoluteFilePath(), QFileInfo(original).absolutePath());
    } else {
        err() << QCoreApplication::translate("main", "Unknown command %1").arg(command) << Qt::endl;
        return ExitCodes::usage;
    }

    qCDebug(lcApp) << "running" << jobs.activeJobCount() << "jobs";
    return runJobs(app, jobs, settings);
}
