#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include "JobManager.h"
#include "TestHelpers.h"

namespace job_manager {

using namespace test_helpers;

AppSettings fastSettings() {
    AppSettings settings;
    settings.pausePollMs = 10;
    return settings;
}

struct TestSubject {
    QTemporaryDir root;
    JobManager jobs{fastSettings()};

    QString path(const QString &relative) const {
        return root.filePath(relative);
    }

    // Starts a copy that stops at a conflict and stays active until answered.
    JobId startBlockedCopy() {
        REQUIRE(writeFile(path("src/a.txt"), 10, 'n'));
        REQUIRE(writeFile(path("dst/src/a.txt"), 5, 'o'));
        const JobId id = jobs.startJob(JobType::Copy, path("src"), path("dst"));

        PendingConflict conflict;
        REQUIRE(waitUntil([this, &conflict]() {
            jobs.processUpdates();
            return jobs.nextPendingConflict(&conflict);
        }));
        CHECK(conflict.jobId == id);
        CHECK(QDir::cleanPath(conflict.filePath) == QDir::cleanPath(path("dst/src/a.txt")));
        return id;
    }
};

TEST_CASE("A copy job runs to completion", "[jobs]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("A/one.txt"), 1000));
    REQUIRE(writeFile(subject.path("A/two.txt"), 2000));
    REQUIRE(QDir().mkpath(subject.path("B")));

    const JobId id = subject.jobs.startJob(JobType::Copy, subject.path("A"), subject.path("B"));
    CHECK(subject.jobs.hasWorker(id));
    CHECK(subject.jobs.activeJobCount() == 1);

    QStringList destinations;
    REQUIRE(waitUntil([&subject, &destinations, id]() {
        destinations += subject.jobs.processUpdates().destinations;
        return subject.jobs.job(id)->status.isTerminal();
    }));

    const Job *job = subject.jobs.job(id);
    CHECK(job->status.state == JobStatus::State::Completed);
    CHECK(job->progress.totalBytes == 3000);
    CHECK(job->progress.processedBytes == 3000);
    CHECK(job->progress.filesProcessed == 2);
    CHECK(destinations == QStringList{QDir::cleanPath(subject.path("B"))});
    CHECK_FALSE(subject.jobs.hasWorker(id));
    CHECK(subject.jobs.activeJobCount() == 0);
    CHECK(QFileInfo(subject.path("B/A/two.txt")).size() == 2000);
}

TEST_CASE("A move job reports both folders", "[jobs]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("left/file.txt"), 10));
    REQUIRE(QDir().mkpath(subject.path("right")));

    const JobId id = subject.jobs.startJob(JobType::Move, subject.path("left/file.txt"), subject.path("right"));

    JobManager::CompletedPaths completed;
    REQUIRE(waitUntil([&subject, &completed, id]() {
        const JobManager::CompletedPaths paths = subject.jobs.processUpdates();
        completed.destinations += paths.destinations;
        completed.sources += paths.sources;
        return subject.jobs.job(id)->status.isTerminal();
    }));

    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Completed);
    CHECK(completed.destinations == QStringList{QDir::cleanPath(subject.path("right"))});
    CHECK(completed.sources == QStringList{QDir::cleanPath(subject.path("left"))});
    CHECK_FALSE(QFileInfo::exists(subject.path("left/file.txt")));
}

TEST_CASE("Delete and rename jobs run through the manager", "[jobs]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("dir/gone.txt"), 10));
    REQUIRE(writeFile(subject.path("dir/old.txt"), 10));

    const JobId deleteId = subject.jobs.startDeleteJob({subject.path("dir/gone.txt")}, subject.path("dir"));
    const JobId renameId =
        subject.jobs.startRenameJob(subject.path("dir/old.txt"), subject.path("dir/new.txt"), subject.path("dir"));

    REQUIRE(waitForJob(subject.jobs, deleteId));
    REQUIRE(waitForJob(subject.jobs, renameId));
    CHECK(stateOf(subject.jobs, deleteId) == JobStatus::State::Completed);
    CHECK(stateOf(subject.jobs, renameId) == JobStatus::State::Completed);
    CHECK_FALSE(QFileInfo::exists(subject.path("dir/gone.txt")));
    CHECK(QFileInfo::exists(subject.path("dir/new.txt")));
}

TEST_CASE("Jobs are listed newest first", "[jobs]") {
    TestSubject subject;
    const JobId first = subject.jobs.startRenameJob(subject.path("x"), subject.path("y"), subject.root.path());
    const JobId second = subject.jobs.startRenameJob(subject.path("x"), subject.path("z"), subject.root.path());
    const JobId third = subject.jobs.startDeleteJob({subject.path("x")}, subject.root.path());

    CHECK(first < second);
    CHECK(second < third);

    const QVector<const Job *> all = subject.jobs.allJobs();
    REQUIRE(all.size() == 3);
    CHECK(all.at(0)->id == third);
    CHECK(all.at(1)->id == second);
    CHECK(all.at(2)->id == first);

    REQUIRE(waitForJob(subject.jobs, first));
    REQUIRE(waitForJob(subject.jobs, second));
    REQUIRE(waitForJob(subject.jobs, third));
    CHECK(stateOf(subject.jobs, third) == JobStatus::State::Failed);
    CHECK_FALSE(subject.jobs.job(third)->status.error.isEmpty());
}

TEST_CASE("Cancelling a job waiting for a conflict decision", "[jobs]") {
    TestSubject subject;
    const JobId id = subject.startBlockedCopy();
    REQUIRE(subject.jobs.hasWorker(id));

    subject.jobs.cancelJob(id);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Cancelled);
    CHECK_FALSE(subject.jobs.hasWorker(id));

    SECTION("late worker updates are ignored") {
        QThread::msleep(50);
        subject.jobs.processUpdates();
        CHECK(stateOf(subject.jobs, id) == JobStatus::State::Cancelled);
        CHECK(subject.jobs.job(id)->progress.filesProcessed == 0);
    }

    SECTION("cancelling again changes nothing") {
        subject.jobs.cancelJob(id);
        CHECK(stateOf(subject.jobs, id) == JobStatus::State::Cancelled);
    }

    CHECK(readFile(subject.path("dst/src/a.txt")) == QByteArray(5, 'o'));
}

TEST_CASE("Answering a conflict resumes the worker", "[jobs]") {
    TestSubject subject;
    const JobId id = subject.startBlockedCopy();

    subject.jobs.sendConflictResolution(id, ConflictResolution::Overwrite);

    REQUIRE(waitForJob(subject.jobs, id));
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Completed);
    CHECK(readFile(subject.path("dst/src/a.txt")) == QByteArray(10, 'n'));
}

TEST_CASE("Pausing is reversible", "[jobs]") {
    TestSubject subject;
    const JobId id = subject.startBlockedCopy();

    subject.jobs.togglePauseJob(id);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Paused);
    CHECK(subject.jobs.visibleJobCount() == 1);

    subject.jobs.togglePauseJob(id);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Visible);

    subject.jobs.cancelJob(id);
    subject.jobs.togglePauseJob(id);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Cancelled);
}

TEST_CASE("Jobs become visible after the threshold", "[jobs]") {
    TestSubject subject;
    const JobId id = subject.startBlockedCopy();
    const qint64 startedAt = subject.jobs.job(id)->status.startedAtMs;

    subject.jobs.updateVisibility(startedAt + 499);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Running);
    CHECK(subject.jobs.visibleJobCount() == 0);

    subject.jobs.updateVisibility(startedAt + 500);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Visible);
    CHECK(subject.jobs.visibleJobCount() == 1);

    subject.jobs.cancelJob(id);
    subject.jobs.updateVisibility(startedAt + 10000);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Cancelled);
}

TEST_CASE("Only finished jobs can be dismissed", "[jobs]") {
    TestSubject subject;
    const JobId id = subject.startBlockedCopy();

    CHECK_FALSE(subject.jobs.dismissJob(id));
    CHECK(subject.jobs.job(id) != nullptr);

    subject.jobs.cancelJob(id);
    CHECK(subject.jobs.dismissJob(id));
    CHECK(subject.jobs.job(id) == nullptr);
    CHECK_FALSE(subject.jobs.dismissJob(JobId{999}));
}

TEST_CASE("Paths overlapping an active transfer are reported", "[jobs]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("elsewhere/file.txt"), 1));
    const JobId id = subject.startBlockedCopy();

    CHECK(subject.jobs.pathsConflictWithActiveJobs({subject.path("src")}));
    CHECK(subject.jobs.pathsConflictWithActiveJobs({subject.path("src/a.txt")}));
    CHECK(subject.jobs.pathsConflictWithActiveJobs({subject.path("dst/src/a.txt")}));
    CHECK(subject.jobs.pathsConflictWithActiveJobs({subject.root.path()}));
    CHECK_FALSE(subject.jobs.pathsConflictWithActiveJobs({subject.path("elsewhere")}));
    CHECK_FALSE(subject.jobs.pathsConflictWithActiveJobs({}));

    subject.jobs.cancelJob(id);
    CHECK_FALSE(subject.jobs.pathsConflictWithActiveJobs({subject.path("src")}));
}

TEST_CASE("Conflicts of finished jobs are dropped", "[jobs]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("src/a.txt"), 10));
    REQUIRE(writeFile(subject.path("dst/src/a.txt"), 5));
    const JobId id = subject.jobs.startJob(JobType::Copy, subject.path("src"), subject.path("dst"));

    REQUIRE(waitUntil([&subject, id]() {
        subject.jobs.processUpdates();
        return subject.jobs.job(id)->progress.totalFiles == 1;
    }));
    QThread::msleep(50);
    subject.jobs.processUpdates();
    subject.jobs.cancelJob(id);

    PendingConflict conflict;
    CHECK_FALSE(subject.jobs.nextPendingConflict(&conflict));
}

TEST_CASE("A cancelled rename that already happened still reports its folder", "[jobs]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("old.txt"), 4));
    const JobId id =
        subject.jobs.startRenameJob(subject.path("old.txt"), subject.path("new.txt"), subject.root.path());

    REQUIRE(waitUntil([&subject]() { return QFileInfo::exists(subject.path("new.txt")); }));
    subject.jobs.cancelJob(id);
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Cancelled);

    QStringList sources;
    REQUIRE(waitUntil([&subject, &sources]() {
        sources += subject.jobs.processUpdates().sources;
        return !sources.isEmpty();
    }));
    CHECK(sources == QStringList{subject.root.path()});
    CHECK(stateOf(subject.jobs, id) == JobStatus::State::Cancelled);
}

TEST_CASE("cancelAllJobs ends every active job", "[jobs]") {
    TestSubject subject;
    const JobId blocked = subject.startBlockedCopy();
    REQUIRE(writeFile(subject.path("other/b.txt"), 1));
    const JobId rename = subject.jobs.startRenameJob(subject.path("other/b.txt"), subject.path("other/c.txt"),
                                                     subject.path("other"));
    REQUIRE(waitForJob(subject.jobs, rename));

    subject.jobs.cancelAllJobs();
    CHECK(stateOf(subject.jobs, blocked) == JobStatus::State::Cancelled);
    CHECK(stateOf(subject.jobs, rename) == JobStatus::State::Completed);
    CHECK(subject.jobs.activeJobCount() == 0);
}

} // namespace job_manager
