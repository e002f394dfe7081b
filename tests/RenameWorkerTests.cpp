#include <catch2/catch_test_macros.hpp>

#include <QFileInfo>
#include <QTemporaryDir>

#include "RenameWorker.h"
#include "TestHelpers.h"

namespace rename_worker {

using namespace test_helpers;

struct TestSubject {
    QTemporaryDir root;
    ChannelEnds<JobUpdate> updates = makeChannel<JobUpdate>();
    WorkerFlags flags = WorkerFlags::create(10);

    QString path(const QString &relative) const {
        return root.filePath(relative);
    }

    QVector<JobUpdate> run(const QString &from, const QString &to) {
        RenameWorker worker(JobId{9}, from, to, updates.sender, flags);
        worker.start();
        return drain(updates.receiver);
    }
};

TEST_CASE("Renaming a file", "[rename]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("old.txt"), 12));

    const QVector<JobUpdate> updates = subject.run(subject.path("old.txt"), subject.path("new.txt"));

    REQUIRE(updates.size() == 3);
    CHECK(updates.at(0).kind == JobUpdate::Kind::ScanComplete);
    CHECK(updates.at(0).totalFiles == 1);
    CHECK(updates.at(1).kind == JobUpdate::Kind::Progress);
    CHECK(updates.at(1).filesProcessed == 1);
    CHECK(updates.at(2).kind == JobUpdate::Kind::Completed);
    CHECK_FALSE(QFileInfo::exists(subject.path("old.txt")));
    CHECK(QFileInfo(subject.path("new.txt")).size() == 12);
}

TEST_CASE("Renaming a folder", "[rename]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("folder/inner.txt"), 3));

    const QVector<JobUpdate> updates = subject.run(subject.path("folder"), subject.path("renamed"));

    CHECK(updates.last().kind == JobUpdate::Kind::Completed);
    CHECK(QFileInfo::exists(subject.path("renamed/inner.txt")));
}

TEST_CASE("Renaming onto an existing entry fails", "[rename]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("a.txt"), 1, 'a'));
    REQUIRE(writeFile(subject.path("b.txt"), 1, 'b'));

    const QVector<JobUpdate> updates = subject.run(subject.path("a.txt"), subject.path("b.txt"));

    CHECK(updates.last().kind == JobUpdate::Kind::Failed);
    CHECK(readFile(subject.path("b.txt")) == QByteArray(1, 'b'));
    CHECK(QFileInfo::exists(subject.path("a.txt")));
}

TEST_CASE("A rename cancelled before it starts does nothing", "[rename]") {
    TestSubject subject;
    REQUIRE(writeFile(subject.path("a.txt"), 1));
    subject.flags.cancelled->storeRelaxed(1);

    const QVector<JobUpdate> updates = subject.run(subject.path("a.txt"), subject.path("z.txt"));

    REQUIRE(updates.size() == 1);
    CHECK(updates.first().kind == JobUpdate::Kind::Cancelled);
    CHECK(QFileInfo::exists(subject.path("a.txt")));
}

} // namespace rename_worker
