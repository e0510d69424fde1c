#include <gtest/gtest.h>
#include <sweep/removal.hpp>

#include "test_doubles.hpp"

#include <filesystem>
#include <memory>

using namespace sweep;
using sweep::test::FakeFileSystem;
using sweep::test::RecordingElevator;
namespace fs = std::filesystem;

class RemovalTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs_ = std::make_shared<FakeFileSystem>();
        for (int i = 0; i < 10; ++i) {
            paths_.push_back("/apps/Foo/entry" + std::to_string(i));
            fs_->add_file(paths_.back(), 10);
        }
    }

    RemovalOrchestrator make(RemovalOptions options = {}, PrivilegeElevator* elevator = nullptr,
                             SnapshotManager* snapshots = nullptr) {
        options.max_workers = 4;
        return RemovalOrchestrator(fs_, std::move(options), nullptr, elevator, snapshots);
    }

    std::shared_ptr<FakeFileSystem> fs_;
    std::vector<std::string> paths_;
};

// ============================================================================
// Standard mode
// ============================================================================

TEST_F(RemovalTest, RemovesEveryEntry) {
    auto orchestrator = make();
    auto report = orchestrator.remove(paths_, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok()) << report.error().to_string();

    EXPECT_EQ(report->removed, 10);
    EXPECT_EQ(report->failed, 0);
    EXPECT_EQ(report->outcomes.size(), 10);
    for (const auto& path : paths_) {
        EXPECT_FALSE(fs_->has(path)) << path;
    }
}

TEST_F(RemovalTest, OneDeniedEntryDoesNotStopOthers) {
    fs_->deny_removal(paths_[5]);

    auto orchestrator = make();
    auto report = orchestrator.remove(paths_, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->removed, 9);
    EXPECT_EQ(report->failed, 1);
    auto failures = report->failures();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0].path, paths_[5]);
    EXPECT_TRUE(fs_->has(paths_[5]));
    EXPECT_TRUE(fs_->writable_calls().empty());
}

TEST_F(RemovalTest, OutcomesAreOrderedByPath) {
    std::vector<std::string> shuffled(paths_.rbegin(), paths_.rend());
    auto orchestrator = make();
    auto report = orchestrator.remove(shuffled, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());

    ASSERT_EQ(report->outcomes.size(), 10);
    for (size_t i = 1; i < report->outcomes.size(); ++i) {
        EXPECT_LT(report->outcomes[i - 1].path, report->outcomes[i].path);
    }
}

TEST_F(RemovalTest, DuplicatesAreCollapsed) {
    auto orchestrator = make();
    auto report = orchestrator.remove({paths_[0], paths_[0] + "/", "/apps/Foo/./entry0"},
                                      RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->outcomes.size(), 1);
    EXPECT_EQ(report->removed, 1);
}

TEST_F(RemovalTest, MissingEntryIsSkipped) {
    auto orchestrator = make();
    auto report = orchestrator.remove({"/apps/Foo/never-there"}, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->skipped, 1);
    const EntryOutcome* outcome = report->find("/apps/Foo/never-there");
    ASSERT_NE(outcome, nullptr);
    EXPECT_EQ(outcome->status, EntryStatus::SKIPPED);
    EXPECT_EQ(outcome->reason, "already absent");
}

TEST_F(RemovalTest, UnreadableEntryFails) {
    fs_->fail_stat(paths_[1], ErrorCode::IO_ERROR);
    auto orchestrator = make();
    auto report = orchestrator.remove({paths_[1]}, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->failed, 1);
}

TEST_F(RemovalTest, EmptyInputIsEmptyReport) {
    auto orchestrator = make();
    auto report = orchestrator.remove(std::vector<std::string>{}, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(report->outcomes.empty());
}

// ============================================================================
// Nesting
// ============================================================================

TEST_F(RemovalTest, NestedCandidatesRemovedWithAncestor) {
    fs_->add_file("/apps/Bar/cache/blob", 5);
    fs_->add_file("/apps/Bar/cache/deep/more", 5);

    auto orchestrator = make();
    auto report = orchestrator.remove(
        {"/apps/Bar/cache/deep/more", "/apps/Bar/cache/blob", "/apps/Bar/cache"},
        RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->removed, 3);
    EXPECT_EQ(report->find("/apps/Bar/cache")->reason, "");
    EXPECT_EQ(report->find("/apps/Bar/cache/blob")->reason, "removed with ancestor");
    EXPECT_EQ(report->find("/apps/Bar/cache/deep/more")->reason, "removed with ancestor");
    EXPECT_FALSE(fs_->has("/apps/Bar/cache"));

    // Only the ancestor was touched
    ASSERT_EQ(fs_->removed().size(), 1);
    EXPECT_EQ(fs_->removed()[0], "/apps/Bar/cache");
}

TEST_F(RemovalTest, ChildOfFailedAncestorIsStillAttempted) {
    fs_->add_file("/apps/Bar/cache/blob", 5);
    fs_->add_file("/apps/Bar/cache/locked", 5);
    fs_->deny_removal("/apps/Bar/cache/locked");

    auto orchestrator = make();
    auto report = orchestrator.remove({"/apps/Bar/cache", "/apps/Bar/cache/blob"},
                                      RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->find("/apps/Bar/cache")->status, EntryStatus::FAILED);
    EXPECT_EQ(report->find("/apps/Bar/cache/blob")->status, EntryStatus::REMOVED);
    EXPECT_FALSE(fs_->has("/apps/Bar/cache/blob"));
}

// ============================================================================
// Forced mode
// ============================================================================

TEST_F(RemovalTest, ForcedResetsPermissionsAndRetries) {
    fs_->deny_removal(paths_[5], true);

    RecordingElevator elevator;
    auto orchestrator = make({}, &elevator);
    auto report = orchestrator.remove(paths_, RemovalMode::FORCED);
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->removed, 10);
    EXPECT_FALSE(fs_->has(paths_[5]));
    EXPECT_EQ(report->find(paths_[5])->reason, "removed after resetting permissions");
    ASSERT_EQ(fs_->writable_calls().size(), 1);
    EXPECT_EQ(fs_->writable_calls()[0], paths_[5]);
    EXPECT_TRUE(elevator.commands().empty());
}

TEST_F(RemovalTest, ForcedFallsBackToElevator) {
    fs_->deny_removal(paths_[5]);

    RecordingElevator elevator;
    auto orchestrator = make({}, &elevator);
    auto report = orchestrator.remove(paths_, RemovalMode::FORCED);
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->removed, 10);
    EXPECT_EQ(report->find(paths_[5])->reason, "removed with elevated privileges");

    auto commands = elevator.commands();
    ASSERT_EQ(commands.size(), 1);
    const std::vector<std::string> expected{"rm", "-rf", "--", paths_[5]};
    EXPECT_EQ(commands[0], expected);
}

TEST_F(RemovalTest, ForcedFailsWhenElevationRefused) {
    fs_->deny_removal(paths_[5]);

    RecordingElevator elevator(false);
    auto orchestrator = make({}, &elevator);
    auto report = orchestrator.remove(paths_, RemovalMode::FORCED);
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->removed, 9);
    EXPECT_EQ(report->failed, 1);
    EXPECT_EQ(report->find(paths_[5])->status, EntryStatus::FAILED);
}

TEST_F(RemovalTest, ForcedWithoutElevatorFails) {
    fs_->deny_removal(paths_[5]);

    auto orchestrator = make();
    auto report = orchestrator.remove(paths_, RemovalMode::FORCED);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->failed, 1);
    EXPECT_EQ(fs_->writable_calls().size(), 1);
}

// ============================================================================
// Cancellation and snapshots
// ============================================================================

TEST_F(RemovalTest, CancelledRunSkipsEverything) {
    RemovalOptions options;
    options.cancel.cancel();

    auto orchestrator = make(options);
    auto report = orchestrator.remove(paths_, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());

    EXPECT_TRUE(report->cancelled);
    EXPECT_EQ(report->skipped, 10);
    EXPECT_EQ(report->find(paths_[0])->reason, "cancelled");
    EXPECT_EQ(fs_->remove_calls(), 0);
}

TEST_F(RemovalTest, SnapshotWithoutManagerIsRejected) {
    RemovalOptions options;
    options.snapshot_before = true;

    auto orchestrator = make(options);
    auto report = orchestrator.remove(paths_, RemovalMode::STANDARD);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error().code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(fs_->remove_calls(), 0);
}

TEST_F(RemovalTest, FailedSnapshotAbortsRemoval) {
    SnapshotManager snapshots(SnapshotOptions{});  // No backup directory

    RemovalOptions options;
    options.snapshot_before = true;
    options.snapshot_name = "Before_Foo_Uninstall";

    auto orchestrator = make(options, nullptr, &snapshots);
    auto report = orchestrator.remove(paths_, RemovalMode::FORCED);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(fs_->remove_calls(), 0);
    for (const auto& path : paths_) {
        EXPECT_TRUE(fs_->has(path));
    }
}

TEST_F(RemovalTest, SnapshotIsTakenBeforeRemoval) {
    const fs::path backups = sweep::test::scratch_dir("sweep_removal");
    fs::remove_all(backups);

    SnapshotOptions snapshot_options;
    snapshot_options.backup_dir = backups;
    snapshot_options.creator = "tester";
    SnapshotManager snapshots(snapshot_options);

    RemovalOptions options;
    options.snapshot_before = true;
    options.snapshot_name = "Before_Foo_Uninstall";

    auto orchestrator = make(options, nullptr, &snapshots);
    auto report = orchestrator.remove(paths_, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok()) << report.error().to_string();

    ASSERT_TRUE(report->snapshot.has_value());
    EXPECT_EQ(report->snapshot->name, "Before_Foo_Uninstall");
    EXPECT_TRUE(fs::exists(report->snapshot->archive_path));
    EXPECT_EQ(report->removed, 10);

    fs::remove_all(backups);
}

TEST_F(RemovalTest, LocksAreReleasedAfterRun) {
    TreeLockRegistry locks;
    RemovalOrchestrator orchestrator(fs_, RemovalOptions{}, nullptr, nullptr, nullptr, &locks);
    auto report = orchestrator.remove(paths_, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(locks.held_count(), 0);
}

TEST_F(RemovalTest, SmallBatchesStillCoverEverything) {
    RemovalOptions options;
    options.batch_size = 3;

    auto orchestrator = make(options);
    auto report = orchestrator.remove(paths_, RemovalMode::STANDARD);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->removed, 10);
}

TEST(EntryStatusTest, Names) {
    EXPECT_STREQ(entry_status_name(EntryStatus::REMOVED), "removed");
    EXPECT_STREQ(entry_status_name(EntryStatus::SKIPPED), "skipped");
    EXPECT_STREQ(entry_status_name(EntryStatus::FAILED), "failed");
}
