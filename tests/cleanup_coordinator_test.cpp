#include "test_base.hpp"
#include "core/cleanup_coordinator.hpp"
#include "core/transfer_executor.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

class CleanupCoordinatorTest : public TestBase
{
protected:
    // A transferred item: source and published destination both on disk
    TransferRecord record(const std::string &name, TransferStatus status, const std::string &content = "payload")
    {
        TransferRecord r;
        r.item_id = "DCIM/" + name;
        r.source_path = createSourceFile("DCIM/" + name, content);
        r.destination_path = createFile(destDir() / name, content);
        r.status = status;
        r.bytes_total = content.size();
        if (status == TransferStatus::SUCCEEDED)
        {
            r.bytes_copied = content.size();
            r.verification = VerificationResult::MATCH;
        }
        return r;
    }

    TransferReport completedReport(std::vector<TransferRecord> records)
    {
        TransferReport report;
        report.records = std::move(records);
        report.completed = true;
        return report;
    }

    CleanupCoordinator coordinator_{CleanupOptions{1, 1, 2}};
};

TEST_F(CleanupCoordinatorTest, DeletesOnlySucceededSources)
{
    TransferReport report = completedReport({record("A.JPG", TransferStatus::SUCCEEDED),
                                             record("B.JPG", TransferStatus::SUCCEEDED),
                                             record("C.JPG", TransferStatus::FAILED),
                                             record("D.JPG", TransferStatus::SUCCEEDED),
                                             record("E.JPG", TransferStatus::SKIPPED)});

    CleanupResult result = coordinator_.cleanup(report, CleanupConfirmation::granted());

    EXPECT_TRUE(result.confirmed);
    EXPECT_EQ(result.deleted, 3u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(result.not_eligible, 2u);
    EXPECT_EQ(listFiles(sourceDir()), (std::vector<std::string>{"DCIM/C.JPG", "DCIM/E.JPG"}));
    // Destinations stay in place
    EXPECT_EQ(listFiles(destDir()).size(), 5u);

    ASSERT_EQ(result.items.size(), 5u);
    EXPECT_EQ(result.items[2].outcome, CleanupOutcome::NOT_ELIGIBLE);
    EXPECT_EQ(result.items[0].outcome, CleanupOutcome::DELETED);
}

TEST_F(CleanupCoordinatorTest, NothingDeletedWithoutConfirmation)
{
    TransferReport report = completedReport({record("A.JPG", TransferStatus::SUCCEEDED),
                                             record("B.JPG", TransferStatus::SUCCEEDED)});

    CleanupResult result = coordinator_.cleanup(report, CleanupConfirmation::denied());

    EXPECT_FALSE(result.confirmed);
    EXPECT_EQ(result.deleted, 0u);
    EXPECT_EQ(result.not_eligible, 2u);
    EXPECT_EQ(listFiles(sourceDir()).size(), 2u);
}

TEST_F(CleanupCoordinatorTest, IncompleteSessionIsRejected)
{
    TransferReport report;
    report.records.push_back(record("A.JPG", TransferStatus::SUCCEEDED));
    EXPECT_THROW(coordinator_.cleanup(report, CleanupConfirmation::granted()), std::logic_error);
    EXPECT_TRUE(fs::exists(report.records[0].source_path));
}

TEST_F(CleanupCoordinatorTest, MissingOrShortDestinationKeepsSource)
{
    TransferRecord missing = record("A.JPG", TransferStatus::SUCCEEDED);
    fs::remove(missing.destination_path);
    TransferRecord truncated = record("B.JPG", TransferStatus::SUCCEEDED, "full content");
    createFile(truncated.destination_path, "full");

    CleanupResult result = coordinator_.cleanup(completedReport({missing, truncated}), CleanupConfirmation::granted());

    EXPECT_EQ(result.deleted, 0u);
    EXPECT_EQ(result.failed, 2u);
    for (const auto &item : result.items)
    {
        EXPECT_EQ(item.outcome, CleanupOutcome::DELETE_FAILED);
        EXPECT_EQ(item.error_kind, TransferErrorKind::DELETION_FAILURE);
    }
    EXPECT_EQ(listFiles(sourceDir()).size(), 2u);
}

TEST_F(CleanupCoordinatorTest, SourceAlreadyGoneIsReportedAsFailure)
{
    TransferRecord gone = record("A.JPG", TransferStatus::SUCCEEDED);
    fs::remove(gone.source_path);

    CleanupResult result = coordinator_.cleanup(completedReport({gone}), CleanupConfirmation::granted());

    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.items[0].outcome, CleanupOutcome::DELETE_FAILED);
    EXPECT_EQ(result.items[0].error_kind, TransferErrorKind::DELETION_FAILURE);
}

TEST_F(CleanupCoordinatorTest, DisconnectedVolumeBlocksDeletion)
{
    Volume volume;
    volume.id = "CARD";
    volume.root_path = sourceDir().string();
    auto handle = std::make_shared<VolumeHandle>(volume);
    handle->markDisconnected();

    CleanupResult result = coordinator_.cleanup(completedReport({record("A.JPG", TransferStatus::SUCCEEDED)}),
                                                CleanupConfirmation::granted(), handle);

    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.items[0].error_kind, TransferErrorKind::VOLUME_UNAVAILABLE);
    EXPECT_EQ(listFiles(sourceDir()).size(), 1u);
}

TEST_F(CleanupCoordinatorTest, CleansUpAfterRealTransfer)
{
    Volume volume;
    volume.id = "CARD";
    volume.root_path = sourceDir().string();
    auto handle = std::make_shared<VolumeHandle>(volume);

    TransferPlan plan;
    plan.destination_root = destDir().string();
    for (const std::string name : {"A.JPG", "B.JPG", "C.JPG"})
    {
        PlanEntry entry;
        entry.item_id = name;
        entry.relative_source = name;
        entry.source_path = createSourceFile(name, "content of " + name);
        entry.destination_path = (destDir() / "2024" / name).string();
        entry.size = fs::file_size(entry.source_path);
        plan.entries.push_back(entry);
    }
    fs::remove(plan.entries[1].source_path); // fails with UNREADABLE_SOURCE

    TransferOptions options;
    options.fsync_files = false;
    TransferExecutor executor(options);
    executor.execute(plan, handle).subscribe([](const TransferEvent &) {}, [](const std::exception &) {}, []() {});
    TransferReport report = executor.report();
    ASSERT_EQ(report.count(TransferStatus::SUCCEEDED), 2u);

    CleanupResult result = coordinator_.cleanup(report, CleanupConfirmation::granted(), handle);
    EXPECT_EQ(result.deleted, 2u);
    EXPECT_TRUE(listFiles(sourceDir()).empty());
    EXPECT_EQ(listFiles(destDir()), (std::vector<std::string>{"2024/A.JPG", "2024/C.JPG"}));

    nlohmann::json json = result.toJson();
    EXPECT_EQ(json["deleted"], 2);
    EXPECT_EQ(json["items"][0]["outcome"], "deleted");
    EXPECT_EQ(json["items"][1]["outcome"], "not-eligible");
}
