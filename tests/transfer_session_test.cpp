#include "test_base.hpp"
#include "core/event_channel.hpp"
#include "core/transfer_session.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

TEST(EventChannelTest, DeliversInOrderAndDrainsAfterClose)
{
    EventChannel<int> channel;
    EXPECT_TRUE(channel.send(1));
    EXPECT_TRUE(channel.send(2));
    channel.close();
    EXPECT_FALSE(channel.send(3));
    EXPECT_TRUE(channel.isClosed());
    EXPECT_FALSE(channel.isDrained());

    EXPECT_EQ(channel.receive(), 1);
    EXPECT_EQ(channel.tryReceive(), 2);
    EXPECT_FALSE(channel.receive().has_value());
    EXPECT_TRUE(channel.isDrained());
}

TEST(EventChannelTest, ReceiveBlocksUntilProducerSends)
{
    EventChannel<std::string> channel;
    EXPECT_FALSE(channel.receiveFor(std::chrono::milliseconds(10)).has_value());

    std::thread producer([&channel]()
                         {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.send("card");
        channel.close(); });
    auto value = channel.receive();
    producer.join();

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "card");
    EXPECT_FALSE(channel.receive().has_value());
}

class TransferSessionTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        Volume volume;
        volume.id = "CARD";
        volume.root_path = sourceDir().string();
        volume_ = std::make_shared<VolumeHandle>(volume);
        options_.fsync_files = false;
        options_.chunk_size_bytes = 8;
        options_.backoff_base_ms = 1;

        plan_.destination_root = destDir().string();
        for (int i = 1; i <= 3; ++i)
        {
            PlanEntry entry;
            entry.item_id = "IMG_000" + std::to_string(i) + ".JPG";
            entry.relative_source = entry.item_id;
            entry.source_path = createSourceFile(entry.item_id, std::string(20 * i, static_cast<char>('a' + i)));
            entry.destination_path = (destDir() / ("IMG000" + std::to_string(i) + ".JPG")).string();
            entry.size = 20 * i;
            entry.sequence_index = i;
            plan_.entries.push_back(entry);
        }
    }

    std::vector<TransferEvent> drain(TransferSession &session)
    {
        std::vector<TransferEvent> events;
        while (auto event = session.events().receive())
            events.push_back(*event);
        return events;
    }

    VolumeHandlePtr volume_;
    TransferOptions options_;
    TransferPlan plan_;
};

TEST_F(TransferSessionTest, RunsOnWorkerAndStreamsEvents)
{
    TransferSession session(options_);
    session.start(plan_, volume_);
    EXPECT_TRUE(volume_->isClaimed());

    std::vector<TransferEvent> events = drain(session);
    TransferReport report = session.wait();

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, TransferEventType::SESSION_FINISHED);
    EXPECT_EQ(events.back().total_bytes_done, 120u);
    EXPECT_TRUE(session.isFinished());
    EXPECT_FALSE(session.isRunning());
    EXPECT_TRUE(session.errorMessage().empty());
    EXPECT_EQ(report.count(TransferStatus::SUCCEEDED), 3u);
    EXPECT_FALSE(volume_->isClaimed());
    EXPECT_FALSE(TransferSession::isAnySessionActive());
    EXPECT_EQ(listFiles(destDir()).size(), 3u);

    // A finished session cannot be restarted
    EXPECT_THROW(session.start(plan_, volume_), std::logic_error);
}

TEST_F(TransferSessionTest, OnlyOneSessionAtATime)
{
    std::atomic<bool> release{false};
    TransferHooks hooks;
    hooks.before_chunk = [&release](const PlanEntry &, size_t)
    {
        while (!release.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    };
    TransferSession first(options_, hooks);
    first.start(plan_, volume_);
    EXPECT_TRUE(TransferSession::isAnySessionActive());

    Volume other;
    other.id = "OTHER";
    other.root_path = sourceDir().string();
    TransferSession second(options_);
    EXPECT_THROW(second.start(plan_, std::make_shared<VolumeHandle>(other)), std::logic_error);

    release.store(true);
    drain(first);
    first.wait();
    EXPECT_FALSE(TransferSession::isAnySessionActive());
}

TEST_F(TransferSessionTest, ClaimedVolumeIsRejected)
{
    ASSERT_TRUE(volume_->claim());
    TransferSession session(options_);
    EXPECT_THROW(session.start(plan_, volume_), std::logic_error);
    EXPECT_FALSE(TransferSession::isAnySessionActive());
    volume_->release();

    TransferSession without_volume(options_);
    EXPECT_THROW(without_volume.start(plan_, nullptr), std::invalid_argument);
}

TEST_F(TransferSessionTest, CancelEndsSessionWithSkippedItems)
{
    TransferSession *session_ptr = nullptr;
    TransferHooks hooks;
    hooks.before_chunk = [&session_ptr](const PlanEntry &, size_t)
    { session_ptr->cancel(); };
    TransferSession session(options_, hooks);
    session_ptr = &session;
    session.start(plan_, volume_);

    drain(session);
    TransferReport report = session.wait();
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.count(TransferStatus::SKIPPED), 3u);
    EXPECT_TRUE(listFiles(destDir()).empty());
}

TEST_F(TransferSessionTest, VolumeLossSurfacesErrorMessage)
{
    TransferHooks hooks;
    VolumeHandlePtr volume = volume_;
    hooks.before_chunk = [volume](const PlanEntry &entry, size_t)
    {
        if (entry.sequence_index == 2)
            volume->markDisconnected();
    };
    TransferSession session(options_, hooks);
    session.start(plan_, volume_);
    drain(session);
    TransferReport report = session.wait();

    EXPECT_FALSE(session.errorMessage().empty());
    EXPECT_EQ(report.session_error, TransferErrorKind::VOLUME_UNAVAILABLE);
    EXPECT_EQ(report.count(TransferStatus::SUCCEEDED), 1u);
    EXPECT_EQ(report.count(TransferStatus::FAILED), 2u);
}

TEST_F(TransferSessionTest, DestructorCancelsRunningSession)
{
    std::atomic<bool> release{false};
    TransferHooks hooks;
    hooks.before_chunk = [&release](const PlanEntry &, size_t)
    {
        while (!release.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    };
    std::thread releaser;
    {
        TransferSession session(options_, hooks);
        session.start(plan_, volume_);
        releaser = std::thread([&release]()
                               {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            release.store(true); });
    }
    releaser.join();
    EXPECT_FALSE(TransferSession::isAnySessionActive());
    EXPECT_FALSE(volume_->isClaimed());
}
