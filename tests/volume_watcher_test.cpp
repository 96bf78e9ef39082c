#include "test_base.hpp"
#include "core/volume_watcher.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

class VolumeWatcherTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        table_ = "proc /proc proc rw,nosuid 0 0\n"
                 "/dev/nvme0n1p2 / ext4 rw,relatime 0 0\n";
    }

    std::unique_ptr<VolumeWatcher> makeWatcher()
    {
        return std::make_unique<VolumeWatcher>(
            [this]()
            {
                std::lock_guard<std::mutex> lock(table_mutex_);
                return table_;
            },
            // Everything on /dev/sd* or /dev/mmcblk* counts as removable here
            [](const MountEntry &entry)
            {
                return entry.device.rfind("/dev/sd", 0) == 0 || entry.device.rfind("/dev/mmcblk", 0) == 0;
            });
    }

    void mount(const std::string &device, const std::string &mount_point, const std::string &fs = "vfat")
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        table_ += device + " " + mount_point + " " + fs + " rw,nosuid,nodev 0 0\n";
    }

    void unmount(const std::string &mount_point)
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        std::string kept;
        std::istringstream lines(table_);
        std::string line;
        while (std::getline(lines, line))
        {
            if (line.find(" " + mount_point + " ") == std::string::npos)
                kept += line + "\n";
        }
        table_ = kept;
    }

    std::mutex table_mutex_;
    std::string table_;
};

TEST_F(VolumeWatcherTest, ParsesMountTableAndUnescapesFields)
{
    auto entries = VolumeWatcher::parseMountTable(
        "/dev/sdb1 /media/user/EOS\\040DIGITAL vfat rw,uid=1000 0 0\n"
        "garbage\n"
        "/dev/mmcblk0p1 /run/media/user/SD\\134CARD exfat ro 0 0\n");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].device, "/dev/sdb1");
    EXPECT_EQ(entries[0].mount_point, "/media/user/EOS DIGITAL");
    EXPECT_EQ(entries[0].fs_type, "vfat");
    EXPECT_EQ(entries[1].mount_point, "/run/media/user/SD\\CARD");
    EXPECT_EQ(VolumeWatcher::unescapeMountField("NO\\x20NAME"), "NO NAME");
    EXPECT_EQ(VolumeWatcher::unescapeMountField("trailing\\04"), "trailing\\04");
}

TEST_F(VolumeWatcherTest, PseudoFilesystemsAreIgnored)
{
    EXPECT_TRUE(VolumeWatcher::isPseudoFilesystem("proc"));
    EXPECT_TRUE(VolumeWatcher::isPseudoFilesystem("tmpfs"));
    EXPECT_FALSE(VolumeWatcher::isPseudoFilesystem("vfat"));
    EXPECT_FALSE(VolumeWatcher::isRemovableDevice(MountEntry{"tmpfs", "/run", "tmpfs", "rw"}));
}

TEST_F(VolumeWatcherTest, FirstRemovableVolumeBecomesActive)
{
    auto watcher = makeWatcher();
    EXPECT_TRUE(watcher->poll().empty());
    EXPECT_EQ(watcher->activeVolume(), nullptr);

    mount("/dev/sdb1", "/media/user/CARD_A");
    auto events = watcher->poll();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, VolumeEventType::ATTACHED);
    EXPECT_EQ(events[1].type, VolumeEventType::ACTIVATED);
    EXPECT_TRUE(events[1].is_active);

    auto active = watcher->activeVolume();
    ASSERT_NE(active, nullptr);
    EXPECT_EQ(active->rootPath(), "/media/user/CARD_A");
    EXPECT_EQ(active->volume().label, "CARD_A");
    EXPECT_TRUE(active->volume().is_removable);

    // A second card is known but does not replace the active one
    mount("/dev/mmcblk0p1", "/media/user/CARD_B", "exfat");
    events = watcher->poll();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, VolumeEventType::ATTACHED);
    EXPECT_EQ(watcher->activeVolume(), active);
    EXPECT_EQ(watcher->knownVolumes().size(), 2u);

    // Polling again with no change reports nothing
    EXPECT_TRUE(watcher->poll().empty());
}

TEST_F(VolumeWatcherTest, NonRemovableMountsAreFilteredSilently)
{
    auto watcher = makeWatcher();
    mount("/dev/nvme0n1p3", "/home", "ext4");
    EXPECT_TRUE(watcher->poll().empty());
    EXPECT_TRUE(watcher->knownVolumes().empty());
}

TEST_F(VolumeWatcherTest, DetachMarksActiveHandleDisconnected)
{
    auto watcher = makeWatcher();
    mount("/dev/sdb1", "/media/user/CARD_A");
    mount("/dev/sdc1", "/media/user/CARD_B");
    watcher->poll();

    auto active = watcher->activeVolume();
    ASSERT_NE(active, nullptr);
    ASSERT_EQ(active->rootPath(), "/media/user/CARD_A");
    EXPECT_TRUE(active->isConnected());

    unmount("/media/user/CARD_A");
    auto events = watcher->poll();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, VolumeEventType::DETACHED);
    EXPECT_TRUE(events[0].is_active);
    EXPECT_EQ(events[1].type, VolumeEventType::ACTIVATED);
    EXPECT_EQ(events[1].volume.root_path, "/media/user/CARD_B");

    EXPECT_FALSE(active->isConnected());
    EXPECT_FALSE(active->isAccessible());
}

TEST_F(VolumeWatcherTest, NoPromotionWhileDetachedVolumeIsClaimed)
{
    auto watcher = makeWatcher();
    mount("/dev/sdb1", "/media/user/CARD_A");
    mount("/dev/sdc1", "/media/user/CARD_B");
    watcher->poll();

    auto active = watcher->activeVolume();
    ASSERT_NE(active, nullptr);
    ASSERT_TRUE(active->claim());

    unmount("/media/user/CARD_A");
    auto events = watcher->poll();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, VolumeEventType::DETACHED);
    EXPECT_TRUE(events[0].is_active);
    EXPECT_EQ(watcher->activeVolume(), nullptr);
    EXPECT_TRUE(watcher->poll().empty());

    // Promotion resumes once the session lets go
    active->release();
    events = watcher->poll();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, VolumeEventType::ACTIVATED);
    ASSERT_NE(watcher->activeVolume(), nullptr);
    EXPECT_EQ(watcher->activeVolume()->rootPath(), "/media/user/CARD_B");
}

TEST_F(VolumeWatcherTest, ClaimedVolumeIsNotReleased)
{
    auto watcher = makeWatcher();
    mount("/dev/sdb1", "/media/user/CARD_A");
    mount("/dev/sdc1", "/media/user/CARD_B");
    watcher->poll();

    auto active = watcher->activeVolume();
    ASSERT_TRUE(active->claim());
    EXPECT_FALSE(active->claim());

    watcher->clearActive();
    EXPECT_EQ(watcher->activeVolume(), active);

    active->release();
    watcher->clearActive();
    auto next = watcher->activeVolume();
    ASSERT_NE(next, nullptr);
    EXPECT_EQ(next->rootPath(), "/media/user/CARD_B");

    // The released card only comes back after it is re-attached
    watcher->clearActive();
    EXPECT_EQ(watcher->activeVolume(), nullptr);
    unmount("/media/user/CARD_A");
    watcher->poll();
    mount("/dev/sdb1", "/media/user/CARD_A");
    watcher->poll();
    ASSERT_NE(watcher->activeVolume(), nullptr);
    EXPECT_EQ(watcher->activeVolume()->rootPath(), "/media/user/CARD_A");
}

TEST_F(VolumeWatcherTest, SubscribersReceiveEventsFromBackgroundThread)
{
    auto watcher = makeWatcher();
    std::atomic<int> attached{0};
    watcher->subscribe([&attached](const VolumeEvent &event)
                       {
        if (event.type == VolumeEventType::ATTACHED)
            ++attached; });

    watcher->start(20);
    EXPECT_TRUE(watcher->isRunning());
    mount("/dev/sdb1", "/media/user/CARD_A");

    for (int i = 0; i < 200 && attached.load() == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    watcher->stop();

    EXPECT_EQ(attached.load(), 1);
    EXPECT_FALSE(watcher->isRunning());
    EXPECT_NE(watcher->activeVolume(), nullptr);
}

TEST_F(VolumeWatcherTest, DescribeVolumeForPlainDirectory)
{
    auto volume = VolumeWatcher::describeVolume(sourceDir().string());
    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(volume->label, "source");
    EXPECT_FALSE(volume->root_path.empty());
    EXPECT_GT(volume->total_bytes, 0u);
    EXPECT_FALSE(VolumeWatcher::describeVolume((testRoot() / "missing").string()).has_value());

    VolumeHandle handle(*volume);
    EXPECT_TRUE(handle.isAccessible());
    handle.markDisconnected();
    EXPECT_FALSE(handle.isAccessible());
}
