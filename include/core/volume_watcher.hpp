#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "core/volume.hpp"

struct MountEntry
{
    std::string device;      // e.g., "/dev/sdb1"
    std::string mount_point; // e.g., "/media/user/EOS_DIGITAL"
    std::string fs_type;     // e.g., "vfat"
    std::string options;     // e.g., "rw,nosuid,nodev"
};

enum class VolumeEventType
{
    ATTACHED,
    DETACHED,
    ACTIVATED
};

struct VolumeEvent
{
    VolumeEventType type;
    Volume volume;
    bool is_active = false; // the event concerns the active volume
};

/**
 * @brief Detects removable volumes by diffing the mount table
 *
 * The first removable volume to appear becomes the active volume when none
 * is active. A claimed active handle is never replaced; detaching it marks
 * the handle disconnected so a running transfer fails fast.
 */
class VolumeWatcher
{
public:
    using MountTableSource = std::function<std::string()>;
    using RemovableProbe = std::function<bool(const MountEntry &)>;
    using Callback = std::function<void(const VolumeEvent &)>;

    /**
     * @param source Returns the mount table text; defaults to /proc/self/mounts
     * @param probe Decides removability; defaults to the sysfs probe
     */
    explicit VolumeWatcher(MountTableSource source = nullptr, RemovableProbe probe = nullptr);
    ~VolumeWatcher();

    VolumeWatcher(const VolumeWatcher &) = delete;
    VolumeWatcher &operator=(const VolumeWatcher &) = delete;

    /**
     * @brief Re-read the mount table once and report changes
     * @return Attach, detach and activation events in that order
     */
    std::vector<VolumeEvent> poll();

    VolumeHandlePtr activeVolume() const;
    std::vector<Volume> knownVolumes() const;

    // Forget the active volume (e.g. user ejected it in the UI) and promote the next one
    void clearActive();

    void subscribe(Callback callback);

    /**
     * @brief Start the background watcher thread
     * @param poll_interval_ms Fallback re-read interval when no change notification arrives
     */
    void start(int poll_interval_ms = 1000);
    void stop();
    bool isRunning() const { return running_.load(); }

    static std::vector<MountEntry> parseMountTable(const std::string &text);
    static std::string unescapeMountField(const std::string &field);
    static bool isPseudoFilesystem(const std::string &fs_type);
    static bool isRemovableDevice(const MountEntry &entry);

    /**
     * @brief Describe an arbitrary directory as a Volume (capacity via statvfs)
     * @return nullopt if the path is not a directory
     */
    static std::optional<Volume> describeVolume(const std::string &path);

private:
    Volume makeVolume(const MountEntry &entry) const;
    void notify(const std::vector<VolumeEvent> &events);
    void watchLoop(int poll_interval_ms);

    MountTableSource source_;
    RemovableProbe probe_;
    bool native_source_;

    mutable std::mutex mutex_;
    std::map<std::string, Volume> known_; // mount_point -> volume
    VolumeHandlePtr active_;
    VolumeHandlePtr detached_active_; // held until its session lets go of the claim
    std::set<std::string> released_; // mount points the user released
    std::vector<Callback> callbacks_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};
