#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief A mounted storage location that media can be transferred from
 */
struct Volume
{
    std::string id;              // Filesystem UUID, else label, else device node
    std::string label;           // e.g., "EOS_DIGITAL"
    std::string root_path;       // e.g., "/media/user/EOS_DIGITAL"
    std::string device;          // e.g., "/dev/mmcblk0p1"
    std::string filesystem_type; // e.g., "vfat", "exfat"
    uint64_t total_bytes = 0;
    uint64_t free_bytes = 0;
    bool is_removable = false;

    std::string toString() const;
    nlohmann::json toJson() const;
};

/**
 * @brief Shared handle to the active volume
 *
 * The watcher marks the handle disconnected on detach. A running session
 * claims the handle so the watcher never promotes a second volume while
 * the first one is in use.
 */
class VolumeHandle
{
public:
    explicit VolumeHandle(Volume volume) : volume_(std::move(volume)) {}

    const Volume &volume() const { return volume_; }
    const std::string &rootPath() const { return volume_.root_path; }

    bool isConnected() const noexcept { return connected_.load(); }
    void markDisconnected() noexcept { connected_.store(false); }

    // Connected and the root directory is still readable
    bool isAccessible() const;

    // Returns false if another session already holds the handle
    bool claim() noexcept
    {
        bool expected = false;
        return claimed_.compare_exchange_strong(expected, true);
    }
    void release() noexcept { claimed_.store(false); }
    bool isClaimed() const noexcept { return claimed_.load(); }

private:
    Volume volume_;
    std::atomic<bool> connected_{true};
    std::atomic<bool> claimed_{false};
};

using VolumeHandlePtr = std::shared_ptr<VolumeHandle>;
