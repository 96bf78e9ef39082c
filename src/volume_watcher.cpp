#include "core/volume_watcher.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    const char *kMountTablePath = "/proc/self/mounts";

    std::string readMountTableFile()
    {
        std::ifstream mounts_file(kMountTablePath);
        std::stringstream buffer;
        buffer << mounts_file.rdbuf();
        return buffer.str();
    }

    std::string readFirstLine(const fs::path &path)
    {
        std::ifstream file(path);
        std::string line;
        std::getline(file, line);
        return line;
    }

    std::string canonicalOrSelf(const std::string &path)
    {
        std::error_code ec;
        fs::path resolved = fs::canonical(path, ec);
        return ec ? path : resolved.string();
    }

    // Name of the /dev/disk/by-* link that resolves to the given device node
    std::string findDiskLink(const std::string &directory, const std::string &device)
    {
        std::error_code ec;
        if (device.empty() || !fs::is_directory(directory, ec))
            return "";
        std::string target = canonicalOrSelf(device);
        for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
        {
            if (canonicalOrSelf(it->path().string()) == target)
                return VolumeWatcher::unescapeMountField(it->path().filename().string());
        }
        return "";
    }

    void fillCapacity(Volume &volume)
    {
        struct statvfs st;
        if (statvfs(volume.root_path.c_str(), &st) == 0)
        {
            volume.total_bytes = static_cast<uint64_t>(st.f_blocks) * st.f_frsize;
            volume.free_bytes = static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
        }
        else
        {
            Logger::debug("statvfs failed for " + volume.root_path + ": " + std::strerror(errno));
        }
    }
}

VolumeWatcher::VolumeWatcher(MountTableSource source, RemovableProbe probe)
    : source_(std::move(source)), probe_(std::move(probe)), native_source_(false)
{
    if (!source_)
    {
        source_ = readMountTableFile;
        native_source_ = true;
    }
    if (!probe_)
    {
        probe_ = &VolumeWatcher::isRemovableDevice;
    }
}

VolumeWatcher::~VolumeWatcher()
{
    stop();
}

std::vector<MountEntry> VolumeWatcher::parseMountTable(const std::string &text)
{
    std::vector<MountEntry> entries;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line))
    {
        std::istringstream iss(line);
        std::string device, mountpoint, type, options;
        if (iss >> device >> mountpoint >> type >> options)
        {
            MountEntry entry;
            entry.device = unescapeMountField(device);
            entry.mount_point = unescapeMountField(mountpoint);
            entry.fs_type = type;
            entry.options = options;
            entries.push_back(entry);
        }
    }
    return entries;
}

std::string VolumeWatcher::unescapeMountField(const std::string &field)
{
    std::string result;
    result.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i)
    {
        if (field[i] == '\\' && i + 3 < field.size() &&
            std::all_of(field.begin() + i + 1, field.begin() + i + 4,
                        [](char c)
                        { return c >= '0' && c <= '7'; }))
        {
            result += static_cast<char>(((field[i + 1] - '0') << 6) | ((field[i + 2] - '0') << 3) | (field[i + 3] - '0'));
            i += 3;
        }
        else if (field[i] == '\\' && i + 3 < field.size() && field[i + 1] == 'x' &&
                 std::isxdigit(static_cast<unsigned char>(field[i + 2])) &&
                 std::isxdigit(static_cast<unsigned char>(field[i + 3])))
        {
            // udev escapes spaces in /dev/disk/by-label names as \x20
            result += static_cast<char>(std::stoi(field.substr(i + 2, 2), nullptr, 16));
            i += 3;
        }
        else
        {
            result += field[i];
        }
    }
    return result;
}

bool VolumeWatcher::isPseudoFilesystem(const std::string &fs_type)
{
    static const std::set<std::string> pseudo = {
        "proc", "sysfs", "tmpfs", "devtmpfs", "devpts", "cgroup", "cgroup2", "securityfs",
        "pstore", "bpf", "tracefs", "debugfs", "configfs", "fusectl", "mqueue", "hugetlbfs",
        "autofs", "binfmt_misc", "overlay", "squashfs", "nsfs", "efivarfs", "rpc_pipefs",
        "ramfs", "selinuxfs", "fuse.gvfsd-fuse", "fuse.portal"};
    return pseudo.count(fs_type) > 0;
}

bool VolumeWatcher::isRemovableDevice(const MountEntry &entry)
{
    if (entry.device.rfind("/dev/", 0) != 0)
        return false;

    std::string name = fs::path(canonicalOrSelf(entry.device)).filename().string();
    if (name.rfind("mmcblk", 0) == 0)
        return true;

    std::error_code ec;
    fs::path sys_entry = fs::path("/sys/class/block") / name;
    fs::path sys_path = fs::canonical(sys_entry, ec);
    if (ec)
        return false;

    // Partitions carry the removable flag on their parent disk
    fs::path disk = fs::exists(sys_path / "partition", ec) ? sys_path.parent_path() : sys_path;
    if (readFirstLine(disk / "removable") == "1")
        return true;
    return sys_path.string().find("/usb") != std::string::npos;
}

std::optional<Volume> VolumeWatcher::describeVolume(const std::string &path)
{
    std::error_code ec;
    if (!fs::is_directory(path, ec))
        return std::nullopt;

    Volume volume;
    volume.root_path = canonicalOrSelf(path);
    volume.label = fs::path(volume.root_path).filename().string();
    volume.id = volume.root_path;

    // Longest mount point containing the directory names its device
    size_t best = 0;
    for (const auto &entry : parseMountTable(readMountTableFile()))
    {
        const std::string &mp = entry.mount_point;
        bool contains = volume.root_path == mp ||
                        (volume.root_path.rfind(mp == "/" ? mp : mp + "/", 0) == 0);
        if (contains && mp.size() >= best)
        {
            best = mp.size();
            volume.device = entry.device;
            volume.filesystem_type = entry.fs_type;
        }
    }
    fillCapacity(volume);
    return volume;
}

Volume VolumeWatcher::makeVolume(const MountEntry &entry) const
{
    Volume volume;
    volume.root_path = entry.mount_point;
    volume.device = entry.device;
    volume.filesystem_type = entry.fs_type;
    volume.is_removable = true;

    volume.label = findDiskLink("/dev/disk/by-label", entry.device);
    if (volume.label.empty())
        volume.label = fs::path(entry.mount_point).filename().string();

    std::string uuid = findDiskLink("/dev/disk/by-uuid", entry.device);
    if (!uuid.empty())
        volume.id = uuid;
    else if (!volume.label.empty())
        volume.id = volume.label;
    else
        volume.id = entry.device;

    fillCapacity(volume);
    return volume;
}

std::vector<VolumeEvent> VolumeWatcher::poll()
{
    std::vector<MountEntry> current;
    for (const auto &entry : parseMountTable(source_()))
    {
        if (isPseudoFilesystem(entry.fs_type))
            continue;
        if (!probe_(entry))
            continue;
        current.push_back(entry);
    }

    std::vector<VolumeEvent> detached, attached, activated;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::set<std::string> present;
        for (const auto &entry : current)
            present.insert(entry.mount_point);

        for (auto it = known_.begin(); it != known_.end();)
        {
            if (present.count(it->first))
            {
                ++it;
                continue;
            }
            VolumeEvent event{VolumeEventType::DETACHED, it->second, false};
            if (active_ && active_->rootPath() == it->first)
            {
                active_->markDisconnected();
                if (active_->isClaimed())
                    detached_active_ = active_;
                active_.reset();
                event.is_active = true;
                Logger::warn("Active volume detached: " + it->second.toString());
            }
            else
            {
                Logger::info("Volume detached: " + it->second.root_path);
            }
            detached.push_back(event);
            released_.erase(it->first);
            it = known_.erase(it);
        }

        for (const auto &entry : current)
        {
            if (known_.count(entry.mount_point))
                continue;
            Volume volume = makeVolume(entry);
            known_[entry.mount_point] = volume;
            attached.push_back(VolumeEvent{VolumeEventType::ATTACHED, volume, false});
            Logger::info("Removable volume attached: " + volume.toString());
        }

        if (detached_active_ && !detached_active_->isClaimed())
            detached_active_.reset();
        if (detached_active_)
        {
            Logger::debug("Detached volume still claimed by a session, not promoting another: " +
                          detached_active_->rootPath());
        }
        else if (!active_)
        {
            for (const auto &entry : current)
            {
                auto it = known_.find(entry.mount_point);
                if (it == known_.end() || released_.count(entry.mount_point))
                    continue;
                active_ = std::make_shared<VolumeHandle>(it->second);
                activated.push_back(VolumeEvent{VolumeEventType::ACTIVATED, it->second, true});
                Logger::info("Active volume: " + it->second.root_path);
                break;
            }
        }
    }

    std::vector<VolumeEvent> events;
    events.insert(events.end(), detached.begin(), detached.end());
    events.insert(events.end(), attached.begin(), attached.end());
    events.insert(events.end(), activated.begin(), activated.end());
    notify(events);
    return events;
}

VolumeHandlePtr VolumeWatcher::activeVolume() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::vector<Volume> VolumeWatcher::knownVolumes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Volume> volumes;
    for (const auto &kv : known_)
        volumes.push_back(kv.second);
    return volumes;
}

void VolumeWatcher::clearActive()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_)
            return;
        if (active_->isClaimed())
        {
            Logger::warn("Active volume is in use by a transfer session, not releasing: " + active_->rootPath());
            return;
        }
        // Not promoted again until it is detached and re-attached
        Logger::info("Releasing active volume: " + active_->rootPath());
        released_.insert(active_->rootPath());
        active_.reset();
    }
    poll();
}

void VolumeWatcher::subscribe(Callback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void VolumeWatcher::notify(const std::vector<VolumeEvent> &events)
{
    if (events.empty())
        return;
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = callbacks_;
    }
    for (const auto &event : events)
    {
        for (const auto &callback : callbacks)
        {
            callback(event);
        }
    }
}

void VolumeWatcher::start(int poll_interval_ms)
{
    if (running_.exchange(true))
    {
        Logger::warn("Volume watcher already running");
        return;
    }
    Logger::info("Starting volume watcher (interval " + std::to_string(poll_interval_ms) + " ms)");
    thread_ = std::thread(&VolumeWatcher::watchLoop, this, poll_interval_ms);
}

void VolumeWatcher::stop()
{
    if (!running_.exchange(false))
        return;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    Logger::info("Volume watcher stopped");
}

void VolumeWatcher::watchLoop(int poll_interval_ms)
{
    // The kernel raises POLLPRI on /proc/self/mounts whenever the mount table changes
    int mounts_fd = -1;
    if (native_source_)
    {
        mounts_fd = ::open(kMountTablePath, O_RDONLY | O_CLOEXEC);
        if (mounts_fd < 0)
            Logger::warn(std::string("Cannot watch mount table, falling back to polling: ") + std::strerror(errno));
    }

    poll();
    const int slice_ms = std::min(poll_interval_ms, 200);
    while (running_.load())
    {
        bool changed = false;
        if (mounts_fd >= 0)
        {
            int waited = 0;
            while (running_.load() && waited < poll_interval_ms && !changed)
            {
                struct pollfd pfd;
                pfd.fd = mounts_fd;
                pfd.events = POLLPRI | POLLERR;
                pfd.revents = 0;
                int rc = ::poll(&pfd, 1, slice_ms);
                if (rc > 0 && (pfd.revents & (POLLPRI | POLLERR)))
                    changed = true;
                else if (rc < 0 && errno != EINTR)
                {
                    Logger::warn(std::string("poll on mount table failed: ") + std::strerror(errno));
                    break;
                }
                waited += slice_ms;
            }
        }
        else
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms),
                              [this]
                              { return !running_.load(); });
        }
        if (!running_.load())
            break;
        if (changed)
            Logger::debug("Mount table changed");
        poll();
    }

    if (mounts_fd >= 0)
        ::close(mounts_fd);
}
