#include "core/volume.hpp"
#include "core/file_utils.hpp"
#include <sstream>
#include <unistd.h>

std::string Volume::toString() const
{
    std::stringstream ss;
    ss << "Volume{"
       << "id='" << id << "', "
       << "label='" << label << "', "
       << "root='" << root_path << "', "
       << "device='" << device << "', "
       << "fs=" << filesystem_type << ", "
       << "free=" << FileUtils::formatBytes(free_bytes) << "/" << FileUtils::formatBytes(total_bytes) << ", "
       << "removable=" << (is_removable ? "yes" : "no") << "}";
    return ss.str();
}

nlohmann::json Volume::toJson() const
{
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["root_path"] = root_path;
    j["device"] = device;
    j["filesystem_type"] = filesystem_type;
    j["total_bytes"] = total_bytes;
    j["free_bytes"] = free_bytes;
    j["is_removable"] = is_removable;
    return j;
}

bool VolumeHandle::isAccessible() const
{
    if (!isConnected())
        return false;
    return access(volume_.root_path.c_str(), R_OK | X_OK) == 0;
}
