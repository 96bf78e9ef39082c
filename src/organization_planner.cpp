#include "core/organization_planner.hpp"
#include "core/file_utils.hpp"
#include "core/transfer_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    std::string padded(int64_t value, int width)
    {
        std::string digits = std::to_string(value);
        if (static_cast<int>(digits.size()) < width)
            digits.insert(0, static_cast<size_t>(width) - digits.size(), '0');
        return digits;
    }

    std::vector<std::string> splitSegments(const std::string &path)
    {
        std::vector<std::string> segments;
        std::stringstream ss(path);
        std::string segment;
        while (std::getline(ss, segment, '/'))
        {
            segments.push_back(segment);
        }
        return segments;
    }

    bool sameContent(const std::string &destination, const MediaItem &item,
                     const std::optional<std::string> &source_checksum, std::string &existing_checksum)
    {
        auto existing = FileUtils::getFileMetadata(destination);
        if (!existing || existing->file_size != item.size || !source_checksum)
            return false;
        existing_checksum = FileUtils::computeFileHash(destination);
        return !existing_checksum.empty() && existing_checksum == *source_checksum;
    }
}

// TransferPlan
nlohmann::json PlanEntry::toJson() const
{
    nlohmann::json j;
    j["item_id"] = item_id;
    j["source_path"] = source_path;
    j["relative_source"] = relative_source;
    j["destination_path"] = destination_path;
    j["size"] = size;
    j["sequence_index"] = sequence_index;
    j["action"] = TransferPlan::getActionName(action);
    if (!existing_checksum.empty())
        j["existing_checksum"] = existing_checksum;
    return j;
}

const PlanEntry *TransferPlan::find(const std::string &item_id) const
{
    for (const auto &entry : entries)
    {
        if (entry.item_id == item_id)
            return &entry;
    }
    return nullptr;
}

uint64_t TransferPlan::totalBytes() const
{
    uint64_t total = 0;
    for (const auto &entry : entries)
    {
        if (entry.action == PlanAction::COPY)
            total += entry.size;
    }
    return total;
}

size_t TransferPlan::count(PlanAction action) const
{
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [action](const PlanEntry &e)
                                             { return e.action == action; }));
}

nlohmann::json TransferPlan::toJson() const
{
    nlohmann::json j;
    j["destination_root"] = destination_root;
    j["entries"] = nlohmann::json::array();
    for (const auto &entry : entries)
        j["entries"].push_back(entry.toJson());
    return j;
}

// OrganizationPlanner
OrganizationPlanner::OrganizationPlanner(OrganizationPolicy policy, ChecksumProvider checksum_provider)
    : policy_(std::move(policy)), checksum_provider_(std::move(checksum_provider))
{
    policy_.validate();
    if (!checksum_provider_)
    {
        checksum_provider_ = [](const MediaItem &item) -> std::optional<std::string>
        {
            std::string hash = FileUtils::computeFileHash(item.absolute_path);
            if (hash.empty())
                return std::nullopt;
            return hash;
        };
    }
}

std::string OrganizationPlanner::formatDate(std::time_t timestamp, const std::string &format)
{
    std::tm tm{};
    gmtime_r(&timestamp, &tm);

    std::string out;
    size_t i = 0;
    auto starts = [&](const char *token)
    {
        return format.compare(i, std::char_traits<char>::length(token), token) == 0;
    };
    while (i < format.size())
    {
        if (starts("YYYY"))
        {
            out += padded(tm.tm_year + 1900, 4);
            i += 4;
        }
        else if (starts("YY"))
        {
            out += padded((tm.tm_year + 1900) % 100, 2);
            i += 2;
        }
        else if (starts("MM"))
        {
            out += padded(tm.tm_mon + 1, 2);
            i += 2;
        }
        else if (starts("DD"))
        {
            out += padded(tm.tm_mday, 2);
            i += 2;
        }
        else if (starts("HH"))
        {
            out += padded(tm.tm_hour, 2);
            i += 2;
        }
        else if (starts("mm"))
        {
            out += padded(tm.tm_min, 2);
            i += 2;
        }
        else if (starts("ss"))
        {
            out += padded(tm.tm_sec, 2);
            i += 2;
        }
        else
        {
            out += format[i];
            ++i;
        }
    }
    return out;
}

std::string OrganizationPlanner::resolveTemplateToken(const std::string &token,
                                                      const std::map<std::string, std::string> &metadata)
{
    auto lookup = [&metadata](const std::string &field) -> std::string
    {
        auto it = metadata.find(field);
        if (it == metadata.end() || it->second.empty())
            return kUnknownValue;
        return it->second;
    };

    if (token.find('{') == std::string::npos)
        return lookup(token);

    std::string out;
    size_t pos = 0;
    while (pos < token.size())
    {
        size_t open = token.find('{', pos);
        if (open == std::string::npos)
        {
            out += token.substr(pos);
            break;
        }
        size_t close = token.find('}', open + 1);
        if (close == std::string::npos)
        {
            // Unbalanced brace, keep the rest literally
            out += token.substr(pos);
            break;
        }
        out += token.substr(pos, open - pos);
        out += lookup(token.substr(open + 1, close - open - 1));
        pos = close + 1;
    }
    return out;
}

std::string OrganizationPlanner::folderFor(const MediaItem &item) const
{
    std::vector<std::string> segments;
    if (policy_.mode == OrganizationMode::BY_DATE)
    {
        for (const auto &segment : splitSegments(formatDate(item.capture_time, policy_.date_format)))
        {
            std::string clean = FileUtils::sanitizePathSegment(segment);
            if (!clean.empty())
                segments.push_back(clean);
        }
    }
    else
    {
        for (const auto &token : policy_.template_tokens)
        {
            std::string clean = FileUtils::sanitizePathSegment(resolveTemplateToken(token, item.metadata));
            segments.push_back(clean.empty() ? kUnknownValue : clean);
        }
    }

    std::string folder;
    for (const auto &segment : segments)
    {
        if (!folder.empty())
            folder += "/";
        folder += segment;
    }
    return folder;
}

std::string OrganizationPlanner::padNumber(int64_t value) const
{
    return padded(value, policy_.rename_digits);
}

std::string OrganizationPlanner::fileNameFor(const MediaItem &item, int sequence_index) const
{
    if (policy_.rename_base.empty())
        return item.file_name;
    // Keep the extension exactly as the camera wrote it
    std::string extension = fs::path(item.file_name).extension().string();
    return policy_.rename_base + padNumber(sequence_index) + extension;
}

TransferPlan OrganizationPlanner::plan(const MediaItems &items, const std::string &destination_root) const
{
    SelectionSet selection;
    for (const auto &item : items)
        selection.push_back(SelectionEntry{item.id, true});
    return plan(items, selection, destination_root);
}

TransferPlan OrganizationPlanner::plan(const MediaItems &items, const SelectionSet &selection,
                                       const std::string &destination_root) const
{
    std::map<std::string, const MediaItem *> by_id;
    for (const auto &item : items)
        by_id[item.id] = &item;

    std::vector<const MediaItem *> selected;
    std::set<std::string> seen;
    for (const auto &entry : selection)
    {
        if (!entry.included || !seen.insert(entry.item_id).second)
            continue;
        auto it = by_id.find(entry.item_id);
        if (it == by_id.end())
        {
            Logger::warn("Selected item not in catalog, ignoring: " + entry.item_id);
            continue;
        }
        selected.push_back(it->second);
    }

    std::sort(selected.begin(), selected.end(),
              [](const MediaItem *a, const MediaItem *b)
              {
                  if (a->capture_time != b->capture_time)
                      return a->capture_time < b->capture_time;
                  if (a->file_name != b->file_name)
                      return a->file_name < b->file_name;
                  return a->relative_path < b->relative_path;
              });

    TransferPlan result;
    result.destination_root = destination_root;
    const fs::path root(destination_root);

    std::set<std::string> used;
    const int64_t last_index = static_cast<int64_t>(policy_.rename_start_index) + static_cast<int64_t>(selected.size());
    if (last_index > std::numeric_limits<int>::max())
        throw std::invalid_argument("Sequence index overflows: start " + std::to_string(policy_.rename_start_index) +
                                    " with " + std::to_string(selected.size()) + " items");
    int64_t next_suffix = last_index;

    for (size_t k = 0; k < selected.size(); ++k)
    {
        const MediaItem &item = *selected[k];
        const int sequence_index = static_cast<int>(policy_.rename_start_index + static_cast<int64_t>(k));

        std::string folder = folderFor(item);
        fs::path directory = folder.empty() ? root : root / folder;
        std::string name = fileNameFor(item, sequence_index);
        std::string stem = fs::path(name).stem().string();
        std::string extension = fs::path(name).extension().string();

        PlanEntry entry;
        entry.item_id = item.id;
        entry.source_path = item.absolute_path;
        entry.relative_source = item.relative_path;
        entry.size = item.size;
        entry.sequence_index = sequence_index;

        std::optional<std::string> source_checksum;
        bool source_checksum_read = false;

        std::string candidate = (directory / name).lexically_normal().string();
        while (true)
        {
            if (!used.count(candidate))
            {
                std::error_code ec;
                if (!fs::exists(candidate, ec))
                    break;

                if (!source_checksum_read)
                {
                    source_checksum = checksum_provider_(item);
                    source_checksum_read = true;
                }
                std::string existing_checksum;
                if (sameContent(candidate, item, source_checksum, existing_checksum))
                {
                    entry.action = PlanAction::SKIP_IDENTICAL;
                    entry.existing_checksum = existing_checksum;
                    Logger::debug("Identical file already at destination: " + candidate);
                    break;
                }
            }
            std::string suffixed = stem + "_" + padNumber(next_suffix++) + extension;
            Logger::debug("Destination taken, trying " + suffixed + " for " + item.id);
            candidate = (directory / suffixed).lexically_normal().string();
        }

        entry.destination_path = candidate;
        used.insert(candidate);
        result.entries.push_back(entry);
    }

    // Final uniqueness invariant
    std::set<std::string> destinations;
    for (const auto &entry : result.entries)
    {
        if (!destinations.insert(entry.destination_path).second)
        {
            Logger::error("Plan collision on " + entry.destination_path);
            throw PlanCollisionError("Two plan entries resolve to " + entry.destination_path);
        }
    }

    Logger::info("Planned " + std::to_string(result.entries.size()) + " items (" +
                 std::to_string(result.count(PlanAction::SKIP_IDENTICAL)) + " identical) into " + destination_root);
    return result;
}

nlohmann::json OrganizationPlanner::preview(const TransferPlan &plan)
{
    nlohmann::json j;
    j["destination_root"] = plan.destination_root;
    j["total_items"] = plan.entries.size();
    j["to_copy"] = plan.count(PlanAction::COPY);
    j["identical"] = plan.count(PlanAction::SKIP_IDENTICAL);
    j["total_bytes"] = plan.totalBytes();
    j["total_size"] = FileUtils::formatBytes(plan.totalBytes());
    j["entries"] = nlohmann::json::array();
    for (const auto &entry : plan.entries)
    {
        nlohmann::json e;
        e["item_id"] = entry.item_id;
        e["source"] = entry.relative_source;
        e["destination"] = fs::path(entry.destination_path).lexically_relative(plan.destination_root).generic_string();
        e["action"] = TransferPlan::getActionName(entry.action);
        e["sequence_index"] = entry.sequence_index;
        e["size"] = entry.size;
        j["entries"].push_back(e);
    }
    return j;
}
