#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct SelectionEntry
{
    std::string item_id;
    bool included = true;
};

// Ordered selection produced by filtering or the UI, owned by the caller
using SelectionSet = std::vector<SelectionEntry>;

enum class PlanAction
{
    COPY,
    SKIP_IDENTICAL // byte-identical file already at the destination
};

struct PlanEntry
{
    std::string item_id;
    std::string source_path;      // absolute
    std::string relative_source;  // volume-relative
    std::string destination_path; // absolute, unique within the plan
    uint64_t size = 0;
    int sequence_index = 0;
    PlanAction action = PlanAction::COPY;
    std::string existing_checksum; // SHA-256 of the identical destination file, SKIP_IDENTICAL only

    nlohmann::json toJson() const;
};

/**
 * @brief Precomputed collision-free source to destination mapping
 */
struct TransferPlan
{
    std::string destination_root;
    std::vector<PlanEntry> entries;

    const PlanEntry *find(const std::string &item_id) const;
    uint64_t totalBytes() const; // bytes of COPY entries
    size_t count(PlanAction action) const;

    nlohmann::json toJson() const;

    static std::string getActionName(PlanAction action)
    {
        return action == PlanAction::SKIP_IDENTICAL ? "skip-identical" : "copy";
    }
};
