#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/media_item.hpp"
#include "core/organization_policy.hpp"
#include "core/transfer_plan.hpp"

/**
 * @brief Computes deterministic, collision-free destinations for selected items
 *
 * Planning only reads destination state. Items are numbered in stable order
 * (capture time, original file name, relative path) so the result does not
 * depend on the order of the input.
 */
class OrganizationPlanner
{
public:
    // Source checksum used to detect byte-identical files at the destination
    using ChecksumProvider = std::function<std::optional<std::string>(const MediaItem &)>;

    /**
     * @param policy Validated organization policy
     * @param checksum_provider Lazy source checksum, usually MediaCatalog::checksum
     */
    explicit OrganizationPlanner(OrganizationPolicy policy, ChecksumProvider checksum_provider = nullptr);

    /**
     * @brief Build the plan for the included entries of a selection
     * @throws PlanCollisionError if two entries end up with the same destination
     */
    TransferPlan plan(const MediaItems &items, const SelectionSet &selection,
                      const std::string &destination_root) const;

    // Plan every item
    TransferPlan plan(const MediaItems &items, const std::string &destination_root) const;

    // Folder path relative to the destination root, '/' separated
    std::string folderFor(const MediaItem &item) const;

    const OrganizationPolicy &policy() const { return policy_; }

    /**
     * @brief Format a wall-clock timestamp with YYYY YY MM DD HH mm ss tokens
     */
    static std::string formatDate(std::time_t timestamp, const std::string &format);

    /**
     * @brief Resolve a bare field name or a {field} pattern against metadata
     * @return Resolved text; missing fields become "unknown"
     */
    static std::string resolveTemplateToken(const std::string &token,
                                            const std::map<std::string, std::string> &metadata);

    // Plan rendered for UI display
    static nlohmann::json preview(const TransferPlan &plan);

    static constexpr const char *kUnknownValue = "unknown";

private:
    std::string fileNameFor(const MediaItem &item, int sequence_index) const;
    std::string padNumber(int64_t value) const;

    OrganizationPolicy policy_;
    ChecksumProvider checksum_provider_;
};
