#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class PocoConfigManager;

enum class OrganizationMode
{
    BY_DATE,             // folders from the capture date, e.g. 2024/03/15
    BY_METADATA_TEMPLATE // folders from metadata fields, e.g. Canon EOS R5/2024-03
};

/**
 * @brief User rules for destination folders and file names
 */
struct OrganizationPolicy
{
    OrganizationMode mode = OrganizationMode::BY_DATE;
    std::string date_format = "YYYY/MM/DD";
    std::vector<std::string> template_tokens = {"camera_model", "{year}-{month}"};
    std::string rename_base = "IMG"; // empty keeps the original file name
    int rename_start_index = 1;
    int rename_digits = 4;

    static constexpr int kMaxRenameStartIndex = 999999999;

    /**
     * @brief Check value ranges
     * @throws std::invalid_argument on an unusable policy
     */
    void validate() const;

    nlohmann::json toJson() const;

    // Missing keys keep their defaults. Validates the result.
    static OrganizationPolicy fromJson(const nlohmann::json &json);
    static OrganizationPolicy fromConfig(const PocoConfigManager &config);

    static std::string getModeName(OrganizationMode mode);
    static OrganizationMode modeFromString(const std::string &mode_str);
};
