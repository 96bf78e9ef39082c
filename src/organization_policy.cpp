#include "core/organization_policy.hpp"
#include "core/poco_config_manager.hpp"
#include <stdexcept>

std::string OrganizationPolicy::getModeName(OrganizationMode mode)
{
    switch (mode)
    {
    case OrganizationMode::BY_METADATA_TEMPLATE:
        return "by-metadata-template";
    default:
        return "by-date";
    }
}

OrganizationMode OrganizationPolicy::modeFromString(const std::string &mode_str)
{
    if (mode_str == "by-date" || mode_str == "BY_DATE")
        return OrganizationMode::BY_DATE;
    if (mode_str == "by-metadata-template" || mode_str == "BY_METADATA_TEMPLATE")
        return OrganizationMode::BY_METADATA_TEMPLATE;
    throw std::invalid_argument("Unknown organization mode: " + mode_str);
}

void OrganizationPolicy::validate() const
{
    if (mode == OrganizationMode::BY_DATE && date_format.empty())
        throw std::invalid_argument("date_format must not be empty in by-date mode");
    if (mode == OrganizationMode::BY_METADATA_TEMPLATE && template_tokens.empty())
        throw std::invalid_argument("template must contain at least one token");
    if (rename_digits < 1 || rename_digits > 12)
        throw std::invalid_argument("rename_digits must be between 1 and 12, got " + std::to_string(rename_digits));
    if (rename_start_index < 0 || rename_start_index > kMaxRenameStartIndex)
        throw std::invalid_argument("rename_start_index must be between 0 and " + std::to_string(kMaxRenameStartIndex) +
                                    ", got " + std::to_string(rename_start_index));
    if (rename_base.find('/') != std::string::npos || rename_base.find('\\') != std::string::npos)
        throw std::invalid_argument("rename_base must not contain path separators: " + rename_base);
}

nlohmann::json OrganizationPolicy::toJson() const
{
    nlohmann::json j;
    j["mode"] = getModeName(mode);
    j["date_format"] = date_format;
    j["template"] = template_tokens;
    j["rename_base"] = rename_base;
    j["rename_start_index"] = rename_start_index;
    j["rename_digits"] = rename_digits;
    return j;
}

OrganizationPolicy OrganizationPolicy::fromJson(const nlohmann::json &json)
{
    OrganizationPolicy policy;
    try
    {
        if (json.contains("mode"))
            policy.mode = modeFromString(json.at("mode").get<std::string>());
        if (json.contains("date_format"))
            policy.date_format = json.at("date_format").get<std::string>();
        if (json.contains("template"))
            policy.template_tokens = json.at("template").get<std::vector<std::string>>();
        if (json.contains("rename_base"))
            policy.rename_base = json.at("rename_base").get<std::string>();
        if (json.contains("rename_start_index"))
            policy.rename_start_index = json.at("rename_start_index").get<int>();
        if (json.contains("rename_digits"))
            policy.rename_digits = json.at("rename_digits").get<int>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::invalid_argument(std::string("Malformed organization policy: ") + e.what());
    }
    policy.validate();
    return policy;
}

OrganizationPolicy OrganizationPolicy::fromConfig(const PocoConfigManager &config)
{
    OrganizationPolicy policy;
    policy.mode = modeFromString(config.getString("organization.mode", "by-date"));
    policy.date_format = config.getString("organization.date_format", policy.date_format);
    auto tokens = config.getStringList("organization.template");
    if (!tokens.empty())
        policy.template_tokens = tokens;
    policy.rename_base = config.getString("organization.rename_base", policy.rename_base);
    policy.rename_start_index = config.getInt("organization.rename_start_index", policy.rename_start_index);
    policy.rename_digits = config.getInt("organization.rename_digits", policy.rename_digits);
    policy.validate();
    return policy;
}
