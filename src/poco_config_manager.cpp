#include "core/poco_config_manager.hpp"
#include "core/organization_policy.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    std::vector<std::string> split(const std::string &str, char delimiter)
    {
        std::vector<std::string> tokens;
        std::stringstream ss(str);
        std::string token;
        while (std::getline(ss, token, delimiter))
        {
            tokens.push_back(token);
        }
        return tokens;
    }

    nlohmann::json extensionMap(const std::vector<std::string> &extensions)
    {
        nlohmann::json map = nlohmann::json::object();
        for (const auto &ext : extensions)
            map[ext] = true;
        return map;
    }

    nlohmann::json yamlToJson(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json object = nlohmann::json::object();
            for (const auto &kv : node)
                object[kv.first.as<std::string>()] = yamlToJson(kv.second);
            return object;
        }
        case YAML::NodeType::Sequence:
        {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &item : node)
                array.push_back(yamlToJson(item));
            return array;
        }
        case YAML::NodeType::Scalar:
        {
            const std::string &text = node.Scalar();
            // Quoted scalars carry the "!" tag and stay strings
            if (node.Tag() == "!")
                return text;
            if (text == "true" || text == "True" || text == "yes")
                return true;
            if (text == "false" || text == "False" || text == "no")
                return false;
            if (!text.empty() && (std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-'))
            {
                size_t used = 0;
                try
                {
                    long long value = std::stoll(text, &used);
                    if (used == text.size())
                        return value;
                    double real = std::stod(text, &used);
                    if (used == text.size())
                        return real;
                }
                catch (const std::logic_error &)
                {
                    // Not a number, keep the text
                }
            }
            return text;
        }
        default:
            return nullptr;
        }
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    loadJsonDocument(defaultConfig());
}

nlohmann::json PocoConfigManager::defaultConfig()
{
    const char *home = std::getenv("HOME");
    std::string destination = (home && *home) ? std::string(home) + "/Pictures/Imported" : "Imported";

    nlohmann::json config;
    config["log_level"] = "INFO";
    config["logging"] = {{"file", ""}, {"max_size_mb", 10}, {"max_files", 3}};
    config["destination_root"] = destination;

    config["organization"] = {
        {"mode", "by-date"},
        {"date_format", "YYYY/MM/DD"},
        {"template", {"camera_model", "{year}-{month}"}},
        {"rename_base", "IMG"},
        {"rename_start_index", 1},
        {"rename_digits", 4}};

    config["transfer"] = {
        {"chunk_size_bytes", 1048576},
        {"max_retries", 3},
        {"backoff_base_ms", 100},
        {"max_backoff_ms", 2000},
        {"stall_timeout_ms", 30000},
        {"fsync", true}};

    config["catalog"] = {
        {"follow_symlinks", false},
        {"extract_capture_time", true},
        {"checksum_threads", 4}};

    config["watcher"] = {{"poll_interval_ms", 1000}};

    // File type categories
    config["categories"]["images"] = extensionMap({"jpg", "jpeg", "jpe", "jfif", "png", "gif", "bmp", "tif", "tiff",
                                                   "webp", "heic", "heif", "psd", "ai", "eps", "svg", "ico",
                                                   "ppm", "pgm", "pbm", "pnm", "hdr", "exr",
                                                   "raw", "cr2", "cr3", "nef", "nrw", "arw", "srw", "dng",
                                                   "orf", "sr2", "pef", "raf", "x3f", "rw2"});
    config["categories"]["raw"] = extensionMap({"raw", "cr2", "cr3", "nef", "nrw", "arw", "srw", "dng",
                                                "orf", "sr2", "pef", "raf", "x3f", "rw2"});
    config["categories"]["video"] = extensionMap({"mp4", "mov", "avi", "mkv", "mpg", "mpeg", "3gp", "wmv", "flv",
                                                  "webm", "m4v", "vob", "ogv", "mts", "m2ts", "ts", "mxf",
                                                  "rm", "rmvb", "asf", "divx", "xvid", "h264", "h265", "hevc",
                                                  "m2v", "f4v", "insv", "lrv"});
    return config;
}

void PocoConfigManager::loadJsonDocument(const nlohmann::json &document)
{
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    std::istringstream in(document.dump());
    tmp->load(in);
    cfg_ = tmp;
}

bool PocoConfigManager::readYamlFile(const std::string &path, nlohmann::json &out)
{
    try
    {
        YAML::Node root = YAML::LoadFile(path);
        out = yamlToJson(root);
        return out.is_object();
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Failed to parse YAML config " + path + ": " + e.what());
        return false;
    }
}

bool PocoConfigManager::load(const std::string &path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    nlohmann::json file_config;
    if (ext == ".yaml" || ext == ".yml")
    {
        if (!readYamlFile(path, file_config))
            return false;
        Logger::info("Migrating YAML configuration into JSON settings: " + path);
    }
    else
    {
        std::ifstream in(path);
        if (!in.good())
            return false;
        try
        {
            in >> file_config;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            Logger::error("Failed to parse config " + path + ": " + e.what());
            return false;
        }
        if (!file_config.is_object())
        {
            Logger::error("Config root must be an object: " + path);
            return false;
        }
    }

    nlohmann::json merged = defaultConfig();
    merged.merge_patch(file_config);

    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        loadJsonDocument(merged);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to load config " + path + ": " + e.displayText());
        return false;
    }
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

bool PocoConfigManager::loadOrCreate(const std::string &path)
{
    std::error_code ec;
    if (std::filesystem::exists(path, ec))
        return load(path);

    Logger::info("Configuration file not found, creating default " + path);
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    if (!save(path))
    {
        Logger::warn("Could not write default configuration to " + path);
        return false;
    }
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten scalars into dotted keys; arrays replace the whole value
    bool has_arrays = false;
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (node.is_array())
        {
            has_arrays = true;
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_unsigned())
                cfg_->setUInt64(prefix, node.get<uint64_t>());
            else if (node.is_number_integer())
                cfg_->setInt64(prefix, node.get<int64_t>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
        }
    };
    apply("", patch);

    if (has_arrays)
    {
        std::stringstream ss;
        cfg_->save(ss);
        auto current = nlohmann::json::parse(ss.str());
        current.merge_patch(patch);
        loadJsonDocument(current);
    }
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config value " + key + " is not an integer, using " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config value " + key + " is not a boolean, using default");
        return def;
    }
}

uint64_t PocoConfigManager::getUInt64(const std::string &key, uint64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return static_cast<uint64_t>(cfg_->getUInt64(key, def));
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config value " + key + " is not an unsigned integer, using " + std::to_string(def));
        return def;
    }
}

std::vector<std::string> PocoConfigManager::getStringList(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> values;
    for (size_t i = 0;; ++i)
    {
        std::string item_key = key + "[" + std::to_string(i) + "]";
        if (!cfg_->has(item_key))
            break;
        values.push_back(cfg_->getString(item_key));
    }
    return values;
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getLogFile() const
{
    return getString("logging.file", "");
}

int PocoConfigManager::getLogMaxSizeMB() const
{
    return getInt("logging.max_size_mb", 10);
}

int PocoConfigManager::getLogMaxFiles() const
{
    return getInt("logging.max_files", 3);
}

std::string PocoConfigManager::getDestinationRoot() const
{
    return getString("destination_root", defaultConfig()["destination_root"].get<std::string>());
}

int PocoConfigManager::getWatcherPollIntervalMs() const
{
    return getInt("watcher.poll_interval_ms", 1000);
}

std::vector<std::string> PocoConfigManager::getEnabledImageExtensions() const
{
    return getEnabledExtensionsForCategory("images");
}

std::vector<std::string> PocoConfigManager::getEnabledVideoExtensions() const
{
    return getEnabledExtensionsForCategory("video");
}

std::vector<std::string> PocoConfigManager::getEnabledRawExtensions() const
{
    return getEnabledExtensionsForCategory("raw");
}

std::vector<std::string> PocoConfigManager::getEnabledExtensionsForCategory(const std::string &category) const
{
    std::vector<std::string> enabled_extensions;
    auto category_config = getNestedConfig("categories." + category);
    for (auto it = category_config.begin(); it != category_config.end(); ++it)
    {
        if (it.value().is_boolean() && it.value().get<bool>())
        {
            std::string ext = it.key();
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
            if (!ext.empty() && ext[0] == '.')
                ext = ext.substr(1);
            enabled_extensions.push_back(ext);
        }
    }
    return enabled_extensions;
}

nlohmann::json PocoConfigManager::getNestedConfig(const std::string &prefix) const
{
    nlohmann::json current = getAll();
    for (const auto &key : split(prefix, '.'))
    {
        if (current.contains(key) && current[key].is_object())
        {
            current = current[key];
        }
        else
        {
            return nlohmann::json::object();
        }
    }
    return current;
}

bool PocoConfigManager::validateConfig() const
{
    std::vector<std::string> required_fields = {
        "log_level", "destination_root", "organization.mode", "organization.rename_digits",
        "transfer.chunk_size_bytes", "transfer.max_retries"};

    for (const auto &field : required_fields)
    {
        if (!hasKey(field))
        {
            Logger::error("Missing required config field: " + field);
            return false;
        }
    }

    if (!Logger::isValidLevel(getLogLevel()))
    {
        Logger::error("Invalid log level: " + getLogLevel());
        return false;
    }

    if (getDestinationRoot().empty())
    {
        Logger::error("destination_root must not be empty");
        return false;
    }

    std::string mode = getString("organization.mode");
    if (mode != "by-date" && mode != "by-metadata-template")
    {
        Logger::error("Invalid organization mode: " + mode);
        return false;
    }

    if (mode == "by-date" && getString("organization.date_format").empty())
    {
        Logger::error("organization.date_format must not be empty in by-date mode");
        return false;
    }

    int digits = getInt("organization.rename_digits", 4);
    if (digits < 1 || digits > 12)
    {
        Logger::error("Invalid rename digits: " + std::to_string(digits));
        return false;
    }

    int start_index = getInt("organization.rename_start_index", 1);
    if (start_index < 0 || start_index > OrganizationPolicy::kMaxRenameStartIndex)
    {
        Logger::error("Invalid organization.rename_start_index: " + std::to_string(start_index));
        return false;
    }

    if (getUInt64("transfer.chunk_size_bytes", 0) == 0)
    {
        Logger::error("transfer.chunk_size_bytes must be positive");
        return false;
    }

    if (getInt("transfer.max_retries", 3) < 0 || getInt("transfer.backoff_base_ms", 100) < 0 ||
        getInt("transfer.max_backoff_ms", 2000) < 0)
    {
        Logger::error("Retry settings must not be negative");
        return false;
    }

    if (getInt("catalog.checksum_threads", 4) <= 0)
    {
        Logger::error("catalog.checksum_threads must be positive");
        return false;
    }

    return true;
}

void PocoConfigManager::resetToDefaults()
{
    std::lock_guard<std::mutex> lock(mutex_);
    loadJsonDocument(defaultConfig());
}
