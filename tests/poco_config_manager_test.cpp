#include "test_base.hpp"
#include "core/organization_policy.hpp"
#include "core/poco_config_manager.hpp"
#include "core/transfer_executor.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

class PocoConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        PocoConfigManager::getInstance().resetToDefaults();
    }

    void TearDown() override
    {
        PocoConfigManager::getInstance().resetToDefaults();
        TestBase::TearDown();
    }

    static bool contains(const std::vector<std::string> &values, const std::string &value)
    {
        return std::find(values.begin(), values.end(), value) != values.end();
    }
};

TEST_F(PocoConfigManagerTest, DefaultsAreValid)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_TRUE(config.validateConfig());
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getString("organization.mode"), "by-date");
    EXPECT_EQ(config.getInt("transfer.max_retries", 0), 3);
    EXPECT_EQ(config.getUInt64("transfer.chunk_size_bytes", 0), 1048576u);
    EXPECT_TRUE(config.getBool("transfer.fsync", false));
    EXPECT_EQ(config.getStringList("organization.template"),
              (std::vector<std::string>{"camera_model", "{year}-{month}"}));

    EXPECT_TRUE(contains(config.getEnabledImageExtensions(), "jpg"));
    EXPECT_TRUE(contains(config.getEnabledRawExtensions(), "cr2"));
    EXPECT_TRUE(contains(config.getEnabledVideoExtensions(), "mov"));
    EXPECT_FALSE(contains(config.getEnabledVideoExtensions(), "jpg"));
}

TEST_F(PocoConfigManagerTest, JsonFileMergesOverDefaults)
{
    std::string path = createFile(testRoot() / "config.json",
                                  R"({"log_level": "DEBUG",
                                      "destination_root": "/srv/photos",
                                      "transfer": {"max_retries": 5},
                                      "categories": {"video": {"mov": false}}})");
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getDestinationRoot(), "/srv/photos");
    EXPECT_EQ(config.getInt("transfer.max_retries", 0), 5);
    // Untouched siblings keep their defaults
    EXPECT_EQ(config.getInt("transfer.backoff_base_ms", 0), 100);
    EXPECT_FALSE(contains(config.getEnabledVideoExtensions(), "mov"));
    EXPECT_TRUE(contains(config.getEnabledVideoExtensions(), "mp4"));

    TransferOptions options = TransferOptions::fromConfig(config);
    EXPECT_EQ(options.max_retries, 5);
    EXPECT_EQ(options.backoff_base_ms, 100);
}

TEST_F(PocoConfigManagerTest, YamlFileIsConverted)
{
    std::string path = createFile(testRoot() / "config.yaml",
                                  "log_level: WARN\n"
                                  "organization:\n"
                                  "  mode: by-metadata-template\n"
                                  "  template: [camera_model, \"{year}\"]\n"
                                  "  rename_base: \"0042\"\n"
                                  "  rename_digits: 3\n"
                                  "transfer:\n"
                                  "  fsync: false\n");
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.getLogLevel(), "WARN");
    EXPECT_EQ(config.getString("organization.mode"), "by-metadata-template");
    EXPECT_EQ(config.getStringList("organization.template"), (std::vector<std::string>{"camera_model", "{year}"}));
    EXPECT_EQ(config.getString("organization.rename_base"), "0042");
    EXPECT_EQ(config.getInt("organization.rename_digits", 0), 3);
    EXPECT_FALSE(config.getBool("transfer.fsync", true));
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, BrokenFilesAreRejected)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_FALSE(config.load((testRoot() / "missing.json").string()));
    EXPECT_FALSE(config.load(createFile(testRoot() / "broken.json", "{not json")));
    EXPECT_FALSE(config.load(createFile(testRoot() / "array.json", "[1, 2]")));
    EXPECT_FALSE(config.load(createFile(testRoot() / "broken.yml", "key: [unclosed")));
    // A failed load leaves the previous values in place
    EXPECT_EQ(config.getLogLevel(), "INFO");
}

TEST_F(PocoConfigManagerTest, UpdateReplacesScalarsAndArrays)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"organization", {{"rename_digits", 6}, {"template", nlohmann::json::array({"volume_label"})}}}});

    EXPECT_EQ(config.getInt("organization.rename_digits", 0), 6);
    EXPECT_EQ(config.getStringList("organization.template"), std::vector<std::string>{"volume_label"});
    EXPECT_EQ(config.getString("organization.rename_base"), "IMG");
}

TEST_F(PocoConfigManagerTest, ValidationCatchesBadValues)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"log_level", "LOUD"}});
    EXPECT_FALSE(config.validateConfig());

    config.resetToDefaults();
    config.update({{"organization", {{"mode", "by-moon-phase"}}}});
    EXPECT_FALSE(config.validateConfig());

    config.resetToDefaults();
    config.update({{"transfer", {{"chunk_size_bytes", 0}}}});
    EXPECT_FALSE(config.validateConfig());

    config.resetToDefaults();
    config.update({{"organization", {{"rename_digits", 0}}}});
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadOrCreateWritesDefaultsOnce)
{
    auto &config = PocoConfigManager::getInstance();
    fs::path path = testRoot() / "settings" / "media_transfer.json";

    ASSERT_TRUE(config.loadOrCreate(path.string()));
    ASSERT_TRUE(fs::exists(path));

    createFile(path, R"({"log_level": "ERROR"})");
    ASSERT_TRUE(config.loadOrCreate(path.string()));
    EXPECT_EQ(config.getLogLevel(), "ERROR");
}

TEST_F(PocoConfigManagerTest, PolicyBuiltFromConfig)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"organization", {{"date_format", "YYYY-MM"}, {"rename_base", "TRIP"}}}});

    OrganizationPolicy policy = OrganizationPolicy::fromConfig(config);
    EXPECT_EQ(policy.mode, OrganizationMode::BY_DATE);
    EXPECT_EQ(policy.date_format, "YYYY-MM");
    EXPECT_EQ(policy.rename_base, "TRIP");
    EXPECT_EQ(policy.rename_digits, 4);
}
