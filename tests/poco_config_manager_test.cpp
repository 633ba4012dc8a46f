#include <gtest/gtest.h>
#include "core/dlp_errors.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>

class PocoConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");

        unsetenv(PocoConfigManager::kAccessTokenEnv);
        unsetenv(PocoConfigManager::kConfigPathEnv);
        PocoConfigManager::getInstance().reset();

        test_config_path_ = "test_config.json";
        createTestConfig();
    }

    void TearDown() override
    {
        if (std::filesystem::exists(test_config_path_))
        {
            std::filesystem::remove(test_config_path_);
        }
        unsetenv(PocoConfigManager::kAccessTokenEnv);
        unsetenv(PocoConfigManager::kConfigPathEnv);
        PocoConfigManager::getInstance().reset();
        Logger::init("WARN");
    }

    void createTestConfig()
    {
        std::ofstream config_file(test_config_path_);
        config_file << R"({
            "log_level": "DEBUG",
            "dlp": {
                "endpoint": "http://localhost:8080",
                "redact_path": "/v2/content:redact",
                "access_token": "file-token",
                "quota_project": "my-project",
                "user_agent": "dlp_redact_test/0.1"
            }
        })";
        config_file.close();
    }

    std::string test_config_path_;
};

TEST_F(PocoConfigManagerTest, DefaultsWithoutFile)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_EQ(config.getLogLevel(), "WARN");
    EXPECT_EQ(config.getDlpEndpoint(), "https://dlp.googleapis.com");
    EXPECT_EQ(config.getRedactPath(), "/v2beta1/content:redact");
    EXPECT_EQ(config.getAccessToken(), "");
    EXPECT_EQ(config.getQuotaProject(), "");
    EXPECT_EQ(config.getUserAgent(), "dlp_redact/1.0");
}

TEST_F(PocoConfigManagerTest, LoadsValuesFromFile)
{
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(test_config_path_));

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    auto settings = config.getClientSettings();
    EXPECT_EQ(settings.endpoint, "http://localhost:8080");
    EXPECT_EQ(settings.redact_path, "/v2/content:redact");
    EXPECT_EQ(settings.access_token, "file-token");
    EXPECT_EQ(settings.quota_project, "my-project");
    EXPECT_EQ(settings.user_agent, "dlp_redact_test/0.1");

    auto all = config.getAll();
    EXPECT_EQ(all["dlp"]["endpoint"], "http://localhost:8080");
}

TEST_F(PocoConfigManagerTest, EnvironmentTokenOverridesFile)
{
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(test_config_path_));

    setenv(PocoConfigManager::kAccessTokenEnv, "env-token", 1);
    EXPECT_EQ(config.getAccessToken(), "env-token");
}

TEST_F(PocoConfigManagerTest, LoadForRunPrefersExplicitPath)
{
    auto &config = PocoConfigManager::getInstance();
    config.loadForRun(test_config_path_);
    EXPECT_EQ(config.getDlpEndpoint(), "http://localhost:8080");
}

TEST_F(PocoConfigManagerTest, LoadForRunUsesEnvironmentPath)
{
    setenv(PocoConfigManager::kConfigPathEnv, test_config_path_.c_str(), 1);

    auto &config = PocoConfigManager::getInstance();
    config.loadForRun(std::nullopt);
    EXPECT_EQ(config.getQuotaProject(), "my-project");
}

TEST_F(PocoConfigManagerTest, MissingExplicitFileIsUsageError)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_THROW(config.loadForRun(std::string("does_not_exist.json")), UsageError);
}

TEST_F(PocoConfigManagerTest, MalformedFileIsRejected)
{
    std::ofstream broken("broken_config.json");
    broken << "{ not json";
    broken.close();

    auto &config = PocoConfigManager::getInstance();
    EXPECT_FALSE(config.load("broken_config.json"));
    EXPECT_THROW(config.loadForRun(std::string("broken_config.json")), UsageError);
    EXPECT_EQ(config.getDlpEndpoint(), "https://dlp.googleapis.com");

    std::filesystem::remove("broken_config.json");
}

TEST_F(PocoConfigManagerTest, ResetRestoresDefaults)
{
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(test_config_path_));
    config.reset();
    EXPECT_EQ(config.getDlpEndpoint(), "https://dlp.googleapis.com");
}
