#include "core/poco_config_manager.hpp"
#include "core/dlp_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + e.displayText());
        return false;
    }
    Logger::debug("Configuration loaded from " + path);
    return true;
}

void PocoConfigManager::loadForRun(const std::optional<std::string> &explicit_path)
{
    if (explicit_path)
    {
        if (!load(*explicit_path))
        {
            throw UsageError("Cannot load configuration file: " + *explicit_path);
        }
        return;
    }

    const char *env_path = std::getenv(kConfigPathEnv);
    if (env_path && *env_path)
    {
        if (!load(env_path))
        {
            throw UsageError(std::string("Cannot load configuration file from ") + kConfigPathEnv + ": " + env_path);
        }
        return;
    }

    if (std::filesystem::exists(kDefaultConfigFile) && !load(kDefaultConfigFile))
    {
        Logger::warn(std::string("Ignoring unreadable ") + kDefaultConfigFile + ", using defaults");
    }
}

void PocoConfigManager::reset()
{
    cfg_ = new JSONConfiguration();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    return cfg_->getString(key, def);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "WARN");
}

std::string PocoConfigManager::getDlpEndpoint() const
{
    return getString("dlp.endpoint", "https://dlp.googleapis.com");
}

std::string PocoConfigManager::getRedactPath() const
{
    return getString("dlp.redact_path", "/v2beta1/content:redact");
}

std::string PocoConfigManager::getAccessToken() const
{
    const char *env_token = std::getenv(kAccessTokenEnv);
    if (env_token && *env_token)
    {
        return env_token;
    }
    return getString("dlp.access_token", "");
}

std::string PocoConfigManager::getQuotaProject() const
{
    return getString("dlp.quota_project", "");
}

std::string PocoConfigManager::getUserAgent() const
{
    return getString("dlp.user_agent", "dlp_redact/1.0");
}

DlpClientSettings PocoConfigManager::getClientSettings() const
{
    DlpClientSettings settings;
    settings.endpoint = getDlpEndpoint();
    settings.redact_path = getRedactPath();
    settings.access_token = getAccessToken();
    settings.quota_project = getQuotaProject();
    settings.user_agent = getUserAgent();
    return settings;
}
