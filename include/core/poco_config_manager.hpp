#pragma once

#include "core/dlp_client.hpp"
#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief JSON configuration for dlp_redact, backed by Poco JSONConfiguration
 *
 * Keys are dotted paths (e.g. "dlp.endpoint"). Every getter falls back to a
 * built-in default when the key is absent.
 */
class PocoConfigManager
{
public:
    static constexpr const char *kDefaultConfigFile = "config.json";
    static constexpr const char *kConfigPathEnv = "DLP_REDACT_CONFIG";
    static constexpr const char *kAccessTokenEnv = "GOOGLE_OAUTH_ACCESS_TOKEN";

    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    bool load(const std::string &path);

    /**
     * @brief Load the configuration for this run
     *
     * An explicit path wins, then $DLP_REDACT_CONFIG, then config.json in the
     * working directory if present. Without any file the defaults apply.
     *
     * @param explicit_path Path given with -config, if any
     * @throws UsageError if an explicitly named file cannot be loaded
     */
    void loadForRun(const std::optional<std::string> &explicit_path);

    // Drop any loaded values and return to defaults
    void reset();

    nlohmann::json getAll() const;

    std::string getString(const std::string &key, const std::string &def) const;

    std::string getLogLevel() const;
    std::string getDlpEndpoint() const;
    std::string getRedactPath() const;
    std::string getAccessToken() const;
    std::string getQuotaProject() const;
    std::string getUserAgent() const;

    DlpClientSettings getClientSettings() const;

private:
    PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
