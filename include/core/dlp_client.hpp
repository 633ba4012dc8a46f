#pragma once

#include "core/redaction_types.hpp"
#include <string>

// Connection and credential settings for a DlpClient
struct DlpClientSettings
{
    std::string endpoint = "https://dlp.googleapis.com";
    std::string redact_path = "/v2beta1/content:redact";
    std::string access_token;
    std::string quota_project;
    std::string user_agent = "dlp_redact/1.0";
};

/**
 * @brief Narrow interface to the remote inspection/redaction service
 *
 * One synchronous call per request. Implementations throw a DlpError
 * subclass on any failure and never return a partial response.
 */
class DlpClient
{
public:
    virtual ~DlpClient() = default;
    virtual RedactContentResponse redactContent(const RedactContentRequest &request) = 0;
};
