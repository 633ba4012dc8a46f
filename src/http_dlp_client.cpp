#include "core/http_dlp_client.hpp"
#include "core/dlp_errors.hpp"
#include "core/dlp_json.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

HttpDlpClient::HttpDlpClient(const DlpClientSettings &settings)
    : settings_(settings)
{
    try
    {
        client_ = std::make_unique<httplib::Client>(settings.endpoint);
    }
    catch (const std::invalid_argument &e)
    {
        throw TransportError("Invalid DLP endpoint: " + settings.endpoint + " (" + e.what() + ")");
    }

    if (!client_->is_valid())
    {
        throw TransportError("Invalid DLP endpoint: " + settings.endpoint);
    }
}

HttpDlpClient::~HttpDlpClient()
{
    if (client_)
    {
        client_->stop();
    }
}

RedactContentResponse HttpDlpClient::redactContent(const RedactContentRequest &request)
{
    if (settings_.access_token.empty())
    {
        throw AuthenticationError("No access token configured; set GOOGLE_OAUTH_ACCESS_TOKEN or dlp.access_token");
    }

    httplib::Headers headers = {
        {"Authorization", "Bearer " + settings_.access_token},
        {"User-Agent", settings_.user_agent}};
    if (!settings_.quota_project.empty())
    {
        headers.emplace("x-goog-user-project", settings_.quota_project);
    }

    std::string body = DlpJson::requestToJson(request).dump();
    Logger::debug("POST " + settings_.endpoint + settings_.redact_path + " (" + std::to_string(body.size()) + " bytes)");

    auto res = client_->Post(settings_.redact_path, headers, body, "application/json");
    if (!res)
    {
        throw TransportError("Failed to reach " + settings_.endpoint + ": " + httplib::to_string(res.error()));
    }

    Logger::debug("DLP service answered with HTTP " + std::to_string(res->status));
    if (res->status < 200 || res->status >= 300)
    {
        throwForStatus(res->status, res->body);
    }

    nlohmann::json parsed = nlohmann::json::parse(res->body, nullptr, false);
    if (parsed.is_discarded())
    {
        throw RemoteError("Malformed response: body is not valid JSON", res->status);
    }
    return DlpJson::responseFromJson(parsed);
}

void HttpDlpClient::throwForStatus(int status, const std::string &body)
{
    std::string message = "HTTP " + std::to_string(status);
    std::string service_status;

    // Google APIs answer with {"error": {"code": .., "message": .., "status": ..}}
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error") && parsed["error"].is_object())
    {
        const auto &error = parsed["error"];
        if (error.contains("status") && error["status"].is_string())
        {
            service_status = error["status"].get<std::string>();
            message += " " + service_status;
        }
        if (error.contains("message") && error["message"].is_string())
        {
            message += ": " + error["message"].get<std::string>();
        }
    }

    if (status == 401 || status == 403)
    {
        throw AuthenticationError("DLP service rejected credentials: " + message);
    }
    throw RemoteError("DLP service rejected request: " + message, status, service_status);
}
