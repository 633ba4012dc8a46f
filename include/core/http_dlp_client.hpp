#pragma once

#include "core/dlp_client.hpp"
#include <httplib.h>
#include <memory>
#include <string>

/**
 * @brief DlpClient speaking the service's REST/JSON API over cpp-httplib
 *
 * The underlying connection is owned by this object and closed on destruction.
 */
class HttpDlpClient : public DlpClient
{
public:
    explicit HttpDlpClient(const DlpClientSettings &settings);
    ~HttpDlpClient() override;

    HttpDlpClient(const HttpDlpClient &) = delete;
    HttpDlpClient &operator=(const HttpDlpClient &) = delete;

    RedactContentResponse redactContent(const RedactContentRequest &request) override;

    /**
     * @brief Map a non-2xx HTTP answer to the matching DlpError and throw it
     * @param status HTTP status code
     * @param body Response body, possibly a Google API error object
     */
    [[noreturn]] static void throwForStatus(int status, const std::string &body);

private:
    DlpClientSettings settings_;
    std::unique_ptr<httplib::Client> client_;
};
