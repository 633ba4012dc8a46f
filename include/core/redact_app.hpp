#pragma once

#include "core/dlp_client.hpp"
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Top-level driver: parse, configure, call the service, report
 *
 * The client is obtained from the factory only after the arguments and the
 * configuration have been validated, so usage errors never reach the network.
 */
class RedactApp
{
public:
    using ClientFactory = std::function<std::unique_ptr<DlpClient>()>;

    static constexpr int kExitSuccess = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitFailure = 2;

    RedactApp(ClientFactory factory, std::ostream &out, std::ostream &err,
              const std::string &program_name = "dlp_redact")
        : factory_(std::move(factory)), out_(out), err_(err), program_name_(program_name) {}

    /**
     * @brief Run one invocation
     * @param args Arguments after the program name
     * @return Process exit code
     */
    int run(const std::vector<std::string> &args);

private:
    ClientFactory factory_;
    std::ostream &out_;
    std::ostream &err_;
    std::string program_name_;
};
