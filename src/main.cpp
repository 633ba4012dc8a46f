#include "core/redact_app.hpp"
#include "core/http_dlp_client.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    // Settings are read when the client is created, after -config has been applied
    RedactApp app(
        []()
        {
            auto settings = PocoConfigManager::getInstance().getClientSettings();
            Logger::debug("Using DLP endpoint " + settings.endpoint + settings.redact_path);
            return std::unique_ptr<DlpClient>(std::make_unique<HttpDlpClient>(settings));
        },
        std::cout, std::cerr, argc > 0 ? argv[0] : "dlp_redact");

    try
    {
        return app.run(args);
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return RedactApp::kExitFailure;
    }
}
