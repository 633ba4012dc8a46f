#include "core/redact_app.hpp"
#include "core/command_line.hpp"
#include "core/dlp_errors.hpp"
#include "core/poco_config_manager.hpp"
#include "core/redact_command.hpp"
#include "logging/logger.hpp"
#include <type_traits>
#include <variant>

int RedactApp::run(const std::vector<std::string> &args)
{
    CommandLineOptions options;
    try
    {
        options = CommandLine::parse(args);
        if (std::holds_alternative<HelpIntent>(options.intent))
        {
            out_ << CommandLine::usage(program_name_);
            return kExitSuccess;
        }

        auto &config = PocoConfigManager::getInstance();
        config.loadForRun(options.config_path);
        Logger::init(config.getLogLevel());
    }
    catch (const UsageError &e)
    {
        err_ << e.what() << std::endl;
        err_ << CommandLine::usage(program_name_);
        return kExitUsage;
    }

    try
    {
        std::unique_ptr<DlpClient> client = factory_();
        RedactCommand command(*client, out_);

        std::visit(
            [&command](const auto &intent)
            {
                using T = std::decay_t<decltype(intent)>;
                if constexpr (std::is_same_v<T, RedactStringIntent>)
                    command.redactString(intent);
                else if constexpr (std::is_same_v<T, RedactFileIntent>)
                    command.redactFile(intent);
            },
            options.intent);
    }
    catch (const DlpError &e)
    {
        Logger::error(e.what());
        err_ << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }

    return kExitSuccess;
}
