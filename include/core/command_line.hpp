#pragma once

#include "core/redaction_types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief Validated request to redact a literal string
 */
struct RedactStringIntent
{
    std::string source;
    std::string replacement;
    Likelihood min_likelihood = Likelihood::LIKELIHOOD_UNSPECIFIED;
    std::vector<InfoType> info_types;
};

/**
 * @brief Validated request to redact an image file
 */
struct RedactFileIntent
{
    std::string input_path;
    std::string output_path;
    Likelihood min_likelihood = Likelihood::LIKELIHOOD_UNSPECIFIED;
    std::vector<InfoType> info_types;
};

struct HelpIntent
{
};

using RedactIntent = std::variant<RedactStringIntent, RedactFileIntent, HelpIntent>;

struct CommandLineOptions
{
    RedactIntent intent;
    std::optional<std::string> config_path;
};

/**
 * @brief Interprets the dlp_redact argument vector
 *
 * Flags are single-dash words matched exactly (-s, -f, -minLikelihood, -r,
 * -infoTypes, -o, -config). -infoTypes consumes values up to the next token
 * starting with '-'.
 */
class CommandLine
{
public:
    static constexpr const char *kDefaultReplacement = "_REDACTED_";

    /**
     * @brief Parse arguments, excluding the program name
     * @param args Arguments as passed after argv[0]
     * @return Validated options
     * @throws UsageError on unknown, missing or conflicting flags
     */
    static CommandLineOptions parse(const std::vector<std::string> &args);

    static std::string usage(const std::string &program_name);
};
