#include "core/command_line.hpp"
#include "core/dlp_errors.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <sstream>

namespace
{
    const std::vector<std::string> kKnownFlags = {
        "-s", "--string",
        "-f", "--file",
        "-minLikelihood",
        "-r", "--replace",
        "-infoTypes",
        "-o", "--outputFilePath",
        "-config",
        "-h", "--help"};

    bool isKnownFlag(const std::string &token)
    {
        return std::find(kKnownFlags.begin(), kKnownFlags.end(), token) != kKnownFlags.end();
    }

    // Single-valued flags may take a value that starts with '-', as long as it is not itself a flag
    std::string takeValue(const std::vector<std::string> &args, size_t &i, const std::string &flag)
    {
        if (i + 1 >= args.size() || isKnownFlag(args[i + 1]))
        {
            throw UsageError("Missing argument for option: " + flag);
        }
        return args[++i];
    }

    // Values that end up as JSON strings on the wire must be valid UTF-8
    void requireUtf8(const std::string &value, const std::string &flag)
    {
        try
        {
            nlohmann::json(value).dump();
        }
        catch (const nlohmann::json::type_error &e)
        {
            throw UsageError("Value for option " + flag + " is not valid UTF-8 (" + e.what() + ")");
        }
    }

    void setOnce(std::optional<std::string> &slot, const std::string &value, const std::string &flag)
    {
        if (slot)
        {
            throw UsageError("Option " + flag + " specified more than once");
        }
        slot = value;
    }
}

CommandLineOptions CommandLine::parse(const std::vector<std::string> &args)
{
    std::optional<std::string> source;
    std::optional<std::string> input_path;
    std::optional<std::string> min_likelihood;
    std::optional<std::string> replacement;
    std::optional<std::string> output_path;
    std::optional<std::string> config_path;
    std::vector<InfoType> info_types;

    for (size_t i = 0; i < args.size(); i++)
    {
        const std::string &arg = args[i];
        if (arg == "-h" || arg == "--help")
        {
            return CommandLineOptions{HelpIntent{}, std::nullopt};
        }
        else if (arg == "-s" || arg == "--string")
        {
            std::string value = takeValue(args, i, arg);
            if (input_path)
            {
                throw UsageError("Options -s and -f are mutually exclusive");
            }
            setOnce(source, value, "-s");
        }
        else if (arg == "-f" || arg == "--file")
        {
            std::string value = takeValue(args, i, arg);
            if (source)
            {
                throw UsageError("Options -s and -f are mutually exclusive");
            }
            setOnce(input_path, value, "-f");
        }
        else if (arg == "-minLikelihood")
        {
            setOnce(min_likelihood, takeValue(args, i, arg), arg);
        }
        else if (arg == "-r" || arg == "--replace")
        {
            std::string value = takeValue(args, i, arg);
            requireUtf8(value, "-r");
            setOnce(replacement, value, "-r");
        }
        else if (arg == "-o" || arg == "--outputFilePath")
        {
            setOnce(output_path, takeValue(args, i, arg), "-o");
        }
        else if (arg == "-config")
        {
            setOnce(config_path, takeValue(args, i, arg), arg);
        }
        else if (arg == "-infoTypes")
        {
            while (i + 1 < args.size() && (args[i + 1].empty() || args[i + 1][0] != '-'))
            {
                if (args[i + 1].empty())
                {
                    throw UsageError("Empty info type name");
                }
                requireUtf8(args[i + 1], arg);
                info_types.emplace_back(args[++i]);
            }
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw UsageError("Unrecognized option: " + arg);
        }
        else
        {
            throw UsageError("Unexpected argument: " + arg);
        }
    }

    if (!source && !input_path)
    {
        throw UsageError("Missing required option: one of -s or -f");
    }

    Likelihood likelihood = Likelihood::LIKELIHOOD_UNSPECIFIED;
    if (min_likelihood)
    {
        likelihood = Likelihoods::fromName(*min_likelihood);
    }

    CommandLineOptions options;
    options.config_path = config_path;

    if (source)
    {
        RedactStringIntent intent;
        intent.source = *source;
        intent.replacement = replacement.value_or(kDefaultReplacement);
        intent.min_likelihood = likelihood;
        intent.info_types = info_types;
        options.intent = intent;
    }
    else
    {
        if (!output_path)
        {
            throw UsageError("Option -o is required when redacting a file");
        }
        RedactFileIntent intent;
        intent.input_path = *input_path;
        intent.output_path = *output_path;
        intent.min_likelihood = likelihood;
        intent.info_types = info_types;
        options.intent = intent;
    }

    return options;
}

std::string CommandLine::usage(const std::string &program_name)
{
    std::ostringstream ss;
    ss << "Usage: " << program_name << " (-s <text> | -f <path> -o <path>) [options]" << std::endl;
    ss << "Redact sensitive data from a string or an image using the DLP service." << std::endl;
    ss << "Options:" << std::endl;
    ss << "  -s, --string <text>              Redact a literal string" << std::endl;
    ss << "  -f, --file <path>                Redact an image file" << std::endl;
    ss << "  -o, --outputFilePath <path>      Where to write the redacted image" << std::endl;
    ss << "  -r, --replace <text>             Replacement text (default: " << kDefaultReplacement << ")" << std::endl;
    ss << "  -infoTypes <name> [<name>...]    Info types to redact (default: all detected)" << std::endl;
    ss << "  -minLikelihood <name>            Minimum likelihood, one of:" << std::endl;
    for (const auto &name : Likelihoods::getAllNames())
    {
        ss << "                                     " << name << std::endl;
    }
    ss << "  -config <path>                   Configuration file" << std::endl;
    ss << "  -h, --help                       Show this help message" << std::endl;
    return ss.str();
}
