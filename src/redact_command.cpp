#include "core/redact_command.hpp"
#include "core/dlp_errors.hpp"
#include "core/file_utils.hpp"
#include "core/request_builder.hpp"
#include "logging/logger.hpp"

void RedactCommand::redactString(const RedactStringIntent &intent)
{
    RedactContentRequest request = RequestBuilder::buildStringRequest(
        intent.source, intent.replacement, intent.min_likelihood, intent.info_types);
    Logger::debug("Redacting string with " + std::to_string(request.replace_configs.size()) +
                  " replace config(s), min likelihood " + Likelihoods::getName(intent.min_likelihood));

    RedactContentResponse response = client_.redactContent(request);
    if (response.items.empty())
    {
        throw RemoteError("Expected a redacted item, got none");
    }

    for (const auto &item : response.items)
    {
        out_ << item.dataAsString() << std::endl;
    }
    if (!out_.good())
    {
        throw IoError("Failed to write redacted text to standard output");
    }
}

void RedactCommand::redactFile(const RedactFileIntent &intent)
{
    std::vector<uint8_t> data = FileUtils::readBinaryFile(intent.input_path);
    std::string mime_type = FileUtils::guessMimeType(intent.input_path);

    RedactContentRequest request = RequestBuilder::buildImageRequest(
        mime_type, data, intent.min_likelihood, intent.info_types);
    Logger::debug("Redacting " + intent.input_path + " (" + mime_type + ") with " +
                  std::to_string(request.image_redaction_configs.size()) + " image redaction config(s)");

    RedactContentResponse response = client_.redactContent(request);

    if (response.items.size() != 1)
    {
        throw RemoteError("Expected exactly one redacted item, got " + std::to_string(response.items.size()));
    }

    FileUtils::writeBinaryFile(intent.output_path, response.items.front().data);
    Logger::info("Redacted image written to " + intent.output_path);
}
