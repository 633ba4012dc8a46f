#include "core/request_builder.hpp"

InspectConfig RequestBuilder::buildInspectConfig(Likelihood min_likelihood, const std::vector<InfoType> &info_types)
{
    InspectConfig config;
    config.info_types = info_types;
    config.min_likelihood = min_likelihood;
    return config;
}

RedactContentRequest RequestBuilder::buildStringRequest(const std::string &text,
                                                        const std::string &replacement,
                                                        Likelihood min_likelihood,
                                                        const std::vector<InfoType> &info_types)
{
    RedactContentRequest request;
    request.inspect_config = buildInspectConfig(min_likelihood, info_types);
    request.items.emplace_back("text/plain", std::vector<uint8_t>(text.begin(), text.end()));

    if (info_types.empty())
    {
        // Replace every detected span regardless of category
        request.replace_configs.push_back(ReplaceConfig{std::nullopt, replacement});
    }
    else
    {
        for (const auto &info_type : info_types)
        {
            request.replace_configs.push_back(ReplaceConfig{info_type, replacement});
        }
    }

    return request;
}

RedactContentRequest RequestBuilder::buildImageRequest(const std::string &mime_type,
                                                       const std::vector<uint8_t> &image_data,
                                                       Likelihood min_likelihood,
                                                       const std::vector<InfoType> &info_types)
{
    RedactContentRequest request;
    request.inspect_config = buildInspectConfig(min_likelihood, info_types);
    request.items.emplace_back(mime_type, image_data);

    for (const auto &info_type : info_types)
    {
        ImageRedactionConfig config(info_type);
        config.action = ImageRedactionAction::CLEAR;
        request.image_redaction_configs.push_back(config);
    }

    return request;
}
