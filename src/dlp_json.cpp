#include "core/dlp_json.hpp"
#include "core/dlp_errors.hpp"
#include <Poco/Base64Decoder.h>
#include <Poco/Base64Encoder.h>
#include <Poco/Exception.h>
#include <cctype>
#include <iterator>
#include <sstream>

namespace
{
    nlohmann::json infoTypeToJson(const InfoType &info_type)
    {
        return nlohmann::json{{"name", info_type.name()}};
    }
}

nlohmann::json DlpJson::requestToJson(const RedactContentRequest &request)
{
    nlohmann::json body;

    nlohmann::json inspect_config = nlohmann::json::object();
    if (!request.inspect_config.info_types.empty())
    {
        nlohmann::json info_types = nlohmann::json::array();
        for (const auto &info_type : request.inspect_config.info_types)
        {
            info_types.push_back(infoTypeToJson(info_type));
        }
        inspect_config["infoTypes"] = info_types;
    }
    inspect_config["minLikelihood"] = Likelihoods::getName(request.inspect_config.min_likelihood);
    body["inspectConfig"] = inspect_config;

    nlohmann::json items = nlohmann::json::array();
    for (const auto &item : request.items)
    {
        items.push_back(contentItemToJson(item));
    }
    body["items"] = items;

    if (!request.replace_configs.empty())
    {
        nlohmann::json replace_configs = nlohmann::json::array();
        for (const auto &config : request.replace_configs)
        {
            nlohmann::json node;
            if (config.info_type)
            {
                node["infoType"] = infoTypeToJson(*config.info_type);
            }
            node["replaceWith"] = config.replace_with;
            replace_configs.push_back(node);
        }
        body["replaceConfigs"] = replace_configs;
    }

    if (!request.image_redaction_configs.empty())
    {
        nlohmann::json image_configs = nlohmann::json::array();
        for (const auto &config : request.image_redaction_configs)
        {
            nlohmann::json node;
            node["infoType"] = infoTypeToJson(config.info_type);
            if (config.action == ImageRedactionAction::COLOR)
            {
                node["redactionColor"] = {
                    {"red", config.redaction_color.red},
                    {"green", config.redaction_color.green},
                    {"blue", config.redaction_color.blue}};
            }
            image_configs.push_back(node);
        }
        body["imageRedactionConfigs"] = image_configs;
    }

    return body;
}

RedactContentResponse DlpJson::responseFromJson(const nlohmann::json &body)
{
    if (!body.is_object())
    {
        throw RemoteError("Malformed response: expected a JSON object");
    }

    RedactContentResponse response;
    auto it = body.find("items");
    if (it == body.end() || it->is_null())
    {
        return response;
    }
    if (!it->is_array())
    {
        throw RemoteError("Malformed response: 'items' is not an array");
    }

    for (const auto &node : *it)
    {
        response.items.push_back(contentItemFromJson(node));
    }
    return response;
}

nlohmann::json DlpJson::contentItemToJson(const ContentItem &item)
{
    return nlohmann::json{{"type", item.type}, {"data", encodeBase64(item.data)}};
}

ContentItem DlpJson::contentItemFromJson(const nlohmann::json &node)
{
    if (!node.is_object())
    {
        throw RemoteError("Malformed response: content item is not an object");
    }

    try
    {
        ContentItem item;
        item.type = node.value("type", "");
        if (node.contains("data"))
        {
            item.data = decodeBase64(node.at("data").get<std::string>());
        }
        else if (node.contains("value"))
        {
            std::string value = node.at("value").get<std::string>();
            item.data.assign(value.begin(), value.end());
        }
        return item;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw RemoteError(std::string("Malformed response content item: ") + e.what());
    }
}

std::string DlpJson::encodeBase64(const std::vector<uint8_t> &data)
{
    std::ostringstream ss;
    Poco::Base64Encoder encoder(ss);
    encoder.rdbuf()->setLineLength(0);
    encoder.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    encoder.close();
    return ss.str();
}

std::vector<uint8_t> DlpJson::decodeBase64(const std::string &encoded)
{
    std::string normalized;
    normalized.reserve(encoded.size() + 3);
    for (char c : encoded)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        if (c == '-')
            normalized.push_back('+');
        else if (c == '_')
            normalized.push_back('/');
        else
            normalized.push_back(c);
    }
    while (normalized.size() % 4 != 0)
    {
        normalized.push_back('=');
    }

    try
    {
        std::istringstream in(normalized);
        Poco::Base64Decoder decoder(in);
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(decoder)), std::istreambuf_iterator<char>());
        return data;
    }
    catch (const Poco::Exception &e)
    {
        throw RemoteError("Malformed base64 payload: " + e.displayText());
    }
}
