#pragma once

#include "core/redaction_types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief JSON wire mapping of the RedactContent request and response
 *
 * Field names follow the proto3 JSON mapping (lowerCamelCase, bytes as
 * base64). Empty repeated fields are omitted.
 */
class DlpJson
{
public:
    static nlohmann::json requestToJson(const RedactContentRequest &request);

    /**
     * @brief Decode a RedactContent response body
     * @param body Parsed response JSON
     * @return Response with decoded item payloads
     * @throws RemoteError if the body does not have the expected shape
     */
    static RedactContentResponse responseFromJson(const nlohmann::json &body);

    static nlohmann::json contentItemToJson(const ContentItem &item);
    static ContentItem contentItemFromJson(const nlohmann::json &node);

    static std::string encodeBase64(const std::vector<uint8_t> &data);

    /**
     * @brief Decode standard or URL-safe base64, padding optional
     * @throws RemoteError on malformed input
     */
    static std::vector<uint8_t> decodeBase64(const std::string &encoded);
};
