#pragma once

#include "core/redaction_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Assembles RedactContent requests. No I/O.
 */
class RequestBuilder
{
public:
    /**
     * @brief Build a text redaction request
     *
     * With no info types a single catch-all ReplaceConfig is produced,
     * otherwise one ReplaceConfig per info type, all sharing the replacement.
     */
    static RedactContentRequest buildStringRequest(const std::string &text,
                                                   const std::string &replacement,
                                                   Likelihood min_likelihood,
                                                   const std::vector<InfoType> &info_types);

    /**
     * @brief Build an image redaction request
     *
     * One CLEAR ImageRedactionConfig per info type.
     */
    static RedactContentRequest buildImageRequest(const std::string &mime_type,
                                                  const std::vector<uint8_t> &image_data,
                                                  Likelihood min_likelihood,
                                                  const std::vector<InfoType> &info_types);

    static InspectConfig buildInspectConfig(Likelihood min_likelihood, const std::vector<InfoType> &info_types);
};
