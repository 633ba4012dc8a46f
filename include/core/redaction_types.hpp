#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Minimum confidence the service needs before it reports a match
 *
 * Ordered from most permissive to most strict.
 */
enum class Likelihood
{
    LIKELIHOOD_UNSPECIFIED,
    VERY_UNLIKELY,
    UNLIKELY,
    POSSIBLE,
    LIKELY,
    VERY_LIKELY
};

class Likelihoods
{
public:
    /**
     * @brief Get the wire name of a likelihood
     * @param likelihood The likelihood value
     * @return Name as the service spells it, e.g. "POSSIBLE"
     */
    static std::string getName(Likelihood likelihood);

    /**
     * @brief Parse a likelihood from its wire name
     * @param name Exact enum name, e.g. "VERY_LIKELY"
     * @return Likelihood value
     * @throws UsageError if the name is not a known likelihood
     */
    static Likelihood fromName(const std::string &name);

    static std::vector<std::string> getAllNames();
};

/**
 * @brief Named category of sensitive data, e.g. EMAIL_ADDRESS
 */
class InfoType
{
public:
    explicit InfoType(std::string name) : name_(std::move(name)) {}

    const std::string &name() const { return name_; }

    bool operator==(const InfoType &other) const { return name_ == other.name_; }
    bool operator!=(const InfoType &other) const { return !(*this == other); }

private:
    std::string name_;
};

struct InspectConfig
{
    std::vector<InfoType> info_types;
    Likelihood min_likelihood = Likelihood::LIKELIHOOD_UNSPECIFIED;
};

/**
 * @brief Typed payload submitted for, or returned from, redaction
 */
struct ContentItem
{
    std::string type; // MIME type
    std::vector<uint8_t> data;

    ContentItem() = default;
    ContentItem(const std::string &t, const std::vector<uint8_t> &d) : type(t), data(d) {}

    std::string dataAsString() const { return std::string(data.begin(), data.end()); }
};

// Catch-all when info_type is empty
struct ReplaceConfig
{
    std::optional<InfoType> info_type;
    std::string replace_with;
};

/**
 * @brief RGB fill colour, each channel in [0, 1]
 */
struct Color
{
    float red = 0.0f;
    float green = 0.0f;
    float blue = 0.0f;
};

enum class ImageRedactionAction
{
    CLEAR, // blank out the detected region
    COLOR  // fill the detected region with redaction_color
};

struct ImageRedactionConfig
{
    InfoType info_type;
    ImageRedactionAction action = ImageRedactionAction::CLEAR;
    Color redaction_color;

    explicit ImageRedactionConfig(const InfoType &type) : info_type(type) {}
};

struct RedactContentRequest
{
    InspectConfig inspect_config;
    std::vector<ContentItem> items;
    std::vector<ReplaceConfig> replace_configs;
    std::vector<ImageRedactionConfig> image_redaction_configs;
};

struct RedactContentResponse
{
    std::vector<ContentItem> items;
};
