#include "core/redaction_types.hpp"
#include "core/dlp_errors.hpp"

std::string Likelihoods::getName(Likelihood likelihood)
{
    switch (likelihood)
    {
    case Likelihood::LIKELIHOOD_UNSPECIFIED:
        return "LIKELIHOOD_UNSPECIFIED";
    case Likelihood::VERY_UNLIKELY:
        return "VERY_UNLIKELY";
    case Likelihood::UNLIKELY:
        return "UNLIKELY";
    case Likelihood::POSSIBLE:
        return "POSSIBLE";
    case Likelihood::LIKELY:
        return "LIKELY";
    case Likelihood::VERY_LIKELY:
        return "VERY_LIKELY";
    default:
        return "LIKELIHOOD_UNSPECIFIED";
    }
}

Likelihood Likelihoods::fromName(const std::string &name)
{
    if (name == "LIKELIHOOD_UNSPECIFIED")
        return Likelihood::LIKELIHOOD_UNSPECIFIED;
    else if (name == "VERY_UNLIKELY")
        return Likelihood::VERY_UNLIKELY;
    else if (name == "UNLIKELY")
        return Likelihood::UNLIKELY;
    else if (name == "POSSIBLE")
        return Likelihood::POSSIBLE;
    else if (name == "LIKELY")
        return Likelihood::LIKELY;
    else if (name == "VERY_LIKELY")
        return Likelihood::VERY_LIKELY;

    throw UsageError("Unknown likelihood: " + name);
}

std::vector<std::string> Likelihoods::getAllNames()
{
    return {"LIKELIHOOD_UNSPECIFIED", "VERY_UNLIKELY", "UNLIKELY", "POSSIBLE", "LIKELY", "VERY_LIKELY"};
}
