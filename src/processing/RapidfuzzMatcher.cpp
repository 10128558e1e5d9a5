#include "RapidfuzzMatcher.hpp"
#include <rapidfuzz/fuzz.hpp>
#include <rapidfuzz/distance.hpp>

namespace processing
{

std::string_view to_string(MatchAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case MatchAlgorithm::Ratio:
        return "ratio";
    case MatchAlgorithm::PartialRatio:
        return "partial_ratio";
    case MatchAlgorithm::TokenSortRatio:
        return "token_sort_ratio";
    case MatchAlgorithm::TokenSetRatio:
        return "token_set_ratio";
    case MatchAlgorithm::Levenshtein:
        return "levenshtein";
    }
    return "unknown";
}

std::optional<MatchAlgorithm> parse_match_algorithm(std::string_view name) noexcept
{
    if (name == "ratio")
        return MatchAlgorithm::Ratio;
    if (name == "partial_ratio")
        return MatchAlgorithm::PartialRatio;
    if (name == "token_sort_ratio")
        return MatchAlgorithm::TokenSortRatio;
    if (name == "token_set_ratio")
        return MatchAlgorithm::TokenSetRatio;
    if (name == "levenshtein")
        return MatchAlgorithm::Levenshtein;
    return std::nullopt;
}

double RapidfuzzMatcher::similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const
{
    if (s1.empty() || s2.empty())
    {
        return 0.0;
    }

    return callRapidfuzzAlgorithm(s1, s2, algorithm);
}

double RapidfuzzMatcher::callRapidfuzzAlgorithm(const std::string& s1, const std::string& s2,
                                                MatchAlgorithm algorithm)
{
    double rapidfuzz_score = 0.0;

    switch (algorithm)
    {
    case MatchAlgorithm::Ratio:
        rapidfuzz_score = rapidfuzz::fuzz::ratio(s1, s2);
        break;

    case MatchAlgorithm::PartialRatio:
        rapidfuzz_score = rapidfuzz::fuzz::partial_ratio(s1, s2);
        break;

    case MatchAlgorithm::TokenSortRatio:
        rapidfuzz_score = rapidfuzz::fuzz::token_sort_ratio(s1, s2);
        break;

    case MatchAlgorithm::TokenSetRatio:
        rapidfuzz_score = rapidfuzz::fuzz::token_set_ratio(s1, s2);
        break;

    case MatchAlgorithm::Levenshtein:
        // Already in [0, 1]
        return rapidfuzz::levenshtein_normalized_similarity(s1, s2);

    default:
        rapidfuzz_score = rapidfuzz::fuzz::ratio(s1, s2);
        break;
    }

    // Normalize from [0, 100] to [0.0, 1.0]
    return rapidfuzz_score / 100.0;
}

} // namespace processing
