#pragma once

#include "IFuzzyMatcher.hpp"

namespace processing
{

/**
 * @brief Fuzzy string matcher backed by rapidfuzz-cpp.
 *
 * This implementation:
 * - Wraps rapidfuzz-cpp algorithms for efficient string matching
 * - Converts rapidfuzz scores (0-100) to normalized scores (0.0-1.0)
 * - Holds no state, so one instance can be shared by scoring threads
 *
 * Example:
 * @code
 * RapidfuzzMatcher matcher;
 * double score = matcher.similarity("plaza lisboa", "lisboa plaza", MatchAlgorithm::TokenSortRatio); // 1.0
 * @endcode
 */
class RapidfuzzMatcher : public IFuzzyMatcher
{
public:
    RapidfuzzMatcher() = default;
    ~RapidfuzzMatcher() override = default;

    double similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const override;

private:
    static double callRapidfuzzAlgorithm(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm);
};

} // namespace processing
