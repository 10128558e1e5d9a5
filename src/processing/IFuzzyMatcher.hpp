#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace processing
{

/**
 * @brief Fuzzy matching algorithms supported by the matcher.
 */
enum class MatchAlgorithm
{
    Ratio,          // Indel-based ratio (general purpose)
    PartialRatio,   // Partial substring matching (e.g., "plaza" matches "plaza lisboa")
    TokenSortRatio, // Order-independent token matching (e.g., "A B" matches "B A")
    TokenSetRatio,  // Set-based token matching (handles duplicates: "A A B" matches "A B")
    Levenshtein     // Normalized Levenshtein similarity
};

[[nodiscard]] std::string_view to_string(MatchAlgorithm algorithm) noexcept;
[[nodiscard]] std::optional<MatchAlgorithm> parse_match_algorithm(std::string_view name) noexcept;

/**
 * @brief Abstract interface for fuzzy string matchers over listing names.
 *
 * Inputs are expected to be cleaned names (see ListingNormalizer::cleanName); implementations
 * do not normalize again.
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Calculate similarity between two strings.
     *
     * @return Similarity score normalized to [0.0, 1.0]; 0.0 when either side is empty
     */
    virtual double similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const = 0;
};

} // namespace processing
