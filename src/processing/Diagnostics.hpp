#pragma once

#include "ListingTypes.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/**
 * @brief Formatting helpers and the verbose switch for the match trace (plog instance kLogInstance).
 *
 * Per-record lines are only emitted when verbose is on; stage summaries are always written.
 *
 * Example:
 * @code
 * PLOG_INFO_(Diagnostics::kLogInstance) << "[Matcher] accept " << Diagnostics::Describe(pair);
 * // [Matcher] accept a=3 b=7 similarity=0.962 distance_m=14.1
 * @endcode
 */
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;
    static constexpr std::size_t kPreviewCodepoints = 48;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Quoted, escaped, at most kPreviewCodepoints codepoints (hotel names are often non-Latin).
    [[nodiscard]] static std::string Preview(std::string_view text);

    // A#3 "plaza" @38.7169,-9.1399
    [[nodiscard]] static std::string Describe(const listing::NormalizedListing& item);
    [[nodiscard]] static std::string Describe(const listing::CandidatePair& pair);

private:
    static std::atomic<bool> verbose_;
};

} // namespace processing
