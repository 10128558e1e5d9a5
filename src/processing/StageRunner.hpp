#pragma once

#include "Diagnostics.hpp"
#include "ListingTypes.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <plog/Log.h>

#include "../utils/Profile.hpp"

namespace processing
{

namespace detail
{

// Record count of a stage payload: containers report size(), pairs of containers the sum
template<typename T>
std::optional<std::size_t> stage_items(const T& payload)
{
    if constexpr (requires { payload.size(); })
        return payload.size();
    else if constexpr (requires { payload.first.size(); payload.second.size(); })
        return payload.first.size() + payload.second.size();
    else
        return std::nullopt;
}

} // namespace detail

// Runs one pipeline stage, timing it and turning an exception into a failed listing::StageResult.
// The match trace always gets one summary line per stage.
template<typename T, typename Fn>
listing::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    const auto start = steady_clock::now();
    try
    {
        T payload = fn();
        const auto elapsed = duration_cast<microseconds>(steady_clock::now() - start);

        std::string items;
        if (auto count = detail::stage_items(payload))
            items = ", " + std::to_string(*count) + " records";
        PLOG_INFO_(Diagnostics::kLogInstance) << "[Pipeline] stage '" << stage_name << "' done in " << elapsed.count()
                                              << "us" << items;
        return listing::StageResult<T>::success(std::move(payload), elapsed, stage_name);
    }
    catch (const std::exception& ex)
    {
        const auto elapsed = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "[Pipeline] stage '" << stage_name << "' failed after "
                                               << elapsed.count() << "us: " << ex.what();
        return listing::StageResult<T>::failure(ex.what(), std::current_exception(), elapsed, stage_name);
    }
}

} // namespace processing
