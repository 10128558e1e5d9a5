#pragma once

#include <string>

// STAYMATCH_PROFILING_LEVEL comes from CMake:
//   0 = macros compile to nothing
//   1 = scope timers written to logs/profiling.log (plog instance kProfilingLogInstance)
//   2 = level 1 plus Tracy zones and thread names

#ifndef STAYMATCH_PROFILING_LEVEL
#define STAYMATCH_PROFILING_LEVEL 0
#endif

#if STAYMATCH_PROFILING_LEVEL >= 1
#include <chrono>
#include <plog/Log.h>
#endif

#if STAYMATCH_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

namespace profiling
{

#if STAYMATCH_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

namespace detail
{

// Logs "[PROFILE] <scope> 12.345 ms" when it leaves scope
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string scope)
        : scope_(std::move(scope))
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << scope_ << " " << elapsed.count() << " ms";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string scope_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail
#endif

// Names the calling thread in Tracy; "staymatch-partition" + 2 -> "staymatch-partition-2"
inline void nameThread([[maybe_unused]] const std::string& base, [[maybe_unused]] int index = -1)
{
#if STAYMATCH_PROFILING_LEVEL >= 2
    const std::string name = index < 0 ? base : base + "-" + std::to_string(index);
    tracy::SetThreadName(name.c_str());
#endif
}

} // namespace profiling

#if STAYMATCH_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))

#elif STAYMATCH_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer profiling_scope_timer_(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer profiling_scope_timer_(nameExpr)

#else
#define PROFILE_SCOPE_FUNCTION()                                                                                     \
    ZoneScopedN(__FUNCTION__);                                                                                       \
    ::profiling::detail::ScopeTimer profiling_scope_timer_(__FUNCTION__)

#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                                               \
    const std::string profiling_scope_name_(nameExpr);                                                               \
    ZoneScoped;                                                                                                      \
    ZoneName(profiling_scope_name_.c_str(), profiling_scope_name_.size());                                           \
    ::profiling::detail::ScopeTimer profiling_scope_timer_(profiling_scope_name_)

#endif

#define PROFILE_THREAD_NAME(...) ::profiling::nameThread(__VA_ARGS__)
