#pragma once

#include <chrono>
#include <string_view>

// WORDCHEF_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Timer only (std::chrono + plog)

#ifndef WORDCHEF_PROFILING_LEVEL
#define WORDCHEF_PROFILING_LEVEL 0
#endif

#if WORDCHEF_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if WORDCHEF_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;
#endif

namespace detail
{

#if WORDCHEF_PROFILING_LEVEL >= 1
/**
 * @brief RAII scope timer for measuring and logging execution time
 *
 * Captures start time on construction and logs elapsed time on destruction.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::high_resolution_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        PLOG_DEBUG_(profiling::kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << duration.count() << " us";
    }

    // Non-copyable, non-movable
    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string_view name_;
    std::chrono::time_point<std::chrono::high_resolution_clock> start_;
};
#endif

} // namespace detail

} // namespace profiling

#if WORDCHEF_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))

#else
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)

#endif
