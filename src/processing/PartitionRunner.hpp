#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iterator>
#include <thread>
#include <utility>
#include <vector>

#include "../utils/Profile.hpp"

namespace processing
{

// Number of partitions to use for item_count items. requested == 0 means hardware concurrency.
inline std::size_t resolve_worker_count(std::size_t requested, std::size_t item_count)
{
    std::size_t workers = requested;
    if (workers == 0)
        workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    return std::max<std::size_t>(1, std::min(workers, item_count));
}

// Splits [0, item_count) into contiguous ranges, runs fn(begin, end) -> std::vector<T> for each
// range on its own thread and concatenates the partial results in range order.
// Partitions share nothing; the first exception thrown by any partition is rethrown after all joined.
template<typename T, typename Fn>
std::vector<T> run_partitioned(std::size_t item_count, std::size_t requested_workers, Fn&& fn)
{
    if (item_count == 0)
        return {};

    const std::size_t workers = resolve_worker_count(requested_workers, item_count);
    if (workers == 1)
        return fn(std::size_t{0}, item_count);

    const std::size_t chunk = (item_count + workers - 1) / workers;
    std::vector<std::vector<T>> partials(workers);
    std::vector<std::exception_ptr> errors(workers);

    {
        std::vector<std::jthread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w)
        {
            const std::size_t begin = std::min(item_count, w * chunk);
            const std::size_t end = std::min(item_count, begin + chunk);
            threads.emplace_back([&, w, begin, end]() {
                PROFILE_THREAD_NAME("staymatch-partition", static_cast<int>(w));
                try
                {
                    partials[w] = fn(begin, end);
                }
                catch (...)
                {
                    errors[w] = std::current_exception();
                }
            });
        }
    } // jthreads join here

    for (auto& error : errors)
    {
        if (error)
            std::rethrow_exception(error);
    }

    std::vector<T> merged;
    std::size_t total = 0;
    for (const auto& part : partials)
        total += part.size();
    merged.reserve(total);
    for (auto& part : partials)
        std::move(part.begin(), part.end(), std::back_inserter(merged));
    return merged;
}

} // namespace processing
