#pragma once

#include <stdexcept>
#include <string>

namespace processing
{

/// Invalid tunable detected before any record is processed. Fatal for the run.
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error("configuration error: " + what)
    {
    }
};

/// No hotel carries a usable price, so the city average and every value score are undefined.
/// Fatal for the enrichment stage only; consolidated data stays available.
class InsufficientDataError : public std::runtime_error
{
public:
    explicit InsufficientDataError(const std::string& what)
        : std::runtime_error("insufficient data: " + what)
    {
    }
};

} // namespace processing
