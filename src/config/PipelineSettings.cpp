#include "PipelineSettings.hpp"
#include "ConfigManager.hpp"
#include "../processing/PipelineErrors.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace config
{

namespace
{

using processing::ConfigurationError;

std::string qualified(std::string_view section, std::string_view key)
{
    return std::string(section) + "." + std::string(key);
}

std::optional<double> readNumber(const toml::table& t, std::string_view section, std::string_view key)
{
    const toml::node* node = t.get(key);
    if (!node)
        return std::nullopt;
    if (auto v = node->value<double>(); v && node->is_number())
        return *v;
    throw ConfigurationError(qualified(section, key) + " must be a number");
}

std::optional<std::int64_t> readInteger(const toml::table& t, std::string_view section, std::string_view key)
{
    const toml::node* node = t.get(key);
    if (!node)
        return std::nullopt;
    if (auto v = node->value<std::int64_t>(); v && node->is_integer())
        return *v;
    throw ConfigurationError(qualified(section, key) + " must be an integer");
}

std::optional<std::size_t> readCount(const toml::table& t, std::string_view section, std::string_view key)
{
    auto value = readInteger(t, section, key);
    if (!value)
        return std::nullopt;
    if (*value < 0)
        throw ConfigurationError(qualified(section, key) + " must not be negative");
    return static_cast<std::size_t>(*value);
}

std::optional<std::string> readString(const toml::table& t, std::string_view section, std::string_view key)
{
    const toml::node* node = t.get(key);
    if (!node)
        return std::nullopt;
    if (auto v = node->value<std::string>())
        return *v;
    throw ConfigurationError(qualified(section, key) + " must be a string");
}

const toml::array* readArray(const toml::table& t, std::string_view section, std::string_view key)
{
    const toml::node* node = t.get(key);
    if (!node)
        return nullptr;
    if (const auto* arr = node->as_array())
        return arr;
    throw ConfigurationError(qualified(section, key) + " must be an array");
}

template<typename T, std::size_t N>
std::optional<std::array<T, N>> readFixedArray(const toml::table& t, std::string_view section, std::string_view key)
{
    const toml::array* arr = readArray(t, section, key);
    if (!arr)
        return std::nullopt;
    if (arr->size() != N)
        throw ConfigurationError(qualified(section, key) + " must have exactly " + std::to_string(N) + " elements");

    std::array<T, N> out{};
    for (std::size_t i = 0; i < N; ++i)
    {
        const toml::node& element = *arr->get(i);
        bool ok = std::is_integral_v<T> ? element.is_integer() : element.is_number();
        auto v = element.value<T>();
        if (!ok || !v)
            throw ConfigurationError(qualified(section, key) + " contains a non-numeric element");
        out[i] = *v;
    }
    return out;
}

void loadPipelineTable(const toml::table& t, processing::PipelineConfig& cfg)
{
    if (auto v = readCount(t, "pipeline", "worker_threads"))
        cfg.worker_threads = *v;
    if (auto v = readCount(t, "pipeline", "top_n"))
        cfg.top_n = *v;
}

void loadSourcesTable(const toml::table& t, processing::PipelineConfig& cfg)
{
    if (auto v = readString(t, "sources", "a_name"))
        cfg.source_a_name = *v;
    if (auto v = readString(t, "sources", "b_name"))
        cfg.source_b_name = *v;
    if (auto v = readNumber(t, "sources", "a_rating_scale"))
        cfg.normalizer.rating_scale_a = *v;
    if (auto v = readNumber(t, "sources", "b_rating_scale"))
        cfg.normalizer.rating_scale_b = *v;
}

void loadNormalizerTable(const toml::table& t, processing::NormalizerConfig& cfg)
{
    if (const toml::array* tokens = readArray(t, "normalizer", "noise_tokens"))
    {
        std::vector<std::string> parsed;
        for (const auto& element : *tokens)
        {
            auto token = element.value<std::string>();
            if (!token)
                throw ConfigurationError("normalizer.noise_tokens must contain only strings");
            parsed.push_back(*token);
        }
        cfg.noise_tokens = std::move(parsed);
    }
    if (auto v = readNumber(t, "normalizer", "grid_cell_deg"))
        cfg.grid_cell_deg = *v;
    if (auto v = readCount(t, "normalizer", "name_prefix_length"))
        cfg.name_prefix_length = *v;
}

void loadMatchingTable(const toml::table& t, processing::MatchConfig& cfg)
{
    if (auto v = readNumber(t, "matching", "name_threshold"))
        cfg.name_threshold = *v;
    if (auto v = readNumber(t, "matching", "distance_threshold_km"))
        cfg.distance_threshold_km = *v;
    if (auto v = readString(t, "matching", "algorithm"))
    {
        auto algorithm = processing::parse_match_algorithm(*v);
        if (!algorithm)
            throw ConfigurationError("matching.algorithm '" + *v + "' is not a known algorithm");
        cfg.algorithm = *algorithm;
    }
}

void loadEnrichmentTable(const toml::table& t, processing::EnrichmentConfig& cfg)
{
    if (auto v = readFixedArray<std::int64_t, 3>(t, "enrichment", "popularity_breakpoints"))
        cfg.popularity_breakpoints = *v;
    if (auto v = readFixedArray<double, 3>(t, "enrichment", "location_breakpoints_km"))
        cfg.location_breakpoints_km = *v;
    if (auto v = readFixedArray<double, 2>(t, "enrichment", "city_center"))
        cfg.city_center = listing::GeoPoint{ (*v)[0], (*v)[1] };
}

void loadFilterTable(const toml::table& t, processing::FilterCriteria& criteria)
{
    if (auto v = readNumber(t, "filter", "max_price"))
        criteria.max_price = *v;
    if (auto v = readNumber(t, "filter", "max_distance_km"))
        criteria.max_distance_km = *v;
    if (auto v = readNumber(t, "filter", "min_rating"))
        criteria.min_rating = *v;
    if (auto v = readInteger(t, "filter", "min_reviews"))
        criteria.min_reviews = *v;
}

} // namespace

processing::PipelineConfig loadPipelineSettings(const std::string& path)
{
    processing::PipelineConfig cfg;
    ConfigManager manager(path);
    manager.acknowledge("logging");

    const std::vector<TableBinding> bindings = {
        { "pipeline", { "worker_threads", "top_n" }, [&cfg](const toml::table& t) { loadPipelineTable(t, cfg); } },
        { "sources",
          { "a_name", "b_name", "a_rating_scale", "b_rating_scale" },
          [&cfg](const toml::table& t) { loadSourcesTable(t, cfg); } },
        { "normalizer",
          { "noise_tokens", "grid_cell_deg", "name_prefix_length" },
          [&cfg](const toml::table& t) { loadNormalizerTable(t, cfg.normalizer); } },
        { "matching",
          { "name_threshold", "distance_threshold_km", "algorithm" },
          [&cfg](const toml::table& t) { loadMatchingTable(t, cfg.matching); } },
        { "enrichment",
          { "popularity_breakpoints", "location_breakpoints_km", "city_center" },
          [&cfg](const toml::table& t) { loadEnrichmentTable(t, cfg.enrichment); } },
        { "filter",
          { "max_price", "max_distance_km", "min_rating", "min_reviews" },
          [&cfg](const toml::table& t) { loadFilterTable(t, cfg.filter); } },
    };
    for (const auto& binding : bindings)
    {
        if (!manager.bind(binding))
            throw ConfigurationError(manager.lastError());
    }

    if (!manager.load())
        throw ConfigurationError(manager.lastError());

    cfg.validate();
    PLOG_INFO << "Pipeline settings " << (manager.fileFound() ? "loaded from " + path : std::string("defaulted"))
              << ": name_threshold=" << cfg.matching.name_threshold
              << " distance_threshold_km=" << cfg.matching.distance_threshold_km;
    return cfg;
}

} // namespace config
