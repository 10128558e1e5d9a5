#include "ListingReader.hpp"
#include "FieldParsers.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace ingest
{

namespace
{

/// First present, non-null key among the aliases
const json* findField(const json& obj, std::initializer_list<const char*> keys)
{
    for (const char* key : keys)
    {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null())
            return &*it;
    }
    return nullptr;
}

std::optional<double> numberField(const json* value)
{
    if (!value)
        return std::nullopt;
    if (value->is_number())
        return value->get<double>();
    if (value->is_string())
        return parseLooseNumber(value->get_ref<const std::string&>());
    return std::nullopt;
}

std::optional<std::int64_t> countField(const json* value)
{
    if (!value)
        return std::nullopt;
    if (value->is_number_integer())
        return value->get<std::int64_t>();
    auto number = numberField(value);
    if (!number || !std::isfinite(*number))
        return std::nullopt;
    return static_cast<std::int64_t>(std::llround(*number));
}

struct Coordinate
{
    std::optional<double> value;
    std::optional<int> decimals;
};

Coordinate coordinateField(const json* value)
{
    Coordinate out;
    if (!value)
        return out;
    if (value->is_number())
    {
        out.value = value->get<double>();
    }
    else if (value->is_string())
    {
        const auto& text = value->get_ref<const std::string&>();
        out.decimals = countDecimals(text);
        if (out.decimals)
            out.value = parseLooseNumber(text);
    }
    return out;
}

std::optional<double> distanceField(const json* value)
{
    if (!value)
        return std::nullopt;
    // Numeric distances are already kilometres; labels carry their unit.
    if (value->is_number())
        return value->get<double>();
    if (value->is_string())
        return parseDistanceKm(value->get_ref<const std::string&>());
    return std::nullopt;
}

} // anonymous namespace

ListingReader::ListingReader(listing::Source source)
    : source_(source)
{
}

ListingReader::~ListingReader() = default;

std::optional<listing::RawListing> ListingReader::parseLine(const std::string& line) const
{
    try
    {
        json obj = json::parse(line);
        if (!obj.is_object())
            return std::nullopt;

        const json* name = findField(obj, { "name", "hotel_name" });
        if (!name || !name->is_string())
            return std::nullopt;

        listing::RawListing raw;
        raw.source = source_;
        raw.name = name->get<std::string>();
        raw.price = numberField(findField(obj, { "price" }));
        raw.rating = numberField(findField(obj, { "rating" }));
        raw.review_count = countField(findField(obj, { "reviews", "review_count", "review_amount" }));

        Coordinate lat;
        Coordinate lon;
        if (const json* coords = findField(obj, { "coordinates" }); coords && coords->is_array() && coords->size() == 2)
        {
            lat = coordinateField(&(*coords)[0]);
            lon = coordinateField(&(*coords)[1]);
        }
        else
        {
            lat = coordinateField(findField(obj, { "latitude", "lat" }));
            lon = coordinateField(findField(obj, { "longitude", "lng", "lon" }));
        }
        raw.latitude = lat.value;
        raw.longitude = lon.value;
        if (lat.decimals && lon.decimals)
            raw.coordinate_decimals = std::max(*lat.decimals, *lon.decimals);

        raw.distance_to_center_km = distanceField(findField(obj, { "distance_km", "distance" }));

        if (const json* url = findField(obj, { "url" }); url && url->is_string())
            raw.url = url->get<std::string>();

        return raw;
    }
    catch (const json::parse_error& e)
    {
        PLOG_DEBUG << "ListingReader: JSON parse error: " << e.what();
        return std::nullopt;
    }
    catch (const json::exception& e)
    {
        PLOG_WARNING << "ListingReader: Unexpected value type: " << e.what();
        return std::nullopt;
    }
}

bool ListingReader::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        last_error_ = "Failed to open listing file: " + path;
        PLOG_ERROR << "ListingReader: " << last_error_;
        return false;
    }
    return load(file, path);
}

bool ListingReader::load(std::istream& input, const std::string& origin)
{
    listings_.clear();
    skipped_ = 0;
    last_error_.clear();

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line))
    {
        ++line_number;

        if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos)
            continue;

        auto raw = parseLine(line);
        if (raw.has_value())
        {
            listings_.push_back(std::move(*raw));
        }
        else
        {
            PLOG_WARNING << "ListingReader: Skipping malformed line " << line_number << " of " << origin;
            ++skipped_;
        }
    }

    PLOG_INFO << "ListingReader: Loaded " << listings_.size() << " " << std::string(listing::to_string(source_))
              << " listings from " << origin;
    if (skipped_ > 0)
        PLOG_WARNING << "ListingReader: Skipped " << skipped_ << " malformed lines in " << origin;
    if (listings_.empty())
        PLOG_WARNING << "ListingReader: No listings found in " << origin;
    return true;
}

} // namespace ingest
