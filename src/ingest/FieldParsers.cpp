#include "FieldParsers.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace ingest
{

namespace
{

bool isDigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::string lowerAscii(std::string_view text)
{
    std::string out(text);
    for (auto& ch : out)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::optional<double> parseLooseNumber(std::string_view text)
{
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char ch : text)
    {
        if (ch != ',')
            cleaned.push_back(ch);
    }

    std::size_t pos = 0;
    while (pos < cleaned.size() && !isDigit(cleaned[pos]))
        ++pos;
    if (pos == cleaned.size())
        return std::nullopt;

    std::size_t start = pos;
    if (start > 0 && cleaned[start - 1] == '-')
        --start;

    std::size_t end = pos;
    while (end < cleaned.size() && isDigit(cleaned[end]))
        ++end;
    if (end < cleaned.size() && cleaned[end] == '.')
    {
        ++end;
        while (end < cleaned.size() && isDigit(cleaned[end]))
            ++end;
    }

    const std::string number = cleaned.substr(start, end - start);
    char* parse_end = nullptr;
    const double value = std::strtod(number.c_str(), &parse_end);
    if (parse_end == number.c_str())
        return std::nullopt;
    return value;
}

std::optional<double> parseDistanceKm(std::string_view text)
{
    const auto trimmed = trim(text);
    if (trimmed.empty() || trimmed == "N/A")
        return std::nullopt;

    auto value = parseLooseNumber(trimmed);
    if (!value)
        return std::nullopt;

    const std::string lower = lowerAscii(trimmed);
    // ק"מ with an ASCII quote or the Hebrew gershayim (U+05F4)
    const bool kilometres = lower.find("km") != std::string::npos ||
                            lower.find("\xD7\xA7\"\xD7\x9E") != std::string::npos ||
                            lower.find("\xD7\xA7\xD7\xB4\xD7\x9E") != std::string::npos;
    if (kilometres)
        return *value;
    return *value / 1000.0;
}

std::optional<int> countDecimals(std::string_view text)
{
    const auto trimmed = trim(text);
    if (trimmed.empty())
        return std::nullopt;

    std::size_t pos = 0;
    if (trimmed[0] == '-' || trimmed[0] == '+')
        ++pos;
    std::size_t int_digits = 0;
    while (pos < trimmed.size() && isDigit(trimmed[pos]))
    {
        ++pos;
        ++int_digits;
    }
    int decimals = 0;
    if (pos < trimmed.size() && trimmed[pos] == '.')
    {
        ++pos;
        while (pos < trimmed.size() && isDigit(trimmed[pos]))
        {
            ++pos;
            ++decimals;
        }
    }
    if (pos != trimmed.size() || (int_digits == 0 && decimals == 0))
        return std::nullopt;
    return decimals;
}

} // namespace ingest
