#pragma once

#include <optional>
#include <string_view>

namespace ingest
{

/// First number in a scraped field: "₪ 1,234" -> 1234, "8.4" -> 8.4, "1,500 reviews" -> 1500.
/// Thousands separators are dropped; a '-' directly before the digits is kept. Empty when no digits.
std::optional<double> parseLooseNumber(std::string_view text);

/// Distance label converted to kilometres. "1.2 km" and "1.2 ק\"מ" are kilometres; "350 m", "350 מטר"
/// and bare numbers are metres. Empty for "N/A" and labels without digits.
std::optional<double> parseDistanceKm(std::string_view text);

/// Digits after the decimal point of a textual number ("38.71690" -> 5); empty when not a number.
std::optional<int> countDecimals(std::string_view text);

} // namespace ingest
