#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::string head = utf8Prefix(text, kPreviewCodepoints);

    std::string out = "\"";
    for (char ch : head)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (ch == '"' || ch == '\\')
        {
            out.push_back('\\');
            out.push_back(ch);
        }
        else if (byte < 0x20)
        {
            out.push_back('?');
        }
        else
        {
            out.push_back(ch);
        }
    }
    out.push_back('"');

    if (head.size() < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

std::string Diagnostics::Describe(const listing::NormalizedListing& item)
{
    std::ostringstream oss;
    oss << listing::to_string(item.source) << "#" << item.index << " " << Preview(item.clean_name);
    if (item.has_coordinates)
        oss << " @" << std::fixed << std::setprecision(item.coordinate_decimals) << item.latitude << ","
            << item.longitude;
    else
        oss << " @none";
    return oss.str();
}

std::string Diagnostics::Describe(const listing::CandidatePair& pair)
{
    std::ostringstream oss;
    oss << "a=" << pair.a_index << " b=" << pair.b_index << " similarity=" << std::fixed << std::setprecision(3)
        << pair.similarity << " distance_m=";
    if (std::isfinite(pair.distance_m))
        oss << std::setprecision(1) << pair.distance_m;
    else
        oss << "inf";
    return oss.str();
}

} // namespace processing
