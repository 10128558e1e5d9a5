#include "FoldingTextNormalizer.hpp"
#include "Diagnostics.hpp"
#include <utf8proc.h>
#include <plog/Log.h>

#include <cctype>
#include <cstdlib>

namespace processing
{

namespace
{

bool is_apostrophe(utf8proc_int32_t cp)
{
    return cp == 0x0027 || cp == 0x2019 || cp == 0x2018 || cp == 0x02BC || cp == 0x0060 || cp == 0x00B4;
}

bool is_word_codepoint(utf8proc_int32_t cp)
{
    switch (utf8proc_category(cp))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_MN:
    case UTF8PROC_CATEGORY_MC:
    case UTF8PROC_CATEGORY_ME:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

std::string ascii_lower(const std::string& text)
{
    std::string out(text);
    for (auto& ch : out)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

} // namespace

std::string FoldingTextNormalizer::fold(const std::string& text) const
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* folded = nullptr;
    const utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()), 0, &folded,
                                              static_cast<utf8proc_option_t>(UTF8PROC_NULLTERM | UTF8PROC_STABLE |
                                                                             UTF8PROC_COMPOSE | UTF8PROC_COMPAT |
                                                                             UTF8PROC_CASEFOLD | UTF8PROC_STRIPMARK));

    if (len < 0 || !folded)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance)
            << "utf8proc folding failed (" << utf8proc_errmsg(len) << "), falling back to ASCII lowercase for "
            << Diagnostics::Preview(text);
        std::free(folded);
        return ascii_lower(text);
    }

    std::string result(reinterpret_cast<char*>(folded), static_cast<std::size_t>(len));
    std::free(folded);
    return result;
}

std::string FoldingTextNormalizer::simplifySeparators(const std::string& text) const
{
    if (text.empty())
        return text;

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    std::string out;
    out.reserve(text.size());
    bool pending_space = false;

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t cp = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &cp);
        if (bytes <= 0)
        {
            // Invalid byte: drop it and resynchronise on the next one
            ++pos;
            continue;
        }

        if (is_apostrophe(cp))
        {
            // "st john's" -> "st johns"
        }
        else if (is_word_codepoint(cp))
        {
            if (pending_space && !out.empty())
                out.push_back(' ');
            pending_space = false;
            out.append(text, static_cast<std::size_t>(pos), static_cast<std::size_t>(bytes));
        }
        else
        {
            pending_space = true;
        }
        pos += bytes;
    }

    return out;
}

std::string FoldingTextNormalizer::normalize(const std::string& text) const
{
    return simplifySeparators(fold(text));
}

} // namespace processing
