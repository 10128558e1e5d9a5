#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

namespace
{

bool isAsciiSpace(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

} // namespace

std::vector<std::string> splitWords(std::string_view text)
{
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        while (pos < text.size() && isAsciiSpace(text[pos]))
            ++pos;
        std::size_t start = pos;
        while (pos < text.size() && !isAsciiSpace(text[pos]))
            ++pos;
        if (pos > start)
            words.emplace_back(text.substr(start, pos - start));
    }
    return words;
}

std::string joinWords(const std::vector<std::string>& words)
{
    std::string result;
    for (const auto& word : words)
    {
        if (!result.empty())
            result.push_back(' ');
        result += word;
    }
    return result;
}

std::string collapseWhitespace(std::string_view text)
{
    return joinWords(splitWords(text));
}

std::vector<std::string> removeNoiseWords(const std::vector<std::string>& words,
                                          const std::unordered_set<std::string>& noise)
{
    std::vector<std::string> kept;
    kept.reserve(words.size());
    for (const auto& word : words)
    {
        if (noise.find(word) == noise.end())
            kept.push_back(word);
    }
    if (kept.empty())
        return words;
    return kept;
}

std::string utf8Prefix(std::string_view text, std::size_t count)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    std::size_t taken = 0;
    while (pos < len && taken < count)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            break;
        pos += bytes;
        ++taken;
    }
    return std::string(text.substr(0, static_cast<std::size_t>(pos)));
}

} // namespace processing
