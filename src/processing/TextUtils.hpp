#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace processing
{

/// Split on ASCII whitespace; empty tokens are dropped
std::vector<std::string> splitWords(std::string_view text);

/// Join tokens with a single space
std::string joinWords(const std::vector<std::string>& words);

/// Trim and collapse every run of ASCII whitespace to a single space
std::string collapseWhitespace(std::string_view text);

/// Drop whole-word tokens present in noise. Returns the input words untouched if nothing would remain.
std::vector<std::string> removeNoiseWords(const std::vector<std::string>& words,
                                          const std::unordered_set<std::string>& noise);

/// First count codepoints of a UTF-8 string (never splits a multi-byte sequence)
std::string utf8Prefix(std::string_view text, std::size_t count);

} // namespace processing
