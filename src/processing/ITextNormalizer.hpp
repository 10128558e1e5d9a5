#pragma once

#include "TextUtils.hpp"

#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Canonical form of a hotel name, before noise-word removal.
 *
 * Both sources go through the same instance so that "Hôtel ＬＩＳＢＯＡ" and "hotel lisboa" compare equal.
 * Implementations must be safe to call from several partition workers at once.
 */
class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Compatibility + case + diacritic folding ("Hôtel ＬＩＳＢＯＡ" -> "hôtel lisboa" -> "hotel lisboa")
    [[nodiscard]] virtual std::string fold(const std::string& text) const = 0;

    // Apostrophes vanish, other punctuation and symbols split words, whitespace collapses
    [[nodiscard]] virtual std::string simplifySeparators(const std::string& text) const = 0;

    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;

    // normalize() split on spaces; never yields empty words
    [[nodiscard]] virtual std::vector<std::string> words(const std::string& text) const
    {
        return splitWords(normalize(text));
    }
};

} // namespace processing
