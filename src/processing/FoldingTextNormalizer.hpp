#pragma once

#include "ITextNormalizer.hpp"

namespace processing
{

// utf8proc-backed normalizer for listing names. Stateless and safe to share between threads.
class FoldingTextNormalizer : public ITextNormalizer
{
public:
    FoldingTextNormalizer() = default;
    ~FoldingTextNormalizer() override = default;

    [[nodiscard]] std::string fold(const std::string& text) const override;
    [[nodiscard]] std::string simplifySeparators(const std::string& text) const override;
    [[nodiscard]] std::string normalize(const std::string& text) const override;
};

} // namespace processing
