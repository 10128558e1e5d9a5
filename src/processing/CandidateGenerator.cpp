#include "CandidateGenerator.hpp"
#include "Diagnostics.hpp"

#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>
#include <plog/Log.h>

namespace processing
{

namespace
{

struct CellKey
{
    std::int64_t lat_index = 0;
    std::int64_t lon_index = 0;
    std::string name_prefix;

    friend bool operator==(const CellKey&, const CellKey&) = default;
};

struct CellKeyHash
{
    std::size_t operator()(const CellKey& key) const noexcept
    {
        std::size_t h = std::hash<std::int64_t>{}(key.lat_index);
        h ^= std::hash<std::int64_t>{}(key.lon_index) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(key.name_prefix) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace

struct CandidateSequence::Index
{
    std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> buckets;
    std::size_t a_count = 0;
    std::size_t b_count = 0;
};

CandidateSequence::CandidateSequence(const std::vector<listing::NormalizedListing>& a,
                                     const std::vector<listing::NormalizedListing>& b)
    : a_(&a)
{
    auto index = std::make_shared<Index>();
    index->a_count = a.size();
    index->b_count = b.size();

    // B indices are appended in ascending order, so each bucket stays sorted.
    for (std::size_t i = 0; i < b.size(); ++i)
    {
        const auto& key = b[i].bucket;
        if (!key.cell)
            continue;
        index->buckets[CellKey{ key.cell->lat_index, key.cell->lon_index, key.name_prefix }].push_back(i);
    }

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[CandidateGenerator] indexed " << b.size() << " B listings into "
                                              << index->buckets.size() << " buckets";
    }
    index_ = std::move(index);
}

CandidateSequence::~CandidateSequence() = default;
CandidateSequence::CandidateSequence(const CandidateSequence&) = default;
CandidateSequence& CandidateSequence::operator=(const CandidateSequence&) = default;
CandidateSequence::CandidateSequence(CandidateSequence&&) noexcept = default;
CandidateSequence& CandidateSequence::operator=(CandidateSequence&&) noexcept = default;

std::vector<std::size_t> CandidateSequence::candidatesFor(std::size_t a_index) const
{
    std::vector<std::size_t> result;
    if (a_index >= index_->a_count)
        return result;

    const auto& key = (*a_)[a_index].bucket;
    if (!key.cell)
        return result;

    for (std::int64_t dlat = -1; dlat <= 1; ++dlat)
    {
        for (std::int64_t dlon = -1; dlon <= 1; ++dlon)
        {
            CellKey probe{ key.cell->lat_index + dlat, key.cell->lon_index + dlon, key.name_prefix };
            auto it = index_->buckets.find(probe);
            if (it != index_->buckets.end())
                result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

CandidateSequence::Iterator CandidateSequence::begin() const
{
    return Iterator(this, 0, index_->a_count);
}

CandidateSequence::Iterator CandidateSequence::end() const
{
    return Iterator(this, index_->a_count, index_->a_count);
}

std::vector<listing::IndexPair> CandidateSequence::collect() const
{
    return collectRange(0, index_->a_count);
}

std::vector<listing::IndexPair> CandidateSequence::collectRange(std::size_t a_begin, std::size_t a_end) const
{
    a_end = std::min(a_end, index_->a_count);
    std::vector<listing::IndexPair> pairs;
    for (std::size_t a = a_begin; a < a_end; ++a)
    {
        for (std::size_t b : candidatesFor(a))
            pairs.push_back(listing::IndexPair{ a, b });
    }
    return pairs;
}

std::size_t CandidateSequence::sourceACount() const noexcept
{
    return index_->a_count;
}

std::size_t CandidateSequence::sourceBCount() const noexcept
{
    return index_->b_count;
}

CandidateSequence::Iterator::Iterator(const CandidateSequence* owner, std::size_t a_index, std::size_t a_end)
    : owner_(owner)
    , a_index_(a_index)
    , a_end_(a_end)
{
    if (a_index_ < a_end_)
        b_indices_ = owner_->candidatesFor(a_index_);
    settle();
}

void CandidateSequence::Iterator::settle()
{
    while (a_index_ < a_end_ && position_ >= b_indices_.size())
    {
        ++a_index_;
        position_ = 0;
        if (a_index_ < a_end_)
            b_indices_ = owner_->candidatesFor(a_index_);
        else
            b_indices_.clear();
    }
    if (a_index_ < a_end_)
        current_ = listing::IndexPair{ a_index_, b_indices_[position_] };
}

CandidateSequence::Iterator& CandidateSequence::Iterator::operator++()
{
    ++position_;
    settle();
    return *this;
}

CandidateSequence::Iterator CandidateSequence::Iterator::operator++(int)
{
    Iterator copy = *this;
    ++(*this);
    return copy;
}

CandidateSequence generate_candidates(const std::vector<listing::NormalizedListing>& a,
                                      const std::vector<listing::NormalizedListing>& b)
{
    return CandidateSequence(a, b);
}

} // namespace processing
