#pragma once

#include "ListingTypes.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <vector>

namespace processing
{

/**
 * @brief Restartable, lazily evaluated sequence of (A, B) candidate index pairs.
 *
 * B listings are indexed once by bucket key. For every A listing (in index order) the sequence yields
 * the B listings whose grid cell lies in the 3x3 neighbourhood of A's cell and whose name prefix equals
 * A's, in ascending B index. Listings without coordinates produce no candidates.
 *
 * The sequence is a pure function of its inputs: iterating twice yields the same pairs. The inputs must
 * outlive the sequence.
 *
 * Example:
 * @code
 * auto candidates = generate_candidates(normalized_a, normalized_b);
 * for (const listing::IndexPair& pair : candidates)
 *     score(normalized_a[pair.a_index], normalized_b[pair.b_index]);
 * @endcode
 */
class CandidateSequence
{
public:
    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = listing::IndexPair;
        using difference_type = std::ptrdiff_t;
        using pointer = const listing::IndexPair*;
        using reference = const listing::IndexPair&;

        Iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        Iterator& operator++();
        Iterator operator++(int);

        friend bool operator==(const Iterator& lhs, const Iterator& rhs)
        {
            return lhs.owner_ == rhs.owner_ && lhs.a_index_ == rhs.a_index_ && lhs.position_ == rhs.position_;
        }

    private:
        friend class CandidateSequence;
        Iterator(const CandidateSequence* owner, std::size_t a_index, std::size_t a_end);

        void settle();

        const CandidateSequence* owner_ = nullptr;
        std::size_t a_index_ = 0;
        std::size_t a_end_ = 0;
        std::size_t position_ = 0;
        std::vector<std::size_t> b_indices_;
        listing::IndexPair current_;
    };

    CandidateSequence(const std::vector<listing::NormalizedListing>& a,
                      const std::vector<listing::NormalizedListing>& b);
    ~CandidateSequence();

    CandidateSequence(const CandidateSequence&);
    CandidateSequence& operator=(const CandidateSequence&);
    CandidateSequence(CandidateSequence&&) noexcept;
    CandidateSequence& operator=(CandidateSequence&&) noexcept;

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const;

    // B indices proposed for one A listing, ascending.
    [[nodiscard]] std::vector<std::size_t> candidatesFor(std::size_t a_index) const;

    // Every pair, in iteration order.
    [[nodiscard]] std::vector<listing::IndexPair> collect() const;

    // Pairs whose A index lies in [a_begin, a_end), in iteration order. Used for partitioned scoring.
    [[nodiscard]] std::vector<listing::IndexPair> collectRange(std::size_t a_begin, std::size_t a_end) const;

    [[nodiscard]] std::size_t sourceACount() const noexcept;
    [[nodiscard]] std::size_t sourceBCount() const noexcept;

private:
    struct Index;
    const std::vector<listing::NormalizedListing>* a_ = nullptr;
    std::shared_ptr<const Index> index_;
};

// Builds the candidate sequence for two normalized sources.
[[nodiscard]] CandidateSequence generate_candidates(const std::vector<listing::NormalizedListing>& a,
                                                    const std::vector<listing::NormalizedListing>& b);

} // namespace processing
