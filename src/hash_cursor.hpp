#pragma once
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <utility>

// Projections applied to each visited entry.
struct EntryProjection
{
    template <class E>
    auto operator()(const E &e) const
    {
        return std::pair<const decltype(e.key) &, const decltype(e.value) &>(e.key, e.value);
    }
};

struct KeyProjection
{
    template <class E>
    const auto &operator()(const E &e) const { return e.key; }
};

struct ValueProjection
{
    template <class E>
    const auto &operator()(const E &e) const { return e.value; }
};

// One-shot cursor over a bucket array: bucket 0 first, each chain walked to
// its end before moving to the next bucket. The table must not be modified
// while a cursor over it is alive.
template <typename Entry, typename Extract>
class HashCursor
{
public:
    // What the projection returns; references into the table for keys and
    // values, a pair of references for entries.
    using reference = decltype(std::declval<const Extract &>()(std::declval<const Entry &>()));
    using value_type = std::decay_t<reference>;

    HashCursor(const Entry *const *slots, std::size_t len) noexcept
        : slots_(slots), len_(len), i_(0), node_(nullptr)
    {
    }

    bool has_next()
    {
        if (node_)
            return true;
        while (i_ < len_)
        {
            const Entry *n = slots_[i_++];
            if (n)
            {
                node_ = n;
                return true;
            }
        }
        return false;
    }

    reference next()
    {
        if (!has_next())
            throw std::out_of_range("HashCursor::next on exhausted cursor");
        const Entry *n = node_;
        node_ = n->next;
        return extract_(*n);
    }

    // Input iterator over the remaining elements; shares this cursor's
    // position, so a cursor can be consumed by one range-for only.
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename HashCursor::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = typename HashCursor::reference;

        explicit iterator(HashCursor *c) noexcept : c_(c) {}

        reference operator*() const { return c_->extract_(*c_->node_); }

        iterator &operator++()
        {
            c_->node_ = c_->node_->next;
            return *this;
        }

        bool operator==(const iterator &o) const { return at_end_() == o.at_end_(); }
        bool operator!=(const iterator &o) const { return !(*this == o); }

    private:
        bool at_end_() const { return !c_ || !c_->has_next(); }

        HashCursor *c_;
    };

    iterator begin() noexcept { return iterator(this); }
    iterator end() noexcept { return iterator(nullptr); }

private:
    const Entry *const *slots_;
    std::size_t len_;
    std::size_t i_;
    const Entry *node_;
    Extract extract_;
};
