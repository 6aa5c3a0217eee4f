#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "bucket_array.hpp"
#include "hash_cursor.hpp"
#include "hash_entry.hpp"
#include "hash_policy.hpp"

// Separate-chaining hash map.
//
// Every chain is kept sorted by the cached 32-bit hash of its entries. Lookup
// and removal can stop as soon as they pass the query hash, and growth
// (always by doubling) splits each chain into a low and a high half on one
// extra hash bit without recomputing any hash or re-sorting.
//
// Not thread-safe. Cursors and pointers returned by find() are invalidated
// by any modification of the table; references to values survive growth but
// not removal of their key.
template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class HashTable
{
    using Entry = HashEntry<K, V>;

public:
    using key_type = K;
    using mapped_type = V;
    using size_type = std::size_t;
    using entry_cursor = HashCursor<Entry, EntryProjection>;
    using key_cursor = HashCursor<Entry, KeyProjection>;
    using value_cursor = HashCursor<Entry, ValueProjection>;

    explicit HashTable(std::size_t initial_capacity = kDefaultCapacity, double load_factor = kDefaultLoadFactor)
        : buckets_(), load_factor_(load_factor), threshold_(0), size_(0)
    {
        if (initial_capacity < 1)
            throw std::invalid_argument("HashTable: initial capacity must be at least 1");
        if (!(load_factor > 0.0 && load_factor <= 1.0))
            throw std::invalid_argument("HashTable: load factor must be in (0, 1]");
        buckets_ = BucketArray<Entry *>(table_size_for(initial_capacity));
        threshold_ = threshold_for(buckets_.size(), load_factor_);
    }

    ~HashTable() { release_(); }

    // Same bucket count and chain layout as the source.
    HashTable(const HashTable &o)
        : buckets_(o.buckets_.size()), load_factor_(o.load_factor_), threshold_(o.threshold_), size_(0),
          default_(o.default_), hash_(o.hash_), eq_(o.eq_)
    {
        try
        {
            for (std::size_t i = 0; i < o.buckets_.size(); ++i)
            {
                Entry **tail = &buckets_[i];
                for (const Entry *n = o.buckets_[i]; n; n = n->next)
                {
                    *tail = new Entry(n->key, n->hash, n->value, nullptr);
                    tail = &(*tail)->next;
                    ++size_;
                }
            }
        }
        catch (...)
        {
            release_();
            throw;
        }
    }

    // The source is left as a valid empty table.
    HashTable(HashTable &&o) noexcept
        : buckets_(std::move(o.buckets_)), load_factor_(o.load_factor_), threshold_(o.threshold_), size_(o.size_),
          default_(std::move(o.default_)), hash_(std::move(o.hash_)), eq_(std::move(o.eq_))
    {
        o.threshold_ = 0;
        o.size_ = 0;
    }

    HashTable &operator=(HashTable o) noexcept
    {
        swap(o);
        return *this;
    }

    void swap(HashTable &o) noexcept
    {
        buckets_.swap(o.buckets_);
        std::swap(load_factor_, o.load_factor_);
        std::swap(threshold_, o.threshold_);
        std::swap(size_, o.size_);
        std::swap(default_, o.default_);
        std::swap(hash_, o.hash_);
        std::swap(eq_, o.eq_);
    }

    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    std::size_t bucket_count() const noexcept { return buckets_.size(); }
    double load_factor() const noexcept { return load_factor_; }
    std::size_t threshold() const noexcept { return threshold_; }

    // ---- lookup ----

    bool contains(const K &key) const { return find_entry_(key) != nullptr; }

    std::optional<V> get(const K &key) const
    {
        const Entry *e = find_entry_(key);
        if (!e)
            return std::nullopt;
        return e->value;
    }

    V *find(const K &key)
    {
        Entry *e = find_entry_(key);
        return e ? &e->value : nullptr;
    }
    const V *find(const K &key) const
    {
        const Entry *e = find_entry_(key);
        return e ? &e->value : nullptr;
    }

    V get_or_else(const K &key, V fallback) const
    {
        const Entry *e = find_entry_(key);
        return e ? e->value : fallback;
    }

    // `fallback()` is called only when key is absent.
    template <class F, std::enable_if_t<std::is_convertible_v<std::invoke_result_t<F &>, V>, int> = 0>
    V get_or_else(const K &key, F &&fallback) const
    {
        const Entry *e = find_entry_(key);
        if (e)
            return e->value;
        return fallback();
    }

    V &at(const K &key)
    {
        Entry *e = find_entry_(key);
        if (!e)
            throw std::out_of_range("HashTable::at: key not found");
        return e->value;
    }
    const V &at(const K &key) const
    {
        const Entry *e = find_entry_(key);
        if (!e)
            throw std::out_of_range("HashTable::at: key not found");
        return e->value;
    }

    // Missing keys go to the provider set by with_default(), if any.
    V apply(const K &key) const
    {
        const Entry *e = find_entry_(key);
        if (e)
            return e->value;
        if (default_)
            return default_(key);
        throw std::out_of_range("HashTable::apply: key not found and no default provider");
    }

    HashTable &with_default(std::function<V(const K &)> provider)
    {
        default_ = std::move(provider);
        return *this;
    }

    // ---- modification ----

    // Returns the value previously stored under key, if any.
    std::optional<V> put(K key, V value)
    {
        std::optional<V> old;
        put_(std::move(key), std::move(value), &old);
        return old;
    }

    void update(K key, V value) { put_(std::move(key), std::move(value), nullptr); }

    HashTable &add(std::pair<K, V> kv)
    {
        put_(std::move(kv.first), std::move(kv.second), nullptr);
        return *this;
    }

    // `compute` runs only when key is absent, and at most once. It must not
    // modify this table.
    template <class F>
    V &get_or_else_update(const K &key, F &&compute)
    {
        std::uint32_t h = hash_of_(key);
        std::size_t len = buckets_.size();
        std::size_t idx = 0;
        if (len)
        {
            idx = bucket_index(h, len);
            Entry *head = buckets_[idx];
            if (head)
            {
                if (Entry *e = head->find(key, h, eq_))
                    return e->value;
            }
        }
        Entry *const *slots = buckets_.data();
        V value = std::forward<F>(compute)();
        if (size_ + 1 >= threshold_)
            grow_table_(table_size_for(buckets_.size() * 2));
        if (buckets_.data() != slots || buckets_.size() != len)
            idx = bucket_index(h, buckets_.size());
        return put_at_(key, h, idx, std::move(value), nullptr)->value;
    }

    // The value is moved out before the entry leaves its chain, so a throwing
    // move leaves the table unchanged.
    std::optional<V> remove(const K &key)
    {
        Entry **from = find_link_(key);
        if (!from)
            return std::nullopt;
        std::optional<V> out(std::move((*from)->value));
        delete detach_(from);
        return out;
    }

    HashTable &subtract(const K &key)
    {
        if (Entry **from = find_link_(key))
            delete detach_(from);
        return *this;
    }

    // Drops every entry; the bucket count is kept.
    void clear() noexcept { release_(); }

    // Grows so that `expected` entries fit without further growth. Never
    // shrinks.
    void size_hint(std::size_t expected)
    {
        std::size_t target = buckets_for_entries(expected, load_factor_);
        if (target > buckets_.size())
            grow_table_(target);
    }

    // Inserts every pair in order, later pairs overwriting earlier ones.
    // Forward ranges presize the table first.
    template <class InputIt>
    HashTable &add_all(InputIt first, InputIt last)
    {
        using Cat = typename std::iterator_traits<InputIt>::iterator_category;
        if constexpr (std::is_base_of_v<std::forward_iterator_tag, Cat>)
            size_hint(static_cast<std::size_t>(std::distance(first, last)));
        for (; first != last; ++first)
        {
            const auto &kv = *first;
            update(kv.first, kv.second);
        }
        return *this;
    }

    HashTable &add_all(std::initializer_list<std::pair<K, V>> pairs)
    {
        return add_all(pairs.begin(), pairs.end());
    }

    // ---- iteration ----

    entry_cursor entries() const { return entry_cursor(buckets_.data(), buckets_.size()); }
    key_cursor keys() const { return key_cursor(buckets_.data(), buckets_.size()); }
    value_cursor values() const { return value_cursor(buckets_.data(), buckets_.size()); }

    // Calls f(key, value) for every entry in cursor order.
    template <class F>
    void for_each(F &&f)
    {
        for (std::size_t i = 0; i < buckets_.size(); ++i)
            for (Entry *n = buckets_[i]; n; n = n->next)
                f(n->key, n->value);
    }
    template <class F>
    void for_each(F &&f) const
    {
        for (std::size_t i = 0; i < buckets_.size(); ++i)
            for (const Entry *n = buckets_[i]; n; n = n->next)
                f(n->key, n->value);
    }

private:
    std::uint32_t hash_of_(const K &key) const { return spread_hash(hash_(key)); }

    Entry *find_entry_(const K &key) const
    {
        if (buckets_.empty())
            return nullptr;
        std::uint32_t h = hash_of_(key);
        Entry *head = buckets_[bucket_index(h, buckets_.size())];
        return head ? head->find(key, h, eq_) : nullptr;
    }

    Entry *put_(K &&key, V &&value, std::optional<V> *old)
    {
        if (size_ + 1 >= threshold_)
            grow_table_(table_size_for(buckets_.size() * 2));
        std::uint32_t h = hash_of_(key);
        return put_at_(std::move(key), h, bucket_index(h, buckets_.size()), std::move(value), old);
    }

    // Overwrites the value of an equal key, or splices a new entry in front
    // of the first entry with a larger hash.
    template <class KArg, class VArg>
    Entry *put_at_(KArg &&key, std::uint32_t h, std::size_t idx, VArg &&value, std::optional<V> *old)
    {
        Entry *&head = buckets_[idx];
        Entry *prev = nullptr;
        for (Entry *n = head; n && n->hash <= h; n = n->next)
        {
            if (n->hash == h && eq_(n->key, key))
            {
                if (old)
                    old->emplace(std::exchange(n->value, std::forward<VArg>(value)));
                else
                    n->value = std::forward<VArg>(value);
                return n;
            }
            prev = n;
        }
        Entry *&link = prev ? prev->next : head;
        link = new Entry(std::forward<KArg>(key), h, std::forward<VArg>(value), link);
        ++size_;
        return link;
    }

    // Returns the link that points at the entry for key: the bucket slot when
    // it heads its chain, otherwise the predecessor's `next`.
    Entry **find_link_(const K &key)
    {
        if (buckets_.empty())
            return nullptr;
        std::uint32_t h = hash_of_(key);
        Entry **from = &buckets_[bucket_index(h, buckets_.size())];
        for (Entry *n; (n = *from) != nullptr && n->hash <= h; from = &n->next)
        {
            if (n->hash == h && eq_(n->key, key))
                return from;
        }
        return nullptr;
    }

    // Unlinks the entry `from` points at and hands it to the caller.
    Entry *detach_(Entry **from) noexcept
    {
        Entry *n = *from;
        *from = n->next;
        --size_;
        return n;
    }

    void grow_table_(std::size_t new_len)
    {
        if (new_len <= buckets_.size())
            return;
        if (size_ == 0)
        {
            buckets_ = BucketArray<Entry *>(new_len);
        }
        else
        {
            BucketArray<Entry *> next = buckets_.grown(new_len);
            for (std::size_t old_len = buckets_.size(); old_len < new_len; old_len *= 2)
                for (std::size_t i = 0; i < old_len; ++i)
                    split_bucket_(next, i, old_len);
            buckets_ = std::move(next);
        }
        threshold_ = threshold_for(new_len, load_factor_);
    }

    // Entries with the `old_len` bit clear stay at i, the rest move to
    // i + old_len. Relative order inside each half is preserved, so both
    // halves stay hash-sorted.
    static void split_bucket_(BucketArray<Entry *> &slots, std::size_t i, std::size_t old_len)
    {
        Entry *n = slots[i];
        if (!n)
            return;
        Entry *low_head = nullptr, *low_tail = nullptr;
        Entry *high_head = nullptr, *high_tail = nullptr;
        for (; n; n = n->next)
        {
            if ((n->hash & old_len) == 0)
            {
                (low_tail ? low_tail->next : low_head) = n;
                low_tail = n;
            }
            else
            {
                (high_tail ? high_tail->next : high_head) = n;
                high_tail = n;
            }
        }
        if (low_tail)
            low_tail->next = nullptr;
        if (high_tail)
            high_tail->next = nullptr;
        slots[i] = low_head;
        slots[i + old_len] = high_head;
    }

    void release_() noexcept
    {
        for (std::size_t i = 0; i < buckets_.size(); ++i)
        {
            destroy_chain(buckets_[i]);
            buckets_[i] = nullptr;
        }
        size_ = 0;
    }

    BucketArray<Entry *> buckets_;
    double load_factor_;
    std::size_t threshold_;
    std::size_t size_;
    std::function<V(const K &)> default_;
    Hash hash_;
    KeyEqual eq_;
};
