#pragma once
#include <cstddef>
#include <cstdint>

// Sizing and hashing rules shared by HashTable and its tests.
// Bucket counts are always powers of two in [kMinBuckets, kMaxBuckets].

constexpr std::size_t kDefaultCapacity = 16;
constexpr double kDefaultLoadFactor = 0.75;
constexpr std::size_t kMinBuckets = 4;
constexpr std::size_t kMaxBuckets = std::size_t(1) << 30;

// Folds a native hash to 32 bits, then xors the high 16 bits into the low 16
// so that the bits used for indexing see some entropy from the whole value.
inline std::uint32_t spread_hash(std::size_t raw)
{
    std::uint64_t wide = static_cast<std::uint64_t>(raw);
    std::uint32_t h = static_cast<std::uint32_t>(wide ^ (wide >> 32));
    return h ^ (h >> 16);
}

// Only valid for power-of-two bucket counts.
inline std::size_t bucket_index(std::uint32_t hash, std::size_t buckets)
{
    return static_cast<std::size_t>(hash) & (buckets - 1);
}

// Smallest power of two >= max(n, kMinBuckets), saturating at kMaxBuckets.
inline std::size_t table_size_for(std::size_t n)
{
    if (n >= kMaxBuckets)
        return kMaxBuckets;
    std::size_t cap = kMinBuckets;
    while (cap < n)
        cap <<= 1;
    return cap;
}

inline std::size_t threshold_for(std::size_t buckets, double load_factor)
{
    return static_cast<std::size_t>(static_cast<double>(buckets) * load_factor);
}

// Bucket count needed to hold `expected` entries without growing.
inline std::size_t buckets_for_entries(std::size_t expected, double load_factor)
{
    double want = (static_cast<double>(expected) + 1.0) / load_factor;
    if (want >= static_cast<double>(kMaxBuckets))
        return kMaxBuckets;
    return table_size_for(static_cast<std::size_t>(want));
}
