#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "datasets.hpp"
#include "hash_table.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    std::string impl, workload, dist, params;
    std::size_t N;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
};

inline void print_csv_header()
{
    std::cout << "impl,workload,N,dist,params,trial,seed,ns,checksum\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.impl << "," << r.workload << "," << r.N << "," << r.dist << "," << r.params << ","
              << r.trial << "," << r.seed << "," << r.ns << "," << r.checksum << "\n";
}

// Parameters shared by every HashTable workload.
struct TableParams
{
    double load_factor = kDefaultLoadFactor;
    std::size_t initial_capacity = kDefaultCapacity;

    std::string describe() const { return "lf=" + std::to_string(load_factor); }
};

using Table = HashTable<std::uint64_t, std::uint64_t>;

// ---- Workloads ----

// update every key, then 50/50 successful and unsuccessful lookups
inline Row run_table_insert_find(std::size_t N, Dist dist, int trial, std::uint64_t seed, const TableParams &p,
                                 bool presize)
{
    Sink s;
    Table t(p.initial_capacity, p.load_factor);
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        if (presize) t.size_hint(keys.size());
        for (auto k: keys) t.update(k, k ^ 0xdeadbeefULL);
        for (std::size_t i = 0; i < N; ++i){
            auto q = (i % 2 == 0) ? keys[i] : keys[i] ^ 0xabcdefULL;
            s.eat(t.get_or_else(q, 0x1234ULL));
        } });
    return Row{"chainmap", presize ? "insert+mixed_find(size_hint)" : "insert+mixed_find", dist_name(dist),
               p.describe(), N, trial, seed, ns, s.acc};
}

// put everything, remove every other key, put them back
inline Row run_table_churn(std::size_t N, Dist dist, int trial, std::uint64_t seed, const TableParams &p)
{
    Sink s;
    Table t(p.initial_capacity, p.load_factor);
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) t.update(k, k);
        for (std::size_t i = 0; i < N; i += 2){
            auto r = t.remove(keys[i]);
            s.eat(r ? *r : 0);
        }
        for (std::size_t i = 0; i < N; i += 2){
            auto r = t.put(keys[i], i);
            s.eat(r ? *r : 1);
        }
        s.eat(t.size()); });
    return Row{"chainmap", "put+remove+put", dist_name(dist), p.describe(), N, trial, seed, ns, s.acc};
}

// occurrence counting through get_or_else_update
inline Row run_table_count(std::size_t N, Dist dist, int trial, std::uint64_t seed, const TableParams &p)
{
    Sink s;
    Table t(p.initial_capacity, p.load_factor);
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) ++t.get_or_else_update(k, []{ return std::uint64_t(0); });
        s.eat(t.size()); });
    return Row{"chainmap", "count", dist_name(dist), p.describe(), N, trial, seed, ns, s.acc};
}

// full walk with a value cursor
inline Row run_table_iterate(std::size_t N, Dist dist, int trial, std::uint64_t seed, const TableParams &p)
{
    Sink s;
    Table t(p.initial_capacity, p.load_factor);
    auto keys = gen_keys(N, dist, seed);
    for (auto k: keys)
        t.update(k, k >> 3);
    std::uint64_t ns = time_ns([&]
                               {
        for (const auto &v: t.values()) s.eat(v); });
    return Row{"chainmap", "iterate", dist_name(dist), p.describe(), N, trial, seed, ns, s.acc};
}
