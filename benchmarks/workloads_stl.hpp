#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include "workloads.hpp" // for Row, Sink, Dist, time_ns, generators

// std::unordered_map counterparts of the workloads in workloads.hpp, run at
// the same max load factor.

using StlTable = std::unordered_map<std::uint64_t, std::uint64_t>;

inline Row run_stl_insert_find(std::size_t N, Dist dist, int trial, std::uint64_t seed, double load_factor,
                               bool with_reserve)
{
    Sink s;
    StlTable m;
    m.max_load_factor(static_cast<float>(load_factor));
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        if (with_reserve) m.reserve(N);
        for (auto k: keys) m[k] = (k ^ 0xdeadbeefULL);
        for (std::size_t i = 0; i < N; ++i){
            auto q = (i % 2 == 0) ? keys[i] : keys[i] ^ 0xabcdefULL;
            auto it = m.find(q);
            s.eat(it == m.end() ? 0x1234ULL : it->second);
        } });
    return Row{"stl", with_reserve ? "insert+mixed_find(size_hint)" : "insert+mixed_find", dist_name(dist),
               "lf=" + std::to_string(load_factor), N, trial, seed, ns, s.acc};
}

inline Row run_stl_churn(std::size_t N, Dist dist, int trial, std::uint64_t seed, double load_factor)
{
    Sink s;
    StlTable m;
    m.max_load_factor(static_cast<float>(load_factor));
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) m[k] = k;
        for (std::size_t i = 0; i < N; i += 2){
            auto it = m.find(keys[i]);
            if (it == m.end()) { s.eat(0); continue; }
            s.eat(it->second);
            m.erase(it);
        }
        for (std::size_t i = 0; i < N; i += 2){
            auto r = m.insert_or_assign(keys[i], i);
            s.eat(r.second ? 1 : r.first->second);
        }
        s.eat(m.size()); });
    return Row{"stl", "put+remove+put", dist_name(dist), "lf=" + std::to_string(load_factor), N, trial, seed, ns,
               s.acc};
}

inline Row run_stl_count(std::size_t N, Dist dist, int trial, std::uint64_t seed, double load_factor)
{
    Sink s;
    StlTable m;
    m.max_load_factor(static_cast<float>(load_factor));
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) ++m[k];
        s.eat(m.size()); });
    return Row{"stl", "count", dist_name(dist), "lf=" + std::to_string(load_factor), N, trial, seed, ns, s.acc};
}

inline Row run_stl_iterate(std::size_t N, Dist dist, int trial, std::uint64_t seed, double load_factor)
{
    Sink s;
    StlTable m;
    m.max_load_factor(static_cast<float>(load_factor));
    auto keys = gen_keys(N, dist, seed);
    for (auto k: keys)
        m[k] = k >> 3;
    std::uint64_t ns = time_ns([&]
                               {
        for (const auto &kv: m) s.eat(kv.second); });
    return Row{"stl", "iterate", dist_name(dist), "lf=" + std::to_string(load_factor), N, trial, seed, ns, s.acc};
}
