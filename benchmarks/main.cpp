#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "workloads.hpp"
#include "workloads_stl.hpp"

static void print_metadata(double load_factor)
{
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
    std::fprintf(stderr, "# load factor: %.3f\n", load_factor);
}

struct Args
{
    std::vector<std::size_t> sizes{1024, 4096, 16384, 65536, 262144, 1048576, 4194304};
    int trials = 8;
    Dist dist = Dist::Uniform;
    std::uint64_t seed0 = 42;
    double load_factor = kDefaultLoadFactor;
};

static void usage(const char *prog)
{
    std::fprintf(stderr,
                 "usage: %s [--trials N] [--dist uniform|zipf|strided] [--seed S] [--sizes a,b,c] "
                 "[--load-factor F]\n",
                 prog);
}

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&](std::string &out)
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + s);
            out = argv[++i];
        };
        std::string v;
        if (s == "--trials")
        {
            next(v);
            a.trials = std::stoi(v);
        }
        else if (s == "--dist")
        {
            next(v);
            a.dist = parse_dist(v);
        }
        else if (s == "--seed")
        {
            next(v);
            a.seed0 = std::stoull(v);
        }
        else if (s == "--load-factor")
        {
            next(v);
            a.load_factor = std::stod(v);
        }
        else if (s == "--sizes")
        {
            next(v);
            a.sizes.clear();
            std::size_t start = 0;
            while (true)
            {
                auto pos = v.find(',', start);
                std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
                if (!tok.empty())
                    a.sizes.push_back(std::stoull(tok));
                if (pos == std::string::npos)
                    break;
                start = pos + 1;
            }
        }
        else
        {
            throw std::invalid_argument("unknown option " + s);
        }
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "error: %s\n", e.what());
        usage(argv[0]);
        return 2;
    }

    TableParams params;
    params.load_factor = a.load_factor;
    try
    {
        // Validates the load factor before any timing starts.
        Table check(params.initial_capacity, params.load_factor);
    }
    catch (const std::invalid_argument &e)
    {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 2;
    }

    print_metadata(a.load_factor);
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.sizes)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;

            // ---- chainmap ----
            print_row(run_table_insert_find(N, a.dist, trial, seed, params, false));
            print_row(run_table_insert_find(N, a.dist, trial, seed, params, true));
            print_row(run_table_churn(N, a.dist, trial, seed + 1, params));
            print_row(run_table_count(N, a.dist, trial, seed + 2, params));
            print_row(run_table_iterate(N, a.dist, trial, seed + 3, params));

            // ---- STL baselines ----
            print_row(run_stl_insert_find(N, a.dist, trial, seed, a.load_factor, false));
            print_row(run_stl_insert_find(N, a.dist, trial, seed, a.load_factor, true));
            print_row(run_stl_churn(N, a.dist, trial, seed + 1, a.load_factor));
            print_row(run_stl_count(N, a.dist, trial, seed + 2, a.load_factor));
            print_row(run_stl_iterate(N, a.dist, trial, seed + 3, a.load_factor));

            ++trial;
        }
    }
    return 0;
}
