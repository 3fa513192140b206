#include <iostream>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <stdexcept>
#include <algorithm>
#include "workloads.hpp"
#include "workloads_stl.hpp"

static void print_metadata(){
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
}

static std::vector<std::string> split_csv(const std::string &v)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true)
    {
        auto pos = v.find(',', start);
        std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
        if (!tok.empty())
            out.push_back(tok);
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
    return out;
}

struct Args
{
    std::vector<std::size_t> sizes{1024, 4096, 16384, 65536, 262144, 1048576};
    std::vector<std::string> ops{"build", "pushpop", "remove_at", "replace"};
    int trials = 8;
    Dist dist = Dist::Uniform;
    std::uint64_t seed0 = 42;

    bool wants(const char *op) const { return std::find(ops.begin(), ops.end(), op) != ops.end(); }
};

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        std::string v;
        if (i + 1 < argc)
            v = argv[i + 1];
        else
        {
            std::fprintf(stderr, "# ignoring %s: missing value\n", s.c_str());
            break;
        }
        ++i;
        try
        {
            if (s == "--trials")
                a.trials = std::stoi(v);
            else if (s == "--dist")
                a.dist = parse_dist(v);
            else if (s == "--seed")
                a.seed0 = std::stoull(v);
            else if (s == "--sizes")
            {
                a.sizes.clear();
                for (auto &tok : split_csv(v))
                    a.sizes.push_back(std::stoull(tok));
            }
            else if (s == "--ops")
                a.ops = split_csv(v);
            else
                std::fprintf(stderr, "# unknown flag %s\n", s.c_str());
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "usage: heap_bench [--trials N] [--dist uniform|zipf|ascending|descending] "
                                 "[--seed S] [--sizes a,b,c] [--ops build,pushpop,remove_at,replace]\n"
                                 "bad value '%s' for %s (%s)\n",
                         v.c_str(), s.c_str(), e.what());
            std::exit(2);
        }
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a = parse(argc, argv);
    print_metadata();
    std::fprintf(stderr, "# dist: %s trials: %d\n", dist_name(a.dist), a.trials);
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.sizes)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;

            if (a.wants("build"))
            {
                print_row(run_build_from(N, a.dist, trial, seed));
                print_row(run_build_insert(N, a.dist, trial, seed));
                print_row(run_build_stl_make_heap(N, a.dist, trial, seed));
            }
            if (a.wants("pushpop"))
            {
                print_row(run_heap_pushpop(N, a.dist, trial, seed + 1));
                print_row(run_heap_stl_pushpop(N, a.dist, trial, seed + 1));
            }
            if (a.wants("remove_at"))
                print_row(run_remove_at(N, a.dist, trial, seed + 2));
            if (a.wants("replace"))
                print_row(run_replace(N, a.dist, trial, seed + 3));

            ++trial;
        }
    }
    return 0;
}
