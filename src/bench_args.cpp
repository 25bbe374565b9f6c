#include "bench_args.h"
#include "hilbert_curve.h"

#include <cstdio>
#include <map>
#include <stdexcept>
#include <vector>

bool parse_mode(const std::string &name, BenchMode &mode) {
    static const std::map<std::string, BenchMode> mode_map = {
        {"naive", BenchMode::Naive},
        {"hilbert", BenchMode::Hilbert},
        {"hilbert_lazy", BenchMode::HilbertLazy},
        {"compare", BenchMode::Compare},
        {"sweep", BenchMode::Sweep}
    };

    auto it = mode_map.find(name);
    if (it == mode_map.end()) return false;
    mode = it->second;
    return true;
}

// std::stoi accepts trailing junk ("12abc"); reject it here.
static long parse_integer(const std::string &s, const char *what) {
    std::size_t pos = 0;
    long value = 0;
    try {
        value = std::stol(s, &pos);
    } catch (const std::exception &) {
        throw std::invalid_argument(std::string(what) + " is not a number: '" + s + "'");
    }
    if (pos != s.size()) {
        throw std::invalid_argument(std::string(what) + " is not a number: '" + s + "'");
    }
    return value;
}

BenchOptions parse_args(int argc, char **argv) {
    BenchOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            return opts;
        } else if (arg == "--reps") {
            if (i + 1 >= argc) throw std::invalid_argument("--reps needs a value");
            long r = parse_integer(argv[++i], "--reps");
            if (r <= 0) throw std::invalid_argument("--reps must be positive");
            opts.reps = static_cast<int>(r);
        } else if (arg == "--verify") {
            opts.verify = true;
        } else if (arg == "--print-output") {
            opts.print_output = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            throw std::invalid_argument("unknown option '" + arg + "'");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        throw std::invalid_argument("expected N, mode and seed");
    }

    long n = parse_integer(positional[0], "N");
    if (n <= 0 || n > (1L << 15) || !hilbert::is_power_of_two(static_cast<int>(n))) {
        throw std::invalid_argument("N must be a power of two between 1 and 32768");
    }
    opts.N = static_cast<int>(n);

    opts.mode_name = positional[1];
    if (!parse_mode(opts.mode_name, opts.mode)) {
        throw std::invalid_argument("unknown mode '" + opts.mode_name + "'");
    }

    long seed = parse_integer(positional[2], "seed");
    if (seed < 0) throw std::invalid_argument("seed must be non-negative");
    opts.seed = static_cast<unsigned int>(seed);

    return opts;
}

void usage(const char *prg) {
    fprintf(stderr, "Usage: %s N mode seed [--reps R] [--verify] [--print-output] [--quiet]\n", prg);
    fprintf(stderr, "  N     matrix side, a power of two\n");
    fprintf(stderr, "Modes: naive, hilbert, hilbert_lazy, compare, sweep\n");
    fprintf(stderr, "Counters are read from $PERFCTR_COUNTERS (default: counters.in)\n");
}
