#pragma once

#include <string>

enum class BenchMode { Naive, Hilbert, HilbertLazy, Compare, Sweep };

struct BenchOptions {
    int N = 0;
    BenchMode mode = BenchMode::Naive;
    std::string mode_name = "naive";
    unsigned int seed = 10;
    int reps = 20;
    bool verify = false;
    bool print_output = false;
    bool quiet = false;
    bool show_help = false;
};

// Parses "N mode seed [--reps R] [--verify] [--print-output] [--quiet]".
// Throws std::invalid_argument on malformed input; --help short-circuits.
BenchOptions parse_args(int argc, char **argv);

// Returns false for unknown names.
bool parse_mode(const std::string &name, BenchMode &mode);

void usage(const char *prg);
