#pragma once

#include <string>
#include <vector>

// Hardware counters around a timed region, backed by PAPI. Events are read
// from the file named by $PERFCTR_COUNTERS (default "counters.in").
namespace perfctr {

struct Sample {
    std::vector<std::string> names;
    std::vector<long long> values;
};

void init();            // initialises PAPI and builds the event set
void start();
Sample stop();          // also prints PERFCTR_COUNTERS / PERFCTR_VALUES to stderr
void finalize();

// Event names from a counters file: one per line, '#' comments and blank
// lines skipped. Missing file yields an empty list.
std::vector<std::string> read_counters_file(const std::string &path);

// One line per event present in both samples: "name\tbase\tother\tratio".
std::string compare(const Sample &base, const Sample &other);

} // namespace perfctr
