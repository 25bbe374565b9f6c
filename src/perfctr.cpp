#include "perfctr.h"
#include "log.h"

#include <papi.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace perfctr {

static int EventSet = PAPI_NULL;
static std::vector<int> event_codes;
static std::vector<std::string> event_names;
static bool inited = false;
static bool running = false;
static bool multiplex_ok = false;   // PAPI_multiplex_init succeeded
static bool multiplexed = false;    // event set switched to multiplexing

static const char *DEFAULT_COUNTERS_FILE = "counters.in";

static void show_papi_info() {
    const PAPI_hw_info_t *hw = PAPI_get_hardware_info();
    if (hw) {
        hlog::info("perfctr", std::string("PAPI hardware info: vendor=") + hw->vendor_string +
                                  " model=" + hw->model_string);
    } else {
        hlog::info("perfctr", "PAPI_get_hardware_info() not available.");
    }
    hlog::info("perfctr", "Hardware counters available: " + std::to_string(PAPI_num_hwctrs()));
}

static bool name_to_code(const std::string &name, int &code) {
    if (PAPI_event_name_to_code(const_cast<char *>(name.c_str()), &code) == PAPI_OK) return true;
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return PAPI_event_name_to_code(const_cast<char *>(upper.c_str()), &code) == PAPI_OK;
}

// Multiplexing can only be enabled once the event set is bound to a
// component, i.e. after its first successful add.
static bool enable_multiplex() {
    if (multiplexed) return true;
    if (!multiplex_ok) return false;
    int ret = PAPI_set_multiplex(EventSet);
    if (ret != PAPI_OK) {
        hlog::warn("perfctr", std::string("PAPI_set_multiplex failed: ") + PAPI_strerror(ret));
        return false;
    }
    multiplexed = true;
    hlog::info("perfctr", "Multiplexing enabled for event set.");
    return true;
}

static bool add_event(const std::string &name, int code) {
    int ret = PAPI_add_event(EventSet, code);
    if (ret != PAPI_OK) {
        hlog::warn("perfctr", "Failed to add event '" + name + "': " + PAPI_strerror(ret));
        if (!enable_multiplex()) return false;
        ret = PAPI_add_event(EventSet, code);
        if (ret != PAPI_OK) {
            hlog::warn("perfctr", "Retry with multiplexing failed for '" + name + "': " + PAPI_strerror(ret));
            return false;
        }
    }
    event_codes.push_back(code);
    event_names.push_back(name);
    hlog::info("perfctr", "Added event: " + name);
    return true;
}

static void build_eventset(const std::string &path) {
    auto names = read_counters_file(path);
    if (names.empty()) {
        hlog::warn("perfctr", "No events read from '" + path + "'. No counters will be measured.");
        return;
    }

    int ret = PAPI_create_eventset(&EventSet);
    if (ret != PAPI_OK) {
        hlog::fatal("perfctr", std::string("PAPI_create_eventset failed: ") + PAPI_strerror(ret));
    }

    for (const auto &name : names) {
        int code = 0;
        if (!name_to_code(name, code)) {
            hlog::warn("perfctr", "Event not available (skipping): " + name);
            continue;
        }
        bool first = event_codes.empty();
        if (add_event(name, code) && first && multiplex_ok) {
            enable_multiplex();
        }
    }

    if (event_codes.empty()) {
        hlog::warn("perfctr", "No events added to the event set. Counters will not be measured.");
    } else {
        hlog::info("perfctr", "Total events added: " + std::to_string(event_codes.size()) +
                                  ", multiplexing " + (multiplexed ? "ON" : "OFF"));
    }
}

void init() {
    if (inited) return;

    int retval = PAPI_library_init(PAPI_VER_CURRENT);
    if (retval != PAPI_VER_CURRENT && retval > 0) {
        hlog::fatal("perfctr", "PAPI_library_init version mismatch");
    } else if (retval < 0) {
        hlog::fatal("perfctr", std::string("PAPI_library_init failed: ") + PAPI_strerror(retval));
    }
    hlog::info("perfctr", "PAPI initialized.");
    show_papi_info();

    int mret = PAPI_multiplex_init();
    if (mret != PAPI_OK) {
        hlog::warn("perfctr", std::string("PAPI_multiplex_init() failed: ") + PAPI_strerror(mret) +
                                  ". Multiplexing unavailable.");
        multiplex_ok = false;
    } else {
        multiplex_ok = true;
    }

    const char *envp = std::getenv("PERFCTR_COUNTERS");
    std::string counters_file = envp ? std::string(envp) : std::string(DEFAULT_COUNTERS_FILE);
    hlog::info("perfctr", "Reading counters from: " + counters_file);
    build_eventset(counters_file);

    inited = true;
}

void start() {
    if (!inited) init();
    if (running) return;
    running = true;
    if (event_codes.empty()) return;

    int ret = PAPI_start(EventSet);
    if (ret != PAPI_OK) {
        hlog::warn("perfctr", std::string("PAPI_start failed: ") + PAPI_strerror(ret));
        running = false;
    }
}

Sample stop() {
    Sample sample;
    if (!running) {
        hlog::warn("perfctr", "stop called without a running measurement.");
        return sample;
    }
    running = false;
    if (event_codes.empty()) return sample;

    std::vector<long long> values(event_codes.size(), 0LL);
    int ret = PAPI_stop(EventSet, values.data());
    if (ret != PAPI_OK) {
        hlog::warn("perfctr", std::string("PAPI_stop returned error: ") + PAPI_strerror(ret));
        if (PAPI_read(EventSet, values.data()) != PAPI_OK) {
            hlog::warn("perfctr", "PAPI_read also failed; no counter values.");
            return sample;
        }
    }

    sample.names = event_names;
    sample.values = values;

    // stderr, so stdout stays clean for data
    std::cerr << "PERFCTR_COUNTERS";
    for (const auto &name : sample.names) std::cerr << "\t" << name;
    std::cerr << std::endl;
    std::cerr << "PERFCTR_VALUES";
    for (long long v : sample.values) std::cerr << "\t" << v;
    std::cerr << std::endl;

    return sample;
}

void finalize() {
    if (!inited) return;
    if (EventSet != PAPI_NULL) {
        PAPI_cleanup_eventset(EventSet);
        PAPI_destroy_eventset(&EventSet);
        EventSet = PAPI_NULL;
    }
    PAPI_shutdown();
    event_codes.clear();
    event_names.clear();
    multiplexed = false;
    inited = false;
    hlog::info("perfctr", "PAPI finalized.");
}

} // namespace perfctr
