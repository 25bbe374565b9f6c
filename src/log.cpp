#include "log.h"

#include <cstdlib>
#include <iostream>

namespace hlog {

static bool quiet_mode = false;

void set_quiet(bool q) { quiet_mode = q; }
bool quiet() { return quiet_mode; }

void info(const std::string &component, const std::string &msg) {
    if (quiet_mode) return;
    std::cerr << "[" << component << "][INFO] " << msg << std::endl;
}

void warn(const std::string &component, const std::string &msg) {
    std::cerr << "[" << component << "][WARN] " << msg << std::endl;
}

void fatal(const std::string &component, const std::string &msg) {
    std::cerr << "[" << component << "][FATAL] " << msg << std::endl;
    std::exit(1);
}

} // namespace hlog
