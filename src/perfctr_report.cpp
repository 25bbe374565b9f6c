#include "perfctr.h"
#include "log.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace perfctr {

static std::string trim(const std::string &s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::vector<std::string> read_counters_file(const std::string &path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    if (!in.is_open()) {
        hlog::warn("perfctr", "Could not open counters file: " + path + " (" + std::strerror(errno) + ")");
        return lines;
    }
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        lines.push_back(t);
    }
    return lines;
}

std::string compare(const Sample &base, const Sample &other) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    for (size_t i = 0; i < base.names.size() && i < base.values.size(); ++i) {
        for (size_t k = 0; k < other.names.size() && k < other.values.size(); ++k) {
            if (other.names[k] != base.names[i]) continue;
            os << base.names[i] << "\t" << base.values[i] << "\t" << other.values[k] << "\t";
            if (base.values[i] != 0) {
                os << static_cast<double>(other.values[k]) / static_cast<double>(base.values[i]);
            } else {
                os << "n/a";
            }
            os << "\n";
            break;
        }
    }
    return os.str();
}

} // namespace perfctr
