#pragma once

#include <string>

// Tagged stderr logging: "[component][LEVEL] message".
namespace hlog {

void set_quiet(bool quiet);   // suppresses INFO lines
bool quiet();

void info(const std::string &component, const std::string &msg);
void warn(const std::string &component, const std::string &msg);
[[noreturn]] void fatal(const std::string &component, const std::string &msg);

} // namespace hlog
