// include/Logger.hpp
#pragma once
#include <string>

namespace Logger {
// Append target for timestamped lines; empty path keeps stderr only.
void init(const std::string& log_path);
void set_quiet(bool quiet);

void info(const std::string& tag, const std::string& msg);
void warn(const std::string& tag, const std::string& msg);
void error(const std::string& tag, const std::string& msg);
}
