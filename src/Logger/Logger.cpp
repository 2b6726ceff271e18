// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>

#define COLOR_YELLOW "\033[1;33m"
#define COLOR_RED    "\033[1;31m"
#define COLOR_RESET  "\033[0m"

namespace {
    std::mutex  g_log_mu;
    std::string g_log_path;
    bool        g_quiet = false;
}


// Desc: append one timestamped line to the log file (best effort)
// In: const std::string& line
// Out: void
static void file_append(const std::string& line) {
    if (g_log_path.empty()) return;
    int fd = ::open(g_log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string out = "[" + std::string(buf) + "] " + line + "\n";
    ssize_t _wr = ::write(fd, out.c_str(), out.size());
    (void)_wr;
    ::close(fd);
}

// Desc: shared sink for all levels
// In: const char* level, const char* color, tag, msg
// Out: void
static void emit(const char* level, const char* color,
                 const std::string& tag, const std::string& msg) {
    const std::string line = std::string(level) + "[" + tag + "] " + msg;
    std::lock_guard<std::mutex> lk(g_log_mu);
    if (!g_quiet) {
        if (color) std::cerr << color << line << COLOR_RESET << "\n";
        else       std::cerr << line << "\n";
    }
    file_append(line);
}


namespace Logger {

void init(const std::string& log_path) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    g_log_path = log_path;
}

void set_quiet(bool quiet) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    g_quiet = quiet;
}

void info(const std::string& tag, const std::string& msg)  { emit("", nullptr, tag, msg); }
void warn(const std::string& tag, const std::string& msg)  { emit("WARN ", COLOR_YELLOW, tag, msg); }
void error(const std::string& tag, const std::string& msg) { emit("ERROR ", COLOR_RED, tag, msg); }

}
