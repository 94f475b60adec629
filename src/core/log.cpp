#include "log.hpp"
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_file_path() {
    static std::string path;
    return path;
}

std::atomic<bool> g_quiet{false};

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

void write_line(const char* level, const std::string& msg) {
    std::string line = fmt::format("[{}] {:<5} {}\n", timestamp(), level, msg);

    std::lock_guard<std::mutex> lock(log_mutex());
    if (!g_quiet.load()) {
        std::cerr << line;
        std::cerr.flush();
    }
    const auto& path = log_file_path();
    if (path.empty()) return;
    std::ofstream out(path, std::ios::app);
    if (out) out << line;
}

} // namespace

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_file_path() = path;
}

void set_log_quiet(bool quiet) {
    g_quiet.store(quiet);
}

void forgeop_log(const std::string& msg) {
    write_line("INFO", msg);
}

void forgeop_log_warn(const std::string& msg) {
    write_line("WARN", msg);
}

void forgeop_log_error(const std::string& msg) {
    write_line("ERROR", msg);
}

void forgeop_log_cmd(const std::string& label, const std::string& cmd,
                     const CommandResult& r) {
    forgeop_log(fmt::format("{} CMD: {}", label, cmd));
    forgeop_log(fmt::format("{} exit={}{} stdout({})={}", label, r.exit_code,
                            r.timed_out ? " (timed out)" : "",
                            r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        forgeop_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
