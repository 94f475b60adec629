#include "platform.hpp"
#include <algorithm>
#include <cstdlib>
#include <signal.h>
#include <unistd.h>

namespace platform {

std::optional<std::string> env_var(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

bool sleep_unless(const std::atomic<bool>& stop, int total_ms, int slice_ms) {
    if (slice_ms <= 0) slice_ms = 1;
    int elapsed = 0;
    while (elapsed < total_ms) {
        if (stop.load()) return false;
        int step = std::min(slice_ms, total_ms - elapsed);
        sleep_ms(step);
        elapsed += step;
    }
    return !stop.load();
}

static std::atomic<bool>* g_stop_flag = nullptr;

static void stop_signal_handler(int) {
    if (g_stop_flag) g_stop_flag->store(true);
}

void install_stop_signals(std::atomic<bool>& flag) {
    g_stop_flag = &flag;

    struct sigaction sa;
    sa.sa_handler = stop_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace platform
