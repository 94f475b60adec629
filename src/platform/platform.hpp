#pragma once

#include <atomic>
#include <optional>
#include <string>

namespace platform {

// Value of an environment variable, or nullopt when unset or empty.
std::optional<std::string> env_var(const std::string& name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Sleep in short slices, returning early (false) once `stop` is set.
// Returns true if the full duration elapsed.
bool sleep_unless(const std::atomic<bool>& stop, int total_ms, int slice_ms = 100);

// Set `flag` on SIGINT/SIGTERM. The flag must outlive the process.
void install_stop_signals(std::atomic<bool>& flag);

} // namespace platform
