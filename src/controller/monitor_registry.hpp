#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Background monitor threads keyed by job name. At most one per job.
class MonitorRegistry {
public:
    // Runs on its own thread; must return promptly once `canceled` is set.
    using Task = std::function<void(const std::atomic<bool>& canceled)>;

    MonitorRegistry() = default;
    ~MonitorRegistry();

    MonitorRegistry(const MonitorRegistry&) = delete;
    MonitorRegistry& operator=(const MonitorRegistry&) = delete;

    // Start `task` for `job_name`. Returns false if one is already running.
    bool start(const std::string& job_name, Task task);

    bool contains(const std::string& job_name);

    // Job names with a monitor still running.
    std::vector<std::string> active();

    // Join monitors that have finished.
    void reap();

    // Cancel every monitor and wait for them to exit.
    void stop_all();

    // Wait until no monitor is running. False on timeout.
    bool wait_idle(int timeout_ms);

private:
    struct Entry {
        std::thread thread;
        std::atomic<bool> canceled{false};
        std::atomic<bool> finished{false};
    };
    std::map<std::string, std::unique_ptr<Entry>> monitors_;
    std::mutex mutex_;

    // Caller holds mutex_. Moves finished entries into `out` for joining.
    void take_finished(std::vector<std::unique_ptr<Entry>>& out);
};
