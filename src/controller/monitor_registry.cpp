#include "monitor_registry.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

MonitorRegistry::~MonitorRegistry() {
    stop_all();
}

void MonitorRegistry::take_finished(std::vector<std::unique_ptr<Entry>>& out) {
    for (auto it = monitors_.begin(); it != monitors_.end();) {
        if (it->second->finished.load()) {
            out.push_back(std::move(it->second));
            it = monitors_.erase(it);
        } else {
            ++it;
        }
    }
}

bool MonitorRegistry::start(const std::string& job_name, Task task) {
    std::vector<std::unique_ptr<Entry>> done;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        take_finished(done);
        if (!monitors_.count(job_name)) {
            auto entry = std::make_unique<Entry>();
            auto* raw = entry.get();
            entry->thread = std::thread([raw, task = std::move(task)]() {
                task(raw->canceled);
                raw->finished.store(true);
            });
            monitors_[job_name] = std::move(entry);
            started = true;
        }
    }
    for (auto& e : done) {
        if (e->thread.joinable()) e->thread.join();
    }

    if (started) forgeop_log(fmt::format("monitor: started for job {}", job_name));
    return started;
}

bool MonitorRegistry::contains(const std::string& job_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = monitors_.find(job_name);
    return it != monitors_.end() && !it->second->finished.load();
}

std::vector<std::string> MonitorRegistry::active() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, entry] : monitors_) {
        if (!entry->finished.load()) names.push_back(name);
    }
    return names;
}

void MonitorRegistry::reap() {
    std::vector<std::unique_ptr<Entry>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        take_finished(done);
    }
    for (auto& e : done) {
        if (e->thread.joinable()) e->thread.join();
    }
}

void MonitorRegistry::stop_all() {
    std::map<std::string, std::unique_ptr<Entry>> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(monitors_);
    }
    for (auto& [name, e] : local) {
        e->canceled.store(true);
    }
    for (auto& [name, e] : local) {
        if (e->thread.joinable())
            e->thread.join();
    }
    if (!local.empty())
        forgeop_log(fmt::format("monitor: stopped {} monitor(s)", local.size()));
}

bool MonitorRegistry::wait_idle(int timeout_ms) {
    int waited = 0;
    while (true) {
        reap();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (monitors_.empty()) return true;
        }
        if (waited >= timeout_ms) return false;
        platform::sleep_ms(10);
        waited += 10;
    }
}
