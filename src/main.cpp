#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <controller/controller.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <kube/kubectl.hpp>
#include <kube/kubectl_job_runner.hpp>
#include <kube/kubectl_store.hpp>
#include <platform/platform.hpp>
#include <storage/minio_artifact_store.hpp>
#include <workloads/workload.hpp>
#include <fmt/format.h>

static std::atomic<bool> g_stop{false};

static void print_usage() {
    std::cout << "forgeop " << FORGEOP_VERSION << "\n\n"
              << "Usage:\n"
              << "    forgeop                 Run the controller\n"
              << "    forgeop run             Run the controller\n"
              << "    forgeop check-config    Print the effective configuration\n"
              << "    forgeop --version       Show version\n"
              << "    forgeop --help          Show this help\n\n"
              << "Configuration is read from $FORGEOP_CONFIG (default "
              << default_config_path().string() << ")\n"
              << "and overridden by environment variables.\n";
}

static int run_controller(const Config& config) {
    set_log_file(config.log_file());

    auto workload = make_workload(config);
    forgeop_log(fmt::format("forgeop {} starting: kind={} namespace={}",
                            FORGEOP_VERSION, workload_kind_name(config.kind()), config.ns()));

    Kubectl kubectl(config.kubectl());
    KubectlResourceStore store(kubectl, workload->resource());
    KubectlJobRunner runner(kubectl);

    auto reachable = store.check_access();
    if (reachable.is_err()) {
        forgeop_log_error(fmt::format("cannot reach {}: {}",
                                      workload->resource().qualified(), reachable.error));
        return 1;
    }

    std::unique_ptr<ArtifactStore> artifacts;
    if (config.kind() == WorkloadKind::Site) {
        artifacts = std::make_unique<MinioArtifactStore>(config.storage());
    }

    platform::install_stop_signals(g_stop);

    ControllerOptions opts;
    opts.reconcile.monitor.poll_interval_ms = config.monitor().poll_interval_secs * 1000;
    opts.reconcile.monitor.message_cap = config.monitor().message_cap;

    Controller controller(store, runner, *workload, artifacts.get(), g_stop,
                          [] { return now_unix(); }, opts);
    controller.run();

    forgeop_log(fmt::format("forgeop stopped after {} event(s)", controller.processed()));
    return 0;
}

int main(int argc, char** argv) {
    try {
        std::string cmd = argc >= 2 ? argv[1] : "run";

        if (cmd == "--version") {
            std::cout << "forgeop version " << FORGEOP_VERSION << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }

        if (cmd != "run" && cmd != "check-config") {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }

        auto config = Config::load();
        if (config.is_err()) {
            std::cerr << "forgeop: " << config.error << "\n";
            return 1;
        }

        if (cmd == "check-config") {
            std::cout << config.value.describe();
            return 0;
        }
        return run_controller(config.value);
    } catch (const std::exception& e) {
        std::cerr << "forgeop: " << e.what() << "\n";
        return 1;
    }
}
