// Experiment: run one command many times in parallel through a pool.
//
// Usage: pooled_exec <host> <command> [parallel] [config.yaml]
//
// <host> names an entry under `hosts:` in the config (default
// ~/.sshpool/config.yaml). Every worker opens its own session, but all
// of them share a single SSH connection; the debug log shows one dial.

#include <core/config.hpp>
#include <core/log.hpp>
#include <core/types.hpp>
#include <pool/pool.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 3) {
        fmt::print(stderr, "usage: {} <host> <command> [parallel] [config.yaml]\n", argv[0]);
        return 2;
    }
    std::string host_name = argv[1];
    std::string command = argv[2];
    int parallel = argc > 3 ? std::atoi(argv[3]) : 4;
    if (parallel <= 0) parallel = 1;

    auto config = argc > 4 ? Config::load(argv[4]) : Config::load_default();
    if (config.is_err()) {
        fmt::print(stderr, "{}\n", config.error);
        return 1;
    }

    if (config.value.pool().log_path) {
        set_pool_log_path(*config.value.pool().log_path);
    }

    const HostConfig* host = config.value.host(host_name);
    auto creds = config.value.client_config(host_name);
    if (!host || creds.is_err()) {
        fmt::print(stderr, "{}\n", creds.error);
        return 1;
    }

    Pool pool(make_pool_options(config.value.pool()));

    std::mutex print_mtx;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    auto start = std::chrono::steady_clock::now();

    for (int i = 0; i < parallel; i++) {
        workers.emplace_back([&, i] {
            auto session = pool.open(host->network, host->address, creds.value);
            if (session.is_err()) {
                failures++;
                std::lock_guard<std::mutex> lock(print_mtx);
                fmt::print(stderr, "[{}] open failed: {}\n", i, session.error);
                return;
            }

            auto result = session.value->run(command);
            std::lock_guard<std::mutex> lock(print_mtx);
            if (result.failed()) {
                failures++;
                fmt::print(stderr, "[{}] exit={} {}\n", i, result.exit_code, result.stderr_data);
            } else {
                fmt::print("[{}] {}", i, result.stdout_data);
            }
        });
    }

    for (auto& t : workers) t.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    fmt::print("{} sessions, {} failed, {} pooled connection(s), {}ms\n",
               parallel, failures.load(), pool.size(), elapsed);
    fmt::print("debug log: {}\n", pool_log_path());

    return failures.load() == 0 ? 0 : 1;
}
