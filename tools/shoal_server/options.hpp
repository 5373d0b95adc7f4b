#pragma once

#include "shoal/cluster/coordinator.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace shoal_server {

// Command-line values; unset ones fall back to the environment.
struct options {
    std::optional<std::string> port;                // PORT
    std::optional<std::string> workers;             // WORKER_COUNT
    std::optional<std::string> dispatch_timeout_ms; // DISPATCH_TIMEOUT_MS
    std::optional<std::string> restart;             // RESTART_POLICY
    std::optional<std::string> balance;             // BALANCING
    std::optional<std::string> env_file;
};

constexpr uint16_t DEFAULT_PORT = 4000;

[[noreturn]] void print_usage(int status);
options parse_args(int argc, char** argv);

// Loads KEY=VALUE lines into the environment. Variables that are already set
// keep their value. Returns the number of variables set.
std::expected<size_t, std::string> load_env_file(const std::string& path);

std::expected<shoal::cluster::coordinator_config, std::string> resolve_config(const options& opts);

} // namespace shoal_server
