#include "options.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string_view>

namespace shoal_server {

namespace {

constexpr size_t MAX_WORKERS = 1024;

std::optional<std::string> setting(const std::optional<std::string>& flag, const char* env_name) {
    if (flag) {
        return flag;
    }
    if (const char* value = std::getenv(env_name)) {
        return std::string(value);
    }
    return std::nullopt;
}

template <typename T> std::optional<T> parse_integer(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

std::string unquote(std::string_view value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        char quote = value.front();
        value = value.substr(1, value.size() - 2);
        if (quote == '\'') {
            return std::string(value);
        }
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == 'n') {
                out.push_back('\n');
                ++i;
            } else {
                out.push_back(value[i]);
            }
        }
        return out;
    }

    // Unquoted values end at an inline comment.
    auto hash = value.find(" #");
    if (hash != std::string_view::npos) {
        value = trim(value.substr(0, hash));
    }
    return std::string(value);
}

std::string_view take_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << argv[i] << "\n";
        print_usage(1);
    }
    return argv[++i];
}

} // namespace

[[noreturn]] void print_usage(int status) {
    auto& out = status == 0 ? std::cout : std::cerr;
    out << R"(shoal_server - multi-process user service

Usage:
  shoal_server [options]

Options:
  -p, --port <port>              Public port (env PORT, default 4000)
  -w, --workers <count>          Worker processes, 0 serves in-process
                                 (env WORKER_COUNT, default: CPU count - 1)
  --dispatch-timeout-ms <ms>     Deadline for a worker reply
                                 (env DISPATCH_TIMEOUT_MS, default 5000)
  --restart <policy>             restart | fail-fast | none
                                 (env RESTART_POLICY, default restart)
  --balance <policy>             round-robin | consistent-hash
                                 (env BALANCING, default round-robin)
  --env-file <path>              Variables file loaded first (default .env)
  -h, --help                     Show this help

Worker N listens on port + N.
)";
    std::exit(status);
}

options parse_args(int argc, char** argv) {
    options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(0);
        } else if (arg == "-p" || arg == "--port") {
            opts.port = std::string(take_value(argc, argv, i));
        } else if (arg == "-w" || arg == "--workers") {
            opts.workers = std::string(take_value(argc, argv, i));
        } else if (arg == "--dispatch-timeout-ms") {
            opts.dispatch_timeout_ms = std::string(take_value(argc, argv, i));
        } else if (arg == "--restart") {
            opts.restart = std::string(take_value(argc, argv, i));
        } else if (arg == "--balance") {
            opts.balance = std::string(take_value(argc, argv, i));
        } else if (arg == "--env-file") {
            opts.env_file = std::string(take_value(argc, argv, i));
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(1);
        }
    }
    return opts;
}

std::expected<size_t, std::string> load_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected("cannot open " + path);
    }

    size_t applied = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string_view text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        if (text.starts_with("export ")) {
            text = trim(text.substr(7));
        }

        auto eq = text.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        std::string key(trim(text.substr(0, eq)));
        if (key.empty()) {
            continue;
        }
        std::string value = unquote(trim(text.substr(eq + 1)));

        if (std::getenv(key.c_str())) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) != 0) {
            return std::unexpected("cannot set " + key);
        }
        ++applied;
    }
    return applied;
}

std::expected<shoal::cluster::coordinator_config, std::string> resolve_config(const options& opts) {
    using namespace shoal::cluster;
    coordinator_config config;

    config.port = DEFAULT_PORT;
    if (auto port = setting(opts.port, "PORT")) {
        auto parsed = parse_integer<uint16_t>(*port);
        if (!parsed || *parsed == 0) {
            return std::unexpected("invalid port: " + *port);
        }
        config.port = *parsed;
    }

    config.worker_count = default_worker_count();
    if (auto workers = setting(opts.workers, "WORKER_COUNT")) {
        auto parsed = parse_integer<size_t>(*workers);
        if (!parsed || *parsed > MAX_WORKERS) {
            return std::unexpected("invalid worker count: " + *workers);
        }
        config.worker_count = *parsed;
    }
    if (config.port + config.worker_count > 65535) {
        return std::unexpected("port + worker count exceeds 65535");
    }

    if (auto timeout = setting(opts.dispatch_timeout_ms, "DISPATCH_TIMEOUT_MS")) {
        auto parsed = parse_integer<uint32_t>(*timeout);
        if (!parsed || *parsed == 0) {
            return std::unexpected("invalid dispatch timeout: " + *timeout);
        }
        config.dispatch_timeout = std::chrono::milliseconds(*parsed);
    }

    if (auto restart = setting(opts.restart, "RESTART_POLICY")) {
        auto parsed = parse_restart_policy(*restart);
        if (!parsed) {
            return std::unexpected("unknown restart policy: " + *restart);
        }
        config.supervision.policy = *parsed;
    }

    if (auto balance = setting(opts.balance, "BALANCING")) {
        auto parsed = parse_balancing(*balance);
        if (!parsed) {
            return std::unexpected("unknown balancing policy: " + *balance);
        }
        config.balance = *parsed;
    }

    return config;
}

} // namespace shoal_server
