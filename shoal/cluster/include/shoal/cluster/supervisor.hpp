#pragma once

#include "shoal/cluster/channel.hpp"
#include "shoal/cluster/wire.hpp"
#include "shoal/core/reactor.hpp"
#include "shoal/core/result.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace shoal::cluster {

enum class restart_policy : uint8_t { restart, fail_fast, none };

std::optional<restart_policy> parse_restart_policy(std::string_view text) noexcept;
std::string_view to_string(restart_policy policy) noexcept;

struct supervisor_config {
    restart_policy policy = restart_policy::restart;
    std::chrono::milliseconds restart_delay{500};
    // Restarts allowed per ordinal over the coordinator's lifetime.
    int max_restarts = 5;
    // SIGTERM to SIGKILL escalation delay during stop_all().
    std::chrono::milliseconds stop_grace{2000};
};

// Descriptor the channel is moved to in a forked child.
constexpr int CHILD_CHANNEL_FD = 3;

// Body of a forked child. Receives its ordinal and the channel descriptor,
// returns the process exit status.
using child_entry = std::function<int(int ordinal, int channel_fd)>;

/// Forks and watches worker processes.
///
/// Each worker is connected by a socketpair wrapped in a dispatch_channel.
/// Losing the channel or reaping the process marks the worker down; reap()
/// must be called periodically from the reactor thread and applies the
/// restart policy once the process is gone.
class supervisor {
public:
    struct events {
        std::function<void(int ordinal, response_envelope)> on_response;
        // Once per worker incarnation, when it stops being dispatchable.
        std::function<void(int ordinal)> on_worker_lost;
        std::function<void(int ordinal)> on_worker_started;
        // fail_fast policy: a worker died.
        std::function<void(int ordinal)> on_fatal_exit;
    };

    supervisor(reactor& r, supervisor_config config, child_entry entry);
    ~supervisor();

    supervisor(const supervisor&) = delete;
    supervisor& operator=(const supervisor&) = delete;

    void set_events(events handlers) { events_ = std::move(handlers); }

    // Forks the worker for an ordinal (replacing a dead incarnation).
    result<void> spawn(int ordinal);

    // Reaps exited children without blocking.
    void reap();

    // SIGTERM to every child, SIGKILL after the grace period. Blocks until all
    // children are reaped. No restarts happen afterwards.
    void stop_all();

    [[nodiscard]] dispatch_channel* channel(int ordinal) noexcept;

    // Ordinals with an open channel, ascending.
    [[nodiscard]] std::vector<int> live_ordinals() const;

    [[nodiscard]] std::optional<pid_t> pid_of(int ordinal) const noexcept;

    [[nodiscard]] int restart_count(int ordinal) const noexcept;

    [[nodiscard]] bool is_stopping() const noexcept { return stopping_; }

private:
    struct worker_slot {
        pid_t pid = -1;
        std::unique_ptr<dispatch_channel> channel;
        bool dispatchable = false;
        bool restart_scheduled = false;
        int restarts = 0;
    };

    [[noreturn]] void run_child(int ordinal, int channel_fd, pid_t parent);
    void mark_lost(int ordinal, worker_slot& slot);
    void handle_exit(int ordinal, int status);

    reactor& reactor_;
    supervisor_config config_;
    child_entry entry_;
    events events_;
    std::map<int, worker_slot> slots_;
    bool stopping_ = false;
};

} // namespace shoal::cluster
