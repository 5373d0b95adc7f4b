#include "shoal/cluster/balancer.hpp"

namespace shoal::cluster {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

uint64_t fnv1a(std::string_view data, uint64_t hash = FNV_OFFSET_BASIS) noexcept {
    for (char ch : data) {
        hash ^= static_cast<uint8_t>(ch);
        hash *= FNV_PRIME;
    }
    return hash;
}

// Final avalanche step of splitmix64.
uint64_t mix(uint64_t x) noexcept {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

} // namespace

std::optional<balancing> parse_balancing(std::string_view text) noexcept {
    if (text == "round-robin" || text == "round_robin") {
        return balancing::round_robin;
    }
    if (text == "consistent-hash" || text == "consistent_hash") {
        return balancing::consistent_hash;
    }
    return std::nullopt;
}

std::string_view to_string(balancing kind) noexcept {
    switch (kind) {
    case balancing::round_robin:
        return "round-robin";
    case balancing::consistent_hash:
        return "consistent-hash";
    }
    return "unknown";
}

std::optional<int> round_robin_policy::select(std::span<const int> live, std::string_view) {
    if (live.empty()) {
        return std::nullopt;
    }
    return live[next_++ % live.size()];
}

std::optional<int> consistent_hash_policy::select(std::span<const int> live,
                                                  std::string_view path) {
    if (live.empty()) {
        return std::nullopt;
    }

    uint64_t key = fnv1a(path);
    int best = live.front();
    uint64_t best_weight = 0;
    bool first = true;
    for (int ordinal : live) {
        uint64_t weight = mix(key ^ mix(static_cast<uint64_t>(ordinal)));
        if (first || weight > best_weight) {
            best = ordinal;
            best_weight = weight;
            first = false;
        }
    }
    return best;
}

std::unique_ptr<balancing_policy> make_balancing_policy(balancing kind) {
    switch (kind) {
    case balancing::consistent_hash:
        return std::make_unique<consistent_hash_policy>();
    case balancing::round_robin:
        break;
    }
    return std::make_unique<round_robin_policy>();
}

} // namespace shoal::cluster
