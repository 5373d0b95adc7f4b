#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace shoal::cluster {

enum class balancing : uint8_t { round_robin, consistent_hash };

std::optional<balancing> parse_balancing(std::string_view text) noexcept;
std::string_view to_string(balancing kind) noexcept;

// Chooses a worker ordinal among the live ones for a request path.
class balancing_policy {
public:
    virtual ~balancing_policy() = default;

    // nullopt only when live is empty.
    virtual std::optional<int> select(std::span<const int> live, std::string_view path) = 0;
};

// Cycles through the live set in order.
class round_robin_policy final : public balancing_policy {
public:
    std::optional<int> select(std::span<const int> live, std::string_view path) override;

private:
    uint64_t next_ = 0;
};

// Rendezvous hashing on the request path: a path keeps its worker while that
// worker stays live, and only the paths of a departed worker move.
class consistent_hash_policy final : public balancing_policy {
public:
    std::optional<int> select(std::span<const int> live, std::string_view path) override;
};

std::unique_ptr<balancing_policy> make_balancing_policy(balancing kind);

} // namespace shoal::cluster
