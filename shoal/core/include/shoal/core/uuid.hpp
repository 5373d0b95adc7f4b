#pragma once

#include <string>
#include <string_view>

namespace shoal::uuid {

// Random (version 4, RFC 9562 variant) identifier in canonical lowercase form.
// The generator state is per process and is reseeded after fork().
std::string generate_v4();

// Canonical 8-4-4-4-12 hex form with a version nibble of 1-8 and an RFC variant
// nibble (8, 9, a, b), case-insensitive. The nil and max UUIDs are accepted too.
[[nodiscard]] bool is_valid(std::string_view id) noexcept;

} // namespace shoal::uuid
