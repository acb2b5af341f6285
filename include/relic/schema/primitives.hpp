#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace relic::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = hash32_t;
using creation_num_t = uint64_t;

bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);

/// Decode 64 hex characters, with or without a `0x` prefix.
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);

/// Authenticated actor on whose behalf a registry call executes.
///
/// Authentication is the host environment's job; by the time a signer
/// reaches the registry its address is trusted.
struct signer_t final {
  address_t address{};
};

}  // namespace relic::schema
