#pragma once

#include <relic/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace relic::testing {

inline relic::schema::address_t make_address(const uint8_t seed) {
  auto address = relic::schema::address_t{};
  address[0] = seed;
  return address;
}

inline relic::schema::signer_t make_signer(const uint8_t seed) {
  return relic::schema::signer_t{.address = make_address(seed)};
}

inline std::string address_hex(const uint8_t seed) {
  return relic::schema::to_hex(make_address(seed));
}

}  // namespace relic::testing
