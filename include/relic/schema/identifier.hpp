#pragma once
#include <relic/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: identifier.
// Registry workflow: globally unique name of an asset for its whole lifetime,
// scoped to the address that minted it.
namespace relic::schema {

template <uint16_t Version>
struct identifier;

template <>
struct identifier<1> final {
  uint16_t version{1};
  address_t creator_address{};
  creation_num_t creation_num{};

  bool operator==(const identifier<1>&) const = default;
};

using identifier_t = identifier<1>;

/// Render as `<creator hex>:<creation_num>` for logs and diagnostics.
std::string to_string(const identifier_t& id);

}  // namespace relic::schema
