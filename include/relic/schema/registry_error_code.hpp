#pragma once

#include <relic/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace relic::schema {

enum class registry_error_code : uint32_t {
  ok = 0,
  collection_not_published = 1,
  duplicate_identifier = 2,
  identifier_not_found = 3,
};

inline constexpr auto kRegistryErrorCodeNames =
    std::array<std::pair<std::string_view, registry_error_code>, 4>{{
        {"ok", registry_error_code::ok},
        {"collection_not_published",
         registry_error_code::collection_not_published},
        {"duplicate_identifier", registry_error_code::duplicate_identifier},
        {"identifier_not_found", registry_error_code::identifier_not_found},
    }};

constexpr std::string_view to_string(const registry_error_code code) {
  return to_string(code, kRegistryErrorCodeNames).value_or("unknown");
}

constexpr std::optional<registry_error_code> try_registry_error_code(
    const std::string_view name) {
  return from_string(name, kRegistryErrorCodeNames);
}

}  // namespace relic::schema
