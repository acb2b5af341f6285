#pragma once

#include <relic/schema/registry_event_attribute.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: registry event.
// Registry workflow: notification of a completed mint, publish or transfer
// handed to the installed observer.
namespace relic::schema {

template <uint16_t Version>
struct registry_event;

template <>
struct registry_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<registry_event_attribute_t> attributes;

  /// Value of the first attribute named `key`, if any.
  std::optional<std::string_view> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return std::string_view{entry.value};
      }
    }
    return std::nullopt;
  }
};

using registry_event_t = registry_event<1>;

}  // namespace relic::schema
