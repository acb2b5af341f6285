#pragma once

#include <cstdint>
#include <string>

// Schema type: registry event attribute.
// Registry workflow: key/value pair describing one field of an emitted event.
namespace relic::schema {

template <uint16_t Version>
struct registry_event_attribute;

template <>
struct registry_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
};

using registry_event_attribute_t = registry_event_attribute<1>;

}  // namespace relic::schema
