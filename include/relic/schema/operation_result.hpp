#pragma once

#include <relic/schema/registry_error_code.hpp>
#include <relic/schema/registry_event.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace relic::schema {

template <uint16_t Version>
struct operation_result;

/// Outcome of a mutating registry call. `code` is 0 on success, otherwise a
/// `registry_error_code` value; `log` carries the code's name and `info` the
/// owner/identifier the failure refers to.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<registry_event_t> events;

  registry_error_code error() const {
    return static_cast<registry_error_code>(code);
  }
};

using operation_result_t = operation_result<1>;

}  // namespace relic::schema
