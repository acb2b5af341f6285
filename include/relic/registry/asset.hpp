#pragma once

#include <relic/schema/identifier.hpp>
#include <relic/schema/primitives.hpp>

#include <utility>

namespace relic::registry {

class registry;

/// A uniquely identified, caller-typed value with an attached content
/// pointer.
///
/// Assets are only created by `registry::mint` and cannot be copied, so an
/// identifier lives in exactly one place: a caller variable or one
/// collection. The registry never inspects `T`.
template <typename T>
class asset final {
 public:
  using payload_type = T;

  asset(const asset&) = delete;
  asset& operator=(const asset&) = delete;
  asset(asset&&) = default;
  asset& operator=(asset&&) = default;
  ~asset() = default;

  const relic::schema::identifier_t& id() const { return id_; }
  const T& payload() const { return payload_; }
  T& payload() { return payload_; }
  const relic::schema::bytes_t& content() const { return content_; }

 private:
  friend class registry;

  asset(relic::schema::identifier_t id, T payload, relic::schema::bytes_t content)
      : id_{std::move(id)},
        payload_{std::move(payload)},
        content_{std::move(content)} {}

  relic::schema::identifier_t id_;
  T payload_;
  relic::schema::bytes_t content_;
};

template <typename T>
const relic::schema::identifier_t& identifier_of(const asset<T>& value) {
  return value.id();
}

template <typename T>
const relic::schema::address_t& creator_of(const asset<T>& value) {
  return value.id().creator_address;
}

template <typename T>
const T& payload_of(const asset<T>& value) {
  return value.payload();
}

template <typename T>
T& payload_of(asset<T>& value) {
  return value.payload();
}

template <typename T>
const relic::schema::bytes_t& content_of(const asset<T>& value) {
  return value.content();
}

}  // namespace relic::registry
