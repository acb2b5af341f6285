#pragma once

#include <relic/schema/identifier.hpp>
#include <relic/schema/primitives.hpp>

#include <map>

namespace relic::identity {

/// Source of globally unique asset identifiers.
///
/// Implementations must never hand out the same (address, creation_num) pair
/// twice over their lifetime. Per-address sequence numbers start at 0 and only
/// increase.
class authority {
 public:
  virtual ~authority() = default;

  /// Allocate the next unused identifier scoped to `owner`.
  virtual relic::schema::identifier_t create(
      const relic::schema::address_t& owner) = 0;

  /// Sequence number the next `create` for `address` will use.
  virtual relic::schema::creation_num_t next_creation_num(
      const relic::schema::address_t& address) const = 0;

  /// Rebuild an identifier previously produced by `create`, for lookups.
  static relic::schema::identifier_t reconstruct(
      const relic::schema::address_t& creator_address,
      relic::schema::creation_num_t creation_num);
};

/// In-memory authority keeping one monotonic counter per creator address.
class sequential_authority final : public authority {
 public:
  using counters_t =
      std::map<relic::schema::address_t, relic::schema::creation_num_t>;

  sequential_authority() = default;

  /// Resume from previously issued counters; each value is the next
  /// creation_num for its address.
  explicit sequential_authority(counters_t counters);

  relic::schema::identifier_t create(
      const relic::schema::address_t& owner) override;

  relic::schema::creation_num_t next_creation_num(
      const relic::schema::address_t& address) const override;

 private:
  counters_t counters_;
};

/// Process-wide authority, created on first use.
authority& process_authority();

}  // namespace relic::identity
