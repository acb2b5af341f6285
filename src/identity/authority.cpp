#include <relic/common/critical.hpp>
#include <relic/identity/authority.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <utility>

namespace relic::identity {

relic::schema::identifier_t authority::reconstruct(
    const relic::schema::address_t& creator_address,
    const relic::schema::creation_num_t creation_num) {
  return relic::schema::identifier_t{.creator_address = creator_address,
                                     .creation_num = creation_num};
}

sequential_authority::sequential_authority(counters_t counters)
    : counters_{std::move(counters)} {}

relic::schema::identifier_t sequential_authority::create(
    const relic::schema::address_t& owner) {
  auto& counter = counters_[owner];
  if (counter == std::numeric_limits<relic::schema::creation_num_t>::max()) {
    relic::common::critical("identifier sequence exhausted for creator");
  }
  auto id = reconstruct(owner, counter);
  ++counter;
  spdlog::trace("Allocated identifier {}", relic::schema::to_string(id));
  return id;
}

relic::schema::creation_num_t sequential_authority::next_creation_num(
    const relic::schema::address_t& address) const {
  auto found = counters_.find(address);
  if (found == std::end(counters_)) {
    return 0;
  }
  return found->second;
}

authority& process_authority() {
  static auto instance = sequential_authority{};
  return instance;
}

}  // namespace relic::identity
