#include <relic/registry/registry.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <numeric>

namespace relic::registry {

registry::registry(relic::identity::authority& authority)
    : authority_{authority} {
  spdlog::debug("Initializing asset registry");
}

std::size_t registry::collection_count() const {
  return std::accumulate(
      std::begin(stores_), std::end(stores_), std::size_t{0},
      [](const std::size_t total, const auto& entry) {
        return total + entry.second->collection_count();
      });
}

void registry::set_event_observer(event_observer_t observer) {
  observer_ = std::move(observer);
}

relic::schema::operation_result_t registry::reject(
    const relic::schema::registry_error_code code,
    const std::string_view codespace,
    const relic::schema::address_t& owner,
    const relic::schema::identifier_t& id) const {
  auto result = relic::schema::operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{relic::schema::to_string(code)};
  result.info = "owner " + relic::schema::to_hex(owner) + " identifier " +
                relic::schema::to_string(id);
  result.codespace = std::string{codespace};
  spdlog::warn("{} rejected: {} ({})", codespace, result.log, result.info);
  return result;
}

relic::schema::operation_result_t registry::accept(
    relic::schema::registry_event_t event) {
  notify(event);
  auto result = relic::schema::operation_result_t{};
  result.events.push_back(std::move(event));
  return result;
}

void registry::notify(const relic::schema::registry_event_t& event) const {
  if (observer_) {
    observer_(event);
  }
}

relic::schema::registry_event_t registry::make_event(
    const std::string_view type,
    const relic::schema::identifier_t& id,
    std::vector<std::pair<std::string, std::string>> extra) {
  auto event = relic::schema::registry_event_t{};
  event.type = std::string{type};
  event.attributes.push_back(
      {.key = "creator", .value = relic::schema::to_hex(id.creator_address)});
  event.attributes.push_back(
      {.key = "creation_num", .value = std::to_string(id.creation_num)});
  for (auto& [key, value] : extra) {
    event.attributes.push_back({.key = std::move(key), .value = std::move(value)});
  }
  return event;
}

}  // namespace relic::registry
