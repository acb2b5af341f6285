#pragma once

#include <relic/common/critical.hpp>
#include <relic/identity/authority.hpp>
#include <relic/registry/asset.hpp>
#include <relic/registry/collection_store.hpp>
#include <relic/schema/identifier.hpp>
#include <relic/schema/operation_result.hpp>
#include <relic/schema/primitives.hpp>
#include <relic/schema/registry_error_code.hpp>
#include <relic/schema/registry_event.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relic::registry {

inline constexpr auto kPublishCodespace = std::string_view{"relic.publish"};
inline constexpr auto kTransferCodespace = std::string_view{"relic.transfer"};

/// Callback invoked after every successful mint, publish and transfer.
using event_observer_t =
    std::function<void(const relic::schema::registry_event_t&)>;

/// Mint/publish/transfer layer over per-type collection stores.
///
/// Each top-level call either completes or leaves every collection exactly
/// as it was. The registry holds no locks; the host serializes calls.
class registry final {
 public:
  explicit registry(relic::identity::authority& authority =
                        relic::identity::process_authority());

  registry(const registry&) = delete;
  registry& operator=(const registry&) = delete;
  registry(registry&&) = delete;
  registry& operator=(registry&&) = delete;

  /// Create the signer's collection for `T`; a no-op when it already exists.
  template <typename T>
  void initialize_collection(const relic::schema::signer_t& signer);

  /// Construct a new asset with a fresh identifier scoped to the signer.
  ///
  /// No collection is touched; the caller publishes the result.
  template <typename T>
  asset<T> mint(const relic::schema::signer_t& signer,
                T payload,
                relic::schema::bytes_t content);

  /// Insert `value` into `owner`'s collection.
  ///
  /// `value` is consumed only on success; a rejected asset stays with the
  /// caller.
  template <typename T>
  relic::schema::operation_result_t publish(
      const relic::schema::address_t& owner,
      asset<T>&& value);

  /// Move the asset named by (creator_address, creation_num) from the
  /// signer's collection into `to`'s collection.
  ///
  /// If the destination rejects the asset it is put back at its original
  /// position in the signer's collection.
  template <typename T>
  relic::schema::operation_result_t transfer(
      const relic::schema::signer_t& signer,
      const relic::schema::address_t& to,
      const relic::schema::address_t& creator_address,
      relic::schema::creation_num_t creation_num);

  template <typename T>
  bool has_collection(const relic::schema::address_t& owner) const;

  template <typename T>
  bool has_asset(const relic::schema::address_t& owner,
                 const relic::schema::address_t& creator_address,
                 relic::schema::creation_num_t creation_num) const;

  template <typename T>
  std::size_t balance_of(const relic::schema::address_t& owner) const;

  template <typename T>
  const asset<T>* find(const relic::schema::address_t& owner,
                       const relic::schema::address_t& creator_address,
                       relic::schema::creation_num_t creation_num) const;

  template <typename T>
  const collection<T>* collection_of(
      const relic::schema::address_t& owner) const;

  /// Mutable access to an asset in the signer's own collection. Only the
  /// payload can change through it.
  template <typename T>
  asset<T>* borrow_mut(const relic::schema::signer_t& signer,
                       const relic::schema::address_t& creator_address,
                       relic::schema::creation_num_t creation_num);

  /// Initialized collections across every payload type.
  std::size_t collection_count() const;

  void set_event_observer(event_observer_t observer);

 private:
  template <typename T>
  collection_store<T>& store_for();

  template <typename T>
  const collection_store<T>* find_store() const;

  relic::schema::operation_result_t reject(
      relic::schema::registry_error_code code,
      std::string_view codespace,
      const relic::schema::address_t& owner,
      const relic::schema::identifier_t& id) const;

  relic::schema::operation_result_t accept(relic::schema::registry_event_t event);

  void notify(const relic::schema::registry_event_t& event) const;

  static relic::schema::registry_event_t make_event(
      std::string_view type,
      const relic::schema::identifier_t& id,
      std::vector<std::pair<std::string, std::string>> extra);

  relic::identity::authority& authority_;
  std::unordered_map<std::type_index, std::unique_ptr<collection_store_base>>
      stores_;
  event_observer_t observer_;
};

template <typename T>
collection_store<T>& registry::store_for() {
  auto& slot = stores_[std::type_index{typeid(T)}];
  if (!slot) {
    slot = std::make_unique<collection_store<T>>();
  }
  return static_cast<collection_store<T>&>(*slot);
}

template <typename T>
const collection_store<T>* registry::find_store() const {
  auto found = stores_.find(std::type_index{typeid(T)});
  if (found == std::end(stores_)) {
    return nullptr;
  }
  return static_cast<const collection_store<T>*>(found->second.get());
}

template <typename T>
void registry::initialize_collection(const relic::schema::signer_t& signer) {
  auto& store = store_for<T>();
  if (store.exists(signer.address)) {
    return;
  }
  store.initialize(signer.address);
  spdlog::debug("Initialized collection for {}",
                relic::schema::to_hex(signer.address));
}

template <typename T>
asset<T> registry::mint(const relic::schema::signer_t& signer,
                        T payload,
                        relic::schema::bytes_t content) {
  auto id = authority_.create(signer.address);
  auto minted = asset<T>{id, std::move(payload), std::move(content)};
  spdlog::debug("Minted {}", relic::schema::to_string(id));
  notify(make_event(
      "mint", id, {{"owner", relic::schema::to_hex(signer.address)}}));
  return minted;
}

template <typename T>
relic::schema::operation_result_t registry::publish(
    const relic::schema::address_t& owner,
    asset<T>&& value) {
  auto id = value.id();
  auto code = store_for<T>().insert(owner, std::move(value));
  if (code != relic::schema::registry_error_code::ok) {
    return reject(code, kPublishCodespace, owner, id);
  }
  spdlog::debug("Published {} to {}", relic::schema::to_string(id),
                relic::schema::to_hex(owner));
  return accept(
      make_event("publish", id, {{"owner", relic::schema::to_hex(owner)}}));
}

template <typename T>
relic::schema::operation_result_t registry::transfer(
    const relic::schema::signer_t& signer,
    const relic::schema::address_t& to,
    const relic::schema::address_t& creator_address,
    const relic::schema::creation_num_t creation_num) {
  auto id =
      relic::identity::authority::reconstruct(creator_address, creation_num);
  auto& store = store_for<T>();
  auto position = store.index_of(signer.address, id);

  auto code = relic::schema::registry_error_code::ok;
  auto removed = store.remove_by_identifier(signer.address, id, code);
  if (!removed) {
    return reject(code, kTransferCodespace, signer.address, id);
  }

  code = store.insert(to, std::move(*removed));
  if (code != relic::schema::registry_error_code::ok) {
    auto restored =
        store.restore(signer.address, *position, std::move(*removed));
    if (restored != relic::schema::registry_error_code::ok) {
      relic::common::critical("failed to restore asset after rejected transfer");
    }
    return reject(code, kTransferCodespace, to, id);
  }

  spdlog::debug("Transferred {} from {} to {}", relic::schema::to_string(id),
                relic::schema::to_hex(signer.address),
                relic::schema::to_hex(to));
  return accept(make_event("transfer", id,
                           {{"from", relic::schema::to_hex(signer.address)},
                            {"to", relic::schema::to_hex(to)}}));
}

template <typename T>
bool registry::has_collection(const relic::schema::address_t& owner) const {
  const auto* store = find_store<T>();
  return store != nullptr && store->exists(owner);
}

template <typename T>
bool registry::has_asset(const relic::schema::address_t& owner,
                         const relic::schema::address_t& creator_address,
                         const relic::schema::creation_num_t creation_num) const {
  return find<T>(owner, creator_address, creation_num) != nullptr;
}

template <typename T>
std::size_t registry::balance_of(const relic::schema::address_t& owner) const {
  const auto* store = find_store<T>();
  if (store == nullptr) {
    return 0;
  }
  return store->size(owner);
}

template <typename T>
const asset<T>* registry::find(
    const relic::schema::address_t& owner,
    const relic::schema::address_t& creator_address,
    const relic::schema::creation_num_t creation_num) const {
  const auto* store = find_store<T>();
  if (store == nullptr) {
    return nullptr;
  }
  return store->find(owner, relic::identity::authority::reconstruct(
                                creator_address, creation_num));
}

template <typename T>
const collection<T>* registry::collection_of(
    const relic::schema::address_t& owner) const {
  const auto* store = find_store<T>();
  if (store == nullptr) {
    return nullptr;
  }
  return store->collection_of(owner);
}

template <typename T>
asset<T>* registry::borrow_mut(const relic::schema::signer_t& signer,
                               const relic::schema::address_t& creator_address,
                               const relic::schema::creation_num_t creation_num) {
  return store_for<T>().find(
      signer.address,
      relic::identity::authority::reconstruct(creator_address, creation_num));
}

}  // namespace relic::registry
