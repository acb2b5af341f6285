#pragma once

#include <relic/registry/asset.hpp>
#include <relic/schema/identifier.hpp>
#include <relic/schema/primitives.hpp>
#include <relic/schema/registry_error_code.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace relic::registry {

/// Ordered assets of one payload type held by one owner.
template <typename T>
struct collection final {
  relic::schema::address_t owner{};
  std::vector<asset<T>> assets;
};

/// Type-erased view of a collection store, so a registry can own stores for
/// any number of payload types.
class collection_store_base {
 public:
  virtual ~collection_store_base() = default;

  /// Number of initialized collections in this store.
  virtual std::size_t collection_count() const = 0;
};

/// Per-owner collections for payload type `T`.
///
/// Lookups are linear scans by identifier; collections are expected to stay
/// small and no secondary index is kept.
template <typename T>
class collection_store final : public collection_store_base {
 public:
  /// Create an empty collection for `owner` if none exists.
  void initialize(const relic::schema::address_t& owner);

  bool exists(const relic::schema::address_t& owner) const;

  /// Position of the first asset with identifier `id`.
  std::optional<std::size_t> index_of(
      const relic::schema::address_t& owner,
      const relic::schema::identifier_t& id) const;

  /// Append `value` to the owner's collection.
  ///
  /// `value` is only moved from when the result is `ok`.
  relic::schema::registry_error_code insert(
      const relic::schema::address_t& owner,
      asset<T>&& value);

  /// Remove and return the asset with identifier `id`.
  ///
  /// On failure returns std::nullopt and sets `error`.
  std::optional<asset<T>> remove_by_identifier(
      const relic::schema::address_t& owner,
      const relic::schema::identifier_t& id,
      relic::schema::registry_error_code& error);

  /// Put a previously removed asset back at `position` (clamped to the end).
  relic::schema::registry_error_code restore(
      const relic::schema::address_t& owner,
      std::size_t position,
      asset<T>&& value);

  const asset<T>* find(const relic::schema::address_t& owner,
                       const relic::schema::identifier_t& id) const;
  asset<T>* find(const relic::schema::address_t& owner,
                 const relic::schema::identifier_t& id);

  const collection<T>* collection_of(
      const relic::schema::address_t& owner) const;

  /// Number of assets the owner holds; 0 when no collection exists.
  std::size_t size(const relic::schema::address_t& owner) const;

  std::size_t collection_count() const override { return collections_.size(); }

 private:
  std::map<relic::schema::address_t, collection<T>> collections_;
};

template <typename T>
void collection_store<T>::initialize(const relic::schema::address_t& owner) {
  if (collections_.contains(owner)) {
    return;
  }
  collections_.emplace(owner, collection<T>{.owner = owner, .assets = {}});
}

template <typename T>
bool collection_store<T>::exists(const relic::schema::address_t& owner) const {
  return collections_.contains(owner);
}

template <typename T>
std::optional<std::size_t> collection_store<T>::index_of(
    const relic::schema::address_t& owner,
    const relic::schema::identifier_t& id) const {
  auto found = collections_.find(owner);
  if (found == std::end(collections_)) {
    return std::nullopt;
  }
  const auto& assets = found->second.assets;
  auto match = std::find_if(
      std::begin(assets), std::end(assets),
      [&](const asset<T>& candidate) { return candidate.id() == id; });
  if (match == std::end(assets)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(std::begin(assets), match));
}

template <typename T>
relic::schema::registry_error_code collection_store<T>::insert(
    const relic::schema::address_t& owner,
    asset<T>&& value) {
  auto found = collections_.find(owner);
  if (found == std::end(collections_)) {
    return relic::schema::registry_error_code::collection_not_published;
  }
  if (index_of(owner, value.id()).has_value()) {
    return relic::schema::registry_error_code::duplicate_identifier;
  }
  found->second.assets.push_back(std::move(value));
  return relic::schema::registry_error_code::ok;
}

template <typename T>
std::optional<asset<T>> collection_store<T>::remove_by_identifier(
    const relic::schema::address_t& owner,
    const relic::schema::identifier_t& id,
    relic::schema::registry_error_code& error) {
  auto found = collections_.find(owner);
  if (found == std::end(collections_)) {
    error = relic::schema::registry_error_code::collection_not_published;
    return std::nullopt;
  }
  auto index = index_of(owner, id);
  if (!index) {
    error = relic::schema::registry_error_code::identifier_not_found;
    return std::nullopt;
  }
  auto& assets = found->second.assets;
  auto position = std::next(std::begin(assets),
                            static_cast<std::ptrdiff_t>(*index));
  auto removed = std::optional<asset<T>>{std::move(*position)};
  assets.erase(position);
  error = relic::schema::registry_error_code::ok;
  return removed;
}

template <typename T>
relic::schema::registry_error_code collection_store<T>::restore(
    const relic::schema::address_t& owner,
    std::size_t position,
    asset<T>&& value) {
  auto found = collections_.find(owner);
  if (found == std::end(collections_)) {
    return relic::schema::registry_error_code::collection_not_published;
  }
  if (index_of(owner, value.id()).has_value()) {
    return relic::schema::registry_error_code::duplicate_identifier;
  }
  auto& assets = found->second.assets;
  position = std::min(position, assets.size());
  assets.insert(
      std::next(std::begin(assets), static_cast<std::ptrdiff_t>(position)),
      std::move(value));
  return relic::schema::registry_error_code::ok;
}

template <typename T>
const asset<T>* collection_store<T>::find(
    const relic::schema::address_t& owner,
    const relic::schema::identifier_t& id) const {
  auto index = index_of(owner, id);
  if (!index) {
    return nullptr;
  }
  return &collections_.at(owner).assets[*index];
}

template <typename T>
asset<T>* collection_store<T>::find(const relic::schema::address_t& owner,
                                    const relic::schema::identifier_t& id) {
  auto index = index_of(owner, id);
  if (!index) {
    return nullptr;
  }
  return &collections_.at(owner).assets[*index];
}

template <typename T>
const collection<T>* collection_store<T>::collection_of(
    const relic::schema::address_t& owner) const {
  auto found = collections_.find(owner);
  if (found == std::end(collections_)) {
    return nullptr;
  }
  return &found->second;
}

template <typename T>
std::size_t collection_store<T>::size(
    const relic::schema::address_t& owner) const {
  auto found = collections_.find(owner);
  if (found == std::end(collections_)) {
    return 0;
  }
  return found->second.assets.size();
}

}  // namespace relic::registry
