#include <gtest/gtest.h>
#include <relic/registry/registry.hpp>
#include <relic/testing/common.hpp>
#include <relic/testing/registry_fixture.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace {

using relic::schema::registry_error_code;
using relic::testing::artwork;

relic::schema::bytes_t make_content(const std::string_view uri) {
  return relic::schema::make_bytes(uri);
}

relic::registry::asset<artwork> mint_artwork(
    relic::registry::registry& registry,
    const relic::schema::signer_t& signer,
    const std::string_view title) {
  return registry.mint(signer, artwork{.title = std::string{title}},
                       make_content("ipfs://relic"));
}

registry_error_code error_of(const relic::schema::operation_result_t& result) {
  return result.error();
}

}  // namespace

TEST(registry, mint_builds_asset_without_touching_collections) {
  auto fixture = relic::testing::registry_fixture{};
  auto minter = relic::testing::make_signer(1);

  auto minted = fixture.registry().mint(
      minter, artwork{.title = "dawn", .edition = 3},
      make_content("ipfs://dawn"));

  EXPECT_EQ(relic::registry::identifier_of(minted),
            relic::identity::authority::reconstruct(minter.address, 0));
  EXPECT_EQ(relic::registry::creator_of(minted), minter.address);
  EXPECT_EQ(relic::registry::payload_of(minted).title, "dawn");
  EXPECT_EQ(relic::registry::payload_of(minted).edition, 3u);
  EXPECT_EQ(relic::schema::make_string(relic::registry::content_of(minted)),
            "ipfs://dawn");

  EXPECT_EQ(fixture.registry().collection_count(), 0u);
  EXPECT_FALSE(fixture.registry().has_collection<artwork>(minter.address));
  EXPECT_EQ(fixture.registry().balance_of<artwork>(minter.address), 0u);

  ASSERT_EQ(fixture.events().size(), 1u);
  EXPECT_EQ(fixture.events()[0].type, "mint");
  EXPECT_EQ(fixture.events()[0].attribute("creation_num"), "0");
  EXPECT_EQ(fixture.events()[0].attribute("owner"),
            relic::schema::to_hex(minter.address));
}

TEST(registry, mints_by_one_minter_are_unique) {
  auto fixture = relic::testing::registry_fixture{};
  auto minter = relic::testing::make_signer(2);
  auto ids = std::vector<relic::schema::identifier_t>{};

  for (auto i = 0; i < 32; ++i) {
    auto minted = mint_artwork(fixture.registry(), minter, "series");
    for (const auto& seen : ids) {
      EXPECT_NE(seen, minted.id());
    }
    ids.push_back(minted.id());
  }
  EXPECT_EQ(fixture.authority().next_creation_num(minter.address), 32u);
}

TEST(registry, initialize_collection_is_idempotent) {
  auto fixture = relic::testing::registry_fixture{};
  auto owner = relic::testing::make_signer(3);
  auto& registry = fixture.registry();

  registry.initialize_collection<artwork>(owner);
  ASSERT_EQ(registry.publish(owner.address, mint_artwork(registry, owner, "a"))
                .code,
            0u);
  registry.initialize_collection<artwork>(owner);

  EXPECT_TRUE(registry.has_collection<artwork>(owner.address));
  EXPECT_EQ(registry.balance_of<artwork>(owner.address), 1u);
  EXPECT_EQ(registry.collection_count(), 1u);
}

TEST(registry, publish_requires_initialized_collection) {
  auto fixture = relic::testing::registry_fixture{};
  auto minter = relic::testing::make_signer(4);
  auto& registry = fixture.registry();
  auto minted = mint_artwork(registry, minter, "homeless");

  auto result = registry.publish(minter.address, std::move(minted));
  EXPECT_EQ(error_of(result), registry_error_code::collection_not_published);
  EXPECT_EQ(result.log, "collection_not_published");
  EXPECT_EQ(result.codespace, "relic.publish");
  EXPECT_TRUE(result.events.empty());
  EXPECT_FALSE(registry.has_collection<artwork>(minter.address));

  // The rejected asset is still usable; retry after initializing.
  EXPECT_EQ(minted.payload().title, "homeless");
  registry.initialize_collection<artwork>(minter);
  auto retry = registry.publish(minter.address, std::move(minted));
  EXPECT_EQ(retry.code, 0u);
  EXPECT_EQ(registry.balance_of<artwork>(minter.address), 1u);
}

TEST(registry, publish_rejects_duplicate_identifier) {
  auto authority = relic::testing::repeating_authority{0};
  auto registry = relic::registry::registry{authority};
  auto owner = relic::testing::make_signer(5);
  registry.initialize_collection<artwork>(owner);

  auto first = mint_artwork(registry, owner, "first");
  auto second = mint_artwork(registry, owner, "second");
  ASSERT_EQ(registry.publish(owner.address, std::move(first)).code, 0u);

  auto result = registry.publish(owner.address, std::move(second));
  EXPECT_EQ(error_of(result), registry_error_code::duplicate_identifier);
  EXPECT_EQ(registry.balance_of<artwork>(owner.address), 1u);
  const auto* held = registry.find<artwork>(owner.address, owner.address, 0);
  ASSERT_NE(held, nullptr);
  EXPECT_EQ(held->payload().title, "first");
  EXPECT_EQ(second.payload().title, "second");
}

TEST(registry, publish_may_target_any_owner) {
  auto fixture = relic::testing::registry_fixture{};
  auto minter = relic::testing::make_signer(6);
  auto recipient = relic::testing::make_signer(7);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(recipient);

  auto minted = mint_artwork(registry, minter, "gift");
  auto result = registry.publish(recipient.address, std::move(minted));
  ASSERT_EQ(result.code, 0u);
  EXPECT_TRUE(registry.has_asset<artwork>(recipient.address, minter.address, 0));
  EXPECT_FALSE(registry.has_collection<artwork>(minter.address));

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "publish");
  EXPECT_EQ(result.events[0].attribute("owner"),
            relic::schema::to_hex(recipient.address));
  EXPECT_EQ(result.events[0].attribute("creator"),
            relic::schema::to_hex(minter.address));
}

TEST(registry, transfer_moves_asset_between_collections) {
  auto fixture = relic::testing::registry_fixture{};
  auto minter = relic::testing::make_signer(0x10);
  auto buyer = relic::testing::make_signer(0x20);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(minter);
  registry.initialize_collection<artwork>(buyer);

  auto minted = mint_artwork(registry, minter, "x");
  ASSERT_EQ(minted.id().creation_num, 0u);
  ASSERT_EQ(registry.publish(minter.address, std::move(minted)).code, 0u);
  ASSERT_EQ(registry.balance_of<artwork>(minter.address), 1u);

  auto result =
      registry.transfer<artwork>(minter, buyer.address, minter.address, 0);
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(registry.balance_of<artwork>(minter.address), 0u);
  EXPECT_EQ(registry.balance_of<artwork>(buyer.address), 1u);
  const auto* held = registry.find<artwork>(buyer.address, minter.address, 0);
  ASSERT_NE(held, nullptr);
  EXPECT_EQ(held->payload().title, "x");

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "transfer");
  EXPECT_EQ(result.events[0].attribute("from"),
            relic::schema::to_hex(minter.address));
  EXPECT_EQ(result.events[0].attribute("to"),
            relic::schema::to_hex(buyer.address));

  auto again =
      registry.transfer<artwork>(minter, buyer.address, minter.address, 0);
  EXPECT_EQ(error_of(again), registry_error_code::identifier_not_found);
  EXPECT_EQ(again.codespace, "relic.transfer");
  EXPECT_EQ(registry.balance_of<artwork>(buyer.address), 1u);
}

TEST(registry, transfer_to_uninitialized_destination_restores_source) {
  auto fixture = relic::testing::registry_fixture{};
  auto owner = relic::testing::make_signer(0x11);
  auto nowhere = relic::testing::make_address(0x12);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(owner);
  for (const auto* title : {"a", "b", "c"}) {
    ASSERT_EQ(
        registry.publish(owner.address, mint_artwork(registry, owner, title))
            .code,
        0u);
  }

  auto result = registry.transfer<artwork>(owner, nowhere, owner.address, 1);
  EXPECT_EQ(error_of(result), registry_error_code::collection_not_published);
  EXPECT_TRUE(result.events.empty());

  const auto* held = registry.collection_of<artwork>(owner.address);
  ASSERT_NE(held, nullptr);
  ASSERT_EQ(held->assets.size(), 3u);
  EXPECT_EQ(held->assets[0].payload().title, "a");
  EXPECT_EQ(held->assets[1].payload().title, "b");
  EXPECT_EQ(held->assets[2].payload().title, "c");
  EXPECT_FALSE(registry.has_collection<artwork>(nowhere));
}

TEST(registry, transfer_into_colliding_collection_keeps_both_sides) {
  auto authority = relic::testing::repeating_authority{9};
  auto registry = relic::registry::registry{authority};
  auto creator = relic::testing::make_signer(0x30);
  auto holder = relic::testing::make_signer(0x31);
  registry.initialize_collection<artwork>(creator);
  registry.initialize_collection<artwork>(holder);

  ASSERT_EQ(registry
                .publish(creator.address,
                         mint_artwork(registry, creator, "source"))
                .code,
            0u);
  ASSERT_EQ(registry
                .publish(holder.address,
                         mint_artwork(registry, creator, "occupant"))
                .code,
            0u);

  auto result =
      registry.transfer<artwork>(creator, holder.address, creator.address, 9);
  EXPECT_EQ(error_of(result), registry_error_code::duplicate_identifier);

  const auto* kept = registry.find<artwork>(creator.address, creator.address, 9);
  ASSERT_NE(kept, nullptr);
  EXPECT_EQ(kept->payload().title, "source");
  const auto* occupant =
      registry.find<artwork>(holder.address, creator.address, 9);
  ASSERT_NE(occupant, nullptr);
  EXPECT_EQ(occupant->payload().title, "occupant");
  EXPECT_EQ(registry.balance_of<artwork>(creator.address), 1u);
  EXPECT_EQ(registry.balance_of<artwork>(holder.address), 1u);
}

TEST(registry, transfer_from_signer_without_collection_fails) {
  auto fixture = relic::testing::registry_fixture{};
  auto stranger = relic::testing::make_signer(0x40);
  auto target = relic::testing::make_signer(0x41);
  fixture.registry().initialize_collection<artwork>(target);

  auto result = fixture.registry().transfer<artwork>(
      stranger, target.address, stranger.address, 0);
  EXPECT_EQ(error_of(result), registry_error_code::collection_not_published);
  EXPECT_EQ(fixture.registry().balance_of<artwork>(target.address), 0u);
}

TEST(registry, transfer_only_moves_assets_the_signer_holds) {
  auto fixture = relic::testing::registry_fixture{};
  auto owner = relic::testing::make_signer(0x50);
  auto thief = relic::testing::make_signer(0x51);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(owner);
  registry.initialize_collection<artwork>(thief);
  ASSERT_EQ(
      registry.publish(owner.address, mint_artwork(registry, owner, "mine"))
          .code,
      0u);

  auto result =
      registry.transfer<artwork>(thief, thief.address, owner.address, 0);
  EXPECT_EQ(error_of(result), registry_error_code::identifier_not_found);
  EXPECT_TRUE(registry.has_asset<artwork>(owner.address, owner.address, 0));
  EXPECT_EQ(registry.balance_of<artwork>(thief.address), 0u);
}

TEST(registry, transfer_to_self_moves_asset_to_the_end) {
  auto fixture = relic::testing::registry_fixture{};
  auto owner = relic::testing::make_signer(0x60);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(owner);
  ASSERT_EQ(
      registry.publish(owner.address, mint_artwork(registry, owner, "a")).code,
      0u);
  ASSERT_EQ(
      registry.publish(owner.address, mint_artwork(registry, owner, "b")).code,
      0u);

  auto result =
      registry.transfer<artwork>(owner, owner.address, owner.address, 0);
  ASSERT_EQ(result.code, 0u);
  const auto* held = registry.collection_of<artwork>(owner.address);
  ASSERT_NE(held, nullptr);
  ASSERT_EQ(held->assets.size(), 2u);
  EXPECT_EQ(held->assets[0].payload().title, "b");
  EXPECT_EQ(held->assets[1].payload().title, "a");
}

TEST(registry, observer_sees_only_successful_operations) {
  auto fixture = relic::testing::registry_fixture{};
  auto minter = relic::testing::make_signer(0x70);
  auto buyer = relic::testing::make_signer(0x71);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(minter);

  auto minted = mint_artwork(registry, minter, "observed");
  ASSERT_EQ(registry.publish(minter.address, std::move(minted)).code, 0u);
  EXPECT_NE(
      registry.transfer<artwork>(minter, buyer.address, minter.address, 0).code,
      0u);
  registry.initialize_collection<artwork>(buyer);
  ASSERT_EQ(
      registry.transfer<artwork>(minter, buyer.address, minter.address, 0).code,
      0u);

  ASSERT_EQ(fixture.events().size(), 3u);
  EXPECT_EQ(fixture.events()[0].type, "mint");
  EXPECT_EQ(fixture.events()[1].type, "publish");
  EXPECT_EQ(fixture.events()[2].type, "transfer");
  EXPECT_EQ(fixture.events()[2].attribute("to"),
            relic::schema::to_hex(buyer.address));
  EXPECT_FALSE(fixture.events()[2].attribute("owner").has_value());
}

TEST(registry, collections_are_independent_per_payload_type) {
  auto fixture = relic::testing::registry_fixture{};
  auto owner = relic::testing::make_signer(0x80);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(owner);

  auto ticket = registry.mint(owner, std::string{"row 4 seat 2"},
                              make_content("ticket://gate-a"));
  auto rejected = registry.publish(owner.address, std::move(ticket));
  EXPECT_EQ(error_of(rejected), registry_error_code::collection_not_published);

  registry.initialize_collection<std::string>(owner);
  ASSERT_EQ(registry.publish(owner.address, std::move(ticket)).code, 0u);
  ASSERT_EQ(
      registry.publish(owner.address, mint_artwork(registry, owner, "print"))
          .code,
      0u);

  EXPECT_EQ(registry.balance_of<std::string>(owner.address), 1u);
  EXPECT_EQ(registry.balance_of<artwork>(owner.address), 1u);
  EXPECT_EQ(registry.collection_count(), 2u);
  EXPECT_TRUE(registry.has_asset<std::string>(owner.address, owner.address, 0));
  EXPECT_TRUE(registry.has_asset<artwork>(owner.address, owner.address, 1));
  EXPECT_FALSE(registry.has_asset<artwork>(owner.address, owner.address, 0));
}

TEST(registry, borrow_mut_updates_payload_in_signers_collection) {
  auto fixture = relic::testing::registry_fixture{};
  auto owner = relic::testing::make_signer(0x90);
  auto other = relic::testing::make_signer(0x91);
  auto& registry = fixture.registry();
  registry.initialize_collection<artwork>(owner);
  ASSERT_EQ(
      registry.publish(owner.address, mint_artwork(registry, owner, "draft"))
          .code,
      0u);

  auto* borrowed = registry.borrow_mut<artwork>(owner, owner.address, 0);
  ASSERT_NE(borrowed, nullptr);
  relic::registry::payload_of(*borrowed).title = "final";
  relic::registry::payload_of(*borrowed).edition = 2;

  const auto* held = registry.find<artwork>(owner.address, owner.address, 0);
  ASSERT_NE(held, nullptr);
  EXPECT_EQ(held->payload().title, "final");
  EXPECT_EQ(held->payload().edition, 2u);
  EXPECT_EQ(held->id(),
            relic::identity::authority::reconstruct(owner.address, 0));

  EXPECT_EQ(registry.borrow_mut<artwork>(other, owner.address, 0), nullptr);
  EXPECT_EQ(registry.borrow_mut<artwork>(owner, owner.address, 5), nullptr);
}

TEST(registry, queries_on_unknown_type_are_empty) {
  auto fixture = relic::testing::registry_fixture{};
  auto owner = relic::testing::make_address(0xA0);
  const auto& registry = fixture.registry();

  EXPECT_FALSE(registry.has_collection<artwork>(owner));
  EXPECT_FALSE(registry.has_asset<artwork>(owner, owner, 0));
  EXPECT_EQ(registry.balance_of<artwork>(owner), 0u);
  EXPECT_EQ(registry.find<artwork>(owner, owner, 0), nullptr);
  EXPECT_EQ(registry.collection_of<artwork>(owner), nullptr);
  EXPECT_EQ(registry.collection_count(), 0u);
}
