#include <gtest/gtest.h>
#include <reliquary/registry/access_matrix.hpp>
#include <reliquary/registry/artifact_vault.hpp>
#include <reliquary/registry/sequence_allocator.hpp>
#include <reliquary/testing/registry_fixture.hpp>

using reliquary::schema::registry_error_code;

namespace {

reliquary::schema::artifact_record_t make_record(
    const reliquary::schema::artifact_id_t id) {
  return reliquary::schema::artifact_record_t{
      .id = id,
      .name = "Sunblade",
      .guardian = reliquary::testing::make_principal(1),
      .power_rating = 500,
      .created_at = 1,
      .lore = "ancient",
      .tags = {"fire"}};
}

}  // namespace

TEST(artifact_vault, insert_then_get) {
  auto fixture = reliquary::testing::registry_fixture{"reliquary_vault_insert"};
  auto vault = reliquary::registry::artifact_vault{fixture.encoder(),
                                                   fixture.storage()};
  EXPECT_FALSE(vault.exists(1));

  auto writes = reliquary::storage::write_set{};
  ASSERT_TRUE(vault.insert(1, make_record(1), writes));
  EXPECT_FALSE(vault.exists(1));
  fixture.storage().apply(writes);

  EXPECT_TRUE(vault.exists(1));
  auto loaded = vault.get(1);
  ASSERT_TRUE(loaded);
  EXPECT_EQ(loaded.value(), make_record(1));
}

TEST(artifact_vault, insert_over_existing_id_is_duplicate) {
  auto fixture =
      reliquary::testing::registry_fixture{"reliquary_vault_duplicate"};
  auto vault = reliquary::registry::artifact_vault{fixture.encoder(),
                                                   fixture.storage()};
  auto writes = reliquary::storage::write_set{};
  ASSERT_TRUE(vault.insert(3, make_record(3), writes));
  fixture.storage().apply(writes);

  auto again = reliquary::storage::write_set{};
  auto inserted = vault.insert(3, make_record(3), again);
  ASSERT_FALSE(inserted);
  EXPECT_EQ(inserted.error(), registry_error_code::duplicate);
  EXPECT_TRUE(again.empty());
}

TEST(artifact_vault, missing_ids_are_not_found) {
  auto fixture = reliquary::testing::registry_fixture{"reliquary_vault_missing"};
  auto vault = reliquary::registry::artifact_vault{fixture.encoder(),
                                                   fixture.storage()};
  auto writes = reliquary::storage::write_set{};

  auto loaded = vault.get(9);
  ASSERT_FALSE(loaded);
  EXPECT_EQ(loaded.error(), registry_error_code::not_found);

  auto set = vault.set(9, make_record(9), writes);
  ASSERT_FALSE(set);
  EXPECT_EQ(set.error(), registry_error_code::not_found);

  auto erased = vault.erase(9, writes);
  ASSERT_FALSE(erased);
  EXPECT_EQ(erased.error(), registry_error_code::not_found);
  EXPECT_TRUE(writes.empty());
}

TEST(artifact_vault, erase_removes_record) {
  auto fixture = reliquary::testing::registry_fixture{"reliquary_vault_erase"};
  auto vault = reliquary::registry::artifact_vault{fixture.encoder(),
                                                   fixture.storage()};
  auto writes = reliquary::storage::write_set{};
  ASSERT_TRUE(vault.insert(2, make_record(2), writes));
  fixture.storage().apply(writes);

  auto removal = reliquary::storage::write_set{};
  ASSERT_TRUE(vault.erase(2, removal));
  fixture.storage().apply(removal);
  EXPECT_FALSE(vault.exists(2));
}

TEST(access_matrix, missing_rows_are_unauthorized) {
  auto fixture = reliquary::testing::registry_fixture{"reliquary_access_empty"};
  auto access = reliquary::registry::access_matrix{fixture.encoder(),
                                                   fixture.storage()};
  EXPECT_FALSE(
      access.is_authorized(1, reliquary::testing::make_principal(1)));
}

TEST(access_matrix, grant_is_idempotent_and_per_principal) {
  auto fixture = reliquary::testing::registry_fixture{"reliquary_access_grant"};
  auto access = reliquary::registry::access_matrix{fixture.encoder(),
                                                   fixture.storage()};
  auto holder = reliquary::testing::make_principal(1);
  auto writes = reliquary::storage::write_set{};
  access.grant(4, holder, writes);
  access.grant(4, holder, writes);
  fixture.storage().apply(writes);

  EXPECT_TRUE(access.is_authorized(4, holder));
  EXPECT_FALSE(access.is_authorized(4, reliquary::testing::make_principal(2)));
  EXPECT_FALSE(access.is_authorized(5, holder));
}

TEST(sequence_allocator, starts_at_zero_and_advances) {
  auto fixture = reliquary::testing::registry_fixture{"reliquary_sequence"};
  auto sequence = reliquary::registry::sequence_allocator{fixture.encoder(),
                                                          fixture.storage()};
  EXPECT_EQ(sequence.current(), 0u);
  EXPECT_EQ(sequence.next_id(), 1u);

  auto writes = reliquary::storage::write_set{};
  sequence.advance(sequence.next_id(), writes);
  // Staged only.
  EXPECT_EQ(sequence.current(), 0u);
  fixture.storage().apply(writes);
  EXPECT_EQ(sequence.current(), 1u);
  EXPECT_EQ(sequence.next_id(), 2u);
}
