#include <gtest/gtest.h>
#include <reliquary/schema/artifact_record.hpp>
#include <reliquary/schema/query_error_code.hpp>
#include <reliquary/schema/transaction_error_code.hpp>
#include <reliquary/testing/execution_fixture.hpp>

#include <string>
#include <tuple>
#include <vector>

using reliquary::schema::query_error_code;
using reliquary::schema::transaction_error_code;
using reliquary::testing::encode_transaction;
using reliquary::testing::make_principal;

namespace {

reliquary::schema::forge_artifact_t sunblade() {
  return reliquary::schema::forge_artifact_t{
      .name = "Sunblade", .power_rating = 500, .lore = "ancient",
      .tags = {"fire"}};
}

reliquary::schema::bytes_view_t view(const reliquary::schema::bytes_t& bytes) {
  return reliquary::schema::bytes_view_t{bytes.data(), bytes.size()};
}

template <typename T>
T decode_value(reliquary::testing::engine_encoder_t& encoder,
               const reliquary::schema::query_result_t& result) {
  return encoder.decode<T>(view(result.value));
}

}  // namespace

TEST(engine, starts_at_genesis) {
  auto fixture = reliquary::testing::execution_fixture{"reliquary_engine_new"};
  auto info = fixture.engine().info();
  EXPECT_EQ(info.last_block_height, 0);
  EXPECT_EQ(info.last_block_state_root, reliquary::schema::make_zero_hash());
  EXPECT_EQ(info.data, "reliquary-registry");
}

TEST(engine, check_transaction_rejects_malformed_and_invalid_payloads) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_check"};
  auto& engine = fixture.engine();

  auto empty = reliquary::schema::bytes_t{};
  EXPECT_EQ(engine.check_transaction(view(empty)).code,
            static_cast<uint32_t>(transaction_error_code::invalid_transaction));

  auto garbage = reliquary::schema::bytes_t{0xFF, 0x01, 0x02};
  EXPECT_EQ(engine.check_transaction(view(garbage)).code,
            static_cast<uint32_t>(transaction_error_code::invalid_transaction));

  auto encoder = reliquary::testing::engine_encoder_t{};
  auto future = encoder.encode(reliquary::schema::transaction_t{
      .version = 2, .signer = make_principal(1), .payload = sunblade()});
  EXPECT_EQ(engine.check_transaction(view(future)).code,
            static_cast<uint32_t>(
                transaction_error_code::unsupported_transaction_version));

  auto bad_rating = sunblade();
  bad_rating.power_rating = 0;
  auto rejected = engine.check_transaction(
      view(encode_transaction(make_principal(1), bad_rating)));
  EXPECT_EQ(rejected.code,
            static_cast<uint32_t>(transaction_error_code::range_invalid));
  EXPECT_EQ(rejected.codespace, "reliquary.checktx");

  auto accepted = engine.check_transaction(
      view(encode_transaction(make_principal(1), sunblade())));
  EXPECT_EQ(accepted.code, 0u);
  EXPECT_EQ(engine.info().last_block_height, 0);
}

TEST(engine, forge_returns_id_in_result_data) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_forge"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();
  auto guardian = make_principal(1);

  auto block = engine.finalize_block(
      1, {encode_transaction(guardian, sunblade()),
          encode_transaction(guardian, sunblade())});
  ASSERT_EQ(block.tx_results.size(), 2u);
  EXPECT_EQ(block.tx_results[0].code, 0u);
  EXPECT_EQ(encoder.decode<reliquary::schema::artifact_id_t>(
                view(block.tx_results[0].data)),
            1u);
  EXPECT_EQ(encoder.decode<reliquary::schema::artifact_id_t>(
                view(block.tx_results[1].data)),
            2u);

  auto commit = engine.commit();
  EXPECT_EQ(commit.committed_height, 1);
  EXPECT_EQ(commit.state_root, block.state_root);
  EXPECT_EQ(engine.info().last_block_height, 1);
}

TEST(engine, failed_transactions_leave_state_root_unchanged) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_failed"};
  auto& engine = fixture.engine();
  auto genesis = engine.info().last_block_state_root;

  auto block = engine.finalize_block(
      1, {encode_transaction(make_principal(1),
                             reliquary::schema::destroy_artifact_t{
                                 .artifact_id = 7}),
          reliquary::schema::bytes_t{0x00}});
  ASSERT_EQ(block.tx_results.size(), 2u);
  EXPECT_EQ(block.tx_results[0].code,
            static_cast<uint32_t>(transaction_error_code::artifact_missing));
  EXPECT_EQ(block.tx_results[0].codespace, "reliquary.finalize");
  EXPECT_EQ(block.tx_results[1].code,
            static_cast<uint32_t>(transaction_error_code::invalid_transaction));
  EXPECT_EQ(block.state_root, genesis);
}

TEST(engine, state_root_is_deterministic) {
  auto first = reliquary::testing::execution_fixture{"reliquary_engine_det_a"};
  auto second = reliquary::testing::execution_fixture{"reliquary_engine_det_b"};
  auto txs = std::vector<reliquary::schema::bytes_t>{
      encode_transaction(make_principal(1), sunblade()),
      encode_transaction(make_principal(1),
                         reliquary::schema::transfer_guardianship_t{
                             .artifact_id = 1,
                             .new_guardian = make_principal(2)})};

  auto a = first.engine().finalize_block(1, txs);
  auto b = second.engine().finalize_block(1, txs);
  EXPECT_EQ(a.state_root, b.state_root);
  EXPECT_NE(a.state_root, reliquary::schema::make_zero_hash());
}

TEST(engine, privileges_map_to_transaction_codes) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_privileges"};
  auto& engine = fixture.engine();
  auto x = make_principal(1);
  auto y = make_principal(2);

  auto block = engine.finalize_block(
      1,
      {encode_transaction(x, sunblade()),
       encode_transaction(
           x, reliquary::schema::transfer_guardianship_t{.artifact_id = 1,
                                                         .new_guardian = y}),
       encode_transaction(
           x, reliquary::schema::destroy_artifact_t{.artifact_id = 1}),
       encode_transaction(
           y, reliquary::schema::destroy_artifact_t{.artifact_id = 1})});
  ASSERT_EQ(block.tx_results.size(), 4u);
  EXPECT_EQ(block.tx_results[0].code, 0u);
  EXPECT_EQ(block.tx_results[1].code, 0u);
  EXPECT_EQ(
      block.tx_results[2].code,
      static_cast<uint32_t>(transaction_error_code::insufficient_privileges));
  EXPECT_EQ(block.tx_results[3].code, 0u);
}

TEST(engine, query_routes_answer_from_registry) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_query"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();
  auto guardian = make_principal(1);

  engine.finalize_block(1, {encode_transaction(guardian, sunblade())});
  engine.commit();

  auto id = encoder.encode(reliquary::schema::artifact_id_t{1});

  auto lore = engine.query("/artifact/lore", view(id));
  ASSERT_EQ(lore.code, 0u);
  EXPECT_EQ(decode_value<std::string>(encoder, lore), "ancient");
  EXPECT_EQ(lore.height, 1);

  auto count = engine.query("/artifact/tags/count", view(id));
  ASSERT_EQ(count.code, 0u);
  EXPECT_EQ(decode_value<uint64_t>(encoder, count), 1u);

  auto record = engine.query("/artifact", view(id));
  ASSERT_EQ(record.code, 0u);
  auto artifact =
      decode_value<reliquary::schema::artifact_record_t>(encoder, record);
  EXPECT_EQ(artifact.name, "Sunblade");
  EXPECT_EQ(artifact.guardian, guardian);

  auto access_key = encoder.encode(
      std::tuple{reliquary::schema::artifact_id_t{1}, guardian});
  auto access = engine.query("/artifact/access", view(access_key));
  ASSERT_EQ(access.code, 0u);
  EXPECT_TRUE(decode_value<bool>(encoder, access));

  auto stranger_key = encoder.encode(
      std::tuple{reliquary::schema::artifact_id_t{1}, make_principal(2)});
  EXPECT_FALSE(decode_value<bool>(
      encoder, engine.query("/artifact/access", view(stranger_key))));

  auto name = encoder.encode(std::string(65, 'n'));
  auto verify = engine.query("/identifier/verify", view(name));
  ASSERT_EQ(verify.code, 0u);
  EXPECT_FALSE(decode_value<bool>(encoder, verify));

  auto sequence = engine.query("/sequence/last", {});
  ASSERT_EQ(sequence.code, 0u);
  EXPECT_EQ(decode_value<reliquary::schema::artifact_id_t>(encoder, sequence),
            1u);
}

TEST(engine, query_errors) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_query_errors"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();

  auto missing = encoder.encode(reliquary::schema::artifact_id_t{9});
  EXPECT_EQ(engine.query("/artifact/lore", view(missing)).code,
            static_cast<uint32_t>(query_error_code::not_found));
  EXPECT_EQ(engine.query("/artifact/tags/count", view(missing)).code,
            static_cast<uint32_t>(query_error_code::not_found));

  auto truncated = reliquary::schema::bytes_t{0x01};
  EXPECT_EQ(engine.query("/artifact", view(truncated)).code,
            static_cast<uint32_t>(query_error_code::invalid_key));

  auto unknown = engine.query("/vault/state", view(missing));
  EXPECT_EQ(unknown.code,
            static_cast<uint32_t>(query_error_code::unsupported_path));
  EXPECT_EQ(unknown.codespace, "reliquary.query");
}

TEST(engine, committed_state_survives_reopen) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_reopen"};
  auto guardian = make_principal(1);

  fixture.engine().finalize_block(1,
                                  {encode_transaction(guardian, sunblade())});
  auto committed = fixture.engine().commit();

  fixture.reopen();
  auto info = fixture.engine().info();
  EXPECT_EQ(info.last_block_height, 1);
  EXPECT_EQ(info.last_block_state_root, committed.state_root);

  auto block = fixture.engine().finalize_block(
      2, {encode_transaction(guardian, sunblade())});
  ASSERT_EQ(block.tx_results.size(), 1u);
  EXPECT_EQ(fixture.encoder().decode<reliquary::schema::artifact_id_t>(
                view(block.tx_results[0].data)),
            2u);
}

TEST(engine, modify_overwrites_properties_through_finalize) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_modify"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();
  auto guardian = make_principal(1);

  engine.finalize_block(1, {encode_transaction(guardian, sunblade())});
  engine.commit();

  auto block = engine.finalize_block(
      2, {encode_transaction(guardian, reliquary::schema::modify_artifact_t{
                                           .artifact_id = 1,
                                           .name = "Moonblade",
                                           .power_rating = 900,
                                           .lore = "reforged",
                                           .tags = {"ice", "moon"}})});
  ASSERT_EQ(block.tx_results.size(), 1u);
  EXPECT_EQ(block.tx_results[0].code, 0u);
  engine.commit();

  auto id = encoder.encode(reliquary::schema::artifact_id_t{1});
  EXPECT_EQ(decode_value<std::string>(
                encoder, engine.query("/artifact/lore", view(id))),
            "reforged");
  EXPECT_EQ(decode_value<uint64_t>(
                encoder, engine.query("/artifact/tags/count", view(id))),
            2u);
}

TEST(engine, modify_reports_existence_and_guardianship_before_bounds) {
  auto fixture =
      reliquary::testing::execution_fixture{"reliquary_engine_modify_order"};
  auto& engine = fixture.engine();
  auto x = make_principal(1);
  auto y = make_principal(2);

  engine.finalize_block(1, {encode_transaction(x, sunblade())});
  engine.commit();
  auto root_before = engine.info().last_block_state_root;

  auto zero_rating = reliquary::schema::modify_artifact_t{
      .artifact_id = 1, .name = "Sunblade", .power_rating = 0,
      .lore = "ancient", .tags = {"fire"}};
  auto empty_name_on_missing = reliquary::schema::modify_artifact_t{
      .artifact_id = 99, .name = "", .power_rating = 500, .lore = "ancient",
      .tags = {"fire"}};

  // Admission does not pre-empt the handler's ordering.
  EXPECT_EQ(engine.check_transaction(view(encode_transaction(y, zero_rating)))
                .code,
            0u);

  auto block = engine.finalize_block(
      2, {encode_transaction(y, zero_rating),
          encode_transaction(x, empty_name_on_missing),
          encode_transaction(x, zero_rating)});
  ASSERT_EQ(block.tx_results.size(), 3u);
  EXPECT_EQ(
      block.tx_results[0].code,
      static_cast<uint32_t>(transaction_error_code::insufficient_privileges));
  EXPECT_EQ(block.tx_results[1].code,
            static_cast<uint32_t>(transaction_error_code::artifact_missing));
  EXPECT_EQ(block.tx_results[2].code,
            static_cast<uint32_t>(transaction_error_code::range_invalid));
  EXPECT_EQ(block.state_root, root_before);
}
