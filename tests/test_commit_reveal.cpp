#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/commit/commitment_builder.hpp"
#include "core/commit/merkle.hpp"
#include "core/crypto/crypto.hpp"
#include "core/model/sample_season.hpp"
#include "core/model/spec_codec.hpp"
#include "core/random/seeded_random.hpp"
#include "core/reveal/reveal_gate.hpp"
#include "core/reveal/verifier.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

constexpr std::string_view kNgoWallet = "NGOwa11et1111111111111111111111111111111111";

advent::RoundSpec proportional_round(int day, std::uint32_t percent) {
  advent::RoundSpec spec;
  spec.day = day;
  spec.type = advent::RoundType::ProportionalHolders;
  spec.hint = "hint " + std::to_string(day);
  spec.sub_hint = "sub " + std::to_string(day);
  spec.params = advent::ProportionalHoldersParams{.allocation_percent = percent, .min_balance = 100};
  spec.notes = "round " + std::to_string(day);
  return spec;
}

advent::SeasonCommitment commit_sample(advent::CryptoEngine& crypto, std::vector<advent::RoundSpec>& specs) {
  specs = advent::sample_season(kNgoWallet);
  std::map<int, std::string> salts;
  const advent::Result salted = crypto.season_salts(advent::kRoundCount, advent::kDefaultSaltBytes, salts);
  assert(salted.ok);

  advent::SeasonCommitment commitment;
  const advent::CommitmentBuilder builder("test-season");
  const advent::Result built = builder.build(specs, salts, commitment);
  assert(built.ok);
  assert(built.data == commitment.commitment.root);
  return commitment;
}

advent::Disclosure full_disclosure(const advent::RoundSpec& spec, const advent::SeasonCommitment& commitment) {
  const advent::CommittedRound round{.spec = spec, .artifact = commitment.artifacts.at(spec.day - 1)};
  advent::Disclosure disclosure;
  const advent::Result disclosed =
      advent::disclose_round(round, commitment.commitment.root, advent::RevealPhase::FullyRevealed, disclosure);
  assert(disclosed.ok);
  return disclosure;
}

void test_hash_primitives() {
  assert(advent::util::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(advent::util::hmac_sha256_hex("what do ya want for nothing?", "Jefe") ==
         "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
  assert(advent::util::is_digest_hex(advent::util::sha256_hex("")));
  assert(!advent::util::is_digest_hex("ABC"));
  assert(advent::util::from_hex(advent::util::to_hex("soup")) == "soup");
}

void test_canonical_key_order() {
  const auto a = nlohmann::json::parse(R"({"b":1,"a":{"d":[2,{"z":1,"y":2}],"c":3},"hash":"ignored"})");
  const auto b = nlohmann::json::parse(R"({"a":{"c":3,"d":[2,{"y":2,"z":1}]},"b":1})");
  assert(advent::util::canonicalize(a) == advent::util::canonicalize(b));
  assert(advent::util::canonicalize(b) == R"({"a":{"c":3,"d":[2,{"y":2,"z":1}]},"b":1})");
  assert(advent::compute_leaf(a, "salt") == advent::compute_leaf(b, "salt"));
  assert(advent::compute_leaf(a, "salt") != advent::compute_leaf(a, "salt2"));
}

void test_merkle_odd_levels() {
  const std::vector<std::string> leaves = {
      advent::util::sha256_hex("l0"),
      advent::util::sha256_hex("l1"),
      advent::util::sha256_hex("l2"),
  };
  advent::MerkleTree tree;
  const advent::Result built = advent::MerkleTree::build(leaves, tree);
  assert(built.ok);
  assert(tree.leaf_count() == 3U);
  assert(tree.depth() == 2U);

  const std::string left = advent::hash_pair(leaves[0], leaves[1]);
  const std::string right = advent::hash_pair(leaves[2], leaves[2]);
  assert(tree.root() == advent::hash_pair(left, right));

  const auto proof = tree.proof(2);
  assert(proof.has_value());
  assert(proof->size() == 2U);
  assert(proof->at(0) == leaves[2]);
  assert(proof->at(1) == left);
  assert(advent::verify_proof(leaves[2], *proof, tree.root(), 2));
  assert(!advent::verify_proof(leaves[2], *proof, tree.root(), 0));
  assert(!tree.proof(3).has_value());

  advent::MerkleTree empty;
  const advent::Result no_leaves = advent::MerkleTree::build({}, empty);
  assert(!no_leaves.ok);

  advent::MerkleTree single;
  const advent::Result one_leaf = advent::MerkleTree::build({leaves[0]}, single);
  assert(one_leaf.ok);
  assert(single.root() == leaves[0]);
  assert(single.proof(0)->empty());
}

void test_three_round_example() {
  const std::vector<advent::RoundSpec> specs = {
      proportional_round(1, 40),
      proportional_round(2, 50),
      proportional_round(3, 60),
  };
  const std::map<int, std::string> salts = {{1, "s1"}, {2, "s2"}, {3, "s3"}};

  const advent::CommitmentBuilder builder("example", 3);
  advent::SeasonCommitment commitment;
  const advent::Result built = builder.build(specs, salts, commitment);
  assert(built.ok);
  assert(commitment.artifacts.size() == 3U);

  const auto& day2 = commitment.artifacts[1];
  assert(day2.day == 2);
  assert(day2.leaf_index == 1U);
  assert(day2.leaf == advent::compute_leaf(specs[1], "s2"));
  assert(day2.proof.size() == 2U);

  // Index 1 sits on the right at level 0, so day 1's leaf is the left operand.
  assert(day2.proof[0] == commitment.artifacts[0].leaf);
  const std::string level1 = advent::hash_pair(day2.proof[0], day2.leaf);
  assert(advent::hash_pair(level1, day2.proof[1]) == commitment.commitment.root);

  const advent::Disclosure disclosure = full_disclosure(specs[1], commitment);
  advent::VerificationReport report;
  const advent::Result verified = advent::verify_disclosure(disclosure, commitment.commitment.root, report);
  assert(verified.ok);
  assert(report.valid);
}

void test_round_trip_all_days() {
  advent::CryptoEngine crypto;
  const advent::Result init = crypto.initialize();
  assert(init.ok);

  std::vector<advent::RoundSpec> specs;
  const advent::SeasonCommitment commitment = commit_sample(crypto, specs);
  assert(commitment.artifacts.size() == static_cast<std::size_t>(advent::kRoundCount));
  assert(advent::util::is_digest_hex(commitment.commitment.root));
  assert(commitment.commitment.season == "test-season");

  for (const auto& spec : specs) {
    const advent::Disclosure disclosure = full_disclosure(spec, commitment);
    assert(disclosure.salt->size() == advent::kDefaultSaltBytes * 2U);

    // A verifier only ever sees the JSON form.
    advent::Disclosure received;
    const auto wire = nlohmann::json::parse(advent::disclosure_to_json(disclosure).dump());
    const advent::Result parsed = advent::disclosure_from_json(wire, received);
    assert(parsed.ok);

    advent::VerificationReport report;
    const advent::Result verified = advent::verify_disclosure(received, commitment.commitment.root, report);
    assert(verified.ok);
    assert(report.valid);
    assert(report.day_matches);
    assert(report.computed_leaf == commitment.artifacts[spec.day - 1].leaf);
    assert(report.computed_root == commitment.commitment.root);
  }
}

void test_tamper_detection() {
  advent::CryptoEngine crypto;
  const advent::Result init = crypto.initialize();
  assert(init.ok);
  std::vector<advent::RoundSpec> specs;
  const advent::SeasonCommitment commitment = commit_sample(crypto, specs);

  advent::Disclosure disclosure = full_disclosure(specs[6], commitment);
  (*disclosure.gift)["notes"] = "edited after the fact";

  advent::VerificationReport report;
  advent::Result verified = advent::verify_disclosure(disclosure, commitment.commitment.root, report);
  assert(verified.ok);
  assert(!report.leaf_matches);
  assert(report.root_matches);
  assert(report.proof_valid);
  assert(!report.valid);
  assert(report.details.find("leaf") != std::string::npos);

  advent::Disclosure wrong_root = full_disclosure(specs[0], commitment);
  wrong_root.root = advent::util::sha256_hex("another season");
  verified = advent::verify_disclosure(wrong_root, commitment.commitment.root, report);
  assert(verified.ok);
  assert(!report.root_matches);
  assert(!report.proof_valid);
  assert(!report.valid);

  advent::Disclosure shifted = full_disclosure(specs[3], commitment);
  shifted.day = 5;
  verified = advent::verify_disclosure(shifted, commitment.commitment.root, report);
  assert(verified.ok);
  assert(!report.proof_valid);
  assert(!report.day_matches);
  assert(!report.valid);
  assert(report.details.find("not the round for this day") != std::string::npos);
}

void test_disclosure_day_bounds() {
  advent::CryptoEngine crypto;
  const advent::Result init = crypto.initialize();
  assert(init.ok);
  std::vector<advent::RoundSpec> specs;
  const advent::SeasonCommitment commitment = commit_sample(crypto, specs);

  // With 24 leaves the third level pairs node 2 with itself, so day 17's
  // path also reaches the root from index 24.
  advent::Disclosure replayed = full_disclosure(specs[16], commitment);
  assert(advent::recompute_root(*replayed.leaf, *replayed.proof, 24) == commitment.commitment.root);
  replayed.day = 25;
  advent::VerificationReport report;
  const advent::Result past_end = advent::verify_disclosure(replayed, commitment.commitment.root, report);
  assert(!past_end.ok);
  assert(past_end.kind == advent::ErrorKind::Incomplete);

  replayed.day = 0;
  const advent::Result before_start = advent::verify_disclosure(replayed, commitment.commitment.root, report);
  assert(!before_start.ok);
  assert(before_start.kind == advent::ErrorKind::Incomplete);

  // A gift whose own day disagrees with the disclosed day never verifies.
  advent::Disclosure relabeled = full_disclosure(specs[16], commitment);
  (*relabeled.gift)["day"] = 18;
  relabeled.leaf = advent::compute_leaf(*relabeled.gift, *relabeled.salt);
  const advent::Result checked = advent::verify_disclosure(relabeled, commitment.commitment.root, report);
  assert(checked.ok);
  assert(!report.day_matches);
  assert(!report.valid);
}

void test_incomplete_disclosure() {
  advent::CryptoEngine crypto;
  const advent::Result init = crypto.initialize();
  assert(init.ok);
  std::vector<advent::RoundSpec> specs;
  const advent::SeasonCommitment commitment = commit_sample(crypto, specs);

  advent::Disclosure disclosure = full_disclosure(specs[2], commitment);
  disclosure.salt.reset();
  advent::VerificationReport report;
  const advent::Result missing_salt = advent::verify_disclosure(disclosure, commitment.commitment.root, report);
  assert(!missing_salt.ok);
  assert(missing_salt.kind == advent::ErrorKind::Incomplete);
  assert(missing_salt.message.find("salt") != std::string::npos);

  advent::Disclosure hint;
  hint.day = 3;
  hint.hint_only = true;
  const advent::Result hint_only = advent::verify_disclosure(hint, commitment.commitment.root, report);
  assert(hint_only.kind == advent::ErrorKind::Incomplete);

  advent::Disclosure parsed;
  const advent::Result no_day = advent::disclosure_from_json(nlohmann::json::parse(R"({"hint":"x"})"), parsed);
  assert(no_day.kind == advent::ErrorKind::Incomplete);
}

void test_builder_rejects_bad_layout() {
  std::map<int, std::string> salts = {{1, "s1"}, {2, "s2"}, {3, "s3"}};
  const advent::CommitmentBuilder builder("example", 3);
  advent::SeasonCommitment commitment;

  const std::vector<advent::RoundSpec> duplicate = {proportional_round(1, 40), proportional_round(1, 40),
                                                    proportional_round(3, 40)};
  advent::Result result = builder.build(duplicate, salts, commitment);
  assert(!result.ok);
  assert(result.kind == advent::ErrorKind::Configuration);
  assert(result.message.find("Duplicate") != std::string::npos);

  const std::vector<advent::RoundSpec> gap = {proportional_round(1, 40), proportional_round(3, 40)};
  result = builder.build(gap, salts, commitment);
  assert(!result.ok);
  assert(result.message.find("Missing round spec for day 2") != std::string::npos);

  const std::vector<advent::RoundSpec> over = {proportional_round(1, 40), proportional_round(2, 150),
                                               proportional_round(3, 40)};
  result = builder.build(over, salts, commitment);
  assert(!result.ok);
  assert(result.kind == advent::ErrorKind::Configuration);

  const std::vector<advent::RoundSpec> good = {proportional_round(1, 40), proportional_round(2, 40),
                                               proportional_round(3, 40)};
  salts.erase(2);
  result = builder.build(good, salts, commitment);
  assert(!result.ok);
  assert(result.message.find("Missing salt for day 2") != std::string::npos);
  assert(commitment.artifacts.empty());
}

void test_spec_codec_schema() {
  advent::RoundSpec spec;
  const auto good = nlohmann::json::parse(R"({
    "day": 4, "type": "top_buyers_airdrop", "hint": "h", "sub_hint": "s",
    "params": {"top_n": 5, "allocation_percent": 30, "token_airdrop": {"enabled": true, "total_amount": "2400"}}
  })");
  advent::Result parsed = advent::round_spec_from_json(good, spec);
  assert(parsed.ok);
  assert(spec.type == advent::RoundType::TopBuyersAirdrop);
  const auto& params = std::get<advent::TopBuyersParams>(spec.params);
  assert(params.top_n == 5U);
  assert(params.split == advent::SplitMode::Proportional);
  assert(spec.token_airdrop.has_value() && spec.token_airdrop->total_amount == 2400);
  assert(spec.distribution_source == advent::kDefaultDistributionSource);

  advent::RoundSpec again;
  parsed = advent::round_spec_from_json(advent::round_spec_to_json(spec), again);
  assert(parsed.ok);
  assert(advent::compute_leaf(spec, "x") == advent::compute_leaf(again, "x"));

  const auto missing = nlohmann::json::parse(R"({"day": 2, "type": "deterministic_random",
    "params": {"allocation_percent": 30}})");
  const advent::Result missing_result = advent::round_spec_from_json(missing, spec);
  assert(!missing_result.ok);
  assert(missing_result.message.find("winner_count") != std::string::npos);

  const auto unknown = nlohmann::json::parse(R"({"day": 2, "type": "proportional_holders",
    "params": {"allocation_percent": 30, "bonus": 1}})");
  parsed = advent::round_spec_from_json(unknown, spec);
  assert(!parsed.ok);

  const auto bad_type = nlohmann::json::parse(R"({"day": 2, "type": "mystery", "params": {}})");
  parsed = advent::round_spec_from_json(bad_type, spec);
  assert(!parsed.ok);

  const auto no_ngo = nlohmann::json::parse(R"({"day": 7, "type": "ngo_donation", "params": {"percent": 10}})");
  parsed = advent::round_spec_from_json(no_ngo, spec);
  assert(!parsed.ok);

  const auto day_out = nlohmann::json::parse(R"({"day": 25, "type": "proportional_holders",
    "params": {"allocation_percent": 30}})");
  parsed = advent::round_spec_from_json(day_out, spec);
  assert(!parsed.ok);
}

void test_reveal_gating() {
  const auto start = *advent::util::parse_iso_date("2025-12-01");
  const auto before = *advent::util::parse_iso_date("2025-12-04");
  const auto on_day = *advent::util::parse_iso_date("2025-12-05");
  const auto after = *advent::util::parse_iso_date("2025-12-06");

  assert(advent::reveal_phase(5, before, start) == advent::RevealPhase::Hidden);
  assert(advent::reveal_phase(5, on_day, start) == advent::RevealPhase::HintOnly);
  assert(advent::reveal_phase(5, after, start) == advent::RevealPhase::FullyRevealed);
  assert(advent::reveal_phase(5, before, start, true) == advent::RevealPhase::FullyRevealed);
  assert(advent::util::format_iso_date(advent::round_date(24, start)) == "2025-12-24");

  advent::CryptoEngine crypto;
  const advent::Result init = crypto.initialize();
  assert(init.ok);
  std::vector<advent::RoundSpec> specs;
  const advent::SeasonCommitment commitment = commit_sample(crypto, specs);
  const advent::CommittedRound round{.spec = specs[4], .artifact = commitment.artifacts[4]};

  advent::Disclosure disclosure;
  const advent::Result hidden = advent::disclose_round(round, commitment.commitment.root,
                                                       advent::reveal_phase(5, before, start), disclosure);
  assert(!hidden.ok);
  assert(hidden.kind == advent::ErrorKind::NotRevealed);

  const advent::Result hinted = advent::disclose_round(round, commitment.commitment.root,
                                                       advent::reveal_phase(5, on_day, start), disclosure);
  assert(hinted.ok);
  assert(disclosure.hint_only);
  assert(disclosure.day == 5);
  assert(disclosure.hint == specs[4].hint);
  assert(disclosure.sub_hint == specs[4].sub_hint);
  assert(!disclosure.gift.has_value() && !disclosure.salt.has_value() && !disclosure.leaf.has_value());
  assert(!disclosure.proof.has_value() && !disclosure.root.has_value());
  const auto hint_json = advent::disclosure_to_json(disclosure);
  assert(!hint_json.contains("gift") && !hint_json.contains("salt"));

  const advent::Result revealed = advent::disclose_round(round, commitment.commitment.root,
                                                         advent::reveal_phase(5, after, start), disclosure);
  assert(revealed.ok);
  assert(!disclosure.hint_only);
  assert(disclosure.gift.has_value() && !disclosure.gift->contains("hash"));
  assert(disclosure.salt == commitment.artifacts[4].salt);
  assert(disclosure.leaf == commitment.artifacts[4].leaf);
  assert(disclosure.proof == commitment.artifacts[4].proof);
  assert(disclosure.root == commitment.commitment.root);
}

void test_seeded_shuffle() {
  const std::vector<std::string> abc = {"a", "b", "c"};
  assert((advent::seeded_shuffle(abc, "00000001") == std::vector<std::string>{"c", "b", "a"}));
  assert((advent::seeded_shuffle(std::vector<std::string>{"a", "b"}, "00000001") ==
          std::vector<std::string>{"b", "a"}));
  assert((advent::seeded_shuffle(std::vector<std::string>{"a", "b", "c", "d", "e"}, "ffffffffdeadbeef") ==
          std::vector<std::string>{"e", "d", "b", "a", "c"}));
  assert(advent::seed_prefix_value("0000000a99") == 10U);

  advent::SeededRandom rng("00000001");
  const double first = rng.next();
  assert(rng.state() == 58598U);
  assert(first >= 0.0 && first < 1.0);

  const std::string seed = advent::derive_seed("blockhash", "salt");
  assert(seed == advent::util::hmac_sha256_hex("blockhash", "salt"));
  assert(advent::derive_hour_seed("blockhash", "salt", 7) == advent::derive_seed("blockhash", "salt7"));
  assert(advent::seeded_shuffle(abc, seed) == advent::seeded_shuffle(abc, seed));
}

}  // namespace

int main() {
  advent::CryptoEngine crypto;
  const advent::Result init = crypto.initialize();
  assert(init.ok);

  test_hash_primitives();
  test_canonical_key_order();
  test_merkle_odd_levels();
  test_three_round_example();
  test_round_trip_all_days();
  test_tamper_detection();
  test_disclosure_day_bounds();
  test_incomplete_disclosure();
  test_builder_rejects_bad_layout();
  test_spec_codec_schema();
  test_reveal_gating();
  test_seeded_shuffle();

  std::cout << "advent_commit_tests passed\n";
  return 0;
}
