#include "internal/model/partner.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using rvault::model::ParsePartnerRef;
using rvault::model::ParsePartnerRefs;

constexpr const char* kMintA = "8b1sr6ZyBY68DvwZmfTBVu4b9Lyi9PthB9LU3PH2PBhF";
constexpr const char* kMintB = "29d2S7vB453rNYFdR5Ycwt7y9haRT5fwVwL9zTmBhfV2";

void TestLabelledAndUnlabelled() {
  const auto labelled = ParsePartnerRef(std::string(kMintA) + ": Reward-fest! Ally ");
  assert(labelled.mint.ToBase58() == kMintA);
  assert(labelled.label == "Reward-fest! Ally");

  const auto bare = ParsePartnerRef(kMintB);
  assert(bare.label == "29d2...hfV2");

  const auto empty_label = ParsePartnerRef(std::string(kMintA) + ":");
  assert(empty_label.label == "8b1s...PhBF");
}

void TestDuplicatesAndBlanksAreSkipped() {
  const auto refs = ParsePartnerRefs({std::string(kMintA) + ":first", "  ", kMintB, std::string(kMintA) + ":second"});
  assert(refs.size() == 2);
  assert(refs[0].label == "first");
  assert(refs[1].mint.ToBase58() == kMintB);
}

void TestMalformedMintThrows() {
  bool threw = false;
  try {
    (void)ParsePartnerRefs({"not-a-mint:label"});
  } catch (const rvault::util::AddressDerivationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLabelledAndUnlabelled();
  TestDuplicatesAndBlanksAreSkipped();
  TestMalformedMintThrows();

  std::cout << "rvault_unit_partner_ref: pass\n";
  return 0;
}
