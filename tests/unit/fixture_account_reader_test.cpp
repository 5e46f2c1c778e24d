#include "internal/rpc/fixture_account_reader.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using rvault::chain::Address;
using rvault::rpc::Commitment;
using rvault::rpc::FixtureAccountReader;

constexpr const char* kFilled11 = "29d2S7vB453rNYFdR5Ycwt7y9haRT5fwVwL9zTmBhfV2";
constexpr const char* kPartner  = "8b1sr6ZyBY68DvwZmfTBVu4b9Lyi9PthB9LU3PH2PBhF";
constexpr const char* kProgram  = "2SBFs9cnkv6NZjM28a87ysPr7zvPWj7KuQC4WW16nGS7";

const std::string kFixture = std::string("accounts:\n")
                             + "  - address: " + kFilled11 + "\n    base64: AQIDBAUGBwgq\n"
                             + "  - address: " + kPartner + "\n    hex: \"01:02:ff\"\n"
                             + "  - address: " + kProgram + "\n    error: rpc timeout\n";

void TestEncodingsAndFailures() {
  auto reader = FixtureAccountReader::LoadFromString(kFixture);
  assert(reader.size() == 2);

  const auto b64 = reader.ReadAccount(Address::FromBase58(kFilled11), Commitment::kConfirmed);
  assert(b64 && b64->size() == 9);
  assert((*b64)[0] == 1 && (*b64)[7] == 8 && (*b64)[8] == 0x2a);

  const auto hex = reader.ReadAccount(Address::FromBase58(kPartner), Commitment::kFinalized);
  assert(hex && hex->size() == 3 && (*hex)[2] == 0xff);

  assert(!reader.ReadAccount(Address{}, Commitment::kConfirmed).has_value());

  bool threw = false;
  try {
    (void)reader.ReadAccount(Address::FromBase58(kProgram), Commitment::kConfirmed);
  } catch (const rvault::util::ReadError& e) {
    threw = std::string(e.what()) == "rpc timeout";
  }
  assert(threw);
}

void TestMalformedFixturesThrow() {
  const std::string bad[] = {
      "accounts: {}\n",
      "other: []\n",
      std::string("accounts:\n  - address: ") + kPartner + "\n",
      std::string("accounts:\n  - address: ") + kPartner + "\n    base64: \"@@@\"\n",
      std::string("accounts:\n  - address: ") + kPartner + "\n    hex: \"zz\"\n",
      "accounts:\n  - base64: AQID\n",
      "accounts: [\n",
  };
  for (const auto& yaml : bad) {
    bool threw = false;
    try {
      (void)FixtureAccountReader::LoadFromString(yaml);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw && "malformed fixture must be rejected");
  }
}

void TestMalformedAddressThrows() {
  bool threw = false;
  try {
    (void)FixtureAccountReader::LoadFromString("accounts:\n  - address: 0OIl\n    hex: \"00\"\n");
  } catch (const rvault::util::AddressDerivationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodingsAndFailures();
  TestMalformedFixturesThrow();
  TestMalformedAddressThrows();

  std::cout << "rvault_unit_fixture_account_reader: pass\n";
  return 0;
}
