#include "internal/factory.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/rpc/memory_account_reader.hpp"
#include "internal/util/errors.hpp"

namespace {

using rvault::config::ConfigLoader;
namespace factory = rvault::factory;

void TestDefaultsBuildAServableApplication() {
  const auto config = ConfigLoader::LoadFromString("server:\n  bind_address: \"127.0.0.1:0\"\n");
  auto app          = factory::Build(config);

  assert(app.reader != nullptr);
  assert(app.reader_service != nullptr);
  assert(app.grpc_services.size() == 1);

  const auto partners = factory::PartnersFrom(config.program());
  assert(partners.size() == 1);
  assert(partners[0].label == "Reward-fest! Ally");

  rvault::reader::v1::DeriveAddressesRequest req;
  const auto resp = app.reader_service->DeriveAddresses(req);
  assert(resp.addresses().vault_state() == "24BYPpQsNMEPqkSLUcHoQQk6SbNHXksfL7k1jMzoqmXX");
  assert(resp.addresses().partners_size() == 1);
}

void TestExplicitReaderIsUsed() {
  const auto config = ConfigLoader::LoadFromString("accounts:\n  fixture:\n    path: \"/nonexistent.yaml\"\n");
  auto reader       = std::make_shared<rvault::rpc::MemoryAccountReader>();
  auto app          = factory::Build(config, reader);
  assert(app.reader == reader);
}

void TestProgramOptions() {
  const auto config = ConfigLoader::LoadFromString(R"(program:
  pool_base_reserve: "29d2S7vB453rNYFdR5Ycwt7y9haRT5fwVwL9zTmBhfV2"
  max_stale_secs: 15
  commitment: COMMITMENT_PROCESSED
)");
  const auto options = factory::OracleOptionsFrom(config.program());
  assert(options.pool_base_reserve.has_value());
  assert(options.pool_base_reserve->ToBase58() == "29d2S7vB453rNYFdR5Ycwt7y9haRT5fwVwL9zTmBhfV2");
  assert(!options.pool_reward_reserve.has_value());
  assert(!options.fallback_price_feed.has_value());
  assert(options.max_stale_secs == 15);
  assert(options.commitment == rvault::rpc::Commitment::kProcessed);
}

void TestInvalidConfigurationThrows() {
  bool threw = false;
  try {
    (void)factory::Build(ConfigLoader::LoadFromString("program:\n  program_id: \"0OIl\"\n"));
  } catch (const rvault::util::AddressDerivationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)factory::Build(ConfigLoader::LoadFromString("accounts:\n  fixture: {}\n"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultsBuildAServableApplication();
  TestExplicitReaderIsUsed();
  TestProgramOptions();
  TestInvalidConfigurationThrows();

  std::cout << "rvault_unit_factory: pass\n";
  return 0;
}
