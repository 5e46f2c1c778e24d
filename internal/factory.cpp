#include "factory.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/chain/address_deriver.hpp"
#include "internal/grpc/reader_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rpc/fixture_account_reader.hpp"
#include "internal/rpc/memory_account_reader.hpp"
#include "internal/service/service_context.hpp"
#include "internal/snapshot/snapshot_assembler.hpp"

namespace rvault::factory {

namespace cfg = rvault::runtime::config;

namespace {

std::optional<chain::Address> OptionalAddress(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return chain::Address::FromBase58(value);
}

} // namespace

rpc::Commitment CommitmentFrom(cfg::Commitment commitment) {
  switch (commitment) {
    case cfg::COMMITMENT_PROCESSED:
      return rpc::Commitment::kProcessed;
    case cfg::COMMITMENT_FINALIZED:
      return rpc::Commitment::kFinalized;
    case cfg::COMMITMENT_CONFIRMED:
    default:
      return rpc::Commitment::kConfirmed;
  }
}

oracle::OracleOptions OracleOptionsFrom(const cfg::ProgramConfig& program) {
  oracle::OracleOptions options;
  options.pool_base_reserve   = OptionalAddress(program.pool_base_reserve());
  options.pool_reward_reserve = OptionalAddress(program.pool_reward_reserve());
  options.fallback_price_feed = OptionalAddress(program.fallback_price_feed());
  if (program.max_stale_secs() > 0) options.max_stale_secs = program.max_stale_secs();
  options.commitment = CommitmentFrom(program.commitment());
  return options;
}

std::vector<model::PartnerRef> PartnersFrom(const cfg::ProgramConfig& program) {
  if (program.partners().empty()) {
    return model::ParsePartnerRefs({kDefaultPartner});
  }
  return model::ParsePartnerRefs({program.partners().begin(), program.partners().end()});
}

std::shared_ptr<rpc::AccountReader> BuildReader(const cfg::AccountSourceConfig& accounts) {
  if (accounts.has_fixture()) {
    if (accounts.fixture().path().empty()) {
      throw std::runtime_error("accounts.fixture.path is required");
    }
    auto reader = std::make_shared<rpc::FixtureAccountReader>(
        rpc::FixtureAccountReader::LoadFromYaml(accounts.fixture().path()));
    RVAULT_LOG_INFO("account fixture loaded", {observability::StringField("path", accounts.fixture().path()),
                                               observability::IntField("accounts", static_cast<std::int64_t>(reader->size()))});
    return reader;
  }
  return std::make_shared<rpc::MemoryAccountReader>();
}

/*
    Build full application dependency graph
*/
Application Build(const cfg::RuntimeConfig& config, std::shared_ptr<rpc::AccountReader> reader) {
  Application app;

  const auto& program = config.program();
  app.reader          = reader ? std::move(reader) : BuildReader(config.accounts());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto deriver = std::make_shared<chain::AddressDeriver>(
      chain::AddressDeriver::FromBase58(program.program_id().empty() ? kDefaultProgramId : program.program_id()));
  const auto commitment = CommitmentFrom(program.commitment());
  auto partners         = PartnersFrom(program);

  RVAULT_LOG_INFO("reward vault reader configured",
                  {observability::AddressField("program_id", deriver->program_id()),
                   observability::IntField("partners", static_cast<std::int64_t>(partners.size())),
                   observability::StringField("commitment", rpc::ToString(commitment))});

  auto oracle    = std::make_shared<oracle::PriceOracleEngine>(app.reader, *deriver, OracleOptionsFrom(program));
  auto assembler = std::make_shared<snapshot::SnapshotAssembler>(app.reader, *deriver, std::move(partners), commitment);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.reader     = app.reader;
  ctx.deriver    = deriver;
  ctx.oracle     = oracle;
  ctx.assembler  = assembler;
  ctx.commitment = commitment;

  app.reader_service = std::make_shared<service::ReaderService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ReaderServer>(app.reader_service));

  return app;
}

} // namespace rvault::factory
