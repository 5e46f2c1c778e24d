#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "account_builders.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/reader_server.hpp"
#include "internal/oracle/price_oracle.hpp"
#include "internal/rpc/memory_account_reader.hpp"
#include "internal/service/reader_service.hpp"
#include "internal/snapshot/snapshot_assembler.hpp"
#include "rvault/reader/v1.hpp"

namespace {

using namespace rvault;
using rvault::testing::AddressOf;

struct Fixture {
  std::shared_ptr<rpc::MemoryAccountReader> reader = std::make_shared<rpc::MemoryAccountReader>();
  std::shared_ptr<chain::AddressDeriver> deriver = std::make_shared<chain::AddressDeriver>(
      chain::AddressDeriver::FromBase58("2SBFs9cnkv6NZjM28a87ysPr7zvPWj7KuQC4WW16nGS7"));

  rvault::grpc::ReaderServer Server() const {
    service::ServiceContext ctx;
    ctx.reader    = reader;
    ctx.deriver   = deriver;
    ctx.oracle    = std::make_shared<oracle::PriceOracleEngine>(reader, *deriver, oracle::OracleOptions{});
    ctx.assembler = std::make_shared<snapshot::SnapshotAssembler>(reader, *deriver, std::vector<model::PartnerRef>{},
                                                                  rpc::Commitment::kConfirmed);
    ctx.clock     = [] { return std::int64_t{1'700'000'000}; };
    return rvault::grpc::ReaderServer(std::make_shared<service::ReaderService>(std::move(ctx)));
  }
};

void TestErrorFamiliesMapToCodes() {
  using rvault::grpc::ToStatus;

  const auto quote = ToStatus(util::QuoteError(util::QuoteFailure::kStalePrice, "feed is 90s old"));
  assert(quote.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(quote.error_message() == "price unavailable (StalePrice): feed is 90s old");

  assert(ToStatus(util::DecodeError(util::DecodeFailure::kTooShort, "x")).error_code()
         == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(util::AddressDerivationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(util::ReadError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestMissingVaultReturnsNotFound() {
  Fixture f;
  auto server = f.Server();

  reader::v1::GetVaultConfigRequest req;
  reader::v1::GetVaultConfigResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetVaultConfig(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestBadUserReturnsInvalidArgument() {
  Fixture f;
  auto server = f.Server();

  reader::v1::GetSnapshotRequest req;
  req.set_user("0OIl");
  reader::v1::GetSnapshotResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetSnapshot(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnreadableVaultReturnsUnavailable() {
  Fixture f;
  f.reader->FailWith(f.deriver->VaultState(), "connection reset");
  auto server = f.Server();

  reader::v1::GetQuoteRequest req;
  reader::v1::GetQuoteResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetQuote(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestUnpricedVaultReturnsFailedPrecondition() {
  Fixture f;
  // No reserves configured, no stored price.
  f.reader->Put(f.deriver->VaultState(), testing::EncodeVaultConfig(model::VaultConfig{}));
  auto server = f.Server();

  reader::v1::GetQuoteRequest req;
  reader::v1::GetQuoteResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetQuote(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(status.error_message().find("EmptyReserve") != std::string::npos);
}

void TestSnapshotSucceedsForUnknownUser() {
  Fixture f;
  auto server = f.Server();

  reader::v1::GetSnapshotRequest req;
  req.set_user(AddressOf(0x44).ToBase58());
  reader::v1::GetSnapshotResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetSnapshot(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.snapshot().user() == req.user());
  assert(!resp.snapshot().pop_profile().exists());
}

} // namespace

int main() {
  TestErrorFamiliesMapToCodes();
  TestMissingVaultReturnsNotFound();
  TestBadUserReturnsInvalidArgument();
  TestUnreadableVaultReturnsUnavailable();
  TestUnpricedVaultReturnsFailedPrecondition();
  TestSnapshotSucceedsForUnknownUser();

  std::cout << "rvault_unit_grpc_status: pass\n";
  return 0;
}
