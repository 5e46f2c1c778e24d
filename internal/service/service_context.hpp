#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "internal/chain/address_deriver.hpp"
#include "internal/rpc/account_reader.hpp"
#include "internal/util/time.hpp"

namespace rvault::oracle { class PriceOracleEngine; }
namespace rvault::snapshot { class SnapshotAssembler; }

namespace rvault::service {

/*
  Dependency container shared by the read service.
*/
struct ServiceContext {
  std::shared_ptr<rvault::rpc::AccountReader> reader;
  std::shared_ptr<rvault::chain::AddressDeriver> deriver;
  std::shared_ptr<rvault::oracle::PriceOracleEngine> oracle;
  std::shared_ptr<rvault::snapshot::SnapshotAssembler> assembler;
  rvault::rpc::Commitment commitment = rvault::rpc::Commitment::kConfirmed;
  // Unix seconds; replaced in tests.
  std::function<std::int64_t()> clock = rvault::util::UnixNowSeconds;
};

} // namespace rvault::service
