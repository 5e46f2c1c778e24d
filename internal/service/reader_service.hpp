#pragma once

#include <optional>
#include <utility>

#include "internal/model/records.hpp"
#include "internal/service/service_context.hpp"
#include "rvault/reader/v1.hpp"

namespace rvault::service {

/*
  Read operations over the reward vault, one method per RPC.

  Methods throw the util:: error types; the gRPC adapter turns them into
  status codes.
*/
class ReaderService {
 public:
  explicit ReaderService(ServiceContext ctx);

  rvault::reader::v1::GetSnapshotResponse GetSnapshot(const rvault::reader::v1::GetSnapshotRequest& req);

  rvault::reader::v1::GetQuoteResponse GetQuote(const rvault::reader::v1::GetQuoteRequest& req);

  rvault::reader::v1::GetVaultConfigResponse GetVaultConfig(const rvault::reader::v1::GetVaultConfigRequest& req);

  rvault::reader::v1::GetPartnerResponse GetPartner(const rvault::reader::v1::GetPartnerRequest& req);

  rvault::reader::v1::DeriveAddressesResponse DeriveAddresses(const rvault::reader::v1::DeriveAddressesRequest& req);

  rvault::reader::v1::BuildInstructionResponse
  BuildConvertInstruction(const rvault::reader::v1::BuildConvertInstructionRequest& req);

  rvault::reader::v1::BuildInstructionResponse
  BuildClaimInstruction(const rvault::reader::v1::BuildClaimInstructionRequest& req);

 private:
  // Throws util::NotFound when the vault has not been initialized.
  std::pair<chain::Address, model::VaultConfig> RequireVault() const;
  std::pair<chain::Address, model::PartnerRecord> RequirePartner(const chain::Address& mint) const;
  std::optional<model::VaultConfig> TryReadVault() const;

  ServiceContext ctx_;
};

} // namespace rvault::service
