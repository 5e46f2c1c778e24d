#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/reader_service.hpp"
#include "rvault/reader/v1.hpp"

namespace rvault::grpc {

class ReaderServer final : public rvault::reader::v1::RewardVaultReaderService::Service {
public:
  explicit ReaderServer(std::shared_ptr<rvault::service::ReaderService> svc);

  ::grpc::Status GetSnapshot(::grpc::ServerContext* ctx,
                             const rvault::reader::v1::GetSnapshotRequest* req,
                             rvault::reader::v1::GetSnapshotResponse* resp) override;

  ::grpc::Status GetQuote(::grpc::ServerContext* ctx,
                          const rvault::reader::v1::GetQuoteRequest* req,
                          rvault::reader::v1::GetQuoteResponse* resp) override;

  ::grpc::Status GetVaultConfig(::grpc::ServerContext* ctx,
                                const rvault::reader::v1::GetVaultConfigRequest* req,
                                rvault::reader::v1::GetVaultConfigResponse* resp) override;

  ::grpc::Status GetPartner(::grpc::ServerContext* ctx,
                            const rvault::reader::v1::GetPartnerRequest* req,
                            rvault::reader::v1::GetPartnerResponse* resp) override;

  ::grpc::Status DeriveAddresses(::grpc::ServerContext* ctx,
                                 const rvault::reader::v1::DeriveAddressesRequest* req,
                                 rvault::reader::v1::DeriveAddressesResponse* resp) override;

  ::grpc::Status BuildConvertInstruction(::grpc::ServerContext* ctx,
                                         const rvault::reader::v1::BuildConvertInstructionRequest* req,
                                         rvault::reader::v1::BuildInstructionResponse* resp) override;

  ::grpc::Status BuildClaimInstruction(::grpc::ServerContext* ctx,
                                       const rvault::reader::v1::BuildClaimInstructionRequest* req,
                                       rvault::reader::v1::BuildInstructionResponse* resp) override;

private:
  std::shared_ptr<rvault::service::ReaderService> service_;
};

} // namespace rvault::grpc
