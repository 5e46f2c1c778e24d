#include "reader_server.hpp"
#include "grpc_error.hpp"

namespace rvault::grpc {

namespace v1 = rvault::reader::v1;

namespace {

// Every RPC is unary and stateless; the service call either fills the
// response or throws.
template <typename Call>
::grpc::Status Dispatch(Call&& call) {
  try {
    call();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

ReaderServer::ReaderServer(std::shared_ptr<rvault::service::ReaderService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ReaderServer::GetSnapshot(::grpc::ServerContext*,
                                         const v1::GetSnapshotRequest* req,
                                         v1::GetSnapshotResponse* resp) {
  return Dispatch([&] { *resp = service_->GetSnapshot(*req); });
}

::grpc::Status ReaderServer::GetQuote(::grpc::ServerContext*,
                                      const v1::GetQuoteRequest* req,
                                      v1::GetQuoteResponse* resp) {
  return Dispatch([&] { *resp = service_->GetQuote(*req); });
}

::grpc::Status ReaderServer::GetVaultConfig(::grpc::ServerContext*,
                                            const v1::GetVaultConfigRequest* req,
                                            v1::GetVaultConfigResponse* resp) {
  return Dispatch([&] { *resp = service_->GetVaultConfig(*req); });
}

::grpc::Status ReaderServer::GetPartner(::grpc::ServerContext*,
                                        const v1::GetPartnerRequest* req,
                                        v1::GetPartnerResponse* resp) {
  return Dispatch([&] { *resp = service_->GetPartner(*req); });
}

::grpc::Status ReaderServer::DeriveAddresses(::grpc::ServerContext*,
                                             const v1::DeriveAddressesRequest* req,
                                             v1::DeriveAddressesResponse* resp) {
  return Dispatch([&] { *resp = service_->DeriveAddresses(*req); });
}

::grpc::Status ReaderServer::BuildConvertInstruction(::grpc::ServerContext*,
                                                     const v1::BuildConvertInstructionRequest* req,
                                                     v1::BuildInstructionResponse* resp) {
  return Dispatch([&] { *resp = service_->BuildConvertInstruction(*req); });
}

::grpc::Status ReaderServer::BuildClaimInstruction(::grpc::ServerContext*,
                                                   const v1::BuildClaimInstructionRequest* req,
                                                   v1::BuildInstructionResponse* resp) {
  return Dispatch([&] { *resp = service_->BuildClaimInstruction(*req); });
}

} // namespace rvault::grpc
