#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/model/partner.hpp"
#include "internal/oracle/price_oracle.hpp"
#include "internal/rpc/account_reader.hpp"
#include "internal/service/reader_service.hpp"

namespace rvault::factory {

inline constexpr const char* kDefaultProgramId = "2SBFs9cnkv6NZjM28a87ysPr7zvPWj7KuQC4WW16nGS7";
inline constexpr const char* kDefaultPartner   = "8b1sr6ZyBY68DvwZmfTBVu4b9Lyi9PthB9LU3PH2PBhF:Reward-fest! Ally";

/*
  Application

  Owns every long-lived object used by the server. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<rpc::AccountReader> reader;
  std::shared_ptr<service::ReaderService> reader_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

rpc::Commitment CommitmentFrom(rvault::runtime::config::Commitment commitment);
oracle::OracleOptions OracleOptionsFrom(const rvault::runtime::config::ProgramConfig& program);
std::vector<model::PartnerRef> PartnersFrom(const rvault::runtime::config::ProgramConfig& program);

std::shared_ptr<rpc::AccountReader> BuildReader(const rvault::runtime::config::AccountSourceConfig& accounts);

// Composition root. An explicit reader overrides the configured source.
Application Build(const rvault::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<rpc::AccountReader> reader = nullptr);

} // namespace rvault::factory
