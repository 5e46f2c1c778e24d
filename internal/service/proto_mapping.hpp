#pragma once

#include <string_view>

#include "internal/codec/instruction_codec.hpp"
#include "internal/guard/claim_guard.hpp"
#include "internal/model/records.hpp"
#include "internal/oracle/price_oracle.hpp"
#include "internal/snapshot/snapshot_assembler.hpp"
#include "rvault/reader/v1.hpp"

namespace rvault::service {

/*
  Conversions between internal records and the wire types.

  Timestamps <= 0 are left unset; absent records render as zero values.
*/

rvault::reader::v1::Snapshot ToProto(const snapshot::Snapshot& snapshot);
rvault::reader::v1::ClaimAllowance ToProto(const guard::ClaimAllowance& allowance);
rvault::reader::v1::Quote ToProto(const oracle::Quote& quote);
rvault::reader::v1::VaultConfig ToProto(const chain::Address& address, const model::VaultConfig& vault);
rvault::reader::v1::Partner ToProto(const chain::Address& address, const model::PartnerRecord& partner);
rvault::reader::v1::Instruction ToProto(const codec::Instruction& instruction);

// Throws std::invalid_argument naming the field when the value is empty or
// not a 32-byte base58 address.
chain::Address ParseAddressField(std::string_view value, std::string_view field);

} // namespace rvault::service
