#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/chain/address.hpp"

namespace rvault::model {

// A partner the snapshot covers, identified by its NFT mint.
struct PartnerRef {
  chain::Address mint;
  std::string label;
};

// Parses "mint" or "mint:label"; an unlabeled partner gets its short address.
// Throws util::AddressDerivationError for a malformed mint.
PartnerRef ParsePartnerRef(std::string_view entry);

std::vector<PartnerRef> ParsePartnerRefs(const std::vector<std::string>& entries);

} // namespace rvault::model
