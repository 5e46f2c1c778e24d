#include "internal/model/partner.hpp"

#include <set>

namespace rvault::model {

namespace {

std::string_view Trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

} // namespace

PartnerRef ParsePartnerRef(std::string_view entry) {
  const auto colon = entry.find(':');
  const auto mint  = Trim(entry.substr(0, colon));
  const auto label = colon == std::string_view::npos ? std::string_view{} : Trim(entry.substr(colon + 1));

  PartnerRef ref;
  ref.mint  = chain::Address::FromBase58(mint);
  ref.label = label.empty() ? ref.mint.ShortForm() : std::string(label);
  return ref;
}

std::vector<PartnerRef> ParsePartnerRefs(const std::vector<std::string>& entries) {
  std::vector<PartnerRef> out;
  std::set<chain::Address> seen;
  for (const auto& entry : entries) {
    if (Trim(entry).empty()) continue;
    auto ref = ParsePartnerRef(entry);
    // First occurrence wins for duplicated mints.
    if (!seen.insert(ref.mint).second) continue;
    out.push_back(std::move(ref));
  }
  return out;
}

} // namespace rvault::model
