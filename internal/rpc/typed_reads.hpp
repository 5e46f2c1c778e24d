#pragma once

#include <optional>
#include <span>
#include <string_view>

#include "internal/observability/spans.hpp"
#include "internal/rpc/account_reader.hpp"
#include "internal/util/errors.hpp"

namespace rvault::rpc {

/*
  Reads one account and runs it through a decoder.

  Absent accounts come back as nullopt; ReadError and DecodeError propagate
  unchanged. Every outcome is counted per record kind.
*/
template <typename Decoder>
auto ReadDecoded(AccountReader& reader,
                 const chain::Address& address,
                 Commitment commitment,
                 std::string_view kind,
                 Decoder&& decode) -> std::optional<decltype(decode(std::span<const std::uint8_t>{}))> {
  auto& metrics = observability::Metrics::Instance();

  std::optional<chain::Bytes> data;
  try {
    data = reader.ReadAccount(address, commitment);
  } catch (const util::ReadError&) {
    metrics.RecordAccountRead(kind, "read_error");
    throw;
  }

  if (!data) {
    metrics.RecordAccountRead(kind, "absent");
    return std::nullopt;
  }

  try {
    auto record = decode(std::span<const std::uint8_t>(*data));
    metrics.RecordAccountRead(kind, "found");
    return record;
  } catch (const util::DecodeError&) {
    metrics.RecordAccountRead(kind, "decode_error");
    throw;
  }
}

} // namespace rvault::rpc
