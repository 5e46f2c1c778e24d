#include "internal/rpc/fixture_account_reader.hpp"

#include <sodium.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace rvault::rpc {

namespace {

chain::Bytes DecodeBase64(const std::string& text, const std::string& address) {
  chain::Bytes out(text.size() / 4 * 3 + 3);
  std::size_t written = 0;
  if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), " \n\r\t", &written, nullptr,
                        sodium_base64_VARIANT_ORIGINAL)
      != 0) {
    throw std::runtime_error("fixture account " + address + ": invalid base64 data");
  }
  out.resize(written);
  return out;
}

chain::Bytes DecodeHex(const std::string& text, const std::string& address) {
  chain::Bytes out(text.size() / 2 + 1);
  std::size_t written = 0;
  if (sodium_hex2bin(out.data(), out.size(), text.data(), text.size(), " \n\r\t:", &written, nullptr) != 0) {
    throw std::runtime_error("fixture account " + address + ": invalid hex data");
  }
  out.resize(written);
  return out;
}

YAML::Node Parse(const std::string& source, bool is_path) {
  try {
    return is_path ? YAML::LoadFile(source) : YAML::Load(source);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load account fixture: " + std::string(e.what()));
  }
}

} // namespace

FixtureAccountReader FixtureAccountReader::LoadFromYaml(const std::string& path) {
  FixtureAccountReader reader;
  reader.Populate(Parse(path, true), path);
  return reader;
}

FixtureAccountReader FixtureAccountReader::LoadFromString(const std::string& yaml) {
  FixtureAccountReader reader;
  reader.Populate(Parse(yaml, false), "<inline>");
  return reader;
}

void FixtureAccountReader::Populate(const YAML::Node& root, const std::string& origin) {
  const auto list = root["accounts"];
  if (!list || !list.IsSequence()) {
    throw std::runtime_error("account fixture " + origin + " has no 'accounts' sequence");
  }

  if (sodium_init() < 0) {
    throw std::runtime_error("libsodium initialization failed");
  }

  for (const auto& entry : list) {
    const auto raw_address = entry["address"];
    if (!raw_address) throw std::runtime_error("account fixture " + origin + ": entry without address");
    const auto text    = raw_address.as<std::string>();
    const auto address = chain::Address::FromBase58(text);

    if (const auto error = entry["error"]) {
      failures_[address] = error.as<std::string>();
    } else if (const auto b64 = entry["base64"]) {
      accounts_[address] = DecodeBase64(b64.as<std::string>(), text);
    } else if (const auto hex = entry["hex"]) {
      accounts_[address] = DecodeHex(hex.as<std::string>(), text);
    } else {
      throw std::runtime_error("fixture account " + text + ": expected one of base64, hex or error");
    }
  }
}

std::optional<chain::Bytes> FixtureAccountReader::ReadAccount(const chain::Address& address, Commitment) {
  if (auto failure = failures_.find(address); failure != failures_.end()) {
    throw util::ReadError(failure->second);
  }
  const auto it = accounts_.find(address);
  if (it == accounts_.end()) return std::nullopt;
  return it->second;
}

} // namespace rvault::rpc
