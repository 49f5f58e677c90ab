#include "relay_api.hpp"

#include <unordered_map>

#include "internal/util/errors.hpp"

namespace relay::transport {
namespace {

RelayProtocolApi MakeApi(const std::string& protocol) {
  return RelayProtocolApi{protocol + "_publish", protocol + "_subscribe", protocol + "_subscription", protocol + "_unsubscribe"};
}

const std::unordered_map<std::string, RelayProtocolApi>& Registry() {
  static const std::unordered_map<std::string, RelayProtocolApi> kApis = {
      {"irn", MakeApi("irn")},
      {"iridium", MakeApi("iridium")},
      {"waku", MakeApi("waku")},
  };
  return kApis;
}

} // namespace

const RelayProtocolApi& GetRelayProtocolApi(const std::string& protocol) {
  const auto& apis = Registry();
  auto        it   = apis.find(protocol);
  if (it == apis.end()) {
    throw util::InvalidArgument("Relay Protocol not supported: " + protocol);
  }
  return it->second;
}

std::string GetRelayProtocolName(const relay::v1::PublishOptions& opts) {
  if (opts.has_relay() && !opts.relay().protocol().empty()) {
    return opts.relay().protocol();
  }
  return kDefaultRelayProtocol;
}

} // namespace relay::transport
