#pragma once

#include <string>

#include "relay/v1.hpp"

namespace relay::transport {

inline constexpr char kDefaultRelayProtocol[] = "irn";

/*
  JSON-RPC method names a relay protocol exposes.
*/
struct RelayProtocolApi {
  std::string publish;
  std::string subscribe;
  std::string subscription;
  std::string unsubscribe;
};

// Throws util::InvalidArgument for an unknown protocol.
const RelayProtocolApi& GetRelayProtocolApi(const std::string& protocol);

// Protocol named by the options, or kDefaultRelayProtocol when unset.
std::string GetRelayProtocolName(const relay::v1::PublishOptions& opts);

} // namespace relay::transport
