#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>

#include "relay/v1.hpp"

namespace relay::transport {

/*
  Outbound half of the relay connection.

  Request() blocks until the relay acknowledges and returns its result.
  Any failure (socket down, relay error response, timeout) is thrown.
*/
class RelayTransport {
 public:
  virtual ~RelayTransport() = default;

  virtual google::protobuf::Value Request(const relay::v1::RequestArguments& request) = 0;
};

using RelayTransportPtr = std::shared_ptr<RelayTransport>;

} // namespace relay::transport
