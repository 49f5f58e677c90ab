#pragma once

#include <string>
#include <string_view>

namespace relay::util {

/*
  Message fingerprint: lowercase hex SHA-256 of the raw message bytes.

  Used as the dedup key of the publisher queue.
*/
std::string HashMessage(std::string_view message);

} // namespace relay::util
