#pragma once

#include <string>
#include <string_view>

namespace allot::util {

// False when libsodium cannot be initialized on this host.
bool ensure_sodium();

// Lowercase hex BLAKE2b-256 of `payload`; empty when libsodium is unavailable.
std::string content_id(std::string_view payload);

}  // namespace allot::util
