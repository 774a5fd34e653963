#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace allot::util {

bool ensure_sodium() {
  static const bool ready = sodium_init() >= 0;
  return ready;
}

std::string content_id(std::string_view payload) {
  if (!ensure_sodium()) {
    return {};
  }

  std::array<unsigned char, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()), nullptr, 0);
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

}  // namespace allot::util
