#include "pairlink/common/crypto.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

namespace pairlink::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::string token_fingerprint(const std::string &token) {
  if (token.empty()) {
    return "len=0";
  }
  return "len=" + std::to_string(token.size()) + " sha256=" + sha256_hex(token).substr(0, 12);
}

std::uint32_t random_below(const std::uint32_t bound) {
  std::uint32_t value = 0;
  if (RAND_bytes(reinterpret_cast<unsigned char *>(&value), sizeof(value)) != 1) {
    // CSPRNG unavailable: fall back to the clock.
    value = static_cast<std::uint32_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
  }
  return value % bound;
}

} // namespace pairlink::common
