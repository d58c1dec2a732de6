#pragma once

#include <cstdint>
#include <string>

namespace pairlink::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Short, log-safe identifier for a secret: its length plus a SHA-256 prefix.
[[nodiscard]] std::string token_fingerprint(const std::string &token);

/// Uniform value in [0, bound) from the OpenSSL CSPRNG; bound must be non-zero.
[[nodiscard]] std::uint32_t random_below(std::uint32_t bound);

} // namespace pairlink::common
