#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace shopdb {

constexpr size_t SHA256_DIGEST_BYTES = 32;

// Raw 32-byte SHA-256 of the input bytes.
[[nodiscard]] std::string sha256_bytes(std::string_view input);

// Lowercase hex encoding of arbitrary bytes.
[[nodiscard]] std::string to_hex(std::string_view bytes);

/**
 * Key-stretching digest.
 *
 * Hashes the input once with SHA-256, then re-hashes the raw 32-byte digest
 * `rounds` more times. Negative round counts are treated as zero, so
 * stretch(x, 0) is the plain SHA-256 of x. Returns 64 lowercase hex chars.
 */
[[nodiscard]] std::string stretch(std::string_view input, int rounds);

// Bytes from the OpenSSL CSPRNG. Throws std::runtime_error if it fails.
[[nodiscard]] std::string secure_random_bytes(size_t count);

}
