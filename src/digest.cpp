#include "digest.hpp"
#include <algorithm>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace shopdb {

namespace {

constexpr char HEX_CHARS[] = "0123456789abcdef";

void sha256_into(const unsigned char* data, size_t length, unsigned char* out) {
    if (SHA256(data, length, out) == nullptr) {
        throw std::runtime_error("SHA-256 computation failed");
    }
}

}

std::string sha256_bytes(std::string_view input) {
    unsigned char out[SHA256_DIGEST_BYTES];
    sha256_into(reinterpret_cast<const unsigned char*>(input.data()), input.size(), out);
    return std::string(reinterpret_cast<const char*>(out), SHA256_DIGEST_BYTES);
}

std::string to_hex(std::string_view bytes) {
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        const auto byte = static_cast<unsigned char>(bytes[i]);
        out[i * 2] = HEX_CHARS[byte >> 4];
        out[i * 2 + 1] = HEX_CHARS[byte & 0x0f];
    }
    return out;
}

std::string stretch(std::string_view input, int rounds) {
    unsigned char current[SHA256_DIGEST_BYTES];
    unsigned char next[SHA256_DIGEST_BYTES];

    sha256_into(reinterpret_cast<const unsigned char*>(input.data()), input.size(), current);

    // Each round hashes the previous raw digest, not its hex form.
    for (int i = 0; i < rounds; ++i) {
        sha256_into(current, SHA256_DIGEST_BYTES, next);
        std::copy(next, next + SHA256_DIGEST_BYTES, current);
    }

    return to_hex(std::string_view(reinterpret_cast<const char*>(current), SHA256_DIGEST_BYTES));
}

std::string secure_random_bytes(size_t count) {
    std::string out(count, '\0');
    if (count == 0) {
        return out;
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
        throw std::runtime_error("CSPRNG failed to produce " + std::to_string(count) + " bytes");
    }
    return out;
}

}
