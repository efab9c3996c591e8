#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace shopdb {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Erasure parameters
struct AnonymizerConfig {
    int stretch_rounds = 30000;                // extra SHA-256 rounds after the first hash
    std::string label_prefix = "anon_";
    size_t label_length = 12;                  // hex chars of the digest kept in the label
    std::string email_domain = "example.invalid";
    size_t salt_bytes = 32;                    // per-erasure random salt, never stored
};

constexpr size_t MIN_SALT_BYTES = 32;
constexpr size_t MAX_SALT_BYTES = 1024;       // pgcrypto gen_random_bytes() limit
constexpr size_t MAX_LABEL_LENGTH = 64;
// Narrowest column the label is written to: shipping_addresses.phone_number VARCHAR(50).
constexpr size_t MAX_LABEL_COLUMN_WIDTH = 50;
// users.email and orders.email_snapshot are VARCHAR(255).
constexpr size_t MAX_LABEL_EMAIL_WIDTH = 255;

// Throws ConfigError describing the first violated constraint.
void validate(const AnonymizerConfig& config);

// Missing keys keep their defaults; unknown keys are ignored.
AnonymizerConfig anonymizer_config_from_json(const nlohmann::json& json);
AnonymizerConfig load_anonymizer_config(const std::string& path);

nlohmann::json to_json(const AnonymizerConfig& config);

}
