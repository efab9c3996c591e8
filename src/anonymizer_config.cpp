#include "anonymizer_config.hpp"
#include <fstream>
#include <limits>

namespace shopdb {

namespace {

template <typename T>
void read_key(const nlohmann::json& json, const char* key, T& target) {
    if (!json.contains(key)) {
        return;
    }
    try {
        target = json.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

}

void validate(const AnonymizerConfig& config) {
    if (config.stretch_rounds < 0) {
        throw ConfigError("stretch_rounds must not be negative");
    }
    if (config.label_prefix.empty()) {
        throw ConfigError("label_prefix must not be empty");
    }
    if (config.label_length == 0 || config.label_length > MAX_LABEL_LENGTH) {
        throw ConfigError("label_length must be between 1 and " + std::to_string(MAX_LABEL_LENGTH));
    }
    if (config.label_prefix.size() + config.label_length > MAX_LABEL_COLUMN_WIDTH) {
        throw ConfigError("label_prefix plus label_length must fit in " +
                          std::to_string(MAX_LABEL_COLUMN_WIDTH) + " characters");
    }
    if (config.email_domain.empty()) {
        throw ConfigError("email_domain must not be empty");
    }
    if (config.label_prefix.size() + config.label_length + 1 + config.email_domain.size() >
        MAX_LABEL_EMAIL_WIDTH) {
        throw ConfigError("label email must fit in " + std::to_string(MAX_LABEL_EMAIL_WIDTH) +
                          " characters");
    }
    if (config.salt_bytes < MIN_SALT_BYTES || config.salt_bytes > MAX_SALT_BYTES) {
        throw ConfigError("salt_bytes must be between " + std::to_string(MIN_SALT_BYTES) +
                          " and " + std::to_string(MAX_SALT_BYTES));
    }
}

AnonymizerConfig anonymizer_config_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("anonymizer config must be a JSON object");
    }

    AnonymizerConfig config;

    // Read signed so that "-1" is reported as a range error, not wrapped.
    int64_t stretch_rounds = config.stretch_rounds;
    int64_t label_length = static_cast<int64_t>(config.label_length);
    int64_t salt_bytes = static_cast<int64_t>(config.salt_bytes);

    read_key(json, "stretch_rounds", stretch_rounds);
    read_key(json, "label_prefix", config.label_prefix);
    read_key(json, "label_length", label_length);
    read_key(json, "email_domain", config.email_domain);
    read_key(json, "salt_bytes", salt_bytes);

    if (stretch_rounds < 0 || stretch_rounds > std::numeric_limits<int>::max()) {
        throw ConfigError("stretch_rounds must be between 0 and " +
                          std::to_string(std::numeric_limits<int>::max()));
    }
    if (label_length < 0 || salt_bytes < 0) {
        throw ConfigError("label_length and salt_bytes must not be negative");
    }
    config.stretch_rounds = static_cast<int>(stretch_rounds);
    config.label_length = static_cast<size_t>(label_length);
    config.salt_bytes = static_cast<size_t>(salt_bytes);

    validate(config);
    return config;
}

AnonymizerConfig load_anonymizer_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("malformed config file " + path + ": " + e.what());
    }
    return anonymizer_config_from_json(json);
}

nlohmann::json to_json(const AnonymizerConfig& config) {
    return nlohmann::json{
        {"stretch_rounds", config.stretch_rounds},
        {"label_prefix", config.label_prefix},
        {"label_length", config.label_length},
        {"email_domain", config.email_domain},
        {"salt_bytes", config.salt_bytes}
    };
}

}
