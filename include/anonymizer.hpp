#pragma once

#include "anonymizer_config.hpp"
#include "store.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace shopdb {

enum class ErasureOutcome {
    ERASED,
    NOT_FOUND,
    ALREADY_ERASED
};

std::string to_string(ErasureOutcome outcome);

// What one anonymize_user() call did. Never carries pre-erasure data.
struct ErasureRecord {
    UserId user_id = 0;
    ErasureOutcome outcome = ErasureOutcome::NOT_FOUND;
    std::string anon_tag;
    std::optional<Timestamp> anonymized_time;
    size_t shipping_addresses = 0;
    size_t orders = 0;
    size_t payments = 0;
};

nlohmann::json to_json(const ErasureRecord& record);

/**
 * Anonymizer
 *
 * Right-to-erasure engine. anonymize_user() scrubs a user's personal data
 * from the users, shipping_addresses, orders and payments tables inside
 * one transaction that holds the user's row lock throughout, and moves the
 * user to the terminal `erased` status. Financial columns, order items and
 * payment references are left untouched.
 *
 * Unknown and already-erased users are silent no-ops. A storage failure
 * rolls the whole transaction back and propagates as StorageError; a retry
 * is safe because erased users are never touched twice.
 */
class Anonymizer {
public:
    using SaltSource = std::function<std::string(size_t)>;
    using ErasureListener = std::function<void(const ErasureRecord&)>;

    explicit Anonymizer(std::shared_ptr<CommerceStore> store, AnonymizerConfig config = {});

    void anonymize_user(UserId user_id);

    void set_salt_source(SaltSource source);
    void set_erasure_listener(ErasureListener listener);

    [[nodiscard]] const AnonymizerConfig& get_config() const { return config_; }

    // email|first_name|last_name|username|salt_hex, nulls as empty strings
    [[nodiscard]] static std::string build_label_source(const User& user, std::string_view salt_hex);
    [[nodiscard]] std::string derive_label(std::string_view digest) const;
    [[nodiscard]] std::string label_email(const std::string& label) const;

private:
    void notify(const ErasureRecord& record) const;

    std::shared_ptr<CommerceStore> store_;
    AnonymizerConfig config_;
    SaltSource salt_source_;
    ErasureListener listener_;
};

}
