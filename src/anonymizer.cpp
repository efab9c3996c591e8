#include "anonymizer.hpp"
#include "digest.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace shopdb {

std::string to_string(ErasureOutcome outcome) {
    switch (outcome) {
        case ErasureOutcome::ERASED:
            return "erased";
        case ErasureOutcome::NOT_FOUND:
            return "not_found";
        case ErasureOutcome::ALREADY_ERASED:
            return "already_erased";
    }
    return "unknown";
}

nlohmann::json to_json(const ErasureRecord& record) {
    nlohmann::json json = {
        {"user_id", record.user_id},
        {"outcome", to_string(record.outcome)},
        {"shipping_addresses", record.shipping_addresses},
        {"orders", record.orders},
        {"payments", record.payments}
    };
    json["anon_tag"] = record.anon_tag.empty() ? nlohmann::json(nullptr) : nlohmann::json(record.anon_tag);
    json["anonymized_time"] = record.anonymized_time
        ? nlohmann::json(format_timestamp(*record.anonymized_time))
        : nlohmann::json(nullptr);
    return json;
}

Anonymizer::Anonymizer(std::shared_ptr<CommerceStore> store, AnonymizerConfig config)
    : store_(std::move(store)), config_(std::move(config)), salt_source_(secure_random_bytes) {
    if (!store_) {
        throw std::invalid_argument("Anonymizer requires a store");
    }
    validate(config_);
}

void Anonymizer::set_salt_source(SaltSource source) {
    salt_source_ = std::move(source);
}

void Anonymizer::set_erasure_listener(ErasureListener listener) {
    listener_ = std::move(listener);
}

std::string Anonymizer::build_label_source(const User& user, std::string_view salt_hex) {
    std::string source;
    source += user.email.value_or("");
    source += '|';
    source += user.first_name.value_or("");
    source += '|';
    source += user.last_name.value_or("");
    source += '|';
    source += user.username.value_or("");
    source += '|';
    source += salt_hex;
    return source;
}

std::string Anonymizer::derive_label(std::string_view digest) const {
    return config_.label_prefix + std::string(digest.substr(0, config_.label_length));
}

std::string Anonymizer::label_email(const std::string& label) const {
    return label + "@" + config_.email_domain;
}

void Anonymizer::anonymize_user(UserId user_id) {
    ErasureRecord record;
    record.user_id = user_id;

    // Rolled back by the destructor on every exit that does not commit.
    auto txn = store_->begin();

    auto user = txn->lock_user(user_id);
    if (!user) {
        txn->rollback();
        record.outcome = ErasureOutcome::NOT_FOUND;
        notify(record);
        return;
    }

    if (user->is_erased()) {
        txn->rollback();
        record.outcome = ErasureOutcome::ALREADY_ERASED;
        record.anon_tag = user->anon_tag.value_or("");
        record.anonymized_time = user->anonymized_time;
        notify(record);
        return;
    }

    const std::string salt = salt_source_(config_.salt_bytes);
    if (salt.size() < config_.salt_bytes) {
        throw std::runtime_error("salt source returned " + std::to_string(salt.size()) +
                                 " bytes, need " + std::to_string(config_.salt_bytes));
    }

    const std::string digest = stretch(build_label_source(*user, to_hex(salt)), config_.stretch_rounds);
    const std::string label = derive_label(digest);
    const std::string email = label_email(label);
    const Timestamp now = std::chrono::system_clock::now();

    // Order is fixed: users, shipping_addresses, orders, payments.
    user->first_name = label;
    user->last_name = label;
    user->username = label;
    user->email = email;
    user->anonymized_time = now;
    user->anon_tag = label;
    user->status = UserStatus::ERASED;
    txn->update_user(*user);

    for (auto& address : txn->shipping_addresses_for_user(user_id)) {
        address.street = label;
        address.phone_number = label;
        address.city.reset();
        address.state.reset();
        address.zip.reset();
        txn->update_shipping_address(address);
        ++record.shipping_addresses;
    }

    for (auto& order : txn->orders_for_user(user_id)) {
        order.email_snapshot = email;
        order.shipping_name = label;
        order.shipping_address = label;
        order.shipping_city.reset();
        order.shipping_state.reset();
        order.shipping_zip.reset();
        txn->update_order(order);
        ++record.orders;
    }

    for (auto& payment : txn->payments_for_user(user_id)) {
        payment.billing_name = label;
        payment.billing_address = label;
        txn->update_payment(payment);
        ++record.payments;
    }

    txn->commit();

    record.outcome = ErasureOutcome::ERASED;
    record.anon_tag = label;
    record.anonymized_time = now;
    notify(record);
}

void Anonymizer::notify(const ErasureRecord& record) const {
    if (listener_) {
        listener_(record);
    }
}

}
