#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace shopdb {

using Timestamp = std::chrono::system_clock::time_point;
using Cents = int64_t;             // NUMERIC(12,2) held as integer cents

using UserId = int64_t;
using AdminId = int64_t;
using CategoryId = int64_t;
using ProductId = int64_t;
using ShippingAddressId = int64_t;
using OrderId = int64_t;
using OrderItemId = int64_t;
using PaymentId = int64_t;

// Nullable VARCHAR column
using Text = std::optional<std::string>;

enum class UserStatus {
    ACTIVE,
    ERASED
};

std::string to_string(UserStatus status);
std::optional<UserStatus> user_status_from_string(const std::string& value);

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string format_timestamp(Timestamp ts);

// NUMERIC(12,2) text form, e.g. 7900 -> "79.00"
std::string format_cents(Cents amount);

struct User {
    UserId user_id = 0;
    Text first_name;
    Text last_name;
    Text username;
    Text email;
    std::string password_hash;     // BYTEA NOT NULL
    Timestamp created_at{};
    std::optional<Timestamp> anonymized_time;
    Text anon_tag;
    UserStatus status = UserStatus::ACTIVE;

    [[nodiscard]] bool is_erased() const {
        return status == UserStatus::ERASED || anonymized_time.has_value();
    }
};

struct Admin {
    AdminId admin_id = 0;
    std::string username;
    std::string password_hash;
    Timestamp created_at{};
};

struct Category {
    CategoryId category_id = 0;
    std::string name;
};

struct Product {
    ProductId product_id = 0;
    std::string product_name;
    Cents price = 0;
    Cents discount = 0;
    int32_t count_in_stock = 0;
    Timestamp created_at{};
    std::optional<CategoryId> category_id;
    std::optional<UserId> created_by_user_id;
};

struct ShippingAddress {
    ShippingAddressId shipping_address_id = 0;
    UserId user_id = 0;
    Text street;
    Text city;
    Text zip;
    Text state;
    Text phone_number;
};

// Identity and shipping fields are a snapshot taken at purchase time,
// independent of the live user and address rows.
struct Order {
    OrderId order_id = 0;
    UserId user_id = 0;
    std::optional<ShippingAddressId> shipping_address_id;
    Text email_snapshot;
    Text shipping_name;
    Text shipping_address;
    Text shipping_city;
    Text shipping_state;
    Text shipping_zip;
    Text ship_country;
    Cents tax = 0;
    Cents shipping_price = 0;
    bool is_delivered = false;
    bool is_paid = false;
    Cents total_cost = 0;
    Timestamp purchase_date{};
    std::optional<Timestamp> delivery_date;
};

struct OrderItem {
    OrderItemId order_item_id = 0;
    OrderId order_id = 0;
    ProductId product_id = 0;
    int32_t quantity = 0;
    Cents price = 0;
};

struct Payment {
    PaymentId payment_id = 0;
    OrderId order_id = 0;
    Text psp_ref;
    Text last4;
    Text billing_name;
    Text billing_address;
    Timestamp created_at{};
};

}
