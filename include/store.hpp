#pragma once

#include "entities.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shopdb {

// Lock failures, constraint violations, lost connections. Aborts the
// surrounding transaction.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * StoreTransaction
 *
 * One unit of work against the store. Writes become visible to other
 * transactions only on commit(). A transaction destroyed before commit()
 * is rolled back and releases every row lock it holds.
 */
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    // SELECT ... FOR UPDATE on the user row. Blocks while another
    // transaction holds the lock. Returns nullopt if the user does not exist.
    virtual std::optional<User> lock_user(UserId user_id) = 0;
    virtual void update_user(const User& user) = 0;

    virtual std::vector<ShippingAddress> shipping_addresses_for_user(UserId user_id) = 0;
    virtual void update_shipping_address(const ShippingAddress& address) = 0;

    virtual std::vector<Order> orders_for_user(UserId user_id) = 0;
    virtual void update_order(const Order& order) = 0;

    // Payments reached through the user's orders.
    virtual std::vector<Payment> payments_for_user(UserId user_id) = 0;
    virtual void update_payment(const Payment& payment) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
};

class CommerceStore {
public:
    virtual ~CommerceStore() = default;

    virtual std::unique_ptr<StoreTransaction> begin() = 0;
};

}
