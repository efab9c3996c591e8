#pragma once

#include "store.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace shopdb {

class InMemoryTransaction;

/**
 * InMemoryStore
 *
 * Transactional in-process implementation of CommerceStore. Rows live in
 * per-table maps keyed by id; ids are assigned sequentially from 1.
 * Transactions stage their writes privately and publish them on commit
 * under the store mutex. User rows are locked per transaction: a second
 * lock_user() on the same id waits until the holder commits or rolls back.
 *
 * Inserts and the find_/..._of accessors work on committed state and are
 * meant for seeding and inspection.
 */
class InMemoryStore : public CommerceStore {
public:
    // Called before every staged write with the table name and row id.
    // Throwing StorageError simulates a failed write.
    using WriteHook = std::function<void(const std::string& table, int64_t row_id)>;

    InMemoryStore() = default;
    InMemoryStore(const InMemoryStore&) = delete;
    InMemoryStore& operator=(const InMemoryStore&) = delete;

    std::unique_ptr<StoreTransaction> begin() override;

    UserId insert_user(User user);
    AdminId insert_admin(Admin admin);
    CategoryId insert_category(Category category);
    ProductId insert_product(Product product);
    ShippingAddressId insert_shipping_address(ShippingAddress address);
    OrderId insert_order(Order order);
    OrderItemId insert_order_item(OrderItem item);
    PaymentId insert_payment(Payment payment);

    [[nodiscard]] std::optional<User> find_user(UserId user_id) const;
    [[nodiscard]] std::optional<Admin> find_admin(AdminId admin_id) const;
    [[nodiscard]] std::optional<Category> find_category(CategoryId category_id) const;
    [[nodiscard]] std::optional<Product> find_product(ProductId product_id) const;
    [[nodiscard]] std::optional<Order> find_order(OrderId order_id) const;
    [[nodiscard]] std::vector<ShippingAddress> shipping_addresses_of(UserId user_id) const;
    [[nodiscard]] std::vector<Order> orders_of(UserId user_id) const;
    [[nodiscard]] std::vector<OrderItem> order_items_of(OrderId order_id) const;
    [[nodiscard]] std::vector<Payment> payments_of_order(OrderId order_id) const;
    [[nodiscard]] size_t user_count() const;
    [[nodiscard]] bool is_user_locked(UserId user_id) const;

    void set_write_hook(WriteHook hook);

private:
    friend class InMemoryTransaction;

    struct Tables {
        std::map<UserId, User> users;
        std::map<AdminId, Admin> admins;
        std::map<CategoryId, Category> categories;
        std::map<ProductId, Product> products;
        std::map<ShippingAddressId, ShippingAddress> shipping_addresses;
        std::map<OrderId, Order> orders;
        std::map<OrderItemId, OrderItem> order_items;
        std::map<PaymentId, Payment> payments;
    };

    struct Sequences {
        UserId users = 1;
        AdminId admins = 1;
        CategoryId categories = 1;
        ProductId products = 1;
        ShippingAddressId shipping_addresses = 1;
        OrderId orders = 1;
        OrderItemId order_items = 1;
        PaymentId payments = 1;
    };

    // Caller holds mutex_.
    [[nodiscard]] bool username_taken(const std::string& username, UserId except_user) const;

    mutable std::mutex mutex_;
    std::condition_variable lock_released_;
    std::set<UserId> locked_users_;
    Tables tables_;
    Sequences sequences_;
    WriteHook write_hook_;
};

}
