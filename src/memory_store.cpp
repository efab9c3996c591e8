#include "memory_store.hpp"
#include <chrono>
#include <utility>

namespace shopdb {

namespace {

void default_timestamp(Timestamp& ts) {
    if (ts == Timestamp{}) {
        ts = std::chrono::system_clock::now();
    }
}

std::string row_ref(const std::string& table, int64_t row_id) {
    return table + " row " + std::to_string(row_id);
}

template <typename Id, typename Row>
std::optional<Row> find_row(const std::map<Id, Row>& table, Id id) {
    auto it = table.find(id);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

template <typename Id, typename Row>
const Row& effective_row(const std::map<Id, Row>& staged, Id id, const Row& committed) {
    auto it = staged.find(id);
    return it != staged.end() ? it->second : committed;
}

}

class InMemoryTransaction : public StoreTransaction {
public:
    explicit InMemoryTransaction(InMemoryStore& store) : store_(store) {}

    ~InMemoryTransaction() override {
        if (active_) {
            rollback();
        }
    }

    std::optional<User> lock_user(UserId user_id) override {
        ensure_active();
        std::unique_lock<std::mutex> lock(store_.mutex_);
        if (store_.tables_.users.count(user_id) == 0 && held_locks_.count(user_id) == 0) {
            return std::nullopt;
        }
        acquire_lock(lock, user_id);

        // The row may have disappeared while we waited.
        auto committed = store_.tables_.users.find(user_id);
        if (committed == store_.tables_.users.end()) {
            release_lock(user_id);
            return std::nullopt;
        }
        return effective_row(staged_users_, user_id, committed->second);
    }

    void update_user(const User& user) override {
        ensure_active();
        {
            std::unique_lock<std::mutex> lock(store_.mutex_);
            if (store_.tables_.users.count(user.user_id) == 0) {
                throw StorageError("update on missing " + row_ref("users", user.user_id));
            }
            acquire_lock(lock, user.user_id);
        }

        run_write_hook("users", user.user_id);

        std::lock_guard<std::mutex> guard(store_.mutex_);
        if (username_conflicts(user)) {
            throw StorageError("duplicate key value violates unique constraint \"ux_users_username\"");
        }
        staged_users_[user.user_id] = user;
    }

    std::vector<ShippingAddress> shipping_addresses_for_user(UserId user_id) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        std::vector<ShippingAddress> rows;
        for (const auto& [id, address] : store_.tables_.shipping_addresses) {
            if (address.user_id == user_id) {
                rows.push_back(effective_row(staged_addresses_, id, address));
            }
        }
        return rows;
    }

    void update_shipping_address(const ShippingAddress& address) override {
        ensure_active();
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            if (store_.tables_.shipping_addresses.count(address.shipping_address_id) == 0) {
                throw StorageError("update on missing " +
                                   row_ref("shipping_addresses", address.shipping_address_id));
            }
        }

        run_write_hook("shipping_addresses", address.shipping_address_id);

        std::lock_guard<std::mutex> guard(store_.mutex_);
        staged_addresses_[address.shipping_address_id] = address;
    }

    std::vector<Order> orders_for_user(UserId user_id) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        std::vector<Order> rows;
        for (const auto& [id, order] : store_.tables_.orders) {
            if (order.user_id == user_id) {
                rows.push_back(effective_row(staged_orders_, id, order));
            }
        }
        return rows;
    }

    void update_order(const Order& order) override {
        ensure_active();
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            if (store_.tables_.orders.count(order.order_id) == 0) {
                throw StorageError("update on missing " + row_ref("orders", order.order_id));
            }
        }

        run_write_hook("orders", order.order_id);

        std::lock_guard<std::mutex> guard(store_.mutex_);
        staged_orders_[order.order_id] = order;
    }

    std::vector<Payment> payments_for_user(UserId user_id) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        std::set<OrderId> user_orders;
        for (const auto& [id, order] : store_.tables_.orders) {
            if (order.user_id == user_id) {
                user_orders.insert(id);
            }
        }

        std::vector<Payment> rows;
        for (const auto& [id, payment] : store_.tables_.payments) {
            if (user_orders.count(payment.order_id) != 0) {
                rows.push_back(effective_row(staged_payments_, id, payment));
            }
        }
        return rows;
    }

    void update_payment(const Payment& payment) override {
        ensure_active();
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            if (store_.tables_.payments.count(payment.payment_id) == 0) {
                throw StorageError("update on missing " + row_ref("payments", payment.payment_id));
            }
        }

        run_write_hook("payments", payment.payment_id);

        std::lock_guard<std::mutex> guard(store_.mutex_);
        staged_payments_[payment.payment_id] = payment;
    }

    void commit() override {
        ensure_active();
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            for (const auto& [id, user] : staged_users_) {
                if (username_conflicts(user)) {
                    discard();
                    store_.lock_released_.notify_all();
                    throw StorageError("duplicate key value violates unique constraint \"ux_users_username\"");
                }
            }

            for (const auto& [id, user] : staged_users_) {
                store_.tables_.users[id] = user;
            }
            for (const auto& [id, address] : staged_addresses_) {
                store_.tables_.shipping_addresses[id] = address;
            }
            for (const auto& [id, order] : staged_orders_) {
                store_.tables_.orders[id] = order;
            }
            for (const auto& [id, payment] : staged_payments_) {
                store_.tables_.payments[id] = payment;
            }
            discard();
        }
        store_.lock_released_.notify_all();
    }

    void rollback() override {
        if (!active_) {
            return;
        }
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            discard();
        }
        store_.lock_released_.notify_all();
    }

private:
    void ensure_active() const {
        if (!active_) {
            throw StorageError("transaction is no longer active");
        }
    }

    // Caller holds store_.mutex_ through `lock`.
    void acquire_lock(std::unique_lock<std::mutex>& lock, UserId user_id) {
        if (held_locks_.count(user_id) != 0) {
            return;
        }
        store_.lock_released_.wait(lock, [&] {
            return store_.locked_users_.count(user_id) == 0;
        });
        store_.locked_users_.insert(user_id);
        held_locks_.insert(user_id);
    }

    // Caller holds store_.mutex_.
    void release_lock(UserId user_id) {
        store_.locked_users_.erase(user_id);
        held_locks_.erase(user_id);
        store_.lock_released_.notify_all();
    }

    // Caller holds store_.mutex_. Ends the transaction.
    void discard() {
        staged_users_.clear();
        staged_addresses_.clear();
        staged_orders_.clear();
        staged_payments_.clear();
        for (UserId user_id : held_locks_) {
            store_.locked_users_.erase(user_id);
        }
        held_locks_.clear();
        active_ = false;
    }

    // Caller holds store_.mutex_.
    [[nodiscard]] bool username_conflicts(const User& user) const {
        if (!user.username) {
            return false;
        }
        for (const auto& [id, committed] : store_.tables_.users) {
            if (id == user.user_id) {
                continue;
            }
            const User& other = effective_row(staged_users_, id, committed);
            if (other.username && *other.username == *user.username) {
                return true;
            }
        }
        return false;
    }

    void run_write_hook(const std::string& table, int64_t row_id) {
        InMemoryStore::WriteHook hook;
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            hook = store_.write_hook_;
        }
        if (hook) {
            hook(table, row_id);
        }
    }

    InMemoryStore& store_;
    bool active_ = true;
    std::set<UserId> held_locks_;
    std::map<UserId, User> staged_users_;
    std::map<ShippingAddressId, ShippingAddress> staged_addresses_;
    std::map<OrderId, Order> staged_orders_;
    std::map<PaymentId, Payment> staged_payments_;
};

std::unique_ptr<StoreTransaction> InMemoryStore::begin() {
    return std::make_unique<InMemoryTransaction>(*this);
}

UserId InMemoryStore::insert_user(User user) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (user.username && username_taken(*user.username, 0)) {
        throw StorageError("duplicate key value violates unique constraint \"ux_users_username\"");
    }
    user.user_id = sequences_.users++;
    default_timestamp(user.created_at);
    tables_.users[user.user_id] = user;
    return user.user_id;
}

AdminId InMemoryStore::insert_admin(Admin admin) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (admin.username.empty()) {
        throw StorageError("null value in column \"username\" of relation \"admins\"");
    }
    for (const auto& [id, existing] : tables_.admins) {
        if (existing.username == admin.username) {
            throw StorageError("duplicate key value violates unique constraint \"admins_username_key\"");
        }
    }
    admin.admin_id = sequences_.admins++;
    default_timestamp(admin.created_at);
    tables_.admins[admin.admin_id] = admin;
    return admin.admin_id;
}

CategoryId InMemoryStore::insert_category(Category category) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (category.name.empty()) {
        throw StorageError("null value in column \"name\" of relation \"categories\"");
    }
    for (const auto& [id, existing] : tables_.categories) {
        if (existing.name == category.name) {
            throw StorageError("duplicate key value violates unique constraint \"categories_name_key\"");
        }
    }
    category.category_id = sequences_.categories++;
    tables_.categories[category.category_id] = category;
    return category.category_id;
}

ProductId InMemoryStore::insert_product(Product product) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (product.category_id && tables_.categories.count(*product.category_id) == 0) {
        throw StorageError("products.category_id references missing " +
                           row_ref("categories", *product.category_id));
    }
    if (product.created_by_user_id && tables_.users.count(*product.created_by_user_id) == 0) {
        throw StorageError("products.created_by_user_id references missing " +
                           row_ref("users", *product.created_by_user_id));
    }
    product.product_id = sequences_.products++;
    default_timestamp(product.created_at);
    tables_.products[product.product_id] = product;
    return product.product_id;
}

ShippingAddressId InMemoryStore::insert_shipping_address(ShippingAddress address) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (tables_.users.count(address.user_id) == 0) {
        throw StorageError("shipping_addresses.user_id references missing " +
                           row_ref("users", address.user_id));
    }
    address.shipping_address_id = sequences_.shipping_addresses++;
    tables_.shipping_addresses[address.shipping_address_id] = address;
    return address.shipping_address_id;
}

OrderId InMemoryStore::insert_order(Order order) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (tables_.users.count(order.user_id) == 0) {
        throw StorageError("orders.user_id references missing " + row_ref("users", order.user_id));
    }
    if (order.shipping_address_id &&
        tables_.shipping_addresses.count(*order.shipping_address_id) == 0) {
        throw StorageError("orders.shipping_address_id references missing " +
                           row_ref("shipping_addresses", *order.shipping_address_id));
    }
    order.order_id = sequences_.orders++;
    default_timestamp(order.purchase_date);
    tables_.orders[order.order_id] = order;
    return order.order_id;
}

OrderItemId InMemoryStore::insert_order_item(OrderItem item) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (tables_.orders.count(item.order_id) == 0) {
        throw StorageError("order_items.order_id references missing " + row_ref("orders", item.order_id));
    }
    if (tables_.products.count(item.product_id) == 0) {
        throw StorageError("order_items.product_id references missing " +
                           row_ref("products", item.product_id));
    }
    item.order_item_id = sequences_.order_items++;
    tables_.order_items[item.order_item_id] = item;
    return item.order_item_id;
}

PaymentId InMemoryStore::insert_payment(Payment payment) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (tables_.orders.count(payment.order_id) == 0) {
        throw StorageError("payments.order_id references missing " + row_ref("orders", payment.order_id));
    }
    payment.payment_id = sequences_.payments++;
    default_timestamp(payment.created_at);
    tables_.payments[payment.payment_id] = payment;
    return payment.payment_id;
}

std::optional<User> InMemoryStore::find_user(UserId user_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return find_row(tables_.users, user_id);
}

std::optional<Admin> InMemoryStore::find_admin(AdminId admin_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return find_row(tables_.admins, admin_id);
}

std::optional<Category> InMemoryStore::find_category(CategoryId category_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return find_row(tables_.categories, category_id);
}

std::optional<Product> InMemoryStore::find_product(ProductId product_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return find_row(tables_.products, product_id);
}

std::optional<Order> InMemoryStore::find_order(OrderId order_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return find_row(tables_.orders, order_id);
}

std::vector<ShippingAddress> InMemoryStore::shipping_addresses_of(UserId user_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<ShippingAddress> rows;
    for (const auto& [id, address] : tables_.shipping_addresses) {
        if (address.user_id == user_id) {
            rows.push_back(address);
        }
    }
    return rows;
}

std::vector<Order> InMemoryStore::orders_of(UserId user_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<Order> rows;
    for (const auto& [id, order] : tables_.orders) {
        if (order.user_id == user_id) {
            rows.push_back(order);
        }
    }
    return rows;
}

std::vector<OrderItem> InMemoryStore::order_items_of(OrderId order_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<OrderItem> rows;
    for (const auto& [id, item] : tables_.order_items) {
        if (item.order_id == order_id) {
            rows.push_back(item);
        }
    }
    return rows;
}

std::vector<Payment> InMemoryStore::payments_of_order(OrderId order_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<Payment> rows;
    for (const auto& [id, payment] : tables_.payments) {
        if (payment.order_id == order_id) {
            rows.push_back(payment);
        }
    }
    return rows;
}

size_t InMemoryStore::user_count() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return tables_.users.size();
}

bool InMemoryStore::is_user_locked(UserId user_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return locked_users_.count(user_id) != 0;
}

void InMemoryStore::set_write_hook(WriteHook hook) {
    std::lock_guard<std::mutex> guard(mutex_);
    write_hook_ = std::move(hook);
}

bool InMemoryStore::username_taken(const std::string& username, UserId except_user) const {
    for (const auto& [id, user] : tables_.users) {
        if (id != except_user && user.username && *user.username == username) {
            return true;
        }
    }
    return false;
}

}
