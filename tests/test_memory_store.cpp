#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include "memory_store.hpp"
#include "seed.hpp"

using namespace shopdb;

namespace {

User make_user(const std::string& username) {
    User user;
    user.first_name = "First";
    user.last_name = "Last";
    user.username = username;
    user.email = username + "@example.com";
    user.password_hash = "\x01";
    return user;
}

template <typename Fn>
bool throws_storage_error(Fn&& fn) {
    try {
        fn();
    } catch (const StorageError&) {
        return true;
    }
    return false;
}

}

void test_entity_formatting() {
    std::cout << "Testing entity formatting..." << std::endl;

    assert(format_cents(7900) == "79.00");
    assert(format_cents(5) == "0.05");
    assert(format_cents(0) == "0.00");
    assert(format_cents(-1250) == "-12.50");

    const Timestamp ts = Timestamp{} + std::chrono::milliseconds(86400000 + 1500);
    assert(format_timestamp(ts) == "1970-01-02T00:00:01.500Z");
    assert(format_timestamp(Timestamp{}) == "1970-01-01T00:00:00.000Z");

    assert(to_string(UserStatus::ERASED) == "erased");
    assert(to_string(static_cast<UserStatus>(42)) == "unknown");
    assert(user_status_from_string("active") == UserStatus::ACTIVE);
    assert(user_status_from_string("erased") == UserStatus::ERASED);
    assert(!user_status_from_string("deleted").has_value());

    User user;
    assert(!user.is_erased());
    user.anonymized_time = ts;
    assert(user.is_erased());

    std::cout << "✓ Entity formatting passed" << std::endl;
}

void test_sequential_ids() {
    std::cout << "Testing sequential id assignment..." << std::endl;

    InMemoryStore store;
    assert(store.insert_user(make_user("a")) == 1);
    assert(store.insert_user(make_user("b")) == 2);
    assert(store.user_count() == 2);

    auto user = store.find_user(1);
    assert(user.has_value());
    assert(user->username == "a");
    assert(user->status == UserStatus::ACTIVE);
    assert(!user->anonymized_time.has_value());
    assert(user->created_at != Timestamp{});
    assert(!store.find_user(3).has_value());

    std::cout << "✓ Sequential ids passed" << std::endl;
}

void test_insert_constraints() {
    std::cout << "Testing insert constraints..." << std::endl;

    InMemoryStore store;
    store.insert_user(make_user("dup"));
    assert(throws_storage_error([&] { store.insert_user(make_user("dup")); }));

    ShippingAddress orphan_address;
    orphan_address.user_id = 42;
    assert(throws_storage_error([&] { store.insert_shipping_address(orphan_address); }));

    Order orphan_order;
    orphan_order.user_id = 42;
    assert(throws_storage_error([&] { store.insert_order(orphan_order); }));

    Payment orphan_payment;
    orphan_payment.order_id = 42;
    assert(throws_storage_error([&] { store.insert_payment(orphan_payment); }));

    Category shoes;
    shoes.name = "Shoes";
    store.insert_category(shoes);
    assert(throws_storage_error([&] { store.insert_category(shoes); }));

    Admin admin;
    admin.username = "root";
    admin.password_hash = "\x02";
    AdminId admin_id = store.insert_admin(admin);
    assert(throws_storage_error([&] { store.insert_admin(admin); }));
    assert(store.find_admin(admin_id)->username == "root");
    assert(store.find_category(1)->name == "Shoes");
    assert(!store.find_category(2).has_value());

    std::cout << "✓ Insert constraints passed" << std::endl;
}

void test_seed_demo_data() {
    std::cout << "Testing demo seed..." << std::endl;

    InMemoryStore store;
    auto seed = seed_demo_data(store);
    assert(seed.has_value());

    auto user = store.find_user(seed->user_id);
    assert(user->first_name == "Alice");
    assert(user->email == "alice@example.com");

    auto orders = store.orders_of(seed->user_id);
    assert(orders.size() == 1);
    assert(orders[0].total_cost == 9000);
    assert(orders[0].is_paid);
    assert(orders[0].shipping_name == "Alice Carter");
    assert(store.order_items_of(seed->order_id).size() == 1);

    auto payments = store.payments_of_order(seed->order_id);
    assert(payments.size() == 1);
    assert(payments[0].last4 == "4242");
    assert(store.find_product(seed->product_id)->price == 7900);

    // Second call leaves the store alone
    assert(!seed_demo_data(store).has_value());
    assert(store.user_count() == 1);

    std::cout << "✓ Demo seed passed" << std::endl;
}

void test_commit_publishes_writes() {
    std::cout << "Testing commit visibility..." << std::endl;

    InMemoryStore store;
    auto seed = seed_demo_data(store);

    auto txn = store.begin();
    auto user = txn->lock_user(seed->user_id);
    assert(user.has_value());
    user->first_name = "Alicia";
    txn->update_user(*user);

    // Own writes are visible inside the transaction, not outside it
    assert(txn->lock_user(seed->user_id)->first_name == "Alicia");
    assert(store.find_user(seed->user_id)->first_name == "Alice");

    auto addresses = txn->shipping_addresses_for_user(seed->user_id);
    assert(addresses.size() == 1);
    addresses[0].city.reset();
    txn->update_shipping_address(addresses[0]);
    assert(!txn->shipping_addresses_for_user(seed->user_id)[0].city.has_value());

    txn->commit();
    assert(store.find_user(seed->user_id)->first_name == "Alicia");
    assert(!store.shipping_addresses_of(seed->user_id)[0].city.has_value());
    assert(!store.is_user_locked(seed->user_id));

    assert(throws_storage_error([&] { txn->commit(); }));

    std::cout << "✓ Commit visibility passed" << std::endl;
}

void test_rollback_discards_writes() {
    std::cout << "Testing rollback..." << std::endl;

    InMemoryStore store;
    auto seed = seed_demo_data(store);

    {
        auto txn = store.begin();
        auto user = txn->lock_user(seed->user_id);
        user->status = UserStatus::ERASED;
        txn->update_user(*user);

        auto payments = txn->payments_for_user(seed->user_id);
        assert(payments.size() == 1);
        payments[0].billing_name = "nobody";
        txn->update_payment(payments[0]);

        txn->rollback();
        assert(!store.is_user_locked(seed->user_id));
    }
    assert(store.find_user(seed->user_id)->status == UserStatus::ACTIVE);
    assert(store.payments_of_order(seed->order_id)[0].billing_name == "Alice Carter");

    {
        auto txn = store.begin();
        auto user = txn->lock_user(seed->user_id);
        user->status = UserStatus::ERASED;
        txn->update_user(*user);
        assert(store.is_user_locked(seed->user_id));
        // destroyed without commit
    }
    assert(store.find_user(seed->user_id)->status == UserStatus::ACTIVE);
    assert(!store.is_user_locked(seed->user_id));

    std::cout << "✓ Rollback passed" << std::endl;
}

void test_lock_missing_user() {
    std::cout << "Testing lock on a missing user..." << std::endl;

    InMemoryStore store;
    auto txn = store.begin();
    assert(!txn->lock_user(99).has_value());
    assert(!store.is_user_locked(99));

    User ghost = make_user("ghost");
    ghost.user_id = 99;
    assert(throws_storage_error([&] { txn->update_user(ghost); }));

    std::cout << "✓ Missing user lock passed" << std::endl;
}

void test_row_lock_blocks_second_transaction() {
    std::cout << "Testing row lock contention..." << std::endl;

    InMemoryStore store;
    auto seed = seed_demo_data(store);

    auto holder = store.begin();
    assert(holder->lock_user(seed->user_id).has_value());

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto txn = store.begin();
        auto user = txn->lock_user(seed->user_id);
        acquired = true;
        assert(user.has_value());
        assert(user->first_name == "Changed");
        txn->rollback();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!acquired);

    auto user = holder->lock_user(seed->user_id);
    user->first_name = "Changed";
    holder->update_user(*user);
    holder->commit();

    waiter.join();
    assert(acquired);

    std::cout << "✓ Second locker waited for the commit" << std::endl;
}

void test_other_users_not_blocked() {
    std::cout << "Testing locks on different users..." << std::endl;

    InMemoryStore store;
    UserId first = store.insert_user(make_user("one"));
    UserId second = store.insert_user(make_user("two"));

    auto txn_a = store.begin();
    auto txn_b = store.begin();
    assert(txn_a->lock_user(first).has_value());
    assert(txn_b->lock_user(second).has_value());
    assert(store.is_user_locked(first));
    assert(store.is_user_locked(second));

    txn_a->commit();
    txn_b->commit();

    std::cout << "✓ Different users lock independently" << std::endl;
}

void test_write_hook_failure() {
    std::cout << "Testing injected write failure..." << std::endl;

    InMemoryStore store;
    auto seed = seed_demo_data(store);
    store.set_write_hook([](const std::string& table, int64_t) {
        if (table == "orders") {
            throw StorageError("injected failure on orders");
        }
    });

    auto txn = store.begin();
    auto user = txn->lock_user(seed->user_id);
    user->last_name = "Changed";
    txn->update_user(*user);

    auto orders = txn->orders_for_user(seed->user_id);
    assert(throws_storage_error([&] { txn->update_order(orders[0]); }));
    txn.reset();

    assert(store.find_user(seed->user_id)->last_name == "Carter");
    assert(!store.is_user_locked(seed->user_id));

    std::cout << "✓ Injected failure left no trace" << std::endl;
}

void test_username_unique_on_update() {
    std::cout << "Testing username uniqueness on update..." << std::endl;

    InMemoryStore store;
    UserId first = store.insert_user(make_user("taken"));
    UserId second = store.insert_user(make_user("free"));
    (void)first;

    auto txn = store.begin();
    auto user = txn->lock_user(second);
    user->username = "taken";
    assert(throws_storage_error([&] { txn->update_user(*user); }));
    txn->rollback();

    assert(store.find_user(second)->username == "free");

    std::cout << "✓ Username uniqueness passed" << std::endl;
}

int main() {
    std::cout << "=== In-Memory Store Tests ===" << std::endl;

    try {
        test_entity_formatting();
        test_sequential_ids();
        test_insert_constraints();
        test_seed_demo_data();
        test_commit_publishes_writes();
        test_rollback_discards_writes();
        test_lock_missing_user();
        test_row_lock_blocks_second_transaction();
        test_other_users_not_blocked();
        test_write_hook_failure();
        test_username_unique_on_update();

        std::cout << "\n✅ All store tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
