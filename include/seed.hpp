#pragma once

#include "memory_store.hpp"
#include <optional>
#include <string>

namespace shopdb {

// Ids of the rows seed_demo_data() created.
struct DemoSeed {
    UserId user_id = 0;
    CategoryId category_id = 0;
    ProductId product_id = 0;
    ShippingAddressId shipping_address_id = 0;
    OrderId order_id = 0;
    OrderItemId order_item_id = 0;
    PaymentId payment_id = 0;
};

// One customer with an address, a paid order and its payment. Does nothing
// and returns nullopt when the store already has users.
std::optional<DemoSeed> seed_demo_data(InMemoryStore& store);

// The same rows as a PostgreSQL DO block guarded by "no users yet".
std::string demo_seed_sql();

}
