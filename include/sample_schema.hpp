#pragma once

#include "database.hpp"

namespace shopdb {

// The e-commerce store: users, catalog, orders and payments.
class ECommerceSchema {
public:
    static DatabaseSchema create_schema();

private:
    static Table create_users_table();
    static Table create_admins_table();
    static Table create_categories_table();
    static Table create_products_table();
    static Table create_shipping_addresses_table();
    static Table create_orders_table();
    static Table create_order_items_table();
    static Table create_payments_table();
};

}
