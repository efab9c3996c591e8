#include "sample_schema.hpp"

namespace shopdb {

namespace {

Column make_column(const std::string& name, ColumnType type, bool nullable = true) {
    Column column;
    column.name = name;
    column.type = type;
    column.nullable = nullable;
    return column;
}

Column id_column(const std::string& name) {
    Column column = make_column(name, ColumnType::BIGSERIAL, false);
    column.primary_key = true;
    return column;
}

Column varchar_column(const std::string& name, size_t max_length, bool nullable = true) {
    Column column = make_column(name, ColumnType::VARCHAR, nullable);
    column.max_length = max_length;
    return column;
}

Column money_column(const std::string& name, size_t precision, const std::string& default_value = "") {
    Column column = make_column(name, ColumnType::NUMERIC, false);
    column.precision = precision;
    column.scale = 2;
    column.default_value = default_value;
    return column;
}

Column reference_column(const std::string& name, const std::string& table, const std::string& ref_column,
                        bool nullable) {
    Column column = make_column(name, ColumnType::BIGINT, nullable);
    column.references_table = table;
    column.references_column = ref_column;
    return column;
}

Column created_at_column(const std::string& name = "created_at") {
    Column column = make_column(name, ColumnType::TIMESTAMPTZ, false);
    column.default_value = "now()";
    return column;
}

}

DatabaseSchema ECommerceSchema::create_schema() {
    DatabaseSchema schema("shopdb");

    schema.add_table(create_users_table());
    schema.add_table(create_admins_table());
    schema.add_table(create_categories_table());
    schema.add_table(create_products_table());
    schema.add_table(create_shipping_addresses_table());
    schema.add_table(create_orders_table());
    schema.add_table(create_order_items_table());
    schema.add_table(create_payments_table());

    return schema;
}

Table ECommerceSchema::create_users_table() {
    Table users;
    users.name = "users";

    Column password_hash = make_column("password_hash", ColumnType::BYTEA, false);

    Column status = varchar_column("status", 16, false);
    status.default_value = "'active'";

    users.columns = {
        id_column("user_id"),
        varchar_column("first_name", 100),
        varchar_column("last_name", 100),
        varchar_column("username", 64),
        varchar_column("email", 255),
        password_hash,
        created_at_column(),
        make_column("anonymized_time", ColumnType::TIMESTAMPTZ),
        varchar_column("anon_tag", 64),
        status
    };

    Index username_index;
    username_index.name = "ux_users_username";
    username_index.columns = {"username"};
    username_index.unique = true;
    users.indexes.push_back(username_index);

    return users;
}

Table ECommerceSchema::create_admins_table() {
    Table admins;
    admins.name = "admins";

    Column username = varchar_column("username", 64, false);
    username.unique = true;

    admins.columns = {
        id_column("admin_id"),
        username,
        make_column("password_hash", ColumnType::BYTEA, false),
        created_at_column()
    };

    return admins;
}

Table ECommerceSchema::create_categories_table() {
    Table categories;
    categories.name = "categories";

    Column name = varchar_column("name", 120, false);
    name.unique = true;

    categories.columns = {id_column("category_id"), name};

    return categories;
}

Table ECommerceSchema::create_products_table() {
    Table products;
    products.name = "products";

    Column count_in_stock = make_column("count_in_stock", ColumnType::INTEGER, false);
    count_in_stock.default_value = "0";

    products.columns = {
        id_column("product_id"),
        varchar_column("product_name", 255, false),
        money_column("price", 12),
        money_column("discount", 5, "0"),
        count_in_stock,
        created_at_column(),
        reference_column("category_id", "categories", "category_id", true),
        reference_column("created_by_user_id", "users", "user_id", true)
    };

    return products;
}

Table ECommerceSchema::create_shipping_addresses_table() {
    Table addresses;
    addresses.name = "shipping_addresses";

    addresses.columns = {
        id_column("shipping_address_id"),
        reference_column("user_id", "users", "user_id", false),
        varchar_column("street", 255),
        varchar_column("city", 120),
        varchar_column("zip", 20),
        varchar_column("state", 120),
        varchar_column("phone_number", 50)
    };

    return addresses;
}

Table ECommerceSchema::create_orders_table() {
    Table orders;
    orders.name = "orders";

    Column ship_country = make_column("ship_country", ColumnType::CHAR);
    ship_country.max_length = 2;

    Column is_delivered = make_column("is_delivered", ColumnType::BOOLEAN, false);
    is_delivered.default_value = "FALSE";

    Column is_paid = make_column("is_paid", ColumnType::BOOLEAN, false);
    is_paid.default_value = "FALSE";

    orders.columns = {
        id_column("order_id"),
        reference_column("user_id", "users", "user_id", false),
        reference_column("shipping_address_id", "shipping_addresses", "shipping_address_id", true),
        varchar_column("email_snapshot", 255),
        varchar_column("shipping_name", 255),
        varchar_column("shipping_address", 255),
        varchar_column("shipping_city", 120),
        varchar_column("shipping_state", 120),
        varchar_column("shipping_zip", 20),
        ship_country,
        money_column("tax", 12, "0"),
        money_column("shipping_price", 12, "0"),
        is_delivered,
        is_paid,
        money_column("total_cost", 12),
        created_at_column("purchase_date"),
        make_column("delivery_date", ColumnType::TIMESTAMPTZ)
    };

    Index user_index;
    user_index.name = "order_index_based_user_id";
    user_index.columns = {"user_id"};
    orders.indexes.push_back(user_index);

    return orders;
}

Table ECommerceSchema::create_order_items_table() {
    Table items;
    items.name = "order_items";

    Column order_id = reference_column("order_id", "orders", "order_id", false);
    order_id.on_delete = "CASCADE";

    items.columns = {
        id_column("order_item_id"),
        order_id,
        reference_column("product_id", "products", "product_id", false),
        make_column("quantity", ColumnType::INTEGER, false),
        money_column("price", 12)
    };

    Index order_index;
    order_index.name = "order_index_based_items_order_id";
    order_index.columns = {"order_id"};
    items.indexes.push_back(order_index);

    return items;
}

Table ECommerceSchema::create_payments_table() {
    Table payments;
    payments.name = "payments";

    Column last4 = make_column("last4", ColumnType::CHAR);
    last4.max_length = 4;

    payments.columns = {
        id_column("payment_id"),
        reference_column("order_id", "orders", "order_id", false),
        varchar_column("psp_ref", 128),
        last4,
        varchar_column("billing_name", 255),
        varchar_column("billing_address", 255),
        created_at_column()
    };

    Index order_index;
    order_index.name = "index_payments_based_order_id";
    order_index.columns = {"order_id"};
    payments.indexes.push_back(order_index);

    return payments;
}

}
