#include <iostream>
#include <cassert>
#include <vector>
#include <string>
#include "database.hpp"
#include "sample_schema.hpp"

using namespace shopdb;

namespace {

size_t position_of(const std::string& haystack, const std::string& needle) {
    size_t pos = haystack.find(needle);
    assert(pos != std::string::npos);
    return pos;
}

}

void test_database_creation() {
    std::cout << "Testing database creation..." << std::endl;

    DatabaseSchema schema("test_db");
    assert(schema.get_table_names().empty());
    assert(schema.get_name() == "test_db");
    assert(!schema.has_table("users"));
    std::cout << "✓ Empty database creation passed" << std::endl;
}

void test_table_creation() {
    std::cout << "Testing table creation..." << std::endl;

    DatabaseSchema schema("test_db");

    Table users;
    users.name = "users";
    users.comment = "Customer's accounts";

    Column id_col;
    id_col.name = "id";
    id_col.type = ColumnType::BIGSERIAL;
    id_col.nullable = false;
    id_col.primary_key = true;

    Column name_col;
    name_col.name = "name";
    name_col.type = ColumnType::VARCHAR;
    name_col.max_length = 100;
    name_col.nullable = false;

    users.columns = {id_col, name_col};
    schema.add_table(users);

    auto table_names = schema.get_table_names();
    assert(table_names.size() == 1);
    assert(table_names[0] == "users");

    auto retrieved_table = schema.get_table("users");
    assert(retrieved_table.has_value());
    assert(retrieved_table->columns.size() == 2);
    assert(retrieved_table->find_column("name")->max_length == 100);
    assert(retrieved_table->find_column("missing") == nullptr);

    std::string sql = schema.generate_create_sql();
    assert(sql.find("id BIGSERIAL PRIMARY KEY,") != std::string::npos);
    assert(sql.find("id BIGSERIAL PRIMARY KEY NOT NULL") == std::string::npos);
    assert(sql.find("name VARCHAR(100) NOT NULL\n") != std::string::npos);
    assert(sql.find("COMMENT ON TABLE users IS 'Customer''s accounts';") != std::string::npos);

    std::cout << "✓ Table creation and retrieval passed" << std::endl;
}

void test_declaration_order() {
    std::cout << "Testing declaration order..." << std::endl;

    DatabaseSchema schema("test_db");
    for (const std::string name : {"zeta", "alpha", "mid"}) {
        Table table;
        table.name = name;
        Column id;
        id.name = "id";
        id.type = ColumnType::INTEGER;
        id.primary_key = true;
        table.columns = {id};
        schema.add_table(table);
    }

    // Re-adding replaces the table without moving it
    Table alpha = *schema.get_table("alpha");
    alpha.comment = "replaced";
    schema.add_table(alpha);

    const auto names = schema.get_table_names();
    assert((names == std::vector<std::string>{"zeta", "alpha", "mid"}));
    assert(schema.get_table("alpha")->comment == "replaced");

    const std::string create_sql = schema.generate_create_sql();
    assert(position_of(create_sql, "CREATE TABLE zeta") < position_of(create_sql, "CREATE TABLE alpha"));
    assert(position_of(create_sql, "CREATE TABLE alpha") < position_of(create_sql, "CREATE TABLE mid"));

    const std::string drop_sql = schema.generate_drop_sql();
    assert(position_of(drop_sql, "DROP TABLE IF EXISTS mid CASCADE;") <
           position_of(drop_sql, "DROP TABLE IF EXISTS zeta CASCADE;"));

    std::cout << "✓ Declaration order passed" << std::endl;
}

void test_index_creation() {
    std::cout << "Testing index creation..." << std::endl;

    DatabaseSchema schema("test_db");

    Table users;
    users.name = "users";

    Column id_col;
    id_col.name = "id";
    id_col.type = ColumnType::INTEGER;
    id_col.primary_key = true;
    users.columns = {id_col};

    schema.add_table(users);

    Index name_idx;
    name_idx.name = "idx_users_name";
    name_idx.columns = {"last_name", "first_name"};

    Index email_idx;
    email_idx.name = "ux_users_email";
    email_idx.columns = {"email"};
    email_idx.unique = true;
    email_idx.type = "HASH";

    schema.add_index("users", name_idx);
    schema.add_index("users", email_idx);
    schema.add_index("missing", name_idx);

    auto table = schema.get_table("users");
    assert(table->indexes.size() == 2);

    const std::string sql = schema.generate_create_sql(true);
    assert(sql.find("CREATE INDEX IF NOT EXISTS idx_users_name ON users (last_name, first_name);") !=
           std::string::npos);
    assert(sql.find("CREATE UNIQUE INDEX IF NOT EXISTS ux_users_email ON users USING HASH (email);") !=
           std::string::npos);

    std::cout << "✓ Index creation passed" << std::endl;
}

void test_foreign_key() {
    std::cout << "Testing foreign key creation..." << std::endl;

    DatabaseSchema schema("test_db");

    Table orders;
    orders.name = "orders";
    Column order_id;
    order_id.name = "order_id";
    order_id.type = ColumnType::BIGSERIAL;
    order_id.primary_key = true;
    orders.columns = {order_id};
    schema.add_table(orders);

    Table items;
    items.name = "order_items";
    Column item_id;
    item_id.name = "order_item_id";
    item_id.type = ColumnType::BIGSERIAL;
    item_id.primary_key = true;

    Column order_fk;
    order_fk.name = "order_id";
    order_fk.type = ColumnType::BIGINT;
    order_fk.nullable = false;

    items.columns = {item_id, order_fk};
    schema.add_table(items);

    schema.add_foreign_key("order_items", "order_id", "orders", "order_id", "CASCADE");

    const Column* column = schema.get_table("order_items")->find_column("order_id");
    assert(column->references_table == "orders");
    assert(column->references_column == "order_id");
    assert(column->on_delete == "CASCADE");

    const std::string sql = schema.generate_create_sql();
    assert(sql.find("    order_id BIGINT NOT NULL,\n"
                    "    FOREIGN KEY (order_id) REFERENCES orders(order_id) ON DELETE CASCADE\n);") !=
           std::string::npos);

    std::cout << "✓ Foreign key creation passed" << std::endl;
}

void test_column_types() {
    std::cout << "Testing column type handling..." << std::endl;

    DatabaseSchema schema("test_db");
    Table test_table;
    test_table.name = "test_types";

    std::vector<std::pair<std::string, ColumnType>> type_tests = {
        {"int_col", ColumnType::INTEGER},
        {"bigint_col", ColumnType::BIGINT},
        {"serial_col", ColumnType::BIGSERIAL},
        {"varchar_col", ColumnType::VARCHAR},
        {"char_col", ColumnType::CHAR},
        {"text_col", ColumnType::TEXT},
        {"bool_col", ColumnType::BOOLEAN},
        {"numeric_col", ColumnType::NUMERIC},
        {"bytes_col", ColumnType::BYTEA},
        {"ts_col", ColumnType::TIMESTAMPTZ}
    };

    for (const auto& [name, type] : type_tests) {
        Column col;
        col.name = name;
        col.type = type;
        if (type == ColumnType::VARCHAR) {
            col.max_length = 100;
        }
        if (type == ColumnType::CHAR) {
            col.max_length = 2;
        }
        if (type == ColumnType::NUMERIC) {
            col.precision = 12;
            col.scale = 2;
        }
        test_table.columns.push_back(col);
    }

    Column bare_numeric;
    bare_numeric.name = "bare_numeric";
    bare_numeric.type = ColumnType::NUMERIC;
    bare_numeric.default_value = "0";
    test_table.columns.push_back(bare_numeric);

    schema.add_table(test_table);

    std::string sql = schema.generate_create_sql();
    assert(sql.find("int_col INTEGER") != std::string::npos);
    assert(sql.find("serial_col BIGSERIAL") != std::string::npos);
    assert(sql.find("varchar_col VARCHAR(100)") != std::string::npos);
    assert(sql.find("char_col CHAR(2)") != std::string::npos);
    assert(sql.find("numeric_col NUMERIC(12,2)") != std::string::npos);
    assert(sql.find("bytes_col BYTEA") != std::string::npos);
    assert(sql.find("ts_col TIMESTAMPTZ") != std::string::npos);
    assert(sql.find("bare_numeric NUMERIC DEFAULT 0") != std::string::npos);

    std::cout << "✓ Column type handling passed" << std::endl;
}

void test_quote_literal() {
    std::cout << "Testing literal quoting..." << std::endl;

    assert(quote_literal("") == "''");
    assert(quote_literal("anon_") == "'anon_'");
    assert(quote_literal("O'Brien") == "'O''Brien'");

    std::cout << "✓ Literal quoting passed" << std::endl;
}

void test_ecommerce_schema() {
    std::cout << "Testing e-commerce schema..." << std::endl;

    auto schema = ECommerceSchema::create_schema();
    assert(schema.get_name() == "shopdb");
    assert((schema.get_table_names() == std::vector<std::string>{
        "users", "admins", "categories", "products",
        "shipping_addresses", "orders", "order_items", "payments"}));

    auto users = schema.get_table("users");
    assert(users->columns.size() == 10);
    assert(users->find_column("password_hash")->type == ColumnType::BYTEA);
    assert(!users->find_column("password_hash")->nullable);
    assert(users->find_column("anon_tag")->max_length == 64);
    assert(users->find_column("status")->default_value == "'active'");
    assert(users->find_column("anonymized_time")->nullable);

    auto orders = schema.get_table("orders");
    assert(orders->find_column("ship_country")->type == ColumnType::CHAR);
    assert(orders->find_column("total_cost")->precision == 12);
    assert(orders->find_column("shipping_address_id")->references_table == "shipping_addresses");

    auto products = schema.get_table("products");
    assert(products->find_column("discount")->precision == 5);

    const std::string sql = schema.generate_create_sql(true);
    assert(sql.find("-- Database: shopdb") == 0);
    assert(sql.find("CREATE TABLE IF NOT EXISTS users (") != std::string::npos);
    assert(sql.find("status VARCHAR(16) NOT NULL DEFAULT 'active'") != std::string::npos);
    assert(sql.find("username VARCHAR(64) NOT NULL UNIQUE") != std::string::npos);
    assert(sql.find("name VARCHAR(120) NOT NULL UNIQUE") != std::string::npos);
    assert(sql.find("price NUMERIC(12,2) NOT NULL") != std::string::npos);
    assert(sql.find("discount NUMERIC(5,2) NOT NULL DEFAULT 0") != std::string::npos);
    assert(sql.find("purchase_date TIMESTAMPTZ NOT NULL DEFAULT now()") != std::string::npos);
    assert(sql.find("last4 CHAR(4)") != std::string::npos);
    assert(sql.find("FOREIGN KEY (order_id) REFERENCES orders(order_id) ON DELETE CASCADE") !=
           std::string::npos);
    assert(sql.find("CREATE UNIQUE INDEX IF NOT EXISTS ux_users_username ON users (username);") !=
           std::string::npos);
    assert(sql.find("CREATE INDEX IF NOT EXISTS order_index_based_user_id ON orders (user_id);") !=
           std::string::npos);
    assert(sql.find("CREATE INDEX IF NOT EXISTS order_index_based_items_order_id ON order_items (order_id);") !=
           std::string::npos);
    assert(sql.find("CREATE INDEX IF NOT EXISTS index_payments_based_order_id ON payments (order_id);") !=
           std::string::npos);

    // Referenced tables are created first
    assert(position_of(sql, "CREATE TABLE IF NOT EXISTS users") <
           position_of(sql, "CREATE TABLE IF NOT EXISTS shipping_addresses"));
    assert(position_of(sql, "CREATE TABLE IF NOT EXISTS shipping_addresses") <
           position_of(sql, "CREATE TABLE IF NOT EXISTS orders"));
    assert(position_of(sql, "CREATE TABLE IF NOT EXISTS orders") <
           position_of(sql, "CREATE TABLE IF NOT EXISTS payments"));

    const auto statements = schema.create_statements(true);
    assert(statements.size() == 8 + 4);

    std::string drop_sql = schema.generate_drop_sql();
    assert(position_of(drop_sql, "DROP TABLE IF EXISTS payments CASCADE;") <
           position_of(drop_sql, "DROP TABLE IF EXISTS users CASCADE;"));

    std::cout << "✓ E-commerce schema passed" << std::endl;
}

int main() {
    std::cout << "=== Database Schema Tests ===" << std::endl;

    try {
        test_database_creation();
        test_table_creation();
        test_declaration_order();
        test_index_creation();
        test_foreign_key();
        test_column_types();
        test_quote_literal();
        test_ecommerce_schema();

        std::cout << "\n✅ All database tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
