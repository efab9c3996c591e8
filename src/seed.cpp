#include "seed.hpp"
#include "database.hpp"
#include <sstream>

namespace shopdb {

namespace {

const char* const FIRST_NAME = "Alice";
const char* const LAST_NAME = "Carter";
const char* const USERNAME = "alicec";
const char* const EMAIL = "alice@example.com";
const char* const PASSWORD_HASH = "\x01";

const char* const CATEGORY = "Shoes";
const char* const PRODUCT = "Red Shoe";
constexpr Cents PRODUCT_PRICE = 7900;

const char* const STREET = "123 Peachtree St";
const char* const CITY = "Atlanta";
const char* const ZIP = "30303";
const char* const STATE = "GA";
const char* const PHONE = "+1-404-555-1234";
const char* const COUNTRY = "US";

constexpr Cents TAX = 600;
constexpr Cents SHIPPING_PRICE = 500;
constexpr Cents TOTAL_COST = 9000;

const char* const PSP_REF = "ch_123";
const char* const LAST4 = "4242";

std::string full_name() {
    return std::string(FIRST_NAME) + " " + LAST_NAME;
}

}

std::optional<DemoSeed> seed_demo_data(InMemoryStore& store) {
    if (store.user_count() > 0) {
        return std::nullopt;
    }

    DemoSeed seed;

    User user;
    user.first_name = FIRST_NAME;
    user.last_name = LAST_NAME;
    user.username = USERNAME;
    user.email = EMAIL;
    user.password_hash = PASSWORD_HASH;
    seed.user_id = store.insert_user(user);

    Category category;
    category.name = CATEGORY;
    seed.category_id = store.insert_category(category);

    Product product;
    product.product_name = PRODUCT;
    product.price = PRODUCT_PRICE;
    product.category_id = seed.category_id;
    product.created_by_user_id = seed.user_id;
    seed.product_id = store.insert_product(product);

    ShippingAddress address;
    address.user_id = seed.user_id;
    address.street = STREET;
    address.city = CITY;
    address.zip = ZIP;
    address.state = STATE;
    address.phone_number = PHONE;
    seed.shipping_address_id = store.insert_shipping_address(address);

    Order order;
    order.user_id = seed.user_id;
    order.shipping_address_id = seed.shipping_address_id;
    order.email_snapshot = EMAIL;
    order.shipping_name = full_name();
    order.shipping_address = STREET;
    order.shipping_city = CITY;
    order.shipping_state = STATE;
    order.shipping_zip = ZIP;
    order.ship_country = COUNTRY;
    order.tax = TAX;
    order.shipping_price = SHIPPING_PRICE;
    order.is_delivered = false;
    order.is_paid = true;
    order.total_cost = TOTAL_COST;
    seed.order_id = store.insert_order(order);

    OrderItem item;
    item.order_id = seed.order_id;
    item.product_id = seed.product_id;
    item.quantity = 1;
    item.price = PRODUCT_PRICE;
    seed.order_item_id = store.insert_order_item(item);

    Payment payment;
    payment.order_id = seed.order_id;
    payment.psp_ref = PSP_REF;
    payment.last4 = LAST4;
    payment.billing_name = full_name();
    payment.billing_address = STREET;
    seed.payment_id = store.insert_payment(payment);

    return seed;
}

std::string demo_seed_sql() {
    const std::string email = quote_literal(EMAIL);
    const std::string street = quote_literal(STREET);
    const std::string city = quote_literal(CITY);
    const std::string zip = quote_literal(ZIP);
    const std::string state = quote_literal(STATE);
    const std::string name = quote_literal(full_name());
    const std::string first_order = "(SELECT order_id FROM orders WHERE user_id = 1 LIMIT 1)";

    std::ostringstream sql;
    sql << "DO $$\n"
        << "BEGIN\n"
        << "  IF NOT EXISTS (SELECT 1 FROM users) THEN\n"
        << "    INSERT INTO users (first_name, last_name, username, email, password_hash)\n"
        << "    VALUES (" << quote_literal(FIRST_NAME) << ", " << quote_literal(LAST_NAME) << ", "
        << quote_literal(USERNAME) << ", " << email << ", '\\x01');\n\n"
        << "    INSERT INTO categories (name) VALUES (" << quote_literal(CATEGORY) << ");\n\n"
        << "    INSERT INTO products (product_name, price, category_id, created_by_user_id)\n"
        << "    VALUES (" << quote_literal(PRODUCT) << ", " << format_cents(PRODUCT_PRICE)
        << ", (SELECT category_id FROM categories WHERE name = " << quote_literal(CATEGORY) << "), 1);\n\n"
        << "    INSERT INTO shipping_addresses (user_id, street, city, zip, state, phone_number)\n"
        << "    VALUES (1, " << street << ", " << city << ", " << zip << ", " << state << ", "
        << quote_literal(PHONE) << ");\n\n"
        << "    INSERT INTO orders (user_id, shipping_address_id, email_snapshot, shipping_name, shipping_address,\n"
        << "                        shipping_city, shipping_state, shipping_zip, ship_country, tax, shipping_price,\n"
        << "                        is_delivered, is_paid, total_cost)\n"
        << "    VALUES (1, (SELECT shipping_address_id FROM shipping_addresses WHERE user_id = 1),\n"
        << "            " << email << ", " << name << ", " << street << ", " << city << ", " << state << ", "
        << zip << ", " << quote_literal(COUNTRY) << ",\n"
        << "            " << format_cents(TAX) << ", " << format_cents(SHIPPING_PRICE) << ", false, true, "
        << format_cents(TOTAL_COST) << ");\n\n"
        << "    INSERT INTO order_items (order_id, product_id, quantity, price)\n"
        << "    VALUES (" << first_order << ",\n"
        << "            (SELECT product_id FROM products LIMIT 1), 1, " << format_cents(PRODUCT_PRICE) << ");\n\n"
        << "    INSERT INTO payments (order_id, psp_ref, last4, billing_name, billing_address)\n"
        << "    VALUES (" << first_order << ",\n"
        << "            " << quote_literal(PSP_REF) << ", " << quote_literal(LAST4) << ", " << name << ", "
        << street << ");\n"
        << "  END IF;\n"
        << "END $$;";
    return sql.str();
}

}
