#include <iostream>
#include <memory>
#include "anonymizer.hpp"
#include "anonymizer_config.hpp"
#include "memory_store.hpp"
#include "pg_deployment.hpp"
#include "pg_query_wrapper.hpp"
#include "sample_schema.hpp"
#include "seed.hpp"
#include "statement_validator.hpp"

using namespace shopdb;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

std::string show(const Text& value) {
    return value ? *value : "NULL";
}

void print_customer(const InMemoryStore& store, const DemoSeed& seed) {
    auto user = store.find_user(seed.user_id);
    if (!user) {
        std::cout << "user " << seed.user_id << " not found" << std::endl;
        return;
    }

    std::cout << "users:" << std::endl;
    std::cout << "  name: " << show(user->first_name) << " " << show(user->last_name) << std::endl;
    std::cout << "  username: " << show(user->username) << std::endl;
    std::cout << "  email: " << show(user->email) << std::endl;
    std::cout << "  status: " << to_string(user->status) << std::endl;
    std::cout << "  anon_tag: " << show(user->anon_tag) << std::endl;
    std::cout << "  anonymized_time: "
              << (user->anonymized_time ? format_timestamp(*user->anonymized_time) : "NULL") << std::endl;

    std::cout << "shipping_addresses:" << std::endl;
    for (const auto& address : store.shipping_addresses_of(seed.user_id)) {
        std::cout << "  " << show(address.street) << ", " << show(address.city) << ", "
                  << show(address.state) << " " << show(address.zip)
                  << " / " << show(address.phone_number) << std::endl;
    }

    std::cout << "orders:" << std::endl;
    for (const auto& order : store.orders_of(seed.user_id)) {
        std::cout << "  #" << order.order_id << " to " << show(order.shipping_name)
                  << " <" << show(order.email_snapshot) << ">, "
                  << show(order.shipping_address) << ", " << show(order.shipping_city)
                  << " total " << format_cents(order.total_cost) << std::endl;

        for (const auto& payment : store.payments_of_order(order.order_id)) {
            std::cout << "    payment " << show(payment.psp_ref) << " card *" << show(payment.last4)
                      << " billed to " << show(payment.billing_name) << ", "
                      << show(payment.billing_address) << std::endl;
        }
    }
}

void demonstrate_deployment(const AnonymizerConfig& config) {
    print_separator("PostgreSQL Deployment Script");

    PgDeployment deployment(ECommerceSchema::create_schema(), config);
    const std::string script = deployment.full_script();

    QueryParser parser;
    const auto statements = parser.split_statements(script);
    std::cout << "Statements: " << statements.size() << std::endl;

    auto schema = std::make_shared<DatabaseSchema>(deployment.get_schema());
    StatementValidator validator(schema);
    size_t invalid = 0;
    for (const auto& result : validator.validate_script(script)) {
        if (!result.is_valid) {
            ++invalid;
            for (const auto& error : result.errors) {
                std::cout << "Error: " << error << std::endl;
            }
        }
    }
    std::cout << "Invalid against schema: " << invalid << std::endl;

    std::string error;
    std::cout << "slow_sha256_hex(): "
              << (parser.is_valid_plpgsql(deployment.stretch_function_sql(), &error) ? "✓" : "✗ " + error)
              << std::endl;
    std::cout << "anonymize_user(): "
              << (parser.is_valid_plpgsql(deployment.anonymize_function_sql(), &error) ? "✓" : "✗ " + error)
              << std::endl;

    std::cout << "\nErasure cascade:" << std::endl;
    for (const auto& statement : deployment.erasure_statements()) {
        std::cout << "  " << statement << std::endl;
    }
}

void demonstrate_erasure(const AnonymizerConfig& config) {
    print_separator("Right-to-Erasure");

    auto store = std::make_shared<InMemoryStore>();
    auto seed = seed_demo_data(*store);
    if (!seed) {
        std::cout << "store already seeded" << std::endl;
        return;
    }

    std::cout << "\nBefore:" << std::endl;
    print_customer(*store, *seed);

    Anonymizer anonymizer(store, config);
    anonymizer.set_erasure_listener([](const ErasureRecord& record) {
        std::cout << to_json(record).dump() << std::endl;
    });

    std::cout << "\nErasure log:" << std::endl;
    anonymizer.anonymize_user(seed->user_id);
    anonymizer.anonymize_user(seed->user_id);
    anonymizer.anonymize_user(seed->user_id + 100);

    std::cout << "\nAfter:" << std::endl;
    print_customer(*store, *seed);
}

int main(int argc, char* argv[]) {
    std::cout << "shopdb - Right-to-Erasure Demo" << std::endl;

    try {
        AnonymizerConfig config;
        if (argc > 1) {
            config = load_anonymizer_config(argv[1]);
            std::cout << "Config: " << argv[1] << std::endl;
        }
        std::cout << to_json(config).dump(2) << std::endl;

        demonstrate_deployment(config);
        demonstrate_erasure(config);

        print_separator("Demo Complete");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
