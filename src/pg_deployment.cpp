#include "pg_deployment.hpp"
#include "seed.hpp"
#include <sstream>
#include <utility>

namespace shopdb {

namespace {

struct LabelTarget {
    const char* table;
    const char* column;
    bool email;
};

// Every column anonymize_user() overwrites with the label or the label email.
const LabelTarget LABEL_TARGETS[] = {
    {"users", "first_name", false},
    {"users", "last_name", false},
    {"users", "username", false},
    {"users", "email", true},
    {"users", "anon_tag", false},
    {"shipping_addresses", "street", false},
    {"shipping_addresses", "phone_number", false},
    {"orders", "email_snapshot", true},
    {"orders", "shipping_name", false},
    {"orders", "shipping_address", false},
    {"payments", "billing_name", false},
    {"payments", "billing_address", false},
};

}

PgDeployment::PgDeployment(DatabaseSchema schema, AnonymizerConfig config)
    : schema_(std::move(schema)), config_(std::move(config)) {
    validate(config_);
    check_label_widths();
}

void PgDeployment::check_label_widths() const {
    const size_t label_width = config_.label_prefix.size() + config_.label_length;
    const size_t email_width = label_width + 1 + config_.email_domain.size();

    for (const auto& target : LABEL_TARGETS) {
        const auto table = schema_.get_table(target.table);
        if (!table) {
            continue;
        }
        const Column* column = table->find_column(target.column);
        if (!column || column->max_length == 0) {
            continue;
        }
        const size_t width = target.email ? email_width : label_width;
        if (width > column->max_length) {
            throw ConfigError(std::string(target.table) + "." + target.column + " holds " +
                              std::to_string(column->max_length) + " characters, label needs " +
                              std::to_string(width));
        }
    }
}

std::string PgDeployment::extension_sql() const {
    // digest() and gen_random_bytes() come from pgcrypto
    return "CREATE EXTENSION IF NOT EXISTS pgcrypto;";
}

std::string PgDeployment::schema_sql() const {
    return schema_.generate_create_sql(true);
}

std::string PgDeployment::stretch_function_sql() const {
    std::ostringstream sql;
    sql << "CREATE OR REPLACE FUNCTION slow_sha256_hex(hash_input TEXT, hash_times INT)\n"
        << "RETURNS TEXT\n"
        << "LANGUAGE plpgsql\n"
        << "AS $$\n"
        << "DECLARE\n"
        << "  h BYTEA := digest(convert_to(COALESCE(hash_input, ''), 'UTF8'), 'sha256');\n"
        << "  i INT := 0;\n"
        << "BEGIN\n"
        << "  WHILE i < GREATEST(hash_times, 0) LOOP\n"
        << "    h := digest(h, 'sha256');\n"
        << "    i := i + 1;\n"
        << "  END LOOP;\n"
        << "  RETURN lower(encode(h, 'hex'));\n"
        << "END\n"
        << "$$;";
    return sql.str();
}

std::vector<std::string> PgDeployment::cascade_updates(const std::string& user_ref,
                                                       const std::string& label_ref,
                                                       const std::string& email_ref) const {
    return {
        "UPDATE users SET first_name = " + label_ref + ", last_name = " + label_ref +
            ", username = " + label_ref + ", email = " + email_ref +
            ", anonymized_time = now(), anon_tag = " + label_ref +
            ", status = 'erased' WHERE user_id = " + user_ref,
        "UPDATE shipping_addresses SET street = " + label_ref +
            ", city = NULL, state = NULL, zip = NULL, phone_number = " + label_ref +
            " WHERE user_id = " + user_ref,
        "UPDATE orders SET email_snapshot = " + email_ref + ", shipping_name = " + label_ref +
            ", shipping_address = " + label_ref +
            ", shipping_city = NULL, shipping_state = NULL, shipping_zip = NULL WHERE user_id = " + user_ref,
        "UPDATE payments p SET billing_name = " + label_ref + ", billing_address = " + label_ref +
            " FROM orders o WHERE o.order_id = p.order_id AND o.user_id = " + user_ref
    };
}

std::vector<std::string> PgDeployment::erasure_statements() const {
    std::vector<std::string> statements = {
        "SELECT email, first_name, last_name, username, status, anonymized_time "
        "FROM users WHERE user_id = $1 FOR UPDATE"
    };
    for (auto& update : cascade_updates("$1", "$2", "$3")) {
        statements.push_back(std::move(update));
    }
    return statements;
}

std::string PgDeployment::anonymize_function_sql() const {
    std::ostringstream sql;
    sql << "CREATE OR REPLACE FUNCTION anonymize_user(p_user_id BIGINT)\n"
        << "RETURNS VOID\n"
        << "LANGUAGE plpgsql\n"
        << "AS $$\n"
        << "DECLARE\n"
        << "  v_email      TEXT;\n"
        << "  v_first      TEXT;\n"
        << "  v_last       TEXT;\n"
        << "  v_username   TEXT;\n"
        << "  v_status     TEXT;\n"
        << "  v_anonymized TIMESTAMPTZ;\n"
        << "  v_salthex    TEXT;\n"
        << "  v_digest     TEXT;\n"
        << "  v_tag        TEXT;\n"
        << "  v_tag_email  TEXT;\n"
        << "BEGIN\n"
        << "  SELECT email, first_name, last_name, username, status, anonymized_time\n"
        << "    INTO v_email, v_first, v_last, v_username, v_status, v_anonymized\n"
        << "    FROM users\n"
        << "   WHERE user_id = p_user_id\n"
        << "     FOR UPDATE;\n"
        << "\n"
        << "  IF NOT FOUND THEN\n"
        << "    RETURN;\n"
        << "  END IF;\n"
        << "\n"
        << "  IF v_status = 'erased' OR v_anonymized IS NOT NULL THEN\n"
        << "    RETURN;\n"
        << "  END IF;\n"
        << "\n"
        << "  v_salthex := lower(encode(gen_random_bytes(" << config_.salt_bytes << "), 'hex'));\n"
        << "  v_digest := slow_sha256_hex(\n"
        << "      COALESCE(v_email, '') || '|' ||\n"
        << "      COALESCE(v_first, '') || '|' ||\n"
        << "      COALESCE(v_last, '') || '|' ||\n"
        << "      COALESCE(v_username, '') || '|' ||\n"
        << "      v_salthex,\n"
        << "      " << config_.stretch_rounds << ");\n"
        << "  v_tag := " << quote_literal(config_.label_prefix)
        << " || substr(v_digest, 1, " << config_.label_length << ");\n"
        << "  v_tag_email := v_tag || " << quote_literal("@" + config_.email_domain) << ";\n"
        << "\n";

    for (const auto& update : cascade_updates("p_user_id", "v_tag", "v_tag_email")) {
        sql << "  " << update << ";\n";
    }

    sql << "END\n"
        << "$$;";
    return sql.str();
}

std::string PgDeployment::seed_sql() const {
    return demo_seed_sql();
}

std::string PgDeployment::full_script() const {
    std::ostringstream sql;
    sql << extension_sql() << "\n\n"
        << schema_sql() << "\n"
        << "-- Key-stretched SHA-256, lowercase hex\n"
        << stretch_function_sql() << "\n\n"
        << "-- Right-to-erasure: scrubs one user's personal data in a single transaction\n"
        << anonymize_function_sql() << "\n\n"
        << seed_sql() << "\n";
    return sql.str();
}

}
