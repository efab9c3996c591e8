#pragma once

#include "anonymizer_config.hpp"
#include "database.hpp"
#include <string>
#include <vector>

namespace shopdb {

/**
 * PgDeployment
 *
 * Renders the PostgreSQL side of the store: schema DDL, the server-side
 * slow_sha256_hex() / anonymize_user() functions and the demo seed. The
 * functions are rendered from the same AnonymizerConfig the in-process
 * Anonymizer uses, so both produce labels of the same shape.
 */
class PgDeployment {
public:
    PgDeployment(DatabaseSchema schema, AnonymizerConfig config);

    [[nodiscard]] std::string extension_sql() const;
    [[nodiscard]] std::string schema_sql() const;
    [[nodiscard]] std::string stretch_function_sql() const;
    [[nodiscard]] std::string anonymize_function_sql() const;
    [[nodiscard]] std::string seed_sql() const;
    [[nodiscard]] std::string full_script() const;

    // The erasure cascade as standalone statements with $1 = user id,
    // $2 = label, $3 = label email. The lock comes first.
    [[nodiscard]] std::vector<std::string> erasure_statements() const;

    [[nodiscard]] const DatabaseSchema& get_schema() const { return schema_; }
    [[nodiscard]] const AnonymizerConfig& get_config() const { return config_; }

private:
    // Throws ConfigError when a schema column is too narrow for the label.
    void check_label_widths() const;

    // UPDATE statements of the cascade in lock order.
    [[nodiscard]] std::vector<std::string> cascade_updates(const std::string& user_ref,
                                                           const std::string& label_ref,
                                                           const std::string& email_ref) const;

    DatabaseSchema schema_;
    AnonymizerConfig config_;
};

}
