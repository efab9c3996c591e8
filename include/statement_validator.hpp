#pragma once

#include "pg_query_wrapper.hpp"
#include "database.hpp"
#include <string>
#include <vector>
#include <memory>

namespace shopdb {

struct StatementValidationResult {
    bool is_valid = false;
    std::string statement;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> referenced_tables;
    std::string fingerprint;
};

/**
 * StatementValidator
 *
 * Checks SQL against the store schema: the statement must parse, every
 * table it references must be declared, and column references that match
 * no referenced table are reported as warnings.
 */
class StatementValidator {
public:
    explicit StatementValidator(std::shared_ptr<DatabaseSchema> schema);

    StatementValidationResult validate(const std::string& statement);

    // Splits the script and validates each statement; a script that does
    // not split yields a single invalid result.
    std::vector<StatementValidationResult> validate_script(const std::string& script);

    [[nodiscard]] bool check_table_exists(const std::string& table_name) const;
    [[nodiscard]] bool check_column_exists(const std::string& table_name, const std::string& column_name) const;

private:
    std::shared_ptr<DatabaseSchema> schema_;
    QueryParser parser_;
};

}
