#include "statement_validator.hpp"
#include <stdexcept>
#include <utility>

namespace shopdb {

StatementValidator::StatementValidator(std::shared_ptr<DatabaseSchema> schema)
    : schema_(std::move(schema)) {}

StatementValidationResult StatementValidator::validate(const std::string& statement) {
    StatementValidationResult result;
    result.statement = statement;

    EnhancedQueryResult references;
    try {
        references.extract_references(statement);
    } catch (const std::runtime_error& e) {
        result.errors.emplace_back(e.what());
        return result;
    }

    if (auto fingerprint = parser_.get_query_fingerprint(statement)) {
        result.fingerprint = *fingerprint;
    }

    result.referenced_tables = references.tables;
    for (const auto& table_name : references.tables) {
        if (!check_table_exists(table_name)) {
            result.errors.push_back("Table '" + table_name + "' does not exist in schema");
        }
    }

    for (const auto& column_ref : references.columns) {
        // Qualified references carry an alias we cannot resolve here, so
        // only the column part is checked.
        const auto dot = column_ref.rfind('.');
        const std::string column_name = dot == std::string::npos ? column_ref : column_ref.substr(dot + 1);
        if (column_name == "*") {
            continue;
        }

        bool found = false;
        for (const auto& table_name : references.tables) {
            if (check_column_exists(table_name, column_name)) {
                found = true;
                break;
            }
        }
        if (!found) {
            result.warnings.push_back("Column '" + column_ref + "' may not exist in referenced tables");
        }
    }

    result.is_valid = result.errors.empty();
    return result;
}

std::vector<StatementValidationResult> StatementValidator::validate_script(const std::string& script) {
    std::vector<StatementValidationResult> results;

    const auto statements = parser_.split_statements(script);
    if (statements.empty()) {
        StatementValidationResult failed;
        failed.statement = script;
        auto parsed = parser_.parse(script);
        failed.errors = parsed.is_valid ? std::vector<std::string>{"Script contains no statements"} : parsed.errors;
        results.push_back(failed);
        return results;
    }

    for (const auto& statement : statements) {
        results.push_back(validate(statement));
    }
    return results;
}

bool StatementValidator::check_table_exists(const std::string& table_name) const {
    return schema_->has_table(table_name);
}

bool StatementValidator::check_column_exists(const std::string& table_name,
                                             const std::string& column_name) const {
    auto table = schema_->get_table(table_name);
    if (!table) return false;

    return table->find_column(column_name) != nullptr;
}

}
