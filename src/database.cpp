#include "database.hpp"
#include <sstream>

namespace shopdb {

std::string quote_literal(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

const Column* Table::find_column(const std::string& column_name) const {
    for (const auto& column : columns) {
        if (column.name == column_name) {
            return &column;
        }
    }
    return nullptr;
}

DatabaseSchema::DatabaseSchema(const std::string& name) : name_(name) {}

void DatabaseSchema::add_table(const Table& table) {
    if (tables_.find(table.name) == tables_.end()) {
        table_order_.push_back(table.name);
    }
    tables_[table.name] = table;
}

void DatabaseSchema::add_index(const std::string& table_name, const Index& index) {
    auto it = tables_.find(table_name);
    if (it != tables_.end()) {
        it->second.indexes.push_back(index);
    }
}

void DatabaseSchema::add_foreign_key(const std::string& table_name,
                                    const std::string& column_name,
                                    const std::string& ref_table,
                                    const std::string& ref_column,
                                    const std::string& on_delete) {
    auto it = tables_.find(table_name);
    if (it != tables_.end()) {
        for (auto& column : it->second.columns) {
            if (column.name == column_name) {
                column.references_table = ref_table;
                column.references_column = ref_column;
                column.on_delete = on_delete;
                break;
            }
        }
    }
}

std::vector<std::string> DatabaseSchema::create_statements(bool if_not_exists) const {
    std::vector<std::string> statements;

    for (const auto& table_name : table_order_) {
        const Table& table = tables_.at(table_name);
        statements.push_back(generate_table_sql(table, if_not_exists));

        if (!table.comment.empty()) {
            statements.push_back("COMMENT ON TABLE " + table.name + " IS " + quote_literal(table.comment) + ";");
        }

        for (const auto& index : table.indexes) {
            statements.push_back(generate_index_sql(table_name, index, if_not_exists));
        }
    }

    return statements;
}

std::string DatabaseSchema::generate_create_sql(bool if_not_exists) const {
    std::stringstream sql;

    sql << "-- Database: " << name_ << "\n";
    sql << "-- Generated Schema\n\n";

    for (const auto& statement : create_statements(if_not_exists)) {
        sql << statement << "\n";
        // Blank line after each table block.
        if (statement.rfind("CREATE TABLE", 0) == 0) {
            sql << "\n";
        }
    }

    return sql.str();
}

std::string DatabaseSchema::generate_drop_sql() const {
    std::stringstream sql;

    sql << "-- Drop Database: " << name_ << "\n\n";

    for (auto it = table_order_.rbegin(); it != table_order_.rend(); ++it) {
        sql << "DROP TABLE IF EXISTS " << *it << " CASCADE;\n";
    }

    return sql.str();
}

std::vector<std::string> DatabaseSchema::get_table_names() const {
    return table_order_;
}

std::optional<Table> DatabaseSchema::get_table(const std::string& name) const {
    auto it = tables_.find(name);
    if (it != tables_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool DatabaseSchema::has_table(const std::string& name) const {
    return tables_.find(name) != tables_.end();
}

std::string DatabaseSchema::column_type_to_sql(const Column& column) const {
    std::string sql;

    switch (column.type) {
        case ColumnType::INTEGER:
            sql = "INTEGER";
            break;
        case ColumnType::BIGINT:
            sql = "BIGINT";
            break;
        case ColumnType::BIGSERIAL:
            sql = "BIGSERIAL";
            break;
        case ColumnType::VARCHAR:
            sql = "VARCHAR(" + std::to_string(column.max_length > 0 ? column.max_length : 255) + ")";
            break;
        case ColumnType::CHAR:
            sql = "CHAR(" + std::to_string(column.max_length > 0 ? column.max_length : 1) + ")";
            break;
        case ColumnType::TEXT:
            sql = "TEXT";
            break;
        case ColumnType::BOOLEAN:
            sql = "BOOLEAN";
            break;
        case ColumnType::NUMERIC:
            if (column.precision > 0) {
                sql = "NUMERIC(" + std::to_string(column.precision) + "," + std::to_string(column.scale) + ")";
            } else {
                sql = "NUMERIC";
            }
            break;
        case ColumnType::BYTEA:
            sql = "BYTEA";
            break;
        case ColumnType::TIMESTAMPTZ:
            sql = "TIMESTAMPTZ";
            break;
    }

    return sql;
}

std::string DatabaseSchema::generate_table_sql(const Table& table, bool if_not_exists) const {
    std::stringstream sql;

    sql << "CREATE TABLE " << (if_not_exists ? "IF NOT EXISTS " : "") << table.name << " (\n";

    std::vector<std::string> column_defs;
    std::vector<std::string> constraints;

    for (const auto& column : table.columns) {
        std::string column_def = "    " + column.name + " " + column_type_to_sql(column);

        if (column.primary_key) {
            column_def += " PRIMARY KEY";
        }

        if (!column.nullable && !column.primary_key) {
            column_def += " NOT NULL";
        }

        if (!column.default_value.empty()) {
            column_def += " DEFAULT " + column.default_value;
        }

        if (column.unique && !column.primary_key) {
            column_def += " UNIQUE";
        }

        column_defs.push_back(column_def);

        if (!column.references_table.empty() && !column.references_column.empty()) {
            std::string fk_constraint = "    FOREIGN KEY (" + column.name +
                                      ") REFERENCES " + column.references_table +
                                      "(" + column.references_column + ")";
            if (!column.on_delete.empty()) {
                fk_constraint += " ON DELETE " + column.on_delete;
            }
            constraints.push_back(fk_constraint);
        }
    }

    for (size_t i = 0; i < column_defs.size(); ++i) {
        sql << column_defs[i];
        if (i < column_defs.size() - 1 || !constraints.empty()) {
            sql << ",";
        }
        sql << "\n";
    }

    for (size_t i = 0; i < constraints.size(); ++i) {
        sql << constraints[i];
        if (i < constraints.size() - 1) {
            sql << ",";
        }
        sql << "\n";
    }

    sql << ");";

    return sql.str();
}

std::string DatabaseSchema::generate_index_sql(const std::string& table_name, const Index& index,
                                               bool if_not_exists) const {
    std::stringstream sql;

    if (index.unique) {
        sql << "CREATE UNIQUE INDEX ";
    } else {
        sql << "CREATE INDEX ";
    }

    if (if_not_exists) {
        sql << "IF NOT EXISTS ";
    }

    sql << index.name << " ON " << table_name;

    if (index.type != "BTREE") {
        sql << " USING " << index.type;
    }

    sql << " (";
    for (size_t i = 0; i < index.columns.size(); ++i) {
        sql << index.columns[i];
        if (i < index.columns.size() - 1) {
            sql << ", ";
        }
    }
    sql << ");";

    return sql.str();
}

}
