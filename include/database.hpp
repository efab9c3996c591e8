#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace shopdb {

enum class ColumnType {
    INTEGER,
    BIGINT,
    BIGSERIAL,
    VARCHAR,
    CHAR,
    TEXT,
    BOOLEAN,
    NUMERIC,
    BYTEA,
    TIMESTAMPTZ
};

struct Column {
    std::string name;
    ColumnType type;
    size_t max_length = 0;          // VARCHAR / CHAR
    size_t precision = 0;           // NUMERIC
    size_t scale = 0;               // NUMERIC
    bool nullable = true;
    bool primary_key = false;
    bool unique = false;
    std::string default_value;
    std::string references_table;
    std::string references_column;
    std::string on_delete;          // e.g. "CASCADE"
};

struct Index {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    std::string type = "BTREE";
};

struct Table {
    std::string name;
    std::vector<Column> columns;
    std::vector<Index> indexes;
    std::string comment;

    [[nodiscard]] const Column* find_column(const std::string& column_name) const;
};

// SQL string literal with embedded quotes doubled.
std::string quote_literal(const std::string& value);

/**
 * DatabaseSchema
 *
 * Declarative description of the store's tables. Tables keep their
 * declaration order so that generated DDL creates referenced tables
 * before the tables that point at them.
 */
class DatabaseSchema {
public:
    explicit DatabaseSchema(const std::string& name);

    void add_table(const Table& table);
    void add_index(const std::string& table_name, const Index& index);
    void add_foreign_key(const std::string& table_name,
                        const std::string& column_name,
                        const std::string& ref_table,
                        const std::string& ref_column,
                        const std::string& on_delete = "");

    [[nodiscard]] std::string generate_create_sql(bool if_not_exists = false) const;
    [[nodiscard]] std::string generate_drop_sql() const;
    [[nodiscard]] std::vector<std::string> get_table_names() const;
    [[nodiscard]] std::optional<Table> get_table(const std::string& name) const;
    [[nodiscard]] bool has_table(const std::string& name) const;
    [[nodiscard]] const std::string& get_name() const { return name_; }

    // Individual statements, in the order generate_create_sql() emits them.
    [[nodiscard]] std::vector<std::string> create_statements(bool if_not_exists = false) const;

private:
    std::string name_;
    std::vector<std::string> table_order_;
    std::unordered_map<std::string, Table> tables_;

    [[nodiscard]] std::string column_type_to_sql(const Column& column) const;
    [[nodiscard]] std::string generate_table_sql(const Table& table, bool if_not_exists) const;
    [[nodiscard]] std::string generate_index_sql(const std::string& table_name, const Index& index,
                                                 bool if_not_exists) const;
};

}
