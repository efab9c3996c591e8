#include "pg_query_wrapper.hpp"
#include <stdexcept>

namespace shopdb {

    void EnhancedQueryResult::extract_references(const std::string &query) { // NOLINT(readability-convert-member-functions-to-static)
        tables.clear();
        columns.clear();
        indexes.clear();
        this->query = query;
        if (query.empty()) {
            throw std::runtime_error("Empty query");
        }
        const PgQueryParseResult parse_result = pg_query_parse(query.c_str());
        if (parse_result.error || !parse_result.parse_tree) {
            const std::string message = parse_result.error ? parse_result.error->message : "no parse tree";
            pg_query_free_parse_result(parse_result);
            is_valid = false;
            errors = {message};
            throw std::runtime_error(message);
        }
        try {
            const nlohmann::json ast = nlohmann::json::parse(parse_result.parse_tree);
            extract_tables_from_ast(ast);
            extract_indexes_from_ast(ast);
            extract_columns_from_ast(ast);
        } catch (const nlohmann::json::exception &e) {
            pg_query_free_parse_result(parse_result);
            throw std::runtime_error(std::string("Malformed parse tree: ") + e.what());
        }
        parse_tree = {parse_result.parse_tree};
        errors.clear();
        is_valid = true;
        pg_query_free_parse_result(parse_result);
    }

    void EnhancedQueryResult::extract_tables_from_ast(nlohmann::json::const_reference ast) { // NOLINT(readability-convert-member-functions-to-static)
        std::set<std::string> unique_tables;

        // Traverse AST recursively to find all RangeVar nodes
        traverse_ast_for_tables(ast, unique_tables);

        tables.assign(unique_tables.begin(), unique_tables.end());
    }

    // NOLINTNEXTLINE
    void EnhancedQueryResult::traverse_ast_for_tables(const nlohmann::json &ast_node, std::set<std::string> &table_set) { // NOLINT(readability-convert-member-functions-to-static)
        if (!ast_node.is_object() && !ast_node.is_array()) {
            return;
        }
        if (ast_node.is_array()) {
            for (const auto &child : ast_node) {
                traverse_ast_for_tables(child, table_set);
            }
            return;
        }
        // RangeVar appears both wrapped ({"RangeVar": {...}}) and bare, as
        // the "relation" of UPDATE, CREATE TABLE and CREATE INDEX.
        if (ast_node.contains("RangeVar")) {
            collect_range_var(ast_node["RangeVar"], table_set);
        }
        for (const char *key : {"relation", "pktable"}) {
            if (ast_node.contains(key) && ast_node[key].is_object()) {
                collect_range_var(ast_node[key], table_set);
            }
        }
        // CTE names behave like tables inside the statement
        if (ast_node.contains("CommonTableExpr")) {
            if (const auto &cte = ast_node["CommonTableExpr"]; cte.contains("ctename")) {
                table_set.insert(cte["ctename"].get<std::string>());
            }
        }
        for (const auto &[key, value] : ast_node.items()) {
            traverse_ast_for_tables(value, table_set);
        }
    }

    void EnhancedQueryResult::collect_range_var(const nlohmann::json &range_var, std::set<std::string> &table_set) {
        if (!range_var.contains("relname")) {
            return;
        }
        std::string table_name = range_var["relname"].get<std::string>();

        // Handle schema-qualified names
        if (range_var.contains("schemaname")) {
            table_name = range_var["schemaname"].get<std::string>() + "." + table_name;
        }
        table_set.insert(table_name);
    }

    void EnhancedQueryResult::extract_indexes_from_ast(nlohmann::json::const_reference ast) {
        std::set<std::string> unique_indexes;

        traverse_ast_for_indexes(ast, unique_indexes);

        indexes.assign(unique_indexes.begin(), unique_indexes.end());
    }

    // NOLINTNEXTLINE
    void EnhancedQueryResult::traverse_ast_for_indexes(const nlohmann::json &ast_node, std::set<std::string> &index_set) {
        if (!ast_node.is_object() && !ast_node.is_array()) {
            return;
        }
        if (ast_node.is_array()) {
            for (const auto &child : ast_node) {
                traverse_ast_for_indexes(child, index_set);
            }
            return;
        }
        // CREATE INDEX
        if (ast_node.contains("IndexStmt")) {
            if (const auto &index_stmt = ast_node["IndexStmt"]; index_stmt.contains("idxname")) {
                index_set.insert(index_stmt["idxname"].get<std::string>());
            }
        }
        // DROP INDEX
        if (ast_node.contains("DropStmt")) {
            if (const auto &drop_stmt = ast_node["DropStmt"]; drop_stmt.contains("removeType") &&
                                                              drop_stmt["removeType"] == "OBJECT_INDEX" &&
                                                              drop_stmt.contains("objects")) {
                for (const auto &obj : drop_stmt["objects"]) {
                    if (!obj.contains("List") || !obj["List"].contains("items")) {
                        continue;
                    }
                    for (const auto &name_part : obj["List"]["items"]) {
                        if (name_part.contains("String")) {
                            index_set.insert(name_part["String"]["sval"].get<std::string>());
                        }
                    }
                }
            }
        }
        for (const auto &[key, value] : ast_node.items()) {
            traverse_ast_for_indexes(value, index_set);
        }
    }

    void EnhancedQueryResult::extract_columns_from_ast(nlohmann::json::const_reference ast_node) {
        std::set<std::string> unique_columns;

        traverse_ast_for_columns(ast_node, unique_columns);

        columns.assign(unique_columns.begin(), unique_columns.end());
    }

    // NOLINTNEXTLINE (misc-no-recursion)
    void EnhancedQueryResult::traverse_ast_for_columns(nlohmann::json::const_reference ast_node, std::set<std::string> &column_set) { // NOLINT(readability-convert-member-functions-to-static)
        if (!ast_node.is_object() && !ast_node.is_array()) {
            return;
        }
        if (ast_node.is_array()) {
            for (const auto &child : ast_node) {
                traverse_ast_for_columns(child, column_set);
            }
            return;
        }
        if (ast_node.contains("ColumnRef")) {
            if (const auto &col_ref = ast_node["ColumnRef"]; col_ref.contains("fields")) {
                if (const auto &fields = col_ref["fields"]; fields.is_array() && !fields.empty()) {
                    // Qualified names come out as table.column
                    std::string column_name;
                    for (const auto &field : fields) {
                        if (field.contains("String")) {
                            if (!column_name.empty()) {
                                column_name += ".";
                            }
                            column_name += field["String"]["sval"].get<std::string>();
                        }
                    }
                    if (!column_name.empty()) {
                        column_set.insert(column_name);
                    }
                }
            }
        }
        // UPDATE ... SET targets and SELECT aliases
        if (ast_node.contains("ResTarget")) {
            if (const auto &res_target = ast_node["ResTarget"]; res_target.contains("name")) {
                column_set.insert(res_target["name"].get<std::string>());
            }
        }
        for (const auto &[key, value] : ast_node.items()) {
            traverse_ast_for_columns(value, column_set);
        }
    }

    QueryParser::QueryParser() = default;

    QueryParser::~QueryParser() = default;

    QueryResult QueryParser::parse(const std::string &query) {
        QueryResult result;
        result.query = query;
        result.is_valid = false;

        PgQueryParseResult parse_result = pg_query_parse(query.c_str());

        if (parse_result.error) {
            result.errors.emplace_back(parse_result.error->message);
        } else {
            result.is_valid = true;
            if (parse_result.parse_tree) {
                result.parse_tree.emplace_back(parse_result.parse_tree);
            }
        }

        cleanup_result(parse_result);
        return result;
    }

    NormalizedQuery QueryParser::normalize(const std::string &query) {
        NormalizedQuery result;
        result.is_valid = false;

        const PgQueryNormalizeResult normalize_result = pg_query_normalize(query.c_str());

        if (normalize_result.error) {
            result.errors.emplace_back(normalize_result.error->message);
        } else {
            result.is_valid = true;
            if (normalize_result.normalized_query) {
                result.normalized_query = normalize_result.normalized_query;
            }
        }

        cleanup_normalize_result(normalize_result);
        return result;
    }

    std::optional<std::string> QueryParser::get_query_fingerprint(const std::string &query) {
        PgQueryFingerprintResult fingerprint_result = pg_query_fingerprint(query.c_str());

        std::optional<std::string> result;
        if (!fingerprint_result.error && fingerprint_result.fingerprint_str) {
            result = std::string(fingerprint_result.fingerprint_str);
        }

        cleanup_fingerprint_result(fingerprint_result);
        return result;
    }

    bool QueryParser::is_valid_sql(const std::string &query) {
        PgQueryParseResult parse_result = pg_query_parse(query.c_str());
        const bool valid = !parse_result.error;
        cleanup_result(parse_result);
        return valid;
    }

    std::vector<std::string> QueryParser::split_statements(const std::string &script) {
        std::vector<std::string> statements;

        PgQuerySplitResult split_result = pg_query_split_with_parser(script.c_str());
        if (!split_result.error) {
            for (int i = 0; i < split_result.n_stmts; ++i) {
                const PgQuerySplitStmt *stmt = split_result.stmts[i];
                statements.push_back(script.substr(static_cast<size_t>(stmt->stmt_location),
                                                   static_cast<size_t>(stmt->stmt_len)));
            }
        }

        pg_query_free_split_result(split_result);
        return statements;
    }

    bool QueryParser::is_valid_plpgsql(const std::string &create_function, std::string *error) {
        PgQueryPlpgsqlParseResult plpgsql_result = pg_query_parse_plpgsql(create_function.c_str());

        const bool valid = !plpgsql_result.error;
        if (!valid && error) {
            *error = plpgsql_result.error->message;
        }

        pg_query_free_plpgsql_parse_result(plpgsql_result);
        return valid;
    }

    void QueryParser::cleanup_result(const PgQueryParseResult &result) {
        pg_query_free_parse_result(result);
    }

    void QueryParser::cleanup_fingerprint_result(const PgQueryFingerprintResult &result) {
        pg_query_free_fingerprint_result(result);
    }

    void QueryParser::cleanup_normalize_result(const PgQueryNormalizeResult &result) {
        pg_query_free_normalize_result(result);
    }
}
