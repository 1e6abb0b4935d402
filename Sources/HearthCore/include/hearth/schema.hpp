#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>
#include <initializer_list>

namespace hearth {

class schema_error : public std::runtime_error {
public:
    explicit schema_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Logical column types as declared by the application
enum class logical_type {
    text,
    integer,
    real,
    boolean,
    timestamp,
    date,
    jsonb
};

/// Storage type used in DDL. Total: anything without a dedicated mapping is TEXT.
std::string physical_type(logical_type type);

/// Declared name ("TEXT", "BOOLEAN", ...) for a logical type.
std::string logical_type_name(logical_type type);

/// Inverse of logical_type_name. Unrecognized names map to text.
logical_type parse_logical_type(const std::string& name);

// System columns present on every table
namespace sys {
    inline constexpr const char* id = "id";
    inline constexpr const char* created_at = "created_at";
    inline constexpr const char* updated_at = "updated_at";
    inline constexpr const char* synced = "synced";
    inline constexpr const char* deleted = "deleted";
}

bool is_system_column(const std::string& name);

struct foreign_key {
    std::string table;
    std::string column;
};

// Column definition for schema
struct column_def {
    std::string name;
    logical_type type = logical_type::text;
    bool is_primary_key = false;
    bool is_auto_increment = false;
    bool not_null = false;
    bool is_unique = false;
    std::optional<column_value_t> default_value;
    std::optional<foreign_key> references;
};

struct index_def {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
};

// Table schema. Columns keep their declaration order.
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
    std::vector<index_def> indexes;

    const column_def* find_column(const std::string& column) const;
    bool has_column(const std::string& column) const { return find_column(column) != nullptr; }

    /// Checks that every field names a declared column and that its value fits the
    /// column's logical type. Throws schema_error otherwise.
    void validate(const field_list& fields) const;
    void validate_column(const std::string& column) const;
};

// ============================================================================
// Fluent builder
//
//   auto t = make_table("pomodoro_log", [](table_builder& t) {
//       t.column("log_date", logical_type::date).not_null().unique()
//        .column("focus_score", logical_type::real).default_value(0.0)
//        .index({"log_date"}, "", true);
//   });
//
// Column modifiers apply to the most recently declared column.
// ============================================================================

class table_builder {
public:
    explicit table_builder(std::string table_name);

    table_builder& column(const std::string& name, logical_type type);

    table_builder& primary_key();
    table_builder& auto_increment();
    table_builder& not_null();
    table_builder& unique();
    table_builder& default_value(column_value_t value);
    table_builder& default_value(bool value);
    table_builder& default_value(int value);
    table_builder& default_value(int64_t value);
    table_builder& default_value(double value);
    table_builder& default_value(const char* value);
    table_builder& references(const std::string& table, const std::string& column);

    /// Empty name yields idx_<table>_<col1>_<col2>...
    table_builder& index(std::vector<std::string> columns,
                         const std::string& name = "",
                         bool unique = false);

    table_schema build() const { return schema_; }

private:
    column_def& last_column();
    table_schema schema_;
};

/// Declares id, created_at, updated_at, synced and deleted, then runs the builder.
table_schema make_table(const std::string& name, const std::function<void(table_builder&)>& build);

// ============================================================================
// Schema registry: ordered catalog of tables, the target of every migration
// ============================================================================

class schema_registry {
public:
    schema_registry() = default;
    schema_registry(std::initializer_list<table_schema> tables);

    /// Appends a table. Throws schema_error on a duplicate name.
    void add(table_schema schema);

    const table_schema* find(const std::string& table_name) const;

    /// Throws schema_error for an undeclared table.
    const table_schema& at(const std::string& table_name) const;

    const std::vector<table_schema>& tables() const { return tables_; }
    std::vector<std::string> table_names() const;
    size_t size() const { return tables_.size(); }

private:
    std::vector<table_schema> tables_;
};

} // namespace hearth

#endif // __cplusplus
