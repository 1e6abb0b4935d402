#include "hearth/schema.hpp"
#include <cctype>

namespace hearth {

std::string physical_type(logical_type type) {
    switch (type) {
        case logical_type::text: return "TEXT";
        case logical_type::integer: return "INTEGER";
        case logical_type::real: return "REAL";
        case logical_type::boolean: return "INTEGER";  // SQLite has no BOOLEAN
        case logical_type::timestamp: return "INTEGER";
        case logical_type::date: return "TEXT";
        case logical_type::jsonb: return "TEXT";
    }
    return "TEXT";
}

std::string logical_type_name(logical_type type) {
    switch (type) {
        case logical_type::text: return "TEXT";
        case logical_type::integer: return "INTEGER";
        case logical_type::real: return "REAL";
        case logical_type::boolean: return "BOOLEAN";
        case logical_type::timestamp: return "TIMESTAMP";
        case logical_type::date: return "DATE";
        case logical_type::jsonb: return "JSONB";
    }
    return "TEXT";
}

logical_type parse_logical_type(const std::string& name) {
    std::string upper(name);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "INTEGER") return logical_type::integer;
    if (upper == "REAL") return logical_type::real;
    if (upper == "BOOLEAN") return logical_type::boolean;
    if (upper == "TIMESTAMP") return logical_type::timestamp;
    if (upper == "DATE") return logical_type::date;
    if (upper == "JSONB") return logical_type::jsonb;
    return logical_type::text;
}

bool is_system_column(const std::string& name) {
    return name == sys::id || name == sys::created_at || name == sys::updated_at ||
           name == sys::synced || name == sys::deleted;
}

// ============================================================================
// table_schema
// ============================================================================

const column_def* table_schema::find_column(const std::string& column) const {
    for (const auto& col : columns) {
        if (col.name == column) return &col;
    }
    return nullptr;
}

void table_schema::validate_column(const std::string& column) const {
    if (!has_column(column)) {
        throw schema_error("Unknown column '" + column + "' in table " + name);
    }
}

namespace {

bool value_fits(logical_type type, const column_value_t& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) return true;
    switch (type) {
        case logical_type::integer:
        case logical_type::boolean:
        case logical_type::timestamp:
            return std::holds_alternative<int64_t>(value);
        case logical_type::real:
            return std::holds_alternative<double>(value) || std::holds_alternative<int64_t>(value);
        case logical_type::text:
        case logical_type::date:
        case logical_type::jsonb:
            return std::holds_alternative<std::string>(value);
    }
    return false;
}

} // namespace

void table_schema::validate(const field_list& fields) const {
    for (const auto& [column, value] : fields) {
        const column_def* col = find_column(column);
        if (!col) {
            throw schema_error("Unknown column '" + column + "' in table " + name);
        }
        if (!value_fits(col->type, value)) {
            throw schema_error("Value " + detail::describe(value) + " does not fit " +
                               logical_type_name(col->type) + " column " + name + "." + column);
        }
    }
}

// ============================================================================
// table_builder
// ============================================================================

table_builder::table_builder(std::string table_name) {
    schema_.name = std::move(table_name);
}

table_builder& table_builder::column(const std::string& name, logical_type type) {
    if (schema_.has_column(name)) {
        throw schema_error("Column '" + name + "' declared twice in table " + schema_.name);
    }
    column_def col;
    col.name = name;
    col.type = type;
    schema_.columns.push_back(std::move(col));
    return *this;
}

column_def& table_builder::last_column() {
    if (schema_.columns.empty()) {
        throw schema_error("Column modifier used before any column in table " + schema_.name);
    }
    return schema_.columns.back();
}

table_builder& table_builder::primary_key() {
    last_column().is_primary_key = true;
    return *this;
}

table_builder& table_builder::auto_increment() {
    last_column().is_auto_increment = true;
    return *this;
}

table_builder& table_builder::not_null() {
    last_column().not_null = true;
    return *this;
}

table_builder& table_builder::unique() {
    last_column().is_unique = true;
    return *this;
}

table_builder& table_builder::default_value(column_value_t value) {
    last_column().default_value = std::move(value);
    return *this;
}

table_builder& table_builder::default_value(bool value) {
    return default_value(column_value_t(static_cast<int64_t>(value ? 1 : 0)));
}

table_builder& table_builder::default_value(int value) {
    return default_value(column_value_t(static_cast<int64_t>(value)));
}

table_builder& table_builder::default_value(int64_t value) {
    return default_value(column_value_t(value));
}

table_builder& table_builder::default_value(double value) {
    return default_value(column_value_t(value));
}

table_builder& table_builder::default_value(const char* value) {
    return default_value(column_value_t(std::string(value)));
}

table_builder& table_builder::references(const std::string& table, const std::string& column) {
    last_column().references = foreign_key{table, column};
    return *this;
}

table_builder& table_builder::index(std::vector<std::string> columns,
                                    const std::string& name,
                                    bool unique) {
    index_def idx;
    idx.columns = std::move(columns);
    idx.unique = unique;
    if (name.empty()) {
        idx.name = "idx_" + schema_.name;
        for (const auto& col : idx.columns) {
            idx.name += "_" + col;
        }
    } else {
        idx.name = name;
    }
    schema_.indexes.push_back(std::move(idx));
    return *this;
}

table_schema make_table(const std::string& name, const std::function<void(table_builder&)>& build) {
    table_builder t(name);
    t.column(sys::id, logical_type::text).primary_key()
     .column(sys::created_at, logical_type::timestamp).not_null()
     .column(sys::updated_at, logical_type::timestamp).not_null()
     .column(sys::synced, logical_type::boolean).default_value(false)
     .column(sys::deleted, logical_type::boolean).default_value(false);

    if (build) build(t);

    auto schema = t.build();
    for (const auto& idx : schema.indexes) {
        for (const auto& col : idx.columns) {
            if (!schema.has_column(col)) {
                throw schema_error("Index " + idx.name + " names unknown column '" + col + "'");
            }
        }
    }
    return schema;
}

// ============================================================================
// schema_registry
// ============================================================================

schema_registry::schema_registry(std::initializer_list<table_schema> tables) {
    for (const auto& t : tables) {
        add(t);
    }
}

void schema_registry::add(table_schema schema) {
    if (find(schema.name)) {
        throw schema_error("Table " + schema.name + " registered twice");
    }
    tables_.push_back(std::move(schema));
}

const table_schema* schema_registry::find(const std::string& table_name) const {
    for (const auto& t : tables_) {
        if (t.name == table_name) return &t;
    }
    return nullptr;
}

const table_schema& schema_registry::at(const std::string& table_name) const {
    const auto* schema = find(table_name);
    if (!schema) {
        throw schema_error("Unknown table " + table_name);
    }
    return *schema;
}

std::vector<std::string> schema_registry::table_names() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& t : tables_) {
        names.push_back(t.name);
    }
    return names;
}

} // namespace hearth
