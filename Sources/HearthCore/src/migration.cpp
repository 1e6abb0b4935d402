#include "hearth/migration.hpp"
#include "hearth/log.hpp"
#include <algorithm>
#include <cstdio>

namespace hearth {

namespace {

bool is_duplicate_column(const db_error& e) {
    return std::string(e.what()).find("duplicate column name") != std::string::npos;
}

} // namespace

std::string default_literal_sql(const column_value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", v);
            return buf;
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string quoted = "'";
            for (char c : v) {
                if (c == '\'') quoted += '\'';
                quoted += c;
            }
            return quoted + "'";
        } else {
            static const char* hex = "0123456789ABCDEF";
            std::string lit = "X'";
            for (uint8_t b : v) {
                lit += hex[b >> 4];
                lit += hex[b & 0x0F];
            }
            return lit + "'";
        }
    }, value);
}

std::string column_definition_sql(const column_def& col) {
    std::string sql = col.name + " " + physical_type(col.type);
    if (col.is_primary_key) sql += " PRIMARY KEY";
    if (col.is_auto_increment) sql += " AUTOINCREMENT";
    if (col.not_null) sql += " NOT NULL";
    if (col.is_unique) sql += " UNIQUE";
    if (col.default_value) sql += " DEFAULT " + default_literal_sql(*col.default_value);
    if (col.references) sql += " REFERENCES " + col.references->table + "(" + col.references->column + ")";
    return sql;
}

std::string added_column_definition_sql(const column_def& col) {
    // SQLite rejects PRIMARY KEY and UNIQUE on ADD COLUMN, and NOT NULL
    // without a default; those constraints are dropped here
    std::string sql = col.name + " " + physical_type(col.type);
    if (col.not_null && col.default_value &&
        !std::holds_alternative<std::nullptr_t>(*col.default_value)) {
        sql += " NOT NULL";
    }
    if (col.default_value) sql += " DEFAULT " + default_literal_sql(*col.default_value);
    if (col.references) sql += " REFERENCES " + col.references->table + "(" + col.references->column + ")";
    return sql;
}

std::string create_table_sql(const table_schema& schema) {
    std::string sql = "CREATE TABLE " + schema.name + " (";
    for (size_t i = 0; i < schema.columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += column_definition_sql(schema.columns[i]);
    }
    return sql + ")";
}

std::string create_index_sql(const std::string& table, const index_def& index) {
    std::string sql = index.unique ? "CREATE UNIQUE INDEX IF NOT EXISTS " : "CREATE INDEX IF NOT EXISTS ";
    sql += index.name + " ON " + table + "(";
    for (size_t i = 0; i < index.columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += index.columns[i];
    }
    return sql + ")";
}

// ============================================================================
// migration_engine
// ============================================================================

migration_engine::migration_engine(store_backend& store, const schema_registry& registry, int version)
    : store_(store), registry_(registry), version_(version) {}

size_t migration_engine::apply_migrations() {
    ensure_migrations_table();

    size_t applied = 0;
    for (const auto& schema : registry_.tables()) {
        applied += migrate_table(schema);
    }

    if (applied > 0) {
        LOG_INFO("migration", "Applied %zu migration(s)", applied);
    } else {
        LOG_DEBUG("migration", "Schema up to date");
    }
    return applied;
}

void migration_engine::ensure_migrations_table() {
    store_.execute(std::string("CREATE TABLE IF NOT EXISTS ") + migrations_table + " ("
                   "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                   "version INTEGER NOT NULL, "
                   "table_name TEXT NOT NULL, "
                   "operation TEXT NOT NULL, "
                   "applied_at INTEGER NOT NULL)");
}

size_t migration_engine::migrate_table(const table_schema& schema) {
    size_t applied = 0;
    // A table's DDL and its log rows land together or not at all
    transaction tx(store_);

    if (!table_exists(schema.name)) {
        store_.execute(create_table_sql(schema));
        record_migration(schema.name, "CREATE_TABLE");
        LOG_INFO("migration", "Created table %s", schema.name.c_str());
        ++applied;
    }

    auto existing = existing_columns(schema.name);
    for (const auto& col : schema.columns) {
        if (std::find(existing.begin(), existing.end(), col.name) != existing.end()) {
            continue;
        }
        try {
            store_.execute("ALTER TABLE " + schema.name + " ADD COLUMN " + added_column_definition_sql(col));
        } catch (const db_error& e) {
            // A concurrent initializer got there first
            if (!is_duplicate_column(e)) throw;
            LOG_WARN("migration", "Column %s.%s already exists: %s",
                     schema.name.c_str(), col.name.c_str(), e.what());
            continue;
        }
        record_migration(schema.name, "ADD_COLUMN:" + col.name);
        LOG_INFO("migration", "Added column %s.%s", schema.name.c_str(), col.name.c_str());
        ++applied;
    }

    for (const auto& index : schema.indexes) {
        if (index_exists(index.name)) continue;
        store_.execute(create_index_sql(schema.name, index));
        record_migration(schema.name, "CREATE_INDEX:" + index.name);
        LOG_INFO("migration", "Created index %s", index.name.c_str());
        ++applied;
    }

    tx.commit();
    return applied;
}

bool migration_engine::table_exists(const std::string& table) {
    return !store_.query("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {table}).empty();
}

bool migration_engine::index_exists(const std::string& index) {
    return !store_.query("SELECT name FROM sqlite_master WHERE type='index' AND name=?", {index}).empty();
}

std::vector<std::string> migration_engine::existing_columns(const std::string& table) {
    std::vector<std::string> names;
    for (const auto& row : store_.query("PRAGMA table_info(" + table + ")")) {
        if (auto name = field_string(row, "name")) {
            names.push_back(*name);
        }
    }
    return names;
}

void migration_engine::record_migration(const std::string& table, const std::string& operation) {
    store_.execute(std::string("INSERT INTO ") + migrations_table +
                   " (version, table_name, operation, applied_at) VALUES (?, ?, ?, ?)",
                   {static_cast<int64_t>(version_), table, operation, now_ms()});
}

std::vector<migration_record> migration_engine::applied_migrations() {
    ensure_migrations_table();
    std::vector<migration_record> out;
    for (const auto& row : store_.query(std::string("SELECT id, version, table_name, operation, applied_at FROM ") +
                                        migrations_table + " ORDER BY id ASC")) {
        migration_record rec;
        rec.id = field_int(row, "id").value_or(0);
        rec.version = static_cast<int>(field_int(row, "version").value_or(0));
        rec.table_name = field_string(row, "table_name").value_or("");
        rec.operation = field_string(row, "operation").value_or("");
        rec.applied_at = field_int(row, "applied_at").value_or(0);
        out.push_back(std::move(rec));
    }
    return out;
}

} // namespace hearth
