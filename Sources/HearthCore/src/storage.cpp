#include "hearth/storage.hpp"
#include "hearth/log.hpp"

namespace hearth {

storage_adapter::storage_adapter(store_backend& store, const schema_registry& registry)
    : store_(store), registry_(registry) {}

const table_schema& storage_adapter::schema_for(const std::string& table) const {
    return registry_.at(table);
}

void storage_adapter::check_domain_fields(const table_schema& schema, const field_list& fields) const {
    for (const auto& [column, value] : fields) {
        if (is_system_column(column)) {
            throw schema_error("Column " + schema.name + "." + column + " is managed by the storage layer");
        }
    }
    schema.validate(fields);
}

std::string storage_adapter::where_clause(const table_schema& schema, const field_list& where,
                                          std::vector<column_value_t>& params) const {
    schema.validate(where);
    std::string sql = " WHERE deleted = 0";
    for (const auto& [column, value] : where) {
        if (std::holds_alternative<std::nullptr_t>(value)) {
            sql += " AND " + column + " IS NULL";
        } else {
            sql += " AND " + column + " = ?";
            params.push_back(value);
        }
    }
    return sql;
}

bool storage_adapter::row_exists(const std::string& table, const record_id& id) {
    return !store_.query("SELECT id FROM " + table + " WHERE id = ?", {id}).empty();
}

record_id storage_adapter::insert(const std::string& table, const field_list& data) {
    const auto& schema = schema_for(table);
    check_domain_fields(schema, data);

    record_id id = generate_record_id();
    timestamp_ms now = now_ms();

    std::string columns = "id, created_at, updated_at, synced, deleted";
    std::string placeholders = "?, ?, ?, 0, 0";
    std::vector<column_value_t> params{id, now, now};
    for (const auto& [column, value] : data) {
        columns += ", " + column;
        placeholders += ", ?";
        params.push_back(value);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    store_.execute("INSERT INTO " + table + " (" + columns + ") VALUES (" + placeholders + ")", params);
    LOG_DEBUG("storage", "Inserted %s into %s", id.c_str(), table.c_str());
    return id;
}

bool storage_adapter::update(const std::string& table, const record_id& id, const field_list& changes) {
    const auto& schema = schema_for(table);
    check_domain_fields(schema, changes);

    // updated_at strictly increases per row, even within one millisecond
    std::string sql = "UPDATE " + table + " SET updated_at = MAX(?, updated_at + 1), synced = 0";
    std::vector<column_value_t> params{now_ms()};
    for (const auto& [column, value] : changes) {
        sql += ", " + column + " = ?";
        params.push_back(value);
    }
    sql += " WHERE id = ?";
    params.push_back(id);

    std::lock_guard<std::mutex> lock(mutex_);
    store_.execute(sql, params);
    bool updated = store_.changes() > 0;
    if (!updated) {
        LOG_DEBUG("storage", "Update of missing %s.%s ignored", table.c_str(), id.c_str());
    }
    return updated;
}

bool storage_adapter::remove(const std::string& table, const record_id& id) {
    schema_for(table);

    std::lock_guard<std::mutex> lock(mutex_);
    store_.execute("UPDATE " + table + " SET deleted = 1, synced = 0, updated_at = MAX(?, updated_at + 1) WHERE id = ?",
                   {now_ms(), id});
    return store_.changes() > 0;
}

std::optional<record> storage_adapter::find_by_id(const std::string& table, const record_id& id) {
    schema_for(table);

    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = store_.query("SELECT * FROM " + table + " WHERE id = ? AND deleted = 0", {id});
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<record> storage_adapter::find_all(const std::string& table, const query_options& options) {
    const auto& schema = schema_for(table);

    std::vector<column_value_t> params;
    std::string sql = "SELECT * FROM " + table + where_clause(schema, options.where, params);

    std::string order_by = options.order_by.empty() ? std::string(sys::created_at) : options.order_by;
    schema.validate_column(order_by);
    sql += " ORDER BY " + order_by + (options.descending ? " DESC" : " ASC");

    if (options.limit) {
        sql += " LIMIT ?";
        params.push_back(*options.limit);
    }
    if (options.offset) {
        // SQLite needs a LIMIT before OFFSET
        if (!options.limit) sql += " LIMIT -1";
        sql += " OFFSET ?";
        params.push_back(*options.offset);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return store_.query(sql, params);
}

int64_t storage_adapter::count(const std::string& table, const field_list& where) {
    const auto& schema = schema_for(table);

    std::vector<column_value_t> params;
    std::string sql = "SELECT COUNT(*) AS count FROM " + table + where_clause(schema, where, params);

    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = store_.query(sql, params);
    if (rows.empty()) return 0;
    return field_int(rows.front(), "count").value_or(0);
}

std::vector<record> storage_adapter::find_unsynced(const std::string& table) {
    schema_for(table);

    std::lock_guard<std::mutex> lock(mutex_);
    return store_.query("SELECT * FROM " + table + " WHERE synced = 0 ORDER BY updated_at ASC");
}

int64_t storage_adapter::count_unsynced(const std::string& table) {
    schema_for(table);

    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = store_.query("SELECT COUNT(*) AS count FROM " + table + " WHERE synced = 0");
    if (rows.empty()) return 0;
    return field_int(rows.front(), "count").value_or(0);
}

void storage_adapter::mark_as_synced(const std::string& table, const std::vector<record_id>& ids) {
    if (ids.empty()) return;
    schema_for(table);

    std::string placeholders;
    std::vector<column_value_t> params;
    params.reserve(ids.size());
    for (const auto& id : ids) {
        if (!placeholders.empty()) placeholders += ", ";
        placeholders += "?";
        params.push_back(id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    store_.execute("UPDATE " + table + " SET synced = 1 WHERE id IN (" + placeholders + ")", params);
    LOG_DEBUG("storage", "Marked %zu row(s) of %s as synced", ids.size(), table.c_str());
}

size_t storage_adapter::mark_versions_synced(const std::string& table, const std::vector<synced_version>& versions) {
    if (versions.empty()) return 0;
    schema_for(table);

    size_t marked = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& version : versions) {
        // A row edited after it was read for upload keeps synced = 0
        store_.execute("UPDATE " + table + " SET synced = 1 WHERE id = ? AND updated_at = ?",
                       {version.id, version.updated_at});
        if (store_.changes() > 0) {
            ++marked;
        } else {
            LOG_DEBUG("storage", "%s.%s changed during upload, left pending", table.c_str(), version.id.c_str());
        }
    }
    LOG_DEBUG("storage", "Marked %zu of %zu uploaded %s row(s) as synced", marked, versions.size(), table.c_str());
    return marked;
}

std::optional<record> storage_adapter::find_including_deleted(const std::string& table, const record_id& id) {
    schema_for(table);

    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = store_.query("SELECT * FROM " + table + " WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

void storage_adapter::apply_remote(const std::string& table, const record& remote) {
    const auto& schema = schema_for(table);

    auto id = field_string(remote, sys::id);
    if (!id || id->empty()) {
        throw schema_error("Remote row for " + table + " has no id");
    }

    // Declaration order keeps the generated SQL stable
    field_list fields;
    for (const auto& col : schema.columns) {
        if (col.name == sys::id || col.name == sys::synced) continue;
        auto it = remote.find(col.name);
        if (it != remote.end()) {
            fields.emplace_back(col.name, it->second);
        }
    }
    for (const auto& [column, value] : remote) {
        if (!schema.has_column(column)) {
            throw schema_error("Unknown column '" + column + "' in table " + table);
        }
    }
    schema.validate(fields);

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<column_value_t> params;
    if (row_exists(table, *id)) {
        std::string sql = "UPDATE " + table + " SET synced = 1";
        for (const auto& [column, value] : fields) {
            sql += ", " + column + " = ?";
            params.push_back(value);
        }
        sql += " WHERE id = ?";
        params.push_back(*id);
        store_.execute(sql, params);
    } else {
        std::string columns = "id, synced";
        std::string placeholders = "?, 1";
        params.push_back(*id);
        for (const auto& [column, value] : fields) {
            columns += ", " + column;
            placeholders += ", ?";
            params.push_back(value);
        }
        store_.execute("INSERT INTO " + table + " (" + columns + ") VALUES (" + placeholders + ")", params);
    }
}

std::vector<record> storage_adapter::execute_raw(const std::string& sql,
                                                 const std::vector<column_value_t>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.query(sql, params);
}

} // namespace hearth
