#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include "store.hpp"
#include <mutex>

namespace hearth {

struct query_options {
    field_list where;            ///< equality filters, NULL values match IS NULL
    std::string order_by;        ///< defaults to created_at
    bool descending = true;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

/// A row as it was read for upload.
struct synced_version {
    record_id id;
    timestamp_ms updated_at = 0;
};

// ============================================================================
// storage_adapter - uniform record lifecycle over any store_backend
// ============================================================================
//
// Every write stamps the system columns: insert generates id, created_at and
// updated_at; every mutation sets updated_at = now (or one past its previous
// value, whichever is later) and synced = false. Delete
// is soft. Application read paths never see deleted rows; find_unsynced,
// find_including_deleted and execute_raw do.
//
// Domain data is checked against the registry before it reaches SQL: unknown
// tables, unknown columns and values of the wrong type raise schema_error.

class storage_adapter {
public:
    storage_adapter(store_backend& store, const schema_registry& registry);

    // Non-copyable
    storage_adapter(const storage_adapter&) = delete;
    storage_adapter& operator=(const storage_adapter&) = delete;

    record_id insert(const std::string& table, const field_list& data);

    /// Returns false (and changes nothing) when no row has that id.
    bool update(const std::string& table, const record_id& id, const field_list& changes);

    /// Soft delete. Returns false when no row has that id.
    bool remove(const std::string& table, const record_id& id);

    std::optional<record> find_by_id(const std::string& table, const record_id& id);
    std::vector<record> find_all(const std::string& table, const query_options& options = {});
    int64_t count(const std::string& table, const field_list& where = {});

    // Sync support
    /// synced = false rows, tombstones included, oldest updated_at first.
    std::vector<record> find_unsynced(const std::string& table);
    int64_t count_unsynced(const std::string& table);
    void mark_as_synced(const std::string& table, const std::vector<record_id>& ids);

    /// Marks each row synced only if its updated_at still equals the value
    /// that was uploaded. Returns the number of rows marked.
    size_t mark_versions_synced(const std::string& table, const std::vector<synced_version>& versions);
    std::optional<record> find_including_deleted(const std::string& table, const record_id& id);

    /// Writes a row received from the remote service verbatim (timestamps and
    /// deleted flag included) with synced = true. Inserts when the id is new,
    /// overwrites otherwise. Columns must already be known to the schema.
    void apply_remote(const std::string& table, const record& remote);

    /// Arbitrary SQL. Returns rows, deleted ones included.
    std::vector<record> execute_raw(const std::string& sql,
                                    const std::vector<column_value_t>& params = {});

    const schema_registry& registry() const { return registry_; }
    store_backend& store() { return store_; }

private:
    const table_schema& schema_for(const std::string& table) const;
    void check_domain_fields(const table_schema& schema, const field_list& fields) const;
    std::string where_clause(const table_schema& schema, const field_list& where,
                             std::vector<column_value_t>& params) const;
    bool row_exists(const std::string& table, const record_id& id);

    store_backend& store_;
    const schema_registry& registry_;
    std::mutex mutex_;
};

} // namespace hearth

#endif // __cplusplus
