#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include "store.hpp"

namespace hearth {

/// Name of the append-only structural change log.
inline constexpr const char* migrations_table = "_migrations";

struct migration_record {
    int64_t id = 0;
    int version = 0;
    std::string table_name;
    std::string operation;   ///< CREATE_TABLE, ADD_COLUMN:<name>, CREATE_INDEX:<name>
    timestamp_ms applied_at = 0;
};

// SQL builders, exposed for tests and ad-hoc tooling
std::string column_definition_sql(const column_def& col);
std::string added_column_definition_sql(const column_def& col);
std::string create_table_sql(const table_schema& schema);
std::string create_index_sql(const std::string& table, const index_def& index);
std::string default_literal_sql(const column_value_t& value);

// ============================================================================
// migration_engine - converges a live store toward the schema registry
// ============================================================================
//
// Only additive operations are ever issued: CREATE TABLE, ALTER TABLE ADD
// COLUMN, CREATE INDEX IF NOT EXISTS. Each applied operation appends one row
// to _migrations. Running it again against a converged store applies nothing.

class migration_engine {
public:
    migration_engine(store_backend& store, const schema_registry& registry, int version = 1);

    /// Returns the number of structural operations applied by this call.
    size_t apply_migrations();

    /// Full migration log, oldest first.
    std::vector<migration_record> applied_migrations();

private:
    void ensure_migrations_table();
    size_t migrate_table(const table_schema& schema);
    std::vector<std::string> existing_columns(const std::string& table);
    bool table_exists(const std::string& table);
    bool index_exists(const std::string& index);
    void record_migration(const std::string& table, const std::string& operation);

    store_backend& store_;
    const schema_registry& registry_;
    int version_;
};

} // namespace hearth

#endif // __cplusplus
