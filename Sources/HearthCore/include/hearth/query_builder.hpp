#pragma once

#ifdef __cplusplus

#include "storage.hpp"

namespace hearth {

enum class join_type { inner, left, right, cross };

struct join_clause {
    join_type type = join_type::inner;
    std::string table;
    std::string on;      ///< empty for CROSS joins
    std::string alias;
};

struct join_spec {
    std::vector<std::string> select;
    std::string from;
    std::vector<join_clause> joins;
    std::string where;
    std::vector<std::string> group_by;
    std::string order_by;
    std::optional<int64_t> limit;
    std::vector<column_value_t> params;  ///< bound to '?' in where, in order
};

struct aggregate_spec {
    std::string table;
    std::vector<std::pair<std::string, std::string>> aggregates;  ///< alias, SQL expression
    std::string where;
    std::vector<std::string> group_by;
    std::vector<column_value_t> params;
};

// ============================================================================
// query_builder - composes SELECTs for reports and runs them raw
// ============================================================================
//
// Expressions are SQL fragments supplied by application code, not user
// input; values belong in params. Results come from execute_raw and so
// include soft-deleted rows unless the where clause excludes them. Joined
// tables share the system column names, so a join needs an explicit select
// list with aliases for any repeated name; SELECT * across them raises
// db_error.

class query_builder {
public:
    explicit query_builder(storage_adapter& storage) : storage_(storage) {}

    std::vector<record> join(const join_spec& spec);
    std::vector<record> aggregate(const aggregate_spec& spec);

    static std::string join_sql(const join_spec& spec);
    static std::string aggregate_sql(const aggregate_spec& spec);

private:
    storage_adapter& storage_;
};

} // namespace hearth

#endif // __cplusplus
