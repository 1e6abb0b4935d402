#include "hearth/query_builder.hpp"

namespace hearth {

namespace {

const char* join_keyword(join_type type) {
    switch (type) {
        case join_type::inner: return "INNER JOIN";
        case join_type::left: return "LEFT JOIN";
        case join_type::right: return "RIGHT JOIN";
        case join_type::cross: return "CROSS JOIN";
    }
    return "INNER JOIN";
}

std::string join_list(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

} // namespace

std::string query_builder::join_sql(const join_spec& spec) {
    if (spec.from.empty()) {
        throw schema_error("join query needs a FROM table");
    }
    std::string sql = "SELECT " + (spec.select.empty() ? std::string("*") : join_list(spec.select)) +
                      " FROM " + spec.from;

    for (const auto& join : spec.joins) {
        sql += std::string(" ") + join_keyword(join.type) + " " + join.table;
        if (!join.alias.empty()) sql += " AS " + join.alias;
        if (!join.on.empty()) sql += " ON " + join.on;
    }
    if (!spec.where.empty()) sql += " WHERE " + spec.where;
    if (!spec.group_by.empty()) sql += " GROUP BY " + join_list(spec.group_by);
    if (!spec.order_by.empty()) sql += " ORDER BY " + spec.order_by;
    if (spec.limit) sql += " LIMIT " + std::to_string(*spec.limit);
    return sql;
}

std::string query_builder::aggregate_sql(const aggregate_spec& spec) {
    if (spec.table.empty() || spec.aggregates.empty()) {
        throw schema_error("aggregate query needs a table and at least one aggregate");
    }
    std::vector<std::string> select;
    for (const auto& [alias, expr] : spec.aggregates) {
        select.push_back(expr + " AS " + alias);
    }
    std::string sql = "SELECT " + join_list(select) + " FROM " + spec.table;
    if (!spec.where.empty()) sql += " WHERE " + spec.where;
    if (!spec.group_by.empty()) sql += " GROUP BY " + join_list(spec.group_by);
    return sql;
}

std::vector<record> query_builder::join(const join_spec& spec) {
    return storage_.execute_raw(join_sql(spec), spec.params);
}

std::vector<record> query_builder::aggregate(const aggregate_spec& spec) {
    return storage_.execute_raw(aggregate_sql(spec), spec.params);
}

} // namespace hearth
