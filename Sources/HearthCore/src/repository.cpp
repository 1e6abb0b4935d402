#include "hearth/repository.hpp"

namespace hearth {

repository::repository(storage_adapter& storage, std::string table)
    : storage_(storage), table_(std::move(table)) {
    // Fail at construction, not on first use
    storage_.registry().at(table_);
}

record_id repository::create(const field_list& data) {
    return storage_.insert(table_, data);
}

bool repository::update(const record_id& id, const field_list& changes) {
    return storage_.update(table_, id, changes);
}

bool repository::remove(const record_id& id) {
    return storage_.remove(table_, id);
}

std::optional<record> repository::find_by_id(const record_id& id) {
    return storage_.find_by_id(table_, id);
}

std::vector<record> repository::find_all(const query_options& options) {
    return storage_.find_all(table_, options);
}

int64_t repository::count(const field_list& where) {
    return storage_.count(table_, where);
}

std::vector<record> repository::query(const std::string& sql, const std::vector<column_value_t>& params) {
    return storage_.execute_raw(sql, params);
}

} // namespace hearth
