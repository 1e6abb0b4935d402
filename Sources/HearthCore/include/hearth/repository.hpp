#pragma once

#ifdef __cplusplus

#include "record.hpp"
#include "storage.hpp"

namespace hearth {

// ============================================================================
// repository - CRUD bound to one table
// ============================================================================

class repository {
public:
    repository(storage_adapter& storage, std::string table);

    record_id create(const field_list& data);
    bool update(const record_id& id, const field_list& changes);
    bool remove(const record_id& id);
    std::optional<record> find_by_id(const record_id& id);
    std::vector<record> find_all(const query_options& options = {});
    int64_t count(const field_list& where = {});

    /// Raw SQL through the storage adapter (sees deleted rows).
    std::vector<record> query(const std::string& sql, const std::vector<column_value_t>& params = {});

    const std::string& table() const { return table_; }

private:
    storage_adapter& storage_;
    std::string table_;
};

// ============================================================================
// typed_repository<T> - the same operations in terms of a HEARTH_RECORD type
// ============================================================================

template<typename T>
class typed_repository {
public:
    using traits = record_traits<T>;

    explicit typed_repository(storage_adapter& storage)
        : repo_(storage, traits::table_name) {}

    /// Inserts the domain fields of `obj`; system fields are generated.
    record_id create(const T& obj) {
        return repo_.create(traits::to_fields(obj));
    }

    /// Writes every domain field of `obj` to the row `obj.id`.
    bool save(const T& obj) {
        return repo_.update(obj.id, traits::to_fields(obj));
    }

    /// Writes only the given fields.
    bool update(const record_id& id, const field_list& changes) {
        return repo_.update(id, changes);
    }

    bool remove(const record_id& id) {
        return repo_.remove(id);
    }

    std::optional<T> find_by_id(const record_id& id) {
        auto row = repo_.find_by_id(id);
        if (!row) return std::nullopt;
        return traits::from_record(*row);
    }

    std::vector<T> find_all(const query_options& options = {}) {
        std::vector<T> out;
        for (const auto& row : repo_.find_all(options)) {
            out.push_back(traits::from_record(row));
        }
        return out;
    }

    int64_t count(const field_list& where = {}) {
        return repo_.count(where);
    }

    repository& untyped() { return repo_; }

private:
    repository repo_;
};

} // namespace hearth

#endif // __cplusplus
