#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace hearth {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Unique, not-null, primary key or check violation reported by SQLite.
class constraint_error : public db_error {
public:
    explicit constraint_error(const std::string& msg) : db_error(msg) {}
};

// ============================================================================
// database - one owned sqlite3 connection
// ============================================================================

class database {
public:
    enum class journal_mode {
        wal,     ///< desktop files
        remove,  ///< DELETE journal (mobile, in-memory)
        memory   ///< in-memory image, journal kept in RAM
    };

    explicit database(const std::string& path, journal_mode journal = journal_mode::wal);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Execute SQL with optional params (no result rows)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Runs one or more ';'-separated statements without parameters.
    void execute_script(const std::string& sql);

    // Query - returns rows as column maps. Result column names must be
    // distinct; a duplicate raises db_error.
    std::vector<record> query(const std::string& sql,
                              const std::vector<column_value_t>& params = {});

    /// Rows modified by the most recent INSERT/UPDATE/DELETE.
    int changes() const;

    /// True while a BEGIN ... COMMIT block is open on this connection.
    bool is_in_transaction() const;

    /// Whole-database image of the "main" schema (sqlite3_serialize).
    std::vector<uint8_t> serialize();

    /// Replaces the "main" schema with the given image (sqlite3_deserialize).
    void deserialize(const std::vector<uint8_t>& image);

    void close();
    bool is_open() const { return db_ != nullptr; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    [[noreturn]] void raise(const std::string& what, const std::string& sql);
};

} // namespace hearth

#endif // __cplusplus
