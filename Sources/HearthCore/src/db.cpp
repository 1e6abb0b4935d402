#include "hearth/db.hpp"
#include "hearth/log.hpp"
#include <cstring>
#include <set>

namespace hearth {

namespace {

[[noreturn]] void throw_sqlite(int rc, const std::string& error, const std::string& sql) {
    LOG_ERROR("db", "%s (SQL: %s)", error.c_str(), sql.c_str());
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw constraint_error("Constraint failed: " + error);
    }
    throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
}

} // namespace

database::database(const std::string& path, journal_mode journal) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    sqlite3_extended_result_codes(db_, 1);
    execute_script("PRAGMA foreign_keys = ON");

    switch (journal) {
        case journal_mode::wal:
            // In-memory databases silently stay on MEMORY
            execute_script("PRAGMA journal_mode = WAL");
            break;
        case journal_mode::remove:
            execute_script("PRAGMA journal_mode = DELETE");
            execute_script("PRAGMA synchronous = NORMAL");
            break;
        case journal_mode::memory:
            execute_script("PRAGMA journal_mode = MEMORY");
            break;
    }
    execute_script("PRAGMA temp_store = MEMORY");

    // Busy timeout for lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    close();
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

void database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void database::raise(const std::string& what, const std::string& sql) {
    int rc = db_ ? sqlite3_extended_errcode(db_) : SQLITE_MISUSE;
    std::string error = db_ ? sqlite3_errmsg(db_) : "database is closed";
    throw_sqlite(rc, what + ": " + error, sql);
}

void database::execute_script(const std::string& sql) {
    if (!db_) raise("Execution failed", sql);
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw_sqlite(sqlite3_extended_errcode(db_), error, sql);
    }
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        execute_script(sql);
        return;
    }
    if (!db_) raise("Execution failed", sql);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        raise("Failed to prepare statement", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        int code = sqlite3_extended_errcode(db_);
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw_sqlite(code, error, sql);
    }
    sqlite3_finalize(stmt);
}

std::vector<record> database::query(const std::string& sql,
                                    const std::vector<column_value_t>& params) {
    if (!db_) raise("Query failed", sql);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        raise("Failed to prepare query", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<record> results;
    int col_count = sqlite3_column_count(stmt);

    // Rows are keyed by column name, so every name must be distinct
    std::set<std::string> names;
    for (int i = 0; i < col_count; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        if (!names.insert(name ? name : "").second) {
            sqlite3_finalize(stmt);
            std::string error = std::string("Duplicate result column name: ") + (name ? name : "");
            LOG_ERROR("db", "%s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error(error + "; alias the columns (SQL: " + sql + ")");
        }
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        record row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        int code = sqlite3_extended_errcode(db_);
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw_sqlite(code, error, sql);
    }
    sqlite3_finalize(stmt);

    return results;
}

int database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 while a transaction is active
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

std::vector<uint8_t> database::serialize() {
    if (!db_) raise("Serialize failed", "");
    sqlite3_int64 size = 0;
    unsigned char* data = sqlite3_serialize(db_, "main", &size, 0);
    if (!data) {
        if (size == 0) return {};
        raise("Serialize failed", "");
    }
    std::vector<uint8_t> image(data, data + size);
    sqlite3_free(data);
    return image;
}

void database::deserialize(const std::vector<uint8_t>& image) {
    if (!db_) raise("Deserialize failed", "");
    auto size = static_cast<sqlite3_int64>(image.size());
    auto* buffer = static_cast<unsigned char*>(sqlite3_malloc64(static_cast<sqlite3_uint64>(size)));
    if (!buffer) {
        throw db_error("Deserialize failed: out of memory");
    }
    std::memcpy(buffer, image.data(), image.size());

    // SQLite owns the buffer from here on, including on failure
    int rc = sqlite3_deserialize(db_, "main", buffer, size, size,
                                 SQLITE_DESERIALIZE_FREEONCLOSE | SQLITE_DESERIALIZE_RESIZEABLE);
    if (rc != SQLITE_OK) {
        raise("Deserialize failed", "");
    }
}

} // namespace hearth
