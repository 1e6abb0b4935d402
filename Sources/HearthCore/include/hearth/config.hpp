#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace hearth {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

enum class backend_kind {
    native,    ///< SQLite file (or :memory:) with a WAL journal
    mobile,    ///< SQLite file under an app data directory, DELETE journal
    embedded   ///< in-memory SQLite persisted as a whole-image snapshot
};

/// Throws config_error for anything other than "native", "mobile" or "embedded".
backend_kind parse_backend_kind(const std::string& name);
const char* backend_kind_name(backend_kind kind);

// ============================================================================
// configuration - everything a data_layer needs to open itself
// ============================================================================

struct configuration {
    backend_kind backend = backend_kind::native;

    /// native: database file (or ":memory:"); mobile: data directory;
    /// embedded: snapshot directory (empty keeps snapshots in memory only).
    std::string path = ":memory:";
    std::string database_name = "app.db";

    // Remote service. Sync is enabled iff both are set.
    std::string remote_url;
    std::string remote_key;

    int schema_version = 1;

    std::chrono::milliseconds auto_sync_interval{std::chrono::minutes(5)};
    std::chrono::milliseconds snapshot_interval{std::chrono::seconds(5)};
    size_t upload_chunk_size = 500;

    log_level logging = log_level::off;

    bool sync_enabled() const { return !remote_url.empty() && !remote_key.empty(); }

    /// Parses a JSON object with the same keys as the members above
    /// (intervals in milliseconds, log_level by name). Missing keys keep
    /// their defaults.
    static configuration from_json(const std::string& text);
    static configuration from_file(const std::string& file_path);
};

} // namespace hearth

#endif // __cplusplus
