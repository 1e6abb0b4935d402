#pragma once

#ifdef __cplusplus

#include "network.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace hearth {

// ============================================================================
// Wire codec
// ============================================================================
//
// Locally every timestamp is epoch milliseconds; the remote service stores
// them as ISO-8601 UTC text. Timestamp fields are recognized by name: the
// fixed set created_at, updated_at, started_at, completed_at plus any name
// ending in _at or _time. DATE columns (e.g. last_streak_date) are plain
// YYYY-MM-DD text on both sides and never converted.

/// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string to_iso8601(timestamp_ms ms);

/// Accepts a 'T' or ' ' separator, optional fractional seconds (any
/// precision, truncated to ms) and a Z or +HH[:MM] / -HH[:MM] offset.
/// Throws remote_error on anything else.
timestamp_ms parse_iso8601(const std::string& text);

bool is_timestamp_field(const std::string& name);

/// Local row -> remote JSON object. Drops synced.
nlohmann::json to_remote(const table_schema& schema, const record& row);

/// Remote JSON object -> local row with synced = 1. Columns the local schema
/// does not declare are dropped.
record from_remote(const table_schema& schema, const nlohmann::json& row);

// ============================================================================
// remote_client - what the sync engine needs from the remote service
// ============================================================================
//
// Records crossing this interface are in local shape (epoch milliseconds).

class remote_client {
public:
    virtual ~remote_client() = default;

    /// Insert-or-replace keyed by id. Returns the ids actually written.
    virtual std::vector<record_id> upsert_batch(const std::string& table,
                                                const std::vector<record>& rows) = 0;

    virtual void delete_by_key(const std::string& table, const record_id& id) = 0;

    /// Rows with updated_at >= since, oldest first.
    virtual std::vector<record> fetch_modified_since(const std::string& table, timestamp_ms since) = 0;
};

// ============================================================================
// PostgREST client
// ============================================================================

class rest_remote_client : public remote_client {
public:
    rest_remote_client(std::string base_url,
                       std::string api_key,
                       std::shared_ptr<http_client> http,
                       const schema_registry& registry);

    std::vector<record_id> upsert_batch(const std::string& table,
                                        const std::vector<record>& rows) override;
    void delete_by_key(const std::string& table, const record_id& id) override;
    std::vector<record> fetch_modified_since(const std::string& table, timestamp_ms since) override;

private:
    http_request make_request(const std::string& method, const std::string& url) const;
    http_response send_checked(const http_request& request) const;
    std::string table_url(const std::string& table) const;

    std::string base_url_;
    std::string api_key_;
    std::shared_ptr<http_client> http_;
    const schema_registry& registry_;
};

/// Percent-encodes everything except unreserved characters.
std::string url_encode(const std::string& value);

// ============================================================================
// In-memory remote service for testing
// ============================================================================
//
// Keeps rows per table in local shape. Failures can be injected per id,
// per table, or for every fetch.

class memory_remote_client : public remote_client {
public:
    std::vector<record_id> upsert_batch(const std::string& table,
                                        const std::vector<record>& rows) override;
    void delete_by_key(const std::string& table, const record_id& id) override;
    std::vector<record> fetch_modified_since(const std::string& table, timestamp_ms since) override;

    // Test helpers
    void put(const std::string& table, record row);
    std::optional<record> get(const std::string& table, const record_id& id) const;
    size_t size(const std::string& table) const;

    void fail_id(const record_id& id) { std::lock_guard<std::mutex> lock(mutex_); failing_ids_.insert(id); }
    void fail_table(const std::string& table) { std::lock_guard<std::mutex> lock(mutex_); failing_tables_.insert(table); }
    void set_fetch_failure(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_fetch_ = fail; }
    void clear_failures();

    size_t upsert_calls() const { std::lock_guard<std::mutex> lock(mutex_); return upsert_calls_; }
    size_t delete_calls() const { std::lock_guard<std::mutex> lock(mutex_); return delete_calls_; }
    size_t fetch_calls() const { std::lock_guard<std::mutex> lock(mutex_); return fetch_calls_; }

    /// Every id ever written by upsert_batch, in order.
    std::vector<record_id> upserted_ids() const { std::lock_guard<std::mutex> lock(mutex_); return upserted_ids_; }

    /// `since` of each fetch, in order.
    std::vector<timestamp_ms> fetch_watermarks() const { std::lock_guard<std::mutex> lock(mutex_); return fetch_watermarks_; }

private:
    void check_failure(const std::string& table, const record_id& id) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::map<record_id, record>> tables_;
    std::set<record_id> failing_ids_;
    std::set<std::string> failing_tables_;
    bool fail_fetch_ = false;
    size_t upsert_calls_ = 0;
    size_t delete_calls_ = 0;
    size_t fetch_calls_ = 0;
    std::vector<record_id> upserted_ids_;
    std::vector<timestamp_ms> fetch_watermarks_;
};

} // namespace hearth

#endif // __cplusplus
