#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "migration.hpp"
#include "models.hpp"
#include "query_builder.hpp"
#include "remote.hpp"
#include "repository.hpp"
#include "storage.hpp"
#include "store.hpp"
#include "sync.hpp"

namespace hearth {

/// Collaborators a data_layer builds for itself unless given.
struct data_layer_deps {
    const schema_registry* registry = nullptr;     // default_registry()
    std::shared_ptr<snapshot_store> snapshots;     // derived from configuration::path
    std::shared_ptr<http_client> http;             // curl_http_client
    std::shared_ptr<remote_client> remote;         // rest_remote_client over `http`
    std::shared_ptr<hearth::scheduler> scheduler;  // immediate_scheduler
};

// ============================================================================
// data_layer - one opened, migrated store plus its optional sync engine
// ============================================================================
//
//   hearth::configuration config;
//   config.backend = hearth::backend_kind::native;
//   config.path = "app.db";
//   hearth::data_layer db(config);
//   auto sessions = db.repository_of<hearth::pomodoro_session>();
//
// The constructor opens the configured backend and applies migrations.
// Sync is available only when remote_url and remote_key are both set;
// otherwise sync() and start_auto_sync() throw config_error.

class data_layer {
public:
    explicit data_layer(configuration config, data_layer_deps deps = {});
    ~data_layer();

    // Non-copyable, non-moveable
    data_layer(const data_layer&) = delete;
    data_layer& operator=(const data_layer&) = delete;
    data_layer(data_layer&&) = delete;
    data_layer& operator=(data_layer&&) = delete;

    storage_adapter& storage() { return *storage_; }
    store_backend& store() { return *store_; }
    const schema_registry& registry() const { return registry_; }
    const configuration& config() const { return config_; }

    repository repository_for(const std::string& table) { return repository(*storage_, table); }

    template<typename T>
    typed_repository<T> repository_of() { return typed_repository<T>(*storage_); }

    query_builder queries() { return query_builder(*storage_); }

    std::vector<record> execute_raw(const std::string& sql,
                                    const std::vector<column_value_t>& params = {}) {
        return storage_->execute_raw(sql, params);
    }

    /// Structural operations applied when this instance opened the store.
    size_t migrations_applied() const { return migrations_applied_; }

    // Sync
    bool sync_enabled() const { return sync_ != nullptr; }
    sync_report sync();
    void start_auto_sync(std::optional<std::chrono::milliseconds> interval = std::nullopt);
    void stop_auto_sync();
    int64_t update_pending_count();
    void set_on_sync_status_change(sync_engine::on_status_change_handler handler);

    /// Empty when sync is not configured.
    std::optional<sync_status> status() const;

    /// Stops periodic work, writes a final snapshot (embedded) and closes the store.
    void close();

private:
    sync_engine& require_sync();

    configuration config_;
    const schema_registry& registry_;
    std::unique_ptr<store_backend> store_;
    std::unique_ptr<storage_adapter> storage_;
    std::shared_ptr<http_client> http_;
    std::shared_ptr<remote_client> remote_;
    std::unique_ptr<sync_engine> sync_;
    size_t migrations_applied_ = 0;
    bool closed_ = false;
};

} // namespace hearth

#endif // __cplusplus
