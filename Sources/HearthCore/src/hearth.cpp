#include "hearth/hearth.hpp"
#include "hearth/log.hpp"

namespace hearth {

// Single global log level
std::atomic<log_level> g_log_level{log_level::off};

log_level parse_log_level(const std::string& name) {
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    return log_level::off;
}

data_layer::data_layer(configuration config, data_layer_deps deps)
    : config_(std::move(config))
    , registry_(deps.registry ? *deps.registry : default_registry()) {
    if (config_.logging != log_level::off) {
        set_log_level(config_.logging);
    }

    store_ = make_store(config_, deps.snapshots);
    storage_ = std::make_unique<storage_adapter>(*store_, registry_);

    migration_engine migrations(*store_, registry_, config_.schema_version);
    migrations_applied_ = migrations.apply_migrations();

    if (config_.sync_enabled()) {
        remote_ = deps.remote;
        if (!remote_) {
            http_ = deps.http ? deps.http : std::make_shared<curl_http_client>();
            remote_ = std::make_shared<rest_remote_client>(config_.remote_url, config_.remote_key,
                                                           http_, registry_);
        }
        sync_config sc;
        sc.upload_chunk_size = config_.upload_chunk_size;
        sc.auto_sync_interval = config_.auto_sync_interval;
        sync_ = std::make_unique<sync_engine>(*storage_, *remote_, sc, deps.scheduler);
        LOG_INFO("hearth", "Sync configured for %s", config_.remote_url.c_str());
    } else {
        LOG_INFO("hearth", "Sync not configured, running local-only");
    }

    LOG_INFO("hearth", "Data layer ready (%s backend, %zu migration(s) applied)",
             backend_kind_name(config_.backend), migrations_applied_);
}

data_layer::~data_layer() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("hearth", "Close failed: %s", e.what());
    }
}

sync_engine& data_layer::require_sync() {
    if (!sync_) {
        throw config_error("Sync not configured: remote_url and remote_key are required");
    }
    return *sync_;
}

sync_report data_layer::sync() {
    return require_sync().sync_once();
}

void data_layer::start_auto_sync(std::optional<std::chrono::milliseconds> interval) {
    require_sync().start_auto_sync(interval);
}

void data_layer::stop_auto_sync() {
    if (sync_) sync_->stop_auto_sync();
}

int64_t data_layer::update_pending_count() {
    return require_sync().update_pending_count();
}

void data_layer::set_on_sync_status_change(sync_engine::on_status_change_handler handler) {
    require_sync().set_on_status_change(std::move(handler));
}

std::optional<sync_status> data_layer::status() const {
    if (!sync_) return std::nullopt;
    return sync_->status();
}

void data_layer::close() {
    if (closed_) return;
    closed_ = true;
    stop_auto_sync();
    store_->close();
    LOG_INFO("hearth", "Data layer closed");
}

} // namespace hearth
