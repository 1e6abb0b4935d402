#include "hearth/sync.hpp"
#include "hearth/log.hpp"
#include <algorithm>

namespace hearth {

namespace {

// Clears the in-flight flag however the cycle ends
struct syncing_guard {
    std::atomic<bool>& flag;
    ~syncing_guard() { flag.store(false); }
};

// Pairs each id the remote confirmed with the updated_at that was sent for it
void collect_versions(const std::vector<record>& sent, const std::vector<record_id>& written,
                      std::vector<synced_version>& uploaded) {
    for (const auto& id : written) {
        auto it = std::find_if(sent.begin(), sent.end(), [&](const record& row) {
            return field_string(row, sys::id) == id;
        });
        if (it != sent.end()) {
            uploaded.push_back({id, field_int(*it, sys::updated_at).value_or(0)});
        }
    }
}

} // namespace

sync_engine::sync_engine(storage_adapter& storage, remote_client& remote,
                         sync_config config,
                         std::shared_ptr<scheduler> scheduler)
    : storage_(storage)
    , remote_(remote)
    , config_(config)
    , scheduler_(scheduler ? std::move(scheduler) : std::make_shared<immediate_scheduler>()) {
    if (config_.upload_chunk_size == 0) {
        config_.upload_chunk_size = 1;
    }
}

sync_engine::~sync_engine() {
    stop_auto_sync();
}

sync_status sync_engine::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

void sync_engine::set_on_status_change(on_status_change_handler handler) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    on_status_change_ = std::move(handler);
}

void sync_engine::notify_status_change() {
    on_status_change_handler handler;
    sync_status snapshot;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        handler = on_status_change_;
        snapshot = status_;
    }
    if (handler && scheduler_->can_invoke()) {
        scheduler_->invoke([handler, snapshot] { handler(snapshot); });
    }
}

int64_t sync_engine::count_pending() {
    int64_t pending = 0;
    for (const auto& schema : storage_.registry().tables()) {
        pending += storage_.count_unsynced(schema.name);
    }
    return pending;
}

int64_t sync_engine::update_pending_count() {
    int64_t pending = count_pending();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.pending_count = pending;
    }
    notify_status_change();
    return pending;
}

sync_report sync_engine::sync_once() {
    sync_report report;

    bool expected = false;
    if (!syncing_.compare_exchange_strong(expected, true)) {
        LOG_INFO("sync", "Sync already in progress, skipping");
        return report;
    }
    syncing_guard guard{syncing_};
    report.ran = true;

    timestamp_ms since = 0;
    timestamp_ms cycle_start = now_ms();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.is_syncing = true;
        status_.error.reset();
        if (status_.last_sync) {
            since = *status_.last_sync;
            // The watermark only ever moves forward
            if (cycle_start <= since) cycle_start = since + 1;
        }
    }
    notify_status_change();
    LOG_INFO("sync", "Sync cycle started (since %lld)", static_cast<long long>(since));

    std::optional<std::string> failure;
    try {
        for (const auto& schema : storage_.registry().tables()) {
            upload_table(schema, report);
            download_table(schema, since, report);
        }
    } catch (const std::exception& e) {
        failure = e.what();
        LOG_ERROR("sync", "Sync cycle failed: %s", e.what());
    }

    int64_t pending = 0;
    try {
        pending = count_pending();
    } catch (const std::exception& e) {
        LOG_ERROR("sync", "Failed to count pending records: %s", e.what());
        if (!failure) failure = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.is_syncing = false;
        status_.pending_count = pending;
        if (failure) {
            status_.error = failure;
        } else {
            status_.last_sync = cycle_start;
            status_.error.reset();
        }
    }
    report.succeeded = !failure;
    notify_status_change();

    LOG_INFO("sync", "Sync cycle %s: %zu uploaded, %zu deleted, %zu downloaded, %zu failed",
             report.succeeded ? "completed" : "aborted",
             report.uploaded, report.deleted, report.downloaded, report.failed);
    return report;
}

// ============================================================================
// Upload
// ============================================================================

void sync_engine::upload_chunk(const table_schema& schema, std::vector<record>& chunk,
                               std::vector<synced_version>& uploaded, sync_report& report) {
    if (chunk.empty()) return;

    try {
        auto written = remote_.upsert_batch(schema.name, chunk);
        report.uploaded += written.size();
        if (written.size() < chunk.size()) {
            report.failed += chunk.size() - written.size();
        }
        collect_versions(chunk, written, uploaded);
        chunk.clear();
        return;
    } catch (const std::exception& e) {
        if (chunk.size() == 1) {
            LOG_WARN("sync", "Upload of %s.%s failed: %s", schema.name.c_str(),
                     field_string(chunk.front(), sys::id).value_or("?").c_str(), e.what());
            ++report.failed;
            chunk.clear();
            return;
        }
        LOG_WARN("sync", "Batch upload of %zu %s rows failed, retrying one by one: %s",
                 chunk.size(), schema.name.c_str(), e.what());
    }

    // One bad record must not hold back the rest of the batch
    for (const auto& row : chunk) {
        try {
            std::vector<record> single{row};
            auto written = remote_.upsert_batch(schema.name, single);
            report.uploaded += written.size();
            collect_versions(single, written, uploaded);
        } catch (const std::exception& e) {
            LOG_WARN("sync", "Upload of %s.%s failed: %s", schema.name.c_str(),
                     field_string(row, sys::id).value_or("?").c_str(), e.what());
            ++report.failed;
        }
    }
    chunk.clear();
}

void sync_engine::upload_table(const table_schema& schema, sync_report& report) {
    auto rows = storage_.find_unsynced(schema.name);
    if (rows.empty()) return;
    LOG_DEBUG("sync", "Uploading %zu unsynced %s row(s)", rows.size(), schema.name.c_str());

    std::vector<synced_version> uploaded;
    std::vector<record> chunk;

    for (auto& row : rows) {
        if (!field_bool(row, sys::deleted)) {
            chunk.push_back(std::move(row));
            if (chunk.size() >= config_.upload_chunk_size) {
                upload_chunk(schema, chunk, uploaded, report);
            }
            continue;
        }

        // Keep oldest-first order: pending upserts go out before this tombstone
        upload_chunk(schema, chunk, uploaded, report);

        auto id = field_string(row, sys::id).value_or("");
        try {
            remote_.delete_by_key(schema.name, id);
            uploaded.push_back({id, field_int(row, sys::updated_at).value_or(0)});
            ++report.deleted;
        } catch (const std::exception& e) {
            LOG_WARN("sync", "Remote delete of %s.%s failed: %s", schema.name.c_str(), id.c_str(), e.what());
            ++report.failed;
        }
    }
    upload_chunk(schema, chunk, uploaded, report);

    // Rows edited while the upload was in flight stay pending for the next cycle
    storage_.mark_versions_synced(schema.name, uploaded);
}

// ============================================================================
// Download
// ============================================================================

void sync_engine::download_table(const table_schema& schema, timestamp_ms since, sync_report& report) {
    // A failed fetch is a cycle-level failure
    auto rows = remote_.fetch_modified_since(schema.name, since);
    LOG_DEBUG("sync", "Fetched %zu remote %s row(s)", rows.size(), schema.name.c_str());

    for (auto& remote_row : rows) {
        auto id = field_string(remote_row, sys::id).value_or("");
        try {
            // Columns this build does not know about are dropped
            for (auto it = remote_row.begin(); it != remote_row.end();) {
                if (!schema.has_column(it->first)) {
                    LOG_DEBUG("sync", "Dropping unknown remote column %s.%s",
                              schema.name.c_str(), it->first.c_str());
                    it = remote_row.erase(it);
                } else {
                    ++it;
                }
            }

            auto local = storage_.find_including_deleted(schema.name, id);
            if (!local) {
                storage_.apply_remote(schema.name, remote_row);
                ++report.downloaded;
                continue;
            }

            auto remote_updated = field_int(remote_row, sys::updated_at).value_or(0);
            auto local_updated = field_int(*local, sys::updated_at).value_or(0);
            if (remote_updated > local_updated) {
                storage_.apply_remote(schema.name, remote_row);
                ++report.downloaded;
            } else {
                ++report.skipped;
            }
        } catch (const std::exception& e) {
            LOG_WARN("sync", "Applying remote %s.%s failed: %s", schema.name.c_str(), id.c_str(), e.what());
            ++report.failed;
        }
    }
}

// ============================================================================
// Auto sync
// ============================================================================

void sync_engine::start_auto_sync(std::optional<std::chrono::milliseconds> interval) {
    stop_auto_sync();
    auto period = interval.value_or(config_.auto_sync_interval);

    sync_once();
    auto_sync_.start(period, [this] { sync_once(); });
    LOG_INFO("sync", "Auto sync every %lld ms", static_cast<long long>(period.count()));
}

void sync_engine::stop_auto_sync() {
    bool was_running = auto_sync_.is_running();
    // Joins a worker left behind by a stop from inside a tick as well
    auto_sync_.stop();
    if (was_running) {
        LOG_INFO("sync", "Auto sync stopped");
    }
}

} // namespace hearth
