#pragma once

#ifdef __cplusplus

#include "remote.hpp"
#include "scheduler.hpp"
#include "storage.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

namespace hearth {

struct sync_config {
    size_t upload_chunk_size = 500;  // Max upserts per remote call
    std::chrono::milliseconds auto_sync_interval{std::chrono::minutes(5)};
};

/// Snapshot of the sync engine's state as seen by observers.
struct sync_status {
    std::optional<timestamp_ms> last_sync;  ///< start of the last successful cycle
    int64_t pending_count = 0;
    bool is_syncing = false;
    std::optional<std::string> error;       ///< failure of the latest cycle, cleared when a cycle starts
};

/// What one call to sync_once() did.
struct sync_report {
    bool ran = false;        ///< false when another cycle was already in flight
    bool succeeded = false;
    size_t uploaded = 0;     ///< upserts confirmed by the remote service
    size_t deleted = 0;      ///< tombstones confirmed by the remote service
    size_t downloaded = 0;   ///< remote rows written locally
    size_t skipped = 0;      ///< remote rows not newer than the local copy
    size_t failed = 0;       ///< records left for the next cycle
};

// ============================================================================
// sync_engine - upload-then-download, last-write-wins by updated_at
// ============================================================================
//
// Tables are processed one at a time in registry order. Per-record failures
// are logged and left pending; anything else ends the cycle, is recorded in
// the status and leaves the watermark where it was. Cycles never overlap: a
// trigger arriving while a cycle runs is rejected.

class sync_engine {
public:
    using on_status_change_handler = std::function<void(const sync_status&)>;

    sync_engine(storage_adapter& storage, remote_client& remote,
                sync_config config = {},
                std::shared_ptr<scheduler> scheduler = nullptr);
    ~sync_engine();

    // Non-copyable, non-moveable
    sync_engine(const sync_engine&) = delete;
    sync_engine& operator=(const sync_engine&) = delete;
    sync_engine(sync_engine&&) = delete;
    sync_engine& operator=(sync_engine&&) = delete;

    /// Runs one full cycle on the calling thread.
    sync_report sync_once();

    /// Runs a cycle now, then every `interval` (config default when omitted).
    void start_auto_sync(std::optional<std::chrono::milliseconds> interval = std::nullopt);

    /// Cancels future ticks. Waits for an in-flight cycle to finish, except
    /// when called from that cycle (a status callback); the destructor then waits.
    void stop_auto_sync();
    bool is_auto_syncing() const { return auto_sync_.is_running(); }

    /// Recounts unsynced rows across every table.
    int64_t update_pending_count();

    sync_status status() const;

    void set_on_status_change(on_status_change_handler handler);

private:
    void upload_table(const table_schema& schema, sync_report& report);
    void upload_chunk(const table_schema& schema, std::vector<record>& chunk,
                      std::vector<synced_version>& uploaded, sync_report& report);
    void download_table(const table_schema& schema, timestamp_ms since, sync_report& report);
    int64_t count_pending();
    void notify_status_change();

    storage_adapter& storage_;
    remote_client& remote_;
    sync_config config_;
    std::shared_ptr<scheduler> scheduler_;

    std::atomic<bool> syncing_{false};
    mutable std::mutex status_mutex_;
    sync_status status_;
    on_status_change_handler on_status_change_;

    periodic_task auto_sync_;
};

} // namespace hearth

#endif // __cplusplus
