#include "hearth/store.hpp"
#include "hearth/log.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace hearth {

namespace fs = std::filesystem;

// ============================================================================
// file_snapshot_store
// ============================================================================

file_snapshot_store::file_snapshot_store(std::string directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw db_error("Cannot create snapshot directory " + directory_ + ": " + ec.message());
    }
}

std::string file_snapshot_store::file_for(const std::string& key) const {
    return (fs::path(directory_) / (key + ".bin")).string();
}

std::optional<std::vector<uint8_t>> file_snapshot_store::load(const std::string& key) {
    const std::string file = file_for(key);
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::vector<uint8_t> image((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw db_error("Failed to read snapshot " + file);
    }
    return image;
}

void file_snapshot_store::save(const std::string& key, const std::vector<uint8_t>& image) {
    const std::string file = file_for(key);
    const std::string temp = file + ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw db_error("Cannot open snapshot file " + temp);
        }
        out.write(reinterpret_cast<const char*>(image.data()),
                  static_cast<std::streamsize>(image.size()));
        out.flush();
        if (!out) {
            throw db_error("Failed to write snapshot " + temp);
        }
    }

    // Readers see either the previous image or the new one, never a torn write
    std::error_code ec;
    fs::rename(temp, file, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw db_error("Failed to replace snapshot " + file);
    }
}

void file_snapshot_store::remove(const std::string& key) {
    std::error_code ec;
    fs::remove(file_for(key), ec);
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(store_backend& store) : store_(store) {
    store_.execute("BEGIN IMMEDIATE");
}

transaction::~transaction() {
    if (!completed_) {
        try {
            store_.execute("ROLLBACK");
        } catch (const db_error& e) {
            LOG_WARN("store", "Rollback in destructor failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    store_.execute("COMMIT");
    completed_ = true;
}

void transaction::rollback() {
    store_.execute("ROLLBACK");
    completed_ = true;
}

// ============================================================================
// native_store
// ============================================================================

native_store::native_store(const std::string& path)
    : db_(path, database::journal_mode::wal) {
    LOG_INFO("store", "Opened native store at %s", path.c_str());
}

void native_store::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    db_.execute(sql, params);
}

std::vector<record> native_store::query(const std::string& sql, const std::vector<column_value_t>& params) {
    return db_.query(sql, params);
}

// ============================================================================
// mobile_store
// ============================================================================

namespace {

std::string mobile_database_path(const std::string& data_directory, const std::string& database_name) {
    if (database_name.empty()) {
        throw config_error("Mobile backend requires a database name");
    }
    std::error_code ec;
    fs::create_directories(data_directory, ec);
    if (ec) {
        throw db_error("Cannot create data directory " + data_directory + ": " + ec.message());
    }
    return (fs::path(data_directory) / database_name).string();
}

} // namespace

mobile_store::mobile_store(const std::string& data_directory, const std::string& database_name)
    : db_(mobile_database_path(data_directory, database_name), database::journal_mode::remove) {
    LOG_INFO("store", "Opened mobile store at %s", db_.path().c_str());
}

void mobile_store::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        db_.execute_script(sql);
    } else {
        db_.execute(sql, params);
    }
}

std::vector<record> mobile_store::query(const std::string& sql, const std::vector<column_value_t>& params) {
    return db_.query(sql, params);
}

// ============================================================================
// embedded_store
// ============================================================================

embedded_store::embedded_store(std::shared_ptr<snapshot_store> snapshots,
                               std::chrono::milliseconds snapshot_interval)
    : db_(":memory:", database::journal_mode::memory)
    , snapshots_(std::move(snapshots)) {
    if (!snapshots_) {
        throw config_error("Embedded backend requires a snapshot store");
    }

    auto image = snapshots_->load(snapshot_key);
    if (image && !image->empty()) {
        db_.deserialize(*image);
        restored_ = true;
        LOG_INFO("store", "Restored embedded store from snapshot (%zu bytes)", image->size());
    } else {
        LOG_INFO("store", "Created empty embedded store");
    }

    snapshot_task_.start(snapshot_interval, [this] { persist(); });
}

embedded_store::~embedded_store() {
    close();
}

void embedded_store::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.execute(sql, params);
    persist_locked();
}

std::vector<record> embedded_store::query(const std::string& sql, const std::vector<column_value_t>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    int before = db_.is_open() ? sqlite3_total_changes(db_.handle()) : 0;
    auto rows = db_.query(sql, params);
    // A raw statement run through query() may still have written
    if (sqlite3_total_changes(db_.handle()) != before) {
        persist_locked();
    }
    return rows;
}

int embedded_store::changes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.changes();
}

bool embedded_store::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.is_open();
}

bool embedded_store::persist() {
    std::lock_guard<std::mutex> lock(mutex_);
    return persist_locked();
}

bool embedded_store::persist_locked() {
    if (!db_.is_open()) return false;
    // Uncommitted pages are not saved; COMMIT persists once the block closes
    if (db_.is_in_transaction()) return false;
    try {
        auto image = db_.serialize();
        if (image.empty()) {
            return false;
        }
        snapshots_->save(snapshot_key, image);
        LOG_DEBUG("store", "Saved snapshot (%zu bytes)", image.size());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("store", "Failed to save snapshot: %s", e.what());
        return false;
    }
}

void embedded_store::close() {
    // Stop the periodic task first; its tick takes the same lock
    snapshot_task_.stop();

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_.is_open()) {
        persist_locked();
        db_.close();
        LOG_INFO("store", "Closed embedded store");
    }
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<store_backend> make_store(const configuration& config,
                                          std::shared_ptr<snapshot_store> snapshots) {
    switch (config.backend) {
        case backend_kind::native:
            return std::make_unique<native_store>(config.path);
        case backend_kind::mobile:
            return std::make_unique<mobile_store>(config.path, config.database_name);
        case backend_kind::embedded:
            if (!snapshots) {
                if (config.path.empty() || config.path == ":memory:") {
                    snapshots = std::make_shared<memory_snapshot_store>();
                } else {
                    snapshots = std::make_shared<file_snapshot_store>(config.path);
                }
            }
            return std::make_unique<embedded_store>(std::move(snapshots), config.snapshot_interval);
    }
    throw config_error("Unsupported backend");
}

} // namespace hearth
