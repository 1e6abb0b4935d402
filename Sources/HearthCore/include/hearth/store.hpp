#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "db.hpp"
#include "scheduler.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace hearth {

// ============================================================================
// Snapshot stores - durable side-channel for the embedded backend
// ============================================================================

class snapshot_store {
public:
    virtual ~snapshot_store() = default;

    /// Empty optional when nothing was ever saved under `key`.
    virtual std::optional<std::vector<uint8_t>> load(const std::string& key) = 0;
    virtual void save(const std::string& key, const std::vector<uint8_t>& image) = 0;
    virtual void remove(const std::string& key) = 0;
};

/// One file per key: {directory}/{key}.bin, replaced atomically on save.
class file_snapshot_store : public snapshot_store {
public:
    explicit file_snapshot_store(std::string directory);

    std::optional<std::vector<uint8_t>> load(const std::string& key) override;
    void save(const std::string& key, const std::vector<uint8_t>& image) override;
    void remove(const std::string& key) override;

    std::string file_for(const std::string& key) const;

private:
    std::string directory_;
};

class memory_snapshot_store : public snapshot_store {
public:
    std::optional<std::vector<uint8_t>> load(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = images_.find(key);
        if (it == images_.end()) return std::nullopt;
        return it->second;
    }

    void save(const std::string& key, const std::vector<uint8_t>& image) override {
        std::lock_guard<std::mutex> lock(mutex_);
        images_[key] = image;
        ++save_count_;
    }

    void remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        images_.erase(key);
    }

    // Test helpers
    size_t save_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return save_count_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>> images_;
    size_t save_count_ = 0;
};

// ============================================================================
// store_backend - the capability interface every backend implements
// ============================================================================

class store_backend {
public:
    virtual ~store_backend() = default;

    virtual backend_kind kind() const = 0;

    /// Runs a statement that returns no rows.
    virtual void execute(const std::string& sql,
                         const std::vector<column_value_t>& params = {}) = 0;

    virtual std::vector<record> query(const std::string& sql,
                                      const std::vector<column_value_t>& params = {}) = 0;

    /// Rows modified by the most recent execute().
    virtual int changes() const = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(store_backend& store);
    ~transaction();

    void commit();
    void rollback();

private:
    store_backend& store_;
    bool completed_ = false;
};

class native_store : public store_backend {
public:
    explicit native_store(const std::string& path);

    backend_kind kind() const override { return backend_kind::native; }
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {}) override;
    std::vector<record> query(const std::string& sql, const std::vector<column_value_t>& params = {}) override;
    int changes() const override { return db_.changes(); }
    void close() override { db_.close(); }
    bool is_open() const override { return db_.is_open(); }

private:
    database db_;
};

class mobile_store : public store_backend {
public:
    mobile_store(const std::string& data_directory, const std::string& database_name);

    backend_kind kind() const override { return backend_kind::mobile; }
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {}) override;
    std::vector<record> query(const std::string& sql, const std::vector<column_value_t>& params = {}) override;
    int changes() const override { return db_.changes(); }
    void close() override { db_.close(); }
    bool is_open() const override { return db_.is_open(); }

    const std::string& path() const { return db_.path(); }

private:
    database db_;
};

/// In-memory database whose whole image lives in a snapshot_store.
/// Every execute() saves the image; a periodic task saves it as well.
class embedded_store : public store_backend {
public:
    static constexpr const char* snapshot_key = "sqliteDb";

    embedded_store(std::shared_ptr<snapshot_store> snapshots,
                   std::chrono::milliseconds snapshot_interval);
    ~embedded_store() override;

    backend_kind kind() const override { return backend_kind::embedded; }
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {}) override;
    std::vector<record> query(const std::string& sql, const std::vector<column_value_t>& params = {}) override;
    int changes() const override;
    void close() override;
    bool is_open() const override;

    /// Writes the current image to the snapshot store. Failures are logged.
    bool persist();

    bool restored_from_snapshot() const { return restored_; }

private:
    bool persist_locked();

    mutable std::mutex mutex_;
    database db_;
    std::shared_ptr<snapshot_store> snapshots_;
    periodic_task snapshot_task_;
    bool restored_ = false;
};

/// Opens the backend named by the configuration. For the embedded backend,
/// `snapshots` overrides the snapshot store derived from `config.path`.
std::unique_ptr<store_backend> make_store(const configuration& config,
                                          std::shared_ptr<snapshot_store> snapshots = nullptr);

} // namespace hearth

#endif // __cplusplus
