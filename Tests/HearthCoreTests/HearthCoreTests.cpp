#include <HearthCore.hpp>
#include <cassert>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <thread>
#include <chrono>
#include <algorithm>
#include <atomic>

#include "SyncEngineTests.hpp"

// ============================================================================
// Test Registries
// ============================================================================

static const hearth::schema_registry& notes_registry() {
    static const hearth::schema_registry registry{
        hearth::make_table("notes", [](hearth::table_builder& t) {
            t.column("name", hearth::logical_type::text)
             .column("pinned", hearth::logical_type::boolean).default_value(false);
        })
    };
    return registry;
}

// Wraps a store and hides one column from PRAGMA table_info, as if another
// initializer added it between introspection and ALTER TABLE.
class racing_store : public hearth::store_backend {
public:
    racing_store(hearth::store_backend& inner, std::string hidden)
        : inner_(inner), hidden_(std::move(hidden)) {}

    hearth::backend_kind kind() const override { return inner_.kind(); }
    void execute(const std::string& sql, const std::vector<hearth::column_value_t>& params = {}) override {
        inner_.execute(sql, params);
    }
    std::vector<hearth::record> query(const std::string& sql,
                                      const std::vector<hearth::column_value_t>& params = {}) override {
        auto rows = inner_.query(sql, params);
        if (sql.rfind("PRAGMA table_info", 0) == 0) {
            rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const hearth::record& r) {
                return hearth::field_string(r, "name") == hidden_;
            }), rows.end());
        }
        return rows;
    }
    int changes() const override { return inner_.changes(); }
    void close() override { inner_.close(); }
    bool is_open() const override { return inner_.is_open(); }

private:
    hearth::store_backend& inner_;
    std::string hidden_;
};

static std::vector<std::string> column_names(hearth::store_backend& store, const std::string& table) {
    std::vector<std::string> names;
    for (const auto& row : store.query("PRAGMA table_info(" + table + ")")) {
        names.push_back(hearth::field_string(row, "name").value_or(""));
    }
    return names;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ============================================================================
// Test: Schema Builder and Registry
// ============================================================================

void test_schema_builder() {
    std::cout << "Testing schema builder..." << std::endl;

    const auto& registry = hearth::default_registry();
    auto names = registry.table_names();
    assert(names.size() == 4);
    assert(names[0] == "pomodoro_sessions");
    assert(names[1] == "pomodoro_log");
    assert(names[2] == "pomodoro_streak");
    assert(names[3] == "app_settings");

    // System columns come first, in a fixed order
    const auto& sessions = registry.at("pomodoro_sessions");
    assert(sessions.columns[0].name == "id" && sessions.columns[0].is_primary_key);
    assert(sessions.columns[1].name == "created_at" && sessions.columns[1].not_null);
    assert(sessions.columns[2].name == "updated_at");
    assert(sessions.columns[3].name == "synced");
    assert(sessions.columns[4].name == "deleted");
    assert(sessions.columns[5].name == "session_date");

    const auto* status = sessions.find_column("status");
    assert(status != nullptr);
    assert(status->not_null);
    assert(status->default_value.has_value());
    assert(std::get<std::string>(*status->default_value) == "active");

    assert(sessions.indexes.size() == 2);
    assert(sessions.indexes[0].name == "idx_pomodoro_sessions_session_date");
    assert(sessions.indexes[1].name == "idx_pomodoro_sessions_status");

    const auto& log = registry.at("pomodoro_log");
    assert(log.find_column("log_date")->is_unique);
    assert(log.indexes[0].unique);
    assert(!log.indexes[1].unique);

    const auto* streak_date = registry.at("pomodoro_streak").find_column("last_streak_date");
    assert(streak_date->type == hearth::logical_type::date);

    // Type mapping
    assert(hearth::physical_type(hearth::logical_type::boolean) == "INTEGER");
    assert(hearth::physical_type(hearth::logical_type::timestamp) == "INTEGER");
    assert(hearth::physical_type(hearth::logical_type::date) == "TEXT");
    assert(hearth::physical_type(hearth::logical_type::jsonb) == "TEXT");
    assert(hearth::parse_logical_type("timestamp") == hearth::logical_type::timestamp);
    assert(hearth::parse_logical_type("VARCHAR") == hearth::logical_type::text);

    // Unknown tables and duplicate declarations are rejected
    bool threw = false;
    try { registry.at("nope"); } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    threw = false;
    try {
        hearth::schema_registry dup{notes_registry().at("notes"), notes_registry().at("notes")};
    } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    threw = false;
    try {
        hearth::make_table("bad", [](hearth::table_builder& t) {
            t.column("a", hearth::logical_type::text).index({"missing"});
        });
    } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    std::cout << "  Schema builder test passed!" << std::endl;
}

// ============================================================================
// Test: Migration Engine
// ============================================================================

void test_migration_fresh_store() {
    std::cout << "Testing migrations on a fresh store..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine engine(store, hearth::default_registry(), 1);

    // 4 tables + 4 indexes
    size_t applied = engine.apply_migrations();
    assert(applied == 8);

    auto log = engine.applied_migrations();
    assert(log.size() == 8);
    assert(log[0].table_name == "pomodoro_sessions");
    assert(log[0].operation == "CREATE_TABLE");
    assert(log[0].version == 1);
    assert(log[0].applied_at > 0);
    assert(log[1].operation == "CREATE_INDEX:idx_pomodoro_sessions_session_date");

    auto cols = column_names(store, "pomodoro_log");
    assert(contains(cols, "log_date"));
    assert(contains(cols, "synced"));
    assert(!store.query("SELECT name FROM sqlite_master WHERE type='index' AND name='idx_pomodoro_log_log_date'").empty());

    std::cout << "  Fresh store migration test passed!" << std::endl;
}

void test_migration_idempotent() {
    std::cout << "Testing migration idempotence..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine engine(store, hearth::default_registry());

    engine.apply_migrations();
    auto first = engine.applied_migrations().size();

    assert(engine.apply_migrations() == 0);
    assert(engine.apply_migrations() == 0);
    assert(engine.applied_migrations().size() == first);

    std::cout << "  Migration idempotence test passed!" << std::endl;
}

void test_migration_additive() {
    std::cout << "Testing additive migrations..." << std::endl;

    hearth::native_store store(":memory:");

    hearth::schema_registry v1{
        hearth::make_table("notes", [](hearth::table_builder& t) {
            t.column("name", hearth::logical_type::text);
        })
    };
    hearth::schema_registry v2{
        hearth::make_table("notes", [](hearth::table_builder& t) {
            t.column("name", hearth::logical_type::text)
             .column("body", hearth::logical_type::text).default_value("x")
             .column("priority", hearth::logical_type::integer).not_null().default_value(3)
             .column("tag", hearth::logical_type::text).not_null().unique()
             .index({"priority"});
        })
    };
    // A later build that no longer declares body
    hearth::schema_registry v3{
        hearth::make_table("notes", [](hearth::table_builder& t) {
            t.column("name", hearth::logical_type::text);
        })
    };

    assert(hearth::migration_engine(store, v1).apply_migrations() == 1);

    hearth::storage_adapter storage_v1(store, v1);
    auto id = storage_v1.insert("notes", {{"name", std::string("kept")}});

    hearth::migration_engine engine_v2(store, v2, 2);
    assert(engine_v2.apply_migrations() == 4);  // 3 columns + 1 index

    auto log = engine_v2.applied_migrations();
    assert(log.back().operation == "CREATE_INDEX:idx_notes_priority");
    assert(log.back().version == 2);
    bool saw_body = false;
    for (const auto& m : log) {
        if (m.operation == "ADD_COLUMN:body") saw_body = true;
    }
    assert(saw_body);

    // Existing rows keep their data and pick up defaults
    hearth::storage_adapter storage_v2(store, v2);
    auto row = storage_v2.find_by_id("notes", id);
    assert(row.has_value());
    assert(hearth::field_string(*row, "name") == "kept");
    assert(hearth::field_string(*row, "body") == "x");
    assert(hearth::field_int(*row, "priority") == 3);
    assert(hearth::field_is_null(*row, "tag"));

    // Dropping a column from the registry never drops it from the store
    assert(hearth::migration_engine(store, v3).apply_migrations() == 0);
    assert(contains(column_names(store, "notes"), "body"));

    std::cout << "  Additive migration test passed!" << std::endl;
}

void test_migration_duplicate_column() {
    std::cout << "Testing migration duplicate column handling..." << std::endl;

    hearth::native_store inner(":memory:");
    hearth::schema_registry v1{
        hearth::make_table("notes", [](hearth::table_builder& t) {
            t.column("name", hearth::logical_type::text)
             .column("body", hearth::logical_type::text);
        })
    };
    hearth::migration_engine(inner, v1).apply_migrations();
    auto before = hearth::migration_engine(inner, v1).applied_migrations().size();

    // "body" looks missing but already exists: swallowed, not logged
    racing_store racing(inner, "body");
    hearth::migration_engine engine(racing, v1);
    assert(engine.apply_migrations() == 0);
    assert(engine.applied_migrations().size() == before);

    // Any other ALTER failure propagates
    hearth::schema_registry v2{
        hearth::make_table("notes", [](hearth::table_builder& t) {
            t.column("name", hearth::logical_type::text)
             .column("body", hearth::logical_type::text)
             .column("select", hearth::logical_type::text);
        })
    };
    bool threw = false;
    try {
        hearth::migration_engine(inner, v2).apply_migrations();
    } catch (const hearth::db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Duplicate column test passed!" << std::endl;
}

void test_ddl_generation() {
    std::cout << "Testing DDL generation..." << std::endl;

    assert(hearth::default_literal_sql(std::string("it's")) == "'it''s'");
    assert(hearth::default_literal_sql(int64_t(25)) == "25");
    assert(hearth::default_literal_sql(nullptr) == "NULL");

    hearth::column_def col;
    col.name = "tag";
    col.type = hearth::logical_type::text;
    col.not_null = true;
    col.is_unique = true;
    assert(hearth::column_definition_sql(col) == "tag TEXT NOT NULL UNIQUE");
    // ADD COLUMN keeps only what SQLite accepts there
    assert(hearth::added_column_definition_sql(col) == "tag TEXT");

    col.default_value = hearth::column_value_t(std::string("a"));
    assert(hearth::added_column_definition_sql(col) == "tag TEXT NOT NULL DEFAULT 'a'");

    auto linked = hearth::make_table("children", [](hearth::table_builder& t) {
        t.column("seq", hearth::logical_type::integer).primary_key().auto_increment()
         .column("parent_id", hearth::logical_type::text).references("parents", "id");
    });
    assert(hearth::column_definition_sql(*linked.find_column("parent_id")) ==
           "parent_id TEXT REFERENCES parents(id)");
    assert(hearth::column_definition_sql(*linked.find_column("seq")) == "seq INTEGER PRIMARY KEY AUTOINCREMENT");
    assert(hearth::added_column_definition_sql(*linked.find_column("parent_id")) ==
           "parent_id TEXT REFERENCES parents(id)");

    hearth::index_def idx{"idx_t_a_b", {"a", "b"}, true};
    assert(hearth::create_index_sql("t", idx) == "CREATE UNIQUE INDEX IF NOT EXISTS idx_t_a_b ON t(a, b)");

    std::cout << "  DDL generation test passed!" << std::endl;
}

// ============================================================================
// Test: Storage Adapter
// ============================================================================

void test_insert_scenario() {
    std::cout << "Testing insert..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine(store, notes_registry()).apply_migrations();
    hearth::storage_adapter storage(store, notes_registry());

    auto id = storage.insert("notes", {{"name", std::string("x")}});
    assert(!id.empty());
    assert(id.size() == 36);

    auto row = storage.find_by_id("notes", id);
    assert(row.has_value());
    assert(hearth::field_string(*row, "id") == id);
    assert(hearth::field_string(*row, "name") == "x");
    assert(!hearth::field_bool(*row, "synced"));
    assert(!hearth::field_bool(*row, "deleted"));
    assert(hearth::field_int(*row, "created_at").value() > 0);
    assert(hearth::field_int(*row, "created_at") == hearth::field_int(*row, "updated_at"));

    // Every insert gets a fresh id
    auto other = storage.insert("notes", {{"name", std::string("y")}});
    assert(other != id);

    std::cout << "  Insert test passed!" << std::endl;
}

void test_update_semantics() {
    std::cout << "Testing update..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine(store, notes_registry()).apply_migrations();
    hearth::storage_adapter storage(store, notes_registry());

    auto id = storage.insert("notes", {{"name", std::string("draft")}});
    storage.mark_as_synced("notes", {id});
    auto before = storage.find_by_id("notes", id);
    assert(hearth::field_bool(*before, "synced"));

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    assert(storage.update("notes", id, {{"name", std::string("final")}}));

    auto after = storage.find_by_id("notes", id);
    assert(hearth::field_string(*after, "name") == "final");
    assert(!hearth::field_bool(*after, "synced"));
    assert(hearth::field_int(*after, "updated_at").value() > hearth::field_int(*before, "updated_at").value());
    assert(hearth::field_int(*after, "created_at") == hearth::field_int(*before, "created_at"));

    // Missing id is a no-op, not an error
    assert(!storage.update("notes", "no-such-id", {{"name", std::string("ghost")}}));
    assert(storage.count("notes") == 1);

    // Unknown columns, wrong types and system columns are rejected
    bool threw = false;
    try { storage.update("notes", id, {{"nope", std::string("x")}}); } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { storage.insert("notes", {{"name", int64_t(5)}}); } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { storage.update("notes", id, {{"synced", int64_t(1)}}); } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { storage.insert("missing_table", {}); } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    std::cout << "  Update test passed!" << std::endl;
}

void test_soft_delete_visibility() {
    std::cout << "Testing soft delete visibility..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine(store, notes_registry()).apply_migrations();
    hearth::storage_adapter storage(store, notes_registry());

    auto keep = storage.insert("notes", {{"name", std::string("keep")}});
    auto gone = storage.insert("notes", {{"name", std::string("gone")}});
    storage.mark_as_synced("notes", {keep, gone});
    assert(storage.find_unsynced("notes").empty());

    assert(storage.remove("notes", gone));

    assert(!storage.find_by_id("notes", gone).has_value());
    auto all = storage.find_all("notes");
    assert(all.size() == 1);
    assert(hearth::field_string(all[0], "id") == keep);
    assert(storage.count("notes") == 1);

    // The tombstone is still there for the sync engine
    auto unsynced = storage.find_unsynced("notes");
    assert(unsynced.size() == 1);
    assert(hearth::field_string(unsynced[0], "id") == gone);
    assert(hearth::field_bool(unsynced[0], "deleted"));

    auto raw = storage.execute_raw("SELECT * FROM notes WHERE id = ?", {gone});
    assert(raw.size() == 1);
    assert(storage.find_including_deleted("notes", gone).has_value());

    // Row is never physically removed
    auto total = storage.execute_raw("SELECT COUNT(*) AS n FROM notes");
    assert(hearth::field_int(total[0], "n") == 2);

    // Once uploaded, the tombstone leaves the unsynced set
    storage.mark_as_synced("notes", {gone});
    assert(storage.find_unsynced("notes").empty());
    assert(!storage.find_by_id("notes", gone).has_value());

    std::cout << "  Soft delete visibility test passed!" << std::endl;
}

void test_dirty_flags() {
    std::cout << "Testing dirty flags..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine(store, notes_registry()).apply_migrations();
    hearth::storage_adapter storage(store, notes_registry());

    auto synced_flag = [&](const std::string& id) {
        auto row = storage.find_including_deleted("notes", id);
        return hearth::field_bool(*row, "synced");
    };

    auto id = storage.insert("notes", {{"name", std::string("a")}});
    assert(!synced_flag(id));
    storage.update("notes", id, {{"pinned", int64_t(1)}});
    assert(!synced_flag(id));

    // mark_as_synced names other ids only
    auto other = storage.insert("notes", {{"name", std::string("b")}});
    storage.mark_as_synced("notes", {other});
    assert(!synced_flag(id));
    assert(synced_flag(other));

    storage.mark_as_synced("notes", {id});
    assert(synced_flag(id));
    storage.update("notes", id, {{"name", std::string("c")}});
    assert(!synced_flag(id));

    storage.mark_as_synced("notes", {id});
    storage.remove("notes", id);
    assert(!synced_flag(id));

    // Empty id list is a no-op
    storage.mark_as_synced("notes", {});
    assert(!synced_flag(id));

    // A version read before an edit no longer marks the row, even when the
    // edit lands in the same millisecond
    auto fresh = storage.insert("notes", {{"name", std::string("d")}});
    auto read = storage.find_including_deleted("notes", fresh);
    hearth::synced_version stale{fresh, hearth::field_int(*read, "updated_at").value()};
    storage.update("notes", fresh, {{"name", std::string("e")}});
    auto edited = storage.find_including_deleted("notes", fresh);
    assert(hearth::field_int(*edited, "updated_at").value() > stale.updated_at);

    assert(storage.mark_versions_synced("notes", {stale}) == 0);
    assert(!synced_flag(fresh));

    hearth::synced_version current{fresh, hearth::field_int(*edited, "updated_at").value()};
    assert(storage.mark_versions_synced("notes", {current}) == 1);
    assert(synced_flag(fresh));

    std::cout << "  Dirty flag test passed!" << std::endl;
}

void test_find_all_options() {
    std::cout << "Testing find_all options..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine(store, notes_registry()).apply_migrations();
    hearth::storage_adapter storage(store, notes_registry());

    // Rows with known timestamps
    for (int i = 1; i <= 4; ++i) {
        hearth::record row;
        row["id"] = "n" + std::to_string(i);
        row["created_at"] = int64_t(i * 1000);
        row["updated_at"] = int64_t(i * 1000);
        row["deleted"] = int64_t(0);
        row["name"] = std::string(i % 2 ? "odd" : "even");
        row["pinned"] = int64_t(i == 4 ? 1 : 0);
        storage.apply_remote("notes", row);
    }

    // Default: newest created first
    auto all = storage.find_all("notes");
    assert(all.size() == 4);
    assert(hearth::field_string(all[0], "id") == "n4");
    assert(hearth::field_string(all[3], "id") == "n1");

    hearth::query_options asc;
    asc.order_by = "created_at";
    asc.descending = false;
    asc.limit = 2;
    asc.offset = 1;
    auto page = storage.find_all("notes", asc);
    assert(page.size() == 2);
    assert(hearth::field_string(page[0], "id") == "n2");
    assert(hearth::field_string(page[1], "id") == "n3");

    hearth::query_options filtered;
    filtered.where = {{"name", std::string("odd")}};
    auto odd = storage.find_all("notes", filtered);
    assert(odd.size() == 2);
    assert(storage.count("notes", {{"name", std::string("even")}, {"pinned", int64_t(1)}}) == 1);

    hearth::query_options offset_only;
    offset_only.offset = 3;
    assert(storage.find_all("notes", offset_only).size() == 1);

    bool threw = false;
    hearth::query_options bad;
    bad.order_by = "nope";
    try { storage.find_all("notes", bad); } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    std::cout << "  find_all options test passed!" << std::endl;
}

void test_constraint_violations() {
    std::cout << "Testing constraint violations..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine(store, hearth::default_registry()).apply_migrations();
    hearth::storage_adapter storage(store, hearth::default_registry());

    storage.insert("pomodoro_log", {{"log_date", std::string("2024-05-01")}, {"target_sessions", int64_t(8)}});

    bool threw = false;
    try {
        storage.insert("pomodoro_log", {{"log_date", std::string("2024-05-01")}, {"target_sessions", int64_t(6)}});
    } catch (const hearth::constraint_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        storage.insert("pomodoro_log", {{"log_date", std::string("2024-05-02")}});
    } catch (const hearth::constraint_error&) {
        threw = true;
    }
    assert(threw);
    assert(storage.count("pomodoro_log") == 1);

    std::cout << "  Constraint violation test passed!" << std::endl;
}

void test_transaction_guard() {
    std::cout << "Testing transaction guard..." << std::endl;

    hearth::native_store store(":memory:");
    hearth::migration_engine(store, notes_registry()).apply_migrations();
    hearth::storage_adapter storage(store, notes_registry());

    {
        hearth::transaction tx(store);
        storage.insert("notes", {{"name", std::string("kept")}});
        tx.commit();
    }
    {
        // Abandoned without commit
        hearth::transaction tx(store);
        storage.insert("notes", {{"name", std::string("discarded")}});
    }
    {
        hearth::transaction tx(store);
        storage.insert("notes", {{"name", std::string("rolled back")}});
        tx.rollback();
    }

    auto rows = storage.find_all("notes");
    assert(rows.size() == 1);
    assert(hearth::field_string(rows[0], "name") == "kept");

    // A failed migration leaves no partial table behind
    hearth::schema_registry broken{
        hearth::make_table("broken", [](hearth::table_builder& t) {
            t.column("a", hearth::logical_type::text).index({"a"}, "idx_notes_taken");
        })
    };
    store.execute("CREATE TABLE idx_notes_taken (x INTEGER)");
    bool threw = false;
    try {
        hearth::migration_engine(store, broken).apply_migrations();
    } catch (const hearth::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(store.query("SELECT name FROM sqlite_master WHERE type='table' AND name='broken'").empty());

    std::cout << "  Transaction guard test passed!" << std::endl;
}

void test_periodic_task() {
    std::cout << "Testing periodic task..." << std::endl;

    hearth::periodic_task task;
    assert(!task.is_running());

    std::atomic<int> calls{0};
    task.start(std::chrono::milliseconds(10), [&] {
        // A failing tick is logged and the task keeps going
        if (++calls == 1) throw std::runtime_error("first tick fails");
    });
    assert(task.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    task.stop();
    assert(!task.is_running());
    assert(calls.load() > 1);
    assert(task.tick_count() == static_cast<uint64_t>(calls.load()));

    auto after_stop = calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(calls.load() == after_stop);

    // Restart replaces the callback
    std::atomic<int> other{0};
    task.start(std::chrono::milliseconds(10), [&] { ++other; });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    task.stop();
    assert(other.load() > 0);
    assert(calls.load() == after_stop);

    // Stopping from inside a tick cancels without joining; the owner's next
    // stop() joins the finished worker
    std::atomic<int> self_stopping{0};
    task.start(std::chrono::milliseconds(10), [&] {
        if (++self_stopping == 2) task.stop();
    });
    for (int i = 0; i < 200 && task.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(!task.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    assert(self_stopping.load() == 2);
    task.stop();

    // Restarting from inside a tick is refused
    std::atomic<bool> refused{false};
    task.start(std::chrono::milliseconds(10), [&] {
        try {
            task.start(std::chrono::milliseconds(10), [] {});
        } catch (const std::logic_error&) {
            refused = true;
        }
    });
    for (int i = 0; i < 200 && !refused; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    task.stop();
    assert(refused.load());

    hearth::immediate_scheduler immediate;
    bool ran = false;
    assert(immediate.can_invoke());
    immediate.invoke([&] { ran = true; });
    assert(ran);

    std::cout << "  Periodic task test passed!" << std::endl;
}

// ============================================================================
// Test: Backends
// ============================================================================

void test_native_file_store() {
    std::cout << "Testing native file store..." << std::endl;

    std::string path = "/tmp/hearth_native_test.db";
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");

    std::string id;
    {
        hearth::native_store store(path);
        hearth::migration_engine(store, notes_registry()).apply_migrations();
        hearth::storage_adapter storage(store, notes_registry());
        id = storage.insert("notes", {{"name", std::string("persistent")}});
        assert(store.kind() == hearth::backend_kind::native);
    }
    {
        hearth::native_store store(path);
        assert(hearth::migration_engine(store, notes_registry()).apply_migrations() == 0);
        hearth::storage_adapter storage(store, notes_registry());
        auto row = storage.find_by_id("notes", id);
        assert(row.has_value());
        assert(hearth::field_string(*row, "name") == "persistent");
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");

    std::cout << "  Native file store test passed!" << std::endl;
}

void test_mobile_store() {
    std::cout << "Testing mobile store..." << std::endl;

    std::string dir = "/tmp/hearth_mobile_test";
    std::filesystem::remove_all(dir);

    {
        hearth::mobile_store store(dir, "pomodoro.db");
        assert(store.kind() == hearth::backend_kind::mobile);
        assert(std::filesystem::exists(dir + "/pomodoro.db"));

        auto mode = store.query("PRAGMA journal_mode");
        assert(hearth::field_string(mode[0], "journal_mode") == "delete");

        // Parameterless statements may be whole scripts
        store.execute("CREATE TABLE a (x INTEGER); CREATE TABLE b (y INTEGER);");
        store.execute("INSERT INTO a (x) VALUES (?)", {int64_t(7)});
        assert(store.changes() == 1);
        assert(hearth::field_int(store.query("SELECT x FROM a")[0], "x") == 7);
    }

    std::filesystem::remove_all(dir);

    std::cout << "  Mobile store test passed!" << std::endl;
}

void test_embedded_store_snapshot() {
    std::cout << "Testing embedded store snapshots..." << std::endl;

    auto snapshots = std::make_shared<hearth::memory_snapshot_store>();
    std::string id;
    {
        hearth::embedded_store store(snapshots, std::chrono::hours(1));
        assert(!store.restored_from_snapshot());
        assert(!snapshots->load(hearth::embedded_store::snapshot_key).has_value());

        hearth::migration_engine(store, notes_registry()).apply_migrations();
        auto saves = snapshots->save_count();
        assert(saves > 0);

        hearth::storage_adapter storage(store, notes_registry());
        id = storage.insert("notes", {{"name", std::string("in memory")}});

        // Every mutation writes the image
        assert(snapshots->save_count() > saves);
        assert(snapshots->load("sqliteDb").has_value());
    }
    {
        hearth::embedded_store store(snapshots, std::chrono::hours(1));
        assert(store.restored_from_snapshot());
        assert(hearth::migration_engine(store, notes_registry()).apply_migrations() == 0);

        hearth::storage_adapter storage(store, notes_registry());
        auto row = storage.find_by_id("notes", id);
        assert(row.has_value());
        assert(hearth::field_string(*row, "name") == "in memory");
    }

    std::cout << "  Embedded store snapshot test passed!" << std::endl;
}

void test_embedded_periodic_snapshot() {
    std::cout << "Testing embedded periodic snapshot..." << std::endl;

    auto snapshots = std::make_shared<hearth::memory_snapshot_store>();
    hearth::embedded_store store(snapshots, std::chrono::milliseconds(20));
    hearth::migration_engine(store, notes_registry()).apply_migrations();

    auto before = snapshots->save_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    assert(snapshots->save_count() > before);

    // Closing stops the task and writes one last image
    store.close();
    assert(!store.is_open());
    auto after_close = snapshots->save_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(snapshots->save_count() == after_close);

    std::cout << "  Embedded periodic snapshot test passed!" << std::endl;
}

void test_file_snapshot_store() {
    std::cout << "Testing file snapshot store..." << std::endl;

    std::string dir = "/tmp/hearth_snapshot_test";
    std::filesystem::remove_all(dir);

    hearth::file_snapshot_store snapshots(dir);
    assert(!snapshots.load("sqliteDb").has_value());

    std::vector<uint8_t> image{1, 2, 3, 0, 255};
    snapshots.save("sqliteDb", image);
    assert(std::filesystem::exists(dir + "/sqliteDb.bin"));
    assert(!std::filesystem::exists(dir + "/sqliteDb.bin.tmp"));
    assert(snapshots.load("sqliteDb").value() == image);

    snapshots.save("sqliteDb", {9});
    assert(snapshots.load("sqliteDb").value() == std::vector<uint8_t>{9});

    snapshots.remove("sqliteDb");
    assert(!snapshots.load("sqliteDb").has_value());

    std::filesystem::remove_all(dir);

    std::cout << "  File snapshot store test passed!" << std::endl;
}

void test_make_store() {
    std::cout << "Testing backend selection..." << std::endl;

    hearth::configuration config;
    config.backend = hearth::backend_kind::native;
    config.path = ":memory:";
    assert(hearth::make_store(config)->kind() == hearth::backend_kind::native);

    config.backend = hearth::backend_kind::embedded;
    config.path = "";
    auto embedded = hearth::make_store(config);
    assert(embedded->kind() == hearth::backend_kind::embedded);
    embedded->close();

    assert(hearth::parse_backend_kind("mobile") == hearth::backend_kind::mobile);
    bool threw = false;
    try { hearth::parse_backend_kind("browser"); } catch (const hearth::config_error&) { threw = true; }
    assert(threw);

    std::cout << "  Backend selection test passed!" << std::endl;
}

// ============================================================================
// Test: Configuration
// ============================================================================

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    auto config = hearth::configuration::from_json(R"({
        "backend": "mobile",
        "path": "/data/app",
        "database_name": "pomodoro.db",
        "remote_url": "https://example.supabase.co",
        "remote_key": "anon",
        "auto_sync_interval_ms": 60000,
        "upload_chunk_size": 50,
        "log_level": "warn"
    })");
    assert(config.backend == hearth::backend_kind::mobile);
    assert(config.path == "/data/app");
    assert(config.database_name == "pomodoro.db");
    assert(config.sync_enabled());
    assert(config.auto_sync_interval == std::chrono::milliseconds(60000));
    assert(config.snapshot_interval == std::chrono::milliseconds(5000));
    assert(config.upload_chunk_size == 50);
    assert(config.logging == hearth::log_level::warn);
    assert(config.schema_version == 1);

    auto defaults = hearth::configuration::from_json("{}");
    assert(defaults.backend == hearth::backend_kind::native);
    assert(!defaults.sync_enabled());
    assert(defaults.auto_sync_interval == std::chrono::minutes(5));

    auto expect_config_error = [](const std::string& text) {
        try {
            hearth::configuration::from_json(text);
        } catch (const hearth::config_error&) {
            return true;
        }
        return false;
    };
    assert(expect_config_error("{not json"));
    assert(expect_config_error("[]"));
    assert(expect_config_error(R"({"backend": "browser"})"));
    assert(expect_config_error(R"({"upload_chunk_size": 0})"));
    assert(expect_config_error(R"({"path": 12})"));

    std::string file = "/tmp/hearth_config_test.json";
    {
        std::ofstream out(file);
        out << R"({"backend": "embedded", "snapshot_interval_ms": 1000})";
    }
    auto from_file = hearth::configuration::from_file(file);
    assert(from_file.backend == hearth::backend_kind::embedded);
    assert(from_file.snapshot_interval == std::chrono::seconds(1));
    std::filesystem::remove(file);

    bool threw = false;
    try { hearth::configuration::from_file("/tmp/hearth_no_such_config.json"); } catch (const hearth::config_error&) { threw = true; }
    assert(threw);

    assert(hearth::parse_log_level("debug") == hearth::log_level::debug);
    assert(hearth::parse_log_level("loud") == hearth::log_level::off);

    std::cout << "  Configuration test passed!" << std::endl;
}

// ============================================================================
// Test: Wire Codec
// ============================================================================

void test_iso8601() {
    std::cout << "Testing ISO-8601 conversion..." << std::endl;

    assert(hearth::to_iso8601(0) == "1970-01-01T00:00:00.000Z");
    assert(hearth::to_iso8601(1700000000123) == "2023-11-14T22:13:20.123Z");
    assert(hearth::to_iso8601(-1) == "1969-12-31T23:59:59.999Z");
    assert(hearth::to_iso8601(951782400000) == "2000-02-29T00:00:00.000Z");

    assert(hearth::parse_iso8601("2023-11-14T22:13:20.123Z") == 1700000000123);
    assert(hearth::parse_iso8601("2023-11-14T22:13:20.123456+00:00") == 1700000000123);
    assert(hearth::parse_iso8601("2023-11-15T00:13:20.123+02:00") == 1700000000123);
    assert(hearth::parse_iso8601("2023-11-14 22:13:20") == 1700000000000);
    assert(hearth::parse_iso8601("1970-01-01") == 0);
    assert(hearth::parse_iso8601(hearth::to_iso8601(1234567890987)) == 1234567890987);

    for (const char* bad : {"", "yesterday", "2023-13-01", "2023-11-14T22:13", "2023-11-14T22:13:20X"}) {
        bool threw = false;
        try { hearth::parse_iso8601(bad); } catch (const hearth::remote_error&) { threw = true; }
        assert(threw);
    }

    std::cout << "  ISO-8601 test passed!" << std::endl;
}

void test_timestamp_fields() {
    std::cout << "Testing timestamp field recognition..." << std::endl;

    assert(hearth::is_timestamp_field("created_at"));
    assert(hearth::is_timestamp_field("updated_at"));
    assert(hearth::is_timestamp_field("started_at"));
    assert(hearth::is_timestamp_field("completed_at"));
    assert(hearth::is_timestamp_field("archived_at"));
    assert(hearth::is_timestamp_field("reminder_time"));
    assert(!hearth::is_timestamp_field("last_streak_date"));
    assert(!hearth::is_timestamp_field("session_date"));
    assert(!hearth::is_timestamp_field("status"));
    assert(!hearth::is_timestamp_field("at"));

    std::cout << "  Timestamp field test passed!" << std::endl;
}

void test_codec() {
    std::cout << "Testing wire codec..." << std::endl;

    const auto& streak = hearth::default_registry().at("pomodoro_streak");

    hearth::record row;
    row["id"] = std::string("s1");
    row["created_at"] = int64_t(1700000000123);
    row["updated_at"] = int64_t(1700000000456);
    row["synced"] = int64_t(0);
    row["deleted"] = int64_t(1);
    row["current_streak"] = int64_t(3);
    row["last_streak_date"] = std::string("2024-05-01");

    auto json = hearth::to_remote(streak, row);
    assert(!json.contains("synced"));
    assert(json["created_at"] == "2023-11-14T22:13:20.123Z");
    assert(json["deleted"] == true);
    assert(json["current_streak"] == 3);
    assert(json["last_streak_date"] == "2024-05-01");

    json["server_only"] = "dropped";
    json["best_streak"] = nullptr;
    auto back = hearth::from_remote(streak, json);
    assert(back.find("server_only") == back.end());
    assert(hearth::field_int(back, "created_at") == 1700000000123);
    assert(hearth::field_int(back, "updated_at") == 1700000000456);
    assert(hearth::field_int(back, "synced") == 1);
    assert(hearth::field_int(back, "deleted") == 1);
    assert(hearth::field_string(back, "last_streak_date") == "2024-05-01");
    assert(hearth::field_is_null(back, "best_streak"));

    // JSONB travels as embedded JSON and comes back as text
    hearth::schema_registry jsonb_registry{
        hearth::make_table("prefs", [](hearth::table_builder& t) {
            t.column("data", hearth::logical_type::jsonb);
        })
    };
    const auto& prefs = jsonb_registry.at("prefs");
    hearth::record pref;
    pref["id"] = std::string("p1");
    pref["data"] = std::string(R"({"theme":"dark"})");
    auto pref_json = hearth::to_remote(prefs, pref);
    assert(pref_json["data"].is_object());
    assert(pref_json["data"]["theme"] == "dark");
    auto pref_back = hearth::from_remote(prefs, pref_json);
    assert(hearth::field_string(pref_back, "data") == R"({"theme":"dark"})");

    std::cout << "  Wire codec test passed!" << std::endl;
}

// ============================================================================
// Test: REST Remote Client
// ============================================================================

void test_rest_remote_client() {
    std::cout << "Testing REST remote client..." << std::endl;

    auto http = std::make_shared<hearth::mock_http_client>();
    hearth::rest_remote_client client("https://proj.supabase.co/", "anon-key", http,
                                      hearth::default_registry());

    hearth::record row;
    row["id"] = std::string("abc");
    row["created_at"] = int64_t(0);
    row["updated_at"] = int64_t(1000);
    row["synced"] = int64_t(0);
    row["deleted"] = int64_t(0);
    row["current_streak"] = int64_t(2);

    // Upsert
    http->enqueue_json(201, R"([{"id":"abc","current_streak":2}])");
    auto written = client.upsert_batch("pomodoro_streak", {row});
    assert(written.size() == 1 && written[0] == "abc");

    auto requests = http->requests();
    assert(requests.size() == 1);
    const auto& upsert = requests[0];
    assert(upsert.method == "POST");
    assert(upsert.url == "https://proj.supabase.co/rest/v1/pomodoro_streak?on_conflict=id");
    assert(upsert.headers.at("apikey") == "anon-key");
    assert(upsert.headers.at("Authorization") == "Bearer anon-key");
    assert(upsert.headers.at("Prefer") == "resolution=merge-duplicates,return=representation");
    assert(upsert.headers.at("Content-Type") == "application/json");
    auto body = nlohmann::json::parse(upsert.body_string());
    assert(body.is_array() && body.size() == 1);
    assert(!body[0].contains("synced"));
    assert(body[0]["updated_at"] == "1970-01-01T00:00:01.000Z");

    // Delete
    http->clear_requests();
    http->enqueue_json(204, "");
    client.delete_by_key("pomodoro_streak", "abc");
    requests = http->requests();
    assert(requests[0].method == "DELETE");
    assert(requests[0].url == "https://proj.supabase.co/rest/v1/pomodoro_streak?id=eq.abc");

    // Select since
    http->clear_requests();
    http->enqueue_json(200, R"([
        {"id":"r1","created_at":"2024-01-01T00:00:00+00:00","updated_at":"2024-01-01T00:00:01.5+00:00",
         "deleted":false,"current_streak":4,"last_streak_date":"2023-12-31","extra":1}
    ])");
    auto rows = client.fetch_modified_since("pomodoro_streak", 0);
    requests = http->requests();
    assert(requests[0].method == "GET");
    assert(requests[0].url == "https://proj.supabase.co/rest/v1/pomodoro_streak"
                              "?select=*&updated_at=gte.1970-01-01T00%3A00%3A00.000Z&order=updated_at.asc");
    assert(rows.size() == 1);
    assert(hearth::field_int(rows[0], "created_at") == 1704067200000);
    assert(hearth::field_int(rows[0], "updated_at") == 1704067201500);
    assert(hearth::field_int(rows[0], "deleted") == 0);
    assert(hearth::field_int(rows[0], "synced") == 1);
    assert(hearth::field_string(rows[0], "last_streak_date") == "2023-12-31");
    assert(rows[0].find("extra") == rows[0].end());

    // HTTP errors become remote_error with the status
    http->enqueue_json(401, R"({"message":"JWT expired"})");
    bool threw = false;
    try {
        client.delete_by_key("pomodoro_streak", "abc");
    } catch (const hearth::remote_error& e) {
        threw = true;
        assert(e.status() == 401);
    }
    assert(threw);

    http->enqueue_json(200, "not json");
    threw = false;
    try { client.fetch_modified_since("pomodoro_streak", 0); } catch (const hearth::remote_error&) { threw = true; }
    assert(threw);

    // Nothing queued: the fallback answers
    http->set_fallback(hearth::http_response::with_body(200, "[]"));
    assert(client.fetch_modified_since("pomodoro_log", 1000).empty());

    assert(hearth::url_encode("a b:c/é") == "a%20b%3Ac%2F%C3%A9");

    std::cout << "  REST remote client test passed!" << std::endl;
}

// ============================================================================
// Test: Repositories and Query Builder
// ============================================================================

void test_typed_repository() {
    std::cout << "Testing typed repositories..." << std::endl;

    hearth::configuration config;
    hearth::data_layer db(config);
    assert(db.migrations_applied() == 8);
    assert(!db.sync_enabled());

    auto sessions = db.repository_of<hearth::pomodoro_session>();

    hearth::pomodoro_session s;
    s.session_date = "2024-05-01";
    s.session_number = 1;
    s.planned_duration = 25;
    s.started_at = 1714550400000;
    auto id = sessions.create(s);

    auto found = sessions.find_by_id(id);
    assert(found.has_value());
    assert(found->id == id);
    assert(found->session_date == "2024-05-01");
    assert(found->status == "active");
    assert(found->started_at == 1714550400000);
    assert(!found->completed_at.has_value());
    assert(found->efficiency_score == 0.0);
    assert(!found->synced);
    assert(found->created_at == found->updated_at);

    found->status = "completed";
    found->actual_duration = 27;
    found->completed_at = 1714552020000;
    found->efficiency_score = 92.5;
    assert(sessions.save(*found));

    auto saved = sessions.find_by_id(id);
    assert(saved->status == "completed");
    assert(saved->actual_duration == 27);
    assert(saved->completed_at == 1714552020000);
    assert(saved->efficiency_score == 92.5);

    assert(sessions.update(id, {{"pause_count", int64_t(2)}}));
    assert(sessions.find_by_id(id)->pause_count == 2);

    hearth::query_options completed;
    completed.where = {{"status", std::string("completed")}};
    assert(sessions.find_all(completed).size() == 1);
    assert(sessions.count() == 1);
    assert(sessions.untyped().table() == "pomodoro_sessions");

    // Settings pick up declared defaults
    auto settings = db.repository_of<hearth::app_settings>();
    auto settings_id = settings.create(hearth::app_settings{});
    auto loaded = settings.find_by_id(settings_id);
    assert(loaded->work_session_duration == 25);
    assert(loaded->sessions_before_long_break == 4);

    // last_streak_date stays a plain date
    auto streaks = db.repository_of<hearth::pomodoro_streak>();
    hearth::pomodoro_streak streak;
    streak.current_streak = 3;
    streak.last_streak_date = "2024-05-01";
    auto streak_id = streaks.create(streak);
    assert(streaks.find_by_id(streak_id)->last_streak_date == "2024-05-01");

    assert(sessions.remove(id));
    assert(!sessions.find_by_id(id).has_value());
    assert(sessions.count() == 0);

    // Untyped repository and raw query
    auto logs = db.repository_for("pomodoro_log");
    auto log_id = logs.create({{"log_date", std::string("2024-05-01")}, {"target_sessions", int64_t(8)}});
    assert(hearth::field_int(*logs.find_by_id(log_id), "work_sessions") == 0);
    auto raw = logs.query("SELECT log_date FROM pomodoro_log WHERE id = ?", {log_id});
    assert(hearth::field_string(raw[0], "log_date") == "2024-05-01");

    bool threw = false;
    try { db.repository_for("missing"); } catch (const hearth::schema_error&) { threw = true; }
    assert(threw);

    assert(hearth::record_traits<hearth::pomodoro_streak>::field_names().size() == 4);

    std::cout << "  Typed repository test passed!" << std::endl;
}

void test_query_builder() {
    std::cout << "Testing query builder..." << std::endl;

    hearth::configuration config;
    hearth::data_layer db(config);
    auto sessions = db.repository_for("pomodoro_sessions");
    auto logs = db.repository_for("pomodoro_log");

    auto add_session = [&](const std::string& date, int64_t number, double efficiency) {
        return sessions.create({{"session_date", date}, {"session_number", number},
                                {"planned_duration", int64_t(25)}, {"started_at", int64_t(1000)},
                                {"efficiency_score", efficiency}});
    };
    add_session("2024-05-01", 1, 80.0);
    add_session("2024-05-01", 2, 100.0);
    add_session("2024-05-02", 1, 50.0);
    auto removed = add_session("2024-05-02", 2, 10.0);
    sessions.remove(removed);
    logs.create({{"log_date", std::string("2024-05-01")}, {"target_sessions", int64_t(8)}});

    hearth::aggregate_spec per_day;
    per_day.table = "pomodoro_sessions";
    per_day.aggregates = {{"total", "COUNT(*)"}, {"avg_efficiency", "AVG(efficiency_score)"}};
    per_day.where = "deleted = 0";
    per_day.group_by = {"session_date"};
    assert(hearth::query_builder::aggregate_sql(per_day) ==
           "SELECT COUNT(*) AS total, AVG(efficiency_score) AS avg_efficiency FROM pomodoro_sessions "
           "WHERE deleted = 0 GROUP BY session_date");

    auto days = db.queries().aggregate(per_day);
    assert(days.size() == 2);
    for (const auto& day : days) {
        if (hearth::field_int(day, "total") == 2) {
            assert(hearth::field_real(day, "avg_efficiency") == 90.0);
        } else {
            assert(hearth::field_int(day, "total") == 1);
            assert(hearth::field_real(day, "avg_efficiency") == 50.0);
        }
    }

    hearth::join_spec joined;
    joined.select = {"s.session_number", "l.target_sessions"};
    joined.from = "pomodoro_sessions s";
    joined.joins = {{hearth::join_type::inner, "pomodoro_log", "l.log_date = s.session_date", "l"}};
    joined.where = "s.deleted = 0 AND s.session_date = ?";
    joined.params = {std::string("2024-05-01")};
    joined.order_by = "s.session_number ASC";
    joined.limit = 10;
    assert(hearth::query_builder::join_sql(joined) ==
           "SELECT s.session_number, l.target_sessions FROM pomodoro_sessions s "
           "INNER JOIN pomodoro_log AS l ON l.log_date = s.session_date "
           "WHERE s.deleted = 0 AND s.session_date = ? ORDER BY s.session_number ASC LIMIT 10");

    auto rows = db.queries().join(joined);
    assert(rows.size() == 2);
    assert(hearth::field_int(rows[0], "session_number") == 1);
    assert(hearth::field_int(rows[1], "target_sessions") == 8);

    hearth::join_spec left;
    left.select = {"s.id AS session_id", "l.id AS log_id", "s.session_date"};
    left.from = "pomodoro_sessions s";
    left.joins = {{hearth::join_type::left, "pomodoro_log", "l.log_date = s.session_date", "l"}};
    left.order_by = "s.session_date ASC";
    auto left_rows = db.queries().join(left);
    assert(left_rows.size() == 4);
    for (const auto& row : left_rows) {
        assert(hearth::field_string(row, "session_id").has_value());
        bool has_log = hearth::field_string(row, "log_id").has_value();
        assert(has_log == (hearth::field_string(row, "session_date") == "2024-05-01"));
    }

    // Both tables carry id, created_at, ... so SELECT * would collide
    left.select.clear();
    bool rejected = false;
    try {
        db.queries().join(left);
    } catch (const hearth::db_error& e) {
        rejected = std::string(e.what()).find("Duplicate result column name") != std::string::npos;
    }
    assert(rejected);

    std::cout << "  Query builder test passed!" << std::endl;
}

// ============================================================================
// Test: Data Layer
// ============================================================================

void test_data_layer_embedded() {
    std::cout << "Testing data layer on the embedded backend..." << std::endl;

    std::string dir = "/tmp/hearth_embedded_layer_test";
    std::filesystem::remove_all(dir);

    hearth::configuration config;
    config.backend = hearth::backend_kind::embedded;
    config.path = dir;

    std::string id;
    {
        hearth::data_layer db(config);
        assert(db.store().kind() == hearth::backend_kind::embedded);
        id = db.repository_for("pomodoro_log").create(
            {{"log_date", std::string("2024-05-03")}, {"target_sessions", int64_t(4)}});
        db.close();
        db.close();
    }
    assert(std::filesystem::exists(dir + "/sqliteDb.bin"));
    {
        hearth::data_layer db(config);
        assert(db.migrations_applied() == 0);
        auto row = db.repository_for("pomodoro_log").find_by_id(id);
        assert(row.has_value());
        assert(hearth::field_int(*row, "target_sessions") == 4);
    }

    std::filesystem::remove_all(dir);

    std::cout << "  Embedded data layer test passed!" << std::endl;
}

void test_data_layer_without_remote() {
    std::cout << "Testing data layer without remote credentials..." << std::endl;

    hearth::configuration config;
    config.remote_url = "https://proj.supabase.co";  // key missing
    hearth::data_layer db(config);

    assert(!db.sync_enabled());
    assert(!db.status().has_value());

    bool threw = false;
    try { db.sync(); } catch (const hearth::config_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { db.start_auto_sync(); } catch (const hearth::config_error&) { threw = true; }
    assert(threw);

    // Always safe
    db.stop_auto_sync();

    // Local operations are unaffected
    auto id = db.repository_for("app_settings").create({});
    assert(db.repository_for("app_settings").find_by_id(id).has_value());

    std::cout << "  No-remote data layer test passed!" << std::endl;
}

void test_data_layer_rest_sync() {
    std::cout << "Testing data layer sync over HTTP..." << std::endl;

    auto http = std::make_shared<hearth::mock_http_client>();
    http->set_handler([](const hearth::http_request& request) {
        if (request.method == "POST") {
            // Echo the ids back
            auto body = nlohmann::json::parse(request.body_string());
            nlohmann::json echoed = nlohmann::json::array();
            for (const auto& row : body) echoed.push_back({{"id", row["id"]}});
            return hearth::http_response::with_body(201, echoed.dump());
        }
        return hearth::http_response::with_body(200, "[]");
    });

    hearth::configuration config;
    config.remote_url = "https://proj.supabase.co";
    config.remote_key = "anon";
    hearth::data_layer_deps deps;
    deps.http = http;
    hearth::data_layer db(config, deps);
    assert(db.sync_enabled());

    db.repository_for("pomodoro_streak").create({{"current_streak", int64_t(1)}});
    assert(db.update_pending_count() == 1);

    auto report = db.sync();
    assert(report.ran && report.succeeded);
    assert(report.uploaded == 1);

    auto requests = http->requests();
    // One upsert plus one select per table
    assert(requests.size() == 5);
    size_t posts = 0;
    for (const auto& r : requests) {
        if (r.method == "POST") {
            ++posts;
            assert(r.url.find("/rest/v1/pomodoro_streak?on_conflict=id") != std::string::npos);
        } else {
            assert(r.method == "GET");
        }
    }
    assert(posts == 1);

    auto status = db.status();
    assert(status.has_value());
    assert(status->pending_count == 0);
    assert(status->last_sync.has_value());
    assert(!status->error.has_value());

    std::cout << "  HTTP sync data layer test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== HearthCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Schema and migrations
        test_schema_builder();
        test_migration_fresh_store();
        test_migration_idempotent();
        test_migration_additive();
        test_migration_duplicate_column();
        test_ddl_generation();

        // Storage adapter
        test_insert_scenario();
        test_update_semantics();
        test_soft_delete_visibility();
        test_dirty_flags();
        test_find_all_options();
        test_constraint_violations();
        test_transaction_guard();
        test_periodic_task();

        // Backends
        test_native_file_store();
        test_mobile_store();
        test_embedded_store_snapshot();
        test_embedded_periodic_snapshot();
        test_file_snapshot_store();
        test_make_store();
        test_configuration();

        // Remote
        test_iso8601();
        test_timestamp_fields();
        test_codec();
        test_rest_remote_client();

        // Sync engine
        sync_tests::run_all();
        std::cout << std::endl;

        // Typed layer
        test_typed_repository();
        test_query_builder();
        test_data_layer_embedded();
        test_data_layer_without_remote();
        test_data_layer_rest_sync();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
