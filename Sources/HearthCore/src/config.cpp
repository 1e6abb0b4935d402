#include "hearth/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace hearth {

backend_kind parse_backend_kind(const std::string& name) {
    if (name == "native") return backend_kind::native;
    if (name == "mobile") return backend_kind::mobile;
    if (name == "embedded") return backend_kind::embedded;
    throw config_error("Unknown backend '" + name + "'");
}

const char* backend_kind_name(backend_kind kind) {
    switch (kind) {
        case backend_kind::native: return "native";
        case backend_kind::mobile: return "mobile";
        case backend_kind::embedded: return "embedded";
    }
    return "native";
}

configuration configuration::from_json(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw config_error(std::string("Malformed configuration: ") + e.what());
    }
    if (!j.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    configuration cfg;
    try {
        if (j.contains("backend")) cfg.backend = parse_backend_kind(j["backend"].get<std::string>());
        cfg.path = j.value("path", cfg.path);
        cfg.database_name = j.value("database_name", cfg.database_name);
        cfg.remote_url = j.value("remote_url", cfg.remote_url);
        cfg.remote_key = j.value("remote_key", cfg.remote_key);
        cfg.schema_version = j.value("schema_version", cfg.schema_version);
        if (j.contains("auto_sync_interval_ms")) {
            cfg.auto_sync_interval = std::chrono::milliseconds(j["auto_sync_interval_ms"].get<int64_t>());
        }
        if (j.contains("snapshot_interval_ms")) {
            cfg.snapshot_interval = std::chrono::milliseconds(j["snapshot_interval_ms"].get<int64_t>());
        }
        cfg.upload_chunk_size = j.value("upload_chunk_size", cfg.upload_chunk_size);
        if (j.contains("log_level")) cfg.logging = parse_log_level(j["log_level"].get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw config_error(std::string("Invalid configuration value: ") + e.what());
    }

    if (cfg.upload_chunk_size == 0) {
        throw config_error("upload_chunk_size must be positive");
    }
    if (cfg.auto_sync_interval.count() <= 0 || cfg.snapshot_interval.count() <= 0) {
        throw config_error("Intervals must be positive");
    }
    return cfg;
}

configuration configuration::from_file(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw config_error("Cannot read configuration file " + file_path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return from_json(ss.str());
}

} // namespace hearth
