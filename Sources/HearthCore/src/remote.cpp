#include "hearth/remote.hpp"
#include "hearth/log.hpp"
#include <algorithm>
#include <cstdio>

namespace hearth {

// ============================================================================
// ISO-8601 conversion (proleptic Gregorian, UTC)
// ============================================================================

namespace {

constexpr int64_t ms_per_day = 86400000;

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

[[noreturn]] void bad_timestamp(const std::string& text) {
    throw remote_error("Malformed timestamp '" + text + "'");
}

int read_number(const std::string& text, size_t& pos, size_t digits) {
    if (pos + digits > text.size()) bad_timestamp(text);
    int value = 0;
    for (size_t i = 0; i < digits; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') bad_timestamp(text);
        value = value * 10 + (c - '0');
    }
    pos += digits;
    return value;
}

void expect(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) bad_timestamp(text);
    ++pos;
}

} // namespace

std::string to_iso8601(timestamp_ms ms) {
    int64_t days = ms / ms_per_day;
    int64_t rem = ms % ms_per_day;
    if (rem < 0) {
        rem += ms_per_day;
        --days;
    }

    int64_t year;
    unsigned month, day;
    civil_from_days(days, year, month, day);

    int hour = static_cast<int>(rem / 3600000);
    int minute = static_cast<int>((rem / 60000) % 60);
    int second = static_cast<int>((rem / 1000) % 60);
    int millis = static_cast<int>(rem % 1000);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day, hour, minute, second, millis);
    return buf;
}

timestamp_ms parse_iso8601(const std::string& text) {
    size_t pos = 0;
    int year = read_number(text, pos, 4);
    expect(text, pos, '-');
    int month = read_number(text, pos, 2);
    expect(text, pos, '-');
    int day = read_number(text, pos, 2);
    if (month < 1 || month > 12 || day < 1 || day > 31) bad_timestamp(text);

    int hour = 0, minute = 0, second = 0, millis = 0;
    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ') bad_timestamp(text);
        ++pos;
        hour = read_number(text, pos, 2);
        expect(text, pos, ':');
        minute = read_number(text, pos, 2);
        expect(text, pos, ':');
        second = read_number(text, pos, 2);
        if (hour > 23 || minute > 59 || second > 60) bad_timestamp(text);

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t start = pos;
            int scale = 100;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
            if (pos == start) bad_timestamp(text);
        }
    }

    int64_t offset_ms = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int off_h = read_number(text, pos, 2);
            int off_m = 0;
            if (pos < text.size()) {
                if (text[pos] == ':') ++pos;
                off_m = read_number(text, pos, 2);
            }
            offset_ms = (off_h * 60 + off_m) * 60000LL;
            if (sign == '-') offset_ms = -offset_ms;
        } else {
            bad_timestamp(text);
        }
    }
    if (pos != text.size()) bad_timestamp(text);

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * ms_per_day + hour * 3600000LL + minute * 60000LL + second * 1000LL + millis - offset_ms;
}

bool is_timestamp_field(const std::string& name) {
    static const char* exact[] = {"created_at", "updated_at", "started_at", "completed_at"};
    for (const char* e : exact) {
        if (name == e) return true;
    }
    auto ends_with = [&](const std::string& suffix) {
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with("_at") || ends_with("_time");
}

// ============================================================================
// Codec
// ============================================================================

namespace {

bool converts_as_timestamp(const column_def& col) {
    if (col.type == logical_type::date) return false;
    return col.type == logical_type::timestamp || is_timestamp_field(col.name);
}

} // namespace

nlohmann::json to_remote(const table_schema& schema, const record& row) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& col : schema.columns) {
        if (col.name == sys::synced) continue;
        auto it = row.find(col.name);
        if (it == row.end()) continue;
        const column_value_t& value = it->second;

        if (std::holds_alternative<std::nullptr_t>(value)) {
            out[col.name] = nullptr;
        } else if (col.type == logical_type::boolean) {
            out[col.name] = detail::from_column_value<int64_t>(value) != 0;
        } else if (converts_as_timestamp(col) && std::holds_alternative<int64_t>(value)) {
            out[col.name] = to_iso8601(std::get<int64_t>(value));
        } else if (col.type == logical_type::jsonb && std::holds_alternative<std::string>(value)) {
            const auto& text = std::get<std::string>(value);
            auto parsed = nlohmann::json::parse(text, nullptr, false);
            out[col.name] = parsed.is_discarded() ? nlohmann::json(text) : parsed;
        } else if (std::holds_alternative<int64_t>(value)) {
            out[col.name] = std::get<int64_t>(value);
        } else if (std::holds_alternative<double>(value)) {
            out[col.name] = std::get<double>(value);
        } else if (std::holds_alternative<std::string>(value)) {
            out[col.name] = std::get<std::string>(value);
        } else {
            out[col.name] = std::get<std::vector<uint8_t>>(value);
        }
    }
    return out;
}

namespace {

column_value_t decode_value(const column_def& col, const nlohmann::json& v) {
    if (v.is_null()) return nullptr;

    if (converts_as_timestamp(col)) {
        if (v.is_string()) return parse_iso8601(v.get<std::string>());
        if (v.is_number()) return v.get<int64_t>();
        throw remote_error("Timestamp column " + col.name + " has non-timestamp value " + v.dump());
    }

    switch (col.type) {
        case logical_type::boolean:
            if (v.is_boolean()) return static_cast<int64_t>(v.get<bool>() ? 1 : 0);
            if (v.is_number()) return static_cast<int64_t>(v.get<double>() != 0 ? 1 : 0);
            break;
        case logical_type::integer:
        case logical_type::timestamp:
            if (v.is_number_integer()) return v.get<int64_t>();
            if (v.is_number()) return static_cast<int64_t>(v.get<double>());
            if (v.is_boolean()) return static_cast<int64_t>(v.get<bool>() ? 1 : 0);
            break;
        case logical_type::real:
            if (v.is_number()) return v.get<double>();
            break;
        case logical_type::jsonb:
            if (v.is_string()) return v.get<std::string>();
            return v.dump();
        case logical_type::text:
        case logical_type::date:
            if (v.is_string()) return v.get<std::string>();
            return v.dump();
    }
    throw remote_error("Column " + col.name + " cannot hold remote value " + v.dump());
}

} // namespace

record from_remote(const table_schema& schema, const nlohmann::json& row) {
    if (!row.is_object()) {
        throw remote_error("Remote row for " + schema.name + " is not an object");
    }
    record out;
    for (const auto& [key, value] : row.items()) {
        const column_def* col = schema.find_column(key);
        if (!col) {
            LOG_DEBUG("remote", "Dropping unknown column %s.%s", schema.name.c_str(), key.c_str());
            continue;
        }
        if (col->name == sys::synced) continue;
        out[key] = decode_value(*col, value);
    }
    out[sys::synced] = int64_t(1);
    return out;
}

// ============================================================================
// rest_remote_client
// ============================================================================

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

rest_remote_client::rest_remote_client(std::string base_url,
                                       std::string api_key,
                                       std::shared_ptr<http_client> http,
                                       const schema_registry& registry)
    : base_url_(std::move(base_url))
    , api_key_(std::move(api_key))
    , http_(std::move(http))
    , registry_(registry) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    if (!http_) {
        throw remote_error("rest_remote_client requires an http_client");
    }
}

std::string rest_remote_client::table_url(const std::string& table) const {
    return base_url_ + "/rest/v1/" + table;
}

http_request rest_remote_client::make_request(const std::string& method, const std::string& url) const {
    http_request request;
    request.method = method;
    request.url = url;
    request.headers["apikey"] = api_key_;
    request.headers["Authorization"] = "Bearer " + api_key_;
    request.headers["Accept"] = "application/json";
    return request;
}

http_response rest_remote_client::send_checked(const http_request& request) const {
    http_response response = http_->send(request);
    if (!response.is_success()) {
        LOG_ERROR("remote", "%s %s -> %d", request.method.c_str(), request.url.c_str(), response.status_code);
        throw remote_error("Remote " + request.method + " failed with status " +
                           std::to_string(response.status_code) + ": " + response.body_string(),
                           response.status_code);
    }
    return response;
}

std::vector<record_id> rest_remote_client::upsert_batch(const std::string& table,
                                                        const std::vector<record>& rows) {
    if (rows.empty()) return {};
    const auto& schema = registry_.at(table);

    nlohmann::json body = nlohmann::json::array();
    std::vector<record_id> sent;
    for (const auto& row : rows) {
        body.push_back(to_remote(schema, row));
        sent.push_back(field_string(row, sys::id).value_or(""));
    }

    auto request = make_request("POST", table_url(table) + "?on_conflict=id");
    request.headers["Prefer"] = "resolution=merge-duplicates,return=representation";
    request.set_json_body(body.dump());

    auto response = send_checked(request);
    auto text = response.body_string();
    if (text.empty()) return sent;

    auto echoed = nlohmann::json::parse(text, nullptr, false);
    if (echoed.is_discarded() || !echoed.is_array()) {
        throw remote_error("Remote upsert returned an undecodable body", response.status_code);
    }
    std::vector<record_id> written;
    for (const auto& item : echoed) {
        if (item.is_object() && item.contains("id") && item["id"].is_string()) {
            written.push_back(item["id"].get<std::string>());
        }
    }
    return written;
}

void rest_remote_client::delete_by_key(const std::string& table, const record_id& id) {
    registry_.at(table);
    send_checked(make_request("DELETE", table_url(table) + "?id=eq." + url_encode(id)));
}

std::vector<record> rest_remote_client::fetch_modified_since(const std::string& table, timestamp_ms since) {
    const auto& schema = registry_.at(table);
    auto request = make_request("GET", table_url(table) + "?select=*&updated_at=gte." +
                                           url_encode(to_iso8601(since)) + "&order=updated_at.asc");
    auto response = send_checked(request);

    auto body = nlohmann::json::parse(response.body_string(), nullptr, false);
    if (body.is_discarded() || !body.is_array()) {
        throw remote_error("Remote select returned an undecodable body", response.status_code);
    }

    std::vector<record> rows;
    rows.reserve(body.size());
    for (const auto& item : body) {
        rows.push_back(from_remote(schema, item));
    }
    return rows;
}

// ============================================================================
// memory_remote_client
// ============================================================================

void memory_remote_client::check_failure(const std::string& table, const record_id& id) const {
    if (failing_tables_.count(table)) {
        throw remote_error("Injected failure for table " + table, 500);
    }
    if (failing_ids_.count(id)) {
        throw remote_error("Injected failure for record " + id, 500);
    }
}

std::vector<record_id> memory_remote_client::upsert_batch(const std::string& table,
                                                          const std::vector<record>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++upsert_calls_;

    // A batch is all-or-nothing, like a single HTTP request
    for (const auto& row : rows) {
        check_failure(table, field_string(row, sys::id).value_or(""));
    }

    std::vector<record_id> written;
    for (const auto& row : rows) {
        auto id = field_string(row, sys::id).value_or("");
        record stored = row;
        stored.erase(sys::synced);
        tables_[table][id] = std::move(stored);
        written.push_back(id);
        upserted_ids_.push_back(id);
    }
    return written;
}

void memory_remote_client::delete_by_key(const std::string& table, const record_id& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++delete_calls_;
    check_failure(table, id);
    tables_[table].erase(id);
}

std::vector<record> memory_remote_client::fetch_modified_since(const std::string& table, timestamp_ms since) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetch_calls_;
    fetch_watermarks_.push_back(since);
    if (fail_fetch_ || failing_tables_.count(table)) {
        throw remote_error("Injected fetch failure for table " + table, 503);
    }

    std::vector<record> rows;
    auto it = tables_.find(table);
    if (it == tables_.end()) return rows;
    for (const auto& [id, row] : it->second) {
        if (field_int(row, sys::updated_at).value_or(0) >= since) {
            record copy = row;
            copy[sys::synced] = int64_t(1);
            rows.push_back(std::move(copy));
        }
    }
    std::stable_sort(rows.begin(), rows.end(), [](const record& a, const record& b) {
        return field_int(a, sys::updated_at).value_or(0) < field_int(b, sys::updated_at).value_or(0);
    });
    return rows;
}

void memory_remote_client::put(const std::string& table, record row) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = field_string(row, sys::id).value_or("");
    row.erase(sys::synced);
    tables_[table][id] = std::move(row);
}

std::optional<record> memory_remote_client::get(const std::string& table, const record_id& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto t = tables_.find(table);
    if (t == tables_.end()) return std::nullopt;
    auto r = t->second.find(id);
    if (r == t->second.end()) return std::nullopt;
    return r->second;
}

size_t memory_remote_client::size(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto t = tables_.find(table);
    return t == tables_.end() ? 0 : t->second.size();
}

void memory_remote_client::clear_failures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ids_.clear();
    failing_tables_.clear();
    fail_fetch_ = false;
}

} // namespace hearth
