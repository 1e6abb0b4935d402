#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>
#include <unordered_map>

namespace hearth {

// Epoch milliseconds, the timestamp representation of every record
using timestamp_ms = int64_t;

inline timestamp_ms now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Record identifier (lowercase hyphenated UUID v4)
using record_id = std::string;

struct uuid {
    std::array<uint8_t, 16> bytes{};

    // Lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    static uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        // Version 4, RFC 4122 variant
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

        return result;
    }
};

inline record_id generate_record_id() {
    return uuid::generate().to_string();
}

// Supported column values
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One row: column name -> value
using record = std::unordered_map<std::string, column_value_t>;

// Ordered column/value pairs for writes (declaration order is kept)
using field_list = std::vector<std::pair<std::string, column_value_t>>;

// ============================================================================
// Record field accessors
// ============================================================================

inline bool field_is_null(const record& r, const std::string& name) {
    auto it = r.find(name);
    return it == r.end() || std::holds_alternative<std::nullptr_t>(it->second);
}

inline std::optional<int64_t> field_int(const record& r, const std::string& name) {
    auto it = r.find(name);
    if (it == r.end()) return std::nullopt;
    if (std::holds_alternative<int64_t>(it->second)) return std::get<int64_t>(it->second);
    if (std::holds_alternative<double>(it->second)) return static_cast<int64_t>(std::get<double>(it->second));
    return std::nullopt;
}

inline std::optional<double> field_real(const record& r, const std::string& name) {
    auto it = r.find(name);
    if (it == r.end()) return std::nullopt;
    if (std::holds_alternative<double>(it->second)) return std::get<double>(it->second);
    if (std::holds_alternative<int64_t>(it->second)) return static_cast<double>(std::get<int64_t>(it->second));
    return std::nullopt;
}

inline std::optional<std::string> field_string(const record& r, const std::string& name) {
    auto it = r.find(name);
    if (it != r.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return std::nullopt;
}

inline bool field_bool(const record& r, const std::string& name) {
    auto v = field_int(r, name);
    return v.has_value() && *v != 0;
}

// ============================================================================
// Helper types and functions for property conversion
// ============================================================================

namespace detail {
    template<typename T> struct is_optional : std::false_type {};
    template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    struct unwrap_optional { using type = T; };
    template<typename T>
    struct unwrap_optional<std::optional<T>> { using type = T; };

    inline column_value_t to_column_value(int64_t v) { return v; }
    inline column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }
    inline column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    inline column_value_t to_column_value(double v) { return v; }
    inline column_value_t to_column_value(const std::string& v) { return v; }
    inline column_value_t to_column_value(const char* v) { return std::string(v); }
    inline column_value_t to_column_value(const std::vector<uint8_t>& v) { return v; }

    template<typename T>
    column_value_t to_column_value(const std::optional<T>& v) {
        if (!v.has_value()) return nullptr;
        return to_column_value(*v);
    }

    template<typename T>
    T from_column_value(const column_value_t& v);

    template<> inline int64_t from_column_value<int64_t>(const column_value_t& v) {
        if (std::holds_alternative<double>(v)) return static_cast<int64_t>(std::get<double>(v));
        return std::get<int64_t>(v);
    }
    template<> inline int from_column_value<int>(const column_value_t& v) {
        return static_cast<int>(from_column_value<int64_t>(v));
    }
    template<> inline bool from_column_value<bool>(const column_value_t& v) {
        return from_column_value<int64_t>(v) != 0;
    }
    template<> inline double from_column_value<double>(const column_value_t& v) {
        // REAL affinity still hands back integers for whole values written as INTEGER
        if (std::holds_alternative<int64_t>(v)) return static_cast<double>(std::get<int64_t>(v));
        return std::get<double>(v);
    }
    template<> inline std::string from_column_value<std::string>(const column_value_t& v) {
        return std::get<std::string>(v);
    }
    template<> inline std::vector<uint8_t> from_column_value<std::vector<uint8_t>>(const column_value_t& v) {
        return std::get<std::vector<uint8_t>>(v);
    }

    template<typename T>
    void read_field(const record& r, const char* name, T& out) {
        auto it = r.find(name);
        if constexpr (is_optional<T>::value) {
            if (it == r.end() || std::holds_alternative<std::nullptr_t>(it->second)) {
                out = std::nullopt;
            } else {
                out = from_column_value<typename unwrap_optional<T>::type>(it->second);
            }
        } else {
            if (it != r.end() && !std::holds_alternative<std::nullptr_t>(it->second)) {
                out = from_column_value<T>(it->second);
            }
        }
    }

    inline std::string describe(const column_value_t& v) {
        return std::visit([](auto&& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) return "NULL";
            else if constexpr (std::is_same_v<T, int64_t>) return std::to_string(x);
            else if constexpr (std::is_same_v<T, double>) return std::to_string(x);
            else if constexpr (std::is_same_v<T, std::string>) return "'" + x + "'";
            else return "<blob " + std::to_string(x.size()) + " bytes>";
        }, v);
    }
} // namespace detail

} // namespace hearth

#endif // __cplusplus
