#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "schema.hpp"

namespace hearth {

/// System fields every typed record carries. Filled from rows on reads,
/// never written by typed repositories.
struct record_base {
    record_id id;
    timestamp_ms created_at = 0;
    timestamp_ms updated_at = 0;
    bool synced = false;
    bool deleted = false;
};

/// Specialized by HEARTH_RECORD for each mapped struct.
template<typename T>
struct record_traits;

namespace detail {
    inline void read_system_fields(const record& row, record_base& out) {
        read_field(row, sys::id, out.id);
        read_field(row, sys::created_at, out.created_at);
        read_field(row, sys::updated_at, out.updated_at);
        read_field(row, sys::synced, out.synced);
        read_field(row, sys::deleted, out.deleted);
    }
}

} // namespace hearth

// ============================================================================
// HEARTH_RECORD - map a plain struct to a table row
// ============================================================================
//
//   struct pomodoro_streak : hearth::record_base {
//       int current_streak = 0;
//       std::optional<std::string> last_streak_date;
//   };
//   HEARTH_RECORD(pomodoro_streak, "pomodoro_streak", current_streak, last_streak_date)
//
// Must be used at global scope.
// ============================================================================

// FOR_EACH variadic macro helpers (recursive expansion, up to 16 fields)
#define HFE_0(WHAT, cls)
#define HFE_1(WHAT, cls, X) WHAT(cls, X)
#define HFE_2(WHAT, cls, X, ...) WHAT(cls, X) HFE_1(WHAT, cls, __VA_ARGS__)
#define HFE_3(WHAT, cls, X, ...) WHAT(cls, X) HFE_2(WHAT, cls, __VA_ARGS__)
#define HFE_4(WHAT, cls, X, ...) WHAT(cls, X) HFE_3(WHAT, cls, __VA_ARGS__)
#define HFE_5(WHAT, cls, X, ...) WHAT(cls, X) HFE_4(WHAT, cls, __VA_ARGS__)
#define HFE_6(WHAT, cls, X, ...) WHAT(cls, X) HFE_5(WHAT, cls, __VA_ARGS__)
#define HFE_7(WHAT, cls, X, ...) WHAT(cls, X) HFE_6(WHAT, cls, __VA_ARGS__)
#define HFE_8(WHAT, cls, X, ...) WHAT(cls, X) HFE_7(WHAT, cls, __VA_ARGS__)
#define HFE_9(WHAT, cls, X, ...) WHAT(cls, X) HFE_8(WHAT, cls, __VA_ARGS__)
#define HFE_10(WHAT, cls, X, ...) WHAT(cls, X) HFE_9(WHAT, cls, __VA_ARGS__)
#define HFE_11(WHAT, cls, X, ...) WHAT(cls, X) HFE_10(WHAT, cls, __VA_ARGS__)
#define HFE_12(WHAT, cls, X, ...) WHAT(cls, X) HFE_11(WHAT, cls, __VA_ARGS__)
#define HFE_13(WHAT, cls, X, ...) WHAT(cls, X) HFE_12(WHAT, cls, __VA_ARGS__)
#define HFE_14(WHAT, cls, X, ...) WHAT(cls, X) HFE_13(WHAT, cls, __VA_ARGS__)
#define HFE_15(WHAT, cls, X, ...) WHAT(cls, X) HFE_14(WHAT, cls, __VA_ARGS__)
#define HFE_16(WHAT, cls, X, ...) WHAT(cls, X) HFE_15(WHAT, cls, __VA_ARGS__)

#define HEARTH_GET_MACRO(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, NAME, ...) NAME

#define HEARTH_FOR_EACH(action, cls, ...) \
    HEARTH_GET_MACRO(_0, __VA_ARGS__, \
        HFE_16, HFE_15, HFE_14, HFE_13, HFE_12, HFE_11, HFE_10, HFE_9, \
        HFE_8, HFE_7, HFE_6, HFE_5, HFE_4, HFE_3, HFE_2, HFE_1, HFE_0)(action, cls, __VA_ARGS__)

#define HEARTH_COLLECT_FIELD(cls, prop) \
    result.emplace_back(#prop, ::hearth::detail::to_column_value(obj.prop));

#define HEARTH_READ_FIELD(cls, prop) \
    ::hearth::detail::read_field(row, #prop, obj.prop);

#define HEARTH_FIELD_NAME(cls, prop) \
    names.emplace_back(#prop);

#define HEARTH_RECORD(cls, table, ...) \
    template<> \
    struct hearth::record_traits<cls> { \
        static constexpr const char* table_name = table; \
        \
        /* Domain fields in declaration order */ \
        static ::hearth::field_list to_fields(const cls& obj) { \
            ::hearth::field_list result; \
            HEARTH_FOR_EACH(HEARTH_COLLECT_FIELD, cls, __VA_ARGS__) \
            return result; \
        } \
        \
        static cls from_record(const ::hearth::record& row) { \
            cls obj; \
            ::hearth::detail::read_system_fields(row, obj); \
            HEARTH_FOR_EACH(HEARTH_READ_FIELD, cls, __VA_ARGS__) \
            return obj; \
        } \
        \
        static std::vector<std::string> field_names() { \
            std::vector<std::string> names; \
            HEARTH_FOR_EACH(HEARTH_FIELD_NAME, cls, __VA_ARGS__) \
            return names; \
        } \
    };

#endif // __cplusplus
