#include "hearth/models.hpp"

namespace hearth {

namespace {

schema_registry build_default_registry() {
    schema_registry registry;

    registry.add(make_table("pomodoro_sessions", [](table_builder& t) {
        t.column("session_date", logical_type::date).not_null()
         .column("session_number", logical_type::integer).not_null()
         .column("status", logical_type::text).not_null().default_value("active")
         .column("planned_duration", logical_type::integer).not_null()
         .column("actual_duration", logical_type::integer).default_value(0)
         .column("pause_count", logical_type::integer).default_value(0)
         .column("total_pause_duration", logical_type::integer).default_value(0)
         .column("started_at", logical_type::timestamp).not_null()
         .column("completed_at", logical_type::timestamp)
         .column("efficiency_score", logical_type::real).default_value(0.0)
         .index({"session_date"})
         .index({"status"});
    }));

    registry.add(make_table("pomodoro_log", [](table_builder& t) {
        t.column("log_date", logical_type::date).not_null().unique()
         .column("work_sessions", logical_type::integer).default_value(0)
         .column("total_work_time", logical_type::integer).default_value(0)
         .column("target_sessions", logical_type::integer).not_null()
         .column("focus_score", logical_type::real).default_value(0.0)
         .column("daily_notes", logical_type::text)
         .column("average_efficiency", logical_type::real).default_value(0.0)
         .column("total_pause_count", logical_type::integer).default_value(0)
         .column("completion_rate", logical_type::real).default_value(0.0)
         .index({"log_date"}, "", true)
         .index({"focus_score"});
    }));

    registry.add(make_table("pomodoro_streak", [](table_builder& t) {
        t.column("current_streak", logical_type::integer).default_value(0)
         .column("best_streak", logical_type::integer).default_value(0)
         .column("total_days_logged", logical_type::integer).default_value(0)
         .column("last_streak_date", logical_type::date);
    }));

    registry.add(make_table("app_settings", [](table_builder& t) {
        t.column("work_session_duration", logical_type::integer).default_value(25)
         .column("daily_target_sessions", logical_type::integer).default_value(8)
         .column("short_break_duration", logical_type::integer).default_value(5)
         .column("long_break_duration", logical_type::integer).default_value(15)
         .column("sessions_before_long_break", logical_type::integer).default_value(4);
    }));

    return registry;
}

} // namespace

const schema_registry& default_registry() {
    static const schema_registry registry = build_default_registry();
    return registry;
}

} // namespace hearth
