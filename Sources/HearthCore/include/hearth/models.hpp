#pragma once

#ifdef __cplusplus

#include "record.hpp"
#include "schema.hpp"

namespace hearth {

/// The application's tables, in migration and sync order:
/// pomodoro_sessions, pomodoro_log, pomodoro_streak, app_settings.
const schema_registry& default_registry();

// One work session
struct pomodoro_session : record_base {
    std::string session_date;                    // YYYY-MM-DD
    int session_number = 0;                      // 1-based within the day
    std::string status = "active";               // active, paused, completed, cancelled
    int planned_duration = 0;                    // minutes
    int actual_duration = 0;                     // minutes
    int pause_count = 0;
    int total_pause_duration = 0;                // seconds
    timestamp_ms started_at = 0;
    std::optional<timestamp_ms> completed_at;
    double efficiency_score = 0;                 // 0-100
};

// One row per day
struct pomodoro_log : record_base {
    std::string log_date;                        // YYYY-MM-DD, unique
    int work_sessions = 0;
    int total_work_time = 0;                     // minutes
    int target_sessions = 0;
    double focus_score = 0;                      // 1-10
    std::optional<std::string> daily_notes;
    double average_efficiency = 0;
    int total_pause_count = 0;
    double completion_rate = 0;                  // 0-1
};

// Single cached row
struct pomodoro_streak : record_base {
    int current_streak = 0;
    int best_streak = 0;
    int total_days_logged = 0;
    std::optional<std::string> last_streak_date; // YYYY-MM-DD, never a timestamp
};

// Single row
struct app_settings : record_base {
    int work_session_duration = 25;
    int daily_target_sessions = 8;
    int short_break_duration = 5;
    int long_break_duration = 15;
    int sessions_before_long_break = 4;
};

} // namespace hearth

HEARTH_RECORD(hearth::pomodoro_session, "pomodoro_sessions",
              session_date, session_number, status, planned_duration, actual_duration,
              pause_count, total_pause_duration, started_at, completed_at, efficiency_score)

HEARTH_RECORD(hearth::pomodoro_log, "pomodoro_log",
              log_date, work_sessions, total_work_time, target_sessions, focus_score,
              daily_notes, average_efficiency, total_pause_count, completion_rate)

HEARTH_RECORD(hearth::pomodoro_streak, "pomodoro_streak",
              current_streak, best_streak, total_days_logged, last_streak_date)

HEARTH_RECORD(hearth::app_settings, "app_settings",
              work_session_duration, daily_target_sessions, short_break_duration,
              long_break_duration, sessions_before_long_break)

#endif // __cplusplus
