#pragma once

#include <atomic>

enum class Lang { EN, ZH };

struct Strings {
    // General
    const char* app_title;
    const char* jobs;
    const char* no_jobs;
    const char* select_job;
    const char* no_output;

    // Job state
    const char* state_running;
    const char* state_stopped;
    const char* state_external_running;
    const char* state_external_not_running;

    // Watchdog panel
    const char* watchdog_restarting;
    const char* watchdog_restart_unsupported;
    const char* watchdog_started;
    const char* watchdog_stop_requested;
    const char* watchdog_kill_invoked;
    const char* watchdog_no_kill_cmd;
    const char* watchdog_follow_resumed;
    const char* watchdog_following;
    const char* watchdog_paused;

    // Footer
    const char* key_restart;
    const char* key_start_stop;
    const char* key_kill;
    const char* key_follow;
    const char* key_switch_pane;
    const char* key_language;
    const char* key_quit;

    // Errors
    const char* err_invalid_config;
    const char* err_config_missing;
};

#include "i18n/en.hpp"
#include "i18n/zh.hpp"

inline const Strings EN_STRINGS = EN_STRINGS_DEF;
inline const Strings ZH_STRINGS = ZH_STRINGS_DEF;
inline std::atomic<Lang> current_lang{Lang::EN};

inline const Strings& T() {
    return current_lang.load() == Lang::ZH ? ZH_STRINGS : EN_STRINGS;
}
