#pragma once

// English string table - included by i18n.hpp after Strings is defined

inline constexpr Strings EN_STRINGS_DEF = {
    // General
    "chi-watchdog",
    "Jobs",
    "No jobs configured",
    "Select a job and press Enter",
    "(no output)",

    // Job state
    "Running",
    "Stopped",
    "External: running",
    "External: not running",

    // Watchdog panel
    "Watchdog restarting...",
    "External mode: restart not supported",
    "Watchdog started",
    "Watchdog stop requested",
    "External kill invoked",
    "External mode: no kill command configured",
    "Auto-follow resumed",
    "Following",
    "Paused",

    // Footer
    "Restart",
    "Start/Stop",
    "Kill",
    "Follow",
    "Pane",
    "Language",
    "Quit",

    // Errors
    "Invalid config",
    "Config file not found",
};
