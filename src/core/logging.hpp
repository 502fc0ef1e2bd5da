#pragma once

#include <string>

struct LogOptions {
    std::string level = "info";  // trace|debug|info|warn|error|critical|off
    std::string file;            // empty = no file sink
    bool to_stderr = false;      // headless runs also log to the terminal
};

/// Install the process-wide spdlog default logger.
/// The TUI owns the terminal, so interactive sessions log to a file only.
/// Returns false if the file sink could not be opened (stderr sink or a
/// null logger is installed instead).
bool init_logging(const LogOptions& options);
