#pragma once

#include "watchdog/watchdog_config.hpp"

#include <string>
#include <vector>

/// One supervised job as declared in the config file
struct JobSpec {
    std::string id;
    std::string title;
    std::vector<std::string> commands;
    WatchdogConfig watchdog;

    /// Command lines handed to the Supervisor. An external-mode job may
    /// declare no commands; its check command then labels the single pane.
    std::vector<std::string> supervised_commands() const {
        if (commands.empty() && watchdog.external_check_cmd) {
            return {*watchdog.external_check_cmd};
        }
        return commands;
    }
};

struct AppConfig {
    // Display
    std::string language = "en";

    // Logging
    std::string log_level = "info";
    std::string log_file;  // empty = <config_dir>/chi-watchdog.log

    // Jobs
    std::vector<JobSpec> jobs;
};

struct ValidationResult {
    bool ok = true;
    std::vector<std::string> errors;
};

class Config {
public:
    /// Upper bound accepted for a job's max_retries
    static constexpr unsigned MAX_RETRIES_LIMIT = 1000;

    Config();
    ~Config();

    bool load();
    bool load_from(const std::string& path);
    bool save();
    bool save_to(const std::string& path);

    AppConfig& data();
    const AppConfig& data() const;

    /// Check job ids and watchdog fields; never throws
    ValidationResult validate() const;

    /// Find a job by id, nullptr if absent
    const JobSpec* find_job(const std::string& id) const;

    /// Registry key for a job ("menu:<id>")
    static std::string job_key(const std::string& id);

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string default_log_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
