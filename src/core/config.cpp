#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    std::string value = node.as<std::string>("");
    if (value.empty()) return std::nullopt;
    return value;
}

JobSpec parse_job(const YAML::Node& node) {
    JobSpec job;
    job.id = node["id"].as<std::string>("");
    job.title = node["title"].as<std::string>(job.id);

    if (auto cmds = node["commands"]) {
        for (const auto& c : cmds) {
            job.commands.push_back(c.as<std::string>());
        }
    }

    WatchdogConfig& wd = job.watchdog;
    wd.sequential = node["sequential"].as<bool>(wd.sequential);
    wd.auto_restart = node["auto_restart"].as<bool>(wd.auto_restart);
    wd.max_retries = node["max_retries"].as<unsigned>(wd.max_retries);
    wd.restart_delay_ms = node["restart_delay_ms"].as<std::uint64_t>(wd.restart_delay_ms);
    wd.stop_on_failure = node["stop_on_failure"].as<bool>(wd.stop_on_failure);

    // Absent key keeps the {0} default; an explicit empty list accepts any code
    if (auto codes = node["allowed_exit_codes"]) {
        wd.allowed_exit_codes.clear();
        for (const auto& c : codes) {
            wd.allowed_exit_codes.insert(c.as<int>());
        }
    }

    wd.panic_exit_cmd = optional_string(node["on_panic_exit_cmd"]);
    wd.external_check_cmd = optional_string(node["external_check_cmd"]);
    wd.external_kill_cmd = optional_string(node["external_kill_cmd"]);

    if (auto stats = node["stats"]) {
        for (const auto& s : stats) {
            StatPattern p;
            p.label = s["label"].as<std::string>("");
            p.regexp = s["regexp"].as<std::string>("");
            if (p.label.empty() || p.regexp.empty()) continue;
            wd.stat_patterns.push_back(std::move(p));
        }
    }

    return job;
}

void emit_job(YAML::Emitter& out, const JobSpec& job) {
    const WatchdogConfig& wd = job.watchdog;

    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << job.id;
    out << YAML::Key << "title" << YAML::Value << job.title;

    out << YAML::Key << "commands" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : job.commands) out << c;
    out << YAML::EndSeq;

    out << YAML::Key << "sequential" << YAML::Value << wd.sequential;
    out << YAML::Key << "auto_restart" << YAML::Value << wd.auto_restart;
    out << YAML::Key << "max_retries" << YAML::Value << wd.max_retries;
    out << YAML::Key << "restart_delay_ms" << YAML::Value << wd.restart_delay_ms;
    out << YAML::Key << "stop_on_failure" << YAML::Value << wd.stop_on_failure;

    out << YAML::Key << "allowed_exit_codes" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (int code : wd.allowed_exit_codes) out << code;
    out << YAML::EndSeq;

    if (wd.panic_exit_cmd) {
        out << YAML::Key << "on_panic_exit_cmd" << YAML::Value << *wd.panic_exit_cmd;
    }
    if (wd.external_check_cmd) {
        out << YAML::Key << "external_check_cmd" << YAML::Value << *wd.external_check_cmd;
    }
    if (wd.external_kill_cmd) {
        out << YAML::Key << "external_kill_cmd" << YAML::Value << *wd.external_kill_cmd;
    }

    if (!wd.stat_patterns.empty()) {
        out << YAML::Key << "stats" << YAML::Value << YAML::BeginSeq;
        for (const auto& p : wd.stat_patterns) {
            out << YAML::BeginMap;
            out << YAML::Key << "label" << YAML::Value << p.label;
            out << YAML::Key << "regexp" << YAML::Value << p.regexp;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }

    out << YAML::EndMap;
}

} // namespace

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;
Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/chi-watchdog";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/chi-watchdog";
}

std::string Config::config_path() {
    if (const char* override_path = std::getenv("CHI_WATCHDOG_CONFIG")) {
        if (*override_path) return expand_home(override_path);
    }
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_log_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/chi-watchdog.log";
}

std::string Config::job_key(const std::string& id) {
    return "menu:" + id;
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    AppConfig parsed;
    try {
        YAML::Node root = YAML::LoadFile(path);

        // Display section
        if (auto display = root["display"]) {
            parsed.language = display["language"].as<std::string>(parsed.language);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            parsed.log_level = logging["level"].as<std::string>(parsed.log_level);
            parsed.log_file = expand_home(logging["file"].as<std::string>(parsed.log_file));
        }

        // Jobs section
        if (auto jobs = root["jobs"]) {
            for (const auto& node : jobs) {
                parsed.jobs.push_back(parse_job(node));
            }
        }
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        spdlog::warn("[config] failed to parse {}: {}", path, e.what());
        return false;
    }

    config_ = std::move(parsed);
    return true;
}

bool Config::save() {
    return save_to(config_path());
}

bool Config::save_to(const std::string& path) {
    if (path.empty()) return false;

    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("[config] cannot create {}: {}", path, e.what());
        return false;
    }

    YAML::Emitter out;
    out << YAML::BeginMap;

    // Display section
    out << YAML::Key << "display" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "language" << YAML::Value << config_.language;
    out << YAML::EndMap;

    // Logging section
    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config_.log_level;
    out << YAML::Key << "file" << YAML::Value << config_.log_file;
    out << YAML::EndMap;

    // Jobs section
    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& job : config_.jobs) {
        emit_job(out, job);
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    std::ofstream fout(path);
    if (!fout.is_open()) return false;
    fout << out.c_str() << "\n";
    return fout.good();
}

ValidationResult Config::validate() const {
    ValidationResult result;
    std::set<std::string> seen;

    auto fail = [&result](std::string msg) {
        result.ok = false;
        result.errors.push_back(std::move(msg));
    };

    for (const auto& job : config_.jobs) {
        if (job.id.empty()) {
            fail("job with empty id");
            continue;
        }
        if (!seen.insert(job.id).second) {
            fail("duplicate job id '" + job.id + "'");
        }
        if (job.commands.empty() && !job.watchdog.is_external()) {
            fail("job '" + job.id + "' requires non-empty 'commands'");
        }
        if (job.watchdog.max_retries > MAX_RETRIES_LIMIT) {
            fail("job '" + job.id + "' max_retries too large");
        }
    }
    return result;
}

const JobSpec* Config::find_job(const std::string& id) const {
    for (const auto& job : config_.jobs) {
        if (job.id == id) return &job;
    }
    return nullptr;
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
