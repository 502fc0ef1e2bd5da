#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

bool init_logging(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    bool file_ok = true;

    if (!options.file.empty()) {
        try {
            fs::path parent = fs::path(options.file).parent_path();
            if (!parent.empty()) fs::create_directories(parent);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file));
        } catch (const std::exception& e) {
            // spdlog_ex and filesystem_error both land here
            file_ok = false;
            if (options.to_stderr) {
                fprintf(stderr, "chi-watchdog: cannot open log file %s: %s\n",
                        options.file.c_str(), e.what());
            }
        }
    }
    if (options.to_stderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("chi-watchdog", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(options.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    return file_ok;
}
