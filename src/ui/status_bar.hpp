#pragma once

#include <ftxui/component/component.hpp>
#include <chrono>
#include <string>
#include <mutex>
#include <atomic>

enum class ToastLevel { Info, Success, Error };

struct JobStatus {
    std::string title;
    bool started = false;
    bool external = false;
    bool external_running = false;
    int active_workers = 0;
};

class StatusBar {
public:
    StatusBar();
    ~StatusBar();

    ftxui::Component component();

    // Thread-safe setters for background updates
    void set_job(const JobStatus& status);
    void clear_job();
    void show_toast(const std::string& text, ToastLevel level, int seconds = 2);

    /// Current toast text, empty once it has expired
    std::string active_toast() const;

    static std::string describe(const JobStatus& status);

private:
    mutable std::mutex mutex_;
    std::atomic<bool> has_job_{false};
    JobStatus job_;
    std::string toast_;
    ToastLevel toast_level_ = ToastLevel::Info;
    std::chrono::steady_clock::time_point toast_until_{};
};
