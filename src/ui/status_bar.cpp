#include "ui/status_bar.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>

using namespace ftxui;

StatusBar::StatusBar() = default;
StatusBar::~StatusBar() = default;

void StatusBar::set_job(const JobStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    job_ = status;
    has_job_.store(true);
}

void StatusBar::clear_job() {
    has_job_.store(false);
}

void StatusBar::show_toast(const std::string& text, ToastLevel level, int seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    toast_ = text;
    toast_level_ = level;
    toast_until_ = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
}

std::string StatusBar::active_toast() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::chrono::steady_clock::now() >= toast_until_) return "";
    return toast_;
}

std::string StatusBar::describe(const JobStatus& status) {
    if (status.external) {
        return status.external_running ? T().state_external_running
                                        : T().state_external_not_running;
    }
    if (!status.started) return T().state_stopped;
    return std::string(T().state_running) + " (" + std::to_string(status.active_workers) + ")";
}

Component StatusBar::component() {
    return Renderer([this] {
        JobStatus job;
        ToastLevel level;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            job = job_;
            level = toast_level_;
        }
        std::string toast = active_toast();
        bool has_job = has_job_.load();

        // Left: job title
        auto title_text = text(" " + (has_job ? job.title : std::string(T().app_title)) + " ") | bold;

        // Center: job state
        Element state_text = text("");
        if (has_job) {
            bool live = job.external ? job.external_running : job.started;
            state_text = live
                ? text("● " + describe(job)) | color(Color::Green)
                : text("○ " + describe(job)) | color(Color::Red);
        }

        // Right: toast
        Element toast_text = text("");
        if (!toast.empty()) {
            Color c = level == ToastLevel::Error ? Color::Red
                    : level == ToastLevel::Success ? Color::Green
                    : Color::Yellow;
            toast_text = text(" " + toast + " ") | color(c);
        }

        return hbox({
            title_text,
            filler(),
            state_text,
            filler(),
            toast_text,
        }) | inverted;
    });
}
