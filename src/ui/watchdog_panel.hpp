#pragma once

#include "ui/status_bar.hpp"
#include "watchdog/supervisor.hpp"

#include <ftxui/component/component.hpp>
#include <functional>
#include <memory>
#include <string>

/// Renders a Supervisor: one sub-pane per command, a stats footer when stat
/// patterns are configured, and key bindings forwarded to the control
/// surface. The panel never owns process lifetime; the SessionRegistry does.
class WatchdogPanel {
public:
    struct Callbacks {
        std::function<void(const std::string& text, ToastLevel level, int seconds)> show_toast;
    };

    enum class Action {
        Restart,     // r
        Toggle,      // s: start/stop, kill in external mode
        Follow,      // f / End
        ScrollUp,
        ScrollDown,
        PageUp,
        PageDown,
        Home,
        NextPane,    // Tab
    };

    WatchdogPanel();
    ~WatchdogPanel();

    void set_callbacks(Callbacks cb);

    /// Show `session`. A re-attached session gets a visible notice line.
    void attach(const std::string& title, SupervisorRef session, bool reattached);
    void detach();

    SupervisorRef session() const;
    JobStatus status() const;

    /// Apply a key action; false if it did nothing
    bool perform(Action action);

    bool auto_follow() const;
    std::size_t focused_pane() const;
    int scroll_offset() const;

    /// Refresh stat counters from the logs (done on every render)
    void update_stats();
    std::vector<std::pair<std::string, std::size_t>> stats() const;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
