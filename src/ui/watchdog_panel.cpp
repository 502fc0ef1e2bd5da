#include "ui/watchdog_panel.hpp"
#include "watchdog/stats_aggregator.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <algorithm>
#include <cctype>
#include <optional>

using namespace ftxui;

static const int DEFAULT_PAGE_LINES = 10;

struct WatchdogPanel::Impl {
    Callbacks callbacks;

    std::string title;
    SupervisorRef session;
    std::vector<CommandLog> cmds;
    std::optional<StatsAggregator> stats;

    // Shared scroll position for all sub-panes, in lines from the top
    int scroll_offset = 0;
    bool auto_follow = true;
    std::size_t focused_idx = 0;
    std::vector<Box> pane_boxes;

    void toast(const std::string& text, ToastLevel level, int seconds = 2) {
        if (callbacks.show_toast) callbacks.show_toast(text, level, seconds);
    }

    int longest_log() const {
        std::size_t longest = 0;
        for (const auto& c : cmds) longest = std::max(longest, c.log->len());
        return static_cast<int>(longest);
    }

    int page_lines() const {
        int h = 0;
        for (const auto& b : pane_boxes) h = std::max(h, b.y_max - b.y_min - 1);
        return h > 0 ? h : DEFAULT_PAGE_LINES;
    }

    void scroll_by(int delta) {
        if (auto_follow) scroll_offset = std::max(0, longest_log() - 1);
        auto_follow = false;
        scroll_offset = std::clamp(scroll_offset + delta, 0, std::max(0, longest_log() - 1));
    }

    bool restart() {
        if (!session) return false;
        if (session->restart_all(true) == ControlResult::Unsupported) {
            toast(T().watchdog_restart_unsupported, ToastLevel::Info);
        } else {
            auto_follow = true;
            toast(T().watchdog_restarting, ToastLevel::Info);
        }
        return true;
    }

    bool toggle() {
        if (!session) return false;
        if (session->is_external()) {
            if (session->kill_external()) {
                toast(T().watchdog_kill_invoked, ToastLevel::Info);
            } else {
                toast(T().watchdog_no_kill_cmd, ToastLevel::Error, 3);
            }
        } else if (session->is_started()) {
            session->note("[stop requested]");
            session->stop_all();
            toast(T().watchdog_stop_requested, ToastLevel::Info);
        } else {
            session->start();
            toast(T().watchdog_started, ToastLevel::Success);
        }
        return true;
    }

    Element render_pane(std::size_t idx, bool focused) {
        const auto& cmd = cmds[idx];
        auto lines = cmd.log->snapshot();

        Elements rows;
        rows.reserve(lines.size());
        for (auto& line : lines) {
            Element row = text(line);
            if (line.rfind("[stderr]", 0) == 0) {
                row = row | color(Color::Yellow);
            } else if (line.rfind("[panic", 0) == 0 || line.rfind("[spawn error]", 0) == 0 ||
                       line.rfind("[error]", 0) == 0) {
                row = row | color(Color::Red);
            } else if (line.rfind("[", 0) == 0) {
                row = row | dim;
            }
            rows.push_back(row);
        }
        if (rows.empty()) {
            rows.push_back(text(T().no_output) | dim);
        }

        auto body = vbox(std::move(rows));
        if (auto_follow) {
            body = body | focusPositionRelative(0, 1); // auto-scroll to bottom
        } else {
            int last = std::max(0, static_cast<int>(lines.size()) - 1);
            body = body | focusPosition(0, std::min(scroll_offset, last));
        }

        auto header = text(" " + cmd.cmdline + " ");
        if (focused) header = header | bold | color(Color::Cyan);

        if (pane_boxes.size() != cmds.size()) pane_boxes.resize(cmds.size());
        return window(header, body | vscroll_indicator | frame | flex) | reflect(pane_boxes[idx]) | flex;
    }

    static Color stat_color(const std::string& label) {
        std::string l = label;
        std::transform(l.begin(), l.end(), l.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (l.find("err") != std::string::npos) return Color::Red;
        if (l.find("warn") != std::string::npos) return Color::Yellow;
        if (l.find("info") != std::string::npos) return Color::Cyan;
        if (l.find("debug") != std::string::npos) return Color::Blue;
        return Color::GrayLight;
    }

    Element render_stats() {
        Elements items;
        auto labels = stats->labels();
        const auto& counts = stats->counts();
        for (std::size_t i = 0; i < labels.size(); ++i) {
            Color c = stat_color(labels[i]);
            items.push_back(hbox({
                text(" ●") | color(c),
                text(" " + labels[i]) | bold | color(c),
                text("  × " + std::to_string(i < counts.size() ? counts[i] : 0)),
            }));
        }
        return vbox(std::move(items)) | bgcolor(Color::RGB(24, 24, 24));
    }
};

WatchdogPanel::WatchdogPanel() : impl_(std::make_unique<Impl>()) {}
WatchdogPanel::~WatchdogPanel() = default;

void WatchdogPanel::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

void WatchdogPanel::attach(const std::string& title, SupervisorRef session, bool reattached) {
    impl_->title = title;
    impl_->session = std::move(session);
    impl_->cmds = impl_->session->commands();
    impl_->scroll_offset = 0;
    impl_->auto_follow = true;
    impl_->focused_idx = 0;
    impl_->pane_boxes.clear();

    const auto& patterns = impl_->session->config().stat_patterns;
    if (patterns.empty()) {
        impl_->stats.reset();
    } else {
        impl_->stats.emplace(patterns, impl_->cmds.size());
    }

    if (reattached) {
        impl_->session->note("[re-attached to running session]");
    }
}

void WatchdogPanel::detach() {
    impl_->session.reset();
    impl_->cmds.clear();
    impl_->stats.reset();
    impl_->pane_boxes.clear();
}

SupervisorRef WatchdogPanel::session() const { return impl_->session; }

JobStatus WatchdogPanel::status() const {
    JobStatus st;
    st.title = impl_->title;
    if (impl_->session) {
        st.started = impl_->session->is_started();
        st.external = impl_->session->is_external();
        st.external_running = impl_->session->is_external_running();
        st.active_workers = impl_->session->active_workers();
    }
    return st;
}

bool WatchdogPanel::perform(Action action) {
    switch (action) {
    case Action::Restart:
        return impl_->restart();
    case Action::Toggle:
        return impl_->toggle();
    case Action::Follow:
        // Resume auto-follow and jump to bottom on next render
        impl_->auto_follow = true;
        impl_->toast(T().watchdog_follow_resumed, ToastLevel::Success);
        return true;
    case Action::ScrollUp:
        impl_->scroll_by(-1);
        return true;
    case Action::ScrollDown:
        impl_->scroll_by(1);
        return true;
    case Action::PageUp:
        impl_->scroll_by(-impl_->page_lines());
        return true;
    case Action::PageDown:
        impl_->scroll_by(impl_->page_lines());
        return true;
    case Action::Home:
        impl_->auto_follow = false;
        impl_->scroll_offset = 0;
        return true;
    case Action::NextPane:
        if (impl_->cmds.empty()) return false;
        impl_->focused_idx = (impl_->focused_idx + 1) % impl_->cmds.size();
        return true;
    }
    return false;
}

bool WatchdogPanel::auto_follow() const { return impl_->auto_follow; }
std::size_t WatchdogPanel::focused_pane() const { return impl_->focused_idx; }
int WatchdogPanel::scroll_offset() const { return impl_->scroll_offset; }

void WatchdogPanel::update_stats() {
    if (!impl_->stats) return;
    std::vector<RingBufferLogRef> logs;
    logs.reserve(impl_->cmds.size());
    for (const auto& c : impl_->cmds) logs.push_back(c.log);
    impl_->stats->update_from_buffers(logs);
}

std::vector<std::pair<std::string, std::size_t>> WatchdogPanel::stats() const {
    std::vector<std::pair<std::string, std::size_t>> out;
    if (!impl_->stats) return out;
    auto labels = impl_->stats->labels();
    const auto& counts = impl_->stats->counts();
    for (std::size_t i = 0; i < labels.size(); ++i) {
        out.emplace_back(labels[i], counts[i]);
    }
    return out;
}

Component WatchdogPanel::component() {
    auto self = impl_.get();

    return Renderer([this, self](bool focused) -> Element {
        if (!self->session) {
            return text(T().select_job) | dim | center | flex | border;
        }

        Elements panes;
        for (std::size_t i = 0; i < self->cmds.size(); ++i) {
            panes.push_back(self->render_pane(i, focused && i == self->focused_idx));
        }

        Elements layout;
        layout.push_back(vbox(std::move(panes)) | flex);

        if (self->stats && self->stats->size() > 0) {
            update_stats();
            layout.push_back(self->render_stats());
        }

        auto follow = self->auto_follow
            ? text(" " + std::string(T().watchdog_following) + " ") | color(Color::Green)
            : text(" " + std::string(T().watchdog_paused) + " ") | color(Color::Yellow);
        auto header = hbox({
            text(" " + self->title + " ") | bold,
            filler(),
            follow,
        });

        return vbox({
            header,
            separator(),
            vbox(std::move(layout)) | flex,
        }) | border;
    }) | CatchEvent([this](Event event) -> bool {
        if (event.is_character()) {
            auto ch = event.character();
            if (ch == "r" || ch == "R") return perform(Action::Restart);
            if (ch == "s" || ch == "S") return perform(Action::Toggle);
            if (ch == "f" || ch == "F") return perform(Action::Follow);
            return false;
        }
        if (event == Event::End) return perform(Action::Follow);
        if (event == Event::ArrowUp) return perform(Action::ScrollUp);
        if (event == Event::ArrowDown) return perform(Action::ScrollDown);
        if (event == Event::PageUp) return perform(Action::PageUp);
        if (event == Event::PageDown) return perform(Action::PageDown);
        if (event == Event::Home) return perform(Action::Home);
        if (event == Event::Tab) return perform(Action::NextPane);
        return false;
    });
}
