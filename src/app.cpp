#include "app.hpp"
#include "core/config.hpp"
#include "ui/main_screen.hpp"
#include "ui/watchdog_panel.hpp"
#include "ui/status_bar.hpp"
#include "watchdog/session_registry.hpp"
#include "i18n/i18n.hpp"

#include <spdlog/spdlog.h>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <thread>
#include <atomic>

using namespace ftxui;

struct App::Impl {
    const Config& config;
    SessionRegistry registry;

    MainScreen main_screen;
    StatusBar status_bar;
    WatchdogPanel watchdog_panel;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    // Background refresh
    std::atomic<bool> stop_flag{false};
    std::thread refresh_thread;

    explicit Impl(const Config& cfg) : config(cfg) {}

    void open_job(int index) {
        const auto& jobs = config.data().jobs;
        if (index < 0 || index >= static_cast<int>(jobs.size())) return;
        const JobSpec& job = jobs[index];

        // Reuse or create a persistent session by job key
        auto found = registry.get_or_create(Config::job_key(job.id),
                                            job.supervised_commands(),
                                            job.watchdog);
        watchdog_panel.attach(job.title, found.session, found.reused);
        status_bar.set_job(watchdog_panel.status());
    }

    void setup_callbacks() {
        MainScreen::Callbacks cb;

        cb.on_toggle_lang = [this]() {
            if (current_lang == Lang::ZH) {
                current_lang = Lang::EN;
                main_screen.set_language_label("EN");
            } else {
                current_lang = Lang::ZH;
                main_screen.set_language_label("中");
            }
        };

        cb.on_quit = [this]() {
            screen.Exit();
        };

        cb.on_select_job = [this](int index) {
            open_job(index);
        };

        main_screen.set_callbacks(std::move(cb));

        WatchdogPanel::Callbacks wcb;
        wcb.show_toast = [this](const std::string& text, ToastLevel level, int seconds) {
            status_bar.show_toast(text, level, seconds);
        };
        watchdog_panel.set_callbacks(std::move(wcb));
    }

    void start_refresh_thread() {
        refresh_thread = std::thread([this]() {
            while (!stop_flag.load()) {
                // Status is read on the UI thread, the panel is not shared
                screen.Post([this]() {
                    if (watchdog_panel.session()) {
                        status_bar.set_job(watchdog_panel.status());
                    }
                });
                // Post a custom event to trigger UI refresh
                screen.Post(Event::Custom);

                // Sleep 200ms, checking stop_flag every 50ms
                for (int i = 0; i < 4 && !stop_flag.load(); ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
            }
        });
    }

    void stop_threads() {
        stop_flag.store(true);
        if (refresh_thread.joinable()) {
            refresh_thread.join();
        }
    }
};

App::App(const Config& config) : impl_(std::make_unique<Impl>(config)) {
    // Set language from config
    if (config.data().language == "zh") {
        current_lang = Lang::ZH;
        impl_->main_screen.set_language_label("中");
    } else {
        current_lang = Lang::EN;
        impl_->main_screen.set_language_label("EN");
    }

    impl_->setup_callbacks();

    std::vector<std::string> titles;
    for (const auto& job : config.data().jobs) {
        titles.push_back(job.title.empty() ? job.id : job.title);
    }
    impl_->main_screen.set_jobs(std::move(titles));

    auto validation = config.validate();
    if (!validation.ok) {
        impl_->status_bar.show_toast(std::string(T().err_invalid_config) + ": " + validation.errors.front(),
                                     ToastLevel::Error, 10);
    }

    impl_->main_screen.set_content(impl_->watchdog_panel.component());
    impl_->main_screen.set_status_bar(impl_->status_bar.component());
}

App::~App() {
    impl_->stop_threads();
    impl_->watchdog_panel.detach();
    impl_->registry.stop_all();
}

void App::run() {
    spdlog::info("TUI started with {} job(s)", impl_->config.data().jobs.size());

    // Start background threads
    impl_->start_refresh_thread();

    // Run the TUI
    impl_->screen.Loop(impl_->main_screen.component());

    // Cleanup
    impl_->stop_threads();
    impl_->registry.stop_all();
}
