#include "ui/main_screen.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/component_options.hpp>

using namespace ftxui;

struct MainScreen::Impl {
    Callbacks callbacks;
    std::string lang_label = "EN";

    std::vector<std::string> job_titles;
    int selected_job = 0;
    Component job_menu;

    Component content = Renderer([] { return text("Loading..."); });
    Component status_bar = Renderer([] { return text(""); });

    // Custom component: handles global shortcuts AFTER child gets first chance.
    class ScreenComponent : public ComponentBase {
    public:
        explicit ScreenComponent(Impl* impl) : impl_(impl) {}

        Element OnRender() override {
            auto header = hbox({
                text(" " + std::string(T().app_title) + " ") | bold | color(Color::Cyan),
                filler(),
                text(" " + impl_->lang_label + " ") | border,
                text(" "),
            });

            Element jobs_view = impl_->job_titles.empty()
                ? text(T().no_jobs) | dim
                : impl_->job_menu->Render();
            auto jobs_pane = window(text(" " + std::string(T().jobs) + " "), jobs_view | frame)
                | size(WIDTH, LESS_THAN, 32);

            auto footer = hbox({
                text(" [Enter]") | bold,
                text(T().select_job),
                text("  [R]") | bold,
                text(T().key_restart),
                text("  [S]") | bold,
                text(T().key_start_stop),
                text("  [F]") | bold,
                text(T().key_follow),
                text("  [Tab]") | bold,
                text(T().key_switch_pane),
                text("  [Ctrl+L]") | bold,
                text(T().key_language),
                text("  [Q]") | bold,
                text(T().key_quit),
                text("  "),
            }) | dim;

            return vbox({
                header,
                separator(),
                hbox({
                    jobs_pane,
                    impl_->content->Render() | flex,
                }) | flex,
                separator(),
                impl_->status_bar->Render(),
                footer,
            });
        }

        bool OnEvent(Event event) override {
            // Phase 1: Truly global keys (always intercept first)
            if (event == Event::Special("\x0C")) {
                if (impl_->callbacks.on_toggle_lang) impl_->callbacks.on_toggle_lang();
                return true;
            }

            // Phase 2: Let child components (menu, watchdog panel) handle first
            if (ComponentBase::OnEvent(event)) {
                return true;
            }

            // Phase 3: Fallback global shortcuts
            if (event.is_character()) {
                auto ch = event.character();
                if (ch == "q" || ch == "Q") {
                    if (impl_->callbacks.on_quit) impl_->callbacks.on_quit();
                    return true;
                }
            }
            return false;
        }

    private:
        Impl* impl_;
    };
};

MainScreen::MainScreen() : impl_(std::make_unique<Impl>()) {
    auto self = impl_.get();
    MenuOption opt;
    opt.on_enter = [self]() {
        if (self->callbacks.on_select_job) self->callbacks.on_select_job(self->selected_job);
    };
    impl_->job_menu = Menu(&impl_->job_titles, &impl_->selected_job, opt);
}

MainScreen::~MainScreen() = default;

void MainScreen::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }
void MainScreen::set_language_label(const std::string& label) { impl_->lang_label = label; }
void MainScreen::set_content(Component content) { impl_->content = std::move(content); }
void MainScreen::set_status_bar(Component status_bar) { impl_->status_bar = std::move(status_bar); }

void MainScreen::set_jobs(std::vector<std::string> titles) {
    impl_->job_titles = std::move(titles);
    if (impl_->selected_job >= static_cast<int>(impl_->job_titles.size())) {
        impl_->selected_job = 0;
    }
}

Component MainScreen::component() {
    auto comp = Make<Impl::ScreenComponent>(impl_.get());
    comp->Add(Container::Horizontal({impl_->job_menu, impl_->content}));
    return comp;
}
