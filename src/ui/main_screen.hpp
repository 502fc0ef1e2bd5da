#pragma once

#include <ftxui/component/component.hpp>
#include <string>
#include <vector>
#include <functional>
#include <memory>

class MainScreen {
public:
    struct Callbacks {
        std::function<void()> on_toggle_lang;
        std::function<void()> on_quit;
        std::function<void(int)> on_select_job; // index into the job list
    };

    MainScreen();
    ~MainScreen();

    void set_callbacks(Callbacks cb);
    void set_language_label(const std::string& label);

    /// Titles shown in the job menu
    void set_jobs(std::vector<std::string> titles);

    // Set the main content component (the watchdog panel)
    void set_content(ftxui::Component content);

    // Set the status bar component
    void set_status_bar(ftxui::Component status_bar);

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
