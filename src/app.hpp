#pragma once

#include <memory>

class Config;

class App {
public:
    /// Takes a loaded config; the TUI never writes it back
    explicit App(const Config& config);
    ~App();

    void run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
