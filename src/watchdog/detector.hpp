#pragma once

#include "core/environment.hpp"

#include <string>

/// Reports whether an externally started process is alive
class Detector {
public:
    virtual ~Detector() = default;
    virtual bool is_running() = 0;
};

/// Runs a check command quietly; exit status 0 means running
class CommandDetector : public Detector {
public:
    CommandDetector(std::string cmd, Environment env = Environment());

    bool is_running() override;

    const std::string& command() const { return cmd_; }

private:
    std::string cmd_;
    Environment env_;
};
