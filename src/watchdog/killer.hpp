#pragma once

#include "core/environment.hpp"

#include <string>

/// Terminates a process this application did not spawn
class Killer {
public:
    virtual ~Killer() = default;
    virtual void kill() = 0;
};

/// Runs a kill command quietly, once, ignoring its result
class CommandKiller : public Killer {
public:
    CommandKiller(std::string cmd, Environment env = Environment());

    void kill() override;

    const std::string& command() const { return cmd_; }

private:
    std::string cmd_;
    Environment env_;
};
