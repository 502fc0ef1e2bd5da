#pragma once

#include <string>

class Config;

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -1 if no subcommand (caller should launch TUI).
    static int run(int argc, char* argv[]);

    /// Ask a running `run` subcommand to stop (signal handler entry point)
    static void request_stop();

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_list(int argc, char* argv[]);
    static int cmd_check();
    static int cmd_run(int argc, char* argv[]);

    /// Load the config file; prints the reason and returns false on failure
    static bool load_config(Config& config);
};
