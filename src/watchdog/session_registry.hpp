#pragma once

#include "watchdog/supervisor.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

/// Application-wide table of live supervisors keyed by a stable job key,
/// so leaving and re-entering a job view re-attaches instead of restarting.
class SessionRegistry {
public:
    struct Lookup {
        SupervisorRef session;
        bool reused = false;
    };

    /// Return the session for `key`, creating (and starting) it if absent
    Lookup get_or_create(const std::string& key,
                         const std::vector<std::string>& commands,
                         const WatchdogConfig& cfg);

    SupervisorRef find(const std::string& key) const;

    /// Forget a session. It is torn down once the last view releases it.
    bool remove(const std::string& key);

    std::vector<std::string> keys() const;

    /// Stop every session (application shutdown)
    void stop_all();

private:
    mutable std::mutex mutex_;
    std::map<std::string, SupervisorRef> sessions_;
};
