#include "watchdog/session_registry.hpp"

#include <spdlog/spdlog.h>

SessionRegistry::Lookup SessionRegistry::get_or_create(const std::string& key,
                                                       const std::vector<std::string>& commands,
                                                       const WatchdogConfig& cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it != sessions_.end()) {
        spdlog::debug("watchdog: reusing session for {}", key);
        return Lookup{it->second, true};
    }

    spdlog::debug("watchdog: creating session for {}", key);
    auto session = Supervisor::create(commands, cfg);
    sessions_.emplace(key, session);
    return Lookup{session, false};
}

SupervisorRef SessionRegistry::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::remove(const std::string& key) {
    SupervisorRef dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) return false;
        dropped = std::move(it->second);
        sessions_.erase(it);
    }
    spdlog::debug("watchdog: removed session for {}", key);
    // `dropped` may be the last owner; its destructor joins outside our lock
    return true;
}

std::vector<std::string> SessionRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& entry : sessions_) out.push_back(entry.first);
    return out;
}

void SessionRegistry::stop_all() {
    std::vector<SupervisorRef> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) all.push_back(entry.second);
    }
    for (auto& s : all) s->stop_all();
}
