#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

/// Variable lookup used when expanding command templates.
/// The default instance reads the live process environment on every call;
/// tests build one from a fixed map.
class Environment {
public:
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    /// Name of the variable that overrides ${APP_BIN}
    static constexpr const char* APP_BIN_OVERRIDE = "CHI_APP_BIN";
    /// Fallback for ${APP_BIN} when the override is unset
    static constexpr const char* APP_BIN_DEFAULT = "example-app";
    /// Marker injected into every child process
    static constexpr const char* MARKER_NAME = "CHI_TUI_JSON";
    static constexpr const char* MARKER_VALUE = "1";

    Environment();
    explicit Environment(Lookup lookup);

    static Environment from_map(std::map<std::string, std::string> vars);

    std::optional<std::string> get(const std::string& name) const;

    /// Replace every ${NAME} (NAME = [A-Z0-9_]+) with its value.
    /// Unknown variables expand to an empty string.
    std::string expand(const std::string& input) const;

private:
    Lookup lookup_;
};
