#pragma once

#include <optional>
#include <string>
#include <vector>

/// Split a command line into argv the way a POSIX shell tokenizes words,
/// without any expansion: whitespace separates words, single quotes are
/// literal, double quotes allow \" \\ \$ \` escapes, and a backslash outside
/// quotes escapes the next character.
/// Returns nullopt on an unterminated quote or a trailing backslash.
std::optional<std::vector<std::string>> split_command_line(const std::string& line);
