#include "core/cmdline.hpp"

#include <cctype>

std::optional<std::vector<std::string>> split_command_line(const std::string& line) {
    enum class State { Between, Word, Single, Double };

    std::vector<std::string> words;
    std::string current;
    State state = State::Between;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        switch (state) {
        case State::Between:
        case State::Word:
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (state == State::Word) {
                    words.push_back(std::move(current));
                    current.clear();
                    state = State::Between;
                }
            } else if (c == '\'') {
                state = State::Single;
            } else if (c == '"') {
                state = State::Double;
            } else if (c == '\\') {
                if (i + 1 >= line.size()) return std::nullopt;
                ++i;
                // backslash-newline is a line continuation
                if (line[i] != '\n') current += line[i];
                state = State::Word;
            } else {
                current += c;
                state = State::Word;
            }
            break;

        case State::Single:
            if (c == '\'') {
                state = State::Word;
            } else {
                current += c;
            }
            break;

        case State::Double:
            if (c == '"') {
                state = State::Word;
            } else if (c == '\\' && i + 1 < line.size()) {
                char next = line[i + 1];
                if (next == '"' || next == '\\' || next == '$' || next == '`') {
                    current += next;
                    ++i;
                } else if (next == '\n') {
                    ++i;
                } else {
                    current += c;
                }
            } else {
                current += c;
            }
            break;
        }
    }

    if (state == State::Single || state == State::Double) return std::nullopt;
    if (state == State::Word) words.push_back(std::move(current));
    return words;
}
