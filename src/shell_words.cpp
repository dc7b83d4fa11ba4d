#include "shell_words.hpp"
#include <stdexcept>

namespace mcpharbor {

std::vector<std::string> split_shell_words(const std::string& input) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;

    enum class State { normal, single_quoted, double_quoted };
    State state = State::normal;

    for (size_t i = 0; i < input.size(); i++) {
        char c = input[i];
        switch (state) {
        case State::normal:
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (in_word) {
                    words.push_back(std::move(current));
                    current.clear();
                    in_word = false;
                }
            } else if (c == '\'') {
                state = State::single_quoted;
                in_word = true;
            } else if (c == '"') {
                state = State::double_quoted;
                in_word = true;
            } else if (c == '\\') {
                if (i + 1 >= input.size()) {
                    throw std::invalid_argument("trailing backslash in command: " + input);
                }
                char next = input[++i];
                // Escaped newline is a line continuation
                if (next != '\n') current += next;
                in_word = true;
            } else {
                current += c;
                in_word = true;
            }
            break;

        case State::single_quoted:
            if (c == '\'') state = State::normal;
            else current += c;
            break;

        case State::double_quoted:
            if (c == '"') {
                state = State::normal;
            } else if (c == '\\' && i + 1 < input.size()) {
                char next = input[i + 1];
                if (next == '\\' || next == '"' || next == '$' || next == '`') {
                    current += next;
                    i++;
                } else if (next == '\n') {
                    i++;
                } else {
                    current += c;
                }
            } else {
                current += c;
            }
            break;
        }
    }

    if (state != State::normal) {
        throw std::invalid_argument("unterminated quote in command: " + input);
    }
    if (in_word) words.push_back(std::move(current));
    return words;
}

std::string quote_shell_word(const std::string& word) {
    if (word.empty()) return "''";

    bool plain = true;
    for (char c : word) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '-' || c == '_' || c == '.' || c == '/' || c == ':' || c == '=' ||
                    c == '@' || c == '+' || c == ',' || c == '%';
        if (!safe) {
            plain = false;
            break;
        }
    }
    if (plain) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join_shell_words(const std::vector<std::string>& words) {
    std::string out;
    for (auto& w : words) {
        if (!out.empty()) out += ' ';
        out += quote_shell_word(w);
    }
    return out;
}

} // namespace mcpharbor
