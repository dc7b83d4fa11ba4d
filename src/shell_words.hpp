#pragma once
#include <string>
#include <vector>

namespace mcpharbor {

// POSIX shell-style word splitting: whitespace separates words, single
// quotes are literal, double quotes honor \\ \" \$ \` escapes, a backslash
// outside quotes escapes the next character. No expansion is performed.
// Throws std::invalid_argument on an unterminated quote or trailing escape.
std::vector<std::string> split_shell_words(const std::string& input);

// Quote a word so split_shell_words() yields it back unchanged.
std::string quote_shell_word(const std::string& word);

std::string join_shell_words(const std::vector<std::string>& words);

} // namespace mcpharbor
