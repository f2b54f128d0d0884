#pragma once

#include <string>
#include <vector>

/**
 * Render arbitrary bytes as printable UTF-8 text. Valid UTF-8 sequences are
 * kept as-is; every byte that does not start a valid sequence becomes U+FFFD.
 */
std::string lossy_text(const std::string &bytes);

/**
 * Render an argument vector for messages, one quoted token per argument,
 * e.g. ["-n", "a b"] -> "-n" "a b".
 */
std::string quote_args(const std::vector<std::string> &args);

bool starts_with(const std::string &s, const std::string &prefix);
bool contains(const std::string &haystack, const std::string &needle);
