#pragma once

#include "Fixtures.h"
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

/* one set of command-line options, in the exact order it will be passed */
struct OptionSpec {
    std::string label;
    std::vector<std::string> tokens;
};

/* hashes an ordered token sequence; ["-n", "-b"] and ["-b", "-n"] differ */
struct TokenSequenceHash {
    std::size_t operator()(const std::vector<std::string>& tokens) const;
};

/**
 * The combinatorial option matrix. 'standard' enumerates every subset of the
 * short and long flag alphabets plus a few hand-picked orderings; 'add'
 * drops any token sequence that is already present, so the first label
 * registered for a sequence is the one that survives.
 */
class OptionMatrix {
  public:
    static const std::vector<char> kShortFlags;
    static const std::vector<std::string> kLongFlags;

    static OptionMatrix standard();

    /* @return false if an identical token sequence was already added */
    bool add(const std::string& label, const std::vector<std::string>& tokens);

    const std::vector<OptionSpec>& specs() const { return _specs; }

  private:
    std::vector<OptionSpec> _specs;
    std::unordered_set<std::vector<std::string>, TokenSequenceHash> _seen;
};

bool has_short_flag(const std::vector<std::string>& tokens, char flag);
bool has_long_flag(const std::vector<std::string>& tokens, const std::string& flag);

/* the fixture whose content best shows what 'tokens' do */
FixtureKey pick_fixture_key(const std::vector<std::string>& tokens);

/* option sets run against the random binary fixture */
std::vector<std::vector<std::string>> binary_option_sets();
