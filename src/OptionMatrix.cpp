#include "OptionMatrix.h"
#include <loguru/loguru.hpp>
#include <functional>

using std::string;
using std::vector;

const vector<char> OptionMatrix::kShortFlags = {'n', 'b', 's', 'E', 'T', 'v', 'u', 'A'};

const vector<string> OptionMatrix::kLongFlags = {
    "--number",
    "--number-nonblank",
    "--squeeze-blank",
    "--show-ends",
    "--show-tabs",
    "--show-nonprinting",
    "--show-all",
};

/* short sequences that bundling over kShortFlags never produces */
const static vector<vector<string>> kExtraShort = {
    {"-e"},
    {"-t"},
    {"-e", "-s"},
    {"-t", "-s"},
    {"-e", "-n"},
    {"-t", "-n"},
    {"-e", "-b"},
    {"-t", "-b"},
    {"-e", "-u"},
    {"-t", "-u"},
    {"-e", "-s", "-n"},
    {"-t", "-s", "-n"},
    {"-e", "-s", "-b"},
    {"-t", "-s", "-b"},
};

/* pairs of options that may override each other, in both orders */
const static vector<vector<string>> kOrderSensitive = {
    {"-n", "-b"},
    {"-b", "-n"},
    {"-s", "-n"},
    {"-n", "-s"},
    {"-s", "-b"},
    {"-b", "-s"},
    {"-E", "-T"},
    {"-T", "-E"},
    {"--number", "--number-nonblank"},
    {"--number-nonblank", "--number"},
    {"--squeeze-blank", "--number"},
    {"--number", "--squeeze-blank"},
    {"--show-ends", "--show-tabs"},
    {"--show-tabs", "--show-ends"},
};

static string join(const vector<string>& tokens)
{
    string result;
    for (const string& t : tokens) {
        if (!result.empty()) result += ' ';
        result += t;
    }
    return result;
}

std::size_t TokenSequenceHash::operator()(const vector<string>& tokens) const
{
    std::size_t seed = tokens.size();
    std::hash<string> hasher;
    for (const string& t : tokens) {
        seed ^= hasher(t) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

bool OptionMatrix::add(const string& label, const vector<string>& tokens)
{
    if (!_seen.insert(tokens).second) return false;
    _specs.push_back(OptionSpec{label, tokens});
    return true;
}

/**
 * Build the full matrix:
 *  1. no options at all
 *  2. every non-empty subset of kShortFlags, bundled ("-nbs") and, for two or
 *     more flags, separated ("-n -b -s"), both in alphabet order
 *  3. kExtraShort
 *  4. every non-empty subset of kLongFlags, in alphabet order
 *  5. kOrderSensitive
 * Sequences already produced by an earlier step are skipped.
 */
OptionMatrix OptionMatrix::standard()
{
    OptionMatrix matrix;
    matrix.add("no options", {});

    for (unsigned mask = 1; mask < (1u << kShortFlags.size()); ++mask) {
        string bundle = "-";
        vector<string> separate;
        for (size_t idx = 0; idx < kShortFlags.size(); ++idx) {
            if ((mask >> idx) & 1u) {
                bundle += kShortFlags[idx];
                separate.push_back(string("-") + kShortFlags[idx]);
            }
        }
        matrix.add("short bundled " + bundle, {bundle});
        if (separate.size() > 1) {
            matrix.add("short separate " + join(separate), separate);
        }
    }

    for (const vector<string>& opts : kExtraShort) {
        matrix.add("short extra " + join(opts), opts);
    }

    for (unsigned mask = 1; mask < (1u << kLongFlags.size()); ++mask) {
        vector<string> opts;
        for (size_t idx = 0; idx < kLongFlags.size(); ++idx) {
            if ((mask >> idx) & 1u) opts.push_back(kLongFlags[idx]);
        }
        matrix.add("long " + join(opts), opts);
    }

    for (const vector<string>& opts : kOrderSensitive) {
        matrix.add("order " + join(opts), opts);
    }

    LOG_F(INFO, "option matrix: %zu unique option sets", matrix.specs().size());
    return matrix;
}

/* true if 'flag' appears in any single-dash token, bundled or alone */
bool has_short_flag(const vector<string>& tokens, char flag)
{
    for (const string& t : tokens) {
        if (t.size() < 2 || t[0] != '-' || t[1] == '-') continue;
        if (t.find(flag, 1) != string::npos) return true;
    }
    return false;
}

bool has_long_flag(const vector<string>& tokens, const string& flag)
{
    for (const string& t : tokens) {
        if (t == flag) return true;
    }
    return false;
}

/**
 * Pick the fixture that makes 'tokens' visibly do something. Checked in
 * priority order; the first group with a match wins:
 *   show-all (-A, -t)         -> tabs plus control bytes
 *   show-tabs (-T)            -> tabs
 *   show-nonprinting (-e, -v) -> control bytes
 *   numbering / squeezing     -> blank lines
 *   show-ends (-E)            -> missing trailing newline
 */
FixtureKey pick_fixture_key(const vector<string>& tokens)
{
    if (has_long_flag(tokens, "--show-all") || has_short_flag(tokens, 'A') ||
        has_short_flag(tokens, 't')) {
        return FixtureKey::mixed_control;
    }
    if (has_short_flag(tokens, 'T') || has_long_flag(tokens, "--show-tabs")) {
        return FixtureKey::tabs;
    }
    if (has_short_flag(tokens, 'e') || has_short_flag(tokens, 'v') ||
        has_long_flag(tokens, "--show-nonprinting")) {
        return FixtureKey::control;
    }
    if (has_short_flag(tokens, 's') || has_short_flag(tokens, 'b') ||
        has_short_flag(tokens, 'n') || has_long_flag(tokens, "--squeeze-blank") ||
        has_long_flag(tokens, "--number-nonblank") || has_long_flag(tokens, "--number")) {
        return FixtureKey::blank_lines;
    }
    if (has_short_flag(tokens, 'E') || has_long_flag(tokens, "--show-ends")) {
        return FixtureKey::no_trailing_newline;
    }
    return FixtureKey::plain;
}

vector<vector<string>> binary_option_sets()
{
    return {
        {},
        {"-v"},
        {"-A"},
        {"-t"},
        {"-e"},
        {"--show-nonprinting"},
        {"--show-all"},
        {"--show-ends"},
        {"--show-tabs"},
    };
}
