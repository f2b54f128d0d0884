#include "Suite.h"
#include <loguru/loguru.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using std::string;
using std::vector;
using Args = vector<string>;

namespace {

const std::size_t kPassthroughBytes = 2 * 1024 * 1024;
const unsigned kPassthroughSeed = 0xca7;
const std::size_t kMillionLines = 1000005;
const std::size_t kLongLineBytes = 600000;

CompareCase cmp(Args args, std::optional<string> stdin_data = std::nullopt,
                vector<FileSetup> setup = {})
{
    return CompareCase{std::move(setup), std::move(args), std::move(stdin_data)};
}

/* single write of 'data', no pause */
FifoCase fifo(const string& name, Args options, const string& data)
{
    return FifoCase{name, std::move(options), {data}, std::chrono::milliseconds(0), false};
}

ScriptedCase scripted(ScriptKind kind, Args args,
                      std::optional<string> stdin_data = std::nullopt)
{
    return ScriptedCase{kind, std::move(args), std::move(stdin_data)};
}

string join(const Args& tokens)
{
    string result;
    for (const string& t : tokens) {
        if (!result.empty()) result += ' ';
        result += t;
    }
    return result;
}

Args with(Args head, const vector<string>& tail)
{
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

/* plain operands, '-' and '--' handling, option permutation */
void add_operand_cases(CaseRegistry& r, const Fixtures& f)
{
    r.add("single file", cmp({f.sample_a}));
    r.add("multiple files", cmp({f.sample_a, f.sample_b, f.blank}));
    r.add("stdin only", cmp({"-"}, f.stdin_data));
    r.add("dash operand", cmp({f.sample_a, "-", f.sample_b}, f.stdin_mix));
    r.add("dash filename", cmp({"--", f.dash_name}));
    r.add("dash filename with numbering", cmp({"-n", "--", f.dash_name}));
    r.add("empty file", cmp({f.empty}));
    r.add("large file streaming", cmp({f.large}));
    r.add("option-like operand after file", cmp({f.sample_a, f.option_like}));
    r.add("-- stops option parsing", cmp({"--", f.dash_v_file}));
    r.add("-- mid-argv parsing", cmp({"-n", "--", "-n", f.sample_a}));
    r.add("stdin then option-like operand", cmp({"-", "-n"}, f.stdin_data));

    const string dashdash = f.path("adir/--");
    r.add("multiple -- markers",
          cmp({"--", f.sample_a, dashdash, f.sample_b}, std::nullopt,
              {FileSetup::file(dashdash, "double dash file\n")}));

    r.add("redundant -n flags", cmp({"-n", "-n", f.sample_a}));
    r.add("options after operand parsed", cmp({f.sample_a, "-n"}));
    r.add("long option after operand", cmp({f.sample_a, "--number"}));
    r.add("long option stdin", cmp({"--number", "-"}, f.stdin_data));
    r.add("option permutation mixed", cmp({f.sample_a, "-n", f.sample_b, "--show-ends"}));
    r.add("option permutation stdin",
          cmp({f.sample_a, "-", "-n", f.sample_b}, string("stdin line 1\nstdin line 2\n")));
    r.add("double dash no operands", cmp({"--"}, f.stdin_data));
    r.add("-- then -n filename", cmp({"--", f.option_like}));
    r.add("stdin empty", cmp({"-"}, string()));
    r.add("dash file before options", cmp({"--", f.dash_name, "-n"}));

    const string literal_dash = f.path("-");
    r.add("literal dash filename",
          cmp({"--", literal_dash}, std::nullopt,
              {FileSetup::file(literal_dash, "dash literal\n")}));

    r.add("double stdin operands", cmp({"-", "-"}, f.stdin_data));
    r.add("stdin via -- then file", cmp({"--", "-", f.sample_a}, f.stdin_data));
    r.add("mixed stdin and file numbering",
          cmp({"-n", "-", f.sample_a, "-"}, string("stdin first\nstdin second\n")));
    r.add("double dash then dash", cmp({"--", "-"}, f.stdin_data));
    r.add("stdin with option between dashes", cmp({"-", "-n", "-"}, string("first\nsecond\n")));
    r.add("multiple stdin operands with options", cmp({"-n", "-", "-", "-"}, string("a\nb\n")));
    r.add("double stdin --number", cmp({"--number", "-", "-"}, f.stdin_data));

    const string spaced = f.path("space name.txt");
    r.add("space in filename",
          cmp({spaced}, std::nullopt, {FileSetup::file(spaced, "space\n")}));

    /* files whose names look like options, read after '--' */
    const vector<std::pair<string, string>> option_named = {
        {"--help", "help file\n"},
        {"--version", "version file\n"},
        {"--show-ends", "show ends file\n"},
        {"--number", "number file\n"},
        {"--show-tabs", "tabs file\n"},
        {"--squeeze-blank", "squeeze file\n"},
        {"-e", "dash e file\n"},
        {"-A", "dash A file\n"},
        {"--show-all", "show all file\n"},
        {"--show-nonprinting", "show nonprinting file\n"},
    };
    for (const auto& entry : option_named) {
        const string p = f.path(entry.first);
        r.add("file named " + entry.first + " with --",
              cmp({"--", p}, std::nullopt, {FileSetup::file(p, entry.second)}));
    }

    const string named_dashdash = f.path("--");
    r.add("file named -- with -n",
          cmp({"-n", "--", named_dashdash}, std::nullopt,
              {FileSetup::file(named_dashdash, "double dash file\n")}));
    const string named_number = f.path("--number");
    r.add("file named --number with -n",
          cmp({"-n", "--", named_number}, std::nullopt,
              {FileSetup::file(named_number, "number file\n")}));

    r.add("dev null operand", cmp({"/dev/null"}));
}

/* each short option alone, bundled and in sequence */
void add_short_option_cases(CaseRegistry& r, const Fixtures& f)
{
    const string tabs = f.bytes_for(FixtureKey::tabs);
    const string blank = f.bytes_for(FixtureKey::blank_lines);
    const string control = f.bytes_for(FixtureKey::control);
    const string binary = f.bytes_for(FixtureKey::binary);

    r.add("-n option", cmp({"-n", f.blank}));
    r.add("-n across files", cmp({"-n", f.sample_a, f.blank}));
    r.add("-E option", cmp({"-E", f.blank}));
    r.add("-T option (file)", cmp({"-T", f.tabs}));
    r.add("-T option (stdin)", cmp({"-T", "-"}, tabs));
    r.add("-E option large", cmp({"-E", f.large}));
    r.add("-E option huge", cmp({"-E", f.huge}));
    r.add("-nET combo", cmp({"-nET", f.tabs}));
    r.add("-EnT combo order", cmp({"-EnT", f.tabs}));
    r.add("stdin numbered", cmp({"-n", "-"}, f.stdin_data));
    r.add("no newline + -E", cmp({"-E", f.no_newline}));
    r.add("-n large file", cmp({"-n", f.large}));
    r.add("bundle -nb", cmp({"-nb", f.blank}));
    r.add("bundle -bn", cmp({"-bn", f.blank}));
    r.add("bundle -ns", cmp({"-ns", f.blank}));
    r.add("bundle -sn", cmp({"-sn", f.blank}));
    r.add("-n empty file", cmp({"-n", f.empty}));
    r.add("-b empty file", cmp({"-b", f.empty}));
    r.add("-s empty file", cmp({"-s", f.empty}));
    r.add("-v with tabs file", cmp({"-v", f.tabs}));
    r.add("-T with no tabs", cmp({"-T", f.sample_a}));
    r.add("-E with tabs file", cmp({"-E", f.tabs}));
    r.add("-A with tabs file", cmp({"-A", f.tabs}));
    r.add("-e with no newline", cmp({"-e", f.no_newline}));
    r.add("-t with tabs via stdin", cmp({"-t", "-"}, tabs));
    r.add("-b option", cmp({"-b", f.blank}));
    r.add("-s option", cmp({"-s", f.blank}));
    r.add("-v option", cmp({"-v", f.control}));
    r.add("-A shortcut", cmp({"-A", f.control}));
    r.add("-e shortcut", cmp({"-e", f.control}));
    r.add("-t shortcut", cmp({"-t", f.tabs}));
    r.add("-u option", cmp({"-u", f.sample_a}));
    r.add("bundled options -bnEs", cmp({"-bnEs", f.blank}));
    r.add("huge file numbering", cmp({"-n", f.huge}));
    r.add("-bs combo", cmp({"-b", "-s", f.blank}));
    r.add("-nT combo", cmp({"-nT", f.tabs}));
    r.add("stdin huge numbering", cmp({"-n", "-"}, Fixtures::read_file(f.huge)));
    r.add("no newline + -n", cmp({"-n", f.no_newline}));
    r.add("no newline + -b", cmp({"-b", f.no_newline}));
    r.add("no newline + -A", cmp({"-A", f.no_newline}));
    r.add("-s with no blanks", cmp({"-s", f.sample_a}));
    r.add("combo -ns across files", cmp({"-ns", f.sample_a, f.blank}));
    r.add("repeat -n", cmp({"-nn", f.blank}));

    for (const char *bundle : {"-nE", "-bE", "-sE"}) {
        r.add(string("combo ") + bundle, cmp({bundle, f.blank}));
    }
    for (const char *bundle : {"-bT", "-sT"}) {
        r.add(string("combo ") + bundle, cmp({bundle, f.tabs}));
    }
    r.add("combo -A -s", cmp({"-As", f.blank}));
    r.add("combo -e -s", cmp({"-es", f.blank}));
    r.add("combo -t -s", cmp({"-ts", f.blank}));
    r.add("combo -nsvE", cmp({"-nsvE", f.control}));
    r.add("combo -bsvE", cmp({"-bsvE", f.control}));
    r.add("combo -e -t", cmp({"-e", "-t", f.tabs}));
    r.add("combo -t -e", cmp({"-t", "-e", f.tabs}));
    r.add("combo -e -n", cmp({"-e", "-n", f.blank}));
    r.add("combo -t -n", cmp({"-t", "-n", f.tabs}));
    r.add("combo -e -b", cmp({"-e", "-b", f.blank}));
    r.add("combo -t -b", cmp({"-t", "-b", f.tabs}));
    r.add("combo -u -n", cmp({"-u", "-n", f.blank}));
    r.add("combo -u -b", cmp({"-u", "-b", f.blank}));
    r.add("combo -u -s", cmp({"-u", "-s", f.blank}));
    r.add("combo -u -v", cmp({"-u", "-v", f.control}));
    r.add("combo -u --show-all", cmp({"-u", "--show-all", f.control}));
    r.add("combo -A -n", cmp({"-A", "-n", f.control}));
    r.add("combo -A -b", cmp({"-A", "-b", f.control}));

    /* options that override each other, both orders */
    r.add("order -b then -n", cmp({"-b", "-n", f.blank}));
    r.add("order -n then -b", cmp({"-n", "-b", f.blank}));
    r.add("order --number then --number-nonblank", cmp({"--number", "--number-nonblank", f.blank}));
    r.add("order --number-nonblank then --number", cmp({"--number-nonblank", "--number", f.blank}));
    r.add("order -s then -n", cmp({"-s", "-n", f.blank}));
    r.add("order -n then -s", cmp({"-n", "-s", f.blank}));
    r.add("order -E then -T", cmp({"-E", "-T", f.tabs}));
    r.add("order -T then -E", cmp({"-T", "-E", f.tabs}));

    r.add("stdin -A tabs", cmp({"-A", "-"}, tabs));
    r.add("stdin -b blanks", cmp({"-b", "-"}, blank));
    r.add("stdin -nE blanks", cmp({"-nE", "-"}, blank));
    r.add("stdin -bE blanks", cmp({"-bE", "-"}, blank));
    r.add("stdin -sE blanks", cmp({"-sE", "-"}, blank));
    r.add("stdin -v binary", cmp({"-v", "-"}, binary));
    r.add("stdin -A control", cmp({"-A", "-"}, control));
    r.add("stdin only newlines -s", cmp({"-s", "-"}, string("\n\n\n\n")));
    r.add("stdin empty with -n", cmp({"-n", "-"}, string()));
    r.add("stdin only newlines -b", cmp({"-b", "-"}, string("\n\n\n")));
    r.add("stdin only newlines -n", cmp({"-n", "-"}, string("\n\n\n")));
}

/* long options alone, combined with each other and with short forms */
void add_long_option_cases(CaseRegistry& r, const Fixtures& f)
{
    const string tabs = f.bytes_for(FixtureKey::tabs);
    const string blank = f.bytes_for(FixtureKey::blank_lines);
    const string control = f.bytes_for(FixtureKey::control);

    r.add("long options --number", cmp({"--number", f.blank}));
    r.add("long options --number-nonblank", cmp({"--number-nonblank", f.blank}));
    r.add("long options --squeeze-blank", cmp({"--squeeze-blank", f.blank}));
    r.add("long options --show-ends", cmp({"--show-ends", f.blank}));
    r.add("long options --show-tabs", cmp({"--show-tabs", f.tabs}));
    r.add("long options --show-nonprinting", cmp({"--show-nonprinting", f.control}));
    r.add("long options --show-all", cmp({"--show-all", f.control}));

    r.add("--show-ends stdin", cmp({"--show-ends", "-"}, f.stdin_data));
    r.add("--show-tabs stdin", cmp({"--show-tabs", "-"}, tabs));
    r.add("--show-nonprinting stdin", cmp({"--show-nonprinting", "-"}, control));
    r.add("--show-all stdin", cmp({"--show-all", "-"}, control));
    r.add("--number-nonblank stdin", cmp({"--number-nonblank", "-"}, blank));
    r.add("--squeeze-blank stdin", cmp({"--squeeze-blank", "-"}, blank));
    r.add("stdin --show-ends no newline",
          cmp({"--show-ends", "-"}, f.bytes_for(FixtureKey::no_trailing_newline)));
    r.add("stdin only newlines --number-nonblank", cmp({"--number-nonblank", "-"}, string("\n\n\n")));
    r.add("stdin only newlines --show-ends", cmp({"--show-ends", "-"}, string("\n\n\n")));

    /* numbering or squeezing combined with each display option */
    const vector<std::pair<string, string>> display = {
        {"--show-ends", f.blank},
        {"--show-tabs", f.tabs},
        {"--show-nonprinting", f.control},
        {"--show-all", f.control},
    };
    for (const string lead : {"--number", "--number-nonblank", "--squeeze-blank"}) {
        for (const auto& d : display) {
            r.add(lead + " " + d.first, cmp({lead, d.first, d.second}));
        }
    }
    r.add("--squeeze-blank --number", cmp({"--squeeze-blank", "--number", f.blank}));
    r.add("--squeeze-blank --number-nonblank", cmp({"--squeeze-blank", "--number-nonblank", f.blank}));

    for (const auto& d : display) {
        r.add(d.first + " with -n", cmp({d.first, "-n", d.second}));
        r.add(d.first + " with -b", cmp({d.first, "-b", d.second}));
    }
    r.add("-s with --number", cmp({"-s", "--number", f.blank}));
    r.add("-s with --number-nonblank", cmp({"-s", "--number-nonblank", f.blank}));
    for (const auto& d : display) {
        r.add("-s with " + d.first, cmp({"-s", d.first, d.second}));
    }

    const vector<std::pair<string, string>> stdin_plus_file = {
        {"--number", f.stdin_data},
        {"--number-nonblank", blank},
        {"--show-ends", f.stdin_data},
        {"--show-tabs", tabs},
        {"--show-nonprinting", control},
        {"--show-all", control},
    };
    for (const auto& s : stdin_plus_file) {
        r.add("stdin + file " + s.first, cmp({s.first, "-", f.sample_a}, s.second));
    }

    const vector<std::pair<string, string>> file_stdin_file = {
        {"--number", "stdin line 1\nstdin line 2\n"},
        {"--number-nonblank", "\nstdin\n\n"},
        {"--squeeze-blank", "line1\n\n\nline2\n"},
        {"--show-ends", "stdin\n"},
        {"--show-tabs", tabs},
        {"--show-all", control},
    };
    for (const auto& s : file_stdin_file) {
        r.add("file stdin file " + s.first,
              cmp({s.first, f.sample_a, "-", f.sample_b}, s.second));
    }

    const vector<std::pair<string, string>> redundant = {
        {"--number -n", f.blank},
        {"--number-nonblank -b", f.blank},
        {"--squeeze-blank -s", f.blank},
        {"--show-ends -E", f.blank},
        {"--show-tabs -T", f.tabs},
        {"--show-nonprinting -v", f.control},
        {"--show-all -A", f.control},
        {"--show-ends --show-ends", f.blank},
    };
    for (const auto& entry : redundant) {
        const string::size_type space = entry.first.find(' ');
        r.add("redundant " + entry.first,
              cmp({entry.first.substr(0, space), entry.first.substr(space + 1), entry.second}));
    }

    r.add("long combo --show-nonprinting --show-ends", cmp({"--show-nonprinting", "--show-ends", f.control}));
    r.add("long combo --show-nonprinting --show-tabs", cmp({"--show-nonprinting", "--show-tabs", f.control}));
    r.add("long combo --show-all --number", cmp({"--show-all", "--number", f.control}));
    r.add("long combo --show-all --number-nonblank", cmp({"--show-all", "--number-nonblank", f.control}));
    r.add("long combo --show-tabs --number", cmp({"--show-tabs", "--number", f.tabs}));

    r.add("--show-tabs with no tabs", cmp({"--show-tabs", f.sample_a}));
    r.add("--show-ends no newline file", cmp({"--show-ends", f.no_newline}));
    for (const string opt : {"--number", "--number-nonblank", "--squeeze-blank",
                             "--show-all", "--show-nonprinting"}) {
        r.add(opt + " empty file", cmp({opt, f.empty}));
    }
}

/* line state carried from one operand into the next */
void add_boundary_cases(CaseRegistry& r, const Fixtures& f)
{
    const string no_nl = f.path("no_newline_boundary.txt");
    const string with_nl = f.path("newline_boundary.txt");
    r.add("line state across files",
          cmp({"-n", no_nl, with_nl}, std::nullopt,
              {FileSetup::file(no_nl, "first"), FileSetup::file(with_nl, "second\n")}));

    const string blank_a = f.path("blank_a.txt");
    const string blank_b = f.path("blank_b.txt");
    r.add("squeeze across files",
          cmp({"-s", blank_a, blank_b}, std::nullopt,
              {FileSetup::file(blank_a, "line1\n\n"), FileSetup::file(blank_b, "\n\nline2\n")}));

    const string b_a = f.path("b_across_a.txt");
    const string b_b = f.path("b_across_b.txt");
    r.add("number nonblank across files",
          cmp({"-b", b_a, b_b}, std::nullopt,
              {FileSetup::file(b_a, "line1\n\n"), FileSetup::file(b_b, "\nline2\n")}));

    const string sq_a = f.path("squeeze_no_nl_a.txt");
    const string sq_b = f.path("squeeze_no_nl_b.txt");
    r.add("squeeze + no newline boundary",
          cmp({"-s", sq_a, sq_b}, std::nullopt,
              {FileSetup::file(sq_a, "line1\n\n"), FileSetup::file(sq_b, "\nline2")}));

    const string a3 = f.path("squeeze_three_a.txt");
    const string b3 = f.path("squeeze_three_b.txt");
    const string c3 = f.path("squeeze_three_c.txt");
    r.add("squeeze across three files",
          cmp({"-s", a3, b3, c3}, std::nullopt,
              {FileSetup::file(a3, "line1\n\n"), FileSetup::file(b3, "\n\nline2\n"),
               FileSetup::file(c3, "\n\nline3\n")}));

    const vector<std::pair<string, std::pair<string, string>>> empty_first = {
        {"number across empty then data", {"-n", "empty_then_data.txt"}},
        {"number-nonblank across empty then data", {"-b", "empty_then_data_b.txt"}},
        {"squeeze across empty then blank", {"-s", "empty_then_blank.txt"}},
    };
    for (const auto& entry : empty_first) {
        const string empty = f.path(entry.second.second);
        const string& next = entry.second.first == "-s" ? f.blank : f.sample_a;
        r.add(entry.first, cmp({entry.second.first, empty, next}, std::nullopt,
                               {FileSetup::file(empty, "")}));
    }

    r.add("show-ends across no-newline then file", cmp({"-E", f.no_newline, f.sample_b}));
    r.add("number across no-newline then file", cmp({"-n", f.no_newline, f.sample_b}));
    r.add("number-nonblank across no-newline then file", cmp({"-b", f.no_newline, f.sample_b}));

    const string million = f.path("million_lines.txt");
    r.add("large line numbers",
          cmp({"-n", million}, std::nullopt, {FileSetup::file(million, "x\n", kMillionLines)}));

    const string long_line = f.path("long_line.txt");
    r.add("long line no newline -n",
          cmp({"-n", long_line}, std::nullopt, {FileSetup::file(long_line, "x", kLongLineBytes)}));
}

/* bytes that need escaping under -v, -A, -E or -T */
void add_content_cases(CaseRegistry& r, const Fixtures& f)
{
    struct ContentCase {
        const char *name;
        const char *file;
        string content;
        const char *option;
    };
    const vector<ContentCase> content = {
        {"visible DEL", "del.txt", "del:\x7f!\n", "-v"},
        {"visible CR", "cr.txt", "carriage\rreturn\n", "-v"},
        {"visible NUL", "nul.txt", string("nul:\0x\n", 7), "-v"},
        {"visible 0xFF", "ff.txt", "ff:\xff!\n", "-v"},
        {"visible formfeed", "formfeed.txt", "form\x0c" "feed\n", "-v"},
        {"tabs without newline -T", "tabs_no_nl.txt", "a\tb", "-T"},
        {"tabs without newline -A", "tabs_no_nl_a.txt", "a\tb", "-A"},
        {"only newlines file -s", "only_newlines.txt", "\n\n\n\n", "-s"},
        {"only newlines file -b", "only_newlines_b.txt", "\n\n\n\n", "-b"},
        {"only newlines file -n", "only_newlines_n.txt", "\n\n\n\n", "-n"},
        {"crlf file -E", "crlf_e.txt", "one\r\ntwo\r\n", "-E"},
        {"crlf file -v", "crlf_v.txt", "one\r\ntwo\r\n", "-v"},
        {"crlf file -A", "crlf_a.txt", "one\r\ntwo\r\n", "-A"},
        {"tabs + control -A", "tabs_control.txt", "tab\t\x01\n", "-A"},
        {"utf8 bytes -v", "utf8_v.txt", "\xc3\xa9\n", "-v"},
        {"nul file -A", "nul_a.txt", string("nul\0end\n", 8), "-A"},
        {"trailing spaces -E", "trail_spaces.txt", "space  \t \nnext line  \n", "-E"},
        {"leading blanks -b", "leading_blanks.txt", "\n\nstart\n\nend\n", "-b"},
        {"only tabs -T", "only_tabs.txt", "\t\t\n\tend\n", "-T"},
        {"tabs + blanks -sT", "tabs_blanks.txt", "\n\n\tcol\n\n\n", "-sT"},
    };
    for (const ContentCase& c : content) {
        const string p = f.path(c.file);
        r.add(c.name, cmp({c.option, p}, std::nullopt, {FileSetup::file(p, c.content)}));
    }

    r.add("binary passthrough", cmp({f.binary}));
    r.add("binary with -v", cmp({"-v", f.binary}));
    r.add("binary with -A", cmp({"-A", f.binary}));
    r.add("binary with -T", cmp({"-T", f.binary}));
    r.add("binary with -E", cmp({"-E", f.binary}));
    r.add("--show-nonprinting binary", cmp({"--show-nonprinting", f.binary}));
    r.add("--show-all binary", cmp({"--show-all", f.binary}));
    r.add("binary passthrough pipe",
          cmp({"-"}, Fixtures::random_bytes(kPassthroughBytes, kPassthroughSeed)));
}

/* diagnostics: wording, order and exit status come from the reference */
void add_error_cases(CaseRegistry& r, const Fixtures& f)
{
    const string missing = f.path("missing.txt");
    r.add("missing file error", cmp({missing}));
    r.add("missing among files", cmp({f.sample_a, missing, f.sample_b}));
    r.add("missing file with -n", cmp({"-n", f.path("missing_numbered.txt")}));
    r.add("missing file with -v among files",
          cmp({"-v", f.sample_a, f.path("missing_visible.txt"), f.sample_b}));

    r.add("ENOENT vs EACCES: missing", cmp({f.path("adir/nope")}));
    const string locked = f.path("adir/locked.txt");
    r.add("ENOENT vs EACCES: locked",
          cmp({locked}, std::nullopt, {FileSetup::file_with_mode(locked, "locked", 0000)}));

    r.add("directory operand error", cmp({f.dir_path}));
    r.add("directory operand with -n", cmp({"-n", f.dir_path}));
    r.add("directory operand with -v", cmp({"-v", f.dir_path}));
    r.add("directory operand with -E", cmp({"-E", f.dir_path}));
    r.add("very long path ENAMETOOLONG", cmp({f.path("adir/" + string(5000, 'a'))}));

    const string notdir = f.path("notdir");
    r.add("ENOTDIR path",
          cmp({notdir + "/child"}, std::nullopt, {FileSetup::file(notdir, "data")}));

    const string loop_a = f.path("loop_a");
    const string loop_b = f.path("loop_b");
    r.add("ELOOP symlink",
          cmp({loop_a}, std::nullopt,
              {FileSetup::symlink(loop_b, loop_a), FileSetup::symlink(loop_a, loop_b)}));

    r.add("bad option error", cmp({"-x"}));
    r.add("bad option bundle", cmp({"-nZ"}));
    r.add("invalid long option", cmp({"--nope"}));
    r.add("invalid long option equals", cmp({"--number=1"}));
    r.add("unknown long option equals", cmp({"--nope=1"}));
    r.add("long option disallow arg", cmp({"--help=1"}));
}

/* operands reached through links */
void add_link_cases(CaseRegistry& r, const Fixtures& f)
{
    const string to_a = f.path("link_to_a.txt");
    r.add("symlink to file",
          cmp({to_a}, std::nullopt, {FileSetup::symlink(f.sample_a, to_a)}));

    const string to_dir = f.path("link_to_dir");
    r.add("symlink to directory",
          cmp({to_dir}, std::nullopt, {FileSetup::symlink(f.dir_path, to_dir)}));

    const string hard = f.path("hardlink_b.txt");
    r.add("hardlink to file",
          cmp({hard}, std::nullopt, {FileSetup::hard_link(f.sample_b, hard)}));

    const string target = f.path("chain_target.txt");
    const string link1 = f.path("chain_link1");
    const string link2 = f.path("chain_link2");
    r.add("symlink chain",
          cmp({link2}, std::nullopt,
              {FileSetup::file(target, "chain target\n"), FileSetup::symlink(target, link1),
               FileSetup::symlink(link1, link2)}));

    const string rel_dir = f.path("rel_dir");
    const string rel_link = f.path("rel_link.txt");
    r.add("relative symlink",
          cmp({rel_link}, std::nullopt,
              {FileSetup::directory(rel_dir),
               FileSetup::file(rel_dir + "/rel_target.txt", "relative\n"),
               FileSetup::symlink("rel_dir/rel_target.txt", rel_link)}));
}

/* input that arrives through a named pipe */
void add_fifo_cases(CaseRegistry& r, const Fixtures& f)
{
    const string large = Fixtures::read_file(f.large);
    r.add("-T fifo fast path", fifo("tabs_fast.fifo", {"-T"}, f.bytes_for(FixtureKey::tabs)));
    r.add("plain stdout fifo fast path", fifo("plain_out.fifo", {}, large));
    r.add("-n fifo fast path", fifo("num_fast.fifo", {"-n"}, large));
    r.add("-v fifo fast path", fifo("vis_fast.fifo", {"-v"}, f.bytes_for(FixtureKey::control)));
    r.add("fifo streaming",
          FifoCase{"stream.fifo", {}, {"chunk1\n", "chunk2\n"},
                   std::chrono::milliseconds(50), true});
    r.add("fifo decorated -vE", fifo("decorated.fifo", {"-vE"}, "line1\n\nline2\tend\n"));
    r.add("fifo squeeze blank", fifo("squeeze.fifo", {"-s"}, "one\n\n\n\nthree\n"));
    r.add("fifo show ends", fifo("show_ends.fifo", {"-E"}, "one\n\n"));
    r.add("fifo numbered show ends", fifo("num_ends.fifo", {"-nE"}, "one\n\n"));
    r.add("fifo show all", fifo("show_all.fifo", {"-A"}, "tab\t\x01\n"));
    r.add("fifo show tabs and ends", fifo("show_tabs_ends.fifo", {"-ET"}, "one\tend\n\n"));
    r.add("fifo number nonblank", fifo("num_nonblank.fifo", {"-b"}, "one\n\nthree\n"));
}

void add_scripted_cases(CaseRegistry& r)
{
    r.add("--help switch", scripted(ScriptKind::help_output, {"--help"}));
    r.add("--version switch", scripted(ScriptKind::version_output, {"--version"}));
    r.add("--help stdout closed", scripted(ScriptKind::help_stdout_closed, {"--help"}));
    r.add("broken pipe write error",
          scripted(ScriptKind::broken_pipe, {"-"}, string("broken pipe data\n")));
}

} // namespace


void register_builtin_cases(CaseRegistry& registry, const Fixtures& fixtures)
{
    add_operand_cases(registry, fixtures);
    add_short_option_cases(registry, fixtures);
    add_long_option_cases(registry, fixtures);
    add_boundary_cases(registry, fixtures);
    add_content_cases(registry, fixtures);
    add_error_cases(registry, fixtures);
    add_link_cases(registry, fixtures);
    add_fifo_cases(registry, fixtures);
    add_scripted_cases(registry);
    LOG_F(INFO, "registered %zu built-in cases", registry.size());
}

void register_matrix_cases(CaseRegistry& registry, const Fixtures& fixtures,
                           const OptionMatrix& matrix)
{
    std::map<FixtureKey, string> contents;
    auto bytes = [&](FixtureKey key) -> const string& {
        auto it = contents.find(key);
        if (it == contents.end()) it = contents.emplace(key, fixtures.bytes_for(key)).first;
        return it->second;
    };

    for (const OptionSpec& spec : matrix.specs()) {
        const FixtureKey key = pick_fixture_key(spec.tokens);
        const string& input = fixtures.path_for(key);
        registry.add("matrix file " + spec.label, cmp(with(spec.tokens, {input})));
        registry.add("matrix multi " + spec.label,
                     cmp(with(spec.tokens, {input, fixtures.sample_b})));
        registry.add("matrix stdin " + spec.label, cmp(with(spec.tokens, {"-"}), bytes(key)));
        registry.add("matrix stdin+file " + spec.label,
                     cmp(with(spec.tokens, {"-", fixtures.sample_b}), bytes(key)));
    }

    for (const Args& opts : binary_option_sets()) {
        const string label = opts.empty() ? "no options" : join(opts);
        registry.add("matrix binary " + label, cmp(with(opts, {fixtures.binary})));
    }
    LOG_F(INFO, "registered matrix cases, %zu total", registry.size());
}
