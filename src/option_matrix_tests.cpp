#include "Catcheck.h"
#include "OptionMatrix.h"
#include "ProcessRunner.h"
#include "UnitTestHarness.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <map>

using std::string;
using std::vector;

int main(int argc, char* argv[])
{
    loguru::init(argc, argv);
    loguru::add_file("catcheck_tests.log", loguru::Truncate, loguru::Verbosity_MAX);

    LOG_F(INFO, "RUNNING OPTION MATRIX TESTS...");
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF; // don't write to stderr

    const string cat = find_in_path("cat").value_or("/bin/cat");
    ProcessRunner runner;
    const OptionMatrix matrix = OptionMatrix::standard();
    UnitTestHarness tests;


    /* ENUMERATION */
    tests.add_test("standard matrix has 651 unique option sets", [&]() {
        expect(matrix.specs().size() == 651,
               "got " + std::to_string(matrix.specs().size()));
    });
    tests.add_test("every group contributes what it should", [&]() {
        std::map<string, int> counts;
        for (const OptionSpec& spec : matrix.specs()) {
            for (const char *prefix : {"no options", "short bundled ", "short separate ",
                                       "short extra ", "long ", "order "}) {
                if (starts_with(spec.label, prefix)) {
                    ++counts[prefix];
                    break;
                }
            }
        }
        expect(counts["no options"] == 1, "no options");
        expect(counts["short bundled "] == 255, "short bundled");
        expect(counts["short separate "] == 247, "short separate");
        expect(counts["short extra "] == 14, "short extra");
        expect(counts["long "] == 127, "long");
        expect(counts["order "] == 7, "order");
    });
    tests.add_test("first option set is the empty one", [&]() {
        expect(matrix.specs().front().tokens.empty(), "first tokens not empty");
        expect_equal(matrix.specs().front().label, "no options", "label");
    });
    tests.add_test("a repeated token sequence is dropped", [&]() {
        OptionMatrix m;
        expect(m.add("first", {"-n", "-b"}), "first add rejected");
        expect(!m.add("second", {"-n", "-b"}), "duplicate accepted");
        expect(m.specs().size() == 1, "size");
        expect_equal(m.specs()[0].label, "first", "surviving label");
    });
    tests.add_test("token order makes sequences distinct", [&]() {
        OptionMatrix m;
        expect(m.add("a", {"-n", "-b"}), "first order rejected");
        expect(m.add("b", {"-b", "-n"}), "reverse order rejected");
    });
    tests.add_test("reversed override pairs survive in the standard matrix", [&]() {
        bool found = false;
        for (const OptionSpec& spec : matrix.specs()) {
            if (spec.tokens == vector<string>{"-b", "-n"}) found = true;
        }
        expect(found, "-b -n missing");
    });
    tests.add_test("nine binary option sets", [&]() {
        expect(binary_option_sets().size() == 9, "size");
        expect(binary_option_sets().front().empty(), "first set should be empty");
    });


    /* FIXTURE HEURISTIC */
    tests.add_test("show-all wins over everything", [&]() {
        expect(pick_fixture_key({"-nA"}) == FixtureKey::mixed_control, "-nA");
        expect(pick_fixture_key({"-t"}) == FixtureKey::mixed_control, "-t");
        expect(pick_fixture_key({"--show-all", "-T"}) == FixtureKey::mixed_control, "--show-all");
    });
    tests.add_test("then tabs, then nonprinting", [&]() {
        expect(pick_fixture_key({"-T", "-v"}) == FixtureKey::tabs, "-T -v");
        expect(pick_fixture_key({"--show-tabs"}) == FixtureKey::tabs, "--show-tabs");
        expect(pick_fixture_key({"-e"}) == FixtureKey::control, "-e");
        expect(pick_fixture_key({"-vs"}) == FixtureKey::control, "-vs");
    });
    tests.add_test("then numbering and squeezing, then show-ends", [&]() {
        expect(pick_fixture_key({"-bE"}) == FixtureKey::blank_lines, "-bE");
        expect(pick_fixture_key({"--number"}) == FixtureKey::blank_lines, "--number");
        expect(pick_fixture_key({"-E"}) == FixtureKey::no_trailing_newline, "-E");
        expect(pick_fixture_key({"-u"}) == FixtureKey::plain, "-u");
        expect(pick_fixture_key({}) == FixtureKey::plain, "no options");
    });
    tests.add_test("long options never count as short flags", [&]() {
        expect(!has_short_flag({"--number"}, 'n'), "--number matched 'n'");
        expect(has_short_flag({"-bn"}, 'n'), "-bn did not match 'n'");
        expect(!has_short_flag({"-"}, 'n'), "bare dash matched");
    });


    /* OPTION SEMANTICS, checked against the reference */
    const string blank = "one\n\n\nthree\n\n\n";
    tests.add_test("-n numbers every line", [&]() {
        CmdOutput out = runner.run(cat, {"-n", "-"}, blank);
        expect_equal(out.stdout_bytes,
                     "     1\tone\n     2\t\n     3\t\n     4\tthree\n     5\t\n     6\t\n",
                     "cat -n");
    });
    tests.add_test("-s squeezes blank runs", [&]() {
        CmdOutput out = runner.run(cat, {"-s", "-"}, blank);
        expect_equal(out.stdout_bytes, "one\n\nthree\n\n", "cat -s");
    });
    tests.add_test("-b numbers only nonblank lines", [&]() {
        CmdOutput out = runner.run(cat, {"-b", "-"}, string("\nmiddle\n\n"));
        expect_equal(out.stdout_bytes, "\n     1\tmiddle\n\n", "cat -b");
    });
    tests.add_test("bundled and separated short flags behave the same", [&]() {
        const string input = "one\n\n\n\ttab\x01\x7f\n\n";
        for (const OptionSpec& spec : matrix.specs()) {
            if (!starts_with(spec.label, "short separate ")) continue;
            string bundle = "-";
            for (const string& t : spec.tokens) bundle += t.substr(1);
            CmdOutput separate = runner.run(cat, spec.tokens, input);
            CmdOutput bundled = runner.run(cat, {bundle}, input);
            expect(separate.stdout_bytes == bundled.stdout_bytes,
                   "outputs differ for " + spec.label + " vs " + bundle);
        }
    });

    return tests.run_all_tests() == 0 ? 0 : 1;
}
