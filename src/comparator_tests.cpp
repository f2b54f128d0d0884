#include "Catcheck.h"
#include "Comparator.h"
#include "Fixtures.h"
#include "UnitTestHarness.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <chrono>
#include <sys/stat.h>

using std::string;

static HarnessConfig config_for(const string& subject, const string& reference)
{
    HarnessConfig config;
    config.subject = subject;
    config.reference = reference;
    return config;
}

int main(int argc, char* argv[])
{
    loguru::init(argc, argv);
    loguru::add_file("catcheck_tests.log", loguru::Truncate, loguru::Verbosity_MAX);

    LOG_F(INFO, "RUNNING COMPARATOR TESTS...");
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF; // don't write to stderr

    const string cat = find_in_path("cat").value_or("/bin/cat");
    const HarnessConfig same = config_for(cat, cat);
    ProcessRunner runner;
    Fixtures fixtures;
    Comparator comparator(same, runner, fixtures);
    UnitTestHarness tests;


    /* AGREEMENT */
    tests.add_test("reference agrees with itself on a file", [&]() {
        auto report = comparator.compare({"-n", fixtures.blank}, std::nullopt);
        expect(!report, report ? report->message : "");
    });
    tests.add_test("reference agrees with itself on stdin plus file", [&]() {
        auto report = comparator.compare({"-A", "-", fixtures.sample_b},
                                         Fixtures::read_file(fixtures.control));
        expect(!report, report ? report->message : "");
    });
    tests.add_test("diagnostics agree once argv[0] is shared", [&]() {
        auto report = comparator.compare({fixtures.sample_a, fixtures.path("missing.txt")},
                                         std::nullopt);
        expect(!report, report ? report->message : "");
    });
    tests.add_test("fifo comparison agrees", [&]() {
        auto report = comparator.compare_fifo(fixtures.path("cmp.fifo"), {"-s"},
                                              {"one\n\n\n", "\nthree\n"},
                                              std::chrono::milliseconds(10));
        expect(!report, report ? report->message : "");
    });
    tests.add_test("closed stdout comparison agrees", [&]() {
        auto report = comparator.compare_exit_with_closed_stdout({"-"}, string("data\n"));
        expect(!report, report ? report->message : "");
    });
    tests.add_test("null stdout comparison agrees", [&]() {
        auto report = comparator.compare_exit_with_null_stdout({"--help"});
        expect(!report, report ? report->message : "");
    });


    /* DISAGREEMENT */
    tests.add_test("different behavior is reported", [&]() {
        std::optional<string> tac = find_in_path("tac");
        if (!tac) return;  // nothing to compare against
        HarnessConfig config = config_for(*tac, cat);
        Comparator other(config, runner, fixtures);
        auto report = other.compare({fixtures.blank}, std::nullopt);
        expect(report.has_value(), "tac and cat should differ on multi-line input");
        expect(contains(report->message, "mismatch"), report->message);
    });
    tests.add_test("a difference only visible in file mode is reported", [&]() {
        const string script = fixtures.path("file_only_diff.sh");
        Fixtures::write_file(script,
            "#!/bin/sh\n"
            "if [ -f /dev/stdout ]; then printf 'redirected\\n'; else exec cat \"$@\"; fi\n");
        expect(chmod(script.c_str(), 0755) == 0, "chmod failed");
        HarnessConfig config = config_for(script, cat);
        Comparator other(config, runner, fixtures);
        auto report = other.compare({fixtures.sample_a}, std::nullopt);
        expect(report.has_value(), "file mode difference went unnoticed");
        expect(contains(report->message, "file output"), report->message);
        expect(contains(report->message, "redirected"), report->message);
        expect(contains(report->message, "alpha"), report->message);
        expect(contains(report->message, "subject status ===\nexit 0"), report->message);
    });
    tests.add_test("diff_outputs shows both sides", [&]() {
        CmdOutput subject{0, "abc", "", 0};
        CmdOutput reference{1, "abd", "oops\n", 0};
        auto report = diff_outputs("output for args []", subject, reference);
        expect(report.has_value(), "expected a mismatch");
        expect(contains(report->message, "subject stdout (3B)"), report->message);
        expect(contains(report->message, "reference stderr (5B)"), report->message);
        expect(contains(report->message, "oops"), report->message);
        expect(contains(report->message, "exit 1"), report->message);
    });
    tests.add_test("diff_outputs accepts identical runs", [&]() {
        CmdOutput a{0, "same", "", 0};
        expect(!diff_outputs("label", a, a), "identical runs reported as different");
    });
    tests.add_test("signal deaths are compared too", [&]() {
        CmdOutput exited{std::nullopt, "", "", 13};
        CmdOutput killed{std::nullopt, "", "", 9};
        auto report = diff_outputs("label", exited, killed);
        expect(report.has_value(), "different signals reported as equal");
        expect(contains(report->message, "signal 13"), report->message);
    });


    /* RENDERING */
    tests.add_test("lossy_text keeps valid UTF-8", [&]() {
        expect_equal(lossy_text("caf\xc3\xa9\n"), "caf\xc3\xa9\n", "lossy_text");
    });
    tests.add_test("lossy_text replaces invalid bytes", [&]() {
        expect_equal(lossy_text("a\xff" "b"), "a\xef\xbf\xbd" "b", "lossy_text");
    });
    tests.add_test("quote_args quotes every token", [&]() {
        expect_equal(quote_args({"-n", "a b"}), "\"-n\" \"a b\"", "quote_args");
    });

    return tests.run_all_tests() == 0 ? 0 : 1;
}
