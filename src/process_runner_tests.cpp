#include "Catcheck.h"
#include "Fixtures.h"
#include "ProcessRunner.h"
#include "UnitTestHarness.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <chrono>
#include <csignal>
#include <iostream>

using std::string;

int main(int argc, char* argv[])
{
    loguru::init(argc, argv);
    loguru::add_file("catcheck_tests.log", loguru::Truncate, loguru::Verbosity_MAX);

    LOG_F(INFO, "RUNNING PROCESS RUNNER TESTS...");
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF; // don't write to stderr

    const string cat = find_in_path("cat").value_or("/bin/cat");
    ProcessRunner runner;
    UnitTestHarness tests;


    /* CAPTURE */
    tests.add_test("stdin payload comes back on stdout", [&]() {
        CmdOutput out = runner.run(cat, {"-"}, string("hello\n"));
        expect_equal(out.stdout_bytes, "hello\n", "stdout");
        expect(out.stderr_bytes.empty(), "stderr should be empty");
        expect(out.exit_code == 0, "exit code should be 0");
    });
    tests.add_test("no payload means stdin is /dev/null", [&]() {
        CmdOutput out = runner.run(cat, {});
        expect(out.stdout_bytes.empty(), "stdout should be empty");
        expect(out.exit_code == 0, "exit code should be 0");
    });
    tests.add_test("same command twice gives the same result", [&]() {
        CmdOutput first = runner.run(cat, {"-n", "-"}, string("a\n\nb\n"));
        CmdOutput second = runner.run(cat, {"-n", "-"}, string("a\n\nb\n"));
        expect_equal(first.stdout_bytes, second.stdout_bytes, "stdout");
        expect(first.exit_code == second.exit_code, "exit codes differ");
    });
    tests.add_test("missing operand: empty stdout, nonzero exit, ENOENT on stderr", [&]() {
        const string missing = "/nonexistent-catcheck-dir/missing.txt";
        CmdOutput out = runner.run(cat, {missing});
        expect(out.stdout_bytes.empty(), "stdout should be empty");
        expect(out.exit_code && *out.exit_code != 0, "exit code should be nonzero");
        expect(contains(out.stderr_bytes, "No such file"), "stderr: " + out.stderr_bytes);
        expect(contains(out.stderr_bytes, missing), "stderr should name the path");
    });
    tests.add_test("identity replaces argv[0] in diagnostics", [&]() {
        CmdOutput out = runner.run(cat, {"/nonexistent-catcheck-dir/x"}, std::nullopt,
                                   string("spoofed"));
        expect(starts_with(out.stderr_bytes, "spoofed:"), "stderr: " + out.stderr_bytes);
    });
    tests.add_test("empty input yields empty output under every flag", [&]() {
        for (const char *flag : {"-n", "-b", "-s", "-E", "-T", "-v", "-u", "-A", "-e", "-t",
                                 "--number", "--show-all", "--squeeze-blank"}) {
            CmdOutput out = runner.run(cat, {flag, "-"}, string());
            expect(out.stdout_bytes.empty(), string("stdout not empty for ") + flag);
            expect(out.exit_code == 0, string("nonzero exit for ") + flag);
        }
    });


    /* LARGE PAYLOADS */
    tests.add_test("2 MiB of random bytes pass through a pipe unchanged", [&]() {
        const string data = Fixtures::random_bytes(2 * 1024 * 1024, 7);
        CmdOutput out = runner.run(cat, {"-"}, data);
        expect(out.stdout_bytes == data, "payload changed in transit");
        expect(out.exit_code == 0, "exit code should be 0");
    });
    tests.add_test("2 MiB of random bytes pass through to a file unchanged", [&]() {
        Fixtures fixtures;
        const string data = Fixtures::random_bytes(2 * 1024 * 1024, 11);
        const string output = fixtures.make_temp_file("passthrough");
        std::optional<int> code = runner.run_to_file(cat, {"-"}, data, std::nullopt, output);
        expect(code == 0, "exit code should be 0");
        expect(Fixtures::read_file(output) == data, "file content differs from payload");
    });


    /* FAILURE MODES */
    tests.add_test("unspawnable executable throws", [&]() {
        bool threw = false;
        try {
            runner.run("/nonexistent-catcheck-dir/prog", {});
        }
        catch (HarnessException& e) {
            threw = true;
            expect(contains(e.what(), "failed to spawn"), e.what());
        }
        expect(threw, "expected HarnessException");
    });
    tests.add_test("a child that ignores its stdin fails the stdin writer", [&]() {
        const string truth = find_in_path("true").value_or("/bin/true");
        const string payload = Fixtures::random_bytes(2 * 1024 * 1024, 7);
        bool threw = false;
        try {
            runner.run(truth, {}, payload);
        }
        catch (HarnessException& e) {
            threw = true;
            expect(contains(e.what(), "writing stdin"), e.what());
        }
        expect(threw, "expected HarnessException");
    });
    tests.add_test("stdout without a reader ends the writer", [&]() {
        CmdOutput out = runner.run_into_closed_pipe(cat, {"-"}, string("broken pipe data\n"));
        bool sigpipe = out.term_signal == SIGPIPE;
        bool error_exit = out.exit_code && *out.exit_code != 0;
        expect(sigpipe || error_exit, "cat should fail to write");
    });
    tests.add_test("timeout kills a hung child", [&]() {
        ProcessRunner bounded(false, 200);
        const string sleep = find_in_path("sleep").value_or("/bin/sleep");
        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            bounded.run(sleep, {"10"});
        }
        catch (ProcessRunner::TimeoutException&) {
            threw = true;
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        expect(threw, "expected TimeoutException");
        expect(elapsed < std::chrono::seconds(5), "child was not killed promptly");
    });
    tests.add_test("timeout leaves fast children alone", [&]() {
        ProcessRunner bounded(false, 5000);
        CmdOutput out = bounded.run(cat, {"-"}, string("quick\n"));
        expect_equal(out.stdout_bytes, "quick\n", "stdout");
    });

    return tests.run_all_tests() == 0 ? 0 : 1;
}
