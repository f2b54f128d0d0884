#include "Catcheck.h"
#include "UnitTestHarness.h"
#include <loguru/loguru.hpp>
#include <cstdlib>

using std::string;
using std::vector;

/* sets an environment variable for one scope, then puts the old value back */
class ScopedEnv {
  public:
    ScopedEnv(const string& name, const char *value) : _name(name) {
        const char *old = getenv(name.c_str());
        if (old) _old = old;
        _had_old = old != nullptr;
        if (value) setenv(name.c_str(), value, 1);
        else unsetenv(name.c_str());
    }
    ~ScopedEnv() {
        if (_had_old) setenv(_name.c_str(), _old.c_str(), 1);
        else unsetenv(_name.c_str());
    }

  private:
    string _name;
    string _old;
    bool _had_old = false;
};

int main(int argc, char* argv[])
{
    loguru::init(argc, argv);
    loguru::add_file("catcheck_tests.log", loguru::Truncate, loguru::Verbosity_MAX);

    LOG_F(INFO, "RUNNING CATCHECK TESTS...");
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF; // don't write to stderr

    const string cat = find_in_path("cat").value_or("/bin/cat");
    UnitTestHarness tests;


    /* ARGUMENT PARSING */
    tests.add_test("subject as separate value", [&]() {
        ScopedEnv env("CATCHECK_SUBJECT", nullptr);
        HarnessConfig c = parse_arguments({"catcheck", "--subject", "/opt/wcat"});
        expect(c.valid, c.error_message);
        expect_equal(c.subject, "/opt/wcat", "subject");
        expect(c.reference.empty(), "reference should default to empty");
        expect(!c.has_filter && !c.verbose && c.timeout_ms == 0, "defaults");
    });
    tests.add_test("every option in --opt=value form", [&]() {
        HarnessConfig c = parse_arguments({"catcheck", "--subject=/s", "--reference=/r",
                                           "--filter=matrix", "--timeout=250", "--log=x.log"});
        expect(c.valid, c.error_message);
        expect_equal(c.subject, "/s", "subject");
        expect_equal(c.reference, "/r", "reference");
        expect_equal(c.filter, "matrix", "filter");
        expect(c.has_filter, "has_filter");
        expect(c.timeout_ms == 250, "timeout");
        expect_equal(c.log_file, "x.log", "log");
    });
    tests.add_test("short flags", [&]() {
        HarnessConfig c = parse_arguments({"catcheck", "-v", "-f", "stdin", "--subject", "/s"});
        expect(c.valid, c.error_message);
        expect(c.verbose, "verbose");
        expect(c.has_filter, "has_filter");
        expect_equal(c.filter, "stdin", "filter");
    });
    tests.add_test("an empty filter still counts as a filter", [&]() {
        HarnessConfig c = parse_arguments({"catcheck", "--subject", "/s", "--filter", ""});
        expect(c.valid && c.has_filter, "has_filter");
    });
    tests.add_test("bad timeouts are rejected", [&]() {
        for (const char *bad : {"abc", "-1", "10ms", ""}) {
            HarnessConfig c = parse_arguments({"catcheck", "--subject", "/s", "--timeout", bad});
            expect(!c.valid, string("accepted timeout '") + bad + "'");
        }
    });
    tests.add_test("missing value is an error", [&]() {
        HarnessConfig c = parse_arguments({"catcheck", "--subject"});
        expect(!c.valid, "accepted --subject without value");
        expect_equal(c.error_message, "missing value for --subject", "message");
    });
    tests.add_test("unknown argument is an error", [&]() {
        HarnessConfig c = parse_arguments({"catcheck", "--subject", "/s", "--bogus"});
        expect(!c.valid, "accepted --bogus");
        expect_equal(c.error_message, "unknown argument: --bogus", "message");
    });
    tests.add_test("help needs no subject", [&]() {
        ScopedEnv env("CATCHECK_SUBJECT", nullptr);
        HarnessConfig c = parse_arguments({"catcheck", "-h"});
        expect(c.valid && c.show_help, "help");
    });
    tests.add_test("subject falls back to the environment", [&]() {
        ScopedEnv env("CATCHECK_SUBJECT", "/from/env");
        HarnessConfig c = parse_arguments({"catcheck"});
        expect(c.valid, c.error_message);
        expect_equal(c.subject, "/from/env", "subject");
    });
    tests.add_test("command line beats the environment", [&]() {
        ScopedEnv env("CATCHECK_SUBJECT", "/from/env");
        HarnessConfig c = parse_arguments({"catcheck", "--subject", "/from/argv"});
        expect_equal(c.subject, "/from/argv", "subject");
    });
    tests.add_test("no subject anywhere is an error", [&]() {
        ScopedEnv env("CATCHECK_SUBJECT", nullptr);
        HarnessConfig c = parse_arguments({"catcheck"});
        expect(!c.valid, "accepted a missing subject");
    });


    /* PATH SEARCH */
    tests.add_test("PATH entries keep their order", [&]() {
        ScopedEnv env("PATH", "/a::/b:/c");
        expect(extract_paths_from_PATH() == vector<string>{"/a", "/b", "/c"}, "paths");
    });
    tests.add_test("cat is found on PATH", [&]() {
        std::optional<string> found = find_in_path("cat");
        expect(found.has_value(), "cat not found");
        expect(found->size() > 4 && found->substr(found->size() - 4) == "/cat", *found);
    });
    tests.add_test("unknown programs are not found", [&]() {
        expect(!find_in_path("catcheck-no-such-program"), "found a ghost");
    });


    /* WHOLE RUNS */
    tests.add_test("--help exits 0", [&]() {
        expect(Catcheck::run({"catcheck", "--help"}) == 0, "exit status");
    });
    tests.add_test("usage errors exit 2", [&]() {
        ScopedEnv env("CATCHECK_SUBJECT", nullptr);
        expect(Catcheck::run({"catcheck"}) == 2, "no subject");
        expect(Catcheck::run({"catcheck", "--subject", "/nonexistent-catcheck-dir/wcat"}) == 2,
               "unusable subject");
    });
    tests.add_test("cat checked against itself passes a filtered run", [&]() {
        expect(Catcheck::run({"catcheck", "--subject", cat, "--reference", cat,
                              "--filter", "matrix file short bundled -nE"}) == 0,
               "exit status");
    });

    return tests.run_all_tests() == 0 ? 0 : 1;
}
