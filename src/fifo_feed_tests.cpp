#include "Catcheck.h"
#include "FifoFeed.h"
#include "Fixtures.h"
#include "UnitTestHarness.h"
#include <loguru/loguru.hpp>
#include <chrono>

using std::string;
using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
    loguru::init(argc, argv);
    loguru::add_file("catcheck_tests.log", loguru::Truncate, loguru::Verbosity_MAX);

    LOG_F(INFO, "RUNNING FIFO FEED TESTS...");
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF; // don't write to stderr

    const string cat = find_in_path("cat").value_or("/bin/cat");
    ProcessRunner runner;
    Fixtures fixtures;
    UnitTestHarness tests;


    tests.add_test("delayed chunks arrive concatenated in write order", [&]() {
        const string fifo = fixtures.path("stream.fifo");
        FifoFeed::make_fifo(fifo);
        CmdOutput out = FifoFeed::run_with_fifo_input(
            runner, cat, fifo, {}, {"chunk1\n", "chunk2\n"}, 50ms);
        expect_equal(out.stdout_bytes, "chunk1\nchunk2\n", "stdout");
        expect(out.exit_code == 0, "exit code should be 0");
    });
    tests.add_test("options come before the fifo operand", [&]() {
        const string fifo = fixtures.path("numbered.fifo");
        FifoFeed::make_fifo(fifo);
        CmdOutput out = FifoFeed::run_with_fifo_input(
            runner, cat, fifo, {"-n"}, {"a\nb\n"}, 0ms);
        expect_equal(out.stdout_bytes, "     1\ta\n     2\tb\n", "stdout");
    });
    tests.add_test("fifo input with stdout to a file", [&]() {
        const string fifo = fixtures.path("to_file.fifo");
        FifoFeed::make_fifo(fifo);
        const string output = fixtures.make_temp_file("fifo-out");
        std::optional<int> code = FifoFeed::run_with_fifo_input_to_file(
            runner, cat, fifo, {"-E"}, {"one\n", "\n"}, 10ms, std::nullopt, output);
        expect(code == 0, "exit code should be 0");
        expect_equal(Fixtures::read_file(output), "one$\n$\n", "file content");
    });
    tests.add_test("a fifo can be fed more than once", [&]() {
        const string fifo = fixtures.path("reused.fifo");
        FifoFeed::make_fifo(fifo);
        for (int i = 0; i < 3; ++i) {
            CmdOutput out = FifoFeed::run_with_fifo_input(
                runner, cat, fifo, {}, {"again\n"}, 0ms);
            expect_equal(out.stdout_bytes, "again\n", "stdout on pass " + std::to_string(i));
        }
    });
    tests.add_test("make_fifo accepts an existing fifo", [&]() {
        const string fifo = fixtures.path("twice.fifo");
        FifoFeed::make_fifo(fifo);
        FifoFeed::make_fifo(fifo);
    });
    tests.add_test("make_fifo refuses a regular file", [&]() {
        bool threw = false;
        try {
            FifoFeed::make_fifo(fixtures.sample_a);
        }
        catch (HarnessException&) {
            threw = true;
        }
        expect(threw, "expected HarnessException");
    });
    tests.add_test("reader that never starts does not strand the producer", [&]() {
        const string fifo = fixtures.path("orphan.fifo");
        FifoFeed::make_fifo(fifo);
        bool threw = false;
        try {
            FifoFeed::run_with_fifo_input(
                runner, "/nonexistent-catcheck-dir/prog", fifo, {}, {"lost\n"}, 0ms);
        }
        catch (HarnessException&) {
            threw = true;
        }
        expect(threw, "expected HarnessException");
    });

    tests.add_test("a producer cancelled before any reader exits promptly", [&]() {
        const string fifo = fixtures.path("cancelled.fifo");
        FifoFeed::make_fifo(fifo);
        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 200; ++i) {
            FifoProducer producer(fifo, {"never read\n"}, 0ms);
            producer.finish(false);
            expect(!producer.opened(), "producer opened a fifo nobody reads");
        }
        expect(std::chrono::steady_clock::now() - start < 10s, "cancellation took too long");
    });
    tests.add_test("a reader exiting without opening the fifo releases the producer", [&]() {
        const string fifo = fixtures.path("ignored.fifo");
        FifoFeed::make_fifo(fifo);
        const string truth = find_in_path("true").value_or("/bin/true");
        for (int i = 0; i < 50; ++i) {
            CmdOutput out = FifoFeed::run_with_fifo_input(
                runner, truth, fifo, {}, {"lost\n"}, 0ms);
            expect(out.exit_code == 0, "true should exit 0");
        }
    });

    return tests.run_all_tests() == 0 ? 0 : 1;
}
