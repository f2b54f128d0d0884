#include "Harness.h"
#include "FifoFeed.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <type_traits>
#include <variant>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using std::string;
using std::vector;

namespace {

/* makes files a case locked down readable again, however the case ended */
struct ModeRestorer {
    vector<string> paths;
    ~ModeRestorer() {
        for (const string& p : paths) {
            if (chmod(p.c_str(), 0600) != 0) {
                LOG_F(WARNING, "could not restore mode of %s: %s", p.c_str(), strerror(errno));
            }
        }
    }
};

} // namespace


Harness::Harness(const HarnessConfig& config, const Fixtures& fixtures)
  : _config(config),
    _fixtures(fixtures),
    _runner(config.verbose, config.timeout_ms),
    _comparator(config, _runner, fixtures) {}

string Harness::subject_name() const
{
    return fs::path(_config.subject).filename().string();
}

/**
 * Run one case: create its files, dispatch on its shape, and turn the result
 * or the exception into a CaseResult.
 */
CaseResult Harness::run_case(const TestCase& tc) const
{
    ModeRestorer restorer;
    try {
        if (auto compare = std::get_if<CompareCase>(&tc.spec)) {
            for (const FileSetup& s : compare->setup) {
                if (s.kind == FileSetup::Kind::regular_file && s.mode) {
                    restorer.paths.push_back(s.path);
                }
            }
        }
        std::optional<MismatchReport> report = std::visit(
            [this](const auto& spec) { return dispatch(spec); }, tc.spec);
        if (report) return CaseResult{CaseOutcome::failed, report->message};
        return CaseResult{CaseOutcome::passed, ""};
    }
    catch (ProcessRunner::TimeoutException& e) {
        return CaseResult{CaseOutcome::timed_out, e.what()};
    }
    catch (HarnessException& e) {
        LOG_F(WARNING, "infrastructure failure in '%s': %s", tc.name.c_str(), e.what());
        return CaseResult{CaseOutcome::failed, e.what()};
    }
    catch (std::exception& e) {
        LOG_F(ERROR, "unexpected exception in '%s': %s", tc.name.c_str(), e.what());
        return CaseResult{CaseOutcome::failed, e.what()};
    }
}

std::optional<MismatchReport> Harness::dispatch(const CompareCase& c) const
{
    apply_setup(c.setup);
    return _comparator.compare(c.args, c.stdin_data);
}

/**
 * FIFO case: optionally check that the subject reproduces the chunks in
 * order, then compare subject and reference through the FIFO.
 */
std::optional<MismatchReport> Harness::dispatch(const FifoCase& c) const
{
    const string fifo = _fixtures.path(c.fifo_name);
    FifoFeed::make_fifo(fifo);

    if (c.expect_concatenation) {
        string expected;
        for (const string& chunk : c.chunks) expected += chunk;
        CmdOutput out = FifoFeed::run_with_fifo_input(
            _runner, _config.subject, fifo, c.options, c.chunks, c.delay, _config.reference);
        if (out.stdout_bytes != expected) {
            return MismatchReport{"fifo stream mismatch: expected " +
                                  std::to_string(expected.size()) + "B \"" + lossy_text(expected) +
                                  "\", got " + std::to_string(out.stdout_bytes.size()) + "B \"" +
                                  lossy_text(out.stdout_bytes) + "\""};
        }
    }
    return _comparator.compare_fifo(fifo, c.options, c.chunks, c.delay);
}

std::optional<MismatchReport> Harness::dispatch(const ScriptedCase& c) const
{
    switch (c.kind) {
        case ScriptKind::help_output:
            return check_own_text(c, "Usage: " + subject_name(), "help");
        case ScriptKind::version_output:
            return check_own_text(c, subject_name(), "version");
        case ScriptKind::help_stdout_closed:
            return _comparator.compare_exit_with_null_stdout(c.args);
        case ScriptKind::broken_pipe:
            return _comparator.compare_exit_with_closed_stdout(c.args, c.stdin_data);
    }
    return MismatchReport{"unknown scripted case"};
}

/**
 * Help and version text is the one place the subject must NOT match the
 * reference: it has to describe itself.
 */
std::optional<MismatchReport> Harness::check_own_text(const ScriptedCase& c,
                                                      const string& needle,
                                                      const string& what) const
{
    CmdOutput subject_out = _runner.run(_config.subject, c.args, c.stdin_data, _config.reference);
    CmdOutput reference_out = _runner.run(_config.reference, c.args, c.stdin_data);
    if (subject_out.stdout_bytes == reference_out.stdout_bytes) {
        return MismatchReport{what + " output should remain subject-specific"};
    }
    if (!contains(subject_out.stdout_bytes, needle)) {
        return MismatchReport{what + " output does not mention \"" + needle + "\": " +
                              lossy_text(subject_out.stdout_bytes)};
    }
    return std::nullopt;
}

/**
 * Create the files, directories and links a case needs.
 *
 * @throws HarnessException if any of them cannot be created.
 */
void Harness::apply_setup(const vector<FileSetup>& setup) const
{
    for (const FileSetup& s : setup) {
        std::error_code ec;
        switch (s.kind) {
            case FileSetup::Kind::regular_file: {
                string data;
                data.reserve(s.content.size() * s.repeat);
                for (size_t i = 0; i < s.repeat; ++i) data += s.content;
                Fixtures::write_file(s.path, data);
                if (s.mode && chmod(s.path.c_str(), *s.mode) != 0) {
                    throw HarnessException("chmod " + s.path + ": " + strerror(errno));
                }
                break;
            }
            case FileSetup::Kind::directory:
                fs::create_directories(s.path, ec);
                break;
            case FileSetup::Kind::symlink:
                fs::remove(s.path, ec);
                if (!ec) fs::create_symlink(s.content, s.path, ec);
                break;
            case FileSetup::Kind::hard_link:
                fs::remove(s.path, ec);
                if (!ec) fs::create_hard_link(s.content, s.path, ec);
                break;
        }
        if (ec) {
            throw HarnessException("setting up " + s.path + ": " + ec.message());
        }
        LOG_F(INFO, "set up %s", s.path.c_str());
    }
}
