#include "Comparator.h"
#include "FifoFeed.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <algorithm>
#include <cstdio>
#include <sstream>

using std::string;
using std::vector;

namespace {

/* removes the listed scratch files when the comparison is over */
struct ScratchFiles {
    vector<string> paths;
    ~ScratchFiles() {
        for (const string& p : paths) std::remove(p.c_str());
    }
};

string describe_status(const std::optional<int>& exit_code, int term_signal = 0)
{
    if (exit_code) return "exit " + std::to_string(*exit_code);
    if (term_signal != 0) return "signal " + std::to_string(term_signal);
    return "no exit code";
}

size_t first_difference(const string& a, const string& b)
{
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) return i;
    }
    return n;
}

} // namespace


std::optional<MismatchReport> diff_outputs(const string& label,
                                           const CmdOutput& subject,
                                           const CmdOutput& reference)
{
    if (subject.stdout_bytes == reference.stdout_bytes &&
        subject.stderr_bytes == reference.stderr_bytes &&
        subject.exit_code == reference.exit_code &&
        subject.term_signal == reference.term_signal) {
        return std::nullopt;
    }
    std::ostringstream msg;
    msg << label << " mismatch"
        << "\n=== subject stdout (" << subject.stdout_bytes.size() << "B) ===\n"
        << lossy_text(subject.stdout_bytes)
        << "\n=== reference stdout (" << reference.stdout_bytes.size() << "B) ===\n"
        << lossy_text(reference.stdout_bytes)
        << "\n=== subject stderr (" << subject.stderr_bytes.size() << "B) ===\n"
        << lossy_text(subject.stderr_bytes)
        << "\n=== reference stderr (" << reference.stderr_bytes.size() << "B) ===\n"
        << lossy_text(reference.stderr_bytes)
        << "\n=== subject status ===\n" << describe_status(subject.exit_code, subject.term_signal)
        << "\n=== reference status ===\n" << describe_status(reference.exit_code, reference.term_signal);
    return MismatchReport{msg.str()};
}


Comparator::Comparator(const HarnessConfig& config, const ProcessRunner& runner,
                       const Fixtures& fixtures)
  : _config(config), _runner(runner), _fixtures(fixtures) {}

/**
 * Run both programs with stdout going to fresh scratch files and compare the
 * bytes they wrote and how they exited.
 *
 * @param run_to_file Called as (executable, identity, output_path).
 */
template <typename RunToFile>
std::optional<MismatchReport> Comparator::compare_output_files(const string& label,
                                                               RunToFile run_to_file) const
{
    ScratchFiles scratch;
    scratch.paths.push_back(_fixtures.make_temp_file("subject-out"));
    scratch.paths.push_back(_fixtures.make_temp_file("reference-out"));
    const string& subject_file = scratch.paths[0];
    const string& reference_file = scratch.paths[1];

    std::optional<int> subject_code =
        run_to_file(_config.subject, std::optional<string>(_config.reference), subject_file);
    std::optional<int> reference_code =
        run_to_file(_config.reference, std::optional<string>(), reference_file);

    const string subject_bytes = Fixtures::read_file(subject_file);
    const string reference_bytes = Fixtures::read_file(reference_file);
    if (subject_bytes == reference_bytes && subject_code == reference_code) return std::nullopt;

    LOG_F(INFO, "%s differs", label.c_str());
    std::ostringstream msg;
    msg << label << " mismatch";
    if (subject_bytes != reference_bytes) {
        msg << " (first difference at byte " << first_difference(subject_bytes, reference_bytes) << ")";
    }
    msg << "\n=== subject file (" << subject_bytes.size() << "B) ===\n"
        << lossy_text(subject_bytes)
        << "\n=== reference file (" << reference_bytes.size() << "B) ===\n"
        << lossy_text(reference_bytes)
        << "\n=== subject status ===\n" << describe_status(subject_code)
        << "\n=== reference status ===\n" << describe_status(reference_code);
    return MismatchReport{msg.str()};
}

/**
 * Compare subject and reference on one command line, first through pipes,
 * then with stdout redirected to files.
 *
 * @param args Arguments after argv[0], passed in exactly this order.
 * @param stdin_data Bytes fed to both processes' stdin, if any.
 *
 * @return The first mismatch found, or nothing if both modes agree.
 */
std::optional<MismatchReport> Comparator::compare(const vector<string>& args,
                                                  const std::optional<string>& stdin_data) const
{
    const string label = "output for args [" + quote_args(args) + "]";
    CmdOutput subject_out = _runner.run(_config.subject, args, stdin_data, _config.reference);
    CmdOutput reference_out = _runner.run(_config.reference, args, stdin_data);
    if (auto report = diff_outputs(label, subject_out, reference_out)) return report;

    return compare_output_files(
        "file output for args [" + quote_args(args) + "]",
        [&](const string& exe, const std::optional<string>& identity, const string& path) {
            return _runner.run_to_file(exe, args, stdin_data, identity, path);
        });
}

/**
 * Compare subject and reference reading from a FIFO fed by a producer thread.
 * A fresh producer writes the same chunks for each of the four runs.
 */
std::optional<MismatchReport> Comparator::compare_fifo(const string& fifo_path,
                                                       const vector<string>& options,
                                                       const vector<string>& chunks,
                                                       std::chrono::milliseconds delay) const
{
    FifoFeed::make_fifo(fifo_path);
    const string label = "fifo output for options [" + quote_args(options) + "]";
    CmdOutput subject_out = FifoFeed::run_with_fifo_input(
        _runner, _config.subject, fifo_path, options, chunks, delay, _config.reference);
    CmdOutput reference_out = FifoFeed::run_with_fifo_input(
        _runner, _config.reference, fifo_path, options, chunks, delay);
    if (auto report = diff_outputs(label, subject_out, reference_out)) return report;

    return compare_output_files(
        "fifo file output for options [" + quote_args(options) + "]",
        [&](const string& exe, const std::optional<string>& identity, const string& path) {
            return FifoFeed::run_with_fifo_input_to_file(
                _runner, exe, fifo_path, options, chunks, delay, identity, path);
        });
}

/**
 * Compare only how both programs end when their stdout has no reader, e.g.
 * `prog - | head -n0`. Output cannot be compared: there is nowhere for it
 * to go.
 */
std::optional<MismatchReport> Comparator::compare_exit_with_closed_stdout(
        const vector<string>& args, const std::optional<string>& stdin_data) const
{
    CmdOutput subject_out = _runner.run_into_closed_pipe(
        _config.subject, args, stdin_data, _config.reference);
    CmdOutput reference_out = _runner.run_into_closed_pipe(_config.reference, args, stdin_data);
    if (subject_out.exit_code == reference_out.exit_code &&
        subject_out.term_signal == reference_out.term_signal) {
        return std::nullopt;
    }
    return MismatchReport{"broken pipe status mismatch for args [" + quote_args(args) + "]: " +
                          describe_status(subject_out.exit_code, subject_out.term_signal) +
                          " vs " +
                          describe_status(reference_out.exit_code, reference_out.term_signal)};
}

/* compare exit codes with stdout discarded into /dev/null */
std::optional<MismatchReport> Comparator::compare_exit_with_null_stdout(
        const vector<string>& args) const
{
    std::optional<int> subject_code = _runner.run_to_file(
        _config.subject, args, std::nullopt, _config.reference, "/dev/null");
    std::optional<int> reference_code = _runner.run_to_file(
        _config.reference, args, std::nullopt, std::nullopt, "/dev/null");
    if (subject_code == reference_code) return std::nullopt;
    return MismatchReport{"exit mismatch for args [" + quote_args(args) + "] with stdout to /dev/null: " +
                          describe_status(subject_code) + " vs " + describe_status(reference_code)};
}
