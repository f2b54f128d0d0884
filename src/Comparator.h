#pragma once

#include "Fixtures.h"
#include "HarnessConfig.h"
#include "ProcessRunner.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * Why a comparison failed, already rendered for a [FAIL] line: both sides'
 * stdout and stderr (lossily decoded), exit codes and byte counts.
 */
struct MismatchReport {
    std::string message;
};

/**
 * Runs the same command line against the subject and the reference and
 * demands byte-for-byte identical behavior.
 *
 * Every comparison happens twice: once with stdout captured through a pipe
 * (stdout, stderr and exit code must all match) and once with stdout
 * redirected to a regular file (the written files and exit codes must match), because an
 * implementation may take a different I/O path depending on what its stdout
 * is. The subject always runs under the reference's path as argv[0].
 *
 * Infrastructure problems propagate as HarnessException; a behavioral
 * difference is returned as a MismatchReport.
 */
class Comparator {
  public:
    Comparator(const HarnessConfig& config, const ProcessRunner& runner,
               const Fixtures& fixtures);

    std::optional<MismatchReport> compare(const std::vector<std::string>& args,
                                          const std::optional<std::string>& stdin_data) const;

    std::optional<MismatchReport> compare_fifo(const std::string& fifo_path,
                                               const std::vector<std::string>& options,
                                               const std::vector<std::string>& chunks,
                                               std::chrono::milliseconds delay) const;

    std::optional<MismatchReport> compare_exit_with_closed_stdout(
            const std::vector<std::string>& args,
            const std::optional<std::string>& stdin_data) const;

    std::optional<MismatchReport> compare_exit_with_null_stdout(
            const std::vector<std::string>& args) const;

    const std::string& subject() const { return _config.subject; }
    const std::string& reference() const { return _config.reference; }

  private:
    template <typename RunToFile>
    std::optional<MismatchReport> compare_output_files(const std::string& label,
                                                       RunToFile run_to_file) const;

    const HarnessConfig& _config;
    const ProcessRunner& _runner;
    const Fixtures& _fixtures;
};

/* describe the first difference between two captured runs, if any */
std::optional<MismatchReport> diff_outputs(const std::string& label,
                                           const CmdOutput& subject,
                                           const CmdOutput& reference);
