#pragma once

#include "HarnessException.h"
#include <optional>
#include <string>
#include <vector>

/**
 * Result of one child process run with captured output. 'exit_code' is empty
 * when the child was terminated by a signal rather than exiting.
 */
struct CmdOutput {
    std::optional<int> exit_code;
    std::string stdout_bytes;
    std::string stderr_bytes;
    int term_signal = 0;
};

/**
 * A ProcessRunner spawns a single executable with an exact argument vector
 * and collects what it produces. Standard output is either captured through a
 * pipe, redirected to a regular file, or connected to a pipe that has no
 * reader. Standard error is always captured through a pipe.
 *
 * Stdin: if a payload is given, a background thread writes all of it to the
 * child's stdin while the calling thread drains stdout/stderr, so a child that
 * produces more output than a pipe buffer holds before consuming its input
 * cannot deadlock against us. Without a payload the child reads /dev/null.
 *
 * Identity: 'identity' replaces argv[0] of the child. cat-like tools print
 * argv[0] in their diagnostics, so running the subject under the reference's
 * name makes error text directly comparable.
 *
 * Exceptions: HarnessException if the process cannot be spawned or its stdin
 * cannot be written; TimeoutException if a timeout is configured and the
 * process group outlives it.
 */
class ProcessRunner {
  public:
    ProcessRunner(bool verbose = false, long timeout_ms = 0);

    CmdOutput run(const std::string& executable,
                  const std::vector<std::string>& args,
                  const std::optional<std::string>& stdin_data = std::nullopt,
                  const std::optional<std::string>& identity = std::nullopt) const;

    std::optional<int> run_to_file(const std::string& executable,
                                   const std::vector<std::string>& args,
                                   const std::optional<std::string>& stdin_data,
                                   const std::optional<std::string>& identity,
                                   const std::string& output_path) const;

    CmdOutput run_into_closed_pipe(const std::string& executable,
                                   const std::vector<std::string>& args,
                                   const std::optional<std::string>& stdin_data = std::nullopt,
                                   const std::optional<std::string>& identity = std::nullopt) const;

    long timeout_ms() const { return _timeout_ms; }

  private:
    enum class StdoutMode { pipe, file, closed_pipe };

    CmdOutput spawn_and_collect(const std::string& executable,
                                const std::vector<std::string>& args,
                                const std::optional<std::string>& stdin_data,
                                const std::optional<std::string>& identity,
                                StdoutMode mode,
                                const std::string& output_path) const;

    bool _verbose;
    long _timeout_ms;

  public:
    class TimeoutException: public HarnessException {
        public:
            TimeoutException(const std::string& msg) : HarnessException(msg) {}
    };
};
