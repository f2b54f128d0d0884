#include "ProcessRunner.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string;
using std::vector;
using Clock = std::chrono::steady_clock;

namespace {

/* owns one file descriptor; closes it when it goes out of scope */
struct ScopedFd {
    int fd = -1;
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd(fd) {}
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;
    ~ScopedFd() { reset(); }
    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
    int release() {
        int result = fd;
        fd = -1;
        return result;
    }
};

void make_pipe(ScopedFd& read_end, ScopedFd& write_end, const string& what)
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw HarnessException("pipe for " + what + ": " + strerror(errno));
    }
    read_end.fd = fds[0];
    write_end.fd = fds[1];
}

/* writes all of 'data' to 'fd', then closes it. Returns 0 or an errno. */
int write_all_and_close(int fd, const string& data)
{
    int err = 0;
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = errno;
            break;
        }
        offset += static_cast<size_t>(n);
    }
    close(fd);
    return err;
}

/* reads whatever is available on 'fd' into 'dst'; false on EOF */
bool drain_once(int fd, string& dst)
{
    char buf[65536];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            dst.append(buf, static_cast<size_t>(n));
            return true;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN) return true;
        return false;
    }
}

string describe_command(const string& executable, const vector<string>& args)
{
    string desc = "\"" + executable + "\"";
    if (!args.empty()) desc += " " + quote_args(args);
    return desc;
}

} // namespace


/**
 * Construct a runner.
 *
 * @param verbose Print a [CMD ] line for every spawned process.
 * @param timeout_ms Wall clock limit per process, 0 for none.
 */
ProcessRunner::ProcessRunner(bool verbose, long timeout_ms)
  : _verbose(verbose), _timeout_ms(timeout_ms)
{
    // a child that exits without reading its stdin must surface as EPIPE in
    // the writer thread, not kill the harness
    signal(SIGPIPE, SIG_IGN);
}

CmdOutput ProcessRunner::run(const string& executable,
                             const vector<string>& args,
                             const std::optional<string>& stdin_data,
                             const std::optional<string>& identity) const
{
    CmdOutput out = spawn_and_collect(executable, args, stdin_data, identity,
                                      StdoutMode::pipe, "");
    if (_verbose) {
        std::cout << "[CMD ] " << describe_command(executable, args)
                  << " -> status " << (out.exit_code ? std::to_string(*out.exit_code) : "none")
                  << ", stdout " << out.stdout_bytes.size() << "B"
                  << ", stderr " << out.stderr_bytes.size() << "B" << std::endl;
    }
    return out;
}

/**
 * Like 'run', but standard output goes to a regular file instead of a pipe.
 * The file is created if needed and truncated.
 *
 * @param output_path File receiving the child's standard output.
 *
 * @return The child's exit code, empty if it was killed by a signal.
 */
std::optional<int> ProcessRunner::run_to_file(const string& executable,
                                              const vector<string>& args,
                                              const std::optional<string>& stdin_data,
                                              const std::optional<string>& identity,
                                              const string& output_path) const
{
    CmdOutput out = spawn_and_collect(executable, args, stdin_data, identity,
                                      StdoutMode::file, output_path);
    if (_verbose) {
        std::cout << "[CMD ] " << describe_command(executable, args)
                  << " -> status " << (out.exit_code ? std::to_string(*out.exit_code) : "none")
                  << ", file stdout at " << output_path
                  << ", stderr " << out.stderr_bytes.size() << "B" << std::endl;
    }
    return out.exit_code;
}

/**
 * Run with standard output connected to a pipe whose read end is already
 * closed, as if piped into a consumer that exited before reading anything.
 * The first write the child makes to stdout fails with EPIPE or SIGPIPE.
 */
CmdOutput ProcessRunner::run_into_closed_pipe(const string& executable,
                                              const vector<string>& args,
                                              const std::optional<string>& stdin_data,
                                              const std::optional<string>& identity) const
{
    CmdOutput out = spawn_and_collect(executable, args, stdin_data, identity,
                                      StdoutMode::closed_pipe, "");
    if (_verbose) {
        std::cout << "[CMD ] " << describe_command(executable, args)
                  << " -> status " << (out.exit_code ? std::to_string(*out.exit_code) : "none")
                  << ", signal " << out.term_signal
                  << ", stdout closed, stderr " << out.stderr_bytes.size() << "B" << std::endl;
    }
    return out;
}

/**
 * Fork and exec one child, feed its stdin, collect stdout/stderr and reap it.
 *
 * Exec failure is detected through a close-on-exec pipe: the child writes
 * errno into it when execv returns, and the parent sees EOF on success.
 */
CmdOutput ProcessRunner::spawn_and_collect(const string& executable,
                                           const vector<string>& args,
                                           const std::optional<string>& stdin_data,
                                           const std::optional<string>& identity,
                                           StdoutMode mode,
                                           const string& output_path) const
{
    const string what = describe_command(executable, args);

    /* SET UP CHILD I/O */
    ScopedFd in_r, in_w, out_r, out_w, err_r, err_w, status_r, status_w;
    if (stdin_data) {
        make_pipe(in_r, in_w, what);
    }
    else {
        in_r.fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (in_r.fd == -1) {
            throw HarnessException("open /dev/null for " + what + ": " + strerror(errno));
        }
    }
    switch (mode) {
        case StdoutMode::pipe:
            make_pipe(out_r, out_w, what);
            break;
        case StdoutMode::file:
            out_w.fd = open(output_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (out_w.fd == -1) {
                throw HarnessException("open " + output_path + " for " + what +
                                       ": " + strerror(errno));
            }
            break;
        case StdoutMode::closed_pipe:
            make_pipe(out_r, out_w, what);
            out_r.reset();  // no reader, ever
            break;
    }
    make_pipe(err_r, err_w, what);
    make_pipe(status_r, status_w, what);

    /* argv must be fully built before fork: no allocation in the child */
    string arg0 = identity.value_or(executable);
    vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(&arg0[0]);
    vector<string> args_copy = args;
    for (string& a : args_copy) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        throw HarnessException("fork for " + what + ": " + strerror(errno));
    }
    if (pid == 0) {
        // own process group so a timeout can kill everything the child starts
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        dup2(in_r.fd, STDIN_FILENO);
        dup2(out_w.fd, STDOUT_FILENO);
        dup2(err_w.fd, STDERR_FILENO);
        execv(executable.c_str(), argv.data());
        int exec_errno = errno;
        ssize_t ignored = write(status_w.fd, &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    /* parent: drop the child's ends */
    in_r.reset();
    out_w.reset();
    err_w.reset();
    status_w.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_r.fd, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        throw HarnessException("failed to spawn " + what + ": " + strerror(exec_errno));
    }

    /* FEED STDIN IN THE BACKGROUND */
    int write_errno = 0;
    std::thread writer;
    if (stdin_data) {
        int fd = in_w.release();
        writer = std::thread([fd, &stdin_data, &write_errno]() {
            write_errno = write_all_and_close(fd, *stdin_data);
        });
    }

    /* DRAIN STDOUT/STDERR UNTIL EOF OR DEADLINE */
    CmdOutput result;
    const bool has_deadline = _timeout_ms > 0;
    const auto deadline = Clock::now() + std::chrono::milliseconds(_timeout_ms);
    bool timed_out = false;

    vector<pollfd> pfds;
    vector<string*> sinks;
    if (out_r.fd >= 0) {
        pfds.push_back(pollfd{out_r.fd, POLLIN, 0});
        sinks.push_back(&result.stdout_bytes);
    }
    pfds.push_back(pollfd{err_r.fd, POLLIN, 0});
    sinks.push_back(&result.stderr_bytes);

    size_t open_streams = pfds.size();
    while (open_streams > 0) {
        int wait_ms = -1;
        if (has_deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            if (left <= 0) {
                timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }
        int ready = poll(pfds.data(), pfds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_F(ERROR, "poll failed for %s: %s", what.c_str(), strerror(errno));
            break;
        }
        if (ready == 0) continue;  // deadline re-checked above
        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            if (!drain_once(pfds[i].fd, *sinks[i])) {
                pfds[i].fd = -1;  // poll ignores negative fds
                --open_streams;
            }
        }
    }

    /* REAP THE CHILD */
    int status = 0;
    if (!timed_out && has_deadline) {
        while (true) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) break;
            if (w < 0 && errno != EINTR) break;
            if (Clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }
    if (timed_out) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        out_r.reset();
        err_r.reset();
        if (writer.joinable()) writer.join();
        LOG_F(WARNING, "%s timed out after %ld ms", what.c_str(), _timeout_ms);
        throw TimeoutException(what + " timed out after " + std::to_string(_timeout_ms) + " ms");
    }
    if (!has_deadline) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }

    if (writer.joinable()) writer.join();
    // with no stdout reader the child may die before consuming its input
    bool expected_epipe = mode == StdoutMode::closed_pipe && write_errno == EPIPE;
    if (write_errno != 0 && !expected_epipe) {
        throw HarnessException("writing stdin of " + what + ": " + strerror(write_errno));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    LOG_F(INFO, "ran %s: exit %d, signal %d, stdout %zuB, stderr %zuB", what.c_str(),
          result.exit_code.value_or(-1), result.term_signal,
          result.stdout_bytes.size(), result.stderr_bytes.size());
    return result;
}
