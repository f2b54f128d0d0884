#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * A filesystem object a case creates in the fixture directory before it
 * runs. For links 'content' is the link target; for regular files it is
 * written 'repeat' times. A regular file with 'mode' set gets that mode and
 * is made readable (0600) again after the case.
 */
struct FileSetup {
    enum class Kind { regular_file, directory, symlink, hard_link };

    Kind kind;
    std::string path;
    std::string content;
    std::size_t repeat = 1;
    std::optional<unsigned> mode;

    static FileSetup file(const std::string& path, const std::string& content,
                          std::size_t repeat = 1) {
        return FileSetup{Kind::regular_file, path, content, repeat, std::nullopt};
    }
    static FileSetup file_with_mode(const std::string& path, const std::string& content,
                                    unsigned mode) {
        return FileSetup{Kind::regular_file, path, content, 1, mode};
    }
    static FileSetup directory(const std::string& path) {
        return FileSetup{Kind::directory, path, "", 1, std::nullopt};
    }
    static FileSetup symlink(const std::string& target, const std::string& link) {
        return FileSetup{Kind::symlink, link, target, 1, std::nullopt};
    }
    static FileSetup hard_link(const std::string& target, const std::string& link) {
        return FileSetup{Kind::hard_link, link, target, 1, std::nullopt};
    }
};

/* run 'args' (with 'stdin_data') against subject and reference and diff */
struct CompareCase {
    std::vector<FileSetup> setup;
    std::vector<std::string> args;
    std::optional<std::string> stdin_data;
};

/**
 * Feed 'chunks' through a FIFO named 'fifo_name' (inside the fixture
 * directory), which is appended to 'options' as the only operand. With
 * 'expect_concatenation' the subject's stdout must also equal the chunks
 * joined in order.
 */
struct FifoCase {
    std::string fifo_name;
    std::vector<std::string> options;
    std::vector<std::string> chunks;
    std::chrono::milliseconds delay {0};
    bool expect_concatenation = false;
};

enum class ScriptKind {
    help_output,         // subject prints its own usage text
    version_output,      // subject prints its own version text
    help_stdout_closed,  // same exit code with stdout on /dev/null
    broken_pipe          // same ending when stdout has no reader
};

struct ScriptedCase {
    ScriptKind kind;
    std::vector<std::string> args;
    std::optional<std::string> stdin_data;
};

using CaseSpec = std::variant<CompareCase, FifoCase, ScriptedCase>;

struct TestCase {
    std::string name;
    CaseSpec spec;
};
