#pragma once

#include "HarnessConfig.h"
#include <optional>
#include <string>
#include <vector>

/**
 * This class implements "catcheck", a differential conformance runner for
 * cat-compatible executables.
 *
 * A single 'run' method is provided, which parses the given argument array,
 * runs every registered case against the subject and the reference, writes
 * one line per case to standard out and returns the process exit status.
 *
 * Usage:
 *   catcheck --subject PATH [--reference PATH] [-f|--filter TEXT]
 *            [-v|--verbose] [--timeout MS] [--log FILE] [-h|--help]
 *
 * - The subject may also come from CATCHECK_SUBJECT.
 * - Without --reference, the first 'cat' on PATH is used.
 *
 * Exit status: 0 if every executed case passed (or a filter was given), 1 if
 * any case failed, 2 for invalid usage or a harness setup failure.
 */
class Catcheck {
  public:
    static int run(const std::vector<std::string>& args);
};

/**
 * Parse argv-style 'args' (args[0] is the program name). Never throws: on
 * bad input the returned config has 'valid' false and an 'error_message'.
 */
HarnessConfig parse_arguments(const std::vector<std::string>& args);

std::string usage(const std::string& program);

/* each directory in PATH (or the default PATH), in search order */
std::vector<std::string> extract_paths_from_PATH();

/* first executable named 'name' in PATH, if any */
std::optional<std::string> find_in_path(const std::string& name);
