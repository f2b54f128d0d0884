#pragma once

#include <string>

/**
 * Settings for one harness run. Built once from the command line before any
 * case is registered and handed by const reference to the runner, the
 * comparator and the case executor; nothing mutates it afterwards.
 */
struct HarnessConfig {
    std::string subject;     // executable under test
    std::string reference;   // trusted implementation, e.g. /usr/bin/cat
    std::string filter;      // run only cases whose name contains this
    bool has_filter = false;
    bool verbose = false;    // print [RUN ] and [CMD ] lines
    long timeout_ms = 0;     // per-process wall clock limit, 0 = none
    std::string log_file;    // optional loguru file sink

    bool valid = true;
    bool show_help = false;
    std::string error_message;
};
