#include "Catcheck.h"
#include "CaseRegistry.h"
#include "Fixtures.h"
#include "Harness.h"
#include "HarnessException.h"
#include "OptionMatrix.h"
#include "Suite.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using std::string;
using std::vector;

const static string kPATH_default =
    "/usr/local/bin:/usr/local/sbin:/usr/bin:/usr/sbin:/bin:/sbin";

const static char *kSubjectEnv = "CATCHECK_SUBJECT";

string usage(const string& program)
{
    return "Usage: " + program + " --subject PATH [options]\n"
        "  --subject PATH     executable under test (or $CATCHECK_SUBJECT)\n"
        "  --reference PATH   trusted cat implementation (default: cat on PATH)\n"
        "  -f, --filter TEXT  run only cases whose name contains TEXT\n"
        "  -v, --verbose      print each case and command as it runs\n"
        "  --timeout MS       kill any child process running longer than MS\n"
        "  --log FILE         write a detailed log to FILE\n"
        "  -h, --help         show this help\n";
}

HarnessConfig parse_arguments(const vector<string>& args)
{
    HarnessConfig config;

    auto parse_kv = [](const string& s, const string& key) -> std::optional<string> {
        string prefix = key + "=";
        if (starts_with(s, prefix)) return s.substr(prefix.size());
        return std::nullopt;
    };
    auto fail = [&config](const string& msg) {
        config.valid = false;
        config.error_message = msg;
        return config;
    };

    for (size_t i = 1; i < args.size(); ++i) {
        const string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
            continue;
        }

        /* options taking a value, as "--opt VALUE" or "--opt=VALUE" */
        string key;
        std::optional<string> value;
        for (const char *name : {"--subject", "--reference", "--filter", "--timeout", "--log"}) {
            if (arg == name) {
                key = name;
                if (i + 1 >= args.size()) return fail(string("missing value for ") + name);
                value = args[++i];
                break;
            }
            if ((value = parse_kv(arg, name))) {
                key = name;
                break;
            }
        }
        if (key.empty() && arg == "-f") {
            key = "--filter";
            if (i + 1 >= args.size()) return fail("missing value for -f");
            value = args[++i];
        }
        if (key.empty()) return fail("unknown argument: " + arg);

        if (key == "--subject") {
            config.subject = *value;
        }
        else if (key == "--reference") {
            config.reference = *value;
        }
        else if (key == "--filter") {
            config.filter = *value;
            config.has_filter = true;
        }
        else if (key == "--log") {
            config.log_file = *value;
        }
        else if (key == "--timeout") {
            try {
                size_t used = 0;
                config.timeout_ms = std::stol(*value, &used);
                if (used != value->size() || config.timeout_ms < 0) {
                    return fail("invalid timeout: " + *value);
                }
            }
            catch (std::exception&) {
                return fail("invalid timeout: " + *value);
            }
        }
    }

    if (config.show_help) return config;

    if (config.subject.empty()) {
        const char *env = getenv(kSubjectEnv);
        if (env && *env) config.subject = env;
    }
    if (config.subject.empty()) {
        return fail("no subject given (use --subject or " + string(kSubjectEnv) + ")");
    }
    return config;
}

/**
 * Utility function. Parses and returns each path in PATH, keeping their
 * order; empty entries are skipped.
 */
vector<string> extract_paths_from_PATH()
{
    char *path_ptr = getenv("PATH");
    string PATH = path_ptr ? string(path_ptr) : kPATH_default;
    LOG_F(INFO, "existing PATH variable was %s", (path_ptr ? "found" : "not found"));
    size_t start_idx = 0;

    vector<string> result;
    while (start_idx <= PATH.length()) {
        size_t delim_idx = PATH.find(':', start_idx);
        string entry = PATH.substr(start_idx, delim_idx - start_idx);
        if (!entry.empty()) result.push_back(entry);
        if (delim_idx == string::npos) break;
        start_idx = delim_idx + 1;
    }
    return result;
}

std::optional<string> find_in_path(const string& name)
{
    for (const string& base_path : extract_paths_from_PATH()) {
        string attempt_path = base_path + "/" + name;
        if (access(attempt_path.c_str(), X_OK) == 0) {
            LOG_F(INFO, "full executable path found: %s", attempt_path.c_str());
            return attempt_path;
        }
    }
    return std::nullopt;
}

/**
 * Check that both programs can be executed, looking the reference up on PATH
 * when none was given.
 *
 * @throws HarnessException naming the program that cannot be used.
 */
static void resolve_programs(HarnessConfig& config)
{
    if (access(config.subject.c_str(), X_OK) != 0) {
        throw HarnessException("subject " + config.subject + ": " + strerror(errno));
    }
    if (config.reference.empty()) {
        std::optional<string> found = find_in_path("cat");
        if (!found) throw HarnessException("reference not found: no cat on PATH");
        config.reference = *found;
    }
    else if (access(config.reference.c_str(), X_OK) != 0) {
        throw HarnessException("reference " + config.reference + ": " + strerror(errno));
    }
    LOG_F(INFO, "subject %s, reference %s", config.subject.c_str(), config.reference.c_str());
}

int Catcheck::run(const vector<string>& args)
{
    const string program = args.empty() ? "catcheck" : args[0];
    HarnessConfig config = parse_arguments(args);
    if (config.show_help) {
        std::cout << usage(program);
        return 0;
    }
    if (!config.valid) {
        std::cerr << "catcheck: " << config.error_message << std::endl << usage(program);
        return 2;
    }

/* logging */
    loguru::g_stderr_verbosity = config.verbose ? loguru::Verbosity_INFO
                                                : loguru::Verbosity_WARNING;
    if (!config.log_file.empty() &&
        !loguru::add_file(config.log_file.c_str(), loguru::Truncate, loguru::Verbosity_MAX)) {
        std::cerr << "catcheck: cannot open log file " << config.log_file << std::endl;
        return 2;
    }

    try {
        resolve_programs(config);

        Fixtures fixtures;
        CaseRegistry registry;
        register_builtin_cases(registry, fixtures);
        register_matrix_cases(registry, fixtures, OptionMatrix::standard());

        Harness harness(config, fixtures);
        RunSummary summary = registry.execute(
            [&harness](const TestCase& tc) { return harness.run_case(tc); },
            config, std::cout);
        if (!summary.success()) {
            std::cerr << "catcheck: failures encountered" << std::endl;
            return 1;
        }
        return 0;
    }
    catch (HarnessException& e) {
        std::cerr << "catcheck: " << e.what() << std::endl;
        return 2;
    }
    catch (std::logic_error& e) {
        LOG_F(ERROR, "suite definition error: %s", e.what());
        std::cerr << "catcheck: " << e.what() << std::endl;
        return 2;
    }
}
