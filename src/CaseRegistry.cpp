#include "CaseRegistry.h"
#include "string_util.h"
#include <loguru/loguru.hpp>
#include <stdexcept>

using std::string;

void CaseRegistry::add(const string& name, CaseSpec spec)
{
    if (!_names.insert(name).second) {
        throw std::logic_error("duplicate test case name: " + name);
    }
    _cases.push_back(TestCase{name, std::move(spec)});
}

/**
 * Run every case whose name contains the configured filter (all of them if
 * there is none) and print one line per case plus a summary.
 *
 * @param dispatch Runs one case and reports how it went.
 * @param out Where the per-case lines and the summary go.
 */
RunSummary CaseRegistry::execute(const Dispatch& dispatch, const HarnessConfig& config,
                                 std::ostream& out) const
{
    RunSummary summary;
    summary.filtered = config.has_filter;
    summary.total = _cases.size();

    for (const TestCase& tc : _cases) {
        if (config.has_filter && !contains(tc.name, config.filter)) continue;

        if (config.verbose) out << "[RUN ] " << tc.name << std::endl;
        CaseResult result = dispatch(tc);
        ++summary.executed;
        switch (result.outcome) {
            case CaseOutcome::passed:
                ++summary.passed;
                out << "[PASS] " << tc.name << std::endl;
                break;
            case CaseOutcome::failed:
                out << "[FAIL] " << tc.name << ": " << result.detail << std::endl;
                LOG_F(WARNING, "case failed: %s", tc.name.c_str());
                break;
            case CaseOutcome::timed_out:
                out << "[TIME] " << tc.name << ": " << result.detail << std::endl;
                LOG_F(WARNING, "case timed out: %s", tc.name.c_str());
                break;
        }
    }

    out << std::endl << summary.passed << "/" << summary.total << " tests executed"
        << (summary.filtered ? " (filtered)" : "") << "." << std::endl;
    return summary;
}
