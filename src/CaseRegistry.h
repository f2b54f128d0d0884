#pragma once

#include "HarnessConfig.h"
#include "TestCase.h"
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

enum class CaseOutcome { passed, failed, timed_out };

struct CaseResult {
    CaseOutcome outcome;
    std::string detail;
};

struct RunSummary {
    std::size_t passed = 0;
    std::size_t executed = 0;
    std::size_t total = 0;    // registered, filtered out or not
    bool filtered = false;

    /* a filtered run never fails the suite; it only reports */
    bool success() const { return filtered || passed == executed; }
};

/**
 * The ordered list of named cases for one run. Cases execute strictly one
 * after another, in registration order, through a caller-supplied dispatch
 * function.
 *
 * Exceptions: 'add' throws std::logic_error on a duplicate name; that is a
 * bug in the suite, not a test failure.
 */
class CaseRegistry {
  public:
    using Dispatch = std::function<CaseResult(const TestCase&)>;

    void add(const std::string& name, CaseSpec spec);

    RunSummary execute(const Dispatch& dispatch, const HarnessConfig& config,
                       std::ostream& out) const;

    const std::vector<TestCase>& cases() const { return _cases; }
    std::size_t size() const { return _cases.size(); }

  private:
    std::vector<TestCase> _cases;
    std::unordered_set<std::string> _names;
};
