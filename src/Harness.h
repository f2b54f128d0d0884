#pragma once

#include "CaseRegistry.h"
#include "Comparator.h"
#include "Fixtures.h"
#include "HarnessConfig.h"
#include "ProcessRunner.h"
#include "TestCase.h"
#include <optional>
#include <string>
#include <vector>

/**
 * Interprets test case descriptors. One Harness exists per run; it owns the
 * process runner and the comparator and borrows the configuration and the
 * fixtures, both of which must outlive it.
 *
 * 'run_case' never throws for anything a case does: mismatches, spawn
 * failures, setup failures and timeouts all come back as a CaseResult.
 */
class Harness {
  public:
    Harness(const HarnessConfig& config, const Fixtures& fixtures);

    CaseResult run_case(const TestCase& tc) const;

    /* name the subject is expected to print in its own help/version text */
    std::string subject_name() const;

  private:
    std::optional<MismatchReport> dispatch(const CompareCase& c) const;
    std::optional<MismatchReport> dispatch(const FifoCase& c) const;
    std::optional<MismatchReport> dispatch(const ScriptedCase& c) const;

    std::optional<MismatchReport> check_own_text(const ScriptedCase& c,
                                                 const std::string& needle,
                                                 const std::string& what) const;

    void apply_setup(const std::vector<FileSetup>& setup) const;

    const HarnessConfig& _config;
    const Fixtures& _fixtures;
    ProcessRunner _runner;
    Comparator _comparator;
};
