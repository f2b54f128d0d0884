#pragma once

#include "CaseRegistry.h"
#include "Fixtures.h"
#include "OptionMatrix.h"

/**
 * Register the hand-written cases: operand handling, every option alone and
 * combined, error paths, filesystem oddities, FIFO input and the scripted
 * help/version/broken-pipe checks. Paths are taken from 'fixtures', which
 * must already exist.
 */
void register_builtin_cases(CaseRegistry& registry, const Fixtures& fixtures);

/**
 * Register four cases per option set in 'matrix' (file, multi, stdin and
 * stdin+file) plus one case per binary option set.
 */
void register_matrix_cases(CaseRegistry& registry, const Fixtures& fixtures,
                           const OptionMatrix& matrix);
