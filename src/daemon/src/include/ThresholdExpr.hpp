/*
 * bctd — Threshold expression parser
 * (c) 2025 bctd contributors
 *
 * One pipe line -> PartialThresholds. Accepted forms (case-insensitive,
 * whitespace around separators ignored):
 *
 *   X to Y | X..Y | XtoY      start=X end=Y
 *   start=X                   start=X
 *   end=Y                     end=Y
 *   X.. | X to                start=X
 *   ..Y | to Y                end=Y
 *   N                         N < 50: start=N, 50 <= N <= 100: end=N
 *   (empty line)              nothing
 *
 * Values are not range-checked here beyond the bare-integer bands; that is
 * resolveThresholds()' job.
 */
#pragma once

#include <string>
#include <string_view>

#include "Thresholds.hpp"

namespace bct {

/* Bare integers below this are start values, the rest (up to 100) end values. */
constexpr long long kBareStartBelow = 50;

/* Returns false and sets *err on a malformed or ambiguous expression. */
bool parseThresholdExpr(std::string_view line, PartialThresholds& out, std::string* err);

} // namespace bct
