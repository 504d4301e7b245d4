/*
 * bctd — Threshold resolution (defaults + validation)
 * (c) 2025 bctd contributors
 */
#pragma once

#include <optional>
#include <string>

#include "Thresholds.hpp"

namespace bct {

/* Fill values for the side an expression leaves out. */
struct ThresholdDefaults {
    std::optional<int> start;
    std::optional<int> end;
};

enum class ResolveStatus {
    Resolved,   // out holds a valid pair
    NoOp,       // nothing requested; not an error
    Rejected    // *err says why; nothing may be written
};

/*
 * Missing sides are taken from `defaults`; both values must then lie in
 * [0,100] and satisfy start <= end.
 */
ResolveStatus resolveThresholds(const PartialThresholds& partial,
                                const ThresholdDefaults& defaults,
                                std::optional<ResolvedThresholds>& out,
                                std::string* err);

} // namespace bct
