/*
 * bctd — Charge threshold value types
 * (c) 2025 bctd contributors
 */

#include "include/Thresholds.hpp"

namespace bct {

const char* thresholdKindName(ThresholdKind k) {
    switch (k) {
        case ThresholdKind::Start: return "start";
        case ThresholdKind::End:   return "end";
    }
    return "?";
}

std::string ResolvedThresholds::toString() const {
    return std::to_string(start_.value()) + ".." + std::to_string(end_.value());
}

} // namespace bct
