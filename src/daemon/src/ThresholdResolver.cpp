/*
 * bctd — Threshold resolution (defaults + validation)
 * (c) 2025 bctd contributors
 */

#include "include/ThresholdResolver.hpp"

namespace bct {

static ResolveStatus reject(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return ResolveStatus::Rejected;
}

static std::optional<long long> pick(const std::optional<long long>& given,
                                     const std::optional<int>& fallback) {
    if (given) return given;
    if (fallback) return static_cast<long long>(*fallback);
    return std::nullopt;
}

ResolveStatus resolveThresholds(const PartialThresholds& partial,
                                const ThresholdDefaults& defaults,
                                std::optional<ResolvedThresholds>& out,
                                std::string* err) {
    out.reset();
    if (partial.empty()) {
        return ResolveStatus::NoOp;
    }

    const auto rawStart = pick(partial.start, defaults.start);
    const auto rawEnd   = pick(partial.end,   defaults.end);
    if (!rawStart) return reject(err, "no start threshold given and no default available");
    if (!rawEnd)   return reject(err, "no end threshold given and no default available");

    const auto start = Percent::fromInt(*rawStart);
    if (!start) {
        return reject(err, "start threshold " + std::to_string(*rawStart) + " is outside [0,100]");
    }
    const auto end = Percent::fromInt(*rawEnd);
    if (!end) {
        return reject(err, "end threshold " + std::to_string(*rawEnd) + " is outside [0,100]");
    }

    out = ResolvedThresholds::make(*start, *end);
    if (!out) {
        return reject(err, "start threshold " + std::to_string(start->value()) +
                           " is above end threshold " + std::to_string(end->value()));
    }
    return ResolveStatus::Resolved;
}

} // namespace bct
