/*
 * bctd — Ordered application of a threshold pair
 * (c) 2025 bctd contributors
 */
#pragma once

#include <array>
#include <string>

#include "ThresholdDevice.hpp"
#include "Thresholds.hpp"

namespace bct {

struct ApplyError {
    ThresholdKind kind{ThresholdKind::Start};
    std::string   cause;
};

/*
 * Drivers check each attribute against the other's *stored* value, so the
 * pair must stay ordered after every single write:
 *   newStart <= storedEnd  -> start, then end
 *   otherwise              -> end (raise the ceiling), then start
 */
std::array<ThresholdKind, 2> thresholdWriteOrder(int newStart, int storedEnd);

/*
 * Apply `target` to `dev`:
 *  - re-read both stored values and pick the write order from them,
 *  - skip writes whose value is already stored,
 *  - on a refused write, re-read and retry the sequence once,
 *  - read both back and compare,
 *  - if anything fails after one attribute was changed, restore the values
 *    read at the start.
 * Returns false with *err naming the attribute on failure.
 */
bool applyThresholds(const ResolvedThresholds& target, ThresholdDevice& dev, ApplyError* err);

} // namespace bct
