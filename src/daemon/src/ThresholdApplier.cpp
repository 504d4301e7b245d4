/*
 * bctd — Ordered application of a threshold pair
 * (c) 2025 bctd contributors
 */

#include "include/ThresholdApplier.hpp"
#include "include/Log.hpp"

#include <initializer_list>
#include <vector>

namespace bct {

namespace {

struct StoredPair {
    int start{0};
    int end{0};

    int get(ThresholdKind k) const { return k == ThresholdKind::Start ? start : end; }
};

bool setError(ApplyError* err, ThresholdKind k, const std::string& cause) {
    if (err) {
        err->kind  = k;
        err->cause = cause;
    }
    return false;
}

bool readStored(ThresholdDevice& dev, StoredPair& out, ApplyError* err) {
    std::string why;
    auto s = dev.read(ThresholdKind::Start, &why);
    if (!s) return setError(err, ThresholdKind::Start, "cannot read current value: " + why);
    auto e = dev.read(ThresholdKind::End, &why);
    if (!e) return setError(err, ThresholdKind::End, "cannot read current value: " + why);
    out.start = *s;
    out.end   = *e;
    return true;
}

/* One pass over both attributes; `written` collects what was changed. */
bool writeSequence(ThresholdDevice& dev, const StoredPair& want, const StoredPair& stored,
                   std::vector<ThresholdKind>& written, ApplyError* err) {
    for (ThresholdKind k : thresholdWriteOrder(want.start, stored.end)) {
        const int v = want.get(k);
        if (stored.get(k) == v) {
            LOG_TRACE("thresholds: %s already %d", thresholdKindName(k), v);
            continue;
        }
        std::string why;
        if (!dev.write(k, v, &why)) {
            return setError(err, k, why);
        }
        LOG_DEBUG("thresholds: %s %d -> %d (%s)", thresholdKindName(k), stored.get(k), v,
                  dev.describe(k).c_str());
        written.push_back(k);
    }
    return true;
}

bool verifyStored(ThresholdDevice& dev, const StoredPair& want, ApplyError* err) {
    StoredPair after;
    if (!readStored(dev, after, err)) return false;
    for (ThresholdKind k : {ThresholdKind::Start, ThresholdKind::End}) {
        if (after.get(k) != want.get(k)) {
            return setError(err, k, "read back " + std::to_string(after.get(k)) +
                                    " after writing " + std::to_string(want.get(k)));
        }
    }
    return true;
}

/*
 * Put `original` back. `assumed` is what the device should hold after our own
 * writes and is used when the current values cannot be read.
 */
void restore(ThresholdDevice& dev, const StoredPair& original, const StoredPair& assumed) {
    StoredPair now;
    ApplyError e;
    if (!readStored(dev, now, &e)) {
        LOG_WARN("thresholds: %s; restoring from last written state", e.cause.c_str());
        now = assumed;
    }
    std::vector<ThresholdKind> ignored;
    if (!writeSequence(dev, original, now, ignored, &e)) {
        LOG_ERROR("thresholds: restoring %s=%d failed: %s", thresholdKindName(e.kind),
                  original.get(e.kind), e.cause.c_str());
        return;
    }
    LOG_WARN("thresholds: restored previous pair %d..%d", original.start, original.end);
}

} // namespace

std::array<ThresholdKind, 2> thresholdWriteOrder(int newStart, int storedEnd) {
    if (newStart <= storedEnd) {
        return {ThresholdKind::Start, ThresholdKind::End};
    }
    return {ThresholdKind::End, ThresholdKind::Start};
}

bool applyThresholds(const ResolvedThresholds& target, ThresholdDevice& dev, ApplyError* err) {
    const StoredPair want{target.start().value(), target.end().value()};

    StoredPair original;
    if (!readStored(dev, original, err)) return false;

    std::vector<ThresholdKind> written;
    ApplyError failure;
    bool ok = writeSequence(dev, want, original, written, &failure);

    if (!ok) {
        // Another writer may have moved the stored pair under us.
        LOG_WARN("thresholds: %s write refused (%s); re-reading and retrying once",
                 thresholdKindName(failure.kind), failure.cause.c_str());
        StoredPair current;
        ok = readStored(dev, current, &failure) &&
             writeSequence(dev, want, current, written, &failure);
    }
    if (ok) ok = verifyStored(dev, want, &failure);

    if (!ok) {
        if (!written.empty()) {
            StoredPair assumed = original;
            for (ThresholdKind k : written) {
                (k == ThresholdKind::Start ? assumed.start : assumed.end) = want.get(k);
            }
            restore(dev, original, assumed);
        }
        if (err) *err = failure;
        return false;
    }
    return true;
}

} // namespace bct
