/*
 * bctd — Charge threshold value types
 * (c) 2025 bctd contributors
 */
#pragma once

#include <optional>
#include <string>

namespace bct {

/* The two kernel attributes a request touches. */
enum class ThresholdKind { Start, End };

const char* thresholdKindName(ThresholdKind k);

/* Integer percentage, always within [0,100]. */
class Percent {
public:
    static constexpr int kMin = 0;
    static constexpr int kMax = 100;

    static std::optional<Percent> fromInt(long long v) {
        if (v < kMin || v > kMax) return std::nullopt;
        return Percent(static_cast<int>(v));
    }

    int value() const noexcept { return value_; }

    friend bool operator==(Percent a, Percent b) noexcept { return a.value_ == b.value_; }
    friend bool operator!=(Percent a, Percent b) noexcept { return a.value_ != b.value_; }
    friend bool operator<=(Percent a, Percent b) noexcept { return a.value_ <= b.value_; }

private:
    explicit Percent(int v) : value_(v) {}
    int value_;
};

/* Parser output: raw, unclamped integers; either side may be missing. */
struct PartialThresholds {
    std::optional<long long> start;
    std::optional<long long> end;

    bool empty() const noexcept { return !start && !end; }
};

/* A validated pair, start <= end. The only input the applier accepts. */
class ResolvedThresholds {
public:
    static std::optional<ResolvedThresholds> make(Percent start, Percent end) {
        if (!(start <= end)) return std::nullopt;
        return ResolvedThresholds(start, end);
    }

    Percent start() const noexcept { return start_; }
    Percent end()   const noexcept { return end_; }

    Percent get(ThresholdKind k) const noexcept { return k == ThresholdKind::Start ? start_ : end_; }

    /* "40..80" */
    std::string toString() const;

private:
    ResolvedThresholds(Percent s, Percent e) : start_(s), end_(e) {}
    Percent start_;
    Percent end_;
};

} // namespace bct
