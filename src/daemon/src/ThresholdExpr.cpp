/*
 * bctd — Threshold expression parser
 * (c) 2025 bctd contributors
 */

#include "include/ThresholdExpr.hpp"
#include "include/Utils.hpp"

#include <limits>

namespace bct {

namespace {

bool fail(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return false;
}

/* Decimal digits only; saturates instead of overflowing so a huge value is
 * reported as out of range later, not as malformed. */
bool parseNumber(const std::string& tok, const char* what, long long& out, std::string* err) {
    if (tok.empty()) {
        return fail(err, std::string("missing ") + what + " value");
    }
    constexpr long long kMaxLL = std::numeric_limits<long long>::max();
    long long v = 0;
    for (char c : tok) {
        if (c < '0' || c > '9') {
            return fail(err, std::string("invalid ") + what + " value '" + tok + "'");
        }
        const int d = c - '0';
        v = (v > (kMaxLL - d) / 10) ? kMaxLL : v * 10 + d;
    }
    out = v;
    return true;
}

/* "<left> SEP <right>", either side may be empty but not both. */
bool parseRange(const std::string& s, size_t pos, size_t sepLen,
                PartialThresholds& out, std::string* err) {
    const std::string left  = util::trim(std::string_view(s).substr(0, pos));
    const std::string right = util::trim(std::string_view(s).substr(pos + sepLen));
    const std::string sep   = s.substr(pos, sepLen);

    if (left.empty() && right.empty()) {
        return fail(err, "no values around '" + sep + "'");
    }

    PartialThresholds r;
    long long v = 0;
    if (!left.empty()) {
        if (!parseNumber(left, "start", v, err)) return false;
        r.start = v;
    }
    if (!right.empty()) {
        if (!parseNumber(right, "end", v, err)) return false;
        r.end = v;
    }
    out = r;
    return true;
}

bool parseAssignment(const std::string& s, size_t eq, PartialThresholds& out, std::string* err) {
    const std::string key   = util::trim(std::string_view(s).substr(0, eq));
    const std::string value = util::trim(std::string_view(s).substr(eq + 1));

    PartialThresholds r;
    long long v = 0;
    if (key == "start") {
        if (!parseNumber(value, "start", v, err)) return false;
        r.start = v;
    } else if (key == "end") {
        if (!parseNumber(value, "end", v, err)) return false;
        r.end = v;
    } else {
        return fail(err, "unknown key '" + key + "' (expected start or end)");
    }
    out = r;
    return true;
}

bool parseBare(const std::string& s, PartialThresholds& out, std::string* err) {
    long long v = 0;
    if (!parseNumber(s, "threshold", v, err)) return false;

    PartialThresholds r;
    if (v < kBareStartBelow) {
        r.start = v;
    } else if (v <= 100) {
        r.end = v;
    } else {
        return fail(err, "ambiguous value " + s +
                         ": a single number must be 0-49 (start) or 50-100 (end)");
    }
    out = r;
    return true;
}

} // namespace

bool parseThresholdExpr(std::string_view line, PartialThresholds& out, std::string* err) {
    const std::string s = util::to_lower(util::trim(line));
    if (s.empty()) {
        out = PartialThresholds{};
        return true;
    }

    if (const size_t eq = s.find('='); eq != std::string::npos) {
        return parseAssignment(s, eq, out, err);
    }
    if (const size_t dots = s.find(".."); dots != std::string::npos) {
        return parseRange(s, dots, 2, out, err);
    }
    if (const size_t to = s.find("to"); to != std::string::npos) {
        return parseRange(s, to, 2, out, err);
    }
    return parseBare(s, out, err);
}

} // namespace bct
