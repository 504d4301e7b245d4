/*
 * bctd — Daemon configuration (implementation)
 * (c) 2025 bctd contributors
 *
 *  - Defaults match a single-battery laptop (BAT0) and a world-writable pipe
 *    in /tmp.
 *  - ENV is a fallback layer only: the JSON file overrides it.
 */

#include "include/Config.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace bct {

/* Largest uid/gid accepted; (uid_t)-1 means "leave unchanged" to chown(). */
static constexpr long long kMaxOwnerId = 0xfffffffeLL;

/* ----------------------------------------------------------------------------
 * helpers (env)
 * ----------------------------------------------------------------------------*/

static inline std::string getenv_or(const char* key, const std::string& def) {
    auto v = util::getenv_str(key);
    return (v && !v->empty()) ? *v : def;
}

static inline std::optional<long long> getenv_ll(const char* key) {
    auto v = util::getenv_str(key);
    long long out = 0;
    if (!v || !util::parseInt(*v, out)) return std::nullopt;
    return out;
}

/* Values outside [lo, hi] are treated like malformed ones: ignored. */
static inline std::optional<long long> getenv_ranged(const char* key, long long lo, long long hi) {
    auto v = getenv_ll(key);
    if (v && (*v < lo || *v > hi)) {
        LOG_WARN("config: ignoring %s=%lld (expected %lld..%lld)", key, *v, lo, hi);
        return std::nullopt;
    }
    return v;
}

static inline bool getenv_bool(const char* key, bool def) {
    auto c = util::getenv_str(key);
    if (!c || c->empty()) return def;
    const std::string v = util::to_lower(*c);
    if (v=="1"||v=="true"||v=="yes"||v=="on")  return true;
    if (v=="0"||v=="false"||v=="no" ||v=="off") return false;
    return def;
}

/* ----------------------------------------------------------------------------
 * json (de)serialization
 * ----------------------------------------------------------------------------*/

template <typename T>
static json optionalToJson(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T>
static void optionalFromJson(const json& j, const char* key, std::optional<T>& out,
                             long long lo, long long hi) {
    if (!j.contains(key)) return;
    const json& v = j.at(key);
    if (v.is_null()) { out.reset(); return; }
    if (!v.is_number_integer()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be an integer");
    }
    if (v.is_number_unsigned() && v.get<unsigned long long>() > static_cast<unsigned long long>(hi)) {
        throw std::runtime_error(std::string("config: '") + key + "' is out of range");
    }
    const long long raw = v.get<long long>();
    if (raw < lo || raw > hi) {
        throw std::runtime_error(std::string("config: '") + key + "' must be in " +
                                 std::to_string(lo) + ".." + std::to_string(hi));
    }
    out = static_cast<T>(raw);
}

void to_json(json& j, const DaemonConfig& c) {
    j = json{
        {"pipePath", c.pipePath},
        {"pipeMode", util::formatOctalMode(c.pipeMode)},
        {"pipeUid",  optionalToJson(c.pipeUid)},
        {"pipeGid",  optionalToJson(c.pipeGid)},

        {"startPath", c.startPath},
        {"endPath",   c.endPath},

        {"defaultStart", optionalToJson(c.defaultStart)},
        {"defaultEnd",   optionalToJson(c.defaultEnd)},
        {"applyDefaultsOnStart", c.applyDefaultsOnStart},

        {"logfile",     c.logfile},
        {"logMaxBytes", c.logMaxBytes},
        {"logMaxFiles", c.logMaxFiles},
        {"logLevel",    c.logLevel},
        {"debug",       c.debug}
    };
}

void from_json(const json& j, DaemonConfig& c) {
    if (j.contains("pipePath"))  j.at("pipePath").get_to(c.pipePath);
    if (j.contains("pipeMode")) {
        const std::string s = j.at("pipeMode").get<std::string>();
        if (!util::parseOctalMode(s, c.pipeMode)) {
            throw std::runtime_error("config: 'pipeMode' is not an octal mode: " + s);
        }
    }
    optionalFromJson(j, "pipeUid", c.pipeUid, 0, kMaxOwnerId);
    optionalFromJson(j, "pipeGid", c.pipeGid, 0, kMaxOwnerId);

    if (j.contains("startPath")) j.at("startPath").get_to(c.startPath);
    if (j.contains("endPath"))   j.at("endPath").get_to(c.endPath);

    optionalFromJson(j, "defaultStart", c.defaultStart, 0, 100);
    optionalFromJson(j, "defaultEnd",   c.defaultEnd,   0, 100);
    if (j.contains("applyDefaultsOnStart")) j.at("applyDefaultsOnStart").get_to(c.applyDefaultsOnStart);

    if (j.contains("logfile"))     j.at("logfile").get_to(c.logfile);
    if (j.contains("logMaxBytes")) j.at("logMaxBytes").get_to(c.logMaxBytes);
    if (j.contains("logMaxFiles")) j.at("logMaxFiles").get_to(c.logMaxFiles);
    if (j.contains("logLevel"))    j.at("logLevel").get_to(c.logLevel);
    if (j.contains("debug"))       j.at("debug").get_to(c.debug);
}

/* ----------------------------------------------------------------------------
 * Defaults / ENV
 * ----------------------------------------------------------------------------*/

DaemonConfig defaultConfig() {
    DaemonConfig c;
    c.configFile = Config::defaultConfigPath();
    return c;
}

void applyEnvFallbacks(DaemonConfig& c) {
    c.pipePath = getenv_or("BCTD_PIPE_PATH", c.pipePath);
    {
        auto m = util::getenv_str("BCTD_PIPE_MODE");
        mode_t mode = 0;
        if (m && util::parseOctalMode(*m, mode)) c.pipeMode = mode;
    }
    if (auto v = getenv_ranged("BCTD_PIPE_UID", 0, kMaxOwnerId)) c.pipeUid = static_cast<uid_t>(*v);
    if (auto v = getenv_ranged("BCTD_PIPE_GID", 0, kMaxOwnerId)) c.pipeGid = static_cast<gid_t>(*v);

    c.startPath = getenv_or("BCTD_START_PATH", c.startPath);
    c.endPath   = getenv_or("BCTD_END_PATH",   c.endPath);

    if (auto v = getenv_ranged("BCTD_DEFAULT_START", 0, 100)) c.defaultStart = static_cast<int>(*v);
    if (auto v = getenv_ranged("BCTD_DEFAULT_END",   0, 100)) c.defaultEnd   = static_cast<int>(*v);

    c.logfile  = getenv_or("BCTD_LOGFILE", c.logfile);
    c.logLevel = getenv_or("BCTD_LOG_LEVEL", c.logLevel);
    c.debug   = getenv_bool("BCTD_DEBUG", c.debug);
}

/* Normalize paths (non-persistent) */
static void expandPaths_(DaemonConfig& c) {
    c.pipePath  = util::expandUserPath(c.pipePath);
    c.startPath = util::expandUserPath(c.startPath);
    c.endPath   = util::expandUserPath(c.endPath);
    c.logfile   = util::expandUserPath(c.logfile);
}

/* ----------------------------------------------------------------------------
 * Loading
 * ----------------------------------------------------------------------------*/

void loadDaemonConfig(const std::string& path, DaemonConfig& out) {
    out = defaultConfig();
    applyEnvFallbacks(out);

    const bool explicitPath = !path.empty();
    const std::string p = util::expandUserPath(
        explicitPath ? path : getenv_or("BCTD_CONFIG_PATH", out.configFile));

    std::error_code ec;
    if (!fs::exists(p, ec) || ec) {
        if (explicitPath) {
            throw std::runtime_error("config file not found: " + p);
        }
        expandPaths_(out);
        return;
    }

    const json j = util::read_json_file(p);
    if (!j.is_object()) {
        throw std::runtime_error("config root must be a JSON object: " + p);
    }
    try {
        from_json(j, out);
    } catch (const json::exception& ex) {
        throw std::runtime_error("config " + p + ": " + ex.what());
    }
    out.configFile = p;
    expandPaths_(out);
}

DaemonConfig loadDaemonConfig(const std::string& path, std::string* err) {
    DaemonConfig cfg;
    if (err) *err = {};
    try {
        loadDaemonConfig(path, cfg);
    } catch (const std::exception& ex) {
        if (err) *err = ex.what();
        cfg = defaultConfig();
        applyEnvFallbacks(cfg);
        expandPaths_(cfg);
    }
    return cfg;
}

/* ----------------------------------------------------------------------------
 * Validation
 * ----------------------------------------------------------------------------*/

static bool inPercentRange(int v) { return v >= 0 && v <= 100; }

bool validateDaemonConfig(const DaemonConfig& c, std::string* err) {
    auto fail = [&](const std::string& m) { if (err) *err = m; return false; };

    if (c.pipePath.empty())  return fail("pipe path is empty");
    if (c.startPath.empty()) return fail("start threshold path is empty");
    if (c.endPath.empty())   return fail("end threshold path is empty");
    if (c.pipeMode > 07777)  return fail("pipe mode out of range: " + util::formatOctalMode(c.pipeMode));

    if (c.defaultStart && !inPercentRange(*c.defaultStart)) {
        return fail("default start " + std::to_string(*c.defaultStart) + " is outside [0,100]");
    }
    if (c.defaultEnd && !inPercentRange(*c.defaultEnd)) {
        return fail("default end " + std::to_string(*c.defaultEnd) + " is outside [0,100]");
    }
    if (c.defaultStart && c.defaultEnd && *c.defaultStart > *c.defaultEnd) {
        return fail("default start " + std::to_string(*c.defaultStart) +
                    " is above default end " + std::to_string(*c.defaultEnd));
    }
    if (c.logMaxFiles < 0) return fail("logMaxFiles must not be negative");
    LogLevel lvl;
    if (!parseLogLevel(c.logLevel, lvl)) return fail("unknown log level '" + c.logLevel + "'");

    if (err) *err = {};
    return true;
}

LogLevel effectiveLogLevel(const DaemonConfig& c) {
    LogLevel lvl = LogLevel::Info;
    if (!parseLogLevel(c.logLevel, lvl)) lvl = LogLevel::Info;
    if (c.debug && lvl < LogLevel::Debug) lvl = LogLevel::Debug;
    return lvl;
}

namespace Config {
std::string defaultConfigPath() { return "/etc/bctd/bctd.json"; }
} // namespace Config

} // namespace bct
