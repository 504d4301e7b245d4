/*
 * bctd — Daemon configuration (public interface)
 * (c) 2025 bctd contributors
 *
 * Layering, lowest to highest priority:
 *   built-in defaults -> ENV (BCTD_*) -> JSON config file -> command line
 * The command-line layer lives in main.cpp; everything else is here.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <sys/types.h>

#include <nlohmann/json.hpp>

#include "Log.hpp"

namespace bct {

/* ----------------------------------------------------------------------------
 * Daemon configuration model
 * ----------------------------------------------------------------------------*/
struct DaemonConfig {
    // Command pipe
    std::string           pipePath{"/tmp/battery_pipe"};
    mode_t                pipeMode{0777};
    std::optional<uid_t>  pipeUid;      // unset = leave owner unchanged
    std::optional<gid_t>  pipeGid;      // unset = leave group unchanged

    // Kernel attributes
    std::string startPath{"/sys/class/power_supply/BAT0/charge_control_start_threshold"};
    std::string endPath{"/sys/class/power_supply/BAT0/charge_control_end_threshold"};

    // Fill values for one-sided expressions; unset = keep the kernel's value
    std::optional<int> defaultStart;
    std::optional<int> defaultEnd;
    bool               applyDefaultsOnStart{true};

    // Logging
    std::string logfile;                       // empty = stdio only
    size_t      logMaxBytes{5 * 1024 * 1024};
    int         logMaxFiles{5};
    std::string logLevel{"info"};              // error|warn|info|debug|trace
    bool        debug{false};                  // at least debug, whatever logLevel says

    // Where this configuration was read from (not serialized)
    std::string configFile;
};

// JSON (de)serialization
void to_json(nlohmann::json& j, const DaemonConfig& c);
void from_json(const nlohmann::json& j, DaemonConfig& c);

/* Built-in defaults; configFile points at the default location. */
DaemonConfig defaultConfig();

/* ENV fallback layer (BCTD_*); malformed values are ignored. */
void applyEnvFallbacks(DaemonConfig& c);

/*
 * Explicit path (throws std::runtime_error):
 *  - empty path: use BCTD_CONFIG_PATH or the default location; a missing
 *    file there is not an error.
 *  - non-empty path: the file must exist and parse.
 */
void loadDaemonConfig(const std::string& path, DaemonConfig& out);

/* Convenience wrapper; on failure *err is set and defaults+ENV are returned. */
DaemonConfig loadDaemonConfig(const std::string& path, std::string* err);

/* Range and consistency checks that make the config usable. */
bool validateDaemonConfig(const DaemonConfig& c, std::string* err);

/* logLevel, raised to Debug by `debug`; Info if logLevel does not parse. */
LogLevel effectiveLogLevel(const DaemonConfig& c);

namespace Config {
    std::string defaultConfigPath();
}

} // namespace bct
