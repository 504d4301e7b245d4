/*
 * bctd — Daemon entry (main)
 * (c) 2025 bctd contributors
 */

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <sys/types.h>

#include <nlohmann/json.hpp>

#include "include/Version.hpp"
#include "include/Config.hpp"
#include "include/Daemon.hpp"
#include "include/Log.hpp"
#include "include/ThresholdDevice.hpp"
#include "include/Utils.hpp"

using bct::Daemon;
using bct::DaemonConfig;
using bct::SysfsThresholdDevice;
using bct::ThresholdKind;

enum ExitCode {
    kExitOk      = 0,
    kExitFatal   = 1,
    kExitConfig  = 2
};

static Daemon* gDaemon = nullptr;

static void sig_handler(int) {
    if (gDaemon) gDaemon->requestStop();
}

/*
 * Block the stop signals and return the previous mask in `waitMask`. They are
 * only delivered inside the pipe wait, which then returns EINTR; no
 * SA_RESTART for the same reason.
 */
static void install_signals(sigset_t* waitMask) {
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    sigaddset(&stopSignals, SIGHUP);
    sigprocmask(SIG_BLOCK, &stopSignals, waitMask);
    sigdelset(waitMask, SIGINT);
    sigdelset(waitMask, SIGTERM);
    sigdelset(waitMask, SIGHUP);

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = sig_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT,  &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP,  &sa, nullptr);
}

static void usage(const char* exe) {
    std::cout <<
        "Battery charge threshold daemon (bctd) " << BCTD_VERSION << "\n"
        "Usage: " << exe << " [options]\n"
        "Options:\n"
        "  --config PATH             JSON config (default: " << bct::Config::defaultConfigPath() << ")\n"
        "  --pipe-path PATH          Command pipe (default: /tmp/battery_pipe)\n"
        "  --pipe-permissions OCTAL  Pipe mode (default: 777)\n"
        "  --pipe-uid N              Pipe owner uid (default: unchanged)\n"
        "  --pipe-gid N              Pipe group gid (default: unchanged)\n"
        "  --start-path PATH         charge_control_start_threshold attribute\n"
        "  --end-path PATH           charge_control_end_threshold attribute\n"
        "  --default-start N         Start value used when a request omits it\n"
        "  --default-end N           End value used when a request omits it\n"
        "  --no-apply-defaults       Do not push the defaults at startup\n"
        "  --logfile PATH            Log file (default: stdio only)\n"
        "  --log-level LEVEL         error, warn, info, debug or trace (default: info)\n"
        "  --debug                   Verbose logging (same as --log-level debug)\n"
        "  --dump-config             Print the effective configuration and exit\n"
        "  --version                 Print version and exit\n"
        "  -h,--help                 Show this help\n";
}

/* Command-line layer; applied on top of defaults/ENV/JSON. */
struct CliOverrides {
    std::optional<std::string> pipePath;
    std::optional<mode_t>      pipeMode;
    std::optional<uid_t>       pipeUid;
    std::optional<gid_t>       pipeGid;
    std::optional<std::string> startPath;
    std::optional<std::string> endPath;
    std::optional<int>         defaultStart;
    std::optional<int>         defaultEnd;
    std::optional<std::string> logfile;
    std::optional<std::string> logLevel;
    bool noApplyDefaults{false};
    bool debug{false};
};

static void apply_overrides(const CliOverrides& o, DaemonConfig& cfg) {
    if (o.pipePath)     cfg.pipePath     = bct::util::expandUserPath(*o.pipePath);
    if (o.pipeMode)     cfg.pipeMode     = *o.pipeMode;
    if (o.pipeUid)      cfg.pipeUid      = *o.pipeUid;
    if (o.pipeGid)      cfg.pipeGid      = *o.pipeGid;
    if (o.startPath)    cfg.startPath    = bct::util::expandUserPath(*o.startPath);
    if (o.endPath)      cfg.endPath      = bct::util::expandUserPath(*o.endPath);
    if (o.defaultStart) cfg.defaultStart = *o.defaultStart;
    if (o.defaultEnd)   cfg.defaultEnd   = *o.defaultEnd;
    if (o.logfile)      cfg.logfile      = bct::util::expandUserPath(*o.logfile);
    if (o.logLevel)     cfg.logLevel     = *o.logLevel;
    if (o.noApplyDefaults) cfg.applyDefaultsOnStart = false;
    if (o.debug)        cfg.debug = true;
}

int main(int argc, char** argv) {
    std::string cfgPath;
    CliOverrides cli;
    bool dumpConfig = false;

    // Parse CLI first (no filesystem/config yet)
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) { std::cerr << "missing value for " << what << "\n"; std::exit(kExitConfig); }
            return argv[++i];
        };
        auto nextInt = [&](const char* what, long long lo, long long hi) -> long long {
            const std::string v = next(what);
            long long n = 0;
            if (!bct::util::parseInt(v, n) || n < lo || n > hi) {
                std::cerr << "invalid value for " << what << ": " << v << "\n";
                std::exit(kExitConfig);
            }
            return n;
        };

        if (a == "--config") cfgPath = next(a.c_str());
        else if (a == "--pipe-path") cli.pipePath = next(a.c_str());
        else if (a == "--pipe-permissions") {
            const std::string v = next(a.c_str());
            mode_t m = 0;
            if (!bct::util::parseOctalMode(v, m)) {
                std::cerr << "invalid value for " << a << ": " << v << "\n";
                return kExitConfig;
            }
            cli.pipeMode = m;
        }
        else if (a == "--pipe-uid") cli.pipeUid = static_cast<uid_t>(nextInt(a.c_str(), 0, 0x7fffffff));
        else if (a == "--pipe-gid") cli.pipeGid = static_cast<gid_t>(nextInt(a.c_str(), 0, 0x7fffffff));
        else if (a == "--start-path") cli.startPath = next(a.c_str());
        else if (a == "--end-path") cli.endPath = next(a.c_str());
        else if (a == "--default-start") cli.defaultStart = static_cast<int>(nextInt(a.c_str(), -1000, 1000));
        else if (a == "--default-end") cli.defaultEnd = static_cast<int>(nextInt(a.c_str(), -1000, 1000));
        else if (a == "--no-apply-defaults") cli.noApplyDefaults = true;
        else if (a == "--logfile") cli.logfile = next(a.c_str());
        else if (a == "--log-level") cli.logLevel = next(a.c_str());
        else if (a == "--debug") cli.debug = true;
        else if (a == "--dump-config") dumpConfig = true;
        else if (a == "--version") { std::cout << "bctd " << BCTD_VERSION << "\n"; return kExitOk; }
        else if (a == "-h" || a == "--help") { usage(argv[0]); return kExitOk; }
        else {
            std::cerr << "unknown arg: " << a << "\n";
            usage(argv[0]);
            return kExitConfig;
        }
    }

    DaemonConfig cfg;
    try {
        bct::loadDaemonConfig(cfgPath, cfg);
    } catch (const std::exception& ex) {
        std::cerr << "[error] load config: " << ex.what() << "\n";
        return kExitConfig;
    }
    apply_overrides(cli, cfg);

    {
        std::string err;
        if (!bct::validateDaemonConfig(cfg, &err)) {
            std::cerr << "[error] invalid config: " << err << "\n";
            return kExitConfig;
        }
    }

    if (dumpConfig) {
        std::cout << nlohmann::json(cfg).dump(2) << "\n";
        return kExitOk;
    }

    auto& log = bct::Logger::instance();
    log.init(cfg.logfile, bct::effectiveLogLevel(cfg), true);
    log.enableRotation(cfg.logMaxBytes, cfg.logMaxFiles);
    LOG_INFO("bctd starting (version %s, config %s)", BCTD_VERSION, cfg.configFile.c_str());

    auto device = std::make_unique<SysfsThresholdDevice>(cfg.startPath, cfg.endPath);
    const bool startWritable = device->writable(ThresholdKind::Start);
    const bool endWritable   = device->writable(ThresholdKind::End);

    Daemon daemon(cfg, std::move(device));
    gDaemon = &daemon;
    sigset_t waitMask;
    install_signals(&waitMask);

    std::string err;
    if (!daemon.init(&err)) {
        LOG_ERROR("pipe setup failed: %s", err.c_str());
        gDaemon = nullptr;
        log.shutdown();
        return kExitFatal;
    }

    if (!startWritable) LOG_WARN("start threshold %s is not writable", cfg.startPath.c_str());
    if (!endWritable)   LOG_WARN("end threshold %s is not writable", cfg.endPath.c_str());
    if (!startWritable && !endWritable) {
        LOG_ERROR("no writable charge threshold attribute; is bctd running as root?");
        gDaemon = nullptr;
        log.shutdown();
        return kExitFatal;
    }

    (void)daemon.applyStartupDefaults();

    const bool ok = daemon.runLoop(&waitMask);
    LOG_INFO("bctd shutting down%s", ok ? "" : " (pipe unusable)");

    gDaemon = nullptr;
    log.shutdown();
    return ok ? kExitOk : kExitFatal;
}
