/*
 * bctd — Daemon (header)
 * - Reads requests from the command pipe and applies them to the battery
 * (c) 2025 bctd contributors
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <signal.h>

#include "CommandPipe.hpp"
#include "Config.hpp"
#include "ThresholdDevice.hpp"
#include "ThresholdResolver.hpp"
#include "Thresholds.hpp"

namespace bct {

/* What became of one request. */
enum class LineOutcome {
    Applied,
    Ignored,      // empty line / nothing requested
    ParseError,
    Rejected,
    ApplyError
};

const char* lineOutcomeName(LineOutcome o);

class Daemon {
public:
    Daemon(DaemonConfig cfg, std::unique_ptr<ThresholdDevice> device);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /* Create or repair the command pipe. */
    bool init(std::string* err);

    /*
     * applyDefaultsOnStart with at least one default configured: push them
     * once. A failure is logged; the caller keeps serving requests.
     */
    LineOutcome applyStartupDefaults();

    /*
     * WaitingForLine <-> Processing until requestStop(). `waitMask` is the
     * signal mask in effect only while waiting on the pipe. Returns false when
     * the pipe became unusable and could not be recreated.
     */
    bool runLoop(const sigset_t* waitMask = nullptr);

    /* Async-signal-safe. */
    void requestStop() noexcept { stop_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const noexcept { return stop_.load(std::memory_order_relaxed); }

    /* parse -> resolve -> apply for one pipe line. */
    LineOutcome handleLine(const std::string& line);

    /* Push the configured defaults through resolve -> apply. */
    LineOutcome applyConfiguredDefaults();

    ThresholdDevice&    device() noexcept { return *device_; }
    CommandPipe&        pipe() noexcept { return pipe_; }

private:
    LineOutcome process(const PartialThresholds& partial, const std::string& source);
    ThresholdDefaults fillValuesFor(const PartialThresholds& partial);

    DaemonConfig                     cfg_;
    std::unique_ptr<ThresholdDevice> device_;
    CommandPipe                      pipe_;
    std::atomic<bool>                stop_{false};
};

} // namespace bct
