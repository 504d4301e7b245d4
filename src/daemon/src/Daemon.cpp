/*
 * bctd — Daemon (implementation)
 * (c) 2025 bctd contributors
 */
#include "include/Daemon.hpp"
#include "include/Log.hpp"
#include "include/ThresholdApplier.hpp"
#include "include/ThresholdExpr.hpp"
#include "include/Utils.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace bct {

/* Back-off after a pipe error so a broken path does not spin the CPU. */
static constexpr std::chrono::milliseconds kPipeErrorBackoff{250};

const char* lineOutcomeName(LineOutcome o) {
    switch (o) {
        case LineOutcome::Applied:    return "applied";
        case LineOutcome::Ignored:    return "ignored";
        case LineOutcome::ParseError: return "parse error";
        case LineOutcome::Rejected:   return "rejected";
        case LineOutcome::ApplyError: return "apply error";
    }
    return "?";
}

Daemon::Daemon(DaemonConfig cfg, std::unique_ptr<ThresholdDevice> device)
    : cfg_(std::move(cfg)),
      device_(std::move(device)),
      pipe_(cfg_.pipePath, cfg_.pipeMode, cfg_.pipeUid, cfg_.pipeGid) {
    LOG_TRACE("daemon: ctor");
}

Daemon::~Daemon() {
    pipe_.close();
}

bool Daemon::init(std::string* err) {
    LOG_INFO("daemon: init (pipe=%s mode=%s start=%s end=%s)",
             cfg_.pipePath.c_str(), util::formatOctalMode(cfg_.pipeMode).c_str(),
             device_->describe(ThresholdKind::Start).c_str(),
             device_->describe(ThresholdKind::End).c_str());

    return pipe_.ensure(err);
}

LineOutcome Daemon::applyStartupDefaults() {
    if (!cfg_.applyDefaultsOnStart || (!cfg_.defaultStart && !cfg_.defaultEnd)) {
        return LineOutcome::Ignored;
    }
    return applyConfiguredDefaults();
}

ThresholdDefaults Daemon::fillValuesFor(const PartialThresholds& partial) {
    ThresholdDefaults d;
    d.start = cfg_.defaultStart;
    d.end   = cfg_.defaultEnd;

    // Without a configured default the missing side keeps its kernel value.
    auto fromKernel = [&](ThresholdKind k, std::optional<int>& slot) {
        std::string why;
        slot = device_->read(k, &why);
        if (!slot) {
            LOG_WARN("daemon: no default for %s and current value unreadable: %s",
                     thresholdKindName(k), why.c_str());
        }
    };
    if (!partial.start && !d.start) fromKernel(ThresholdKind::Start, d.start);
    if (!partial.end   && !d.end)   fromKernel(ThresholdKind::End,   d.end);
    return d;
}

LineOutcome Daemon::process(const PartialThresholds& partial, const std::string& source) {
    if (partial.empty()) {
        LOG_DEBUG("request '%s': nothing to do", source.c_str());
        return LineOutcome::Ignored;
    }

    std::optional<ResolvedThresholds> resolved;
    std::string why;
    switch (resolveThresholds(partial, fillValuesFor(partial), resolved, &why)) {
        case ResolveStatus::NoOp:
            LOG_DEBUG("request '%s': nothing to do", source.c_str());
            return LineOutcome::Ignored;
        case ResolveStatus::Rejected:
            LOG_WARN("request '%s': rejected: %s", source.c_str(), why.c_str());
            return LineOutcome::Rejected;
        case ResolveStatus::Resolved:
            break;
    }

    ApplyError ae;
    if (!applyThresholds(*resolved, *device_, &ae)) {
        LOG_ERROR("request '%s': %s failed for %s threshold (%s): %s",
                  source.c_str(), resolved->toString().c_str(), thresholdKindName(ae.kind),
                  device_->describe(ae.kind).c_str(), ae.cause.c_str());
        return LineOutcome::ApplyError;
    }
    LOG_INFO("request '%s': applied %s", source.c_str(), resolved->toString().c_str());
    return LineOutcome::Applied;
}

LineOutcome Daemon::handleLine(const std::string& line) {
    PartialThresholds partial;
    std::string why;
    if (!parseThresholdExpr(line, partial, &why)) {
        LOG_WARN("request '%s': parse error: %s", line.c_str(), why.c_str());
        return LineOutcome::ParseError;
    }
    return process(partial, line);
}

LineOutcome Daemon::applyConfiguredDefaults() {
    PartialThresholds partial;
    if (cfg_.defaultStart) partial.start = *cfg_.defaultStart;
    if (cfg_.defaultEnd)   partial.end   = *cfg_.defaultEnd;
    return process(partial, "<defaults>");
}

bool Daemon::runLoop(const sigset_t* waitMask) {
    LOG_INFO("daemon: waiting for requests on %s", pipe_.path().c_str());

    while (!stopRequested()) {
        std::string line;
        std::string err;
        switch (pipe_.nextLine(line, &err, waitMask)) {
            case CommandPipe::ReadStatus::Line: {
                const LineOutcome o = handleLine(line);
                LOG_TRACE("daemon: line done (%s)", lineOutcomeName(o));
                break;
            }
            case CommandPipe::ReadStatus::Eof:
                LOG_TRACE("daemon: writer closed the pipe, reopening");
                break;
            case CommandPipe::ReadStatus::Interrupted:
                break;
            case CommandPipe::ReadStatus::Error: {
                LOG_ERROR("daemon: pipe: %s", err.c_str());
                std::string ensureErr;
                if (!pipe_.ensure(&ensureErr)) {
                    LOG_ERROR("daemon: cannot recreate pipe: %s", ensureErr.c_str());
                    return false;
                }
                std::this_thread::sleep_for(kPipeErrorBackoff);
                break;
            }
        }
    }

    pipe_.close();
    LOG_INFO("daemon: run loop end");
    return true;
}

} // namespace bct
