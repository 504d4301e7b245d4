/*
 * bctd — Charge threshold attribute access
 * (c) 2025 bctd contributors
 */
#pragma once

#include <optional>
#include <string>

#include "Thresholds.hpp"

namespace bct {

/*
 * The pair of kernel attributes behind one battery. Every call goes to the
 * device; nothing is cached, since other tools may change the values.
 */
class ThresholdDevice {
public:
    virtual ~ThresholdDevice() = default;

    /* Current stored value; nullopt and *err on failure. */
    virtual std::optional<int> read(ThresholdKind k, std::string* err) = 0;

    /* Store `value`; false and *err when the driver refuses it. */
    virtual bool write(ThresholdKind k, int value, std::string* err) = 0;

    /* Human-readable location for log lines. */
    virtual std::string describe(ThresholdKind k) const = 0;
};

/* charge_control_{start,end}_threshold files under /sys/class/power_supply. */
class SysfsThresholdDevice : public ThresholdDevice {
public:
    SysfsThresholdDevice(std::string startPath, std::string endPath);

    std::optional<int> read(ThresholdKind k, std::string* err) override;
    bool write(ThresholdKind k, int value, std::string* err) override;
    std::string describe(ThresholdKind k) const override { return path(k); }

    /* access(W_OK) probe used at startup. */
    bool writable(ThresholdKind k) const;

private:
    const std::string& path(ThresholdKind k) const {
        return k == ThresholdKind::Start ? startPath_ : endPath_;
    }

    std::string startPath_;
    std::string endPath_;
};

} // namespace bct
