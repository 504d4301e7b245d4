/*
 * bctd — Charge threshold attribute access (sysfs)
 * (c) 2025 bctd contributors
 *
 * A refused value surfaces as the errno of write(2), hence raw fds for writes.
 */

#include "include/ThresholdDevice.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <cerrno>
#include <fstream>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace bct {

SysfsThresholdDevice::SysfsThresholdDevice(std::string startPath, std::string endPath)
    : startPath_(std::move(startPath)),
      endPath_(std::move(endPath)) {}

std::optional<int> SysfsThresholdDevice::read(ThresholdKind k, std::string* err) {
    const std::string& p = path(k);
    std::ifstream f(p);
    if (!f) {
        if (err) *err = "open " + p + ": " + util::errnoString(errno);
        return std::nullopt;
    }
    std::string line;
    std::getline(f, line);

    long long v = 0;
    if (!util::parseInt(line, v)) {
        if (err) *err = "unexpected content in " + p + ": '" + line + "'";
        return std::nullopt;
    }
    return static_cast<int>(v);
}

bool SysfsThresholdDevice::write(ThresholdKind k, int value, std::string* err) {
    const std::string& p = path(k);
    const std::string text = std::to_string(value);

    int fd = ::open(p.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
    if (fd < 0) {
        if (err) *err = "open " + p + ": " + util::errnoString(errno);
        return false;
    }
    ssize_t n;
    do {
        n = ::write(fd, text.data(), text.size());
    } while (n < 0 && errno == EINTR);
    const int writeErrno = errno;

    if (::close(fd) != 0 && n >= 0) {
        if (err) *err = "close " + p + ": " + util::errnoString(errno);
        return false;
    }
    if (n < 0) {
        if (err) *err = "write " + text + " to " + p + ": " + util::errnoString(writeErrno);
        return false;
    }
    if (static_cast<size_t>(n) != text.size()) {
        if (err) *err = "short write to " + p;
        return false;
    }
    LOG_TRACE("sysfs: wrote %s -> %s", text.c_str(), p.c_str());
    return true;
}

bool SysfsThresholdDevice::writable(ThresholdKind k) const {
    return ::access(path(k).c_str(), W_OK) == 0;
}

} // namespace bct
