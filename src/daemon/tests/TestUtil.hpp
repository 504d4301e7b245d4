/*
 * bctd — Test helpers (temp dirs, environment, fake battery)
 * (c) 2025 bctd contributors
 */
#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

#include <gtest/gtest.h>

#include "include/ThresholdDevice.hpp"
#include "include/Thresholds.hpp"

namespace bct {
namespace test {

/* mkdtemp() directory, removed with its contents on destruction. */
class ScopedTempDir {
public:
    ScopedTempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "bctd-test-XXXXXX").string();
        if (::mkdtemp(tmpl.data()) != nullptr) path_ = tmpl;
    }
    ~ScopedTempDir() {
        std::error_code ec;
        if (!path_.empty()) std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    bool isValid() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

/* Sets an environment variable for the lifetime of the object. */
class ScopedEnv {
public:
    ScopedEnv(const char* key, const std::string& value) : key_(key) {
        if (const char* old = std::getenv(key)) old_ = std::string(old);
        ::setenv(key, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (old_) ::setenv(key_.c_str(), old_->c_str(), 1);
        else ::unsetenv(key_.c_str());
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string key_;
    std::optional<std::string> old_;
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::trunc);
    f << content;
}

inline std::string readFile(const std::string& path) {
    std::ifstream f(path);
    std::string s((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return s;
}

/*
 * In-memory battery. Like the kernel drivers, it refuses a start above the
 * stored end and an end below the stored start.
 */
class FakeThresholdDevice : public ThresholdDevice {
public:
    struct Write {
        ThresholdKind kind;
        int value;
        bool operator==(const Write& o) const { return kind == o.kind && value == o.value; }
    };

    FakeThresholdDevice(int start, int end) : start_(start), end_(end) {}

    std::optional<int> read(ThresholdKind k, std::string* err) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++reads_;
        if (failReads_) {
            if (err) *err = "Input/output error";
            return std::nullopt;
        }
        return k == ThresholdKind::Start ? start_ : end_;
    }

    bool write(ThresholdKind k, int value, std::string* err) override {
        std::lock_guard<std::mutex> lock(mtx_);
        int& pending = (k == ThresholdKind::Start) ? failStartWrites_ : failEndWrites_;
        if (pending != 0) {
            if (pending > 0) --pending;
            if (err) *err = "injected failure";
            return false;
        }
        if (k == ThresholdKind::Start) {
            if (value > end_) {
                if (err) *err = "Invalid argument";
                return false;
            }
            start_ = value;
        } else {
            if (value < start_) {
                if (err) *err = "Invalid argument";
                return false;
            }
            end_ = (endCeiling_ && value > *endCeiling_) ? *endCeiling_ : value;
        }
        writes_.push_back({k, value});
        if (readsFailAfterWrite_) failReads_ = true;
        return true;
    }

    std::string describe(ThresholdKind k) const override {
        return std::string("fake:") + thresholdKindName(k);
    }

    /* Fail the next `n` writes of `k`; -1 fails them all. */
    void failWrites(ThresholdKind k, int n) {
        std::lock_guard<std::mutex> lock(mtx_);
        (k == ThresholdKind::Start ? failStartWrites_ : failEndWrites_) = n;
    }
    void failReads(bool on) {
        std::lock_guard<std::mutex> lock(mtx_);
        failReads_ = on;
    }
    /* Reads start failing once any write has succeeded. */
    void failReadsAfterWrite() {
        std::lock_guard<std::mutex> lock(mtx_);
        readsFailAfterWrite_ = true;
    }
    /* Accept end writes but silently store at most `v`. */
    void clampEndTo(int v) {
        std::lock_guard<std::mutex> lock(mtx_);
        endCeiling_ = v;
    }
    /* Another process changing the values behind the daemon's back. */
    void set(int start, int end) {
        std::lock_guard<std::mutex> lock(mtx_);
        start_ = start;
        end_ = end;
    }

    std::pair<int, int> values() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return {start_, end_};
    }
    std::vector<Write> writes() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return writes_;
    }
    int reads() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return reads_;
    }
    void clearWrites() {
        std::lock_guard<std::mutex> lock(mtx_);
        writes_.clear();
    }

private:
    mutable std::mutex mtx_;
    int start_;
    int end_;
    int failStartWrites_{0};
    int failEndWrites_{0};
    bool failReads_{false};
    bool readsFailAfterWrite_{false};
    std::optional<int> endCeiling_;
    std::vector<Write> writes_;
    int reads_{0};
};

inline void PrintTo(const FakeThresholdDevice::Write& w, std::ostream* os) {
    *os << thresholdKindName(w.kind) << "=" << w.value;
}

} // namespace test
} // namespace bct
