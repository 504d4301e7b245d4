/*
 * bctd — Utility helpers (implementation; Linux-only)
 * (c) 2025 bctd contributors
 */

#include "include/Utils.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace bct { namespace util {

using json = nlohmann::json;

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key) {
    if (!key || !*key) return std::nullopt;
    const char* v = std::getenv(key);
    if (!v) return std::nullopt;
    return std::string(v);
}

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv) {
    size_t i = 0, j = sv.size();
    while (i < j && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(sv[j-1]))) --j;
    return std::string(sv.substr(i, j - i));
}

std::string to_lower(std::string_view sv) {
    std::string s(sv);
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool parseInt(std::string_view sv, long long& out) {
    const std::string s = trim(sv);
    if (s.empty()) return false;
    size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (size_t k = i; k < s.size(); ++k) {
        if (s[k] < '0' || s[k] > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') return false;
    out = v;
    return true;
}

bool parseOctalMode(std::string_view sv, mode_t& out) {
    const std::string s = trim(sv);
    if (s.empty() || s.size() > 5) return false;
    unsigned long sum = 0;
    for (char c : s) {
        if (c < '0' || c > '7') return false;
        sum = (sum << 3) + static_cast<unsigned long>(c - '0');
    }
    if (sum > 07777) return false;
    out = static_cast<mode_t>(sum);
    return true;
}

std::string formatOctalMode(mode_t mode) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03o", static_cast<unsigned>(mode));
    return std::string(buf);
}

std::string errnoString(int err) {
    return std::string(std::strerror(err));
}

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

void ensure_parent_dirs(const fs::path& p, std::error_code* ec) {
    fs::path dir = p.parent_path();
    if (dir.empty()) return;
    std::error_code tmp;
    fs::create_directories(dir, tmp);
    if (ec) *ec = tmp;
}

/* ----------------------------------------------------------------------------
 * Path expansion
 * ----------------------------------------------------------------------------*/

static inline bool isIdentChar_(char c) {
    return (c == '_') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9');
}

std::string expandUserPath(const std::string& in) {
    if (in.empty()) return in;

    std::string out = in;

    // "~" -> $HOME
    if (out.front() == '~') {
        auto home = getenv_str("HOME");
        if (home && !home->empty()) {
            if (out.size() == 1) return *home;
            if (out[1] == '/') out = *home + out.substr(1);
        }
    }

    // $VAR and ${VAR}; unknown variables expand to nothing
    std::string result;
    result.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        const char c = out[i];
        if (c == '$' && i + 1 < out.size()) {
            if (out[i + 1] == '{') {
                const size_t j = out.find('}', i + 2);
                if (j != std::string::npos) {
                    auto v = getenv_str(out.substr(i + 2, j - (i + 2)).c_str());
                    if (v) result += *v;
                    i = j;
                    continue;
                }
            } else {
                size_t j = i + 1;
                while (j < out.size() && isIdentChar_(out[j])) ++j;
                if (j > i + 1) {
                    auto v = getenv_str(out.substr(i + 1, j - (i + 1)).c_str());
                    if (v) result += *v;
                    i = j - 1;
                    continue;
                }
            }
        }
        result.push_back(c);
    }
    return result;
}

/* ----------------------------------------------------------------------------
 * JSON helpers
 * ----------------------------------------------------------------------------*/

json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("cannot open '" + path + "': " + errnoString(errno));
    }
    std::stringstream ss;
    ss << f.rdbuf();

    json j = json::parse(ss.str(), /*cb=*/nullptr, /*allow_exceptions=*/false,
                         /*ignore_comments=*/true);
    if (j.is_discarded()) {
        throw std::runtime_error("invalid JSON in '" + path + "'");
    }
    return j;
}

}} // namespace bct::util
