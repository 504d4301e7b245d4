/*
 * bctd — Utility helpers (header)
 * (c) 2025 bctd contributors
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <sys/types.h>

#include <nlohmann/json.hpp>

namespace bct { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key);

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv);

/** Lowercase copy (ASCII) */
std::string to_lower(std::string_view sv);

/** Strict base-10 integer: optional sign, digits only, no trailing junk. */
bool parseInt(std::string_view sv, long long& out);

/** Octal permission bits ("660", "0644"); rejects non-octal digits and values > 07777. */
bool parseOctalMode(std::string_view sv, mode_t& out);

/** "%03o"-style rendering used in logs and config dumps. */
std::string formatOctalMode(mode_t mode);

/** strerror(err) as std::string. */
std::string errnoString(int err);

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

/** Ensure parent directory of path exists (no-op if already exists). */
void ensure_parent_dirs(const std::filesystem::path& p, std::error_code* ec = nullptr);

/* Expand a user/home/environment path:
 *  - Leading '~' -> $HOME
 *  - ${VAR} or $VAR -> environment variable
 * Returns the expanded string (no filesystem checks). */
std::string expandUserPath(const std::string& path);

/* Read a JSON document; '//' and block comments are tolerated.
 * Throws std::runtime_error when the file cannot be read or parsed. */
nlohmann::json read_json_file(const std::string& path);

}} // namespace bct::util
