/*
 * Arduino Compile Server
 * Copyright (c) 2025 Pavel Petržela
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <wx/log.h>
#include <wx/string.h>

using Clock = std::chrono::steady_clock;

extern bool g_debugLogging;
extern bool g_verboseLogging;

void AppDebugLog(const char *fmt, ...);
void AppTraceLog(const char *fmt, ...);

#define APP_DEBUG_LOG(...)    \
  do {                        \
    AppDebugLog(__VA_ARGS__); \
  } while (0)

#define APP_TRACE_LOG(...)    \
  do {                        \
    AppTraceLog(__VA_ARGS__); \
  } while (0)

/**
 * Helper for profiling.
 */
struct ScopeTimer {
  std::string name;
  Clock::time_point start;

  ScopeTimer(const char *fmt, ...) {
    char buf[512];

    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    name = buf;
    start = Clock::now();
  }

  ~ScopeTimer() {
    auto end = Clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    APP_DEBUG_LOG("TIMER [%s]: %lld us", name.c_str(), static_cast<long long>(us));
  }
};

// Returns <0 if a < b, 0 if a == b, >0 if a > b
int CompareVersions(const std::string &a, const std::string &b);

// "1.3.1-beta" -> "1.3.1"; keeps only digits and dots
std::string StripVersionSuffix(const std::string &version);

std::string Trim(const std::string &s);

void TrimInPlace(std::string &s);

bool LoadFileToString(const std::string &path, std::string &out);
bool SaveFileFromString(const std::string &pathUtf8, const std::string &data);

// Writes into a sibling temp file and renames it over the target.
bool SaveFileAtomically(const std::string &pathUtf8, const std::string &data);

std::vector<std::string> SplitCsv(const std::string &s);

std::string ShellQuote(const std::string &s);

bool hasSuffix(const std::string &s, const char *suf);

bool hasPrefix(const std::string &s, const char *pre);

std::string ToLower(const std::string &s);

bool isSourceExt(const std::string &ext);

bool isHeaderExt(const std::string &ext);

uint64_t Fnv1a64(const uint8_t *data, size_t len);

std::string wxToStd(const wxString &str);

void ReplaceAll(std::string &s, const std::string &from, const std::string &to);
