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

#include "utils.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

bool g_debugLogging = false;
bool g_verboseLogging = false;

void AppDebugLog(const char *fmt, ...) {
  if (!g_debugLogging) {
    return;
  }

  char buf[65535];

  va_list args;
  va_start(args, fmt);
  vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  buf[sizeof(buf) - 1] = '\0';

  wxString msg = wxString::FromUTF8(buf);

  wxLogMessage(wxT("[DBG] %s"), msg);
}

void AppTraceLog(const char *fmt, ...) {
  if (!g_verboseLogging) {
    return;
  }

  char buf[65535];

  va_list args;
  va_start(args, fmt);
  vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  buf[sizeof(buf) - 1] = '\0';

  wxString msg = wxString::FromUTF8(buf);

  wxLogMessage(wxT("[TRC] %s"), msg);
}

// Returns <0 if a < b, 0 if a == b, >0 if a > b
int CompareVersions(const std::string &a, const std::string &b) {
  auto split = [](const std::string &s) {
    std::vector<long> parts;
    size_t start = 0;

    while (start < s.size()) {
      size_t dot = s.find('.', start);
      size_t len = (dot == std::string::npos) ? s.size() - start : dot - start;

      std::string token = s.substr(start, len);

      // we take only the initial digits (in case of "1.3.1-beta")
      size_t i = 0;
      while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]))) {
        ++i;
      }

      long value = 0;
      if (i > 0) {
        try {
          value = std::stol(token.substr(0, i));
        } catch (const std::out_of_range &) {
          value = 0;
        }
      }

      parts.push_back(value);

      if (dot == std::string::npos)
        break;
      start = dot + 1;
    }

    return parts;
  };

  auto va = split(a);
  auto vb = split(b);

  size_t n = std::max(va.size(), vb.size());
  for (size_t i = 0; i < n; ++i) {
    long ai = (i < va.size()) ? va[i] : 0;
    long bi = (i < vb.size()) ? vb[i] : 0;
    if (ai < bi)
      return -1;
    if (ai > bi)
      return 1;
  }
  return 0;
}

std::string StripVersionSuffix(const std::string &version) {
  std::string out;
  out.reserve(version.size());
  for (char c : version) {
    if (c == '.' || std::isdigit(static_cast<unsigned char>(c))) {
      out.push_back(c);
    }
  }
  return out;
}

std::string Trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return std::string();
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

void TrimInPlace(std::string &s) {
  auto notSpace = [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
  s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

bool LoadFileToString(const std::string &pathUtf8, std::string &out) {
  out.clear();

  std::ifstream ifs(pathUtf8, std::ios::binary);
  if (!ifs.is_open()) {
    return false;
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  out = oss.str();
  return true;
}

bool SaveFileFromString(const std::string &pathUtf8, const std::string &data) {
  std::ofstream ofs(pathUtf8, std::ios::binary | std::ios::trunc);

  if (!ofs.is_open())
    return false;

  if (!data.empty()) {
    ofs.write(data.data(), (std::streamsize)data.size());
  }

  return ofs.good();
}

static std::atomic<unsigned int> g_tmpCounter{1};

bool SaveFileAtomically(const std::string &pathUtf8, const std::string &data) {
  std::ostringstream tmp;
  tmp << pathUtf8 << ".tmp." << std::this_thread::get_id() << "." << g_tmpCounter++;

  if (!SaveFileFromString(tmp.str(), data)) {
    std::error_code ec;
    fs::remove(tmp.str(), ec);
    return false;
  }

  std::error_code ec;
  fs::rename(tmp.str(), pathUtf8, ec);
  if (ec) {
    wxLogWarning(wxT("Cannot rename %s: %s"), wxString::FromUTF8(tmp.str()), wxString::FromUTF8(ec.message()));
    fs::remove(tmp.str(), ec);
    return false;
  }
  return true;
}

std::vector<std::string> SplitCsv(const std::string &s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    TrimInPlace(item);
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

std::string ShellQuote(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

bool hasSuffix(const std::string &s, const char *suf) {
  size_t len = std::strlen(suf);
  return s.size() >= len && s.compare(s.size() - len, len, suf) == 0;
}

bool hasPrefix(const std::string &s, const char *pre) {
  size_t len = std::strlen(pre);
  return s.size() >= len && s.compare(0, len, pre) == 0;
}

std::string ToLower(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return out;
}

bool isSourceExt(const std::string &ext) {
  return (ext == "cpp" || ext == "c");
}

bool isHeaderExt(const std::string &ext) {
  return (ext == "h" || ext == "hpp");
}

uint64_t Fnv1a64(const uint8_t *data, size_t len) {
  uint64_t hash = 14695981039346656037ULL;
  for (size_t i = 0; i < len; ++i) {
    hash ^= data[i];
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::string wxToStd(const wxString &str) {
  wxCharBuffer buf = str.utf8_str();
  return std::string(buf.data(), buf.length());
}

void ReplaceAll(std::string &s, const std::string &from, const std::string &to) {
  if (from.empty())
    return;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}
