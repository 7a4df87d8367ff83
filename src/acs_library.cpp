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

#include "acs_library.hpp"

#include "utils.hpp"
#include <cctype>
#include <sstream>

bool IsSafeLibraryName(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!(std::isalnum(uc) || c == '_' || c == ' ')) {
      return false;
    }
  }
  return true;
}

bool IsSafeLibraryVersion(const std::string &version) {
  if (version.empty()) {
    return false;
  }
  for (char c : version) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!(std::isalnum(uc) || c == '.' || c == '-' || c == '+' || c == '_')) {
      return false;
    }
  }
  return true;
}

bool ParseLibraryRequest(const std::string &text, ArduinoLibraryRequest &out, ArduinoBuildError *err) {
  out = ArduinoLibraryRequest{};

  std::string raw = Trim(text);
  std::string name = raw;
  std::string version;

  size_t at = raw.find('@');
  if (at != std::string::npos) {
    name = Trim(raw.substr(0, at));
    version = Trim(raw.substr(at + 1));
    if (!IsSafeLibraryVersion(version)) {
      return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Invalid library version in '" + raw + "'");
    }
  }

  if (!IsSafeLibraryName(name)) {
    return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Invalid library name '" + raw + "'");
  }

  out.name = name;
  out.version = version;
  return true;
}

bool ParseLibraryRequests(const std::vector<std::string> &texts, std::vector<ArduinoLibraryRequest> &out, ArduinoBuildError *err) {
  out.clear();
  out.reserve(texts.size());
  for (const auto &t : texts) {
    ArduinoLibraryRequest r;
    if (!ParseLibraryRequest(t, r, err)) {
      out.clear();
      return false;
    }
    out.push_back(std::move(r));
  }
  return true;
}

std::string StripDependencyConstraint(const std::string &dep) {
  std::string s = dep;
  size_t paren = s.find('(');
  if (paren != std::string::npos) {
    s.erase(paren);
  }
  TrimInPlace(s);
  return s;
}

ArduinoLibraryProperties ParseLibraryProperties(const std::string &content) {
  ArduinoLibraryProperties props;

  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    std::string raw = line;
    TrimInPlace(raw);
    if (raw.empty() || raw[0] == '#')
      continue;

    auto eq = raw.find('=');
    if (eq == std::string::npos)
      continue;

    std::string key = raw.substr(0, eq);
    std::string val = raw.substr(eq + 1);
    TrimInPlace(key);
    TrimInPlace(val);

    if (key == "name") {
      props.name = val;
    } else if (key == "version") {
      props.version = val;
    } else if (key == "depends") {
      props.hasDepends = true;
      for (const auto &dep : SplitCsv(val)) {
        std::string depName = StripDependencyConstraint(dep);
        if (!depName.empty()) {
          props.depends.push_back(depName);
        }
      }
    } else if (key == "architectures") {
      props.hasArchitectures = true;
      props.architectures = SplitCsv(val);
    }
  }

  return props;
}
