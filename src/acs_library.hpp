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

#include "acs_error.hpp"
#include <map>
#include <string>
#include <vector>

// One library the caller wants, e.g. "Servo" or "ArduinoJson@7.0.4".
struct ArduinoLibraryRequest {
  std::string name;
  std::string version; // empty = latest from the catalog

  bool HasVersion() const { return !version.empty(); }
  std::string ToString() const { return version.empty() ? name : name + "@" + version; }
};

// Letters, digits, underscore and space only. Anything else never reaches a
// command line.
bool IsSafeLibraryName(const std::string &name);
bool IsSafeLibraryVersion(const std::string &version);

// Parses and validates "Name" / "Name@Version" (surrounding whitespace ignored).
bool ParseLibraryRequest(const std::string &text, ArduinoLibraryRequest &out, ArduinoBuildError *err);
bool ParseLibraryRequests(const std::vector<std::string> &texts, std::vector<ArduinoLibraryRequest> &out, ArduinoBuildError *err);

// Metadata read from library.properties.
struct ArduinoLibraryProperties {
  std::string name;
  std::string version;
  std::vector<std::string> depends;       // names, version constraints stripped
  std::vector<std::string> architectures; // raw tags, "*" = universal
  bool hasDepends = false;
  bool hasArchitectures = false;
};

ArduinoLibraryProperties ParseLibraryProperties(const std::string &content);

// "ArduinoJson (>=6.0.0)" -> "ArduinoJson"
std::string StripDependencyConstraint(const std::string &dep);

// Per board id build flags of one installed library.
struct ArduinoArchitectureFlags {
  std::string includeFlags; // "-I'../Dep@1.0/lib/lib/' ..."
  std::string libraryDirs;  // lib_deps lines
};

struct ArduinoResolvedArtifact {
  std::string name;
  std::string version;
  std::string installDir;
  std::vector<std::string> arches; // architectures declared by the library
  std::map<std::string, ArduinoArchitectureFlags> perArchitecture;

  std::string Key() const { return name + "@" + version; }
  bool SupportsBoard(const std::string &board) const { return perArchitecture.count(board) > 0; }
};

using ArduinoResolvedMap = std::map<std::string, ArduinoResolvedArtifact>;
