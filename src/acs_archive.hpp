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
#include <string>
#include <utility>
#include <vector>

// Library zip read into memory, already filtered and remapped.
struct ArduinoLibraryArchive {
  // (path relative to the library source root, content)
  std::vector<std::pair<std::string, std::string>> files;
  bool hasProperties = false;
  std::string properties; // <root>/library.properties

  size_t SourceCount() const;
};

// Where an entry of the archive goes, relative to the library source root.
// "<root>/src/a/b.cpp" -> "a/b.cpp", "<root>/x.h" -> "x.h", anything else
// (examples, extras, non C/C++ files) -> "".
std::string MapArchiveEntry(const std::string &entryName, const std::string &rootFolder);

// True when the path is absolute or has a ".." component.
bool IsEscapingPath(const std::string &relPath);

bool ReadLibraryArchive(const std::string &zipData,
                        const std::string &rootFolder,
                        ArduinoLibraryArchive &out,
                        ArduinoBuildError *err);

bool WriteLibraryArchive(const ArduinoLibraryArchive &archive,
                         const std::string &destDir,
                         ArduinoBuildError *err);
