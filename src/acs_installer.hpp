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
#include "acs_library.hpp"
#include <set>
#include <string>
#include <vector>

class ArduinoArtifactCache;
class ArduinoBoardRegistry;
class ArduinoHttpClient;
class ArduinoLibraryCatalog;
class ArduinoProcessRunner;
struct ArduinoBoardProfile;
struct ArduinoCatalogEntry;
struct ArduinoLibraryArchive;

struct ArduinoToolchainOptions {
  std::string command = "platformio";
  int threads = 1;
  int timeoutSec = 600;
};

struct ArduinoInstallOptions {
  // PlatformIO board id of the job the install is made for; enables the
  // narrowed retry. Empty for plain installs.
  std::string targetBoard;
};

// Installs libraries (and what they depend on) into the artifact cache and
// builds one static library per supported board.
class ArduinoDependencyInstaller {
public:
  ArduinoDependencyInstaller(ArduinoLibraryCatalog &catalog,
                             ArduinoArtifactCache &cache,
                             ArduinoHttpClient &http,
                             ArduinoProcessRunner &runner,
                             const ArduinoBoardRegistry &boards,
                             const ArduinoToolchainOptions &toolchain);

  // Fills out with name -> artifact for every request and its dependencies.
  // Offline: returns true with an empty map and err->kind == OfflineSkip.
  bool Install(const std::vector<ArduinoLibraryRequest> &requests,
               const ArduinoInstallOptions &options,
               ArduinoResolvedMap &out,
               ArduinoBuildError *err);

private:
  bool InstallOne(const ArduinoLibraryRequest &request,
                  const ArduinoInstallOptions &options,
                  std::vector<std::string> &stack,
                  ArduinoResolvedMap &out,
                  ArduinoBuildError *err);

  bool BuildArtifact(const ArduinoCatalogEntry &entry,
                     const ArduinoLibraryArchive &archive,
                     const std::vector<std::string> &depends,
                     const std::vector<std::string> &arches,
                     const ArduinoInstallOptions &options,
                     const ArduinoResolvedMap &resolved,
                     ArduinoResolvedArtifact &artifact,
                     ArduinoBuildError *err);

  bool WriteBuildProject(const std::string &libDir,
                         const std::vector<const ArduinoBoardProfile *> &scope,
                         const std::map<std::string, std::string> &depIncludes,
                         ArduinoBuildError *err);

  bool BuildForBoard(const std::string &libDir, const std::string &board, const std::string &archiveName);

  ArduinoLibraryCatalog &m_catalog;
  ArduinoArtifactCache &m_cache;
  ArduinoHttpClient &m_http;
  ArduinoProcessRunner &m_runner;
  const ArduinoBoardRegistry &m_boards;
  ArduinoToolchainOptions m_toolchain;
};

// "Adafruit GFX Library" -> "Adafruit_GFX_Library", used as -l<name>.
std::string LinkNameForLibrary(const std::string &name);

// Main file of the per-library build project; keeps the linker happy.
#define ACS_LIBRARY_STUB_MAIN "#include <Arduino.h>\nvoid setup() {}\nvoid loop() {}\n"
