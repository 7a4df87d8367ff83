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

#include <wx/config.h>
#include <wx/string.h>

#define ACS_DEFAULT_INDEX_URL "https://downloads.arduino.cc/libraries/library_index.json"
#define ACS_DEFAULT_PROBE_URL "https://downloads.arduino.cc"

struct ArduinoServiceSettings {
  // paths
  wxString librariesDir = wxT("./arduino-libs"); // installed name@version trees
  wxString slotsDir = wxT("./compiles");         // build slot working directories

  // toolchain
  wxString toolchainCommand = wxT("platformio");
  int threadsPerCompile = 1;
  int maxConcurrentTasks = 10;   // number of build slots
  int compileTimeout = 300;      // in seconds (0 = no limit)
  int libraryCompileTimeout = 600;

  // caches
  int maxCodeCaches = 100;
  int codeCacheDuration = 3600;
  int maxLibraryCaches = 50;
  int libraryCacheDuration = 24 * 3600;

  // library index
  wxString indexUrl = wxT(ACS_DEFAULT_INDEX_URL);
  int indexRefreshInterval = 3600; // 0 disables refresh

  // network
  int connectTimeout = 10;
  int requestTimeout = 120;
  wxString probeUrl = wxT(ACS_DEFAULT_PROBE_URL);

  void Load(wxConfigBase *cfg);
  void Save(wxConfigBase *cfg) const;
};
