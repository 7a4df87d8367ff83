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

#include "acs_settings.hpp"

static void ConfigReadString(wxConfigBase *cfg, const wxString &key, wxString &value, const wxString &defValue) {
  wxString v;
  if (cfg->Read(key, &v)) {
    if (v.IsEmpty()) {
      value = defValue;
    } else {
      value = v;
    }
  } else {
    value = defValue;
  }
}

static void ConfigReadInt(wxConfigBase *cfg, const wxString &key, int &value, int defValue, int minValue = 0) {
  long lw;
  if (cfg->Read(key, &lw)) {
    value = (int)lw;
  } else {
    value = defValue;
  }
  if (value < minValue) {
    value = minValue;
  }
}

void ArduinoServiceSettings::Load(wxConfigBase *cfg) {
  ConfigReadString(cfg, wxT("Paths/LibrariesDir"), librariesDir, wxT("./arduino-libs"));
  ConfigReadString(cfg, wxT("Paths/SlotsDir"), slotsDir, wxT("./compiles"));

  ConfigReadString(cfg, wxT("Build/ToolchainCommand"), toolchainCommand, wxT("platformio"));
  ConfigReadInt(cfg, wxT("Build/ThreadsPerCompile"), threadsPerCompile, 1, 1);
  ConfigReadInt(cfg, wxT("Build/MaxConcurrentTasks"), maxConcurrentTasks, 10, 1);
  ConfigReadInt(cfg, wxT("Build/CompileTimeout"), compileTimeout, 300);
  ConfigReadInt(cfg, wxT("Build/LibraryCompileTimeout"), libraryCompileTimeout, 600);

  ConfigReadInt(cfg, wxT("Cache/MaxCodeCaches"), maxCodeCaches, 100);
  ConfigReadInt(cfg, wxT("Cache/CodeCacheDuration"), codeCacheDuration, 3600);
  ConfigReadInt(cfg, wxT("Cache/MaxLibraryCaches"), maxLibraryCaches, 50);
  ConfigReadInt(cfg, wxT("Cache/LibraryCacheDuration"), libraryCacheDuration, 24 * 3600);

  ConfigReadString(cfg, wxT("Catalog/IndexUrl"), indexUrl, wxT(ACS_DEFAULT_INDEX_URL));
  ConfigReadInt(cfg, wxT("Catalog/RefreshInterval"), indexRefreshInterval, 3600);

  ConfigReadInt(cfg, wxT("Network/ConnectTimeout"), connectTimeout, 10);
  ConfigReadInt(cfg, wxT("Network/RequestTimeout"), requestTimeout, 120);
  ConfigReadString(cfg, wxT("Network/ProbeUrl"), probeUrl, wxT(ACS_DEFAULT_PROBE_URL));
}

void ArduinoServiceSettings::Save(wxConfigBase *cfg) const {
  cfg->Write(wxT("Paths/LibrariesDir"), librariesDir);
  cfg->Write(wxT("Paths/SlotsDir"), slotsDir);
  cfg->Write(wxT("Build/ToolchainCommand"), toolchainCommand);
  cfg->Write(wxT("Build/ThreadsPerCompile"), threadsPerCompile);
  cfg->Write(wxT("Build/MaxConcurrentTasks"), maxConcurrentTasks);
  cfg->Write(wxT("Build/CompileTimeout"), compileTimeout);
  cfg->Write(wxT("Build/LibraryCompileTimeout"), libraryCompileTimeout);
  cfg->Write(wxT("Cache/MaxCodeCaches"), maxCodeCaches);
  cfg->Write(wxT("Cache/CodeCacheDuration"), codeCacheDuration);
  cfg->Write(wxT("Cache/MaxLibraryCaches"), maxLibraryCaches);
  cfg->Write(wxT("Cache/LibraryCacheDuration"), libraryCacheDuration);
  cfg->Write(wxT("Catalog/IndexUrl"), indexUrl);
  cfg->Write(wxT("Catalog/RefreshInterval"), indexRefreshInterval);
  cfg->Write(wxT("Network/ConnectTimeout"), connectTimeout);
  cfg->Write(wxT("Network/RequestTimeout"), requestTimeout);
  cfg->Write(wxT("Network/ProbeUrl"), probeUrl);
  cfg->Flush();
}
