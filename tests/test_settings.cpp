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
#include <gtest/gtest.h>
#include <wx/fileconf.h>
#include <wx/memconf.h>
#include <wx/sstream.h>

TEST(SettingsTest, EmptyConfigGivesDefaults) {
  wxMemoryConfig cfg;
  ArduinoServiceSettings s;
  s.Load(&cfg);

  EXPECT_EQ(s.librariesDir, wxT("./arduino-libs"));
  EXPECT_EQ(s.slotsDir, wxT("./compiles"));
  EXPECT_EQ(s.toolchainCommand, wxT("platformio"));
  EXPECT_EQ(s.maxConcurrentTasks, 10);
  EXPECT_EQ(s.maxCodeCaches, 100);
  EXPECT_EQ(s.codeCacheDuration, 3600);
  EXPECT_EQ(s.maxLibraryCaches, 50);
  EXPECT_EQ(s.libraryCacheDuration, 24 * 3600);
  EXPECT_EQ(s.indexUrl, wxT(ACS_DEFAULT_INDEX_URL));
  EXPECT_EQ(s.indexRefreshInterval, 3600);
}

TEST(SettingsTest, ReadsIniFile) {
  wxStringInputStream in(wxT("[Paths]\n"
                             "LibrariesDir=/var/lib/acs/libs\n"
                             "SlotsDir=\n"
                             "[Build]\n"
                             "ToolchainCommand=python3 -m platformio\n"
                             "MaxConcurrentTasks=0\n"
                             "CompileTimeout=45\n"
                             "[Cache]\n"
                             "MaxCodeCaches=0\n"
                             "[Catalog]\n"
                             "RefreshInterval=0\n"));
  wxFileConfig cfg(in);

  ArduinoServiceSettings s;
  s.Load(&cfg);

  EXPECT_EQ(s.librariesDir, wxT("/var/lib/acs/libs"));
  EXPECT_EQ(s.slotsDir, wxT("./compiles")); // empty value falls back
  EXPECT_EQ(s.toolchainCommand, wxT("python3 -m platformio"));
  EXPECT_EQ(s.maxConcurrentTasks, 1);       // at least one slot
  EXPECT_EQ(s.compileTimeout, 45);
  EXPECT_EQ(s.maxCodeCaches, 0);
  EXPECT_EQ(s.indexRefreshInterval, 0);
  EXPECT_EQ(s.libraryCompileTimeout, 600);
}

TEST(SettingsTest, SaveThenLoad) {
  ArduinoServiceSettings s;
  s.librariesDir = wxT("/srv/libs");
  s.threadsPerCompile = 4;
  s.maxConcurrentTasks = 3;
  s.codeCacheDuration = 60;
  s.probeUrl = wxT("https://probe.example.test");

  wxMemoryConfig cfg;
  s.Save(&cfg);

  ArduinoServiceSettings loaded;
  loaded.Load(&cfg);
  EXPECT_EQ(loaded.librariesDir, wxT("/srv/libs"));
  EXPECT_EQ(loaded.threadsPerCompile, 4);
  EXPECT_EQ(loaded.maxConcurrentTasks, 3);
  EXPECT_EQ(loaded.codeCacheDuration, 60);
  EXPECT_EQ(loaded.probeUrl, wxT("https://probe.example.test"));
}
