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

#include "acs_settings.hpp"
#include <wx/app.h>
#include <wx/arrstr.h>
#include <wx/cmdline.h>

class ArduinoCompileService;
class ArduinoDependencyInstaller;
class ArduinoLibraryCatalog;
class ArduinoBoardRegistry;

class ArduinoCompileServerApp : public wxAppConsole {
private:
  ArduinoServiceSettings m_settings;
  wxString m_configPath = wxT("acs.ini");
  wxString m_command;
  wxArrayString m_args;
  wxString m_board;

  bool LoadSettings();

  int RunRefresh(ArduinoLibraryCatalog &catalog);
  int RunInstall(ArduinoLibraryCatalog &catalog, ArduinoDependencyInstaller &installer, const ArduinoBoardRegistry &boards);
  int RunCompile(ArduinoLibraryCatalog &catalog, ArduinoCompileService &service);

public:
  virtual void OnInitCmdLine(wxCmdLineParser &parser) override;
  virtual bool OnCmdLineParsed(wxCmdLineParser &parser) override;
  virtual bool OnInit() override;
  virtual int OnRun() override;
};

wxDECLARE_APP(ArduinoCompileServerApp);
