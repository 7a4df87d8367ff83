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
#include "acs_installer.hpp"
#include "acs_library.hpp"
#include <string>
#include <vector>

class ArduinoArtifactCache;
class ArduinoProcessRunner;
struct ArduinoBoardProfile;
struct ArduinoBuildSlot;

struct ArduinoCompileJob {
  std::string sourceCode;
  std::string fqbn;
  std::vector<ArduinoLibraryRequest> libraries;
};

enum class ArduinoFirmwareEncoding {
  Hex,   // Intel HEX text, returned as is
  Base64 // binary image (uf2 / bin)
};

struct ArduinoFirmware {
  std::string data;
  ArduinoFirmwareEncoding encoding = ArduinoFirmwareEncoding::Hex;
  std::string fileName; // firmware.hex / firmware.uf2 / firmware.bin
};

// Runs the final PlatformIO build of one sketch inside a build slot.
class ArduinoSketchCompiler {
public:
  ArduinoSketchCompiler(ArduinoProcessRunner &runner, const ArduinoArtifactCache &cache, const ArduinoToolchainOptions &toolchain);

  bool Compile(const ArduinoCompileJob &job,
               const ArduinoBoardProfile &board,
               const ArduinoBuildSlot &slot,
               const ArduinoResolvedMap &resolved,
               ArduinoFirmware &out,
               ArduinoBuildError *err);

  // Contents of job.ini for the board, with manifest paths made absolute.
  std::string BuildJobConfig(const ArduinoBoardProfile &board, const ArduinoResolvedMap &resolved) const;

private:
  bool ReadFirmware(const std::string &outputDir, ArduinoFirmware &out) const;

  ArduinoProcessRunner &m_runner;
  const ArduinoArtifactCache &m_cache;
  ArduinoToolchainOptions m_toolchain;
};

#define ACS_SKETCH_PRELUDE "#include <Arduino.h>\n"
