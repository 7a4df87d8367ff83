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

#include "acs_compiler.hpp"

#include "acs_artifact.hpp"
#include "acs_boards.hpp"
#include "acs_process.hpp"
#include "acs_slots.hpp"
#include "utils.hpp"
#include <filesystem>
#include <wx/base64.h>

namespace fs = std::filesystem;

static const char *const kFirmwareFiles[] = {"firmware.hex", "firmware.uf2", "firmware.bin"};

ArduinoSketchCompiler::ArduinoSketchCompiler(ArduinoProcessRunner &runner, const ArduinoArtifactCache &cache, const ArduinoToolchainOptions &toolchain)
    : m_runner(runner), m_cache(cache), m_toolchain(toolchain) {
}

std::string ArduinoSketchCompiler::BuildJobConfig(const ArduinoBoardProfile &board, const ArduinoResolvedMap &resolved) const {
  std::string includes;
  std::string links;

  for (const auto &kv : resolved) {
    const ArduinoResolvedArtifact &a = kv.second;
    auto it = a.perArchitecture.find(board.board);
    if (it == a.perArchitecture.end()) {
      APP_DEBUG_LOG("COMPILE: %s has no build for %s", a.Key().c_str(), board.board.c_str());
      continue;
    }
    includes += m_cache.ExpandPaths(it->second.includeFlags);
    links += m_cache.ExpandPaths(it->second.libraryDirs);
  }

  std::string ini;
  ini += "[env:" + board.board + "]\n";
  ini += "build_flags = -w " + includes + links + "\n";
  return ini;
}

bool ArduinoSketchCompiler::ReadFirmware(const std::string &outputDir, ArduinoFirmware &out) const {
  for (const char *name : kFirmwareFiles) {
    std::string path = outputDir + "/" + name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      continue;
    }

    std::string data;
    if (!LoadFileToString(path, data)) {
      wxLogWarning(wxT("Cannot read %s"), wxString::FromUTF8(path));
      continue;
    }

    out.fileName = name;
    if (hasSuffix(path, ".hex")) {
      out.encoding = ArduinoFirmwareEncoding::Hex;
      out.data = std::move(data);
    } else {
      out.encoding = ArduinoFirmwareEncoding::Base64;
      out.data = wxToStd(wxBase64Encode(data.data(), data.size()));
    }
    return true;
  }
  return false;
}

bool ArduinoSketchCompiler::Compile(const ArduinoCompileJob &job,
                                    const ArduinoBoardProfile &board,
                                    const ArduinoBuildSlot &slot,
                                    const ArduinoResolvedMap &resolved,
                                    ArduinoFirmware &out,
                                    ArduinoBuildError *err) {
  ScopeTimer t("COMPILE: slot %d, board %s, %zu libraries", slot.id, board.board.c_str(), resolved.size());

  out = ArduinoFirmware{};

  std::error_code ec;
  fs::create_directories(slot.sourceDir, ec);
  if (ec) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot create " + slot.sourceDir + ": " + ec.message());
  }

  const std::string mainPath = slot.sourceDir + "/main.cpp";
  if (!SaveFileFromString(mainPath, ACS_SKETCH_PRELUDE + job.sourceCode)) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + mainPath);
  }

  if (!SaveFileFromString(slot.jobConfigPath, BuildJobConfig(board, resolved))) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + slot.jobConfigPath);
  }

  // stale outputs of the previous job on this slot
  const std::string outputDir = slot.buildDir + "/" + board.board;
  for (const char *name : kFirmwareFiles) {
    fs::remove(outputDir + "/" + name, ec);
  }

  std::vector<std::string> argv = ToolchainRunArgv(m_toolchain.command, board.board, m_toolchain.threads);

  ArduinoProcessResult res;
  if (!m_runner.Run(argv, slot.rootDir, m_toolchain.timeoutSec, res)) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot start " + JoinCommandLine(argv));
  }

  if (res.timedOut) {
    wxLogWarning(wxT("Compilation on slot %d timed out after %d s"), slot.id, m_toolchain.timeoutSec);
    return SetBuildError(err, ArduinoBuildErrorKind::Timeout,
                         "Compilation timed out after " + std::to_string(m_toolchain.timeoutSec) + " s");
  }

  if (res.exitCode != 0) {
    wxLogWarning(wxT("Compilation failed: %s"), wxString::FromUTF8(res.CombinedOutput()));
    return SetBuildError(err, ArduinoBuildErrorKind::CompileError, res.CombinedOutput());
  }

  if (!ReadFirmware(outputDir, out)) {
    return SetBuildError(err, ArduinoBuildErrorKind::CompileError, "Toolchain succeeded but produced no firmware image in " + outputDir);
  }

  APP_DEBUG_LOG("COMPILE: %s, %zu bytes", out.fileName.c_str(), out.data.size());
  return true;
}
