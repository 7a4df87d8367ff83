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

#include "acs_service.hpp"

#include "acs_boards.hpp"
#include "acs_installer.hpp"
#include "acs_slots.hpp"
#include "utils.hpp"
#include <cinttypes>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ArduinoCompileService::ArduinoCompileService(const ArduinoBoardRegistry &boards,
                                             ArduinoDependencyInstaller &installer,
                                             ArduinoBuildSlotPool &pool,
                                             ArduinoSketchCompiler &compiler,
                                             size_t maxCachedResults,
                                             int resultCacheDurationSec)
    : m_boards(boards),
      m_installer(installer),
      m_pool(pool),
      m_compiler(compiler),
      m_results(maxCachedResults, std::chrono::seconds(resultCacheDurationSec)) {
}

bool ArduinoCompileService::ParseRequest(const std::string &jsonText, ArduinoCompileJob &job, ArduinoBuildError *err) {
  job = ArduinoCompileJob{};

  json j;
  try {
    j = json::parse(jsonText);
  } catch (const std::exception &e) {
    return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, std::string("Invalid request JSON: ") + e.what());
  }

  if (!j.is_object()) {
    return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Request must be a JSON object.");
  }

  if (!j.contains("source_code") || !j["source_code"].is_string()) {
    return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Request has no 'source_code' string.");
  }
  if (!j.contains("board") || !j["board"].is_string()) {
    return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Request has no 'board' string.");
  }

  job.sourceCode = j["source_code"].get<std::string>();
  job.fqbn = j["board"].get<std::string>();

  if (j.contains("libraries")) {
    if (!j["libraries"].is_array()) {
      return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "'libraries' must be an array of strings.");
    }

    std::vector<std::string> texts;
    for (const auto &l : j["libraries"]) {
      if (!l.is_string()) {
        return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "'libraries' must be an array of strings.");
      }
      texts.push_back(l.get<std::string>());
    }

    if (!ParseLibraryRequests(texts, job.libraries, err)) {
      return false;
    }
  }

  return true;
}

static std::string StripSpacesAndNewlines(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c != ' ' && c != '\n') {
      out.push_back(c);
    }
  }
  return out;
}

std::string ArduinoCompileService::CacheKey(const ArduinoCompileJob &job) {
  std::string text = StripSpacesAndNewlines(job.sourceCode);
  text.push_back('\x1f');
  text += job.fqbn;
  for (const auto &l : job.libraries) {
    text.push_back('\x1f');
    text += StripSpacesAndNewlines(l.ToString());
  }

  uint64_t h = Fnv1a64(reinterpret_cast<const uint8_t *>(text.data()), text.size());

  char buf[32];
  snprintf(buf, sizeof(buf), "%016" PRIx64, h);
  return buf;
}

bool ArduinoCompileService::Compile(const ArduinoCompileJob &job, ArduinoFirmware &out, ArduinoBuildError *err) {
  const ArduinoBoardProfile *board = m_boards.FindByFqbn(job.fqbn);
  if (!board) {
    return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Unsupported board '" + job.fqbn + "'");
  }

  for (const auto &l : job.libraries) {
    if (!IsSafeLibraryName(l.name) || (l.HasVersion() && !IsSafeLibraryVersion(l.version))) {
      return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Invalid library request '" + l.ToString() + "'");
    }
  }

  const std::string key = CacheKey(job);
  if (m_results.Get(key, out)) {
    m_cacheHits++;
    APP_DEBUG_LOG("SERVICE: result cache hit %s", key.c_str());
    return true;
  }

  ScopeTimer t("SERVICE: compile %s for %s", key.c_str(), board->board.c_str());

  // library builds run the toolchain too, so they count against the slot limit
  ArduinoBuildSlotLease lease = m_pool.Acquire();

  ArduinoResolvedMap resolved;
  ArduinoBuildError installErr;
  ArduinoInstallOptions options;
  options.targetBoard = board->board;

  if (!m_installer.Install(job.libraries, options, resolved, &installErr)) {
    if (err) {
      *err = installErr;
    }
    return false;
  }
  if (installErr.kind == ArduinoBuildErrorKind::OfflineSkip) {
    wxLogWarning(wxT("Compiling without library install: %s"), wxString::FromUTF8(installErr.message));
  }

  if (!m_compiler.Compile(job, *board, *lease.Get(), resolved, out, err)) {
    return false;
  }
  lease.Release();

  m_results.Put(key, out);
  return true;
}

std::string ArduinoCompileService::FirmwareToJson(const ArduinoFirmware &firmware) {
  json j;
  if (firmware.encoding == ArduinoFirmwareEncoding::Hex) {
    j["hex"] = firmware.data;
  } else {
    j["sketch"] = firmware.data;
  }
  return j.dump();
}

std::string ArduinoCompileService::ErrorToJson(const ArduinoBuildError &error) {
  json j;
  j["detail"] = error.message;
  j["kind"] = BuildErrorKindName(error.kind);
  return j.dump();
}

std::string ArduinoCompileService::HandleRequest(const std::string &requestJson, int &status) {
  ArduinoCompileJob job;
  ArduinoBuildError err;

  if (!ParseRequest(requestJson, job, &err)) {
    status = BuildErrorHttpStatus(err.kind);
    return ErrorToJson(err);
  }

  ArduinoFirmware firmware;
  if (!Compile(job, firmware, &err)) {
    status = BuildErrorHttpStatus(err.kind);
    return ErrorToJson(err);
  }

  status = 200;
  return FirmwareToJson(firmware);
}
