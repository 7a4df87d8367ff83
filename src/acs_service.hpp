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

#include "acs_compiler.hpp"
#include "acs_error.hpp"
#include "acs_ttlcache.hpp"
#include <atomic>
#include <string>

class ArduinoBoardRegistry;
class ArduinoBuildSlotPool;
class ArduinoDependencyInstaller;

// What the HTTP layer (or the console front end) calls for one request.
class ArduinoCompileService {
public:
  ArduinoCompileService(const ArduinoBoardRegistry &boards,
                        ArduinoDependencyInstaller &installer,
                        ArduinoBuildSlotPool &pool,
                        ArduinoSketchCompiler &compiler,
                        size_t maxCachedResults,
                        int resultCacheDurationSec);

  // {"source_code": "...", "board": "arduino:avr:uno", "libraries": ["Servo", ...]}
  static bool ParseRequest(const std::string &jsonText, ArduinoCompileJob &job, ArduinoBuildError *err);

  // Hash of the request with spaces and newlines removed.
  static std::string CacheKey(const ArduinoCompileJob &job);

  bool Compile(const ArduinoCompileJob &job, ArduinoFirmware &out, ArduinoBuildError *err);

  // Full request -> response JSON; status receives the HTTP-like status.
  std::string HandleRequest(const std::string &requestJson, int &status);

  static std::string FirmwareToJson(const ArduinoFirmware &firmware);
  static std::string ErrorToJson(const ArduinoBuildError &error);

  unsigned int GetCacheHits() const { return m_cacheHits.load(); }

private:
  const ArduinoBoardRegistry &m_boards;
  ArduinoDependencyInstaller &m_installer;
  ArduinoBuildSlotPool &m_pool;
  ArduinoSketchCompiler &m_compiler;

  ArduinoTtlCache<std::string, ArduinoFirmware> m_results;
  std::atomic<unsigned int> m_cacheHits{0};
};
