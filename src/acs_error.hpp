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

#include <string>

enum class ArduinoBuildErrorKind {
  None,
  NotFound,         // unknown library name or version
  InstallFailure,   // toolchain failed while building a library
  OfflineSkip,      // no connectivity, install skipped
  CompileError,     // final sketch compile failed
  InvalidInput,     // bad library name / version / board
  CyclicDependency, // library depends on itself (transitively)
  Timeout,          // external process or network call exceeded its deadline
  IoError           // filesystem, archive or manifest problem
};

struct ArduinoBuildError {
  ArduinoBuildErrorKind kind = ArduinoBuildErrorKind::None;
  std::string message;

  bool IsSet() const { return kind != ArduinoBuildErrorKind::None; }
  void Clear() {
    kind = ArduinoBuildErrorKind::None;
    message.clear();
  }
};

// Fills *err (when not null) and returns false, so callers can write
// "return SetBuildError(err, ...);"
bool SetBuildError(ArduinoBuildError *err, ArduinoBuildErrorKind kind, const std::string &message);

const char *BuildErrorKindName(ArduinoBuildErrorKind kind);

// Status code handed to the HTTP layer.
int BuildErrorHttpStatus(ArduinoBuildErrorKind kind);
