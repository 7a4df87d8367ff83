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

#include "acs_error.hpp"

bool SetBuildError(ArduinoBuildError *err, ArduinoBuildErrorKind kind, const std::string &message) {
  if (err) {
    err->kind = kind;
    err->message = message;
  }
  return false;
}

const char *BuildErrorKindName(ArduinoBuildErrorKind kind) {
  switch (kind) {
    case ArduinoBuildErrorKind::None:
      return "None";
    case ArduinoBuildErrorKind::NotFound:
      return "NotFound";
    case ArduinoBuildErrorKind::InstallFailure:
      return "InstallFailure";
    case ArduinoBuildErrorKind::OfflineSkip:
      return "OfflineSkip";
    case ArduinoBuildErrorKind::CompileError:
      return "CompileError";
    case ArduinoBuildErrorKind::InvalidInput:
      return "InvalidInput";
    case ArduinoBuildErrorKind::CyclicDependency:
      return "CyclicDependency";
    case ArduinoBuildErrorKind::Timeout:
      return "Timeout";
    case ArduinoBuildErrorKind::IoError:
      return "IoError";
  }
  return "Unknown";
}

int BuildErrorHttpStatus(ArduinoBuildErrorKind kind) {
  switch (kind) {
    case ArduinoBuildErrorKind::None:
    case ArduinoBuildErrorKind::OfflineSkip:
      return 200;
    case ArduinoBuildErrorKind::NotFound:
      return 404;
    case ArduinoBuildErrorKind::InvalidInput:
    case ArduinoBuildErrorKind::CyclicDependency:
      return 422;
    case ArduinoBuildErrorKind::Timeout:
      return 504;
    case ArduinoBuildErrorKind::InstallFailure:
    case ArduinoBuildErrorKind::CompileError:
    case ArduinoBuildErrorKind::IoError:
      return 500;
  }
  return 500;
}
