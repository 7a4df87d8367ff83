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

#include "acs_boards.hpp"

#include "utils.hpp"
#include <utility>

static std::string NormalizeArchTarget(const std::string &s) {
  std::string resl = s;
  TrimInPlace(resl);
  return ToLower(resl);
}

std::string ArchitectureFromFqbn(const std::string &fqbn) {
  size_t p1 = fqbn.find(':');
  if (p1 == std::string::npos) {
    return std::string();
  }
  size_t p2 = fqbn.find(':', p1 + 1);
  if (p2 == std::string::npos) {
    // vendor:arch
    return NormalizeArchTarget(fqbn.substr(p1 + 1));
  }
  return NormalizeArchTarget(fqbn.substr(p1 + 1, p2 - (p1 + 1)));
}

bool IsUniversalArchitectureList(const std::vector<std::string> &architectures) {
  if (architectures.empty()) {
    return true; // missing/empty => compatible
  }
  for (const auto &raw : architectures) {
    std::string a = NormalizeArchTarget(raw);
    if (a == "*" || a == "all") {
      return true;
    }
  }
  return false;
}

static ArduinoBoardProfile MakeProfile(const char *fqbn, const char *board, const char *platform) {
  ArduinoBoardProfile p;
  p.fqbn = fqbn;
  p.board = board;
  p.platform = platform;
  p.architecture = ArchitectureFromFqbn(p.fqbn);
  return p;
}

ArduinoBoardRegistry::ArduinoBoardRegistry() {
  m_boards.push_back(MakeProfile("arduino:avr:uno", "uno", "atmelavr"));
  m_boards.push_back(MakeProfile("arduino:avr:nano", "nanoatmega328", "atmelavr"));
  m_boards.push_back(MakeProfile("arduino:avr:mega", "megaADK", "atmelavr"));
  m_boards.push_back(MakeProfile("arduino:esp32:nano_nora", "arduino_nano_esp32", "espressif32"));
}

ArduinoBoardRegistry::ArduinoBoardRegistry(std::vector<ArduinoBoardProfile> boards)
    : m_boards(std::move(boards)) {
  for (auto &b : m_boards) {
    if (b.architecture.empty()) {
      b.architecture = ArchitectureFromFqbn(b.fqbn);
    }
  }
}

const ArduinoBoardProfile *ArduinoBoardRegistry::FindByFqbn(const std::string &fqbn) const {
  for (const auto &b : m_boards) {
    if (b.fqbn == fqbn)
      return &b;
  }
  return nullptr;
}

std::vector<const ArduinoBoardProfile *> ArduinoBoardRegistry::BoardsForArchitectures(const std::vector<std::string> &architectures) const {
  std::vector<const ArduinoBoardProfile *> out;
  bool universal = IsUniversalArchitectureList(architectures);

  for (const auto &b : m_boards) {
    if (universal) {
      out.push_back(&b);
      continue;
    }
    for (const auto &raw : architectures) {
      if (NormalizeArchTarget(raw) == b.architecture) {
        out.push_back(&b);
        break;
      }
    }
  }
  return out;
}
