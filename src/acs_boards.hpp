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
#include <vector>

struct ArduinoBoardProfile {
  std::string fqbn;         // "arduino:avr:uno"
  std::string board;        // PlatformIO board id, e.g. "uno"
  std::string platform;     // PlatformIO platform, e.g. "atmelavr"
  std::string architecture; // second fqbn segment, e.g. "avr"
};

class ArduinoBoardRegistry {
public:
  // Boards the service compiles for.
  ArduinoBoardRegistry();
  explicit ArduinoBoardRegistry(std::vector<ArduinoBoardProfile> boards);

  const std::vector<ArduinoBoardProfile> &GetBoards() const { return m_boards; }

  const ArduinoBoardProfile *FindByFqbn(const std::string &fqbn) const;

  // Boards whose architecture is listed in "architectures" (or all for "*").
  std::vector<const ArduinoBoardProfile *> BoardsForArchitectures(const std::vector<std::string> &architectures) const;

private:
  std::vector<ArduinoBoardProfile> m_boards;
};

// arduino:avr:nano:cpu=atmega328old -> avr
std::string ArchitectureFromFqbn(const std::string &fqbn);

// Empty list, "*" or "all" means universal.
bool IsUniversalArchitectureList(const std::vector<std::string> &architectures);
