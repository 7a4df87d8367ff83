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
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ArduinoBoardRegistry;
class ArduinoBuildSlotPool;

struct ArduinoBuildSlot {
  int id = 0;
  std::string rootDir;       // <slots>/slot-<id>
  std::string sourceDir;     // <root>/src
  std::string buildDir;      // <root>/.pio/build
  std::string configPath;    // <root>/platformio.ini (provisioned once)
  std::string jobConfigPath; // <root>/job.ini (rewritten per job)
  bool busy = false;
};

// Holds one slot; gives it back to the pool when destroyed.
class ArduinoBuildSlotLease {
public:
  ArduinoBuildSlotLease() = default;
  ArduinoBuildSlotLease(ArduinoBuildSlotPool *pool, ArduinoBuildSlot *slot) : m_pool(pool), m_slot(slot) {}
  ~ArduinoBuildSlotLease() { Release(); }

  ArduinoBuildSlotLease(const ArduinoBuildSlotLease &) = delete;
  ArduinoBuildSlotLease &operator=(const ArduinoBuildSlotLease &) = delete;

  ArduinoBuildSlotLease(ArduinoBuildSlotLease &&other) noexcept;
  ArduinoBuildSlotLease &operator=(ArduinoBuildSlotLease &&other) noexcept;

  ArduinoBuildSlot *Get() const { return m_slot; }
  ArduinoBuildSlot *operator->() const { return m_slot; }
  explicit operator bool() const { return m_slot != nullptr; }

  void Release();

private:
  ArduinoBuildSlotPool *m_pool = nullptr;
  ArduinoBuildSlot *m_slot = nullptr;
};

// Fixed set of working directories for the final compile. Acquire() blocks
// until a slot is free; waiters are served in arrival order.
class ArduinoBuildSlotPool {
public:
  ArduinoBuildSlotPool(const std::string &slotsDir, int size, const ArduinoBoardRegistry &boards);

  ArduinoBuildSlotPool(const ArduinoBuildSlotPool &) = delete;
  ArduinoBuildSlotPool &operator=(const ArduinoBuildSlotPool &) = delete;

  // Creates the slot directories and their platformio.ini.
  bool Provision(ArduinoBuildError *err);

  ArduinoBuildSlotLease Acquire();
  void Release(ArduinoBuildSlot *slot);

  int GetSize() const { return (int)m_slots.size(); }
  int GetBusyCount() const;
  int GetWaitingCount() const;

private:
  std::string SlotConfigTemplate() const;

  std::string m_slotsDir;
  const ArduinoBoardRegistry &m_boards;
  std::vector<std::unique_ptr<ArduinoBuildSlot>> m_slots;

  mutable std::mutex m_mtx;
  std::condition_variable m_cv;
  std::deque<ArduinoBuildSlot *> m_free;
  uint64_t m_nextTicket = 0;
  uint64_t m_serving = 0;
};
