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

#include "acs_slots.hpp"

#include "acs_boards.hpp"
#include "utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

ArduinoBuildSlotLease::ArduinoBuildSlotLease(ArduinoBuildSlotLease &&other) noexcept
    : m_pool(other.m_pool), m_slot(other.m_slot) {
  other.m_pool = nullptr;
  other.m_slot = nullptr;
}

ArduinoBuildSlotLease &ArduinoBuildSlotLease::operator=(ArduinoBuildSlotLease &&other) noexcept {
  if (this != &other) {
    Release();
    m_pool = other.m_pool;
    m_slot = other.m_slot;
    other.m_pool = nullptr;
    other.m_slot = nullptr;
  }
  return *this;
}

void ArduinoBuildSlotLease::Release() {
  if (m_pool && m_slot) {
    m_pool->Release(m_slot);
  }
  m_pool = nullptr;
  m_slot = nullptr;
}

ArduinoBuildSlotPool::ArduinoBuildSlotPool(const std::string &slotsDir, int size, const ArduinoBoardRegistry &boards)
    : m_slotsDir(slotsDir), m_boards(boards) {
  if (size < 1) {
    size = 1;
  }

  std::error_code ec;
  fs::path base = fs::absolute(fs::path(slotsDir), ec);
  if (ec) {
    base = fs::path(slotsDir);
  }

  for (int i = 0; i < size; i++) {
    auto slot = std::make_unique<ArduinoBuildSlot>();
    fs::path root = base / ("slot-" + std::to_string(i));
    slot->id = i;
    slot->rootDir = root.string();
    slot->sourceDir = (root / "src").string();
    slot->buildDir = (root / ".pio" / "build").string();
    slot->configPath = (root / "platformio.ini").string();
    slot->jobConfigPath = (root / "job.ini").string();

    m_free.push_back(slot.get());
    m_slots.push_back(std::move(slot));
  }
}

std::string ArduinoBuildSlotPool::SlotConfigTemplate() const {
  std::string ini;
  ini += "[platformio]\n";
  ini += "extra_configs = job.ini\n";

  for (const auto &b : m_boards.GetBoards()) {
    ini += "\n[env:" + b.board + "]\n";
    ini += "platform = " + b.platform + "\n";
    ini += "board = " + b.board + "\n";
    ini += "framework = arduino\n";
  }
  return ini;
}

bool ArduinoBuildSlotPool::Provision(ArduinoBuildError *err) {
  ScopeTimer t("SLOTS: Provision(%d)", GetSize());

  const std::string ini = SlotConfigTemplate();

  for (const auto &slot : m_slots) {
    std::error_code ec;
    fs::create_directories(slot->sourceDir, ec);
    if (!ec) {
      fs::create_directories(slot->buildDir, ec);
    }
    if (ec) {
      return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot create build slot " + slot->rootDir + ": " + ec.message());
    }

    if (!SaveFileFromString(slot->configPath, ini)) {
      return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + slot->configPath);
    }

    if (!fs::exists(slot->jobConfigPath, ec) && !SaveFileFromString(slot->jobConfigPath, "")) {
      return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + slot->jobConfigPath);
    }
  }

  APP_DEBUG_LOG("SLOTS: %d slots ready in %s", GetSize(), m_slotsDir.c_str());
  return true;
}

ArduinoBuildSlotLease ArduinoBuildSlotPool::Acquire() {
  std::unique_lock<std::mutex> lock(m_mtx);

  const uint64_t ticket = m_nextTicket++;
  m_cv.wait(lock, [this, ticket]() { return ticket == m_serving && !m_free.empty(); });

  ArduinoBuildSlot *slot = m_free.front();
  m_free.pop_front();
  slot->busy = true;
  m_serving++;

  APP_TRACE_LOG("SLOTS: ticket %llu got slot %d", (unsigned long long)ticket, slot->id);

  // the next ticket may already have a free slot
  lock.unlock();
  m_cv.notify_all();

  return ArduinoBuildSlotLease(this, slot);
}

void ArduinoBuildSlotPool::Release(ArduinoBuildSlot *slot) {
  if (!slot) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(m_mtx);
    if (!slot->busy) {
      wxLogWarning(wxT("Build slot %d released twice"), slot->id);
      return;
    }
    slot->busy = false;
    m_free.push_back(slot);
  }

  APP_TRACE_LOG("SLOTS: slot %d released", slot->id);
  m_cv.notify_all();
}

int ArduinoBuildSlotPool::GetBusyCount() const {
  std::lock_guard<std::mutex> lock(m_mtx);
  return GetSize() - (int)m_free.size();
}

int ArduinoBuildSlotPool::GetWaitingCount() const {
  std::lock_guard<std::mutex> lock(m_mtx);
  return (int)(m_nextTicket - m_serving);
}
