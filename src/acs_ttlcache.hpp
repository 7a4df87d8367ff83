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

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <utility>

// Bounded map whose entries expire ttl after insertion. When full, expired
// entries go first, then the oldest one. maxEntries == 0 or ttl <= 0 turns
// the cache off (Put() is a no-op).
template <typename K, typename V>
class ArduinoTtlCache {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using NowFunc = std::function<TimePoint()>;

  ArduinoTtlCache(size_t maxEntries, std::chrono::seconds ttl)
      : m_maxEntries(maxEntries), m_ttl(ttl), m_now([]() { return std::chrono::steady_clock::now(); }) {}

  // Tests replace the clock.
  void SetClock(NowFunc now) {
    std::lock_guard<std::mutex> lock(m_mtx);
    m_now = std::move(now);
  }

  bool Enabled() const { return m_maxEntries > 0 && m_ttl.count() > 0; }

  bool Get(const K &key, V &out) {
    std::lock_guard<std::mutex> lock(m_mtx);
    auto it = m_items.find(key);
    if (it == m_items.end()) {
      return false;
    }
    if (it->second.expires <= m_now()) {
      m_order.erase(it->second.pos);
      m_items.erase(it);
      return false;
    }
    out = it->second.value;
    return true;
  }

  bool Contains(const K &key) {
    V tmp;
    return Get(key, tmp);
  }

  void Put(const K &key, V value) {
    if (!Enabled()) {
      return;
    }

    std::lock_guard<std::mutex> lock(m_mtx);
    TimePoint now = m_now();

    auto it = m_items.find(key);
    if (it != m_items.end()) {
      m_order.erase(it->second.pos);
      m_items.erase(it);
    }

    if (m_items.size() >= m_maxEntries) {
      PurgeExpiredLocked(now);
    }
    while (m_items.size() >= m_maxEntries && !m_order.empty()) {
      m_items.erase(m_order.front());
      m_order.pop_front();
    }

    m_order.push_back(key);
    Item item{std::move(value), now + m_ttl, std::prev(m_order.end())};
    m_items.emplace(key, std::move(item));
  }

  void Erase(const K &key) {
    std::lock_guard<std::mutex> lock(m_mtx);
    auto it = m_items.find(key);
    if (it != m_items.end()) {
      m_order.erase(it->second.pos);
      m_items.erase(it);
    }
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(m_mtx);
    m_items.clear();
    m_order.clear();
  }

  size_t Size() {
    std::lock_guard<std::mutex> lock(m_mtx);
    PurgeExpiredLocked(m_now());
    return m_items.size();
  }

private:
  struct Item {
    V value;
    TimePoint expires;
    typename std::list<K>::iterator pos;
  };

  void PurgeExpiredLocked(TimePoint now) {
    for (auto it = m_order.begin(); it != m_order.end();) {
      auto found = m_items.find(*it);
      if (found != m_items.end() && found->second.expires <= now) {
        m_items.erase(found);
        it = m_order.erase(it);
      } else {
        ++it;
      }
    }
  }

  size_t m_maxEntries;
  std::chrono::seconds m_ttl;
  NowFunc m_now;

  std::mutex m_mtx;
  std::map<K, Item> m_items;
  std::list<K> m_order; // insertion order, oldest first
};
