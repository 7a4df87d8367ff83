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

#include "acs_ttlcache.hpp"
#include "fakes.hpp"
#include "utils.hpp"
#include <filesystem>
#include <gtest/gtest.h>

namespace fs = std::filesystem;

TEST(CompareVersions, NumericPartsNotLexical) {
  EXPECT_LT(CompareVersions("1.2.0", "1.10.0"), 0);
  EXPECT_GT(CompareVersions("2.0.0", "1.10.0"), 0);
  EXPECT_EQ(CompareVersions("1.0", "1.0.0"), 0);
  EXPECT_LT(CompareVersions("1.3.1-beta", "1.3.2"), 0);
}

TEST(StripVersionSuffix, KeepsDigitsAndDots) {
  EXPECT_EQ(StripVersionSuffix("1.3.1-beta"), "1.3.1");
  EXPECT_EQ(StripVersionSuffix("v2.0.0"), "2.0.0");
  EXPECT_EQ(StripVersionSuffix("1.0.0-rc.2"), "1.0.0.2");
}

TEST(SplitCsv, TrimsAndDropsEmptyItems) {
  auto parts = SplitCsv(" LibA , LibB,,LibC ");
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "LibA");
  EXPECT_EQ(parts[1], "LibB");
  EXPECT_EQ(parts[2], "LibC");
}

TEST(TrimInPlace, NonAsciiBytesAreKept) {
  std::string s = " \t\xC3\xA9l\xC3\xA9ment\xE2\x84\xA2 \n";
  TrimInPlace(s);
  EXPECT_EQ(s, "\xC3\xA9l\xC3\xA9ment\xE2\x84\xA2");

  std::string high = "\xFF\xA0";
  TrimInPlace(high);
  EXPECT_EQ(high, "\xFF\xA0");
}

TEST(SaveFileAtomically, ReplacesContentWithoutLeftovers) {
  TestTempDir dir;
  std::string path = dir.Sub("manifest.json");

  ASSERT_TRUE(SaveFileAtomically(path, "first"));
  ASSERT_TRUE(SaveFileAtomically(path, "second"));

  std::string content;
  ASSERT_TRUE(LoadFileToString(path, content));
  EXPECT_EQ(content, "second");

  int files = 0;
  for (const auto &e : fs::directory_iterator(dir.Path())) {
    (void)e;
    files++;
  }
  EXPECT_EQ(files, 1);
}

TEST(TtlCache, EntriesExpire) {
  auto now = std::chrono::steady_clock::now();
  ArduinoTtlCache<std::string, int> cache(10, std::chrono::seconds(60));
  cache.SetClock([&now]() { return now; });

  cache.Put("a", 1);
  int v = 0;
  ASSERT_TRUE(cache.Get("a", v));
  EXPECT_EQ(v, 1);

  now += std::chrono::seconds(61);
  EXPECT_FALSE(cache.Get("a", v));
  EXPECT_EQ(cache.Size(), 0u);
}

TEST(TtlCache, OldestEntryEvictedWhenFull) {
  ArduinoTtlCache<std::string, int> cache(2, std::chrono::seconds(60));
  cache.Put("a", 1);
  cache.Put("b", 2);
  cache.Put("c", 3);

  EXPECT_FALSE(cache.Contains("a"));
  EXPECT_TRUE(cache.Contains("b"));
  EXPECT_TRUE(cache.Contains("c"));
  EXPECT_EQ(cache.Size(), 2u);
}

TEST(TtlCache, ZeroSizeDisablesCache) {
  ArduinoTtlCache<std::string, int> cache(0, std::chrono::seconds(60));
  cache.Put("a", 1);
  EXPECT_FALSE(cache.Contains("a"));
}
