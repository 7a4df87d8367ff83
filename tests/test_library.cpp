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

#include "acs_library.hpp"
#include <gtest/gtest.h>

TEST(LibraryRequest, ParsesNameAndVersion) {
  ArduinoLibraryRequest r;
  ArduinoBuildError err;

  ASSERT_TRUE(ParseLibraryRequest("Servo", r, &err));
  EXPECT_EQ(r.name, "Servo");
  EXPECT_FALSE(r.HasVersion());

  ASSERT_TRUE(ParseLibraryRequest(" Adafruit GFX Library@1.11.9 ", r, &err));
  EXPECT_EQ(r.name, "Adafruit GFX Library");
  EXPECT_EQ(r.version, "1.11.9");
  EXPECT_EQ(r.ToString(), "Adafruit GFX Library@1.11.9");
}

TEST(LibraryRequest, RejectsShellMetacharacters) {
  const char *bad[] = {"Servo;rm -rf /", "Servo|cat", "Servo`id`", "../Servo", "Servo@1.0;x", "Servo@", ""};
  for (const char *text : bad) {
    ArduinoLibraryRequest r;
    ArduinoBuildError err;
    EXPECT_FALSE(ParseLibraryRequest(text, r, &err)) << text;
    EXPECT_EQ(err.kind, ArduinoBuildErrorKind::InvalidInput) << text;
  }
}

TEST(LibraryRequest, VersionAllowsSemverCharacters) {
  EXPECT_TRUE(IsSafeLibraryVersion("1.0.0-beta+exp_1"));
  EXPECT_FALSE(IsSafeLibraryVersion("1.0 0"));
  EXPECT_TRUE(IsSafeLibraryName("My_Lib 2"));
  EXPECT_FALSE(IsSafeLibraryName("My-Lib"));
}

TEST(LibraryRequest, ListStopsAtFirstInvalid) {
  std::vector<ArduinoLibraryRequest> out;
  ArduinoBuildError err;
  EXPECT_FALSE(ParseLibraryRequests({"Servo", "Bad;Name"}, out, &err));
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(err.kind, ArduinoBuildErrorKind::InvalidInput);
}

TEST(LibraryProperties, ReadsDependsAndArchitectures) {
  std::string content =
      "# comment\r\n"
      "name=Adafruit SSD1306\r\n"
      "version=2.5.9\r\n"
      "depends=Adafruit GFX Library (>=1.10), Adafruit BusIO\r\n"
      "architectures=avr, esp32\r\n"
      "url=https://example.test/a=b\r\n";

  ArduinoLibraryProperties p = ParseLibraryProperties(content);
  EXPECT_EQ(p.name, "Adafruit SSD1306");
  EXPECT_EQ(p.version, "2.5.9");
  ASSERT_TRUE(p.hasDepends);
  ASSERT_EQ(p.depends.size(), 2u);
  EXPECT_EQ(p.depends[0], "Adafruit GFX Library");
  EXPECT_EQ(p.depends[1], "Adafruit BusIO");
  ASSERT_TRUE(p.hasArchitectures);
  ASSERT_EQ(p.architectures.size(), 2u);
  EXPECT_EQ(p.architectures[1], "esp32");
}

TEST(LibraryProperties, MissingKeysAreReported) {
  ArduinoLibraryProperties p = ParseLibraryProperties("name=Servo\nversion=1.2.1\n");
  EXPECT_FALSE(p.hasDepends);
  EXPECT_FALSE(p.hasArchitectures);
  EXPECT_TRUE(p.depends.empty());

  p = ParseLibraryProperties("depends=\n");
  EXPECT_TRUE(p.hasDepends);
  EXPECT_TRUE(p.depends.empty());
}

TEST(LibraryProperties, StripsVersionConstraint) {
  EXPECT_EQ(StripDependencyConstraint("ArduinoJson (>=6.0.0)"), "ArduinoJson");
  EXPECT_EQ(StripDependencyConstraint("  Servo "), "Servo");
}
