/*
 * ShadowVeil - Privacy Enforcement Core
 * Copyright (C) 2026 ShadowVeil Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pch.h"
#include <gtest/gtest.h>

#include "../src/Utils/JSONUtils.hpp"
#include "TestHelpers.hpp"

using namespace ShadowVeil::Utils;
using ShadowVeil::Testing::TempDir;
using ShadowVeil::Testing::WriteFile;

TEST(JSONUtilsTest, ParseReportsErrors) {
    JSON::Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::Parse("{ invalid json }", j, &err));
    EXPECT_TRUE(err.hasError());
}

TEST(JSONUtilsTest, ParseAllowsComments) {
    JSON::Json j;
    ASSERT_TRUE(JSON::Parse("{ // rules\n \"a\": [1, 2] }", j));
    EXPECT_EQ(j["a"].size(), 2u);
}

TEST(JSONUtilsTest, ParseRejectsExcessiveDepth) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    JSON::Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::Parse(deep, j, &err));
}

TEST(JSONUtilsTest, TypedGettersUsePaths) {
    JSON::Json j;
    ASSERT_TRUE(JSON::Parse(R"({"sessions":{"args":["x","y"],"n":5}})", j));

    std::vector<std::string> args;
    ASSERT_TRUE(JSON::Get(j, "sessions.args", args));
    EXPECT_EQ(args.size(), 2u);
    EXPECT_EQ(JSON::GetOr<int>(j, "sessions.n", 0), 5);
    EXPECT_EQ(JSON::GetOr<int>(j, "sessions.missing", 7), 7);

    int wrong = 0;
    EXPECT_FALSE(JSON::Get(j, "sessions.args", wrong));
}

TEST(JSONUtilsTest, SaveAndLoadFile) {
    TempDir dir;
    JSON::Json j;
    j["trackingParams"] = JSON::Json::array({"utm_source"});
    ASSERT_TRUE(JSON::SaveToFile(dir / "rules.json", j));

    JSON::Json loaded;
    ASSERT_TRUE(JSON::LoadFromFile(dir / "rules.json", loaded));
    EXPECT_EQ(loaded, j);

    JSON::Error err;
    EXPECT_FALSE(JSON::LoadFromFile(dir / "missing.json", loaded, &err));
    EXPECT_TRUE(err.hasError());
}
