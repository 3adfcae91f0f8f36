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

#include "../src/Utils/CryptoUtils.hpp"
#include "../src/Utils/HashUtils.hpp"
#include "TestHelpers.hpp"

using namespace ShadowVeil::Utils;
using ShadowVeil::Testing::TempDir;
using ShadowVeil::Testing::WriteFile;

namespace {
constexpr const char* SHA256_ABC = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* SHA256_EMPTY = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

TEST(HashUtilsTest, KnownSha256Vectors) {
    std::string hex;
    ASSERT_TRUE(HashUtils::ComputeHex(HashUtils::Algorithm::SHA256, std::string_view("abc"), hex));
    EXPECT_EQ(hex, SHA256_ABC);

    ASSERT_TRUE(HashUtils::ComputeHex(HashUtils::Algorithm::SHA256, std::string_view(""), hex));
    EXPECT_EQ(hex, SHA256_EMPTY);
}

TEST(HashUtilsTest, StreamingMatchesOneShot) {
    HashUtils::Hasher hasher(HashUtils::Algorithm::SHA256);
    ASSERT_TRUE(hasher.Init());
    ASSERT_TRUE(hasher.Update("a", 1));
    ASSERT_TRUE(hasher.Update("bc", 2));
    std::string hex;
    ASSERT_TRUE(hasher.FinalHex(hex));
    EXPECT_EQ(hex, SHA256_ABC);
    EXPECT_EQ(hasher.GetDigestSize(), 32u);
}

TEST(HashUtilsTest, FileHashReportsBytesRead) {
    TempDir dir;
    WriteFile(dir / "abc.txt", "abc");

    std::string hex;
    uint64_t bytes = 0;
    HashUtils::Error err;
    ASSERT_TRUE(HashUtils::ComputeFileHex(HashUtils::Algorithm::SHA256, dir / "abc.txt", hex, &err, &bytes))
        << err.message;
    EXPECT_EQ(hex, SHA256_ABC);
    EXPECT_EQ(bytes, 3u);
}

TEST(HashUtilsTest, FileHashOfMissingFileFails) {
    TempDir dir;
    std::string hex;
    HashUtils::Error err;
    EXPECT_FALSE(HashUtils::ComputeFileHex(HashUtils::Algorithm::SHA256, dir / "missing", hex, &err));
    EXPECT_TRUE(err.hasError());
}

TEST(HashUtilsTest, EqualHexIgnoresCase) {
    EXPECT_TRUE(HashUtils::EqualHex("ABCDEF", "abcdef"));
    EXPECT_FALSE(HashUtils::EqualHex("abcdef", "abcdee"));
    EXPECT_FALSE(HashUtils::EqualHex("abc", "abcd"));
}

TEST(HashUtilsTest, AlgorithmInfo) {
    EXPECT_EQ(HashUtils::DigestSize(HashUtils::Algorithm::SHA256), 32u);
    EXPECT_STREQ(HashUtils::AlgorithmName(HashUtils::Algorithm::SHA256), "SHA-256");
}

TEST(CryptoUtilsTest, SecureRandomHexHasRequestedLength) {
    CryptoUtils::SecureRandom rng;
    const std::string a = rng.GenerateHex(16);
    const std::string b = rng.GenerateHex(16);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}
