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

#include "../src/Utils/FileUtils.hpp"
#include "TestHelpers.hpp"

using namespace ShadowVeil::Utils;
using ShadowVeil::Testing::TempDir;
using ShadowVeil::Testing::WriteFile;
using ShadowVeil::Testing::ReadFile;
namespace fs = std::filesystem;

TEST(FileUtilsTest, SanitizeFileNameStripsTraversal) {
    EXPECT_EQ(FileUtils::SanitizeFileName("../../etc/passwd"), "passwd");
    EXPECT_EQ(FileUtils::SanitizeFileName("..\\windows\\evil.txt"), "evil.txt");
    EXPECT_EQ(FileUtils::SanitizeFileName(".."), "");
    EXPECT_EQ(FileUtils::SanitizeFileName("..hidden"), "hidden");
    EXPECT_EQ(FileUtils::SanitizeFileName("re:port?.pdf"), "report.pdf");
    EXPECT_EQ(FileUtils::SanitizeFileName(std::string("a\0b.txt", 7)), "ab.txt");
}

TEST(FileUtilsTest, SanitizeFileNameKeepsExtensionWhenTruncating) {
    const std::string name = std::string(400, 'x') + ".pdf";
    const std::string out = FileUtils::SanitizeFileName(name);
    EXPECT_EQ(out.size(), 200u);
    EXPECT_EQ(out.substr(out.size() - 4), ".pdf");
}

TEST(FileUtilsTest, IsPathUnderRoot) {
    TempDir dir;
    EXPECT_TRUE(FileUtils::IsPathUnderRoot(dir / "a/b.txt", dir.Path()));
    EXPECT_FALSE(FileUtils::IsPathUnderRoot(dir / "../outside.txt", dir.Path()));
    EXPECT_FALSE(FileUtils::IsPathUnderRoot(dir.Path().parent_path(), dir.Path()));
}

TEST(FileUtilsTest, IsPathUnderRootResolvesSymlinks) {
    TempDir dir;
    TempDir outside;
    fs::create_directory_symlink(outside.Path(), dir / "link");
    EXPECT_FALSE(FileUtils::IsPathUnderRoot(dir / "link" / "file", dir.Path()));
}

TEST(FileUtilsTest, StatMissingPathIsNotAnError) {
    TempDir dir;
    FileUtils::FileStat st;
    FileUtils::Error err;
    ASSERT_TRUE(FileUtils::Stat(dir / "missing", st, &err));
    EXPECT_FALSE(st.exists);
    EXPECT_FALSE(err.hasError());

    WriteFile(dir / "present", "12345");
    ASSERT_TRUE(FileUtils::Stat(dir / "present", st, &err));
    EXPECT_TRUE(st.exists);
    EXPECT_TRUE(st.isRegularFile);
    EXPECT_EQ(st.size, 5u);
}

TEST(FileUtilsTest, AtomicWriteAndRead) {
    TempDir dir;
    const fs::path file = dir / "nested/config.json";
    ASSERT_TRUE(FileUtils::WriteAllTextUtf8Atomic(file, "{\"a\":1}"));

    std::string text;
    ASSERT_TRUE(FileUtils::ReadAllTextUtf8(file, text));
    EXPECT_EQ(text, "{\"a\":1}");

    WriteFile(dir / "bom.txt", "\xEF\xBB\xBFhello");
    ASSERT_TRUE(FileUtils::ReadAllTextUtf8(dir / "bom.txt", text));
    EXPECT_EQ(text, "hello");
}

TEST(FileUtilsTest, MoveFileAtomicMovesContent) {
    TempDir dir;
    WriteFile(dir / "src.bin", "payload");

    FileUtils::Error err;
    ASSERT_TRUE(FileUtils::MoveFileAtomic(dir / "src.bin", dir / "dst.bin", &err)) << err.message;
    EXPECT_FALSE(fs::exists(dir / "src.bin"));
    EXPECT_EQ(ReadFile(dir / "dst.bin"), "payload");
}

TEST(FileUtilsTest, MoveFileAtomicMissingSourceFails) {
    TempDir dir;
    FileUtils::Error err;
    EXPECT_FALSE(FileUtils::MoveFileAtomic(dir / "nope", dir / "dst", &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_FALSE(fs::exists(dir / "dst"));
}

TEST(FileUtilsTest, OverwriteInPlaceKeepsLength) {
    TempDir dir;
    WriteFile(dir / "secret", "AAAA");
    const uint8_t noise[4] = {1, 2, 3, 4};
    ASSERT_TRUE(FileUtils::OverwriteInPlace(dir / "secret", noise, sizeof(noise)));
    EXPECT_EQ(ReadFile(dir / "secret"), std::string("\x01\x02\x03\x04", 4));
}

TEST(FileUtilsTest, ListSubdirectoriesSkipsFilesAndSymlinks) {
    TempDir dir;
    fs::create_directory(dir / "one");
    fs::create_directory(dir / "two");
    WriteFile(dir / "file.txt", "x");
    fs::create_directory_symlink(dir / "one", dir / "alias");

    std::vector<fs::path> subdirs;
    ASSERT_TRUE(FileUtils::ListSubdirectories(dir.Path(), subdirs));
    ASSERT_EQ(subdirs.size(), 2u);
}

TEST(FileUtilsTest, ClearRestrictivePermissionsAllowsRemoval) {
    TempDir dir;
    const fs::path locked = dir / "locked";
    WriteFile(locked / "inner.txt", "x");
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec);

    EXPECT_GE(FileUtils::ClearRestrictivePermissions(locked), 1u);
    EXPECT_TRUE(FileUtils::RemoveDirectoryRecursive(locked));
    EXPECT_FALSE(fs::exists(locked));
}

TEST(FileUtilsTest, RemoveFileMissingIsSuccess) {
    TempDir dir;
    EXPECT_TRUE(FileUtils::RemoveFile(dir / "missing"));
}
