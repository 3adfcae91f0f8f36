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
#include <gmock/gmock.h>

#include <sys/xattr.h>

#include "../src/WebProtection/ContentMarker.hpp"
#include "TestHelpers.hpp"

using namespace ShadowVeil::WebProtection;
using namespace ShadowVeil::Testing;
using ::testing::_;
using ::testing::Return;
namespace fs = std::filesystem;

TEST(ContentMarkerTest, SidecarBodyNamesInternetZone) {
    EXPECT_EQ(SidecarContentMarker::FormatZoneIdentifier("https://example.com/a.zip"),
              "[ZoneTransfer]\nZoneId=3\nReferrerUrl=https://example.com/a.zip\n");
    EXPECT_EQ(SidecarContentMarker::FormatZoneIdentifier("https://x/\r\nZoneId=0"),
              "[ZoneTransfer]\nZoneId=3\nReferrerUrl=https://x/ZoneId=0\n");
}

TEST(ContentMarkerTest, SidecarWrittenBesideFile) {
    TempDir dir;
    const fs::path file = dir / "report.pdf";
    WriteFile(file, "%PDF");

    SidecarContentMarker marker;
    ASSERT_TRUE(marker.Mark(file, "https://example.com/report.pdf"));

    const fs::path sidecar = SidecarContentMarker::SidecarPathFor(file);
    EXPECT_EQ(sidecar.filename(), "report.pdf.Zone.Identifier");
    EXPECT_EQ(ReadFile(sidecar), SidecarContentMarker::FormatZoneIdentifier("https://example.com/report.pdf"));
}

TEST(ContentMarkerTest, XattrMarkerSetsZoneAndOrigin) {
    TempDir dir;
    const fs::path file = dir / "image.png";
    WriteFile(file, "png");

    XattrContentMarker marker;
    if (!marker.Mark(file, "https://example.com/image.png")) {
        GTEST_SKIP() << "user extended attributes unsupported on " << dir.Path();
    }

    char buffer[256] = {};
    const ssize_t n = ::getxattr(file.c_str(), std::string(ContentMarkerConstants::XATTR_ORIGIN_URL).c_str(),
                                 buffer, sizeof(buffer));
    ASSERT_GT(n, 0);
    EXPECT_EQ(std::string(buffer, static_cast<size_t>(n)), "https://example.com/image.png");
}

TEST(ContentMarkerTest, XattrMarkerFailsOnMissingFile) {
    TempDir dir;
    XattrContentMarker marker;
    EXPECT_FALSE(marker.Mark(dir / "missing", "https://example.com/"));
}

TEST(ContentMarkerTest, FallbackUsesSecondaryOnlyWhenPrimaryFails) {
    auto primary = std::make_shared<MockContentMarker>();
    auto secondary = std::make_shared<MockContentMarker>();
    ON_CALL(*secondary, GetName()).WillByDefault(Return("secondary"));
    EXPECT_CALL(*secondary, GetName()).Times(::testing::AnyNumber());

    FallbackContentMarker marker(primary, secondary);

    EXPECT_CALL(*primary, Mark(_, _)).WillOnce(Return(true)).WillOnce(Return(false));
    EXPECT_CALL(*secondary, Mark(_, _)).WillOnce(Return(true));

    EXPECT_TRUE(marker.Mark("/tmp/a", "https://example.com/"));
    EXPECT_TRUE(marker.Mark("/tmp/b", "https://example.com/"));
}

TEST(ContentMarkerTest, DefaultMarkerAlwaysLeavesAMark) {
    TempDir dir;
    const fs::path file = dir / "archive.zip";
    WriteFile(file, "PK");

    auto marker = CreateDefaultContentMarker();
    ASSERT_NE(marker, nullptr);
    EXPECT_EQ(marker->GetName(), "fallback");
    EXPECT_TRUE(marker->Mark(file, "https://example.com/archive.zip"));

    char buffer[16] = {};
    const bool hasXattr = ::getxattr(file.c_str(), std::string(ContentMarkerConstants::XATTR_ZONE).c_str(),
                                     buffer, sizeof(buffer)) > 0;
    EXPECT_TRUE(hasXattr || fs::exists(SidecarContentMarker::SidecarPathFor(file)));
}
