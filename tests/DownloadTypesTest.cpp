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

#include <nlohmann/json.hpp>

#include "../src/WebProtection/DownloadTypes.hpp"

using namespace ShadowVeil::WebProtection;

TEST(DownloadTypesTest, ForwardTransitionsAreAllowed) {
    EXPECT_TRUE(IsValidTransition(DownloadStatus::Pending, DownloadStatus::InProgress));
    EXPECT_TRUE(IsValidTransition(DownloadStatus::Pending, DownloadStatus::InProgress));
    EXPECT_TRUE(IsValidTransition(DownloadStatus::InProgress, DownloadStatus::Quarantined));
    EXPECT_TRUE(IsValidTransition(DownloadStatus::Quarantined, DownloadStatus::Promoted));
    EXPECT_TRUE(IsValidTransition(DownloadStatus::Quarantined, DownloadStatus::Deleted));
    EXPECT_TRUE(IsValidTransition(DownloadStatus::InProgress, DownloadStatus::Failed));
}

TEST(DownloadTypesTest, PromotionRequiresQuarantine) {
    EXPECT_FALSE(IsValidTransition(DownloadStatus::Pending, DownloadStatus::Promoted));
    EXPECT_FALSE(IsValidTransition(DownloadStatus::InProgress, DownloadStatus::Promoted));
    EXPECT_FALSE(IsValidTransition(DownloadStatus::Pending, DownloadStatus::Deleted));
}

TEST(DownloadTypesTest, TerminalStatesHaveNoExit) {
    const DownloadStatus all[] = {DownloadStatus::Pending, DownloadStatus::InProgress,
                                  DownloadStatus::Quarantined, DownloadStatus::Promoted,
                                  DownloadStatus::Deleted, DownloadStatus::Failed};
    for (const auto from : {DownloadStatus::Promoted, DownloadStatus::Deleted, DownloadStatus::Failed}) {
        EXPECT_TRUE(IsTerminal(from));
        for (const auto to : all) {
            EXPECT_FALSE(IsValidTransition(from, to))
                << GetDownloadStatusName(from) << " -> " << GetDownloadStatusName(to);
        }
    }
    EXPECT_FALSE(IsTerminal(DownloadStatus::Quarantined));
}

TEST(DownloadTypesTest, NoBackwardTransitions) {
    EXPECT_FALSE(IsValidTransition(DownloadStatus::Quarantined, DownloadStatus::InProgress));
    EXPECT_FALSE(IsValidTransition(DownloadStatus::InProgress, DownloadStatus::Pending));
    EXPECT_FALSE(IsValidTransition(DownloadStatus::Quarantined, DownloadStatus::Quarantined));
}

TEST(DownloadTypesTest, CompletionMustPassThroughInProgress) {
    EXPECT_FALSE(IsValidTransition(DownloadStatus::Pending, DownloadStatus::Quarantined));
    EXPECT_FALSE(IsValidTransition(DownloadStatus::Promoted, DownloadStatus::Failed));
    EXPECT_FALSE(IsValidTransition(DownloadStatus::Failed, DownloadStatus::Quarantined));
}

TEST(DownloadTypesTest, StartDecisionFactories) {
    const auto cancel = StartDecision::Cancel();
    EXPECT_TRUE(cancel.cancel);
    EXPECT_TRUE(cancel.downloadId.empty());

    const auto accept = StartDecision::Accept("abc", "/q/abc_file.pdf");
    EXPECT_FALSE(accept.cancel);
    EXPECT_EQ(accept.downloadId, "abc");
    EXPECT_EQ(accept.resultFilePath, std::filesystem::path("/q/abc_file.pdf"));
}

TEST(DownloadTypesTest, RecordToJsonUsesStatusName) {
    DownloadRecord record;
    record.id = "0123";
    record.fileName = "report.pdf";
    record.status = DownloadStatus::Quarantined;
    record.size = 42;

    const auto j = nlohmann::json::parse(record.ToJson());
    EXPECT_EQ(j["status"].get<std::string>(), "Quarantined");
    EXPECT_EQ(j["size"].get<int64_t>(), 42);
    EXPECT_EQ(j["fileName"].get<std::string>(), "report.pdf");
}

TEST(DownloadTypesTest, EnumNames) {
    EXPECT_EQ(GetTransferStateName(TransferState::Interrupted), "Interrupted");
    EXPECT_EQ(GetDownloadErrorCodeName(DownloadErrorCode::NotInitialized), "NotInitialized");
    EXPECT_EQ(GetDownloadErrorCodeName(DownloadErrorCode::IntegrityMismatch), "IntegrityMismatch");
    EXPECT_EQ(GetDownloadStatusName(DownloadStatus::Quarantined), "Quarantined");
}
