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

#include <atomic>
#include <stdexcept>
#include <thread>

#include "../src/Utils/HashUtils.hpp"
#include "../src/WebProtection/DownloadQuarantineGate.hpp"
#include "TestHelpers.hpp"

using namespace ShadowVeil::WebProtection;
using namespace ShadowVeil::Testing;
using ShadowVeil::Utils::HashUtils::Algorithm;
using ::testing::_;
using ::testing::Return;
namespace fs = std::filesystem;
namespace HashUtils = ShadowVeil::Utils::HashUtils;

namespace {

DownloadStartingEvent MakeEvent(std::string uri, std::string mime, std::string suggested = {}) {
    DownloadStartingEvent event;
    event.uri = std::move(uri);
    event.mimeType = std::move(mime);
    event.suggestedFileName = std::move(suggested);
    return event;
}

std::shared_ptr<ShadowVeil::Privacy::SecureDeletionWorker> FastWiper() {
    ShadowVeil::Privacy::SecureDeletionConfiguration config;
    config.retryBaseDelay = std::chrono::milliseconds(1);
    return std::make_shared<ShadowVeil::Privacy::SecureDeletionWorker>(config);
}

}  // namespace

class DownloadQuarantineGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_source = std::make_shared<FakeDownloadEventSource>();
        m_gate = std::make_unique<DownloadQuarantineGate>(
            QuarantineGateConfiguration{}, std::make_shared<SidecarContentMarker>(), FastWiper());
        ASSERT_TRUE(m_gate->Initialize(m_source, QuarantineDir()));
    }

    fs::path QuarantineDir() const { return m_dir / "session" / "Quarantine"; }

    /// Drive a download through the sink to Quarantined.
    std::string Quarantine(const std::string& uri, const std::string& mime, const std::string& body) {
        IDownloadEventSink* sink = m_source->Sink();
        EXPECT_NE(sink, nullptr);
        const StartDecision decision = sink->OnDownloadStarting(MakeEvent(uri, mime));
        EXPECT_FALSE(decision.cancel);
        WriteFile(decision.resultFilePath, body);
        sink->OnDownloadStateChanged(decision.downloadId, TransferState::InProgress);
        sink->OnDownloadStateChanged(decision.downloadId, TransferState::Completed);
        return decision.downloadId;
    }

    TempDir m_dir;
    std::shared_ptr<FakeDownloadEventSource> m_source;
    std::unique_ptr<DownloadQuarantineGate> m_gate;
};

TEST_F(DownloadQuarantineGateTest, InitializeSubscribesAndCreatesDirectory) {
    EXPECT_TRUE(m_gate->IsInitialized());
    EXPECT_EQ(m_source->subscribeCount, 1);
    EXPECT_EQ(m_source->Sink(), m_gate.get());
    EXPECT_TRUE(fs::is_directory(QuarantineDir()));
    EXPECT_EQ(m_gate->GetQuarantineDirectory(), QuarantineDir().lexically_normal());
}

TEST_F(DownloadQuarantineGateTest, SecondInitializeIsRejected) {
    auto other = std::make_shared<FakeDownloadEventSource>();
    EXPECT_FALSE(m_gate->Initialize(other, m_dir / "elsewhere"));
    EXPECT_EQ(other->subscribeCount, 0);
    EXPECT_EQ(m_gate->GetQuarantineDirectory(), QuarantineDir().lexically_normal());
}

TEST_F(DownloadQuarantineGateTest, InitializeRequiresSource) {
    DownloadQuarantineGate gate;
    EXPECT_FALSE(gate.Initialize(nullptr, m_dir / "q"));
    EXPECT_FALSE(gate.IsInitialized());
}

TEST_F(DownloadQuarantineGateTest, UninitializedGateCancelsEverything) {
    DownloadQuarantineGate gate;
    const auto decision = gate.OnDownloadStarting(MakeEvent("https://example.com/a.pdf", "application/pdf"));
    EXPECT_TRUE(decision.cancel);
}

TEST_F(DownloadQuarantineGateTest, AcceptsAllowedTypeIntoQuarantine) {
    const auto decision = m_gate->OnDownloadStarting(
        MakeEvent("https://example.com/files/Annual%20Report.pdf?token=1", "application/pdf; charset=binary"));
    ASSERT_FALSE(decision.cancel);
    EXPECT_EQ(decision.downloadId.size(), 32u);
    EXPECT_EQ(decision.resultFilePath.parent_path(), m_gate->GetQuarantineDirectory());
    EXPECT_EQ(decision.resultFilePath.filename().string(), decision.downloadId + "_Annual Report.pdf");

    const auto record = m_gate->GetDownload(decision.downloadId);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DownloadStatus::Pending);
    EXPECT_EQ(record->size, -1);
    EXPECT_TRUE(record->sha256.empty());
    EXPECT_EQ(record->sourceUrl, "https://example.com/files/Annual%20Report.pdf?token=1");
}

TEST_F(DownloadQuarantineGateTest, BlocksExecutableExtensions) {
    for (const char* name : {"setup.exe", "SETUP.EXE", "run.sh.bat", "pkg.deb", "script.js"}) {
        const auto decision = m_gate->OnDownloadStarting(
            MakeEvent(std::string("https://example.com/") + name, "application/zip"));
        EXPECT_TRUE(decision.cancel) << name;
    }
    EXPECT_TRUE(m_gate->GetActiveDownloads().empty());
    EXPECT_EQ(m_gate->GetMetrics().blocked, 5u);
}

TEST_F(DownloadQuarantineGateTest, BlocksDisallowedContentTypes) {
    EXPECT_TRUE(m_gate->OnDownloadStarting(MakeEvent("https://example.com/a.bin", "application/x-msdownload")).cancel);
    EXPECT_TRUE(m_gate->OnDownloadStarting(MakeEvent("https://example.com/a.bin", "")).cancel);
    EXPECT_TRUE(m_gate->OnDownloadStarting(MakeEvent("https://example.com/a.html", "text/html")).cancel);
    EXPECT_FALSE(m_gate->OnDownloadStarting(MakeEvent("https://example.com/a.png", "IMAGE/PNG")).cancel);
}

TEST_F(DownloadQuarantineGateTest, SuggestedNameIsSanitized) {
    const auto decision = m_gate->OnDownloadStarting(
        MakeEvent("https://example.com/x", "text/plain", "../../etc/passwd"));
    ASSERT_FALSE(decision.cancel);
    EXPECT_EQ(decision.resultFilePath.parent_path(), m_gate->GetQuarantineDirectory());
    EXPECT_EQ(m_gate->GetDownload(decision.downloadId)->fileName, "passwd");
}

TEST_F(DownloadQuarantineGateTest, EmptyNameGetsGeneratedName) {
    const auto decision = m_gate->OnDownloadStarting(MakeEvent("https://example.com/", "text/plain"));
    ASSERT_FALSE(decision.cancel);
    EXPECT_EQ(m_gate->GetDownload(decision.downloadId)->fileName, "download_" + decision.downloadId);
}

TEST_F(DownloadQuarantineGateTest, CompletionHashesAndMarks) {
    const std::string body = "%PDF-1.7 quarterly numbers";
    const std::string id = Quarantine("https://example.com/report.pdf", "application/pdf", body);

    const auto record = m_gate->GetDownload(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DownloadStatus::Quarantined);
    EXPECT_EQ(record->size, static_cast<int64_t>(body.size()));

    std::string expected;
    ASSERT_TRUE(HashUtils::ComputeFileHex(Algorithm::SHA256, record->quarantinePath, expected));
    EXPECT_EQ(record->sha256, expected);
    EXPECT_EQ(record->sha256.size(), 64u);

    EXPECT_EQ(ReadFile(SidecarContentMarker::SidecarPathFor(record->quarantinePath)),
              SidecarContentMarker::FormatZoneIdentifier("https://example.com/report.pdf"));

    const auto metrics = m_gate->GetMetrics();
    EXPECT_EQ(metrics.totalDownloads, 1u);
    EXPECT_EQ(metrics.quarantined, 1u);
    EXPECT_EQ(metrics.totalBytes, body.size());
}

TEST_F(DownloadQuarantineGateTest, CompletionWithoutFileFails) {
    IDownloadEventSink* sink = m_source->Sink();
    const auto decision = sink->OnDownloadStarting(MakeEvent("https://example.com/a.txt", "text/plain"));
    ASSERT_FALSE(decision.cancel);
    sink->OnDownloadStateChanged(decision.downloadId, TransferState::Completed);

    EXPECT_EQ(m_gate->GetDownload(decision.downloadId)->status, DownloadStatus::Failed);
    EXPECT_EQ(m_gate->GetMetrics().failed, 1u);
}

TEST_F(DownloadQuarantineGateTest, InterruptedDownloadIsRemoved) {
    IDownloadEventSink* sink = m_source->Sink();
    const auto decision = sink->OnDownloadStarting(MakeEvent("https://example.com/a.zip", "application/zip"));
    WriteFile(decision.resultFilePath, "PK partial");
    sink->OnDownloadStateChanged(decision.downloadId, TransferState::InProgress);
    sink->OnDownloadStateChanged(decision.downloadId, TransferState::Interrupted);

    EXPECT_EQ(m_gate->GetDownload(decision.downloadId)->status, DownloadStatus::Failed);
    EXPECT_FALSE(fs::exists(decision.resultFilePath));

    sink->OnDownloadStateChanged(decision.downloadId, TransferState::Completed);
    EXPECT_EQ(m_gate->GetDownload(decision.downloadId)->status, DownloadStatus::Failed);
}

TEST_F(DownloadQuarantineGateTest, UnknownIdEventsAreIgnored) {
    m_source->Sink()->OnDownloadStateChanged("not-a-download", TransferState::Completed);
    EXPECT_TRUE(m_gate->GetActiveDownloads().empty());
}

TEST_F(DownloadQuarantineGateTest, PromoteMovesFileAndMarker) {
    const std::string id = Quarantine("https://example.com/photo.png", "image/png", "PNGDATA");
    const fs::path quarantined = m_gate->GetDownload(id)->quarantinePath;
    const fs::path destination = m_dir / "Downloads" / "photo.png";

    DownloadRecord promoted;
    DownloadError err;
    ASSERT_TRUE(m_gate->Promote(id, destination, promoted, &err)) << err.message;

    EXPECT_EQ(promoted.status, DownloadStatus::Promoted);
    EXPECT_EQ(promoted.finalPath, destination);
    EXPECT_EQ(ReadFile(destination), "PNGDATA");
    EXPECT_FALSE(fs::exists(quarantined));
    EXPECT_TRUE(fs::exists(SidecarContentMarker::SidecarPathFor(destination)));
    EXPECT_EQ(m_gate->GetMetrics().promoted, 1u);
    EXPECT_TRUE(m_gate->GetActiveDownloads().empty());
}

TEST_F(DownloadQuarantineGateTest, PromoteRequiresQuarantinedStatus) {
    const auto decision = m_gate->OnDownloadStarting(MakeEvent("https://example.com/a.txt", "text/plain"));
    DownloadRecord out;
    DownloadError err;
    EXPECT_FALSE(m_gate->Promote(decision.downloadId, m_dir / "out.txt", out, &err));
    EXPECT_EQ(err.code, DownloadErrorCode::InvalidState);
    EXPECT_EQ(m_gate->GetDownload(decision.downloadId)->status, DownloadStatus::Pending);

    err.clear();
    EXPECT_FALSE(m_gate->Promote("missing", m_dir / "out.txt", out, &err));
    EXPECT_EQ(err.code, DownloadErrorCode::NotFound);
}

TEST_F(DownloadQuarantineGateTest, PromoteTwiceFails) {
    const std::string id = Quarantine("https://example.com/a.txt", "text/plain", "hello");
    DownloadRecord out;
    ASSERT_TRUE(m_gate->Promote(id, m_dir / "a.txt", out));

    DownloadError err;
    EXPECT_FALSE(m_gate->Promote(id, m_dir / "b.txt", out, &err));
    EXPECT_EQ(err.code, DownloadErrorCode::InvalidState);
    EXPECT_FALSE(fs::exists(m_dir / "b.txt"));
}

TEST_F(DownloadQuarantineGateTest, PromoteOntoExistingFileFails) {
    const std::string id = Quarantine("https://example.com/a.txt", "text/plain", "new");
    WriteFile(m_dir / "a.txt", "existing");

    DownloadRecord out;
    DownloadError err;
    EXPECT_FALSE(m_gate->Promote(id, m_dir / "a.txt", out, &err));
    EXPECT_EQ(err.code, DownloadErrorCode::IoError);
    EXPECT_EQ(ReadFile(m_dir / "a.txt"), "existing");
    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Failed);
}

TEST_F(DownloadQuarantineGateTest, DeleteWipesFileAndMarker) {
    const std::string id = Quarantine("https://example.com/a.csv", "text/csv", "a,b\n1,2\n");
    const fs::path quarantined = m_gate->GetDownload(id)->quarantinePath;

    ASSERT_TRUE(m_gate->Delete(id));
    EXPECT_FALSE(fs::exists(quarantined));
    EXPECT_FALSE(fs::exists(SidecarContentMarker::SidecarPathFor(quarantined)));
    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Deleted);
    EXPECT_EQ(m_gate->GetMetrics().deleted, 1u);

    EXPECT_FALSE(m_gate->Delete(id));
    EXPECT_FALSE(m_gate->Delete("missing"));
}

TEST_F(DownloadQuarantineGateTest, ConcurrentPromoteAndDeleteHaveOneWinner) {
    for (int round = 0; round < 10; ++round) {
        const std::string id = Quarantine("https://example.com/r.txt", "text/plain", "race");
        const fs::path destination = m_dir / ("promoted-" + std::to_string(round) + ".txt");

        std::atomic<bool> promoted{false};
        std::atomic<bool> deleted{false};
        std::thread a([&] {
            DownloadRecord out;
            promoted = m_gate->Promote(id, destination, out);
        });
        std::thread b([&] { deleted = m_gate->Delete(id); });
        a.join();
        b.join();

        EXPECT_NE(promoted.load(), deleted.load());
        const auto status = m_gate->GetDownload(id)->status;
        if (promoted) {
            EXPECT_EQ(status, DownloadStatus::Promoted);
            EXPECT_TRUE(fs::exists(destination));
        }
        else {
            EXPECT_EQ(status, DownloadStatus::Deleted);
            EXPECT_FALSE(fs::exists(destination));
        }
    }
}

TEST_F(DownloadQuarantineGateTest, CallbacksFireAndCanBeRemoved) {
    std::vector<std::string> completed;
    std::vector<std::string> promoted;
    std::vector<std::string> deleted;
    const uint64_t completedId = m_gate->RegisterCompletedCallback(
        [&](const DownloadRecord& r) { completed.push_back(r.id); });
    m_gate->RegisterPromotedCallback([&](const DownloadRecord& r) { promoted.push_back(r.id); });
    m_gate->RegisterDeletedCallback([&](const DownloadRecord& r) { deleted.push_back(r.id); });

    const std::string first = Quarantine("https://example.com/1.txt", "text/plain", "1");
    const std::string second = Quarantine("https://example.com/2.txt", "text/plain", "2");
    DownloadRecord out;
    ASSERT_TRUE(m_gate->Promote(first, m_dir / "1.txt", out));
    ASSERT_TRUE(m_gate->Delete(second));

    EXPECT_THAT(completed, ::testing::ElementsAre(first, second));
    EXPECT_THAT(promoted, ::testing::ElementsAre(first));
    EXPECT_THAT(deleted, ::testing::ElementsAre(second));

    EXPECT_TRUE(m_gate->UnregisterCallback(completedId));
    EXPECT_FALSE(m_gate->UnregisterCallback(completedId));
    (void)Quarantine("https://example.com/3.txt", "text/plain", "3");
    EXPECT_EQ(completed.size(), 2u);
}

TEST_F(DownloadQuarantineGateTest, ThrowingCallbackDoesNotBreakGate) {
    m_gate->RegisterCompletedCallback([](const DownloadRecord&) { throw std::runtime_error("listener bug"); });
    const std::string id = Quarantine("https://example.com/a.txt", "text/plain", "x");
    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Quarantined);
}

TEST_F(DownloadQuarantineGateTest, ShutdownPurgesUndecidedDownloads) {
    const std::string quarantinedId = Quarantine("https://example.com/q.txt", "text/plain", "q");
    const fs::path quarantinedPath = m_gate->GetDownload(quarantinedId)->quarantinePath;

    const auto pending = m_gate->OnDownloadStarting(MakeEvent("https://example.com/p.txt", "text/plain"));
    WriteFile(pending.resultFilePath, "partial");

    const std::string promotedId = Quarantine("https://example.com/k.txt", "text/plain", "keep");
    DownloadRecord out;
    ASSERT_TRUE(m_gate->Promote(promotedId, m_dir / "k.txt", out));

    m_gate->Shutdown();

    EXPECT_FALSE(m_gate->IsInitialized());
    EXPECT_EQ(m_source->unsubscribeCount, 1);
    EXPECT_EQ(m_source->Sink(), nullptr);
    EXPECT_FALSE(fs::exists(quarantinedPath));
    EXPECT_FALSE(fs::exists(pending.resultFilePath));
    EXPECT_TRUE(fs::exists(m_dir / "k.txt"));
    EXPECT_EQ(m_gate->GetDownload(quarantinedId)->status, DownloadStatus::Deleted);
    EXPECT_EQ(m_gate->GetDownload(pending.downloadId)->status, DownloadStatus::Failed);
    EXPECT_TRUE(m_gate->GetActiveDownloads().empty());

    EXPECT_TRUE(m_gate->OnDownloadStarting(MakeEvent("https://example.com/late.txt", "text/plain")).cancel);
    EXPECT_FALSE(m_gate->Initialize(m_source, QuarantineDir()));

    m_gate->Shutdown();
    EXPECT_EQ(m_source->unsubscribeCount, 1);
}

TEST_F(DownloadQuarantineGateTest, MarkerFailureFallsBackToSidecar) {
    auto marker = std::make_shared<MockContentMarker>();
    EXPECT_CALL(*marker, Mark(_, _)).WillOnce(Return(false));
    EXPECT_CALL(*marker, GetName()).Times(::testing::AnyNumber());

    auto source = std::make_shared<FakeDownloadEventSource>();
    DownloadQuarantineGate gate(QuarantineGateConfiguration{}, marker, FastWiper());
    ASSERT_TRUE(gate.Initialize(source, m_dir / "q2"));

    const auto decision = gate.OnDownloadStarting(MakeEvent("https://example.com/a.txt", "text/plain"));
    WriteFile(decision.resultFilePath, "x");
    gate.OnDownloadStateChanged(decision.downloadId, TransferState::Completed);

    EXPECT_EQ(gate.GetDownload(decision.downloadId)->status, DownloadStatus::Quarantined);
    EXPECT_EQ(ReadFile(SidecarContentMarker::SidecarPathFor(decision.resultFilePath)),
              SidecarContentMarker::FormatZoneIdentifier("https://example.com/a.txt"));
}

TEST_F(DownloadQuarantineGateTest, ThrowingMarkerStillQuarantines) {
    auto marker = std::make_shared<MockContentMarker>();
    EXPECT_CALL(*marker, Mark(_, _)).WillOnce(::testing::Throw(std::runtime_error("attribute store offline")));
    EXPECT_CALL(*marker, GetName()).WillRepeatedly(Return(std::string_view("mock")));

    auto source = std::make_shared<FakeDownloadEventSource>();
    DownloadQuarantineGate gate(QuarantineGateConfiguration{}, marker, FastWiper());
    ASSERT_TRUE(gate.Initialize(source, m_dir / "q4"));

    const auto decision = gate.OnDownloadStarting(MakeEvent("https://example.com/b.txt", "text/plain"));
    WriteFile(decision.resultFilePath, "y");
    EXPECT_NO_THROW(gate.OnDownloadStateChanged(decision.downloadId, TransferState::InProgress));
    EXPECT_NO_THROW(gate.OnDownloadStateChanged(decision.downloadId, TransferState::Completed));

    const auto record = gate.GetDownload(decision.downloadId);
    EXPECT_EQ(record->status, DownloadStatus::Quarantined);
    EXPECT_FALSE(record->sha256.empty());
    EXPECT_TRUE(fs::exists(SidecarContentMarker::SidecarPathFor(decision.resultFilePath)));
}

TEST_F(DownloadQuarantineGateTest, LateEventsCannotLeaveFinalStates) {
    const std::string id = Quarantine("https://example.com/r.txt", "text/plain", "report");
    m_source->Sink()->OnDownloadStateChanged(id, TransferState::InProgress);
    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Quarantined);

    DownloadRecord out;
    ASSERT_TRUE(m_gate->Promote(id, m_dir / "r.txt", out));

    m_source->Sink()->OnDownloadStateChanged(id, TransferState::Interrupted);
    m_source->Sink()->OnDownloadStateChanged(id, TransferState::Completed);

    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Promoted);
    EXPECT_EQ(ReadFile(m_dir / "r.txt"), "report");
    EXPECT_FALSE(m_gate->Delete(id));
    EXPECT_EQ(m_gate->GetMetrics().failed, 0u);
}

TEST_F(DownloadQuarantineGateTest, PromoteRejectsFileChangedInQuarantine) {
    const std::string id = Quarantine("https://example.com/doc.txt", "text/plain", "original");
    const fs::path quarantined = m_gate->GetDownload(id)->quarantinePath;
    WriteFile(quarantined, "swapped after the hash was taken");

    DownloadRecord out;
    DownloadError err;
    EXPECT_FALSE(m_gate->Promote(id, m_dir / "doc.txt", out, &err));
    EXPECT_EQ(err.code, DownloadErrorCode::IntegrityMismatch);
    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Failed);
    EXPECT_FALSE(fs::exists(m_dir / "doc.txt"));
}

TEST_F(DownloadQuarantineGateTest, DetachStopsNewDownloadsAndKeepsFiles) {
    const std::string id = Quarantine("https://example.com/q.txt", "text/plain", "q");
    const fs::path quarantined = m_gate->GetDownload(id)->quarantinePath;

    m_gate->Detach();

    EXPECT_EQ(m_source->unsubscribeCount, 1);
    EXPECT_EQ(m_source->Sink(), nullptr);
    EXPECT_TRUE(fs::exists(quarantined));
    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Quarantined);
    EXPECT_TRUE(m_gate->OnDownloadStarting(MakeEvent("https://example.com/late.txt", "text/plain")).cancel);

    m_gate->Shutdown();
    EXPECT_EQ(m_source->unsubscribeCount, 1);
    EXPECT_FALSE(fs::exists(quarantined));
    EXPECT_EQ(m_gate->GetDownload(id)->status, DownloadStatus::Deleted);
}

TEST_F(DownloadQuarantineGateTest, StartsRacingShutdownAreCancelledOrPurged) {
    constexpr int kThreads = 4;
    constexpr int kStartsPerThread = 50;

    std::atomic<int> started{0};
    std::vector<std::vector<StartDecision>> decisions(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kStartsPerThread; ++i) {
                decisions[t].push_back(m_gate->OnDownloadStarting(
                    MakeEvent("https://example.com/f" + std::to_string(i) + ".txt", "text/plain")));
                started++;
            }
        });
    }

    while (started.load() < kThreads * 5) {
        std::this_thread::yield();
    }
    m_gate->Shutdown();
    for (auto& thread : threads) {
        thread.join();
    }

    size_t accepted = 0;
    for (const auto& perThread : decisions) {
        for (const auto& decision : perThread) {
            if (decision.cancel) {
                continue;
            }
            ++accepted;
            const auto record = m_gate->GetDownload(decision.downloadId);
            ASSERT_TRUE(record.has_value());
            EXPECT_EQ(record->status, DownloadStatus::Failed) << decision.downloadId;
        }
    }
    EXPECT_GT(accepted, 0u);
    EXPECT_TRUE(m_gate->GetActiveDownloads().empty());
    EXPECT_EQ(m_gate->GetMetrics().totalDownloads, accepted);
}

TEST_F(DownloadQuarantineGateTest, CustomConfigurationIsApplied) {
    QuarantineGateConfiguration config;
    config.allowedContentTypes = {"application/octet-stream"};
    config.blockedExtensions = {".ISO"};

    auto source = std::make_shared<FakeDownloadEventSource>();
    DownloadQuarantineGate gate(config, std::make_shared<SidecarContentMarker>(), FastWiper());
    ASSERT_TRUE(gate.Initialize(source, m_dir / "q3"));

    EXPECT_FALSE(gate.OnDownloadStarting(MakeEvent("https://example.com/a.bin", "")).cancel);
    EXPECT_TRUE(gate.OnDownloadStarting(MakeEvent("https://example.com/disk.iso", "application/octet-stream")).cancel);
    EXPECT_TRUE(gate.OnDownloadStarting(MakeEvent("https://example.com/a.pdf", "application/pdf")).cancel);
}
