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

#include <functional>
#include <set>
#include <stdexcept>

#include "../src/Privacy/EphemeralSessionManager.hpp"
#include "TestHelpers.hpp"

using namespace ShadowVeil::Privacy;
using namespace ShadowVeil::Testing;
using ::testing::_;
using ::testing::ByMove;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;
namespace fs = std::filesystem;

namespace {

std::shared_ptr<SecureDeletionWorker> FastWiper() {
    SecureDeletionConfiguration config;
    config.retryBaseDelay = std::chrono::milliseconds(1);
    return std::make_shared<SecureDeletionWorker>(config);
}

/// Environment whose exit wait runs an action on the disposing thread.
class ExitActionEnvironment : public IBrowsingEnvironment {
public:
    explicit ExitActionEnvironment(std::function<void()> onWait) : m_onWait(std::move(onWait)) {}

    void Release() override {}

    bool WaitForExit(std::chrono::milliseconds) override {
        m_onWait();
        return true;
    }

private:
    std::function<void()> m_onWait;
};

}  // namespace

class EphemeralSessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_provider = std::make_shared<FakeEnvironmentProvider>();
        m_manager = MakeManager(m_provider);
    }

    std::unique_ptr<EphemeralSessionManager> MakeManager(
        std::shared_ptr<ShadowVeil::Privacy::IEnvironmentProvider> provider,
        std::chrono::seconds staleness = std::chrono::seconds(3600)) {
        SessionManagerConfiguration config = SessionManagerConfiguration::CreateDefault();
        config.basePath = m_dir / "sessions";
        config.orphanStaleness = staleness;
        config.environmentExitTimeout = std::chrono::milliseconds(50);
        return std::make_unique<EphemeralSessionManager>(config, std::move(provider), FastWiper());
    }

    TempDir m_dir;
    std::shared_ptr<FakeEnvironmentProvider> m_provider;
    std::unique_ptr<EphemeralSessionManager> m_manager;
};

TEST_F(EphemeralSessionManagerTest, CreatesSessionWithCustomId) {
    SessionInfo info;
    SessionError err;
    ASSERT_TRUE(m_manager->CreateSession(std::string("test-session-123"), info, &err)) << err.message;

    EXPECT_EQ(info.id, "test-session-123");
    EXPECT_TRUE(info.active);
    EXPECT_EQ(info.storagePath, m_dir / "sessions" / "test-session-123");
    EXPECT_NE(info.storagePath.string().find("test-session-123"), std::string::npos);
    EXPECT_TRUE(fs::is_directory(info.storagePath));

    const auto perms = fs::status(info.storagePath).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_all);

    ASSERT_EQ(m_provider->Paths().size(), 1u);
    EXPECT_EQ(m_provider->Paths()[0], info.storagePath);
    EXPECT_NE(m_manager->GetEnvironment("test-session-123"), nullptr);
}

TEST_F(EphemeralSessionManagerTest, GeneratedIdsAreUniqueHex) {
    SessionInfo a;
    SessionInfo b;
    ASSERT_TRUE(m_manager->CreateSession(std::nullopt, a));
    ASSERT_TRUE(m_manager->CreateSession(std::nullopt, b));

    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(a.id.size(), 32u);
    EXPECT_EQ(a.id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_TRUE(EphemeralSessionManager::IsValidSessionId(a.id));
}

TEST_F(EphemeralSessionManagerTest, PassesBrowserArguments) {
    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::nullopt, info));

    const auto args = m_provider->LastArguments();
    EXPECT_EQ(args.size(), SessionManagerConstants::DEFAULT_BROWSER_ARGUMENTS.size());
    EXPECT_THAT(args, ::testing::Contains("--no-first-run"));
    EXPECT_THAT(args, ::testing::Not(::testing::Contains("--disable-web-security")));
}

TEST_F(EphemeralSessionManagerTest, ConcurrentCreatesAreIsolated) {
    std::vector<std::future<SessionOutcome>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(m_manager->CreateSessionAsync(std::nullopt));
    }

    std::set<std::string> ids;
    std::set<fs::path> paths;
    for (auto& f : futures) {
        const SessionOutcome outcome = f.get();
        ASSERT_TRUE(outcome.ok) << outcome.error.message;
        ids.insert(outcome.info.id);
        paths.insert(outcome.info.storagePath);
    }

    EXPECT_EQ(ids.size(), 5u);
    EXPECT_EQ(paths.size(), 5u);
    EXPECT_EQ(m_manager->ListActive().size(), 5u);
}

TEST_F(EphemeralSessionManagerTest, ConcurrentCreatesWithSameIdYieldOneWinner) {
    std::vector<std::future<SessionOutcome>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(m_manager->CreateSessionAsync(std::string("shared")));
    }

    int winners = 0;
    for (auto& f : futures) {
        const SessionOutcome outcome = f.get();
        if (outcome.ok) {
            ++winners;
        }
        else {
            EXPECT_EQ(outcome.error.code, SessionErrorCode::AlreadyExists);
        }
    }
    EXPECT_EQ(winners, 1);
    EXPECT_EQ(m_provider->Paths().size(), 1u);
}

TEST_F(EphemeralSessionManagerTest, DuplicateIdIsRejected) {
    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::string("dup"), info));

    SessionInfo second;
    SessionError err;
    EXPECT_FALSE(m_manager->CreateSession(std::string("dup"), second, &err));
    EXPECT_EQ(err.code, SessionErrorCode::AlreadyExists);
    EXPECT_TRUE(fs::exists(info.storagePath));
}

TEST_F(EphemeralSessionManagerTest, ExistingDirectoryOnDiskIsRejected) {
    fs::create_directories(m_dir / "sessions" / "leftover");
    SessionInfo info;
    SessionError err;
    EXPECT_FALSE(m_manager->CreateSession(std::string("leftover"), info, &err));
    EXPECT_EQ(err.code, SessionErrorCode::AlreadyExists);
    EXPECT_TRUE(m_provider->Paths().empty());
}

TEST_F(EphemeralSessionManagerTest, InvalidIdsAreRejected) {
    for (const std::string& id : {std::string(""), std::string("../escape"), std::string("a/b"),
                                  std::string("has space"), std::string(129, 'a')}) {
        SessionInfo info;
        SessionError err;
        EXPECT_FALSE(m_manager->CreateSession(id, info, &err)) << id;
        EXPECT_EQ(err.code, SessionErrorCode::InvalidId) << id;
    }
    EXPECT_FALSE(fs::exists(m_dir / "escape"));
    EXPECT_TRUE(EphemeralSessionManager::IsValidSessionId(std::string(128, 'a')));
}

TEST_F(EphemeralSessionManagerTest, UnknownIdLookupsReturnNothing) {
    EXPECT_EQ(m_manager->GetEnvironment("non-existent"), nullptr);
    EXPECT_FALSE(m_manager->GetSession("non-existent").has_value());
}

TEST_F(EphemeralSessionManagerTest, DisposeUnknownIdIsNoOp) {
    SessionError err;
    EXPECT_TRUE(m_manager->DisposeSession("non-existent", &err));
    EXPECT_FALSE(err.hasError());
}

TEST_F(EphemeralSessionManagerTest, DisposeReleasesAndWipes) {
    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::string("to-dispose"), info));
    WriteFile(info.storagePath / "Default" / "Cookies", "secret");

    ASSERT_TRUE(m_manager->DisposeSession("to-dispose"));
    EXPECT_FALSE(fs::exists(info.storagePath));
    EXPECT_EQ(m_provider->released.load(), 1);
    EXPECT_EQ(m_manager->GetEnvironment("to-dispose"), nullptr);
    EXPECT_TRUE(m_manager->ListActive().empty());

    EXPECT_TRUE(m_manager->DisposeSession("to-dispose"));
    EXPECT_EQ(m_provider->released.load(), 1);
}

TEST_F(EphemeralSessionManagerTest, AsyncDisposeRemovesSession) {
    auto created = m_manager->CreateSessionAsync(std::string("async-session")).get();
    ASSERT_TRUE(created.ok) << created.error.message;

    auto disposed = m_manager->DisposeSessionAsync("async-session").get();
    EXPECT_TRUE(disposed.ok);
    EXPECT_EQ(GetSessionErrorCodeName(disposed.error.code), "None");
    EXPECT_FALSE(fs::exists(created.info.storagePath));
    EXPECT_FALSE(m_manager->GetSession("async-session").has_value());
    EXPECT_EQ(GetSessionStateName(SessionState::Disposed), "Disposed");
}

TEST_F(EphemeralSessionManagerTest, DisposedIdCanBeReused) {
    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::string("again"), info));
    ASSERT_TRUE(m_manager->DisposeSession("again"));
    EXPECT_TRUE(m_manager->CreateSession(std::string("again"), info));
}

TEST_F(EphemeralSessionManagerTest, DisposeWaitsBoundedForEnvironmentExit) {
    auto provider = std::make_shared<MockEnvironmentProvider>();
    auto environment = std::make_unique<MockBrowsingEnvironment>();
    auto* env = environment.get();
    EXPECT_CALL(*env, Release()).Times(1);
    EXPECT_CALL(*env, WaitForExit(std::chrono::milliseconds(50))).WillOnce(Return(false));
    EXPECT_CALL(*provider, CreateEnvironment(_, _)).WillOnce(Return(ByMove(std::move(environment))));

    auto manager = MakeManager(provider);
    SessionInfo info;
    ASSERT_TRUE(manager->CreateSession(std::string("slow-exit"), info));
    EXPECT_TRUE(manager->DisposeSession("slow-exit"));
    EXPECT_FALSE(fs::exists(info.storagePath));
    EXPECT_EQ(manager->GetStatistics().environmentExitTimeouts.load(), 1u);
}

TEST_F(EphemeralSessionManagerTest, OrphanSweepSkipsSessionBeingDisposed) {
    auto provider = std::make_shared<MockEnvironmentProvider>();
    EphemeralSessionManager* manager = nullptr;
    fs::path storage;
    bool storageSurvivedSweep = false;

    EXPECT_CALL(*provider, CreateEnvironment(_, _))
        .WillOnce(Invoke([&](const fs::path& path, const std::vector<std::string>&) {
            storage = path;
            return std::unique_ptr<IBrowsingEnvironment>(std::make_unique<ExitActionEnvironment>([&] {
                manager->CleanupOrphans();
                storageSurvivedSweep = fs::is_directory(storage);
            }));
        }));

    auto owned = MakeManager(provider, std::chrono::seconds(0));
    manager = owned.get();

    SessionInfo info;
    ASSERT_TRUE(manager->CreateSession(std::string("closing-tab"), info));
    EXPECT_TRUE(manager->DisposeSession("closing-tab"));

    EXPECT_TRUE(storageSurvivedSweep);
    EXPECT_EQ(manager->GetStatistics().orphansRemoved.load(), 0u);
    EXPECT_EQ(manager->GetStatistics().sweepsRun.load(), 1u);
    EXPECT_FALSE(fs::exists(info.storagePath));
}

TEST_F(EphemeralSessionManagerTest, TeardownHookRunsAfterReleaseBeforeWipe) {
    int releasedAtHook = -1;
    bool storageAtHook = false;
    bool activeAtHook = true;
    m_manager->SetTeardownHook([&](const SessionInfo& session) {
        releasedAtHook = m_provider->released.load();
        storageAtHook = fs::is_directory(session.storagePath);
        activeAtHook = session.active;
    });

    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::string("hooked"), info));
    ASSERT_TRUE(m_manager->DisposeSession("hooked"));

    EXPECT_EQ(releasedAtHook, 1);
    EXPECT_TRUE(storageAtHook);
    EXPECT_FALSE(activeAtHook);
    EXPECT_FALSE(fs::exists(info.storagePath));
}

TEST_F(EphemeralSessionManagerTest, ThrowingTeardownHookStillWipes) {
    m_manager->SetTeardownHook([](const SessionInfo&) {
        throw std::runtime_error("gate purge failed");
    });

    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::string("hook-throws"), info));
    EXPECT_TRUE(m_manager->DisposeSession("hook-throws"));
    EXPECT_FALSE(fs::exists(info.storagePath));
    EXPECT_FALSE(m_manager->GetSession("hook-throws").has_value());
}

TEST_F(EphemeralSessionManagerTest, ProviderFailureRollsBack) {
    auto provider = std::make_shared<MockEnvironmentProvider>();
    EXPECT_CALL(*provider, CreateEnvironment(_, _))
        .WillOnce(Throw(std::runtime_error("runtime missing")))
        .WillOnce(Return(ByMove(std::unique_ptr<ShadowVeil::Privacy::IBrowsingEnvironment>())));

    auto manager = MakeManager(provider);
    for (int i = 0; i < 2; ++i) {
        SessionInfo info;
        SessionError err;
        EXPECT_FALSE(manager->CreateSession(std::string("broken"), info, &err));
        EXPECT_EQ(err.code, SessionErrorCode::EnvironmentFailure);
        EXPECT_FALSE(fs::exists(m_dir / "sessions" / "broken"));
        EXPECT_FALSE(manager->GetSession("broken").has_value());
    }
    EXPECT_EQ(manager->GetStatistics().creationFailures.load(), 2u);
}

TEST_F(EphemeralSessionManagerTest, ListActiveIsOrderedByCreation) {
    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::string("first"), info));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_TRUE(m_manager->CreateSession(std::string("second"), info));

    const auto active = m_manager->ListActive();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].id, "first");
    EXPECT_EQ(active[1].id, "second");
}

TEST_F(EphemeralSessionManagerTest, CleanupRemovesOnlyUnregisteredStaleDirectories) {
    auto manager = MakeManager(m_provider, std::chrono::seconds(0));

    SessionInfo live;
    ASSERT_TRUE(manager->CreateSession(std::string("live"), live));
    WriteFile(m_dir / "sessions" / "orphan-1" / "data", "x");
    WriteFile(m_dir / "sessions" / "orphan-2" / "data", "y");
    WriteFile(m_dir / "sessions" / "loose-file", "z");

    EXPECT_EQ(manager->CleanupOrphans(), 2u);
    EXPECT_FALSE(fs::exists(m_dir / "sessions" / "orphan-1"));
    EXPECT_FALSE(fs::exists(m_dir / "sessions" / "orphan-2"));
    EXPECT_TRUE(fs::exists(live.storagePath));
    EXPECT_TRUE(fs::exists(m_dir / "sessions" / "loose-file"));
    EXPECT_EQ(manager->GetStatistics().orphansRemoved.load(), 2u);
}

TEST_F(EphemeralSessionManagerTest, CleanupKeepsRecentDirectories) {
    WriteFile(m_dir / "sessions" / "fresh" / "data", "x");
    Backdate(m_dir / "sessions" / "fresh", std::chrono::hours(2));

    EXPECT_EQ(m_manager->CleanupOrphans(), 0u);
    EXPECT_TRUE(fs::exists(m_dir / "sessions" / "fresh"));
}

TEST_F(EphemeralSessionManagerTest, CleanupWithoutBaseDirectoryIsNoOp) {
    EXPECT_EQ(m_manager->CleanupOrphans(), 0u);
    EXPECT_EQ(m_manager->GetStatistics().sweepsRun.load(), 1u);
}

TEST_F(EphemeralSessionManagerTest, DisposeAllRemovesEverything) {
    for (int i = 0; i < 3; ++i) {
        SessionInfo info;
        ASSERT_TRUE(m_manager->CreateSession(std::nullopt, info));
    }
    WriteFile(m_dir / "sessions" / "stray" / "data", "x");

    m_manager->DisposeAll();
    EXPECT_TRUE(m_manager->IsShutDown());
    EXPECT_TRUE(m_manager->ListActive().empty());
    EXPECT_FALSE(fs::exists(m_dir / "sessions"));
    EXPECT_EQ(m_provider->released.load(), 3);

    SessionInfo info;
    SessionError err;
    EXPECT_FALSE(m_manager->CreateSession(std::nullopt, info, &err));
    EXPECT_EQ(err.code, SessionErrorCode::ShuttingDown);
    EXPECT_FALSE(m_manager->Start());

    m_manager->DisposeAll();
    EXPECT_EQ(m_provider->released.load(), 3);
}

TEST_F(EphemeralSessionManagerTest, DestructorDisposesSessions) {
    SessionInfo info;
    ASSERT_TRUE(m_manager->CreateSession(std::string("scoped"), info));
    m_manager.reset();
    EXPECT_FALSE(fs::exists(info.storagePath));
    EXPECT_EQ(m_provider->released.load(), 1);
}

TEST_F(EphemeralSessionManagerTest, StartAndStopSweep) {
    ASSERT_TRUE(m_manager->Start());
    EXPECT_FALSE(m_manager->Start());
    m_manager->Stop();
    EXPECT_TRUE(m_manager->Start());
}

TEST_F(EphemeralSessionManagerTest, NullProviderThrows) {
    SessionManagerConfiguration config;
    config.basePath = m_dir / "sessions";
    EXPECT_THROW(EphemeralSessionManager(config, nullptr, nullptr), std::invalid_argument);
}

TEST_F(EphemeralSessionManagerTest, InvalidConfigurationKeepsBasePath) {
    SessionManagerConfiguration config;
    config.basePath = m_dir / "custom";
    config.sweepInterval = std::chrono::seconds(0);
    EphemeralSessionManager manager(config, m_provider, nullptr);
    EXPECT_EQ(manager.GetBasePath(), m_dir / "custom");
    EXPECT_EQ(manager.GetConfiguration().sweepInterval,
              std::chrono::seconds(SessionManagerConstants::DEFAULT_SWEEP_INTERVAL_SECONDS));
}
