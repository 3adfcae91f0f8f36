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

#include <future>

#include "../src/Core/PeriodicTask.hpp"

using ShadowVeil::Core::PeriodicTask;
using namespace std::chrono_literals;

TEST(PeriodicTaskTest, RunsOnInterval) {
    std::atomic<int> runs{0};
    PeriodicTask task("Tick", 10ms, [&] { runs++; });
    ASSERT_TRUE(task.Start());
    EXPECT_TRUE(task.IsStarted());

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    task.Stop();

    EXPECT_GE(runs.load(), 3);
    EXPECT_FALSE(task.IsStarted());
    EXPECT_EQ(task.GetRunCount(), static_cast<uint64_t>(runs.load()));
}

TEST(PeriodicTaskTest, RefusesNonPositiveIntervalAndDoubleStart) {
    PeriodicTask zero("Zero", 0ms, [] {});
    EXPECT_FALSE(zero.Start());

    PeriodicTask task("Once", 1h, [] {});
    ASSERT_TRUE(task.Start());
    EXPECT_FALSE(task.Start());
    task.Stop();
}

TEST(PeriodicTaskTest, StopWithoutStartIsHarmless) {
    PeriodicTask task("Idle", 1h, [] {});
    task.Stop();
    EXPECT_FALSE(task.IsStarted());
}

TEST(PeriodicTaskTest, OverlappingTriggerIsSkipped) {
    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();

    PeriodicTask task("Slow", 1h, [&, releaseFuture] {
        entered.set_value();
        releaseFuture.wait();
    });

    std::thread first([&] { EXPECT_TRUE(task.TriggerNow()); });
    entered.get_future().wait();

    EXPECT_TRUE(task.IsRunning());
    EXPECT_FALSE(task.TriggerNow());
    EXPECT_EQ(task.GetSkipCount(), 1u);

    release.set_value();
    first.join();
    EXPECT_FALSE(task.IsRunning());
    EXPECT_EQ(task.GetRunCount(), 1u);
}

TEST(PeriodicTaskTest, ThrowingBodyDoesNotStopTask) {
    int calls = 0;
    PeriodicTask task("Throws", 1h, [&] {
        ++calls;
        throw std::runtime_error("boom");
    });
    EXPECT_TRUE(task.TriggerNow());
    EXPECT_TRUE(task.TriggerNow());
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(task.IsRunning());
}
