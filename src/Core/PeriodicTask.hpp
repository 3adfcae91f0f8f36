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
/**
 * ============================================================================
 * ShadowVeil - PERIODIC TASK
 * ============================================================================
 *
 * @file PeriodicTask.hpp
 * @brief Fixed-interval background task with an Idle/Running guard.
 *
 * The body never overlaps itself: a tick (or a TriggerNow() call) that finds
 * the task Running is skipped and counted, never queued.
 * ============================================================================
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

#include "../Utils/Logger.hpp"

namespace ShadowVeil {
namespace Core {

/**
 * @class PeriodicTask
 * @brief Runs a callable every interval on a dedicated thread.
 *
 * USAGE:
 * @code
 *     PeriodicTask sweep("OrphanSweep", std::chrono::minutes(5),
 *                        [this] { CleanupOrphans(); });
 *     sweep.Start();
 *     ...
 *     sweep.Stop();
 * @endcode
 */
class PeriodicTask final {
public:
    struct Idle {};
    struct Running {
        std::chrono::steady_clock::time_point startedAt;
    };
    using State = std::variant<Idle, Running>;

    PeriodicTask(std::string name,
                 std::chrono::milliseconds interval,
                 std::function<void()> body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Start the timer thread. The first run happens one interval later.
     * @return false when already started or the interval is not positive
     */
    [[nodiscard]] bool Start();

    /**
     * @brief Stop the timer thread, waiting for an in-flight run to finish.
     */
    void Stop();

    /**
     * @brief Run the body on the calling thread unless a run is in flight.
     * @return false when skipped
     */
    bool TriggerNow();

    [[nodiscard]] bool IsStarted() const noexcept { return m_started.load(std::memory_order_acquire); }

    [[nodiscard]] bool IsRunning() const;

    [[nodiscard]] uint64_t GetRunCount() const noexcept { return m_runs.load(); }

    [[nodiscard]] uint64_t GetSkipCount() const noexcept { return m_skips.load(); }

    [[nodiscard]] const std::string& GetName() const noexcept { return m_name; }

private:
    void TimerLoop();
    bool RunOnce();

    std::string m_name;
    std::chrono::milliseconds m_interval;
    std::function<void()> m_body;

    mutable std::mutex m_stateMutex;
    State m_state{Idle{}};

    std::mutex m_timerMutex;
    std::condition_variable m_timerCv;
    bool m_stopRequested = false;
    std::thread m_thread;
    std::atomic<bool> m_started{false};

    std::atomic<uint64_t> m_runs{0};
    std::atomic<uint64_t> m_skips{0};
};

}  // namespace Core
}  // namespace ShadowVeil
