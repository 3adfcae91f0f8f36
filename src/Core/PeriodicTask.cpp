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
#include "PeriodicTask.hpp"

#include <exception>

namespace ShadowVeil {
namespace Core {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           std::function<void()> body)
    : m_name(std::move(name)), m_interval(interval), m_body(std::move(body)) {
}

PeriodicTask::~PeriodicTask() {
    Stop();
}

bool PeriodicTask::Start() {
    if (m_interval.count() <= 0 || !m_body) {
        SV_LOG_WARN("PeriodicTask", "%s: refusing to start (interval %lld ms)",
                    m_name.c_str(), static_cast<long long>(m_interval.count()));
        return false;
    }

    bool expected = false;
    if (!m_started.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }

    {
        std::lock_guard lock(m_timerMutex);
        m_stopRequested = false;
    }
    m_thread = std::thread(&PeriodicTask::TimerLoop, this);
    SV_LOG_DEBUG("PeriodicTask", "%s: started, interval %lld ms",
                 m_name.c_str(), static_cast<long long>(m_interval.count()));
    return true;
}

void PeriodicTask::Stop() {
    if (!m_started.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard lock(m_timerMutex);
        m_stopRequested = true;
    }
    m_timerCv.notify_all();

    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
    else if (m_thread.joinable()) {
        m_thread.detach();
    }
    m_started.store(false, std::memory_order_release);
    SV_LOG_DEBUG("PeriodicTask", "%s: stopped after %llu run(s)",
                 m_name.c_str(), static_cast<unsigned long long>(m_runs.load()));
}

bool PeriodicTask::TriggerNow() {
    return RunOnce();
}

bool PeriodicTask::IsRunning() const {
    std::lock_guard lock(m_stateMutex);
    return std::holds_alternative<Running>(m_state);
}

void PeriodicTask::TimerLoop() {
    std::unique_lock lock(m_timerMutex);
    while (!m_stopRequested) {
        if (m_timerCv.wait_for(lock, m_interval, [this] { return m_stopRequested; })) {
            break;
        }
        lock.unlock();
        RunOnce();
        lock.lock();
    }
}

bool PeriodicTask::RunOnce() {
    {
        std::lock_guard lock(m_stateMutex);
        if (std::holds_alternative<Running>(m_state)) {
            m_skips++;
            SV_LOG_DEBUG("PeriodicTask", "%s: previous run still in flight, skipping", m_name.c_str());
            return false;
        }
        m_state = Running{std::chrono::steady_clock::now()};
    }

    try {
        m_body();
    }
    catch (const std::exception& e) {
        SV_LOG_ERROR("PeriodicTask", "%s: run failed: %s", m_name.c_str(), e.what());
    }

    {
        std::lock_guard lock(m_stateMutex);
        m_state = Idle{};
    }
    m_runs++;
    return true;
}

}  // namespace Core
}  // namespace ShadowVeil
