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
/*
 * ============================================================================
 * ShadowVeil - PRECOMPILED HEADER
 * ============================================================================
 * Includes: Stable STL, POSIX, and Core Framework headers.
 * ============================================================================
 */

#ifndef SHADOWVEIL_PCH_H
#define SHADOWVEIL_PCH_H

#pragma once

// POSIX
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>

// C++20 Standard Library - Core & Containers
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <variant>
#include <cstdint>
#include <algorithm>
#include <iterator>
#include <type_traits>
#include <filesystem>

// C++20 - Concurrency & Time
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <future>
#include <chrono>

// Performance & Memory
#include <limits>

#endif // SHADOWVEIL_PCH_H
