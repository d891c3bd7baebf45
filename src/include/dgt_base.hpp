#pragma once
/**
 * @file dgt_base.hpp
 * @brief Layer 1: Basic modules built on dgt_platform.
 *
 * Provides format_tools, debug_info (panic / precondition / debug messages),
 * scope_guard and the Result<T, E> type. Include this when you need formatting,
 * debug utilities, basic RAII guards or value-or-error returns.
 */
#include "dgt_platform.hpp"

#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
