#pragma once
/**
 * @file ckv_base.hpp
 * @brief Layer 1: Basic modules built on ckv_platform.
 *
 * Provides format_tools, debug_info (CKV_PANIC, CKV_DEBUG, stack traces), scope_guard,
 * the Result type and the Logger. Include this when you need formatting, debug
 * utilities, logging or basic RAII guards.
 */
#include "ckv_platform.hpp"

#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
#include "utils/logger.hpp"
