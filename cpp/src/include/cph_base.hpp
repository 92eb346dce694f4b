#pragma once
/**
 * @file cph_base.hpp
 * @brief Layer 1: Basic modules built on cph_platform.
 *
 * Provides format_tools, debug_info, and the foundational RAII and error-handling
 * helpers: scope_guard and result. Include this when you need formatting, debug
 * utilities, or basic guards.
 */
#include "cph_platform.hpp"

// Standard library support required by format_tools, debug_info, and guards
#include <atomic>
#include <cstdint>
#include <filesystem>
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
