#pragma once
/**
 * @file hbl_base.hpp
 * @brief Layer 1: Basic modules built on hbl_platform.
 *
 * Provides format_tools and the scope_guard RAII helper.
 * Include this when you need formatting or basic RAII guards.
 */
#include "hbl_platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/scope_guard.hpp"
