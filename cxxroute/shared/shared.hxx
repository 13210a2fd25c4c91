/**
 * @file shared.hxx
 * @brief Common includes, macros, and shared namespace for the CXXROUTE.
 */

#ifndef CXXROUTE_SHARED_HXX
#define CXXROUTE_SHARED_HXX

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <sstream>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/asio.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/url.hpp>

#include <boost/beast.hpp>

#include <boost/system/system_error.hpp>

#include <boost/unordered_map.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <boost/filesystem.hpp>

#include <boost/lexical_cast.hpp>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#if defined(_WIN32)
#include <stdlib.h>
#endif // _WIN32

#ifdef __MSVC_COMPILER__
/** @brief Forces function inlining. */
#define CXXROUTE_INLINE __forceinline

/** @brief Prevents function inlining. */
#define CXXROUTE_NOINLINE __declspec(noinline)
#elif __CLANG_COMPILER__ || __GCC_COMPILER__ || __INTEL_COMPILER__
/** @brief Forces function inlining. */
#define CXXROUTE_INLINE __attribute__((always_inline)) inline

/** @brief Prevents function inlining. */
#define CXXROUTE_NOINLINE __attribute__((noinline))
#else
/** @brief Forces function inlining. */
#define CXXROUTE_INLINE inline

/** @brief Prevents function inlining. */
#define CXXROUTE_NOINLINE
#endif // ...

#include <nlohmann/json.hpp>

#ifdef CXXROUTE_USE_LOGGING_IMPL
#include "logging/logging.hxx"
#endif // CXXROUTE_USE_LOGGING_IMPL

#include "json_traits/json_traits.hxx"

/**
 * @namespace shared
 * @brief Contains shared types and utilities used across the CXXROUTE.
 *
 * Components here are not tied to routing: the logger, the JSON traits
 * and the platform-specific macros.
 */
namespace shared {
    // ...
}

#endif // CXXROUTE_SHARED_HXX
