/* LV2-Atom: In-place Atom Format
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#pragma once

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/string_view.hpp>
#include <boost/unordered_map.hpp>
#include <string>
#include <cstdint>
#include <cstddef>

/**
 * Catch-all namespace for the LV2 support libraries: the in-place Atom format (lv2::atom) and the shared
 * facilities (logging components, error code type) on which it builds.
 */
namespace lv2
{

// Types.

/// Short-hand for the boost.system error code type, as used throughout the Flow family.
using Error_code = flow::Error_code;

/**
 * The `flow::log::Component` payload type for every log call site in the lv2 libraries.  Register the names
 * via `flow::log::Config::init_component_names()` with #S_LV2_LOG_COMPONENT_NAME_MAP, and the index mapping via
 * `flow::log::Config::init_component_to_union_idx_mapping()`, before logging.
 */
enum class Log_component
{
  /// Not categorized.
  S_UNCAT = 0,
  /// lv2::atom space and atom machinery: cursors, writers, growable buffers.
  S_ATOM,
  /// URID (URI-to-integer) mapping.
  S_URID,
  /// Host port buffer endpoints.
  S_PORT,
  /// SENTINEL: Not a component.  Must be last.
  S_END_SENTINEL
}; // enum class Log_component

// Globals.

/// Names of the #Log_component values, for `flow::log::Config::init_component_names()`.
extern const boost::unordered_multimap<Log_component, std::string> S_LV2_LOG_COMPONENT_NAME_MAP;

} // namespace lv2

/// Short-hand utilities shared by the lv2 libraries.
namespace lv2::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

} // namespace lv2::util
