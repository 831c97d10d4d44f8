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

#include "lv2/common.hpp"
#include <boost/system/error_code.hpp>
#include <istream>
#include <ostream>

/**
 * Namespace containing the lv2::atom module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.
 *
 * Every fallible lv2::atom operation follows the flow.error convention: it takes a trailing
 * `Error_code* err_code`; if that is null a failure throws `flow::error::Runtime_error` wrapping the code;
 * otherwise the code is written to `*err_code` (success clears it) and the operation's return value indicates
 * failure (null pointer, empty `optional`, `false`).  A failed write never leaves part of a value committed.
 *
 * Some codes correspond to conditions with numeric detail (how many bytes were requested versus available, for
 * example).  That detail is logged (WARNING level) by the object emitting the code.
 */
namespace lv2::atom::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by lv2::atom functions/methods *outside of*
 * boost.system errors.
 *
 * The first group concerns alignment, the second writing, the third reading.
 */
enum class Code
{
  /**
   * Atom space: a byte range does not start at an address aligned as required for the target type, or it is
   * too short to be realigned by skipping padding.
   */
  S_SPACE_MISALIGNED = S_CODE_LOWEST_INT_VALUE,

  /// Atom writing: the fixed-capacity buffer has fewer unallocated bytes left than requested.
  S_OUT_OF_SPACE,

  /// Atom writing: asked to rewind (un-allocate) more bytes than are allocated.
  S_REWIND_BEYOND_ALLOCATED,

  /// Atom writing: the write would push an atom's recorded body size beyond the 32-bit size field.
  S_WRITING_OUT_OF_BOUNDS,

  /// Atom writing: the operation is illegal in the writer's current state (e.g., non-monotonic time stamp).
  S_WRITING_ILLEGAL_STATE,

  /// Atom writing: an atom was already written to this output port during this processing cycle.
  S_ATOM_ALREADY_WRITTEN,

  /// Atom reading: the atom's type tag does not match the expected type tag.
  S_INVALID_ATOM_URID,

  /// Atom reading/writing: a URID of 0 (none) was found or supplied where a non-zero URID is required.
  S_INVALID_URID,

  /// Atom reading: fewer bytes remain than the value or atom being read requires.
  S_READING_OUT_OF_BOUNDS,

  /// Atom reading: a value is structurally present but semantically invalid (e.g., bad UTF-8, missing NUL).
  S_INVALID_ATOM_VALUE,

  /// Atom reading: a Vector's child type tag or child size does not match the requested element type.
  S_ATOM_URID_MISMATCH,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight flow::Error_code (boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * `Error_code` to the (lv2::atom-specific) error code set.
 *
 * @param err_code
 *        `enum` value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a lv2::atom::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a `Code`.  If none is
 * recognized, `Code::S_END_SENTINEL` is the result.  The recognized values are:
 *   - "<N>", where `<N>` is the numeric value of the `int` corresponding to a `Code`;
 *   - the symbolic form of a `Code` sans `S_` prefix, case-insensitive (e.g., "out_of_space").
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a lv2::atom::error::Code to a standard output stream.  Its symbolic form is printed, sans `S_`
 * prefix; it is therefore readable by `operator>>()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace lv2::atom::error

namespace boost::system
{

// Types.

/**
 * Specialization that tells boost.system that lv2::atom::error::Code values may be implicitly converted to
 * `Error_code` (via lv2::atom::error::make_error_code(), found by ADL).  Unspecialized, `value` is `false`, so
 * that arbitrary `enum`s do not become error codes by accident.
 */
template<>
struct is_error_code_enum<::lv2::atom::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
