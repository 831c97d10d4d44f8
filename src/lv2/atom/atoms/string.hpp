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

#include "lv2/atom/space/atom_writer.hpp"
#include "lv2/atom/space/terminated.hpp"
#include "lv2/atom/detail/bodies.hpp"
#include <utility>

namespace lv2::atom
{

// Types.

/**
 * Write handle of String and Literal: appends UTF-8 text, keeping the body NUL-terminated after every call
 * (the previous terminator is overwritten by the next append).  The terminator is written as soon as the handle
 * exists, so an atom with no append() at all holds the empty string.
 */
class String_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the text writer.  Prefer String::init() and Literal_info_writer::write_info(), which also write
   * the initial terminator.
   *
   * @param writer
   *        Writer of the text, terminating with NUL.
   */
  explicit String_writer(Terminated<Atom_writer>&& writer);

  // Methods.

  /**
   * Appends `text`.  The caller is responsible for it being UTF-8 without NULs: readers reject the atom otherwise.
   *
   * @param text
   *        Text to append; may be empty.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated: allocation errors.
   *        On error the text is as before the call.
   * @return Pointer to the first appended character (with `text.size()` valid characters there); or null on
   *         error.
   */
  char* append(util::String_view text, Error_code* err_code = 0);

private:
  // Data.

  /// Writer of the text.
  Terminated<Atom_writer> m_writer;
}; // class String_writer

/// `atom:String`: NUL-terminated UTF-8 text.  Read handle: the text without the terminator.
struct String
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = util::String_view;

  /// See Space_writer::write_atom().
  using Write_handle = String_writer;

  // Methods.

  /**
   * Checks and returns the text.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_INVALID_ATOM_VALUE (no terminating NUL, or not
   *        UTF-8).
   * @return The text, valid as long as the buffer; or empty on error.
   */
  static std::optional<Read_handle> read(Atom_space body, Error_code* err_code);

  /**
   * Creates the write handle and writes the terminator.
   *
   * @param writer
   *        The atom's body writer.
   * @param err_code
   *        Not null.  #Error_code generated: allocation errors.
   * @return The handle; or empty on error.
   */
  static std::optional<Write_handle> init(Atom_writer&& writer, Error_code* err_code);
}; // struct String

/// What qualifies the text of a Literal: a language or a datatype, never both.
struct Literal_info
{
  // Types.

  /// Which one #m_urid is.
  enum class Kind
  {
    /// A language tag, e.g., the tag of `http://lexvo.org/id/iso639-1/de`.
    S_LANGUAGE,
    /// A datatype tag.
    S_DATATYPE
  };

  // Data.

  /// See Kind.
  Kind m_kind;

  /// The tag; not 0.
  urid_t m_urid;
}; // struct Literal_info

/// Initial write handle of a Literal: the info must be written (write_info()) before the text.
class Literal_info_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the literal's writer; nothing written yet.
   *
   * @param writer
   *        Writer of the literal body.
   */
  explicit Literal_info_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Writes the info, then turns into the text writer.  `*this` is spent after a success.
   *
   * @param info
   *        Language or datatype.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_URID, allocation errors.
   * @return The text writer; or empty on error.
   */
  std::optional<String_writer> write_info(const Literal_info& info, Error_code* err_code = 0);

private:
  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Literal_info_writer

/// `atom:Literal`: String with a language or datatype.
struct Literal
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = std::pair<Literal_info, util::String_view>;

  /// See Space_writer::write_atom().
  using Write_handle = Literal_info_writer;

  // Methods.

  /**
   * Checks and returns the info and text.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_READING_OUT_OF_BOUNDS,
   *        error::Code::S_INVALID_ATOM_VALUE (neither or both of language and datatype; text as for String).
   * @return See above; or empty on error.
   */
  static std::optional<Read_handle> read(Atom_space body, Error_code* err_code);

  /**
   * Creates the write handle.
   *
   * @param writer
   *        The atom's body writer.
   * @param err_code
   *        Not null.  Never fails.
   * @return The handle.
   */
  static std::optional<Write_handle> init(Atom_writer&& writer, Error_code* err_code);
}; // struct Literal

// Free functions.

/**
 * Returns `true` if and only if `lhs` and `rhs` are equal.
 *
 * @param lhs
 *        Object to compare.
 * @param rhs
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Literal_info& lhs, const Literal_info& rhs);

/**
 * Prints string representation of the given `Literal_info` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Literal_info& val);

} // namespace lv2::atom
