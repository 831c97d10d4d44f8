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

#include "lv2/atom/header.hpp"
#include "lv2/atom/space/aligned_space.hpp"
#include <flow/error/error.hpp>
#include <optional>

namespace lv2::atom
{

// Types.

/**
 * An atom of not-yet-known type: an Atom_header immediately followed by its body, viewed in place.  One never
 * constructs, copies or owns an Unidentified_atom; one obtains a `const Unidentified_atom*` pointing into a buffer
 * (from Space_reader::next_atom(), an iterator over a container atom, or from_space()), valid as long as the
 * buffer is.  Its footprint (header() plus body()) was verified to lie within the buffer when the pointer was
 * produced.
 *
 * To access the value, *identify* the atom by calling read() with the atom type and its type tag.  That compares
 * the stored tag to the one given (integers only) and, if they match, lets the atom type decode the body.
 *
 * @see Atom_header.
 */
class Unidentified_atom
{
public:
  // Constructors/destructor.

  /// Forbid copying: it would slice off the body.
  Unidentified_atom(const Unidentified_atom&) = delete;

  // Methods.

  /// Forbid copying: it would slice off the body.
  Unidentified_atom& operator=(const Unidentified_atom&) = delete;

  /**
   * Interprets the start of the given space as an atom, checking that the header fits and that the body it
   * declares fits too.  Trailing bytes beyond that are allowed and ignored.
   *
   * @param space
   *        Space beginning with an atom header.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_READING_OUT_OF_BOUNDS.
   * @return Pointer into `space`; or null on error.
   */
  static const Unidentified_atom* from_space(Atom_space space, Error_code* err_code = 0);

  /**
   * The header.
   * @return See above.
   */
  const Atom_header& header() const;

  /**
   * The body: `header().size_of_body()` bytes right after the header.
   * @return See above.
   */
  Atom_space body() const;

  /**
   * Header plus body; excludes trailing padding.
   * @return See above.
   */
  Atom_space atom_space() const;

  /**
   * Identifies `*this` as atom type `Atom` with type tag `type`, returning its read handle.  Fails if the stored
   * tag differs, or if `Atom` rejects the body.
   *
   * @tparam Atom
   *         Atom type, such as Int, Vector or Object.
   * @param type
   *        Type tag registered for `Atom` (see Atom_urid_collection).
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ATOM_URID (tag mismatch); whatever `Atom::read()` emits otherwise.
   * @return The read handle; or empty on error.
   */
  template<typename Atom>
  std::optional<typename Atom::Read_handle> read(urid_t type, Error_code* err_code = 0) const;

private:
  // Constructors.

  /// Never constructed: only viewed in place.
  Unidentified_atom() = delete;

  // Data.

  /// The header; the body follows in memory.
  Atom_header m_header;
}; // class Unidentified_atom

// Template implementations.

template<typename Atom>
std::optional<typename Atom::Read_handle> Unidentified_atom::read(urid_t type, Error_code* err_code) const
{
  using Result = std::optional<typename Atom::Read_handle>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, read<Atom>, type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_header.type() != type)
  {
    *err_code = error::Code::S_INVALID_ATOM_URID;
    return std::nullopt;
  }
  // else
  err_code->clear();
  return Atom::read(body(), err_code);
}

} // namespace lv2::atom
