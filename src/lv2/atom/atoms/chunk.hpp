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

namespace lv2::atom
{

// Types.

/**
 * `atom:Chunk`: a body of raw bytes with no structure.  Read handle: the body bytes.  Write handle: the body's
 * Atom_writer itself, so anything Space_writer offers (`allocate()`, `write_bytes()`, ...) can fill it.
 *
 * Hosts also use a Chunk to announce the capacity of an output port buffer; see Atom_port::output_from_raw().
 */
struct Chunk
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = Byte_space;

  /// See Space_writer::write_atom().
  using Write_handle = Atom_writer;

  // Methods.

  /**
   * Returns the body bytes.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  Never fails.
   * @return See above.
   */
  static std::optional<Read_handle> read(Atom_space body, Error_code* err_code);

  /**
   * Returns `writer` itself.
   *
   * @param writer
   *        The atom's body writer.
   * @param err_code
   *        Not null.  Never fails.
   * @return See above.
   */
  static std::optional<Write_handle> init(Atom_writer&& writer, Error_code* err_code);
}; // struct Chunk

} // namespace lv2::atom
