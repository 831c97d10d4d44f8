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

#include "lv2/atom/atom_fwd.hpp"

namespace lv2::atom
{

// Types.

/**
 * The 8-byte record preceding every atom's body: body size, then type tag, both native-endian.  It is
 * `alignas(8)`, and so is every place an atom may start; the total footprint of an atom is
 * `sizeof(Atom_header) + size_of_body()` rounded up to a multiple of 8, the rounding being implicit: whatever
 * comes next realigns itself.
 *
 * The layout is bit-exact with `LV2_Atom` of the LV2 C API.
 */
struct alignas(8) Atom_header
{
  // Methods.

  /**
   * Header of an empty atom of the given type.
   *
   * @param type
   *        Type tag.
   * @return See above.
   */
  static Atom_header create(urid_t type);

  /**
   * Exact byte count of the body, excluding trailing padding.
   * @return See above.
   */
  size_t size_of_body() const;

  /**
   * `sizeof(Atom_header) + size_of_body()`.
   * @return See above.
   */
  size_t size_of_atom() const;

  /**
   * size_of_atom() rounded up to a multiple of 8: the distance to where the next atom may start.
   * @return See above.
   */
  size_t padded_size_of_atom() const;

  /**
   * Type tag.
   * @return See above.
   */
  urid_t type() const;

  // Data.

  /// See size_of_body().
  uint32_t m_size_of_body;

  /// See type().
  uint32_t m_type;
}; // struct Atom_header

static_assert(sizeof(Atom_header) == 8, "Atom header layout must match LV2_Atom.");

// Free functions.

/**
 * `size` rounded up to a multiple of 8.
 *
 * @param size
 *        Byte count.
 * @return See above.
 */
constexpr size_t padded_size(size_t size)
{
  return (size + 7) & ~size_t(7);
}

} // namespace lv2::atom
