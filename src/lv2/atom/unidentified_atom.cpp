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
#include "lv2/atom/unidentified_atom.hpp"

namespace lv2::atom
{

// Implementations.

const Unidentified_atom* Unidentified_atom::from_space(Atom_space space, Error_code* err_code) // Static.
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(const Unidentified_atom*, from_space, space, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto header = space.assume_init_value();
  if ((!header) || (header->size_of_atom() > space.size()))
  {
    *err_code = error::Code::S_READING_OUT_OF_BOUNDS;
    return nullptr;
  }
  // else
  err_code->clear();

  /* The header is in place and the declared body lies within `space`: the whole atom is addressable.  This is
   * the place a header-in-a-buffer becomes an atom view. */
  return reinterpret_cast<const Unidentified_atom*>(header);
}

const Atom_header& Unidentified_atom::header() const
{
  return m_header;
}

Atom_space Unidentified_atom::body() const
{
  const auto bytes = reinterpret_cast<const uint8_t*>(this) + sizeof(Atom_header);
  return Atom_space::from_bytes_unchecked(bytes, m_header.size_of_body());
}

Atom_space Unidentified_atom::atom_space() const
{
  return Atom_space::from_bytes_unchecked(reinterpret_cast<const uint8_t*>(this), m_header.size_of_atom());
}

std::ostream& operator<<(std::ostream& os, const Unidentified_atom& val)
{
  return os << '@' << &val << ' ' << val.header();
}

} // namespace lv2::atom
