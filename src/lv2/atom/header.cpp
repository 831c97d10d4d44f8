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
#include "lv2/atom/header.hpp"

namespace lv2::atom
{

// Implementations.

Atom_header Atom_header::create(urid_t type) // Static.
{
  return Atom_header{ 0, type };
}

size_t Atom_header::size_of_body() const
{
  return m_size_of_body;
}

size_t Atom_header::size_of_atom() const
{
  return sizeof(Atom_header) + size_of_body();
}

size_t Atom_header::padded_size_of_atom() const
{
  return padded_size(size_of_atom());
}

urid_t Atom_header::type() const
{
  return m_type;
}

std::ostream& operator<<(std::ostream& os, const Atom_header& val)
{
  return os << "type[" << val.m_type << "] size_of_body[" << val.m_size_of_body << ']';
}

} // namespace lv2::atom
