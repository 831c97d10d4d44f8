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
#include "lv2/atom/atoms/tuple.hpp"

namespace lv2::atom
{

// Tuple_iterator implementations.

Tuple_iterator::Tuple_iterator(Atom_space body) :
  m_reader(body)
{
  // Nothing else.
}

std::optional<Tuple_iterator::Item> Tuple_iterator::next()
{
  Error_code err_code;
  const auto child = m_reader.next_atom(&err_code);
  if (!child)
  {
    return std::nullopt; // End of body, or a truncated child: either way the tuple ends here.
  }
  // else
  return child;
}

Tuple_iterator::Iterator Tuple_iterator::begin() const
{
  return Iterator(*this);
}

Tuple_iterator::Iterator Tuple_iterator::end() const
{
  return Iterator();
}

// Tuple_writer implementations.

Tuple_writer::Tuple_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

// Tuple implementations.

std::optional<Tuple::Read_handle> Tuple::read(Atom_space body, Error_code* err_code) // Static.
{
  assert(err_code);
  err_code->clear();
  return Tuple_iterator(body);
}

std::optional<Tuple::Write_handle> Tuple::init(Atom_writer&& writer, Error_code* err_code) // Static.
{
  assert(err_code);
  err_code->clear();
  return Tuple_writer(std::move(writer));
}

} // namespace lv2::atom
