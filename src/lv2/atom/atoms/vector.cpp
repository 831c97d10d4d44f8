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
#include "lv2/atom/atoms/vector.hpp"

namespace lv2::atom
{

// Vector_reader implementations.

Vector_reader::Vector_reader(const Vector_body& body, Byte_space elements) :
  m_body(body),
  m_elements(elements)
{
  // Nothing else.
}

urid_t Vector_reader::child_type() const
{
  return m_body.m_child_type;
}

size_t Vector_reader::child_size() const
{
  return m_body.m_child_size;
}

// Vector_type_writer implementations.

Vector_type_writer::Vector_type_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

// Vector implementations.

std::optional<Vector::Read_handle> Vector::read(Atom_space body, Error_code* err_code) // Static.
{
  assert(err_code);

  Space_reader reader(body);
  const auto vector_body = reader.next_value<Vector_body>(err_code);
  if (!vector_body)
  {
    return std::nullopt;
  }
  // else
  return Vector_reader(*vector_body, reader.into_remaining());
}

std::optional<Vector::Write_handle> Vector::init(Atom_writer&& writer, Error_code* err_code) // Static.
{
  assert(err_code);
  err_code->clear();
  return Vector_type_writer(std::move(writer));
}

} // namespace lv2::atom
