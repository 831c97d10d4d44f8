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
#include "lv2/atom/space/space_reader.hpp"

namespace lv2::atom
{

// Implementations.

Space_reader::Space_reader(Byte_space space) :
  m_space(space)
{
  // That's it.
}

std::optional<Byte_space> Space_reader::next_bytes(size_t n_bytes, Error_code* err_code)
{
  using Result = std::optional<Byte_space>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, next_bytes, n_bytes, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto split = m_space.split_at(n_bytes);
  if (!split)
  {
    *err_code = error::Code::S_READING_OUT_OF_BOUNDS;
    return std::nullopt;
  }
  // else
  err_code->clear();

  m_space = split->second;
  return split->first;
}

const Unidentified_atom* Space_reader::next_atom(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(const Unidentified_atom*, next_atom, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto space = realigned<Atom_header>(sizeof(Atom_header), err_code);
  if (!space)
  {
    return nullptr;
  }
  // else

  // Checks the declared body against what remains.
  const auto atom = Unidentified_atom::from_space(*space, err_code);
  if (!atom)
  {
    return nullptr;
  }
  // else

  advance_to(space->data() + atom->header().size_of_atom());
  return atom;
}

Byte_space Space_reader::remaining_bytes() const
{
  return m_space;
}

Byte_space Space_reader::into_remaining()
{
  const auto remaining = m_space;
  advance_to(m_space.data() + m_space.size());
  return remaining;
}

void Space_reader::advance_to(const uint8_t* pos)
{
  assert((pos >= m_space.data()) && (pos <= (m_space.data() + m_space.size()))
         && "Advancing a reader outside of its remaining bytes.");

  const size_t n_consumed = pos - m_space.data();
  m_space = Byte_space::from_bytes_unchecked(pos, m_space.size() - n_consumed);
}

} // namespace lv2::atom
