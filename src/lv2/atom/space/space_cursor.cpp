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
#include "lv2/atom/space/space_cursor.hpp"

namespace lv2::atom
{

// Implementations.

Space_cursor::Space_cursor(flow::log::Logger* logger_ptr, Byte_space_mut data) :
  Space_writer(logger_ptr),
  m_data(data),
  m_allocated_length(0)
{
  FLOW_LOG_TRACE("Space_cursor [" << *this << "]: Started over buffer "
                 "@[" << static_cast<const void*>(m_data.data()) << "] sized [" << m_data.size() << "].");
}

std::optional<Space_allocator::Split_allocation> Space_cursor::allocate_and_split(size_t size, Error_code* err_code)
{
  assert(err_code);

  const size_t n_remaining = m_data.size() - m_allocated_length;
  if (size > n_remaining)
  {
    FLOW_LOG_WARNING("Space_cursor [" << *this << "]: Out of space: requested [" << size << "] bytes; "
                     "used [" << m_allocated_length << "] of capacity [" << m_data.size() << "].  "
                     "Emitting error.");
    *err_code = error::Code::S_OUT_OF_SPACE;
    return std::nullopt;
  }
  // else

  const auto previous = Byte_space_mut::from_bytes_unchecked(m_data.data(), m_allocated_length);
  const auto allocated = Byte_space_mut::from_bytes_unchecked(m_data.data() + m_allocated_length, size);
  m_allocated_length += size;

  return Split_allocation{ previous, allocated };
}

bool Space_cursor::rewind(size_t byte_count, Error_code* err_code)
{
  assert(err_code);

  if (byte_count > m_allocated_length)
  {
    FLOW_LOG_WARNING("Space_cursor [" << *this << "]: Cannot rewind [" << byte_count << "] bytes: "
                     "only [" << m_allocated_length << "] are allocated.  Emitting error.");
    *err_code = error::Code::S_REWIND_BEYOND_ALLOCATED;
    return false;
  }
  // else

  m_allocated_length -= byte_count;
  return true;
}

Byte_space Space_cursor::allocated_bytes() const
{
  return Byte_space::from_bytes_unchecked(m_data.data(), m_allocated_length);
}

Byte_space_mut Space_cursor::allocated_bytes_mut()
{
  return Byte_space_mut::from_bytes_unchecked(m_data.data(), m_allocated_length);
}

Byte_space Space_cursor::remaining_bytes() const
{
  return Byte_space::from_bytes_unchecked(m_data.data() + m_allocated_length, m_data.size() - m_allocated_length);
}

} // namespace lv2::atom
