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
#include "lv2/atom/space/aligned_vec.hpp"
#include <algorithm>
#include <cstring>

namespace lv2::atom
{

// Vec_space implementations.

Vec_space::Vec_space(const Config& config) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_ATOM),
  m_blob(config.m_logger_ptr)
{
  resize(config.m_initial_size);
  FLOW_LOG_TRACE("Vec_space [" << *this << "]: Started with [" << size() << "] zeroed bytes.");
}

Vec_space::~Vec_space()
{
  FLOW_LOG_TRACE("Vec_space [" << *this << "]: Freeing [" << size() << "] bytes.");
}

size_t Vec_space::size() const
{
  return m_blob.size();
}

void Vec_space::resize(size_t new_size)
{
  using flow::util::Blob;
  using std::memcpy;
  using std::memset;

  const size_t old_size = size();
  if ((new_size <= old_size) || ((m_blob.capacity() - m_blob.start()) >= new_size))
  {
    // Fits in the current storage; zero whatever is newly exposed.
    m_blob.resize(new_size);
    if (new_size > old_size)
    {
      memset(m_blob.begin() + old_size, 0, new_size - old_size);
    }
    return;
  }
  // else: must relocate.

  /* Reserve enough slack to slide start() forward to an aligned address; then begin() is aligned regardless of
   * what the allocator returned. */
  Blob new_blob(get_logger());
  new_blob.reserve(new_size + S_ALIGNMENT - 1);
  const size_t prefix = Atom_space_mut::padding_for(new_blob.begin());
  new_blob.resize(new_size, prefix);
  assert(Atom_space_mut::padding_for(new_blob.begin()) == 0);

  memset(new_blob.begin(), 0, new_size);
  if (old_size != 0)
  {
    memcpy(new_blob.begin(), m_blob.begin(), old_size);
  }

  FLOW_LOG_TRACE("Vec_space [" << *this << "]: Grew from [" << old_size << "] to [" << new_size << "] bytes; "
                 "storage moved to @[" << static_cast<const void*>(new_blob.begin()) << "].");
  m_blob = std::move(new_blob);
} // Vec_space::resize()

Atom_space Vec_space::as_space() const
{
  return Atom_space::from_bytes_unchecked(m_blob.const_data(), size());
}

Atom_space_mut Vec_space::as_space_mut()
{
  return Atom_space_mut::from_bytes_unchecked(m_blob.begin(), size());
}

Byte_space Vec_space::as_bytes() const
{
  return as_space().as_bytes();
}

Byte_space_mut Vec_space::as_bytes_mut()
{
  return as_space_mut().as_bytes();
}

Space_reader Vec_space::read() const
{
  return Space_reader(as_bytes());
}

Vec_space_cursor Vec_space::cursor()
{
  return Vec_space_cursor(this);
}

std::ostream& operator<<(std::ostream& os, const Vec_space& val)
{
  return os << '@' << &val;
}

// Vec_space_cursor implementations.

Vec_space_cursor::Vec_space_cursor(Vec_space* vec) :
  Space_writer(vec->get_logger()),
  m_vec(vec),
  m_allocated_length(0)
{
  // Nothing else.
}

std::optional<Space_allocator::Split_allocation>
  Vec_space_cursor::allocate_and_split(size_t size, Error_code* err_code)
{
  using std::max;

  assert(err_code);

  const size_t needed = m_allocated_length + size;
  if (needed < m_allocated_length)
  {
    FLOW_LOG_WARNING("Vec_space_cursor [" << *this << "]: Requested [" << size << "] bytes on top of "
                     "[" << m_allocated_length << "] allocated: overflow.  Emitting error.");
    *err_code = error::Code::S_OUT_OF_SPACE;
    return std::nullopt;
  }
  // else

  if (needed > m_vec->size())
  {
    m_vec->resize(max(needed, m_vec->size() * 2));
  }

  const auto bytes = m_vec->as_bytes_mut();
  const auto previous = Byte_space_mut::from_bytes_unchecked(bytes.data(), m_allocated_length);
  const auto allocated = Byte_space_mut::from_bytes_unchecked(bytes.data() + m_allocated_length, size);
  m_allocated_length = needed;

  return Split_allocation{ previous, allocated };
}

bool Vec_space_cursor::rewind(size_t byte_count, Error_code* err_code)
{
  assert(err_code);

  if (byte_count > m_allocated_length)
  {
    FLOW_LOG_WARNING("Vec_space_cursor [" << *this << "]: Cannot rewind [" << byte_count << "] bytes: "
                     "only [" << m_allocated_length << "] are allocated.  Emitting error.");
    *err_code = error::Code::S_REWIND_BEYOND_ALLOCATED;
    return false;
  }
  // else

  m_allocated_length -= byte_count;
  return true;
}

Byte_space Vec_space_cursor::allocated_bytes() const
{
  return Byte_space::from_bytes_unchecked(m_vec->as_bytes().data(), m_allocated_length);
}

Byte_space_mut Vec_space_cursor::allocated_bytes_mut()
{
  return Byte_space_mut::from_bytes_unchecked(m_vec->as_bytes_mut().data(), m_allocated_length);
}

Byte_space Vec_space_cursor::remaining_bytes() const
{
  const auto bytes = m_vec->as_bytes();
  return Byte_space::from_bytes_unchecked(bytes.data() + m_allocated_length, bytes.size() - m_allocated_length);
}

} // namespace lv2::atom
