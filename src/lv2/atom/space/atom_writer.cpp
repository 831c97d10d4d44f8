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
#include "lv2/atom/space/atom_writer.hpp"

namespace lv2::atom
{

// Implementations.

Atom_writer::Atom_writer(Space_allocator* parent, size_t header_offset) :
  Space_writer(parent->get_logger()),
  m_parent(parent),
  m_header_offset(header_offset)
{
  // Nothing else.
}

std::optional<Atom_writer> Atom_writer::write_new(Space_writer* parent, urid_t type, Error_code* err_code) // Static.
{
  using Result = std::optional<Atom_writer>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, write_new, parent, type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(parent);

  if (type == 0)
  {
    *err_code = error::Code::S_INVALID_URID;
    return std::nullopt;
  }
  // else

  if (!parent->write_value(Atom_header::create(type), err_code))
  {
    return std::nullopt;
  }
  // else: the header is the last thing allocated.

  const size_t header_offset = parent->allocated_bytes().size() - sizeof(Atom_header);
  err_code->clear();
  return Atom_writer(parent, header_offset);
} // Atom_writer::write_new()

Atom_header Atom_writer::atom_header() const
{
  const auto previous = m_parent->allocated_bytes();
  assert((m_header_offset + sizeof(Atom_header)) <= previous.size());
  return *reinterpret_cast<const Atom_header*>(previous.data() + m_header_offset);
}

bool Atom_writer::check_open(Error_code* err_code) const
{
  const size_t n_allocated = m_parent->allocated_bytes().size();
  if ((n_allocated >= (m_header_offset + sizeof(Atom_header)))
      && (n_allocated == (m_header_offset + atom_header().size_of_atom())))
  {
    return true;
  }
  // else: something was written (or rewound) past our body other than through us.

  FLOW_LOG_WARNING("Atom_writer [" << *this << "]: Atom at offset [" << m_header_offset << "] is no longer the "
                   "last thing written: parent has [" << n_allocated << "] bytes allocated.  A later sibling "
                   "was written, or the parent was rewound; this writer is stale.  Emitting error.");
  *err_code = error::Code::S_WRITING_ILLEGAL_STATE;
  return false;
}

Atom_header* Atom_writer::header_in(Byte_space_mut previous) const
{
  assert((m_header_offset + sizeof(Atom_header)) <= previous.size());
  return reinterpret_cast<Atom_header*>(previous.data() + m_header_offset);
}

std::optional<Space_allocator::Split_allocation> Atom_writer::allocate_and_split(size_t size, Error_code* err_code)
{
  assert(err_code);

  if (!check_open(err_code))
  {
    return std::nullopt;
  }
  // else

  const size_t body_size = atom_header().size_of_body();
  if (size > (std::numeric_limits<uint32_t>::max() - body_size))
  {
    FLOW_LOG_WARNING("Atom_writer [" << *this << "]: Atom [" << atom_header() << "] cannot grow by "
                     "[" << size << "] bytes: body size would overflow.  Emitting error.");
    *err_code = error::Code::S_WRITING_OUT_OF_BOUNDS;
    return std::nullopt;
  }
  // else

  auto alloc = m_parent->allocate_and_split(size, err_code);
  if (!alloc)
  {
    return std::nullopt;
  }
  // else

  // Look the header up anew: the allocation may have moved the buffer.
  header_in(alloc->m_previous)->m_size_of_body = uint32_t(body_size + size);
  return alloc;
}

bool Atom_writer::rewind(size_t byte_count, Error_code* err_code)
{
  assert(err_code);

  if (!check_open(err_code))
  {
    return false;
  }
  // else

  const size_t body_size = atom_header().size_of_body();
  if (byte_count > body_size)
  {
    FLOW_LOG_WARNING("Atom_writer [" << *this << "]: Cannot rewind [" << byte_count << "] bytes: atom "
                     "[" << atom_header() << "] has a smaller body.  Emitting error.");
    *err_code = error::Code::S_REWIND_BEYOND_ALLOCATED;
    return false;
  }
  // else

  if (!m_parent->rewind(byte_count, err_code))
  {
    return false;
  }
  // else

  header_in(m_parent->allocated_bytes_mut())->m_size_of_body = uint32_t(body_size - byte_count);
  return true;
}

Byte_space Atom_writer::allocated_bytes() const
{
  return m_parent->allocated_bytes();
}

Byte_space_mut Atom_writer::allocated_bytes_mut()
{
  return m_parent->allocated_bytes_mut();
}

Byte_space Atom_writer::remaining_bytes() const
{
  return m_parent->remaining_bytes();
}

} // namespace lv2::atom
