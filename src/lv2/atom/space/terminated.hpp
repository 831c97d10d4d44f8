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

#include "lv2/atom/space/space_writer.hpp"

namespace lv2::atom
{

// Types.

/**
 * Space_writer decorator that keeps one terminator byte right after everything allocated through it: e.g., a
 * String body stays NUL-terminated after every append.  The terminator is written with the first allocation;
 * each later allocation first takes it back, then allocates one more byte than asked and writes it again at the
 * end.  The terminator byte is not part of allocated_bytes(), though it is part of the inner writer's.
 *
 * @tparam Inner_writer
 *         Space_writer (usually Atom_writer) owned by value and receiving all allocations.
 */
template<typename Inner_writer>
class Terminated :
  public Space_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over `inner`; nothing is written until the first allocation.
   *
   * @param inner
   *        Writer to decorate.
   * @param terminator
   *        Byte to keep at the end.
   */
  explicit Terminated(Inner_writer&& inner, uint8_t terminator);

  // Methods.

  /**
   * The decorated writer.
   * @return See above.
   */
  const Inner_writer& inner() const;

  /**
   * Implements Space_allocator API.  On failure the terminator is still in place.
   *
   * @param size
   *        See Space_allocator.
   * @param err_code
   *        See Space_allocator.
   * @return See Space_allocator.  The terminator is not part of `m_allocated`.
   */
  std::optional<Split_allocation> allocate_and_split(size_t size, Error_code* err_code) override;

  /**
   * Implements Space_allocator API.  The terminator is rewritten after the remaining allocated bytes.
   *
   * @param byte_count
   *        See Space_allocator.
   * @param err_code
   *        See Space_allocator.
   * @return See Space_allocator.
   */
  bool rewind(size_t byte_count, Error_code* err_code) override;

  /**
   * Implements Space_allocator API: the inner writer's, minus the terminator.
   * @return See Space_allocator.
   */
  Byte_space allocated_bytes() const override;

  /**
   * Implements Space_allocator API: the inner writer's, minus the terminator.
   * @return See Space_allocator.
   */
  Byte_space_mut allocated_bytes_mut() override;

  /**
   * Implements Space_allocator API: the inner writer's, plus the terminator (which will be overwritten).
   * @return See Space_allocator.
   */
  Byte_space remaining_bytes() const override;

private:
  // Methods.

  /**
   * Allocates one byte from #m_inner and writes the terminator into it.
   *
   * @param err_code
   *        Not null.
   * @return `true` on success.
   */
  bool write_terminator(Error_code* err_code);

  // Data.

  /// The decorated writer.
  Inner_writer m_inner;

  /// The byte kept at the end.
  uint8_t m_terminator;

  /// Whether #m_inner's last allocated byte is the terminator.
  bool m_wrote_terminator;
}; // class Terminated

// Template implementations.

template<typename Inner_writer>
Terminated<Inner_writer>::Terminated(Inner_writer&& inner, uint8_t terminator) :
  Space_writer(inner.get_logger()),
  m_inner(std::move(inner)),
  m_terminator(terminator),
  m_wrote_terminator(false)
{
  // Nothing else.
}

template<typename Inner_writer>
const Inner_writer& Terminated<Inner_writer>::inner() const
{
  return m_inner;
}

template<typename Inner_writer>
bool Terminated<Inner_writer>::write_terminator(Error_code* err_code)
{
  const auto alloc = m_inner.allocate_and_split(1, err_code);
  if (!alloc)
  {
    return false;
  }
  // else

  alloc->m_allocated.data()[0] = m_terminator;
  m_wrote_terminator = true;
  return true;
}

template<typename Inner_writer>
std::optional<Space_allocator::Split_allocation>
  Terminated<Inner_writer>::allocate_and_split(size_t size, Error_code* err_code)
{
  assert(err_code);

  if (size == std::numeric_limits<size_t>::max())
  {
    *err_code = error::Code::S_OUT_OF_SPACE;
    return std::nullopt;
  }
  // else

  const bool had_terminator = m_wrote_terminator;
  if (had_terminator)
  {
    if (!m_inner.rewind(1, err_code))
    {
      return std::nullopt;
    }
    // else
    m_wrote_terminator = false;
  }

  const auto alloc = m_inner.allocate_and_split(size + 1, err_code);
  if (!alloc)
  {
    if (had_terminator)
    {
      // The byte was just given back, so re-claiming it cannot run out of space.
      Error_code restore_err_code;
      [[maybe_unused]] const bool restored = write_terminator(&restore_err_code);
      assert(restored && "Could not re-claim the terminator byte just rewound.");
    }
    return std::nullopt;
  }
  // else

  alloc->m_allocated.data()[size] = m_terminator;
  m_wrote_terminator = true;

  return Split_allocation{ alloc->m_previous, Byte_space_mut::from_bytes_unchecked(alloc->m_allocated.data(), size) };
} // Terminated::allocate_and_split()

template<typename Inner_writer>
bool Terminated<Inner_writer>::rewind(size_t byte_count, Error_code* err_code)
{
  assert(err_code);

  if (!m_wrote_terminator)
  {
    return m_inner.rewind(byte_count, err_code);
  }
  // else

  if (byte_count == std::numeric_limits<size_t>::max())
  {
    *err_code = error::Code::S_REWIND_BEYOND_ALLOCATED;
    return false;
  }
  // else

  if (!m_inner.rewind(byte_count + 1, err_code))
  {
    return false;
  }
  // else

  m_wrote_terminator = false;
  return write_terminator(err_code);
}

template<typename Inner_writer>
Byte_space Terminated<Inner_writer>::allocated_bytes() const
{
  const auto bytes = m_inner.allocated_bytes();
  return m_wrote_terminator ? Byte_space::from_bytes_unchecked(bytes.data(), bytes.size() - 1) : bytes;
}

template<typename Inner_writer>
Byte_space_mut Terminated<Inner_writer>::allocated_bytes_mut()
{
  const auto bytes = m_inner.allocated_bytes_mut();
  return m_wrote_terminator ? Byte_space_mut::from_bytes_unchecked(bytes.data(), bytes.size() - 1) : bytes;
}

template<typename Inner_writer>
Byte_space Terminated<Inner_writer>::remaining_bytes() const
{
  const auto bytes = m_inner.remaining_bytes();
  return m_wrote_terminator ? Byte_space::from_bytes_unchecked(bytes.data() - 1, bytes.size() + 1) : bytes;
}

} // namespace lv2::atom
