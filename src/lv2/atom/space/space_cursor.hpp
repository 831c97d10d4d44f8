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
 * Space_writer over a fixed, caller-owned buffer, such as a host's output port buffer: allocations are handed out
 * front to back, and when the buffer is exhausted the allocation fails with error::Code::S_OUT_OF_SPACE (logged
 * with the numbers).  It never reallocates.
 *
 * The buffer must outlive `*this` and everything written through it must not be used after the buffer is gone.
 * For an atom layout independent of the buffer address, give it an 8-byte aligned buffer.
 */
class Space_cursor :
  public Space_writer
{
public:
  // Constructors/destructor.

  /**
   * Cursor at the start of `data`, nothing allocated.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   * @param data
   *        The buffer.
   */
  explicit Space_cursor(flow::log::Logger* logger_ptr, Byte_space_mut data);

  // Methods.

  /**
   * Implements Space_allocator API.
   *
   * @param size
   *        See Space_allocator.
   * @param err_code
   *        See Space_allocator.  Specifically error::Code::S_OUT_OF_SPACE.
   * @return See Space_allocator.
   */
  std::optional<Split_allocation> allocate_and_split(size_t size, Error_code* err_code) override;

  /**
   * Implements Space_allocator API.
   *
   * @param byte_count
   *        See Space_allocator.
   * @param err_code
   *        See Space_allocator.
   * @return See Space_allocator.
   */
  bool rewind(size_t byte_count, Error_code* err_code) override;

  /**
   * Implements Space_allocator API.
   * @return See Space_allocator.
   */
  Byte_space allocated_bytes() const override;

  /**
   * Implements Space_allocator API.
   * @return See Space_allocator.
   */
  Byte_space_mut allocated_bytes_mut() override;

  /**
   * Implements Space_allocator API.
   * @return See Space_allocator.
   */
  Byte_space remaining_bytes() const override;

private:
  // Data.

  /// The whole buffer.
  Byte_space_mut m_data;

  /// Length of the allocated prefix of #m_data.
  size_t m_allocated_length;
}; // class Space_cursor

} // namespace lv2::atom
