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

#include "lv2/atom/space/aligned_space.hpp"
#include <flow/log/log.hpp>
#include <optional>

namespace lv2::atom
{

// Types.

/**
 * Interface of a cursor that carves successive byte ranges out of a mutable buffer: the allocation primitives
 * on which every write in lv2::atom is built.  Space_writer adds the typed writing operations on top; concrete
 * allocators derive from that.
 *
 * ### Model ###
 * An allocator has *allocated* bytes, a prefix of its buffer handed out so far, and *remaining* bytes after
 * them.  allocate_and_split() appends `size` fresh bytes to the allocated prefix and returns them (plus the
 * previously allocated prefix, which is where enclosing atom headers live).  rewind() un-allocates the most
 * recently allocated bytes so that they can be written again; it does not clear them.  Nothing is ever
 * reallocated behind the caller's back, except by a Vec_space_cursor, whose growth is documented there.
 *
 * ### Implementations ###
 *   - Space_cursor: fixed caller-supplied buffer; running out is error::Code::S_OUT_OF_SPACE.
 *   - Vec_space_cursor: grows its Vec_space on demand.
 *   - Atom_writer: forwards to a parent allocator, adding each allocation to its atom header's body size.
 *   - Terminated: keeps a terminator byte after everything allocated through it.
 *
 * The primitives here take a non-null `Error_code*` and do not throw; the Space_writer operations wrap them in
 * the usual flow.error convention.
 */
class Space_allocator :
  public flow::log::Log_context
{
public:
  // Types.

  /// Result of allocate_and_split().
  struct Split_allocation
  {
    // Data.

    /// All bytes allocated before this allocation.
    Byte_space_mut m_previous;

    /// The bytes just allocated.
    Byte_space_mut m_allocated;
  }; // struct Split_allocation

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Space_allocator();

  // Methods.

  /**
   * Allocates the next `size` bytes.  On failure nothing is allocated.
   *
   * @param size
   *        Byte count; may be 0.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_OUT_OF_SPACE, error::Code::S_WRITING_OUT_OF_BOUNDS,
   *        or another allocator-specific code.
   * @return The new and previous allocations; or empty on error.
   */
  virtual std::optional<Split_allocation> allocate_and_split(size_t size, Error_code* err_code) = 0;

  /**
   * Un-allocates the last `byte_count` allocated bytes.  Their contents are left as they are.
   *
   * @param byte_count
   *        Byte count.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_REWIND_BEYOND_ALLOCATED.
   * @return `true` on success.
   */
  virtual bool rewind(size_t byte_count, Error_code* err_code) = 0;

  /**
   * The allocated prefix, read-only.
   * @return See above.
   */
  virtual Byte_space allocated_bytes() const = 0;

  /**
   * The allocated prefix, writable.  Earlier allocations (e.g., enclosing atom headers) are patched through this.
   * @return See above.
   */
  virtual Byte_space_mut allocated_bytes_mut() = 0;

  /**
   * The bytes not yet allocated.  For a growable allocator this is what remains before the next growth.
   * @return See above.
   */
  virtual Byte_space remaining_bytes() const = 0;

protected:
  // Constructors.

  /**
   * Constructs the logging context.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   */
  explicit Space_allocator(flow::log::Logger* logger_ptr);

  /**
   * Copy-constructs the logging context only.
   *
   * @param src
   *        Source.
   */
  Space_allocator(const Space_allocator& src);

  /**
   * Move-constructs the logging context only.
   *
   * @param src
   *        Source.
   */
  Space_allocator(Space_allocator&& src);

  // Methods.

  /**
   * Copy-assigns the logging context only.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Space_allocator& operator=(const Space_allocator& src);

  /**
   * Move-assigns the logging context only.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Space_allocator& operator=(Space_allocator&& src);
}; // class Space_allocator

} // namespace lv2::atom
