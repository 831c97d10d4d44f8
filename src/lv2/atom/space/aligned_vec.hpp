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
#include "lv2/atom/space/space_reader.hpp"
#include "lv2/atom/header.hpp"
#include <flow/util/blob.hpp>
#include <flow/log/log.hpp>

namespace lv2::atom
{

// Types.

/**
 * A locally owned, zero-initialized, growable byte buffer whose data always starts 8-byte aligned (aligned for
 * Atom_header): a convenient backing store for atoms outside the real-time path, e.g., for a host preparing port
 * buffers or for tests.  Obtain a Vec_space_cursor via cursor() to write; a Space_reader via read() to read.
 *
 * @internal
 * ### Implementation ###
 * Storage is a `flow::util::Blob` reserved with enough slack that its `start()` can be slid forward to the first
 * 8-byte aligned byte: `begin()` is aligned, whatever alignment the heap returned.  Growing allocates a new such
 * blob, zeroes it, copies the old contents and swaps it in; hence growth invalidates all pointers into the old
 * storage.
 * @endinternal
 */
class Vec_space :
  public flow::log::Log_context
{
public:
  // Types.

  /// Knobs for Vec_space construction.
  struct Config
  {
    // Data.

    /// Logger to use for logging subsequently; may be null.
    flow::log::Logger* m_logger_ptr;

    /// Initial size() in bytes.  All of it is zeroed.
    size_t m_initial_size;
  }; // struct Config

  // Constants.

  /// Alignment of data().
  static constexpr size_t S_ALIGNMENT = alignof(Atom_header);

  // Constructors/destructor.

  /**
   * Allocates zeroed storage per `config`.
   *
   * @param config
   *        See Config.
   */
  explicit Vec_space(const Config& config);

  /// Disallow copying.
  Vec_space(const Vec_space&) = delete;

  /// Frees the storage.
  ~Vec_space();

  // Methods.

  /// Disallow copying.
  Vec_space& operator=(const Vec_space&) = delete;

  /**
   * Byte count.
   * @return See above.
   */
  size_t size() const;

  /**
   * Resizes to `new_size` bytes, zero-filling any new bytes.  Growing may relocate the storage.
   *
   * @param new_size
   *        Byte count.
   */
  void resize(size_t new_size);

  /**
   * The storage as an atom space (8-byte aligned).
   * @return See above.
   */
  Atom_space as_space() const;

  /**
   * The storage as a writable atom space.
   * @return See above.
   */
  Atom_space_mut as_space_mut();

  /**
   * Same as as_space(), as plain bytes.
   * @return See above.
   */
  Byte_space as_bytes() const;

  /**
   * Same as as_space_mut(), as plain bytes.
   * @return See above.
   */
  Byte_space_mut as_bytes_mut();

  /**
   * Reader at the start of the storage.
   * @return See above.
   */
  Space_reader read() const;

  /**
   * A writer starting at the start of the storage, growing it as needed.  At most one should exist at a time.
   * @return See above.
   */
  Vec_space_cursor cursor();

private:
  // Data.

  /// Storage; `begin()` is #S_ALIGNMENT-aligned.
  flow::util::Blob m_blob;
}; // class Vec_space

/**
 * Space_writer over a Vec_space that, instead of failing when the space is exhausted, grows it (at least
 * doubling).  Everything obtained from earlier allocations is invalidated by a growth; Atom_writer and the atom
 * write handles cope with that since they locate headers by offset, but raw pointers kept by the caller do not.
 */
class Vec_space_cursor :
  public Space_writer
{
public:
  // Constructors/destructor.

  /**
   * Cursor at the start of `vec`, nothing allocated.
   *
   * @param vec
   *        The storage; must outlive `*this`.
   */
  explicit Vec_space_cursor(Vec_space* vec);

  // Methods.

  /**
   * Implements Space_allocator API.  Never fails for lack of space, short of exhausting memory.
   *
   * @param size
   *        See Space_allocator.
   * @param err_code
   *        See Space_allocator.
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

  /// The storage.
  Vec_space* m_vec;

  /// Length of the allocated prefix of #m_vec.
  size_t m_allocated_length;
}; // class Vec_space_cursor

} // namespace lv2::atom
