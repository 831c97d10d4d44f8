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
#include "lv2/atom/header.hpp"

namespace lv2::atom
{

// Types.

/**
 * Space_writer that writes the body of one atom whose header it has already written into its parent: every
 * allocation is forwarded to the parent, then added to the header's body size; every rewind is forwarded, then
 * subtracted.  Since the parent may itself be an Atom_writer, writing deep inside nested atoms updates every
 * enclosing header as it happens, with no second pass.
 *
 * Obtained via write_new() or, more usually, indirectly via Space_writer::write_atom(), which hands it to an atom
 * type's `init()` to become part of the write handle.
 *
 * @internal
 * ### Implementation ###
 * The header is located by its offset within the parent's allocated bytes (`allocated_bytes()` of an
 * Atom_writer is its parent's, so all offsets in a chain refer to the outermost allocator's buffer).  Offsets,
 * unlike pointers, survive a Vec_space_cursor relocating the buffer.  Each link checks, before forwarding, that
 * its header's 32-bit size field can absorb the allocation; so a failure anywhere in the chain leaves every
 * header unchanged.  Each link also checks that its body still ends where the outermost allocation ends: a handle
 * kept after a sibling was started behind it would otherwise append into (or rewind) the sibling.
 * @endinternal
 */
class Atom_writer :
  public Space_writer
{
public:
  // Constructors/destructor.

  /**
   * Writes an empty header of type `type` at the next 8-byte aligned position of `parent` and returns an
   * Atom_writer for its body.  `*parent` must outlive the result and not be written to (except through the
   * result) while it is in use.
   *
   * @param parent
   *        Writer receiving the atom.
   * @param type
   *        Type tag; not 0.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_URID, allocation errors.
   * @return The writer; or empty on error.
   */
  static std::optional<Atom_writer> write_new(Space_writer* parent, urid_t type, Error_code* err_code = 0);

  // Methods.

  /**
   * Copy of the header as it stands.
   * @return See above.
   */
  Atom_header atom_header() const;

  /**
   * Implements Space_allocator API.
   *
   * @param size
   *        See Space_allocator.
   * @param err_code
   *        See Space_allocator.  Additionally error::Code::S_WRITING_OUT_OF_BOUNDS if the body size would
   *        overflow its 32-bit field; error::Code::S_WRITING_ILLEGAL_STATE if a sibling atom was written after
   *        this one (the handle is stale).
   * @return See Space_allocator.
   */
  std::optional<Split_allocation> allocate_and_split(size_t size, Error_code* err_code) override;

  /**
   * Implements Space_allocator API.  Rewinding more than this atom's body is
   * error::Code::S_REWIND_BEYOND_ALLOCATED, even if the parent has more allocated.  Rewinding a stale handle
   * (see allocate_and_split()) is error::Code::S_WRITING_ILLEGAL_STATE.
   *
   * @param byte_count
   *        See Space_allocator.
   * @param err_code
   *        See Space_allocator.
   * @return See Space_allocator.
   */
  bool rewind(size_t byte_count, Error_code* err_code) override;

  /**
   * Implements Space_allocator API: the parent's.
   * @return See Space_allocator.
   */
  Byte_space allocated_bytes() const override;

  /**
   * Implements Space_allocator API: the parent's.
   * @return See Space_allocator.
   */
  Byte_space_mut allocated_bytes_mut() override;

  /**
   * Implements Space_allocator API: the parent's.
   * @return See Space_allocator.
   */
  Byte_space remaining_bytes() const override;

private:
  // Constructors.

  /**
   * Constructs from the already-written header's location.
   *
   * @param parent
   *        See #m_parent.
   * @param header_offset
   *        See #m_header_offset.
   */
  explicit Atom_writer(Space_allocator* parent, size_t header_offset);

  // Methods.

  /**
   * The header, found in `previous` (the parent's allocated bytes).
   *
   * @param previous
   *        Parent's allocated bytes; must contain the header.
   * @return See above.
   */
  Atom_header* header_in(Byte_space_mut previous) const;

  /**
   * Whether this atom's body still ends exactly where the parent's allocated bytes end, i.e., nothing was
   * written after it except through `*this`.  If not, sets error::Code::S_WRITING_ILLEGAL_STATE.
   *
   * @param err_code
   *        Not null.
   * @return See above.
   */
  bool check_open(Error_code* err_code) const;

  // Data.

  /// Where the header lives and where all allocations go.
  Space_allocator* m_parent;

  /// Offset of the header within `m_parent->allocated_bytes()`.
  size_t m_header_offset;
}; // class Atom_writer

// Template implementations.

template<typename Atom>
std::optional<typename Atom::Write_handle> Space_writer::write_atom(urid_t type, Error_code* err_code)
{
  using Result = std::optional<typename Atom::Write_handle>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, write_atom<Atom>, type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const size_t n_allocated_before = allocated_bytes().size();

  auto writer = Atom_writer::write_new(this, type, err_code);
  if (!writer)
  {
    return std::nullopt;
  }
  // else

  auto result = Atom::init(std::move(*writer), err_code);
  if (!result)
  {
    // Un-allocate the header (and any padding before it): no trace of the failed atom remains.
    Error_code rewind_err_code;
    [[maybe_unused]] const bool rewound = rewind_to(n_allocated_before, &rewind_err_code);
    assert(rewound && "Rewinding to a previously allocated size cannot fail.");
  }
  return result;
} // Space_writer::write_atom()

} // namespace lv2::atom
