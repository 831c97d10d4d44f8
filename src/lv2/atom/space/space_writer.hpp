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

#include "lv2/atom/space/space_allocator.hpp"
#include "lv2/atom/unidentified_atom.hpp"
#include <flow/error/error.hpp>
#include <optional>
#include <limits>
#include <new>

namespace lv2::atom
{

// Types.

/**
 * A Space_allocator with the typed write operations every lv2::atom writer offers: aligned allocation, writing
 * values/slices/bytes, starting a nested atom (write_atom()) and copying an existing atom verbatim
 * (copy_atom()).  All of them are non-virtual and expressed in terms of the allocator primitives, so each
 * concrete writer (Space_cursor, Vec_space_cursor, Atom_writer, Terminated) supplies only those.
 *
 * ### Alignment ###
 * allocate_aligned() and everything built on it first allocates the padding needed for the *address* of the next
 * free byte to be aligned for `T`; that padding counts as allocated.  Buffers are expected to start 8-byte
 * aligned, which makes atom layout independent of the buffer address.
 *
 * ### Errors ###
 * flow.error convention: trailing `Error_code* err_code`, null meaning "throw on failure."  A failing operation
 * allocates nothing.
 *
 * ### Thread safety ###
 * None; a buffer has at most one writer at a time, and no readers while it is being written.
 */
class Space_writer :
  public Space_allocator
{
public:
  // Methods.

  /**
   * Allocates the next `size` bytes, unaligned.
   *
   * @param size
   *        Byte count.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated: see
   *        allocate_and_split().
   * @return The bytes, contents unspecified; or empty on error.
   */
  std::optional<Byte_space_mut> allocate(size_t size, Error_code* err_code = 0);

  /**
   * Allocates padding up to alignment for `T`, then `size` bytes.
   *
   * @tparam T
   *         Alignment type; alignment at most 8.
   * @param size
   *        Byte count after the padding.
   * @param err_code
   *        See allocate().
   * @return The aligned bytes (padding excluded); or empty on error.
   */
  template<typename T>
  std::optional<Aligned_space_mut<T>> allocate_aligned(size_t size, Error_code* err_code = 0);

  /**
   * Allocates just the padding needed for the next free byte to be aligned for `T`.
   *
   * @tparam T
   *         Alignment type.
   * @param err_code
   *        See allocate().
   * @return `true` on success.
   */
  template<typename T>
  bool allocate_padding_for(Error_code* err_code = 0);

  /**
   * Allocates an aligned, value-initialized `T`.
   *
   * @tparam T
   *         Trivially copyable type.
   * @param err_code
   *        See allocate().
   * @return Pointer to the new value; or null on error.
   */
  template<typename T>
  T* allocate_value(Error_code* err_code = 0);

  /**
   * Allocates `n_values` aligned, value-initialized `T`s.
   *
   * @tparam T
   *         Trivially copyable type.
   * @param n_values
   *        Element count.
   * @param err_code
   *        See allocate().
   * @return The values; or empty on error.
   */
  template<typename T>
  std::optional<Slice<T>> allocate_values(size_t n_values, Error_code* err_code = 0);

  /**
   * Writes a copy of `value` at the next position aligned for `T`.
   *
   * @tparam T
   *         Trivially copyable type.
   * @param value
   *        Value.
   * @param err_code
   *        See allocate().
   * @return Pointer to the written value; or null on error.
   */
  template<typename T>
  T* write_value(const T& value, Error_code* err_code = 0);

  /**
   * Writes copies of `values` at the next position aligned for `T`.
   *
   * @tparam T
   *         Trivially copyable type.
   * @param values
   *        Values to copy.
   * @param err_code
   *        See allocate().
   * @return The written values; or empty on error.
   */
  template<typename T>
  std::optional<Slice<T>> write_values(Slice<const T> values, Error_code* err_code = 0);

  /**
   * Writes a copy of the given bytes, unaligned.
   *
   * @param bytes
   *        First byte.
   * @param size
   *        Byte count.
   * @param err_code
   *        See allocate().
   * @return The written bytes; or empty on error.
   */
  std::optional<Byte_space_mut> write_bytes(const void* bytes, size_t size, Error_code* err_code = 0);

  /**
   * Starts a nested atom of type `Atom`: writes its header (body size 0, given type tag) at the next 8-byte
   * aligned position and returns `Atom`'s write handle.  The handle writes the body through an Atom_writer
   * whose parent is `*this`; each byte it allocates is added to the new header's body size, and (as `*this` may
   * itself be an Atom_writer) to every enclosing atom's.
   *
   * `*this` must not be moved or destroyed while the handle is in use; and `*this` must not be written to
   * directly until the handle is done.
   *
   * If the handle cannot be initialized, the header is un-allocated again.
   *
   * @tparam Atom
   *         Writable atom type, such as Int, Tuple or String.
   * @param type
   *        Type tag for `Atom`; not 0.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_URID (`type` is 0), allocation errors, whatever `Atom::init()` emits.
   * @return The write handle; or empty on error.
   */
  template<typename Atom>
  std::optional<typename Atom::Write_handle> write_atom(urid_t type, Error_code* err_code = 0);

  /**
   * Copies the given atom (header and body) verbatim to the next 8-byte aligned position.
   *
   * @param atom
   *        Atom to copy; typically read from another buffer.
   * @param err_code
   *        See allocate().
   * @return The copy; or null on error.
   */
  const Unidentified_atom* copy_atom(const Unidentified_atom& atom, Error_code* err_code = 0);

  /**
   * Rewinds until exactly `allocated_size` bytes are allocated.  Used to undo everything allocated since a
   * remembered `allocated_bytes().size()`.
   *
   * @param allocated_size
   *        Target allocated byte count; at most the current one.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_REWIND_BEYOND_ALLOCATED.
   * @return `true` on success.
   */
  bool rewind_to(size_t allocated_size, Error_code* err_code = 0);

protected:
  // Constructors.

  /**
   * Constructs the logging context.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   */
  explicit Space_writer(flow::log::Logger* logger_ptr);
}; // class Space_writer

// Template implementations.

template<typename T>
std::optional<Aligned_space_mut<T>> Space_writer::allocate_aligned(size_t size, Error_code* err_code)
{
  using Result = std::optional<Aligned_space_mut<T>>;

  static_assert(alignof(T) <= alignof(Atom_header), "Atom buffers are only guaranteed 8-byte alignment.");

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, allocate_aligned<T>, size, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const size_t padding = Aligned_space_mut<T>::padding_for(remaining_bytes().data());
  if (size > (std::numeric_limits<size_t>::max() - padding))
  {
    *err_code = error::Code::S_OUT_OF_SPACE;
    return std::nullopt;
  }
  // else

  const auto alloc = allocate_and_split(padding + size, err_code);
  if (!alloc)
  {
    return std::nullopt;
  }
  // else
  err_code->clear();

  return Aligned_space_mut<T>::from_bytes_unchecked(alloc->m_allocated.data() + padding, size);
} // Space_writer::allocate_aligned()

template<typename T>
bool Space_writer::allocate_padding_for(Error_code* err_code)
{
  return bool(allocate_aligned<T>(0, err_code));
}

template<typename T>
T* Space_writer::allocate_value(Error_code* err_code)
{
  const auto values = allocate_values<T>(1, err_code);
  return values ? values->data() : nullptr;
}

template<typename T>
std::optional<Slice<T>> Space_writer::allocate_values(size_t n_values, Error_code* err_code)
{
  using Result = std::optional<Slice<T>>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, allocate_values<T>, n_values, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (n_values > (std::numeric_limits<size_t>::max() / sizeof(T)))
  {
    *err_code = error::Code::S_OUT_OF_SPACE;
    return std::nullopt;
  }
  // else

  const auto space = allocate_aligned<T>(n_values * sizeof(T), err_code);
  if (!space)
  {
    return std::nullopt;
  }
  // else

  const auto storage = space->as_uninit_slice();
  for (auto& value : storage)
  {
    new (&value) T();
  }
  return storage;
}

template<typename T>
T* Space_writer::write_value(const T& value, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(T*, write_value, value, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto space = allocate_aligned<T>(sizeof(T), err_code);
  if (!space)
  {
    return nullptr;
  }
  // else
  return new (space->as_uninit_slice().data()) T(value);
}

template<typename T>
std::optional<Slice<T>> Space_writer::write_values(Slice<const T> values, Error_code* err_code)
{
  using Result = std::optional<Slice<T>>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, write_values, values, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto space = allocate_aligned<T>(values.size() * sizeof(T), err_code);
  if (!space)
  {
    return std::nullopt;
  }
  // else

  const auto storage = space->as_uninit_slice();
  for (size_t idx = 0; idx != values.size(); ++idx)
  {
    new (&storage[idx]) T(values[idx]);
  }
  return storage;
}

} // namespace lv2::atom
