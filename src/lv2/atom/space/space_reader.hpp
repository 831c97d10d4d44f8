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
#include "lv2/atom/unidentified_atom.hpp"
#include <flow/error/error.hpp>
#include <optional>
#include <limits>

namespace lv2::atom
{

// Types.

/**
 * Forward-only cursor over a read-only byte range that extracts typed values, raw byte slices and whole atoms in
 * sequence.  Before each typed extraction the cursor skips the padding required for that type's alignment; it
 * never reads past the end of the range.
 *
 * Every `next_*()` either succeeds and advances the cursor past what it returned, or fails (with an `Error_code`
 * as usual) leaving the cursor where it was.  For multi-step reads that must be all-or-nothing use try_read(),
 * which runs the steps on a copy and adopts the copy's position only on success.  Iterators over container atoms
 * (Tuple_iterator, Object_reader, Sequence_iterator) are built that way, so they stop cleanly at the first
 * truncated or malformed element.
 *
 * Space_reader is a small value type; copying one yields an independent cursor over the same bytes.  Any number
 * of readers may traverse a buffer at once, provided nothing writes to it meanwhile.
 */
class Space_reader
{
public:
  // Constructors/destructor.

  /**
   * Cursor at the start of the given bytes.
   *
   * @param space
   *        Bytes to read.
   */
  explicit Space_reader(Byte_space space);

  /**
   * Cursor at the start of the given aligned space.
   *
   * @tparam T
   *         Alignment type of `space`; it is irrelevant after construction.
   * @tparam IS_MUTABLE
   *         Constness of `space`.
   * @param space
   *        Bytes to read.
   */
  template<typename T, bool IS_MUTABLE>
  explicit Space_reader(const Basic_aligned_space<T, IS_MUTABLE>& space);

  // Methods.

  /**
   * Realigns for `T` and returns the `T` there.
   *
   * @tparam T
   *         Trivially copyable type previously written at this position.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SPACE_MISALIGNED, error::Code::S_READING_OUT_OF_BOUNDS.
   * @return Pointer into the buffer; or null on error.
   */
  template<typename T>
  const T* next_value(Error_code* err_code = 0);

  /**
   * Realigns for `T` and returns the `n_values` contiguous `T`s there.
   *
   * @tparam T
   *         See next_value().
   * @param n_values
   *        Element count.
   * @param err_code
   *        See next_value().
   * @return The slice; or empty `optional` on error.
   */
  template<typename T>
  std::optional<Slice<const T>> next_values(size_t n_values, Error_code* err_code = 0);

  /**
   * Same as next_values().
   *
   * @tparam T
   *         See next_values().
   * @param n_values
   *        See next_values().
   * @param err_code
   *        See next_values().
   * @return See next_values().
   */
  template<typename T>
  std::optional<Slice<const T>> next_slice(size_t n_values, Error_code* err_code = 0);

  /**
   * Returns the next `n_bytes` bytes exactly: no realignment, no padding skipped.
   *
   * @param n_bytes
   *        Byte count.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_READING_OUT_OF_BOUNDS.
   * @return The bytes; or empty `optional` on error.
   */
  std::optional<Byte_space> next_bytes(size_t n_bytes, Error_code* err_code = 0);

  /**
   * Realigns for an atom, then returns the atom there: its header must fit, and so must the body it declares.
   * The cursor moves past the body; the padding after it is skipped by the next realignment.
   *
   * A header declaring a body larger than what remains yields error::Code::S_READING_OUT_OF_BOUNDS.  Hosts
   * routinely over-allocate buffers, so iterators treat that as "no more elements," not as a fault.
   *
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SPACE_MISALIGNED, error::Code::S_READING_OUT_OF_BOUNDS.
   * @return The atom; or null on error.
   */
  const Unidentified_atom* next_atom(Error_code* err_code = 0);

  /**
   * The bytes not yet consumed.  Does not advance.
   * @return See above.
   */
  Byte_space remaining_bytes() const;

  /**
   * Consumes and returns everything not yet consumed.
   * @return See above.
   */
  Byte_space into_remaining();

  /**
   * Runs `func` against a copy of `*this`; if the result is truthy (non-null pointer, engaged `optional`,
   * `true`), `*this` adopts the copy's position.  Otherwise `*this` is untouched.
   *
   * @tparam Func
   *         Callable as `R func(Space_reader&)`, `R` contextually convertible to `bool`.
   * @param func
   *        The read steps.
   * @return Whatever `func` returned.
   */
  template<typename Func>
  auto try_read(Func&& func) -> decltype(func(std::declval<Space_reader&>()));

private:
  // Methods.

  /**
   * Realigns for `T` and checks that `n_bytes` remain after that.  Does not advance.
   *
   * @tparam T
   *         Alignment type.
   * @param n_bytes
   *        Bytes needed after alignment.
   * @param err_code
   *        Not null.
   * @return The realigned remaining space; or empty on error.
   */
  template<typename T>
  std::optional<Aligned_space<T>> realigned(size_t n_bytes, Error_code* err_code) const;

  /**
   * Moves the cursor to `pos`, which must lie within the remaining bytes.
   *
   * @param pos
   *        New position.
   */
  void advance_to(const uint8_t* pos);

  // Data.

  /// The bytes not yet consumed.
  Byte_space m_space;
}; // class Space_reader

// Template implementations.

template<typename T, bool IS_MUTABLE>
Space_reader::Space_reader(const Basic_aligned_space<T, IS_MUTABLE>& space) :
  Space_reader(Byte_space(space.as_bytes()))
{
  // Nothing else.
}

template<typename T>
std::optional<Aligned_space<T>> Space_reader::realigned(size_t n_bytes, Error_code* err_code) const
{
  assert(err_code);

  auto space = Aligned_space<T>::align_from_bytes(m_space.data(), m_space.size(), err_code);
  if (!space)
  {
    return std::nullopt;
  }
  // else
  if (space->size() < n_bytes)
  {
    *err_code = error::Code::S_READING_OUT_OF_BOUNDS;
    return std::nullopt;
  }
  // else
  return space;
}

template<typename T>
const T* Space_reader::next_value(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(const T*, next_value<T>, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto space = realigned<T>(sizeof(T), err_code);
  if (!space)
  {
    return nullptr;
  }
  // else

  const auto value = space->assume_init_value();
  advance_to(space->data() + sizeof(T));
  return value;
}

template<typename T>
std::optional<Slice<const T>> Space_reader::next_values(size_t n_values, Error_code* err_code)
{
  using Result = std::optional<Slice<const T>>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, next_values<T>, n_values, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (n_values > (std::numeric_limits<size_t>::max() / sizeof(T)))
  {
    *err_code = error::Code::S_READING_OUT_OF_BOUNDS;
    return std::nullopt;
  }
  // else

  const size_t n_bytes = n_values * sizeof(T);
  const auto space = realigned<T>(n_bytes, err_code);
  if (!space)
  {
    return std::nullopt;
  }
  // else

  const auto values = Aligned_space<T>::from_bytes_unchecked(space->data(), n_bytes).assume_init_slice();
  advance_to(space->data() + n_bytes);
  return values;
}

template<typename T>
std::optional<Slice<const T>> Space_reader::next_slice(size_t n_values, Error_code* err_code)
{
  return next_values<T>(n_values, err_code);
}

template<typename Func>
auto Space_reader::try_read(Func&& func) -> decltype(func(std::declval<Space_reader&>()))
{
  Space_reader attempt(*this);
  auto result = func(attempt);
  if (result)
  {
    m_space = attempt.m_space;
  }
  return result;
}

} // namespace lv2::atom
