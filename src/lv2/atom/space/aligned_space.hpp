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

#include "lv2/atom/atom_fwd.hpp"
#include "lv2/atom/error.hpp"
#include <flow/error/error.hpp>
#include <optional>
#include <utility>
#include <type_traits>
#include <cstdint>
#include <cassert>

namespace lv2::atom
{

// Types.

/**
 * Pointer-plus-count view of `T`s stored contiguously in an atom buffer.  It owns nothing; it is what the
 * typed-slice operations (Space_reader::next_values(), Space_writer::allocate_values(), Vector element access)
 * hand out.
 *
 * @tparam T
 *         Element type, possibly `const`-qualified.
 */
template<typename T>
class Slice
{
public:
  // Constructors/destructor.

  /// Empty slice.
  Slice();

  /**
   * Slice over `[data, data + size)`.
   *
   * @param data
   *        First element.
   * @param size
   *        Element count.
   */
  explicit Slice(T* data, size_t size);

  /**
   * Allows `Slice<T>` to be used where `Slice<const T>` is expected.
   *
   * @tparam U
   *         Non-`const` counterpart of `T`.
   * @param src
   *        Source.
   */
  template<typename U, typename = std::enable_if_t<std::is_same_v<const U, T> && (!std::is_const_v<U>)>>
  Slice(const Slice<U>& src);

  // Methods.

  /**
   * First element.
   * @return See above.
   */
  T* data() const;

  /**
   * Element count.
   * @return See above.
   */
  size_t size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Same as data().
   * @return See above.
   */
  T* begin() const;

  /**
   * Past-the-last element.
   * @return See above.
   */
  T* end() const;

  /**
   * Element at the given index, which must be less than size().
   *
   * @param idx
   *        Index.
   * @return See above.
   */
  T& operator[](size_t idx) const;

private:
  // Data.

  /// See data().
  T* m_data;

  /// See size().
  size_t m_size;
}; // class Slice

/**
 * A byte range whose start address is known to satisfy `alignof(T)`.  This says nothing about the range's
 * *contents*: only that reinterpreting its prefix as `T` objects would not violate alignment.  Objects of this
 * type are cheap to copy; they never own the bytes, whose lifetime is managed elsewhere (a host port buffer,
 * a Vec_space, a caller's array).
 *
 * Byte views are simply `T = uint8_t` (alignment 1); see #Byte_space and #Byte_space_mut.  An atom body, or any
 * place an atom may start, is #Atom_space (alignment of Atom_header, 8 bytes).
 *
 * ### Reinterpretation ###
 * Exactly two methods produce typed access to the bytes: as_uninit_slice() (storage about to be written) and
 * assume_init_slice() (storage holding previously, fully written `T`s).  Every higher-level typed read or write
 * in lv2::atom goes through one of those.  The alignment half of their contract is guaranteed by this type; the
 * initialization half is the caller's.  `T` must be trivially copyable.
 *
 * @tparam T
 *         Type whose alignment is guaranteed.
 * @tparam IS_MUTABLE
 *         Whether the bytes may be modified through `*this`.
 */
template<typename T, bool IS_MUTABLE>
class Basic_aligned_space
{
public:
  // Types.

  /// Byte type as seen through `*this`.
  using Byte = std::conditional_t<IS_MUTABLE, uint8_t, const uint8_t>;

  /// `T` as seen through `*this`.
  using Value = std::conditional_t<IS_MUTABLE, T, const T>;

  /// Raw byte view of the same constness.
  using Bytes = Basic_aligned_space<uint8_t, IS_MUTABLE>;

  // Constants.

  /// The guaranteed alignment.
  static constexpr size_t S_ALIGNMENT = alignof(T);

  static_assert(std::is_trivially_copyable_v<T>, "Atom spaces may only be reinterpreted as trivially copyable types.");

  // Constructors/destructor.

  /// Empty space (null data, zero size).
  Basic_aligned_space();

  /**
   * Allows a mutable space to be used where a read-only one is expected.
   *
   * @tparam OTHER_MUTABLE
   *         Must be `true`.
   * @param src
   *        Source.
   */
  template<bool OTHER_MUTABLE, typename = std::enable_if_t<OTHER_MUTABLE && (!IS_MUTABLE)>>
  Basic_aligned_space(const Basic_aligned_space<T, OTHER_MUTABLE>& src);

  // Methods.

  /**
   * Wraps the given byte range, failing if it does not start at an address aligned for `T`.
   *
   * @param data
   *        First byte.  May be null if `size == 0`.
   * @param size
   *        Byte count.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SPACE_MISALIGNED.
   * @return The space; or empty on error.
   */
  static std::optional<Basic_aligned_space> from_bytes(Byte* data, size_t size, Error_code* err_code = 0);

  /**
   * Wraps the given byte range minus the minimal leading padding needed to reach an address aligned for `T`.
   * Fails only if the range is shorter than that padding.
   *
   * @param data
   *        First byte.
   * @param size
   *        Byte count.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SPACE_MISALIGNED.
   * @return The space (possibly empty, if exactly the padding fit); or empty `optional` on error.
   */
  static std::optional<Basic_aligned_space> align_from_bytes(Byte* data, size_t size, Error_code* err_code = 0);

  /**
   * Number of bytes to skip from the given address to reach one aligned for `T`.
   *
   * @param ptr
   *        Address.
   * @return Value in `[0, alignof(T))`.
   */
  static size_t padding_for(const void* ptr);

  /**
   * Splits `*this` at byte `mid`.  The first part keeps the alignment guarantee; the remainder is returned as
   * plain bytes and must be realigned by the caller as needed.
   *
   * @param mid
   *        Split point in bytes.
   * @return The two parts; or empty if `mid > size()`.
   */
  std::optional<std::pair<Basic_aligned_space, Bytes>> split_at(size_t mid) const;

  /**
   * The bytes of `*this`, dropping the alignment guarantee.
   * @return See above.
   */
  Bytes as_bytes() const;

  /**
   * Realigns `*this` for type `U`; equivalent to `Basic_aligned_space<U>::align_from_bytes(data(), size())`.
   *
   * @tparam U
   *         Target type.
   * @param err_code
   *        See align_from_bytes().
   * @return See above.
   */
  template<typename U>
  std::optional<Basic_aligned_space<U, IS_MUTABLE>> realign(Error_code* err_code = 0) const;

  /**
   * Storage for `n_values()` objects of type `T`, whose contents are unspecified: write before reading.
   * @return See above.
   */
  Slice<Value> as_uninit_slice() const;

  /**
   * The `n_values()` objects of type `T` at the start of `*this`.  The caller vouches that every one of those was
   * actually written as a `T` previously; violating this is undefined behavior.
   *
   * @return See above.
   */
  Slice<Value> assume_init_slice() const;

  /**
   * The first `T` per assume_init_slice() rules; or null if `size() < sizeof(T)`.
   * @return See above.
   */
  Value* assume_init_value() const;

  /**
   * How many whole `T`s fit in `*this`.
   * @return See above.
   */
  size_t n_values() const;

  /**
   * First byte.
   * @return See above.
   */
  Byte* data() const;

  /**
   * Byte count.
   * @return See above.
   */
  size_t size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Wraps a byte range known, by the caller, to be aligned for `T`.  It is `assert()`ed.
   *
   * @param data
   *        First byte.
   * @param size
   *        Byte count.
   * @return See above.
   */
  static Basic_aligned_space from_bytes_unchecked(Byte* data, size_t size);

private:
  // Friends.

  /// Cross-type access for conversion and splitting.
  template<typename, bool>
  friend class Basic_aligned_space;

  // Constructors.

  /**
   * Constructs from already-validated members.
   *
   * @param data
   *        See #m_data.
   * @param size
   *        See #m_size.
   */
  explicit Basic_aligned_space(Byte* data, size_t size);

  // Methods.

  /**
   * The sole reinterpretation of bytes as `T`s in lv2::atom.
   * @return See above.
   */
  Slice<Value> reinterpret() const;

  // Data.

  /// First byte; null only if empty.
  Byte* m_data;

  /// Byte count.
  size_t m_size;
}; // class Basic_aligned_space

// Template implementations.

template<typename T>
Slice<T>::Slice() :
  m_data(nullptr),
  m_size(0)
{
  // Nothing else.
}

template<typename T>
Slice<T>::Slice(T* data, size_t size) :
  m_data(data),
  m_size(size)
{
  // Nothing else.
}

template<typename T>
template<typename U, typename>
Slice<T>::Slice(const Slice<U>& src) :
  m_data(src.data()),
  m_size(src.size())
{
  // Nothing else.
}

template<typename T>
T* Slice<T>::data() const
{
  return m_data;
}

template<typename T>
size_t Slice<T>::size() const
{
  return m_size;
}

template<typename T>
bool Slice<T>::empty() const
{
  return m_size == 0;
}

template<typename T>
T* Slice<T>::begin() const
{
  return m_data;
}

template<typename T>
T* Slice<T>::end() const
{
  return m_data + m_size;
}

template<typename T>
T& Slice<T>::operator[](size_t idx) const
{
  assert(idx < m_size);
  return m_data[idx];
}

template<typename T, bool IS_MUTABLE>
Basic_aligned_space<T, IS_MUTABLE>::Basic_aligned_space() :
  m_data(nullptr),
  m_size(0)
{
  // Nothing else.
}

template<typename T, bool IS_MUTABLE>
Basic_aligned_space<T, IS_MUTABLE>::Basic_aligned_space(Byte* data, size_t size) :
  m_data(data),
  m_size(size)
{
  assert(((size == 0) || (padding_for(data) == 0)) && "Constructing an aligned space from unaligned bytes.");
}

template<typename T, bool IS_MUTABLE>
template<bool OTHER_MUTABLE, typename>
Basic_aligned_space<T, IS_MUTABLE>::Basic_aligned_space(const Basic_aligned_space<T, OTHER_MUTABLE>& src) :
  m_data(src.m_data),
  m_size(src.m_size)
{
  // Nothing else.
}

template<typename T, bool IS_MUTABLE>
std::optional<Basic_aligned_space<T, IS_MUTABLE>>
  Basic_aligned_space<T, IS_MUTABLE>::from_bytes(Byte* data, size_t size, Error_code* err_code) // Static.
{
  using Result = std::optional<Basic_aligned_space>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, from_bytes, data, size, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((size != 0) && (padding_for(data) != 0))
  {
    *err_code = error::Code::S_SPACE_MISALIGNED;
    return std::nullopt;
  }
  // else
  err_code->clear();
  return Basic_aligned_space(data, size);
}

template<typename T, bool IS_MUTABLE>
std::optional<Basic_aligned_space<T, IS_MUTABLE>>
  Basic_aligned_space<T, IS_MUTABLE>::align_from_bytes(Byte* data, size_t size, Error_code* err_code) // Static.
{
  using Result = std::optional<Basic_aligned_space>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, align_from_bytes, data, size, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (size == 0)
  {
    // Nothing to skip; an empty range is aligned for anything.  Keep `data` so that positions stay meaningful.
    err_code->clear();
    return Basic_aligned_space(data, 0);
  }
  // else

  const size_t padding = padding_for(data);
  if (padding > size)
  {
    *err_code = error::Code::S_SPACE_MISALIGNED;
    return std::nullopt;
  }
  // else
  err_code->clear();
  return Basic_aligned_space(data + padding, size - padding);
}

template<typename T, bool IS_MUTABLE>
size_t Basic_aligned_space<T, IS_MUTABLE>::padding_for(const void* ptr) // Static.
{
  const auto remainder = reinterpret_cast<std::uintptr_t>(ptr) % S_ALIGNMENT;
  return (remainder == 0) ? 0 : (S_ALIGNMENT - remainder);
}

template<typename T, bool IS_MUTABLE>
Basic_aligned_space<T, IS_MUTABLE>
  Basic_aligned_space<T, IS_MUTABLE>::from_bytes_unchecked(Byte* data, size_t size) // Static.
{
  assert(((size == 0) || (padding_for(data) == 0)) && "Caller promised an aligned range.");
  return Basic_aligned_space(data, size);
}

template<typename T, bool IS_MUTABLE>
std::optional<std::pair<Basic_aligned_space<T, IS_MUTABLE>, typename Basic_aligned_space<T, IS_MUTABLE>::Bytes>>
  Basic_aligned_space<T, IS_MUTABLE>::split_at(size_t mid) const
{
  if (mid > m_size)
  {
    return std::nullopt;
  }
  // else
  return std::make_pair(Basic_aligned_space(m_data, mid), Bytes(m_data + mid, m_size - mid));
}

template<typename T, bool IS_MUTABLE>
typename Basic_aligned_space<T, IS_MUTABLE>::Bytes Basic_aligned_space<T, IS_MUTABLE>::as_bytes() const
{
  return Bytes(m_data, m_size);
}

template<typename T, bool IS_MUTABLE>
template<typename U>
std::optional<Basic_aligned_space<U, IS_MUTABLE>> Basic_aligned_space<T, IS_MUTABLE>::realign(Error_code* err_code) const
{
  return Basic_aligned_space<U, IS_MUTABLE>::align_from_bytes(m_data, m_size, err_code);
}

template<typename T, bool IS_MUTABLE>
Slice<typename Basic_aligned_space<T, IS_MUTABLE>::Value> Basic_aligned_space<T, IS_MUTABLE>::reinterpret() const
{
  return Slice<Value>(reinterpret_cast<Value*>(m_data), n_values());
}

template<typename T, bool IS_MUTABLE>
Slice<typename Basic_aligned_space<T, IS_MUTABLE>::Value> Basic_aligned_space<T, IS_MUTABLE>::as_uninit_slice() const
{
  return reinterpret();
}

template<typename T, bool IS_MUTABLE>
Slice<typename Basic_aligned_space<T, IS_MUTABLE>::Value>
  Basic_aligned_space<T, IS_MUTABLE>::assume_init_slice() const
{
  return reinterpret();
}

template<typename T, bool IS_MUTABLE>
typename Basic_aligned_space<T, IS_MUTABLE>::Value* Basic_aligned_space<T, IS_MUTABLE>::assume_init_value() const
{
  const auto values = reinterpret();
  return values.empty() ? nullptr : values.data();
}

template<typename T, bool IS_MUTABLE>
size_t Basic_aligned_space<T, IS_MUTABLE>::n_values() const
{
  return m_size / sizeof(T);
}

template<typename T, bool IS_MUTABLE>
typename Basic_aligned_space<T, IS_MUTABLE>::Byte* Basic_aligned_space<T, IS_MUTABLE>::data() const
{
  return m_data;
}

template<typename T, bool IS_MUTABLE>
size_t Basic_aligned_space<T, IS_MUTABLE>::size() const
{
  return m_size;
}

template<typename T, bool IS_MUTABLE>
bool Basic_aligned_space<T, IS_MUTABLE>::empty() const
{
  return m_size == 0;
}

} // namespace lv2::atom
