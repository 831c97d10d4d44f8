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

#include "lv2/atom/space/atom_writer.hpp"
#include "lv2/atom/space/space_reader.hpp"

namespace lv2::atom
{

// Types.

/**
 * Write handle of the scalar atoms: sets (and may later overwrite) the single value making up the body.  The body
 * is always padded to 8 bytes, even for 4-byte values, as LV2 hosts expect of `LV2_Atom_Int` and friends.
 *
 * Until set() is called the atom has an empty body, which readers reject.
 *
 * @tparam T
 *         The stored value type.
 */
template<typename T>
class Scalar_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the atom's writer.
   *
   * @param writer
   *        Writer of the scalar atom's body.
   */
  explicit Scalar_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Writes `value` as the body, replacing any earlier value.
   *
   * @param value
   *        Value.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated: allocation errors.
   * @return Pointer to the stored value, valid until the buffer is next grown or rewound; or null on error.
   */
  T* set(const T& value, Error_code* err_code = 0);

private:
  // Types.

  /// The body as stored: the value, then zeroes up to 8 bytes.
  struct alignas(8) Padded
  {
    /// The value.
    T m_value;
  };

  static_assert(sizeof(Padded) == 8, "Scalar atom bodies are exactly 8 bytes.");

  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Scalar_writer

/**
 * Common definition of the scalar atom types: read handle is a copy of the value; write handle a Scalar_writer.
 *
 * @tparam Internal
 *         The stored value type; at most 8 bytes.
 */
template<typename Internal>
struct Scalar_atom
{
  // Types.

  /// Stored value type; also the element type of a Vector of these.
  using Value = Internal;

  /// See Unidentified_atom::read().
  using Read_handle = Internal;

  /// See Space_writer::write_atom().
  using Write_handle = Scalar_writer<Internal>;

  // Methods.

  /**
   * Reads the value at the start of `body`.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_READING_OUT_OF_BOUNDS (body too small).
   * @return The value; or empty on error.
   */
  static std::optional<Read_handle> read(Atom_space body, Error_code* err_code);

  /**
   * Creates the write handle.
   *
   * @param writer
   *        The atom's body writer.
   * @param err_code
   *        Not null.  Never fails.
   * @return The handle.
   */
  static std::optional<Write_handle> init(Atom_writer&& writer, Error_code* err_code);
}; // struct Scalar_atom

/// `atom:Int`: 32-bit signed integer.
struct Int : Scalar_atom<int32_t> {};

/// `atom:Long`: 64-bit signed integer.
struct Long : Scalar_atom<int64_t> {};

/// `atom:Float`: 32-bit IEEE float.
struct Float : Scalar_atom<float> {};

/// `atom:Double`: 64-bit IEEE float.
struct Double : Scalar_atom<double> {};

/// `atom:Bool`: 32-bit integer, 0 meaning false.
struct Bool : Scalar_atom<int32_t> {};

/// `atom:URID`: a type tag as a value.
struct Urid : Scalar_atom<urid_t> {};

// Template implementations.

template<typename T>
Scalar_writer<T>::Scalar_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

template<typename T>
T* Scalar_writer<T>::set(const T& value, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(T*, set, value, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const size_t body_size = m_writer.atom_header().size_of_body();
  if ((body_size != 0) && (!m_writer.rewind(body_size, err_code)))
  {
    return nullptr;
  }
  // else

  // Value-initialization zeroes the padding too.
  const auto stored = m_writer.allocate_value<Padded>(err_code);
  if (!stored)
  {
    return nullptr;
  }
  // else

  stored->m_value = value;
  return &stored->m_value;
}

template<typename Internal>
std::optional<typename Scalar_atom<Internal>::Read_handle>
  Scalar_atom<Internal>::read(Atom_space body, Error_code* err_code) // Static.
{
  assert(err_code);

  Space_reader reader(body);
  const auto value = reader.next_value<Internal>(err_code);
  if (!value)
  {
    return std::nullopt;
  }
  // else
  return *value;
}

template<typename Internal>
std::optional<typename Scalar_atom<Internal>::Write_handle>
  Scalar_atom<Internal>::init(Atom_writer&& writer, Error_code* err_code) // Static.
{
  assert(err_code);
  err_code->clear();
  return Write_handle(std::move(writer));
}

} // namespace lv2::atom
