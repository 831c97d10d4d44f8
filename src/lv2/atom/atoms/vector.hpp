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
#include "lv2/atom/detail/bodies.hpp"

namespace lv2::atom
{

// Types.

/**
 * Read handle of a Vector: knows the stored child type tag and child size, and yields the elements only when
 * asked for with a matching scalar atom type (of_type()).
 */
class Vector_reader
{
public:
  // Constructors/destructor.

  /**
   * Constructs from the vector's body record and the element bytes after it.
   *
   * @param body
   *        The record.
   * @param elements
   *        The remaining body bytes.
   */
  explicit Vector_reader(const Vector_body& body, Byte_space elements);

  // Methods.

  /**
   * Stored child type tag.
   * @return See above.
   */
  urid_t child_type() const;

  /**
   * Stored child size in bytes.
   * @return See above.
   */
  size_t child_size() const;

  /**
   * The elements as `A`'s values, if the vector was written with child type `child_type` and child size
   * `sizeof(A::Value)`.  Trailing body bytes too few to form a whole element are ignored.
   *
   * @tparam A
   *         Scalar atom type such as Int or Float.
   * @param child_type
   *        Type tag of `A`.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ATOM_URID_MISMATCH (tag or size mismatch), read errors.
   * @return The elements, valid as long as the buffer; or empty on error.
   */
  template<typename A>
  std::optional<Slice<const typename A::Value>> of_type(urid_t child_type, Error_code* err_code = 0) const;

private:
  // Data.

  /// Copy of the body record.
  Vector_body m_body;

  /// Body bytes after #m_body.
  Byte_space m_elements;
}; // class Vector_reader

/**
 * Final write handle of a Vector, after the child type is set: appends elements of scalar atom type `A`.
 *
 * @tparam A
 *         Scalar atom type such as Int or Float.
 */
template<typename A>
class Vector_writer
{
public:
  // Types.

  /// Element type.
  using Value = typename A::Value;

  // Constructors/destructor.

  /**
   * Takes over the vector's writer, whose body record has been written.
   *
   * @param writer
   *        Writer of the vector body.
   */
  explicit Vector_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Appends one element.
   *
   * @param child
   *        Value.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated: allocation errors.
   * @return Pointer to the stored element; or null on error.
   */
  Value* push(const Value& child, Error_code* err_code = 0);

  /**
   * Appends copies of `children`.
   *
   * @param children
   *        Values.
   * @param err_code
   *        See push().
   * @return The stored elements; or empty on error.
   */
  std::optional<Slice<Value>> append(Slice<const Value> children, Error_code* err_code = 0);

  /**
   * Appends `n_children` elements for the caller to fill in.  They are value-initialized.
   *
   * @param n_children
   *        Element count.
   * @param err_code
   *        See push().
   * @return The new elements; or empty on error.
   */
  std::optional<Slice<Value>> allocate_uninit(size_t n_children, Error_code* err_code = 0);

private:
  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Vector_writer

/// Initial write handle of a Vector: the child type must be chosen (of_type()) before elements can be written.
class Vector_type_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the vector's writer; nothing written yet.
   *
   * @param writer
   *        Writer of the vector body.
   */
  explicit Vector_type_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Writes the body record for elements of type `A`, then turns into the element writer.  `*this` is spent
   * after a success.
   *
   * @tparam A
   *         Scalar atom type such as Int or Float.
   * @param child_type
   *        Type tag of `A`; not 0.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_URID, allocation errors.
   * @return The element writer; or empty on error.
   */
  template<typename A>
  std::optional<Vector_writer<A>> of_type(urid_t child_type, Error_code* err_code = 0);

private:
  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Vector_type_writer

/// `atom:Vector`: homogeneous array of scalar values, with the element type tag and size stored up front.
struct Vector
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = Vector_reader;

  /// See Space_writer::write_atom().
  using Write_handle = Vector_type_writer;

  // Methods.

  /**
   * Reads the body record.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_READING_OUT_OF_BOUNDS.
   * @return The reader; or empty on error.
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
}; // struct Vector

// Template implementations.

template<typename A>
std::optional<Slice<const typename A::Value>> Vector_reader::of_type(urid_t child_type, Error_code* err_code) const
{
  using Value = typename A::Value;
  using Result = std::optional<Slice<const Value>>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, of_type<A>, child_type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((m_body.m_child_type != child_type) || (m_body.m_child_size != sizeof(Value)))
  {
    *err_code = error::Code::S_ATOM_URID_MISMATCH;
    return std::nullopt;
  }
  // else

  Space_reader reader(m_elements);
  return reader.next_slice<Value>(m_elements.size() / sizeof(Value), err_code);
}

template<typename A>
Vector_writer<A>::Vector_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

template<typename A>
typename Vector_writer<A>::Value* Vector_writer<A>::push(const Value& child, Error_code* err_code)
{
  return m_writer.write_value(child, err_code);
}

template<typename A>
std::optional<Slice<typename Vector_writer<A>::Value>>
  Vector_writer<A>::append(Slice<const Value> children, Error_code* err_code)
{
  return m_writer.write_values(children, err_code);
}

template<typename A>
std::optional<Slice<typename Vector_writer<A>::Value>>
  Vector_writer<A>::allocate_uninit(size_t n_children, Error_code* err_code)
{
  return m_writer.template allocate_values<Value>(n_children, err_code);
}

template<typename A>
std::optional<Vector_writer<A>> Vector_type_writer::of_type(urid_t child_type, Error_code* err_code)
{
  using Value = typename A::Value;
  using Result = std::optional<Vector_writer<A>>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, of_type<A>, child_type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (child_type == 0)
  {
    *err_code = error::Code::S_INVALID_URID;
    return std::nullopt;
  }
  // else

  if (!m_writer.write_value(Vector_body{ uint32_t(sizeof(Value)), child_type }, err_code))
  {
    return std::nullopt;
  }
  // else
  return Vector_writer<A>(std::move(m_writer));
}

} // namespace lv2::atom
