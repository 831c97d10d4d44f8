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
#include "lv2/atom/detail/next_iterator.hpp"

namespace lv2::atom
{

// Types.

/**
 * Read handle of a Tuple: yields the child atoms in order.  Iteration ends at the end of the body, or silently at
 * the first child whose header or declared body does not fit in what remains of it.
 */
class Tuple_iterator
{
public:
  // Types.

  /// Yielded item: a child atom.
  using Item = const Unidentified_atom*;

  /// Iterator type for range-`for`.
  using Iterator = Next_iterator<Tuple_iterator>;

  // Constructors/destructor.

  /**
   * Iterator over the children packed in `body`.
   *
   * @param body
   *        The tuple's body.
   */
  explicit Tuple_iterator(Atom_space body);

  // Methods.

  /**
   * Next child, or empty at the end.
   * @return See above.
   */
  std::optional<Item> next();

  /**
   * Range-`for` support; does not affect `*this`.
   * @return See above.
   */
  Iterator begin() const;

  /**
   * Range-`for` support.
   * @return See above.
   */
  Iterator end() const;

private:
  // Data.

  /// Unread part of the body.
  Space_reader m_reader;
}; // class Tuple_iterator

/**
 * Write handle of a Tuple: appends child atoms one after the other.  Each init() returns the child's write
 * handle, whose writes grow this tuple's body too.  Finish writing a child before starting the next, and do not
 * move `*this` while a child handle is in use.
 */
class Tuple_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the tuple's writer.
   *
   * @param writer
   *        Writer of the tuple body.
   */
  explicit Tuple_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Starts the next child atom.
   *
   * @tparam A
   *         Writable atom type.
   * @param child_type
   *        Type tag of `A`.
   * @param err_code
   *        See Space_writer::write_atom().
   * @return See Space_writer::write_atom().
   */
  template<typename A>
  std::optional<typename A::Write_handle> init(urid_t child_type, Error_code* err_code = 0);

private:
  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Tuple_writer

/// `atom:Tuple`: heterogeneous list of child atoms, back to back, without a count.
struct Tuple
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = Tuple_iterator;

  /// See Space_writer::write_atom().
  using Write_handle = Tuple_writer;

  // Methods.

  /**
   * Creates the iterator.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  Never fails.
   * @return See above.
   */
  static std::optional<Read_handle> read(Atom_space body, Error_code* err_code);

  /**
   * Creates the write handle.
   *
   * @param writer
   *        The atom's body writer.
   * @param err_code
   *        Not null.  Never fails.
   * @return See above.
   */
  static std::optional<Write_handle> init(Atom_writer&& writer, Error_code* err_code);
}; // struct Tuple

// Template implementations.

template<typename A>
std::optional<typename A::Write_handle> Tuple_writer::init(urid_t child_type, Error_code* err_code)
{
  return m_writer.write_atom<A>(child_type, err_code);
}

} // namespace lv2::atom
