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

#include <iterator>
#include <optional>
#include <cassert>
#include <cstddef>

namespace lv2::atom
{

// Types.

/**
 * Input iterator over the items of a *generator*: a copyable type with `using Item = ...` and a method
 * `std::optional<Item> next()` returning the items one by one, then empty.  Lets the container readers (Tuple,
 * Object, Sequence) offer both a `next()` loop and range-`for`.
 *
 * A default-constructed iterator is the end iterator.  Two iterators compare equal if both are at the end (or
 * they are the same iterator).
 *
 * @tparam Generator
 *         See above.
 */
template<typename Generator>
class Next_iterator
{
public:
  // Types.

  /// Standard iterator trait.
  using iterator_category = std::input_iterator_tag;
  /// Standard iterator trait.
  using value_type = typename Generator::Item;
  /// Standard iterator trait.
  using difference_type = std::ptrdiff_t;
  /// Standard iterator trait.
  using pointer = const value_type*;
  /// Standard iterator trait.
  using reference = const value_type&;

  // Constructors/destructor.

  /// End iterator.
  Next_iterator() = default;

  /**
   * Iterator at the first item of a copy of `generator`.
   *
   * @param generator
   *        Generator, positioned at the first item to yield.
   */
  explicit Next_iterator(const Generator& generator) :
    m_generator(generator)
  {
    m_item = m_generator->next();
  }

  // Methods.

  /**
   * Current item.  Not at the end.
   * @return See above.
   */
  reference operator*() const
  {
    assert(m_item && "Dereferencing an end iterator.");
    return *m_item;
  }

  /**
   * Current item.  Not at the end.
   * @return See above.
   */
  pointer operator->() const
  {
    return &(operator*());
  }

  /**
   * Advances.  Not at the end.
   * @return `*this`.
   */
  Next_iterator& operator++()
  {
    assert(m_item && "Incrementing an end iterator.");
    m_item = m_generator->next();
    return *this;
  }

  /**
   * Advances.  Not at the end.
   * @return Copy from before the advance.
   */
  Next_iterator operator++(int)
  {
    Next_iterator before(*this);
    ++(*this);
    return before;
  }

  /**
   * See class doc header.
   *
   * @param other
   *        Other iterator.
   * @return See above.
   */
  bool operator==(const Next_iterator& other) const
  {
    return (this == &other) || ((!m_item) && (!other.m_item));
  }

  /**
   * Negation of `==`.
   *
   * @param other
   *        Other iterator.
   * @return See above.
   */
  bool operator!=(const Next_iterator& other) const
  {
    return !(*this == other);
  }

private:
  // Data.

  /// Source of items; empty for an end iterator.
  std::optional<Generator> m_generator;

  /// Current item; empty at the end.
  std::optional<value_type> m_item;
}; // class Next_iterator

} // namespace lv2::atom
