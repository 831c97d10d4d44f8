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
#include "lv2/atom/detail/bodies.hpp"
#include <utility>

namespace lv2::atom
{

// Types.

/// Identity and type of an Object, as stored at the start of its body.
struct Object_header
{
  // Data.

  /// Object ID, if any (stored as 0 if not).
  std::optional<urid_t> m_id;

  /// Object type tag; never 0.
  urid_t m_otype;
};

/// Key and context of one Object property, as stored ahead of its value atom.
struct Property_header
{
  // Data.

  /// Key; never 0.
  urid_t m_key;

  /// Context, if any (stored as 0 if not).
  std::optional<urid_t> m_context;
};

/**
 * Iterator over the properties of an Object: yields each property's header together with its value atom.
 * Iteration ends at the end of the body, or silently at the first property that is truncated or has key 0.
 */
class Object_reader
{
public:
  // Types.

  /// Yielded item.
  using Item = std::pair<Property_header, const Unidentified_atom*>;

  /// Iterator type for range-`for`.
  using Iterator = Next_iterator<Object_reader>;

  // Constructors/destructor.

  /**
   * Iterator over the properties starting at `reader`'s position.
   *
   * @param reader
   *        Reader positioned after the Object_header.
   */
  explicit Object_reader(const Space_reader& reader);

  // Methods.

  /**
   * Next property, or empty at the end.
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
}; // class Object_reader

/**
 * Write handle of an Object once its header is written: appends properties.  Each new_property() writes the
 * property header, then starts the value atom and returns its write handle.  Finish writing a value before
 * starting the next property, and do not move `*this` while a value handle is in use.
 */
class Object_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the object's writer, positioned after the header.
   *
   * @param writer
   *        Writer of the object body.
   */
  explicit Object_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Appends a property without context.
   *
   * @tparam A
   *         Writable atom type of the value.
   * @param key
   *        Property key; not 0.
   * @param value_type
   *        Type tag of `A`.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_URID (`key` is 0), whatever Space_writer::write_atom() emits.  On error
   *        nothing of the property remains written.
   * @return The value's write handle; or empty on error.
   */
  template<typename A>
  std::optional<typename A::Write_handle> new_property(urid_t key, urid_t value_type, Error_code* err_code = 0);

  /**
   * Appends a property with a context.
   *
   * @tparam A
   *         Writable atom type of the value.
   * @param key
   *        Property key; not 0.
   * @param context
   *        Property context; not 0.
   * @param value_type
   *        Type tag of `A`.
   * @param err_code
   *        See new_property().  error::Code::S_INVALID_URID also if `context` is 0.
   * @return See new_property().
   */
  template<typename A>
  std::optional<typename A::Write_handle> new_property_with_context(urid_t key, urid_t context, urid_t value_type,
                                                                    Error_code* err_code = 0);

private:
  // Methods.

  /**
   * Implements both new_property() and new_property_with_context().
   *
   * @tparam A
   *         See new_property().
   * @param key
   *        See new_property().
   * @param context
   *        Context or 0.
   * @param value_type
   *        See new_property().
   * @param err_code
   *        Not null.
   * @return See new_property().
   */
  template<typename A>
  std::optional<typename A::Write_handle> write_property(urid_t key, urid_t context, urid_t value_type,
                                                         Error_code* err_code);

  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Object_writer

/// Initial write handle of an Object: the header must be written (write_header()) before any property.
class Object_header_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the object's writer; nothing written yet.
   *
   * @param writer
   *        Writer of the object body.
   */
  explicit Object_header_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Writes the header, then turns into the property writer.  `*this` is spent after a success.
   *
   * @param header
   *        ID and type; type not 0, ID not 0 if present.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_URID, allocation errors.
   * @return The property writer; or empty on error.
   */
  std::optional<Object_writer> write_header(const Object_header& header, Error_code* err_code = 0);

private:
  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Object_header_writer

/// `atom:Object`: an RDF-style resource; optional ID, a type, then key/value properties.
struct Object
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = std::pair<Object_header, Object_reader>;

  /// See Space_writer::write_atom().
  using Write_handle = Object_header_writer;

  // Methods.

  /**
   * Reads the header and creates the property iterator.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_READING_OUT_OF_BOUNDS,
   *        error::Code::S_INVALID_ATOM_VALUE (object type is 0).
   * @return See above; or empty on error.
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
}; // struct Object

/**
 * `atom:Blank`: the deprecated name of an Object without ID, still found in older hosts' and plugins' data.
 * Readable exactly like an Object; never written.
 */
struct Blank
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = Object::Read_handle;

  // Methods.

  /**
   * Same as Object::read().
   *
   * @param body
   *        See Object::read().
   * @param err_code
   *        See Object::read().
   * @return See Object::read().
   */
  static std::optional<Read_handle> read(Atom_space body, Error_code* err_code);
}; // struct Blank

// Template implementations.

template<typename A>
std::optional<typename A::Write_handle>
  Object_writer::new_property(urid_t key, urid_t value_type, Error_code* err_code)
{
  using Result = std::optional<typename A::Write_handle>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, new_property<A>, key, value_type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return write_property<A>(key, 0, value_type, err_code);
}

template<typename A>
std::optional<typename A::Write_handle>
  Object_writer::new_property_with_context(urid_t key, urid_t context, urid_t value_type, Error_code* err_code)
{
  using Result = std::optional<typename A::Write_handle>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, new_property_with_context<A>, key, context, value_type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (context == 0)
  {
    *err_code = error::Code::S_INVALID_URID;
    return std::nullopt;
  }
  // else
  return write_property<A>(key, context, value_type, err_code);
}

template<typename A>
std::optional<typename A::Write_handle>
  Object_writer::write_property(urid_t key, urid_t context, urid_t value_type, Error_code* err_code)
{
  assert(err_code);

  if (key == 0)
  {
    *err_code = error::Code::S_INVALID_URID;
    return std::nullopt;
  }
  // else

  const size_t n_allocated_before = m_writer.allocated_bytes().size();
  if (!m_writer.write_value(Property_body{ key, context }, err_code))
  {
    return std::nullopt;
  }
  // else

  auto value = m_writer.write_atom<A>(value_type, err_code);
  if (!value)
  {
    // Take back the property header too.
    Error_code rewind_err_code;
    [[maybe_unused]] const bool rewound = m_writer.rewind_to(n_allocated_before, &rewind_err_code);
    assert(rewound && "Rewinding to a previously allocated size cannot fail.");
  }
  return value;
} // Object_writer::write_property()

} // namespace lv2::atom
