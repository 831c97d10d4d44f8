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
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/unordered_map.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lv2::atom
{

// Constants.

/// URI of `atom:Blank`.
constexpr util::String_view S_BLANK_URI = "http://lv2plug.in/ns/ext/atom#Blank";
/// URI of `atom:Bool`.
constexpr util::String_view S_BOOL_URI = "http://lv2plug.in/ns/ext/atom#Bool";
/// URI of `atom:Chunk`.
constexpr util::String_view S_CHUNK_URI = "http://lv2plug.in/ns/ext/atom#Chunk";
/// URI of `atom:Double`.
constexpr util::String_view S_DOUBLE_URI = "http://lv2plug.in/ns/ext/atom#Double";
/// URI of `atom:Float`.
constexpr util::String_view S_FLOAT_URI = "http://lv2plug.in/ns/ext/atom#Float";
/// URI of `atom:Int`.
constexpr util::String_view S_INT_URI = "http://lv2plug.in/ns/ext/atom#Int";
/// URI of `atom:Literal`.
constexpr util::String_view S_LITERAL_URI = "http://lv2plug.in/ns/ext/atom#Literal";
/// URI of `atom:Long`.
constexpr util::String_view S_LONG_URI = "http://lv2plug.in/ns/ext/atom#Long";
/// URI of `atom:Object`.
constexpr util::String_view S_OBJECT_URI = "http://lv2plug.in/ns/ext/atom#Object";
/// URI of `atom:Property`.
constexpr util::String_view S_PROPERTY_URI = "http://lv2plug.in/ns/ext/atom#Property";
/// URI of `atom:Sequence`.
constexpr util::String_view S_SEQUENCE_URI = "http://lv2plug.in/ns/ext/atom#Sequence";
/// URI of `atom:String`.
constexpr util::String_view S_STRING_URI = "http://lv2plug.in/ns/ext/atom#String";
/// URI of `atom:Tuple`.
constexpr util::String_view S_TUPLE_URI = "http://lv2plug.in/ns/ext/atom#Tuple";
/// URI of `atom:URID`.
constexpr util::String_view S_URID_URI = "http://lv2plug.in/ns/ext/atom#URID";
/// URI of `atom:Vector`.
constexpr util::String_view S_VECTOR_URI = "http://lv2plug.in/ns/ext/atom#Vector";
/// URI of `units:frame`, the frame time stamp unit of a Sequence.
constexpr util::String_view S_FRAME_URI = "http://lv2plug.in/ns/extensions/units#frame";
/// URI of `units:beat`, the beat time stamp unit of a Sequence.
constexpr util::String_view S_BEAT_URI = "http://lv2plug.in/ns/extensions/units#beat";

// Types.

/**
 * Interface of the type registry: the host service that interns URIs as small non-zero integers (URIDs), used by
 * lv2::atom as type tags, property keys and units.  Mapping may allocate and lock; so do it outside the real-time
 * path, once, and keep the results (e.g., in an Atom_urid_collection).
 *
 * Contract: map() of the same URI always returns the same URID for the lifetime of `*this`; distinct URIs get
 * distinct URIDs; 0 is never a valid URID.
 */
class Urid_mapper
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Urid_mapper();

  // Methods.

  /**
   * URID of `uri`, assigning one if needed.
   *
   * @param uri
   *        URI.
   * @return The URID; or 0 if none could be assigned.
   */
  virtual urid_t map(util::String_view uri) = 0;

  /**
   * URI mapped to `urid`, if any.
   *
   * @param urid
   *        URID.
   * @return Pointer to the URI, valid as long as `*this`; or null if `urid` was never returned by map().
   */
  virtual const std::string* unmap(urid_t urid) const = 0;
}; // class Urid_mapper

/**
 * Urid_mapper keeping its table in memory: URIDs are 1, 2, 3, ... in order of first map().  For tests and for
 * hosts without a URID service of their own.  Thread-safe.
 */
class Hash_urid_mapper :
  public Urid_mapper,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Empty table.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   */
  explicit Hash_urid_mapper(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Implements Urid_mapper API.
   *
   * @param uri
   *        See Urid_mapper.
   * @return See Urid_mapper.  0 only if the 32-bit URID space is exhausted.
   */
  urid_t map(util::String_view uri) override;

  /**
   * Implements Urid_mapper API.
   *
   * @param urid
   *        See Urid_mapper.
   * @return See Urid_mapper.
   */
  const std::string* unmap(urid_t urid) const override;

  /**
   * Number of URIs mapped.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// Protects the other members.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// URI to URID.  Keys are owned here.
  boost::unordered_map<std::string, urid_t> m_urids;

  /// URID minus 1 to its entry in #m_urids.  Node-based storage keeps the pointed-to keys in place.
  std::vector<const std::string*> m_uris;
}; // class Hash_urid_mapper

/**
 * The URIDs of all atom types plus the Sequence time units, mapped once up front and then passed by reference
 * to the code that reads and writes atoms, which compares tags without touching the mapper.
 */
struct Atom_urid_collection
{
  // Methods.

  /**
   * Maps every URI of the collection through `mapper`.
   *
   * @param mapper
   *        The type registry.
   * @return The collection; or empty if any URI mapped to 0.
   */
  static std::optional<Atom_urid_collection> from_map(Urid_mapper* mapper);

  // Data.

  /// `atom:Blank`.
  urid_t m_blank;
  /// `atom:Bool`.
  urid_t m_bool;
  /// `atom:Chunk`.
  urid_t m_chunk;
  /// `atom:Double`.
  urid_t m_double;
  /// `atom:Float`.
  urid_t m_float;
  /// `atom:Int`.
  urid_t m_int;
  /// `atom:Literal`.
  urid_t m_literal;
  /// `atom:Long`.
  urid_t m_long;
  /// `atom:Object`.
  urid_t m_object;
  /// `atom:Property`.
  urid_t m_property;
  /// `atom:Sequence`.
  urid_t m_sequence;
  /// `atom:String`.
  urid_t m_string;
  /// `atom:Tuple`.
  urid_t m_tuple;
  /// `atom:URID`.
  urid_t m_urid;
  /// `atom:Vector`.
  urid_t m_vector;
  /// `units:frame`.
  urid_t m_frame;
  /// `units:beat`.
  urid_t m_beat;
}; // struct Atom_urid_collection

} // namespace lv2::atom
