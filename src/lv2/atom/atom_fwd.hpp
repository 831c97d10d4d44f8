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

#include "lv2/common.hpp"
#include <ostream>

/**
 * The in-place, self-describing, tagged binary value format ("Atom") exchanged between an LV2 host and its plugins
 * inside fixed-size, host-supplied, 8-byte-aligned buffers.  Nothing here allocates in the real-time path:
 * readers and writers are cursors over memory owned by someone else.
 *
 * Layers, leaf to root:
 *   - Basic_aligned_space: a byte range known to be aligned for some `T`.  Space_reader walks one;
 *     Space_writer (with concrete Space_cursor, Vec_space_cursor, Atom_writer, Terminated) carves one up.
 *   - Atom_header framing: every atom is `{ size_of_body, type }` followed by the body, padded to 8 bytes.
 *   - Unidentified_atom: a header-plus-body view, identified (read as a given type) by type tag comparison.
 *   - The atom types themselves (Chunk, Int, Long, Float, Double, Bool, Urid, Vector, Tuple, Object, Blank,
 *     Sequence, String, Literal): each supplies `read()` (body -> read handle) and, unless read-only,
 *     `init()` (Atom_writer -> write handle).
 *
 * Type tags come from a URID mapping service (Urid_mapper); resolve them once, outside the real-time path, into an
 * Atom_urid_collection and compare integers afterwards.
 */
namespace lv2::atom
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename T, bool IS_MUTABLE>
class Basic_aligned_space;
template<typename T>
class Slice;

struct Atom_header;
class Unidentified_atom;

class Space_reader;
class Space_allocator;
class Space_writer;
class Space_cursor;
class Vec_space;
class Vec_space_cursor;
class Atom_writer;
template<typename Inner_writer>
class Terminated;

class Urid_mapper;
class Hash_urid_mapper;
struct Atom_urid_collection;

class Port_reader;
class Port_writer;

/**
 * A URID: the small integer that stands in for a URI, as handed out by a Urid_mapper.  0 is reserved and means
 * none/invalid; in atoms it marks an absent optional tag (e.g., an Object without an ID).
 */
using urid_t = uint32_t;

/// Read-only view of a byte range aligned for `T`.
template<typename T>
using Aligned_space = Basic_aligned_space<T, false>;

/// Mutable view of a byte range aligned for `T`.
template<typename T>
using Aligned_space_mut = Basic_aligned_space<T, true>;

/// Read-only view of arbitrary bytes (alignment 1).
using Byte_space = Aligned_space<uint8_t>;

/// Mutable view of arbitrary bytes (alignment 1).
using Byte_space_mut = Aligned_space_mut<uint8_t>;

/// Read-only view of a byte range aligned for an atom (8 bytes).  An atom body is one of these.
using Atom_space = Aligned_space<Atom_header>;

/// Mutable view of a byte range aligned for an atom (8 bytes).
using Atom_space_mut = Aligned_space_mut<Atom_header>;

// Free functions.

/**
 * Prints string representation of the given `Atom_header` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Atom_header& val);

/**
 * Prints string representation of the given `Unidentified_atom` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Unidentified_atom& val);

/**
 * Prints string representation of the given writer (any Space_allocator) to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Space_allocator& val);

/**
 * Prints string representation of the given `Vec_space` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Vec_space& val);

/**
 * Prints string representation of the given `Hash_urid_mapper` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Hash_urid_mapper& val);

/**
 * Prints string representation of the given `Port_reader` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Port_reader& val);

/**
 * Prints string representation of the given `Port_writer` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Port_writer& val);

} // namespace lv2::atom
