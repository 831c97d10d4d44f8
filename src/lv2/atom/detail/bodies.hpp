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

namespace lv2::atom
{

// Types.

/* Fixed-size records that begin the bodies of the container atoms, laid out exactly as the LV2 atom C headers
 * lay them out (LV2_Atom_Vector_Body, LV2_Atom_Object_Body, LV2_Atom_Property_Body minus its value,
 * LV2_Atom_Sequence_Body, LV2_Atom_Literal_Body).  They are read and written only through Space_reader and
 * Space_writer; the user-facing types (Object_header, Time_stamp, ...) are built from them. */

/// Start of a Vector body; elements follow.
struct Vector_body
{
  /// `sizeof` one element.
  uint32_t m_child_size;
  /// Type tag of the elements.
  urid_t m_child_type;
};

/// Start of an Object body; properties follow.
struct Object_body
{
  /// Object ID; 0 for none.
  urid_t m_id;
  /// Object type tag; never 0.
  urid_t m_otype;
};

/// Start of an Object property; the value atom follows.
struct Property_body
{
  /// Key; never 0.
  urid_t m_key;
  /// Context; 0 for none.
  urid_t m_context;
};

/// Start of a Sequence body; events follow.
struct Sequence_body
{
  /// Time stamp unit tag (frame or beat); 0 is treated as frames.
  urid_t m_unit;
  /// Unused.
  uint32_t m_pad;
};

/// Start of a Literal body; text follows.
struct Literal_body
{
  /// Datatype tag; 0 for none.
  urid_t m_datatype;
  /// Language tag; 0 for none.
  urid_t m_lang;
};

static_assert((sizeof(Vector_body) == 8) && (sizeof(Object_body) == 8) && (sizeof(Property_body) == 8)
                && (sizeof(Sequence_body) == 8) && (sizeof(Literal_body) == 8),
              "Body records must match the LV2 atom C layouts.");

} // namespace lv2::atom
