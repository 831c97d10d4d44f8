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

// Everything needed to read and write atoms; include this rather than the individual headers.

#include "lv2/atom/error.hpp"
#include "lv2/atom/header.hpp"
#include "lv2/atom/unidentified_atom.hpp"
#include "lv2/atom/space/aligned_space.hpp"
#include "lv2/atom/space/space_reader.hpp"
#include "lv2/atom/space/space_cursor.hpp"
#include "lv2/atom/space/aligned_vec.hpp"
#include "lv2/atom/space/atom_writer.hpp"
#include "lv2/atom/space/terminated.hpp"
#include "lv2/atom/atoms/chunk.hpp"
#include "lv2/atom/atoms/scalar.hpp"
#include "lv2/atom/atoms/vector.hpp"
#include "lv2/atom/atoms/tuple.hpp"
#include "lv2/atom/atoms/object.hpp"
#include "lv2/atom/atoms/sequence.hpp"
#include "lv2/atom/atoms/string.hpp"
#include "lv2/atom/urid.hpp"
#include "lv2/atom/port.hpp"
