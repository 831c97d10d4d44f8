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
#include "lv2/atom/space/space_allocator.hpp"

namespace lv2::atom
{

// Implementations.

Space_allocator::Space_allocator(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_ATOM)
{
  // Nothing else.
}

Space_allocator::Space_allocator(const Space_allocator&) = default;
Space_allocator::Space_allocator(Space_allocator&&) = default;
Space_allocator::~Space_allocator() = default;
Space_allocator& Space_allocator::operator=(const Space_allocator&) = default;
Space_allocator& Space_allocator::operator=(Space_allocator&&) = default;

std::ostream& operator<<(std::ostream& os, const Space_allocator& val)
{
  return os << '@' << &val;
}

} // namespace lv2::atom
