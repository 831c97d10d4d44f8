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
#include "lv2/atom/space/space_writer.hpp"
#include <cstring>

namespace lv2::atom
{

// Implementations.

Space_writer::Space_writer(flow::log::Logger* logger_ptr) :
  Space_allocator(logger_ptr)
{
  // Nothing else.
}

std::optional<Byte_space_mut> Space_writer::allocate(size_t size, Error_code* err_code)
{
  using Result = std::optional<Byte_space_mut>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, allocate, size, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto alloc = allocate_and_split(size, err_code);
  if (!alloc)
  {
    return std::nullopt;
  }
  // else
  err_code->clear();
  return alloc->m_allocated;
}

std::optional<Byte_space_mut> Space_writer::write_bytes(const void* bytes, size_t size, Error_code* err_code)
{
  using Result = std::optional<Byte_space_mut>;
  using std::memcpy;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, write_bytes, bytes, size, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto space = allocate(size, err_code);
  if (!space)
  {
    return std::nullopt;
  }
  // else

  if (size != 0)
  {
    memcpy(space->data(), bytes, size);
  }
  return space;
}

const Unidentified_atom* Space_writer::copy_atom(const Unidentified_atom& atom, Error_code* err_code)
{
  using std::memcpy;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(const Unidentified_atom*, copy_atom, atom, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto src = atom.atom_space();
  const auto space = allocate_aligned<Atom_header>(src.size(), err_code);
  if (!space)
  {
    FLOW_LOG_WARNING("Space_writer [" << *this << "]: Could not copy atom [" << atom << "]; "
                     "see preceding messages if any.");
    return nullptr;
  }
  // else

  memcpy(space->data(), src.data(), src.size());
  return Unidentified_atom::from_space(*space, err_code);
}

bool Space_writer::rewind_to(size_t allocated_size, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, rewind_to, allocated_size, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const size_t n_allocated = allocated_bytes().size();
  if (allocated_size > n_allocated)
  {
    *err_code = error::Code::S_REWIND_BEYOND_ALLOCATED;
    return false;
  }
  // else

  if (!rewind(n_allocated - allocated_size, err_code))
  {
    return false;
  }
  // else
  err_code->clear();
  return true;
}

} // namespace lv2::atom
