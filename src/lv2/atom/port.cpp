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
#include "lv2/atom/port.hpp"

namespace lv2::atom
{

// Port_reader implementations.

Port_reader::Port_reader(flow::log::Logger* logger_ptr, const Unidentified_atom* atom) :
  flow::log::Log_context(logger_ptr, Log_component::S_PORT),
  m_atom(atom)
{
  assert(m_atom);
  FLOW_LOG_TRACE("Port_reader [" << *this << "]: Cycle start; input atom [" << *m_atom << "].");
}

const Unidentified_atom& Port_reader::atom() const
{
  return *m_atom;
}

std::ostream& operator<<(std::ostream& os, const Port_reader& val)
{
  return os << '@' << &val;
}

// Port_writer implementations.

Port_writer::Port_writer(flow::log::Logger* logger_ptr, Byte_space_mut space) :
  flow::log::Log_context(logger_ptr, Log_component::S_PORT),
  m_cursor(logger_ptr, space),
  m_written(false)
{
  FLOW_LOG_TRACE("Port_writer [" << *this << "]: Cycle start; [" << space.size() << "] bytes available.");
}

bool Port_writer::written() const
{
  return m_written;
}

Byte_space Port_writer::written_bytes() const
{
  return m_cursor.allocated_bytes();
}

bool Port_writer::check_not_written(Error_code* err_code) const
{
  assert(err_code);

  if (m_written)
  {
    FLOW_LOG_WARNING("Port_writer [" << *this << "]: The port's atom was already written this cycle; "
                     "a port holds one atom.  Emitting error.");
    *err_code = error::Code::S_ATOM_ALREADY_WRITTEN;
    return false;
  }
  // else
  return true;
}

std::ostream& operator<<(std::ostream& os, const Port_writer& val)
{
  return os << '@' << &val;
}

// Atom_port implementations.

std::optional<Port_reader> Atom_port::input_from_raw(flow::log::Logger* logger_ptr, const void* data,
                                                     uint32_t, Error_code* err_code) // Static.
{
  using Result = std::optional<Port_reader>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, input_from_raw, logger_ptr, data, 0, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!data)
  {
    *err_code = error::Code::S_READING_OUT_OF_BOUNDS;
    return std::nullopt;
  }
  // else

  const auto bytes = static_cast<const uint8_t*>(data);
  const auto header_space = Atom_space::from_bytes(bytes, sizeof(Atom_header), err_code);
  if (!header_space)
  {
    return std::nullopt;
  }
  // else

  // The host vouches for the declared body.
  const size_t atom_size = header_space->assume_init_value()->size_of_atom();
  const auto atom = Unidentified_atom::from_space(Atom_space::from_bytes_unchecked(bytes, atom_size), err_code);
  if (!atom)
  {
    return std::nullopt;
  }
  // else
  return Port_reader(logger_ptr, atom);
}

std::optional<Port_writer> Atom_port::output_from_raw(flow::log::Logger* logger_ptr, void* data,
                                                      uint32_t, Error_code* err_code) // Static.
{
  using Result = std::optional<Port_writer>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, output_from_raw, logger_ptr, data, 0, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!data)
  {
    *err_code = error::Code::S_READING_OUT_OF_BOUNDS;
    return std::nullopt;
  }
  // else

  const auto bytes = static_cast<uint8_t*>(data);
  const auto header_space = Atom_space_mut::from_bytes(bytes, sizeof(Atom_header), err_code);
  if (!header_space)
  {
    return std::nullopt;
  }
  // else

  // The Chunk's body is the capacity the host grants us.
  const size_t capacity = header_space->assume_init_value()->size_of_body();
  err_code->clear();
  return Port_writer(logger_ptr, Byte_space_mut::from_bytes_unchecked(bytes + sizeof(Atom_header), capacity));
}

} // namespace lv2::atom
