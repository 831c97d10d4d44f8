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

#include "lv2/atom/space/space_cursor.hpp"
#include "lv2/atom/space/atom_writer.hpp"
#include "lv2/atom/unidentified_atom.hpp"
#include <flow/log/log.hpp>

namespace lv2::atom
{

// Types.

/**
 * Plugin-side view of an atom input port for one processing cycle: the single atom the host put in the port
 * buffer, to be identified via read().  Obtain via Atom_port::input_from_raw().
 */
class Port_reader :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Wraps `atom`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   * @param atom
   *        The port's atom; not null; must outlive `*this`.
   */
  explicit Port_reader(flow::log::Logger* logger_ptr, const Unidentified_atom* atom);

  // Methods.

  /**
   * The port's atom, unidentified.
   * @return See above.
   */
  const Unidentified_atom& atom() const;

  /**
   * Identifies the port's atom as `A`; see Unidentified_atom::read().
   *
   * @tparam A
   *         Atom type.
   * @param type
   *        Type tag of `A`.
   * @param err_code
   *        See Unidentified_atom::read().
   * @return See Unidentified_atom::read().
   */
  template<typename A>
  std::optional<typename A::Read_handle> read(urid_t type, Error_code* err_code = 0) const;

private:
  // Data.

  /// See atom().
  const Unidentified_atom* m_atom;
}; // class Port_reader

/**
 * Plugin-side view of an atom output port for one processing cycle: exactly one top-level atom may be written
 * into the port buffer, via init().  Obtain via Atom_port::output_from_raw().
 *
 * Do not move `*this` once init() has succeeded: the returned write handle refers to it.
 */
class Port_writer :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Writer over `space`, nothing written.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   * @param space
   *        The writable port buffer; must outlive `*this`.
   */
  explicit Port_writer(flow::log::Logger* logger_ptr, Byte_space_mut space);

  // Methods.

  /**
   * Starts the port's atom.  Allowed once: after a successful call, further calls fail.
   *
   * @tparam A
   *         Writable atom type.
   * @param type
   *        Type tag of `A`.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ATOM_ALREADY_WRITTEN, whatever Space_writer::write_atom() emits.
   * @return The atom's write handle; or empty on error.
   */
  template<typename A>
  std::optional<typename A::Write_handle> init(urid_t type, Error_code* err_code = 0);

  /**
   * Whether init() has succeeded.
   * @return See above.
   */
  bool written() const;

  /**
   * Bytes written so far, from the start of the port buffer.
   * @return See above.
   */
  Byte_space written_bytes() const;

private:
  // Methods.

  /**
   * Checks that nothing was written yet, logging if not.
   *
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_ATOM_ALREADY_WRITTEN.
   * @return `true` if init() may proceed.
   */
  bool check_not_written(Error_code* err_code) const;

  // Data.

  /// Cursor over the port buffer.
  Space_cursor m_cursor;

  /// See written().
  bool m_written;
}; // class Port_writer

/**
 * Interpretation of the raw buffers a host connects to a plugin's atom ports.  (Connecting ports, and calling
 * these once per cycle, is the job of the plugin framework.)
 *
 * Input: the buffer holds one atom.  Output: the host writes a Chunk atom whose body size is the capacity
 * available to the plugin; the plugin's atom is written into that body.
 */
class Atom_port
{
public:
  // Methods.

  /**
   * Reader for an input port buffer.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   * @param data
   *        The port buffer: an 8-byte aligned atom, whose whole declared body must be readable.
   * @param sample_count
   *        Frames in this cycle; unused.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SPACE_MISALIGNED, error::Code::S_READING_OUT_OF_BOUNDS (`data` is null).
   * @return The reader; or empty on error.
   */
  static std::optional<Port_reader> input_from_raw(flow::log::Logger* logger_ptr, const void* data,
                                                   uint32_t sample_count, Error_code* err_code = 0);

  /**
   * Writer for an output port buffer.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; may be null.
   * @param data
   *        The port buffer: an 8-byte aligned Chunk atom (the type tag is not checked), whose body is writable.
   * @param sample_count
   *        Frames in this cycle; unused.
   * @param err_code
   *        See input_from_raw().
   * @return The writer; or empty on error.
   */
  static std::optional<Port_writer> output_from_raw(flow::log::Logger* logger_ptr, void* data,
                                                    uint32_t sample_count, Error_code* err_code = 0);
}; // class Atom_port

// Template implementations.

template<typename A>
std::optional<typename A::Read_handle> Port_reader::read(urid_t type, Error_code* err_code) const
{
  using Result = std::optional<typename A::Read_handle>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, read<A>, type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto result = m_atom->read<A>(type, err_code);
  if (!result)
  {
    FLOW_LOG_TRACE("Port_reader [" << *this << "]: Atom [" << *m_atom << "] is not readable as type "
                   "[" << type << "]: [" << *err_code << "] [" << err_code->message() << "].");
  }
  return result;
}

template<typename A>
std::optional<typename A::Write_handle> Port_writer::init(urid_t type, Error_code* err_code)
{
  using Result = std::optional<typename A::Write_handle>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, init<A>, type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!check_not_written(err_code))
  {
    return std::nullopt;
  }
  // else

  auto result = m_cursor.write_atom<A>(type, err_code);
  if (result)
  {
    m_written = true;
  }
  return result;
}

} // namespace lv2::atom
