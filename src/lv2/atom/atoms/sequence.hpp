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

/// Unit of the time stamps of a Sequence.
enum class Time_stamp_unit
{
  /// Audio frames since the start of the current cycle; stored as `int64_t`.
  S_FRAMES,
  /// Musical beats; stored as `double`.
  S_BEATS
};

/// Time stamp of a Sequence event: a frame count or a beat count.
class Time_stamp
{
public:
  // Constructors/destructor.

  /**
   * Time stamp in frames.
   *
   * @param frames
   *        Frame count.
   * @return See above.
   */
  static Time_stamp frames(int64_t frames);

  /**
   * Time stamp in beats.
   *
   * @param beats
   *        Beat count.
   * @return See above.
   */
  static Time_stamp beats(double beats);

  // Methods.

  /**
   * The unit.
   * @return See above.
   */
  Time_stamp_unit unit() const;

  /**
   * The frame count, if in frames.
   * @return See above.
   */
  std::optional<int64_t> as_frames() const;

  /**
   * The beat count, if in beats.
   * @return See above.
   */
  std::optional<double> as_beats() const;

private:
  // Constructors.

  /**
   * Constructs from the members.
   *
   * @param unit
   *        See #m_unit.
   * @param frames
   *        See #m_frames.
   * @param beats
   *        See #m_beats.
   */
  explicit Time_stamp(Time_stamp_unit unit, int64_t frames, double beats);

  // Data.

  /// Which of the other members is meaningful.
  Time_stamp_unit m_unit;

  /// Frame count; 0 unless #m_unit is frames.
  int64_t m_frames;

  /// Beat count; 0 unless #m_unit is beats.
  double m_beats;
}; // class Time_stamp

/**
 * Iterator over the events of a Sequence: yields each event's time stamp together with its atom.  Iteration
 * ends at the end of the body, or silently at the first truncated event.  Time stamps are yielded as stored;
 * their order is not checked.
 */
class Sequence_iterator
{
public:
  // Types.

  /// Yielded item.
  using Item = std::pair<Time_stamp, const Unidentified_atom*>;

  /// Iterator type for range-`for`.
  using Iterator = Next_iterator<Sequence_iterator>;

  // Constructors/destructor.

  /**
   * Iterator over the events starting at `reader`'s position.
   *
   * @param reader
   *        Reader positioned after the Sequence_body.
   * @param unit
   *        How to interpret the stored time stamps.
   */
  explicit Sequence_iterator(const Space_reader& reader, Time_stamp_unit unit);

  // Methods.

  /**
   * The unit of the yielded time stamps.
   * @return See above.
   */
  Time_stamp_unit unit() const;

  /**
   * Next event, or empty at the end.
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

  /// See unit().
  Time_stamp_unit m_unit;
}; // class Sequence_iterator

/**
 * Merges two Sequence_iterator streams, each assumed ordered by time stamp, into one ordered stream.  On equal
 * time stamps the event of the first stream comes first.  Time stamps of different units are not comparable;
 * the first stream's event is then yielded first.
 *
 * Obtain via zip_sequence().
 */
class Sequence_zip
{
public:
  // Types.

  /// Yielded item.
  using Item = Sequence_iterator::Item;

  /// Iterator type for range-`for`.
  using Iterator = Next_iterator<Sequence_zip>;

  // Constructors/destructor.

  /**
   * Merges `first` and `second`.
   *
   * @param first
   *        The preferred stream on ties.
   * @param second
   *        The other stream.
   */
  explicit Sequence_zip(const Sequence_iterator& first, const Sequence_iterator& second);

  // Methods.

  /**
   * Next event of either stream, or empty when both are exhausted.
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

  /// First stream.
  Sequence_iterator m_first;

  /// Second stream.
  Sequence_iterator m_second;

  /// Event taken from #m_first and not yet yielded.
  std::optional<Item> m_first_pending;

  /// Event taken from #m_second and not yet yielded.
  std::optional<Item> m_second_pending;
}; // class Sequence_zip

/**
 * Read handle of a Sequence: knows the stored unit tag; read() turns it into an event iterator once the caller
 * says which tag means beats (and, optionally, which means frames).
 */
class Sequence_header_reader
{
public:
  // Constructors/destructor.

  /**
   * Constructs from the sequence's body record and a reader positioned after it.
   *
   * @param body
   *        The record.
   * @param reader
   *        Reader over the events.
   */
  explicit Sequence_header_reader(const Sequence_body& body, const Space_reader& reader);

  // Methods.

  /**
   * The stored unit tag.
   * @return See above.
   */
  urid_t unit_urid() const;

  /**
   * Event iterator, interpreting time stamps as beats if the unit tag is `beat_unit`, as frames otherwise.
   *
   * @param beat_unit
   *        Tag of the beat unit.
   * @return See above.
   */
  Sequence_iterator read(urid_t beat_unit) const;

  /**
   * Event iterator, interpreting time stamps as beats if the unit tag is `beat_unit`, as frames if it is
   * `frame_unit` or 0; any other unit tag is an error.
   *
   * @param frame_unit
   *        Tag of the frame unit.
   * @param beat_unit
   *        Tag of the beat unit.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ATOM_VALUE.
   * @return See above; or empty on error.
   */
  std::optional<Sequence_iterator> read(urid_t frame_unit, urid_t beat_unit, Error_code* err_code = 0) const;

private:
  // Data.

  /// Copy of the body record.
  Sequence_body m_body;

  /// Reader over the events.
  Space_reader m_reader;
}; // class Sequence_header_reader

/**
 * Write handle of a Sequence once its unit is written: appends events whose time stamps never decrease.  Each
 * new_event() writes the time stamp, then starts the event's atom and returns its write handle.  Finish writing
 * an event before starting the next, and do not move `*this` while an event handle is in use.
 */
class Sequence_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the sequence's writer, positioned after the body record.
   *
   * @param writer
   *        Writer of the sequence body.
   * @param unit
   *        Unit of all time stamps to write.
   */
  explicit Sequence_writer(Atom_writer&& writer, Time_stamp_unit unit);

  // Methods.

  /**
   * The unit of all time stamps.
   * @return See above.
   */
  Time_stamp_unit unit() const;

  /**
   * Appends an event.
   *
   * @tparam A
   *         Writable atom type of the event.
   * @param stamp
   *        Time stamp; of unit() and not earlier than the last event's.
   * @param type
   *        Type tag of `A`.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_WRITING_ILLEGAL_STATE (`stamp` of the wrong unit or earlier than the last one),
   *        whatever Space_writer::write_atom() emits.  On error nothing of the event remains written.
   * @return The event atom's write handle; or empty on error.
   */
  template<typename A>
  std::optional<typename A::Write_handle> new_event(const Time_stamp& stamp, urid_t type, Error_code* err_code = 0);

  /**
   * Appends an event holding a verbatim copy of `atom`, e.g., one read from an input sequence.
   *
   * @param stamp
   *        See new_event().
   * @param atom
   *        Atom to copy.
   * @param err_code
   *        See new_event().
   * @return The copy; or null on error.
   */
  const Unidentified_atom* forward(const Time_stamp& stamp, const Unidentified_atom& atom, Error_code* err_code = 0);

private:
  // Methods.

  /**
   * Checks `stamp` against unit() and the last written time stamp.  Writes nothing.
   *
   * @param stamp
   *        Time stamp.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_WRITING_ILLEGAL_STATE.
   * @return `true` if `stamp` may be written.
   */
  bool check_time_stamp(const Time_stamp& stamp, Error_code* err_code);

  /**
   * Checks and writes `stamp`.
   *
   * @param stamp
   *        Time stamp.
   * @param err_code
   *        Not null.
   * @return `true` on success.
   */
  bool write_time_stamp(const Time_stamp& stamp, Error_code* err_code);

  /**
   * Un-allocates everything allocated after `allocated_size` was the allocated size.
   *
   * @param allocated_size
   *        Earlier `m_writer.allocated_bytes().size()`.
   */
  void roll_back(size_t allocated_size);

  // Data.

  /// Writer of the body.
  Atom_writer m_writer;

  /// See unit().
  Time_stamp_unit m_unit;

  /// Time stamp of the last event written, if any.
  std::optional<Time_stamp> m_last_stamp;
}; // class Sequence_writer

/// Initial write handle of a Sequence: the unit must be written (with_unit() or similar) before any event.
class Sequence_header_writer
{
public:
  // Constructors/destructor.

  /**
   * Takes over the sequence's writer; nothing written yet.
   *
   * @param writer
   *        Writer of the sequence body.
   */
  explicit Sequence_header_writer(Atom_writer&& writer);

  // Methods.

  /**
   * Writes the unit, then turns into the event writer.  `*this` is spent after a success.
   *
   * @param unit
   *        Unit of the time stamps.
   * @param unit_urid
   *        Tag of that unit (e.g., Atom_urid_collection::m_frame); not 0.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_URID, allocation errors.
   * @return The event writer; or empty on error.
   */
  std::optional<Sequence_writer> with_unit(Time_stamp_unit unit, urid_t unit_urid, Error_code* err_code = 0);

  /**
   * Same as `with_unit(Time_stamp_unit::S_FRAMES, frame_unit)`.
   *
   * @param frame_unit
   *        Tag of the frame unit.
   * @param err_code
   *        See with_unit().
   * @return See with_unit().
   */
  std::optional<Sequence_writer> with_frame_unit(urid_t frame_unit, Error_code* err_code = 0);

  /**
   * Same as `with_unit(Time_stamp_unit::S_BEATS, beat_unit)`.
   *
   * @param beat_unit
   *        Tag of the beat unit.
   * @param err_code
   *        See with_unit().
   * @return See with_unit().
   */
  std::optional<Sequence_writer> with_beat_unit(urid_t beat_unit, Error_code* err_code = 0);

private:
  // Data.

  /// Writer of the body.
  Atom_writer m_writer;
}; // class Sequence_header_writer

/// `atom:Sequence`: time-stamped events (e.g., MIDI), the usual payload of an atom port.
struct Sequence
{
  // Types.

  /// See Unidentified_atom::read().
  using Read_handle = Sequence_header_reader;

  /// See Space_writer::write_atom().
  using Write_handle = Sequence_header_writer;

  // Methods.

  /**
   * Reads the body record.
   *
   * @param body
   *        The atom body.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_READING_OUT_OF_BOUNDS.
   * @return The reader; or empty on error.
   */
  static std::optional<Read_handle> read(Atom_space body, Error_code* err_code);

  /**
   * Creates the write handle.
   *
   * @param writer
   *        The atom's body writer.
   * @param err_code
   *        Not null.  Never fails.
   * @return The handle.
   */
  static std::optional<Write_handle> init(Atom_writer&& writer, Error_code* err_code);
}; // struct Sequence

// Free functions.

/**
 * Merges two event streams by time stamp; see Sequence_zip.
 *
 * @param first
 *        The preferred stream on ties.
 * @param second
 *        The other stream.
 * @return See above.
 */
Sequence_zip zip_sequence(const Sequence_iterator& first, const Sequence_iterator& second);

/**
 * Returns `true` if and only if `lhs` and `rhs` have the same unit and count.
 *
 * @param lhs
 *        Object to compare.
 * @param rhs
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Time_stamp& lhs, const Time_stamp& rhs);

/**
 * Prints string representation of the given `Time_stamp` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Time_stamp& val);

// Template implementations.

template<typename A>
std::optional<typename A::Write_handle>
  Sequence_writer::new_event(const Time_stamp& stamp, urid_t type, Error_code* err_code)
{
  using Result = std::optional<typename A::Write_handle>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, new_event<A>, stamp, type, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const size_t n_allocated_before = m_writer.allocated_bytes().size();
  if (!write_time_stamp(stamp, err_code))
  {
    return std::nullopt;
  }
  // else

  auto event = m_writer.write_atom<A>(type, err_code);
  if (!event)
  {
    roll_back(n_allocated_before);
    return std::nullopt;
  }
  // else

  m_last_stamp = stamp;
  return event;
} // Sequence_writer::new_event()

} // namespace lv2::atom
