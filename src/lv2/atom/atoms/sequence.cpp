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
#include "lv2/atom/atoms/sequence.hpp"

namespace lv2::atom
{

namespace
{

/**
 * Whether the event with time stamp `first` goes before (or together with) the one with `second`.
 *
 * @param first
 *        Time stamp from the preferred stream.
 * @param second
 *        Time stamp from the other stream.
 * @return See above.
 */
bool goes_first(const Time_stamp& first, const Time_stamp& second)
{
  if ((first.unit() == Time_stamp_unit::S_FRAMES) && (second.unit() == Time_stamp_unit::S_FRAMES))
  {
    return *first.as_frames() <= *second.as_frames();
  }
  // else
  if ((first.unit() == Time_stamp_unit::S_BEATS) && (second.unit() == Time_stamp_unit::S_BEATS))
  {
    return !(*second.as_beats() < *first.as_beats());
  }
  // else: Not comparable.
  return true;
}

} // namespace (anon)

// Time_stamp implementations.

Time_stamp::Time_stamp(Time_stamp_unit unit, int64_t frames, double beats) :
  m_unit(unit),
  m_frames(frames),
  m_beats(beats)
{
  // Nothing else.
}

Time_stamp Time_stamp::frames(int64_t frames) // Static.
{
  return Time_stamp(Time_stamp_unit::S_FRAMES, frames, 0);
}

Time_stamp Time_stamp::beats(double beats) // Static.
{
  return Time_stamp(Time_stamp_unit::S_BEATS, 0, beats);
}

Time_stamp_unit Time_stamp::unit() const
{
  return m_unit;
}

std::optional<int64_t> Time_stamp::as_frames() const
{
  if (m_unit != Time_stamp_unit::S_FRAMES)
  {
    return std::nullopt;
  }
  return m_frames;
}

std::optional<double> Time_stamp::as_beats() const
{
  if (m_unit != Time_stamp_unit::S_BEATS)
  {
    return std::nullopt;
  }
  return m_beats;
}

// Sequence_iterator implementations.

Sequence_iterator::Sequence_iterator(const Space_reader& reader, Time_stamp_unit unit) :
  m_reader(reader),
  m_unit(unit)
{
  // Nothing else.
}

Time_stamp_unit Sequence_iterator::unit() const
{
  return m_unit;
}

std::optional<Sequence_iterator::Item> Sequence_iterator::next()
{
  const auto unit = m_unit;
  return m_reader.try_read([unit](Space_reader& reader) -> std::optional<Item>
  {
    Error_code err_code;

    std::optional<Time_stamp> stamp;
    if (unit == Time_stamp_unit::S_FRAMES)
    {
      if (const auto frames = reader.next_value<int64_t>(&err_code))
      {
        stamp = Time_stamp::frames(*frames);
      }
    }
    else if (const auto beats = reader.next_value<double>(&err_code))
    {
      stamp = Time_stamp::beats(*beats);
    }

    if (!stamp)
    {
      return std::nullopt;
    }
    // else

    const auto event = reader.next_atom(&err_code);
    if (!event)
    {
      return std::nullopt;
    }
    // else
    return Item(*stamp, event);
  });
} // Sequence_iterator::next()

Sequence_iterator::Iterator Sequence_iterator::begin() const
{
  return Iterator(*this);
}

Sequence_iterator::Iterator Sequence_iterator::end() const
{
  return Iterator();
}

// Sequence_zip implementations.

Sequence_zip::Sequence_zip(const Sequence_iterator& first, const Sequence_iterator& second) :
  m_first(first),
  m_second(second)
{
  // Nothing else.
}

std::optional<Sequence_zip::Item> Sequence_zip::next()
{
  if (!m_first_pending)
  {
    m_first_pending = m_first.next();
  }
  if (!m_second_pending)
  {
    m_second_pending = m_second.next();
  }

  std::optional<Item>* chosen;
  if (m_first_pending && m_second_pending)
  {
    chosen = goes_first(m_first_pending->first, m_second_pending->first) ? &m_first_pending : &m_second_pending;
  }
  else if (m_first_pending)
  {
    chosen = &m_first_pending;
  }
  else
  {
    chosen = &m_second_pending; // Possibly also empty: then so are we.
  }

  std::optional<Item> item;
  item.swap(*chosen);
  return item;
} // Sequence_zip::next()

Sequence_zip::Iterator Sequence_zip::begin() const
{
  return Iterator(*this);
}

Sequence_zip::Iterator Sequence_zip::end() const
{
  return Iterator();
}

// Sequence_header_reader implementations.

Sequence_header_reader::Sequence_header_reader(const Sequence_body& body, const Space_reader& reader) :
  m_body(body),
  m_reader(reader)
{
  // Nothing else.
}

urid_t Sequence_header_reader::unit_urid() const
{
  return m_body.m_unit;
}

Sequence_iterator Sequence_header_reader::read(urid_t beat_unit) const
{
  return Sequence_iterator(m_reader,
                           (m_body.m_unit == beat_unit) ? Time_stamp_unit::S_BEATS : Time_stamp_unit::S_FRAMES);
}

std::optional<Sequence_iterator>
  Sequence_header_reader::read(urid_t frame_unit, urid_t beat_unit, Error_code* err_code) const
{
  using Result = std::optional<Sequence_iterator>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, read, frame_unit, beat_unit, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((m_body.m_unit != 0) && (m_body.m_unit == beat_unit))
  {
    err_code->clear();
    return Sequence_iterator(m_reader, Time_stamp_unit::S_BEATS);
  }
  // else
  if ((m_body.m_unit == 0) || (m_body.m_unit == frame_unit))
  {
    err_code->clear();
    return Sequence_iterator(m_reader, Time_stamp_unit::S_FRAMES);
  }
  // else

  *err_code = error::Code::S_INVALID_ATOM_VALUE;
  return std::nullopt;
}

// Sequence_writer implementations.

Sequence_writer::Sequence_writer(Atom_writer&& writer, Time_stamp_unit unit) :
  m_writer(std::move(writer)),
  m_unit(unit)
{
  // Nothing else.
}

Time_stamp_unit Sequence_writer::unit() const
{
  return m_unit;
}

bool Sequence_writer::check_time_stamp(const Time_stamp& stamp, Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(m_writer.get_logger(), Log_component::S_ATOM);

  assert(err_code);

  if (stamp.unit() != m_unit)
  {
    FLOW_LOG_WARNING("Sequence_writer [" << m_writer << "]: Event time stamp [" << stamp << "] is not in the "
                     "unit of the sequence.  Emitting error.");
    *err_code = error::Code::S_WRITING_ILLEGAL_STATE;
    return false;
  }
  // else

  if (m_last_stamp && (!goes_first(*m_last_stamp, stamp)))
  {
    FLOW_LOG_WARNING("Sequence_writer [" << m_writer << "]: Event time stamp [" << stamp << "] is earlier than "
                     "the preceding event's [" << *m_last_stamp << "].  Emitting error.");
    *err_code = error::Code::S_WRITING_ILLEGAL_STATE;
    return false;
  }
  // else

  if ((m_unit == Time_stamp_unit::S_BEATS) && (*stamp.as_beats() != *stamp.as_beats()))
  {
    FLOW_LOG_WARNING("Sequence_writer [" << m_writer << "]: Event time stamp is NaN.  Emitting error.");
    *err_code = error::Code::S_WRITING_ILLEGAL_STATE;
    return false;
  }
  // else
  return true;
} // Sequence_writer::check_time_stamp()

bool Sequence_writer::write_time_stamp(const Time_stamp& stamp, Error_code* err_code)
{
  if (!check_time_stamp(stamp, err_code))
  {
    return false;
  }
  // else

  return (m_unit == Time_stamp_unit::S_FRAMES) ? bool(m_writer.write_value(*stamp.as_frames(), err_code))
                                                : bool(m_writer.write_value(*stamp.as_beats(), err_code));
}

void Sequence_writer::roll_back(size_t allocated_size)
{
  Error_code rewind_err_code;
  [[maybe_unused]] const bool rewound = m_writer.rewind_to(allocated_size, &rewind_err_code);
  assert(rewound && "Rewinding to a previously allocated size cannot fail.");
}

const Unidentified_atom* Sequence_writer::forward(const Time_stamp& stamp, const Unidentified_atom& atom,
                                                  Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(const Unidentified_atom*, forward, stamp, atom, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const size_t n_allocated_before = m_writer.allocated_bytes().size();
  if (!write_time_stamp(stamp, err_code))
  {
    return nullptr;
  }
  // else

  const auto copy = m_writer.copy_atom(atom, err_code);
  if (!copy)
  {
    roll_back(n_allocated_before);
    return nullptr;
  }
  // else

  m_last_stamp = stamp;
  return copy;
} // Sequence_writer::forward()

// Sequence_header_writer implementations.

Sequence_header_writer::Sequence_header_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

std::optional<Sequence_writer>
  Sequence_header_writer::with_unit(Time_stamp_unit unit, urid_t unit_urid, Error_code* err_code)
{
  using Result = std::optional<Sequence_writer>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, with_unit, unit, unit_urid, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (unit_urid == 0)
  {
    *err_code = error::Code::S_INVALID_URID;
    return std::nullopt;
  }
  // else

  if (!m_writer.write_value(Sequence_body{ unit_urid, 0 }, err_code))
  {
    return std::nullopt;
  }
  // else
  return Sequence_writer(std::move(m_writer), unit);
}

std::optional<Sequence_writer> Sequence_header_writer::with_frame_unit(urid_t frame_unit, Error_code* err_code)
{
  return with_unit(Time_stamp_unit::S_FRAMES, frame_unit, err_code);
}

std::optional<Sequence_writer> Sequence_header_writer::with_beat_unit(urid_t beat_unit, Error_code* err_code)
{
  return with_unit(Time_stamp_unit::S_BEATS, beat_unit, err_code);
}

// Sequence implementations.

std::optional<Sequence::Read_handle> Sequence::read(Atom_space body, Error_code* err_code) // Static.
{
  assert(err_code);

  Space_reader reader(body);
  const auto sequence_body = reader.next_value<Sequence_body>(err_code);
  if (!sequence_body)
  {
    return std::nullopt;
  }
  // else
  return Sequence_header_reader(*sequence_body, reader);
}

std::optional<Sequence::Write_handle> Sequence::init(Atom_writer&& writer, Error_code* err_code) // Static.
{
  assert(err_code);
  err_code->clear();
  return Sequence_header_writer(std::move(writer));
}

// Free function implementations.

Sequence_zip zip_sequence(const Sequence_iterator& first, const Sequence_iterator& second)
{
  return Sequence_zip(first, second);
}

bool operator==(const Time_stamp& lhs, const Time_stamp& rhs)
{
  return (lhs.unit() == rhs.unit()) && (lhs.as_frames() == rhs.as_frames()) && (lhs.as_beats() == rhs.as_beats());
}

std::ostream& operator<<(std::ostream& os, const Time_stamp& val)
{
  if (val.unit() == Time_stamp_unit::S_FRAMES)
  {
    return os << *val.as_frames() << " frames";
  }
  // else
  return os << *val.as_beats() << " beats";
}

} // namespace lv2::atom
