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
#include "lv2/atom/urid.hpp"
#include <limits>

namespace lv2::atom
{

// Urid_mapper implementations.

Urid_mapper::~Urid_mapper() = default;

// Hash_urid_mapper implementations.

Hash_urid_mapper::Hash_urid_mapper(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_URID)
{
  // Nothing else.
}

urid_t Hash_urid_mapper::map(util::String_view uri)
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);

  const auto it = m_urids.find(std::string(uri));
  if (it != m_urids.end())
  {
    return it->second;
  }
  // else

  if (m_uris.size() >= std::numeric_limits<urid_t>::max())
  {
    FLOW_LOG_WARNING("Hash_urid_mapper [" << *this << "]: URID space exhausted; cannot map [" << uri << "].");
    return 0;
  }
  // else

  const auto urid = urid_t(m_uris.size() + 1);
  const auto inserted = m_urids.emplace(std::string(uri), urid).first;
  m_uris.push_back(&inserted->first);

  FLOW_LOG_TRACE("Hash_urid_mapper [" << *this << "]: Mapped [" << uri << "] to [" << urid << "].");
  return urid;
}

const std::string* Hash_urid_mapper::unmap(urid_t urid) const
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);

  if ((urid == 0) || (urid > m_uris.size()))
  {
    return nullptr;
  }
  // else
  return m_uris[urid - 1];
}

size_t Hash_urid_mapper::size() const
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  return m_uris.size();
}

std::ostream& operator<<(std::ostream& os, const Hash_urid_mapper& val)
{
  return os << '@' << &val;
}

// Atom_urid_collection implementations.

std::optional<Atom_urid_collection> Atom_urid_collection::from_map(Urid_mapper* mapper) // Static.
{
  assert(mapper);

  Atom_urid_collection urids;
  const std::pair<urid_t*, util::String_view> entries[]
    = {
        { &urids.m_blank, S_BLANK_URI },
        { &urids.m_bool, S_BOOL_URI },
        { &urids.m_chunk, S_CHUNK_URI },
        { &urids.m_double, S_DOUBLE_URI },
        { &urids.m_float, S_FLOAT_URI },
        { &urids.m_int, S_INT_URI },
        { &urids.m_literal, S_LITERAL_URI },
        { &urids.m_long, S_LONG_URI },
        { &urids.m_object, S_OBJECT_URI },
        { &urids.m_property, S_PROPERTY_URI },
        { &urids.m_sequence, S_SEQUENCE_URI },
        { &urids.m_string, S_STRING_URI },
        { &urids.m_tuple, S_TUPLE_URI },
        { &urids.m_urid, S_URID_URI },
        { &urids.m_vector, S_VECTOR_URI },
        { &urids.m_frame, S_FRAME_URI },
        { &urids.m_beat, S_BEAT_URI }
      };

  for (const auto& entry : entries)
  {
    *entry.first = mapper->map(entry.second);
    if (*entry.first == 0)
    {
      return std::nullopt;
    }
  }
  return urids;
}

} // namespace lv2::atom
