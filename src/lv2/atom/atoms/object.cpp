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
#include "lv2/atom/atoms/object.hpp"

namespace lv2::atom
{

// Object_reader implementations.

Object_reader::Object_reader(const Space_reader& reader) :
  m_reader(reader)
{
  // Nothing else.
}

std::optional<Object_reader::Item> Object_reader::next()
{
  return m_reader.try_read([](Space_reader& reader) -> std::optional<Item>
  {
    Error_code err_code;

    const auto body = reader.next_value<Property_body>(&err_code);
    if ((!body) || (body->m_key == 0))
    {
      return std::nullopt;
    }
    // else

    const auto value = reader.next_atom(&err_code);
    if (!value)
    {
      return std::nullopt;
    }
    // else

    Property_header header{ body->m_key, std::nullopt };
    if (body->m_context != 0)
    {
      header.m_context = body->m_context;
    }
    return Item(header, value);
  });
}

Object_reader::Iterator Object_reader::begin() const
{
  return Iterator(*this);
}

Object_reader::Iterator Object_reader::end() const
{
  return Iterator();
}

// Object_writer implementations.

Object_writer::Object_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

// Object_header_writer implementations.

Object_header_writer::Object_header_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

std::optional<Object_writer> Object_header_writer::write_header(const Object_header& header, Error_code* err_code)
{
  using Result = std::optional<Object_writer>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, write_header, header, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((header.m_otype == 0) || (header.m_id && (*header.m_id == 0)))
  {
    FLOW_LOG_SET_CONTEXT(m_writer.get_logger(), Log_component::S_ATOM);
    FLOW_LOG_WARNING("Object_header_writer [" << m_writer << "]: Object header has a 0 tag "
                     "(type [" << header.m_otype << "]).  Emitting error.");
    *err_code = error::Code::S_INVALID_URID;
    return std::nullopt;
  }
  // else

  if (!m_writer.write_value(Object_body{ header.m_id.value_or(0), header.m_otype }, err_code))
  {
    return std::nullopt;
  }
  // else
  return Object_writer(std::move(m_writer));
}

// Object implementations.

std::optional<Object::Read_handle> Object::read(Atom_space body, Error_code* err_code) // Static.
{
  assert(err_code);

  Space_reader reader(body);
  const auto object_body = reader.next_value<Object_body>(err_code);
  if (!object_body)
  {
    return std::nullopt;
  }
  // else

  if (object_body->m_otype == 0)
  {
    *err_code = error::Code::S_INVALID_ATOM_VALUE;
    return std::nullopt;
  }
  // else

  Object_header header{ std::nullopt, object_body->m_otype };
  if (object_body->m_id != 0)
  {
    header.m_id = object_body->m_id;
  }
  return Read_handle(header, Object_reader(reader));
}

std::optional<Object::Write_handle> Object::init(Atom_writer&& writer, Error_code* err_code) // Static.
{
  assert(err_code);
  err_code->clear();
  return Object_header_writer(std::move(writer));
}

// Blank implementations.

std::optional<Blank::Read_handle> Blank::read(Atom_space body, Error_code* err_code) // Static.
{
  return Object::read(body, err_code);
}

} // namespace lv2::atom
