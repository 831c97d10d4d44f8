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
#include "lv2/atom/atoms/string.hpp"
#include "lv2/atom/space/space_reader.hpp"
#include <boost/locale/utf.hpp>

namespace lv2::atom
{

namespace
{

/**
 * Interprets `bytes` as NUL-terminated UTF-8 text.
 *
 * @param bytes
 *        Text followed by NUL.
 * @param err_code
 *        Not null.  #Error_code generated: error::Code::S_INVALID_ATOM_VALUE.
 * @return The text minus the NUL; or empty on error.
 */
std::optional<util::String_view> text_from_bytes(Byte_space bytes, Error_code* err_code)
{
  using boost::locale::utf::utf_traits;
  using boost::locale::utf::illegal;
  using boost::locale::utf::incomplete;

  if (bytes.empty() || (bytes.data()[bytes.size() - 1] != 0))
  {
    *err_code = error::Code::S_INVALID_ATOM_VALUE;
    return std::nullopt;
  }
  // else

  const char* const text = reinterpret_cast<const char*>(bytes.data());
  const char* const text_end = text + bytes.size() - 1;
  for (const char* pos = text; pos != text_end; )
  {
    const auto code_point = utf_traits<char>::decode(pos, text_end);
    if ((code_point == illegal) || (code_point == incomplete))
    {
      *err_code = error::Code::S_INVALID_ATOM_VALUE;
      return std::nullopt;
    }
  }

  err_code->clear();
  return util::String_view(text, text_end - text);
} // text_from_bytes()

} // namespace (anon)

// String_writer implementations.

String_writer::String_writer(Terminated<Atom_writer>&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

char* String_writer::append(util::String_view text, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(char*, append, text, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto written = m_writer.write_bytes(text.data(), text.size(), err_code);
  if (!written)
  {
    return nullptr;
  }
  // else
  return reinterpret_cast<char*>(written->data());
}

// String implementations.

std::optional<String::Read_handle> String::read(Atom_space body, Error_code* err_code) // Static.
{
  assert(err_code);
  return text_from_bytes(body.as_bytes(), err_code);
}

std::optional<String::Write_handle> String::init(Atom_writer&& writer, Error_code* err_code) // Static.
{
  assert(err_code);

  String_writer string_writer(Terminated<Atom_writer>(std::move(writer), 0));
  if (!string_writer.append(util::String_view(), err_code))
  {
    return std::nullopt;
  }
  // else
  return string_writer;
}

// Literal_info_writer implementations.

Literal_info_writer::Literal_info_writer(Atom_writer&& writer) :
  m_writer(std::move(writer))
{
  // Nothing else.
}

std::optional<String_writer> Literal_info_writer::write_info(const Literal_info& info, Error_code* err_code)
{
  using Result = std::optional<String_writer>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Result, write_info, info, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (info.m_urid == 0)
  {
    *err_code = error::Code::S_INVALID_URID;
    return std::nullopt;
  }
  // else

  const size_t n_allocated_before = m_writer.allocated_bytes().size();
  const auto body = (info.m_kind == Literal_info::Kind::S_LANGUAGE) ? Literal_body{ 0, info.m_urid }
                                                                     : Literal_body{ info.m_urid, 0 };
  if (!m_writer.write_value(body, err_code))
  {
    return std::nullopt;
  }
  // else

  // Write the terminator through a copy, so that on failure m_writer can still take back the info.
  Terminated<Atom_writer> text_writer(Atom_writer(m_writer), 0);
  if (!text_writer.allocate(0, err_code))
  {
    Error_code rewind_err_code;
    [[maybe_unused]] const bool rewound = m_writer.rewind_to(n_allocated_before, &rewind_err_code);
    assert(rewound && "Rewinding to a previously allocated size cannot fail.");
    return std::nullopt;
  }
  // else
  return String_writer(std::move(text_writer));
} // Literal_info_writer::write_info()

// Literal implementations.

std::optional<Literal::Read_handle> Literal::read(Atom_space body, Error_code* err_code) // Static.
{
  assert(err_code);

  Space_reader reader(body);
  const auto literal_body = reader.next_value<Literal_body>(err_code);
  if (!literal_body)
  {
    return std::nullopt;
  }
  // else

  Literal_info info;
  if ((literal_body->m_lang != 0) && (literal_body->m_datatype == 0))
  {
    info = Literal_info{ Literal_info::Kind::S_LANGUAGE, literal_body->m_lang };
  }
  else if ((literal_body->m_lang == 0) && (literal_body->m_datatype != 0))
  {
    info = Literal_info{ Literal_info::Kind::S_DATATYPE, literal_body->m_datatype };
  }
  else
  {
    *err_code = error::Code::S_INVALID_ATOM_VALUE;
    return std::nullopt;
  }

  const auto text = text_from_bytes(reader.into_remaining(), err_code);
  if (!text)
  {
    return std::nullopt;
  }
  // else
  return Read_handle(info, *text);
}

std::optional<Literal::Write_handle> Literal::init(Atom_writer&& writer, Error_code* err_code) // Static.
{
  assert(err_code);
  err_code->clear();
  return Literal_info_writer(std::move(writer));
}

// Free function implementations.

bool operator==(const Literal_info& lhs, const Literal_info& rhs)
{
  return (lhs.m_kind == rhs.m_kind) && (lhs.m_urid == rhs.m_urid);
}

std::ostream& operator<<(std::ostream& os, const Literal_info& val)
{
  return os << ((val.m_kind == Literal_info::Kind::S_LANGUAGE) ? "lang" : "datatype") << '[' << val.m_urid << ']';
}

} // namespace lv2::atom
