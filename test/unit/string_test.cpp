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
#include "atom_test_base.hpp"
#include <sstream>
#include <string>

namespace lv2::atom::test
{

class StringTest : public Atom_test_base
{
protected:
  StringTest() :
    m_german(m_mapper.map("http://lexvo.org/id/iso639-1/de")),
    m_xsd_date(m_mapper.map("http://www.w3.org/2001/XMLSchema#date"))
  {
    // Nothing else.
  }

  const urid_t m_german;
  const urid_t m_xsd_date;
}; // class StringTest

// Test that appended pieces form one NUL-terminated text whose size counts the NUL.
TEST_F(StringTest, AppendConcatenates)
{
  {
    auto cursor = m_space.cursor();
    auto writer = cursor.write_atom<String>(m_urids.m_string);
    ASSERT_TRUE(writer);
    ASSERT_NE(writer->append("foo"), nullptr);
    ASSERT_NE(writer->append("bar"), nullptr);
  }

  const auto atom = first_atom();
  ASSERT_NE(atom, nullptr);
  EXPECT_EQ(atom->header().size_of_body(), 7u);
  EXPECT_EQ(std::memcmp(atom->body().data(), "foobar", 7), 0);
  EXPECT_EQ(std::string(*atom->read<String>(m_urids.m_string)), "foobar");
}

// Test that a string nothing was appended to is the valid empty text.
TEST_F(StringTest, EmptyString)
{
  {
    auto cursor = m_space.cursor();
    ASSERT_TRUE(cursor.write_atom<String>(m_urids.m_string));
  }

  const auto atom = first_atom();
  EXPECT_EQ(atom->header().size_of_body(), 1u);
  const auto text = atom->read<String>(m_urids.m_string);
  ASSERT_TRUE(text);
  EXPECT_TRUE(text->empty());
}

// Test that multi-byte UTF-8 text passes through unchanged.
TEST_F(StringTest, MultiByteText)
{
  const std::string text = "Gr\xC3\xBC\xC3\x9F Gott, sch\xC3\xB6ne Welt \xE2\x99\xAA";
  {
    auto cursor = m_space.cursor();
    auto writer = cursor.write_atom<String>(m_urids.m_string);
    ASSERT_NE(writer->append(util::String_view(text.data(), text.size())), nullptr);
  }
  EXPECT_EQ(std::string(*first_atom()->read<String>(m_urids.m_string)), text);
}

// Test that a body without terminator or with malformed UTF-8 does not read.
TEST_F(StringTest, InvalidBodies)
{
  const auto write_raw = [&](const char* bytes, size_t size)
  {
    Vec_space space(Vec_space::Config{ nullptr, 16 });
    {
      auto cursor = space.cursor();
      auto writer = Atom_writer::write_new(&cursor, m_urids.m_string);
      EXPECT_TRUE(writer->write_bytes(bytes, size));
    }
    Error_code err_code;
    auto reader = space.read();
    EXPECT_FALSE(reader.next_atom()->read<String>(m_urids.m_string, &err_code));
    return err_code;
  };

  EXPECT_EQ(write_raw("abc", 3), error::Code::S_INVALID_ATOM_VALUE);
  EXPECT_EQ(write_raw("", 0), error::Code::S_INVALID_ATOM_VALUE);
  EXPECT_EQ(write_raw("\xC3\x28", 3), error::Code::S_INVALID_ATOM_VALUE);
  EXPECT_EQ(write_raw("ab\xE2\x82", 5), error::Code::S_INVALID_ATOM_VALUE);
}

// Test that a literal carries its language and its text, laid out as LV2_Atom_Literal.
TEST_F(StringTest, LiteralWithLanguage)
{
  const util::String_view first_part = "Es irrt der Mensch, ";
  const util::String_view second_part = "solang er strebt.";
  {
    auto cursor = m_space.cursor();
    auto text = cursor.write_atom<Literal>(m_urids.m_literal)
                  ->write_info(Literal_info{ Literal_info::Kind::S_LANGUAGE, m_german });
    ASSERT_TRUE(text);
    ASSERT_NE(text->append(first_part), nullptr);
    ASSERT_NE(text->append(second_part), nullptr);
  }

  const auto atom = first_atom();
  ASSERT_NE(atom, nullptr);
  EXPECT_EQ(atom->header().size_of_body(), 8u + first_part.size() + second_part.size() + 1u);
  const auto body = reinterpret_cast<const uint32_t*>(atom->body().data());
  EXPECT_EQ(body[0], 0u);
  EXPECT_EQ(body[1], m_german);

  const auto literal = atom->read<Literal>(m_urids.m_literal);
  ASSERT_TRUE(literal);
  EXPECT_EQ(literal->first, (Literal_info{ Literal_info::Kind::S_LANGUAGE, m_german }));
  EXPECT_EQ(std::string(literal->second), "Es irrt der Mensch, solang er strebt.");
}

// Test that a literal with a datatype and no text reads back as such.
TEST_F(StringTest, LiteralWithDatatype)
{
  {
    auto cursor = m_space.cursor();
    ASSERT_TRUE(cursor.write_atom<Literal>(m_urids.m_literal)
                  ->write_info(Literal_info{ Literal_info::Kind::S_DATATYPE, m_xsd_date }));
  }

  const auto literal = first_atom()->read<Literal>(m_urids.m_literal);
  ASSERT_TRUE(literal);
  EXPECT_EQ(literal->first.m_kind, Literal_info::Kind::S_DATATYPE);
  EXPECT_EQ(literal->first.m_urid, m_xsd_date);
  EXPECT_TRUE(literal->second.empty());

  std::ostringstream os;
  os << literal->first;
  EXPECT_FALSE(os.str().empty());
}

// Test that literal info with tag 0 is refused, and that stored info naming both or neither tag does not read.
TEST_F(StringTest, LiteralInvalidInfo)
{
  {
    auto cursor = m_space.cursor();
    auto writer = cursor.write_atom<Literal>(m_urids.m_literal);
    Error_code err_code;
    EXPECT_FALSE(writer->write_info(Literal_info{ Literal_info::Kind::S_LANGUAGE, 0 }, &err_code));
    EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
    EXPECT_EQ(cursor.allocated_bytes().size(), 8u);
  }

  for (const auto& body : { Literal_body{ 0, 0 }, Literal_body{ m_xsd_date, m_german } })
  {
    Vec_space space(Vec_space::Config{ nullptr, 32 });
    {
      auto cursor = space.cursor();
      auto writer = Atom_writer::write_new(&cursor, m_urids.m_literal);
      ASSERT_TRUE(writer->write_value(body));
      ASSERT_TRUE(writer->write_value(uint8_t(0)));
    }
    Error_code err_code;
    auto reader = space.read();
    EXPECT_FALSE(reader.next_atom()->read<Literal>(m_urids.m_literal, &err_code));
    EXPECT_EQ(err_code, error::Code::S_INVALID_ATOM_VALUE);
  }
}

// Test that a literal whose text does not fit takes its info back too.
TEST(LiteralLayoutTest, OutOfSpaceRollsBackInfo)
{
  Fixed_buffer<16> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());
  auto writer = cursor.write_atom<Literal>(3);
  ASSERT_TRUE(writer);

  Error_code err_code;
  EXPECT_FALSE(writer->write_info(Literal_info{ Literal_info::Kind::S_DATATYPE, 4 }, &err_code));
  EXPECT_EQ(err_code, error::Code::S_OUT_OF_SPACE);
  EXPECT_EQ(cursor.allocated_bytes().size(), 8u);

  Space_reader reader(cursor.allocated_bytes());
  EXPECT_EQ(reader.next_atom()->header().size_of_body(), 0u);
}

} // namespace lv2::atom::test
