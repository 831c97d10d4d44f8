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

namespace lv2::atom::test
{

// Test that a fixed-capacity cursor hands out consecutive bytes and refuses to overrun.
TEST(SpaceCursorTest, AllocatesUntilFull)
{
  Fixed_buffer<16> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());

  const auto first = cursor.allocate(10);
  ASSERT_TRUE(first);
  EXPECT_EQ(first->data(), buf.m_bytes);
  EXPECT_EQ(cursor.allocated_bytes().size(), 10u);
  EXPECT_EQ(cursor.remaining_bytes().size(), 6u);

  Error_code err_code;
  EXPECT_FALSE(cursor.allocate(7, &err_code));
  EXPECT_EQ(err_code, error::Code::S_OUT_OF_SPACE);
  // A failed allocation changes nothing.
  EXPECT_EQ(cursor.allocated_bytes().size(), 10u);

  const auto last = cursor.allocate(6, &err_code);
  ASSERT_TRUE(last);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(last->data(), buf.m_bytes + 10);
  EXPECT_TRUE(cursor.remaining_bytes().empty());
}

// Test that rewinding gives bytes back, but never more than were allocated.
TEST(SpaceCursorTest, Rewind)
{
  Fixed_buffer<16> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());
  ASSERT_TRUE(cursor.allocate(12));

  Error_code err_code;
  EXPECT_FALSE(cursor.rewind_to(13, &err_code));
  EXPECT_EQ(err_code, error::Code::S_REWIND_BEYOND_ALLOCATED);

  EXPECT_TRUE(cursor.rewind_to(4, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(cursor.allocated_bytes().size(), 4u);
  EXPECT_EQ(cursor.remaining_bytes().data(), buf.m_bytes + 4);
}

// Test that typed writes insert padding to reach the value's alignment.
TEST(SpaceCursorTest, WriteValuePads)
{
  Fixed_buffer<32> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());

  ASSERT_TRUE(cursor.write_value(uint8_t(0xAB)));
  const auto value = cursor.write_value(uint64_t(0x0102030405060708));
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(reinterpret_cast<uint8_t*>(value), buf.m_bytes + 8);
  EXPECT_EQ(cursor.allocated_bytes().size(), 16u);
  EXPECT_EQ(buf.m_bytes[0], 0xAB);
  EXPECT_EQ(*value, 0x0102030405060708u);
}

// Test that a growable buffer keeps earlier contents when it relocates.
TEST(VecSpaceTest, GrowsAndKeepsContents)
{
  Vec_space space(Vec_space::Config{ nullptr, 8 });
  EXPECT_EQ(space.size(), 8u);
  EXPECT_EQ(reinterpret_cast<std::uintptr_t>(space.as_bytes().data()) % 8, 0u);

  auto cursor = space.cursor();
  for (uint32_t idx = 0; idx != 100; ++idx)
  {
    ASSERT_TRUE(cursor.write_value(idx));
  }

  EXPECT_GE(space.size(), 400u);
  EXPECT_EQ(cursor.allocated_bytes().size(), 400u);
  EXPECT_EQ(reinterpret_cast<std::uintptr_t>(space.as_bytes().data()) % 8, 0u);

  auto reader = space.read();
  const auto values = reader.next_values<uint32_t>(100);
  ASSERT_TRUE(values);
  for (uint32_t idx = 0; idx != 100; ++idx)
  {
    EXPECT_EQ((*values)[idx], idx);
  }
}

// Test that the terminated writer always keeps one terminator byte after what was written.
TEST(TerminatedTest, KeepsTerminatorLast)
{
  Fixed_buffer<16> buf;
  std::memset(buf.m_bytes, 'x', 16);
  Space_cursor cursor(nullptr, buf.as_bytes_mut());
  Terminated<Space_cursor> writer(std::move(cursor), 0);

  ASSERT_TRUE(writer.write_bytes("foo", 3));
  EXPECT_EQ(writer.allocated_bytes().size(), 3u);
  EXPECT_EQ(writer.inner().allocated_bytes().size(), 4u);
  EXPECT_EQ(std::memcmp(buf.m_bytes, "foo\0x", 5), 0);

  ASSERT_TRUE(writer.write_bytes("bar", 3));
  EXPECT_EQ(writer.allocated_bytes().size(), 6u);
  EXPECT_EQ(std::memcmp(buf.m_bytes, "foobar\0x", 8), 0);

  ASSERT_TRUE(writer.rewind_to(4));
  EXPECT_EQ(writer.inner().allocated_bytes().size(), 5u);
  EXPECT_EQ(std::memcmp(buf.m_bytes, "foob\0", 5), 0);
}

// Test that a terminated write which does not fit leaves the previous text and terminator intact.
TEST(TerminatedTest, FailedWriteKeepsTerminator)
{
  Fixed_buffer<8> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());
  Terminated<Space_cursor> writer(std::move(cursor), 0);

  ASSERT_TRUE(writer.write_bytes("abcde", 5));

  Error_code err_code;
  EXPECT_FALSE(writer.write_bytes("fgh", 3, &err_code));
  EXPECT_EQ(err_code, error::Code::S_OUT_OF_SPACE);
  EXPECT_EQ(writer.inner().allocated_bytes().size(), 6u);
  EXPECT_EQ(std::memcmp(buf.m_bytes, "abcde\0", 6), 0);

  // Exactly filling the buffer still fits the terminator.
  EXPECT_TRUE(writer.write_bytes("fg", 2));
  EXPECT_EQ(std::memcmp(buf.m_bytes, "abcdefg\0", 8), 0);
}

// Test that nested atom writers keep every enclosing header's size current.
TEST(AtomWriterTest, NestedSizesPropagate)
{
  Fixed_buffer<64> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());

  auto outer = Atom_writer::write_new(&cursor, 1);
  ASSERT_TRUE(outer);
  auto inner = Atom_writer::write_new(&*outer, 2);
  ASSERT_TRUE(inner);
  ASSERT_TRUE(inner->write_value(uint32_t(7)));

  EXPECT_EQ(inner->atom_header().size_of_body(), 4u);
  EXPECT_EQ(outer->atom_header().size_of_body(), 12u);
  EXPECT_EQ(cursor.allocated_bytes().size(), 20u);

  ASSERT_TRUE(inner->rewind_to(16));
  EXPECT_EQ(inner->atom_header().size_of_body(), 0u);
  EXPECT_EQ(outer->atom_header().size_of_body(), 8u);

  // The inner atom cannot give back its own header.
  Error_code err_code;
  EXPECT_FALSE(inner->rewind(1, &err_code));
  EXPECT_EQ(err_code, error::Code::S_REWIND_BEYOND_ALLOCATED);
}

// Test that an atom writer refuses to write once a sibling follows it, or once its parent rewound past it.
TEST(AtomWriterTest, StaleWriterRefused)
{
  Fixed_buffer<64> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());

  auto outer = Atom_writer::write_new(&cursor, 1);
  ASSERT_TRUE(outer);
  auto first = Atom_writer::write_new(&*outer, 2);
  ASSERT_TRUE(first);
  ASSERT_TRUE(first->write_value(uint32_t(7)));
  // Header at 8, value at 16; the sibling's header is realigned to 24.
  auto second = Atom_writer::write_new(&*outer, 3);
  ASSERT_TRUE(second);
  EXPECT_EQ(cursor.allocated_bytes().size(), 32u);

  Error_code err_code;
  EXPECT_FALSE(first->write_value(uint32_t(8), &err_code));
  EXPECT_EQ(err_code, error::Code::S_WRITING_ILLEGAL_STATE);
  EXPECT_FALSE(first->rewind(4, &err_code));
  EXPECT_EQ(err_code, error::Code::S_WRITING_ILLEGAL_STATE);
  EXPECT_EQ(first->atom_header().size_of_body(), 4u);
  EXPECT_EQ(outer->atom_header().size_of_body(), 24u);

  // The enclosing atom still ends where the buffer's allocation ends, so it may continue.
  ASSERT_TRUE(outer->write_value(uint32_t(9)));
  EXPECT_EQ(outer->atom_header().size_of_body(), 28u);

  ASSERT_TRUE(outer->rewind_to(8));
  EXPECT_EQ(outer->atom_header().size_of_body(), 0u);
  EXPECT_FALSE(second->write_value(uint32_t(10), &err_code));
  EXPECT_EQ(err_code, error::Code::S_WRITING_ILLEGAL_STATE);
  EXPECT_EQ(cursor.allocated_bytes().size(), 8u);
}

// Test that an atom header with type 0 is refused.
TEST(AtomWriterTest, RejectsZeroType)
{
  Fixed_buffer<16> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());

  Error_code err_code;
  EXPECT_FALSE(Atom_writer::write_new(&cursor, 0, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
  EXPECT_TRUE(cursor.allocated_bytes().empty());
}

// Test that atom writers track their headers across relocation of a growable buffer.
TEST(AtomWriterTest, SurvivesRelocation)
{
  Vec_space space(Vec_space::Config{ nullptr, 16 });
  auto cursor = space.cursor();

  auto writer = Atom_writer::write_new(&cursor, 5);
  ASSERT_TRUE(writer);
  for (uint64_t idx = 0; idx != 32; ++idx)
  {
    ASSERT_TRUE(writer->write_value(idx));
  }

  EXPECT_EQ(writer->atom_header().size_of_body(), 256u);
  auto reader = space.read();
  const auto atom = reader.next_atom();
  ASSERT_NE(atom, nullptr);
  EXPECT_EQ(atom->header().type(), 5u);
  EXPECT_EQ(atom->header().size_of_body(), 256u);
}

} // namespace lv2::atom::test
