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

class PortTest : public Atom_test_base
{
protected:
  /// Prepares #m_space as a host prepares an output port buffer: a Chunk announcing `capacity` body bytes.
  void announce_capacity(size_t capacity)
  {
    auto cursor = m_space.cursor();
    auto chunk = cursor.write_atom<Chunk>(m_urids.m_chunk);
    ASSERT_TRUE(chunk);
    ASSERT_TRUE(chunk->allocate(capacity));
  }
}; // class PortTest

// Test that a plugin writes its output atom into the announced chunk and the host reads it back as input.
TEST_F(PortTest, OutputThenInput)
{
  announce_capacity(256 - sizeof(Atom_header));

  {
    auto writer = Atom_port::output_from_raw(nullptr, m_space.as_bytes_mut().data(), 0);
    ASSERT_TRUE(writer);
    EXPECT_FALSE(writer->written());
    ASSERT_NE(writer->init<Int>(m_urids.m_int)->set(42), nullptr);
    EXPECT_TRUE(writer->written());
    EXPECT_EQ(writer->written_bytes().size(), 16u);
  }

  const auto chunk = first_atom()->read<Chunk>(m_urids.m_chunk);
  ASSERT_TRUE(chunk);
  EXPECT_EQ(chunk->size(), 256 - sizeof(Atom_header));

  const auto reader = Atom_port::input_from_raw(nullptr, chunk->data(), 0);
  ASSERT_TRUE(reader);
  EXPECT_EQ(reader->atom().header().type(), m_urids.m_int);
  EXPECT_EQ(*reader->read<Int>(m_urids.m_int), 42);

  Error_code err_code;
  EXPECT_FALSE(reader->read<Long>(m_urids.m_long, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ATOM_URID);
}

// Test that an output port takes one atom per cycle.
TEST_F(PortTest, SecondInitRefused)
{
  announce_capacity(64);

  auto writer = Atom_port::output_from_raw(nullptr, m_space.as_bytes_mut().data(), 0);
  ASSERT_TRUE(writer);
  ASSERT_TRUE(writer->init<Tuple>(m_urids.m_tuple));

  Error_code err_code;
  EXPECT_FALSE(writer->init<Int>(m_urids.m_int, &err_code));
  EXPECT_EQ(err_code, error::Code::S_ATOM_ALREADY_WRITTEN);
  EXPECT_EQ(writer->written_bytes().size(), 8u);
}

// Test that a failed first write leaves the port writable.
TEST_F(PortTest, FailedInitCanBeRetried)
{
  announce_capacity(16);

  auto writer = Atom_port::output_from_raw(nullptr, m_space.as_bytes_mut().data(), 0);
  ASSERT_TRUE(writer);

  Error_code err_code;
  EXPECT_FALSE(writer->init<Int>(0, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
  EXPECT_FALSE(writer->written());

  auto sequence = writer->init<Sequence>(m_urids.m_sequence);
  ASSERT_TRUE(sequence);
  EXPECT_TRUE(writer->written());
  auto events = sequence->with_frame_unit(m_urids.m_frame);
  ASSERT_TRUE(events);
  EXPECT_EQ(writer->written_bytes().size(), 16u);

  // The announced capacity is a hard limit.
  EXPECT_FALSE(events->new_event<Int>(Time_stamp::frames(0), m_urids.m_int, &err_code));
  EXPECT_EQ(err_code, error::Code::S_OUT_OF_SPACE);
  EXPECT_EQ(writer->written_bytes().size(), 16u);
}

// Test that a port buffer must be present and 8-byte aligned.
TEST_F(PortTest, RawBufferChecks)
{
  Error_code err_code;
  EXPECT_FALSE(Atom_port::input_from_raw(nullptr, nullptr, 0, &err_code));
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
  EXPECT_FALSE(Atom_port::output_from_raw(nullptr, nullptr, 0, &err_code));
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);

  announce_capacity(16);
  EXPECT_FALSE(Atom_port::input_from_raw(nullptr, m_space.as_bytes().data() + 4, 0, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SPACE_MISALIGNED);
  EXPECT_FALSE(Atom_port::output_from_raw(nullptr, m_space.as_bytes_mut().data() + 4, 0, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SPACE_MISALIGNED);
}

} // namespace lv2::atom::test
