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
#include <limits>
#include <cmath>

namespace lv2::atom::test
{

class ScalarTest : public Atom_test_base {};

// Test that an Int is laid out exactly as LV2_Atom_Int: header, value, 4 zero bytes; nothing else touched.
TEST(ScalarLayoutTest, IntBytes)
{
  Fixed_buffer<64> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());

  auto writer = cursor.write_atom<Int>(7);
  ASSERT_TRUE(writer);
  ASSERT_NE(writer->set(42), nullptr);
  EXPECT_EQ(cursor.allocated_bytes().size(), 16u);

  alignas(8) uint8_t expected[64] = {};
  const uint32_t header[] = { 8, 7 };
  const int32_t value = 42;
  std::memcpy(expected, header, sizeof(header));
  std::memcpy(expected + 8, &value, sizeof(value));
  EXPECT_EQ(std::memcmp(buf.m_bytes, expected, sizeof(expected)), 0);
}

// Test that setting a scalar twice replaces the value instead of appending.
TEST(ScalarLayoutTest, SetReplaces)
{
  Fixed_buffer<32> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());

  auto writer = cursor.write_atom<Long>(3);
  ASSERT_TRUE(writer);
  ASSERT_NE(writer->set(1), nullptr);
  ASSERT_NE(writer->set(-2), nullptr);
  EXPECT_EQ(cursor.allocated_bytes().size(), 16u);

  Space_reader reader(cursor.allocated_bytes());
  const auto atom = reader.next_atom();
  ASSERT_NE(atom, nullptr);
  EXPECT_EQ(*atom->read<Long>(3), -2);
}

// Test that a scalar read checks the type tag.
TEST_F(ScalarTest, ReadChecksTypeTag)
{
  auto cursor = m_space.cursor();
  ASSERT_NE(cursor.write_atom<Int>(m_urids.m_int)->set(42), nullptr);

  const auto atom = first_atom();
  ASSERT_NE(atom, nullptr);
  EXPECT_EQ(*atom->read<Int>(m_urids.m_int), 42);

  Error_code err_code;
  EXPECT_FALSE(atom->read<Int>(m_urids.m_long, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ATOM_URID);
}

// Test that every scalar type reads back what was written.
TEST_F(ScalarTest, AllTypes)
{
  auto cursor = m_space.cursor();
  ASSERT_NE(cursor.write_atom<Int>(m_urids.m_int)->set(std::numeric_limits<int32_t>::min()), nullptr);
  ASSERT_NE(cursor.write_atom<Long>(m_urids.m_long)->set(std::numeric_limits<int64_t>::max()), nullptr);
  ASSERT_NE(cursor.write_atom<Float>(m_urids.m_float)->set(-1.5f), nullptr);
  ASSERT_NE(cursor.write_atom<Double>(m_urids.m_double)->set(2.25), nullptr);
  ASSERT_NE(cursor.write_atom<Bool>(m_urids.m_bool)->set(1), nullptr);
  ASSERT_NE(cursor.write_atom<Urid>(m_urids.m_urid)->set(m_urids.m_beat), nullptr);

  auto reader = m_space.read();
  EXPECT_EQ(*reader.next_atom()->read<Int>(m_urids.m_int), std::numeric_limits<int32_t>::min());
  EXPECT_EQ(*reader.next_atom()->read<Long>(m_urids.m_long), std::numeric_limits<int64_t>::max());
  EXPECT_EQ(*reader.next_atom()->read<Float>(m_urids.m_float), -1.5f);
  EXPECT_EQ(*reader.next_atom()->read<Double>(m_urids.m_double), 2.25);
  EXPECT_EQ(*reader.next_atom()->read<Bool>(m_urids.m_bool), 1);
  EXPECT_EQ(*reader.next_atom()->read<Urid>(m_urids.m_urid), m_urids.m_beat);
  EXPECT_EQ(cursor.allocated_bytes().size(), 6u * 16u);
}

// Test that non-finite floating point values come back bit-for-bit.
TEST_F(ScalarTest, NonFiniteBitExact)
{
  const double values[] = { std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity(),
                            -std::numeric_limits<double>::infinity(), -0.0 };

  auto cursor = m_space.cursor();
  for (const double value : values)
  {
    ASSERT_NE(cursor.write_atom<Double>(m_urids.m_double)->set(value), nullptr);
  }

  auto reader = m_space.read();
  for (const double value : values)
  {
    const auto atom = reader.next_atom();
    ASSERT_NE(atom, nullptr);
    const auto read_value = atom->read<Double>(m_urids.m_double);
    ASSERT_TRUE(read_value);
    EXPECT_EQ(std::memcmp(&*read_value, &value, sizeof(double)), 0);
  }
}

// Test that a scalar whose value was never set has an empty body, which does not read.
TEST_F(ScalarTest, UnsetDoesNotRead)
{
  auto cursor = m_space.cursor();
  ASSERT_TRUE(cursor.write_atom<Float>(m_urids.m_float));

  const auto atom = first_atom();
  ASSERT_NE(atom, nullptr);
  EXPECT_EQ(atom->header().size_of_body(), 0u);

  Error_code err_code;
  EXPECT_FALSE(atom->read<Float>(m_urids.m_float, &err_code));
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
}

// Test that a scalar value which does not fit leaves its atom empty and the rest of the buffer as it was.
TEST(ScalarLayoutTest, OutOfSpaceLeavesAtomEmpty)
{
  Fixed_buffer<24> buf;
  Space_cursor cursor(nullptr, buf.as_bytes_mut());
  ASSERT_NE(cursor.write_atom<Int>(1)->set(5), nullptr);

  auto writer = cursor.write_atom<Double>(2);
  ASSERT_TRUE(writer);
  Error_code err_code;
  EXPECT_EQ(writer->set(1.0, &err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_OUT_OF_SPACE);
  EXPECT_EQ(cursor.allocated_bytes().size(), 24u);

  Space_reader reader(cursor.allocated_bytes());
  EXPECT_EQ(*reader.next_atom()->read<Int>(1), 5);
  const auto unset = reader.next_atom();
  ASSERT_NE(unset, nullptr);
  EXPECT_EQ(unset->header().type(), 2u);
  EXPECT_EQ(unset->header().size_of_body(), 0u);
}

} // namespace lv2::atom::test
