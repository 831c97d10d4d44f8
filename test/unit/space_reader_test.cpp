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
#include <flow/error/error.hpp>
#include <optional>

namespace lv2::atom::test
{

/// A 32-byte buffer holding: `uint8_t` 0xAB at 0, `uint32_t` at 4, `uint64_t` at 8, and an atom (type 9, one
/// `int32_t` body) at 16 whose body ends at 28.
class SpaceReaderTest : public ::testing::Test
{
protected:
  SpaceReaderTest()
  {
    const uint8_t tag = 0xAB;
    const uint32_t word = 0xDEADBEEF;
    const uint64_t big = 77;
    const uint32_t header[] = { 4, 9 };
    const int32_t body = 5;
    std::memcpy(m_buf.m_bytes, &tag, sizeof(tag));
    std::memcpy(m_buf.m_bytes + 4, &word, sizeof(word));
    std::memcpy(m_buf.m_bytes + 8, &big, sizeof(big));
    std::memcpy(m_buf.m_bytes + 16, header, sizeof(header));
    std::memcpy(m_buf.m_bytes + 24, &body, sizeof(body));
  }

  Fixed_buffer<32> m_buf;
}; // class SpaceReaderTest

// Test that typed reads skip alignment padding and whole atoms are returned with their declared body.
TEST_F(SpaceReaderTest, ValuesAndAtomInSequence)
{
  Space_reader reader(m_buf.as_bytes_mut());

  EXPECT_EQ(*reader.next_value<uint8_t>(), 0xAB);
  EXPECT_EQ(*reader.next_value<uint32_t>(), 0xDEADBEEFu);
  EXPECT_EQ(*reader.next_value<uint64_t>(), 77u);

  const auto atom = reader.next_atom();
  ASSERT_NE(atom, nullptr);
  EXPECT_EQ(atom->header().type(), 9u);
  EXPECT_EQ(atom->header().size_of_body(), 4u);
  EXPECT_EQ(atom->atom_space().as_bytes().data(), m_buf.m_bytes + 16);

  // The cursor stops right after the body; the trailing padding is left for the next realignment.
  EXPECT_EQ(reader.remaining_bytes().size(), 4u);
  EXPECT_EQ(reader.remaining_bytes().data(), m_buf.m_bytes + 28);
}

// Test that raw byte reads take exactly what is asked, without realigning.
TEST_F(SpaceReaderTest, NextBytesIsExact)
{
  Space_reader reader(m_buf.as_bytes_mut());

  ASSERT_TRUE(reader.next_value<uint8_t>());
  const auto bytes = reader.next_bytes(3);
  ASSERT_TRUE(bytes);
  EXPECT_EQ(bytes->data(), m_buf.m_bytes + 1);
  EXPECT_EQ(bytes->size(), 3u);
  EXPECT_EQ(*reader.next_value<uint32_t>(), 0xDEADBEEFu);

  Error_code err_code;
  EXPECT_FALSE(reader.next_bytes(100, &err_code));
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
  EXPECT_EQ(reader.remaining_bytes().size(), 24u);

  EXPECT_THROW(reader.next_bytes(100), flow::error::Runtime_error);
  EXPECT_EQ(reader.remaining_bytes().size(), 24u);
}

// Test that failed reads leave the cursor where it was.
TEST_F(SpaceReaderTest, FailedReadsDoNotAdvance)
{
  Space_reader reader(m_buf.as_bytes_mut());
  ASSERT_TRUE(reader.next_bytes(28));

  Error_code err_code;
  // 4 bytes remain; aligning for a uint64_t consumes all of them.
  EXPECT_EQ(reader.next_value<uint64_t>(&err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
  EXPECT_EQ(reader.next_atom(&err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
  EXPECT_FALSE(reader.next_values<uint32_t>(2, &err_code));
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
  EXPECT_EQ(reader.remaining_bytes().size(), 4u);

  // What does fit is still there.
  EXPECT_EQ(*reader.next_value<uint32_t>(), 0u);
  EXPECT_TRUE(reader.remaining_bytes().empty());
}

// Test that an atom declaring more body than remains is refused without moving the cursor.
TEST_F(SpaceReaderTest, TruncatedAtomDoesNotAdvance)
{
  const uint32_t bogus_size = 64;
  std::memcpy(m_buf.m_bytes + 16, &bogus_size, sizeof(bogus_size));

  Space_reader reader(m_buf.as_bytes_mut());
  ASSERT_TRUE(reader.next_bytes(16));

  Error_code err_code;
  EXPECT_EQ(reader.next_atom(&err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
  EXPECT_EQ(reader.remaining_bytes().size(), 16u);
}

// Test that a multi-step read commits its position only if every step succeeds.
TEST_F(SpaceReaderTest, TryReadCommitsOnlyOnSuccess)
{
  Space_reader reader(m_buf.as_bytes_mut());

  const auto read_tag_and_word = [](Space_reader& attempt) -> std::optional<uint32_t>
  {
    Error_code err_code;
    if (!attempt.next_value<uint8_t>(&err_code))
    {
      return std::nullopt;
    }
    const auto word = attempt.next_value<uint32_t>(&err_code);
    if (!word)
    {
      return std::nullopt;
    }
    return *word;
  };
  EXPECT_EQ(reader.try_read(read_tag_and_word), std::optional<uint32_t>(0xDEADBEEF));
  EXPECT_EQ(reader.remaining_bytes().size(), 24u);

  // Reads the uint64_t, then asks for more than remains: the whole attempt is undone.
  const auto overreach = reader.try_read([](Space_reader& attempt) -> const uint8_t*
  {
    Error_code err_code;
    if (!attempt.next_value<uint64_t>(&err_code))
    {
      return nullptr;
    }
    const auto bytes = attempt.next_bytes(100, &err_code);
    return bytes ? bytes->data() : nullptr;
  });
  EXPECT_EQ(overreach, nullptr);
  EXPECT_EQ(reader.remaining_bytes().size(), 24u);
  EXPECT_EQ(*reader.next_value<uint64_t>(), 77u);
}

// Test that the unread tail can be taken in one piece, after which nothing remains.
TEST_F(SpaceReaderTest, IntoRemaining)
{
  Space_reader reader(m_buf.as_bytes_mut());
  ASSERT_TRUE(reader.next_value<uint64_t>());

  const auto rest = reader.into_remaining();
  EXPECT_EQ(rest.data(), m_buf.m_bytes + 8);
  EXPECT_EQ(rest.size(), 24u);
  EXPECT_TRUE(reader.remaining_bytes().empty());

  Error_code err_code;
  EXPECT_FALSE(reader.next_bytes(1, &err_code));
  EXPECT_EQ(err_code, error::Code::S_READING_OUT_OF_BOUNDS);
}

} // namespace lv2::atom::test
