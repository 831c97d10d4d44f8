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
#include <vector>

namespace lv2::atom::test
{

class ObjectTest : public Atom_test_base
{
protected:
  ObjectTest() :
    m_preset(m_mapper.map("urn:lv2-atom:test#Preset")),
    m_gain(m_mapper.map("urn:lv2-atom:test#gain")),
    m_name(m_mapper.map("urn:lv2-atom:test#name")),
    m_unit(m_mapper.map("urn:lv2-atom:test#decibel"))
  {
    // Nothing else.
  }

  const urid_t m_preset;
  const urid_t m_gain;
  const urid_t m_name;
  const urid_t m_unit;
}; // class ObjectTest

// Test that properties of different types, with and without context, read back in order.
TEST_F(ObjectTest, PropertiesRoundTrip)
{
  {
    auto cursor = m_space.cursor();
    auto object = cursor.write_atom<Object>(m_urids.m_object)->write_header(Object_header{ 5, m_preset });
    ASSERT_TRUE(object);
    ASSERT_NE(object->new_property<Int>(m_gain, m_urids.m_int)->set(3), nullptr);
    ASSERT_NE(object->new_property<String>(m_name, m_urids.m_string)->append("lead"), nullptr);
    ASSERT_NE(object->new_property_with_context<Float>(m_gain, m_unit, m_urids.m_float)->set(-6.0f), nullptr);
  }

  const auto atom = first_atom();
  ASSERT_NE(atom, nullptr);
  const auto object = atom->read<Object>(m_urids.m_object);
  ASSERT_TRUE(object);
  EXPECT_EQ(object->first.m_id, std::optional<urid_t>(5));
  EXPECT_EQ(object->first.m_otype, m_preset);

  std::vector<Object_reader::Item> properties;
  for (const auto& property : object->second)
  {
    properties.push_back(property);
  }
  ASSERT_EQ(properties.size(), 3u);

  EXPECT_EQ(properties[0].first.m_key, m_gain);
  EXPECT_FALSE(properties[0].first.m_context);
  EXPECT_EQ(*properties[0].second->read<Int>(m_urids.m_int), 3);

  EXPECT_EQ(properties[1].first.m_key, m_name);
  EXPECT_EQ(*properties[1].second->read<String>(m_urids.m_string), "lead");

  EXPECT_EQ(properties[2].first.m_key, m_gain);
  EXPECT_EQ(properties[2].first.m_context, std::optional<urid_t>(m_unit));
  EXPECT_EQ(*properties[2].second->read<Float>(m_urids.m_float), -6.0f);
}

// Test that an object without ID stores 0 and reads back as having none.
TEST_F(ObjectTest, NoId)
{
  {
    auto cursor = m_space.cursor();
    ASSERT_TRUE(cursor.write_atom<Object>(m_urids.m_object)->write_header(Object_header{ std::nullopt, m_preset }));
    EXPECT_EQ(cursor.allocated_bytes().size(), 16u);
  }

  const auto atom = first_atom();
  const auto body = reinterpret_cast<const uint32_t*>(atom->body().data());
  EXPECT_EQ(body[0], 0u);
  EXPECT_EQ(body[1], m_preset);

  const auto object = atom->read<Object>(m_urids.m_object);
  ASSERT_TRUE(object);
  EXPECT_FALSE(object->first.m_id);
  auto properties = object->second;
  EXPECT_FALSE(properties.next());
}

// Test that zero tags in the header or a property key are refused without writing anything.
TEST_F(ObjectTest, ZeroTagsRefused)
{
  auto cursor = m_space.cursor();
  auto header_writer = cursor.write_atom<Object>(m_urids.m_object);
  ASSERT_TRUE(header_writer);

  Error_code err_code;
  EXPECT_FALSE(header_writer->write_header(Object_header{ std::nullopt, 0 }, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
  EXPECT_FALSE(header_writer->write_header(Object_header{ 0, m_preset }, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
  EXPECT_EQ(cursor.allocated_bytes().size(), 8u);

  auto object = header_writer->write_header(Object_header{ std::nullopt, m_preset });
  ASSERT_TRUE(object);
  EXPECT_FALSE(object->new_property<Int>(0, m_urids.m_int, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
  EXPECT_FALSE(object->new_property_with_context<Int>(m_gain, 0, m_urids.m_int, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
  EXPECT_FALSE(object->new_property<Int>(m_gain, 0, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_URID);
  EXPECT_EQ(cursor.allocated_bytes().size(), 16u);
  EXPECT_EQ(first_atom()->header().size_of_body(), 8u);
}

// Test that an object with type tag 0 does not read.
TEST_F(ObjectTest, ZeroTypeDoesNotRead)
{
  auto cursor = m_space.cursor();
  auto writer = Atom_writer::write_new(&cursor, m_urids.m_object);
  ASSERT_TRUE(writer);
  ASSERT_TRUE(writer->write_value(Object_body{ 0, 0 }));

  Error_code err_code;
  EXPECT_FALSE(first_atom()->read<Object>(m_urids.m_object, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ATOM_VALUE);
}

// Test that property iteration ends at a property with key 0.
TEST_F(ObjectTest, ZeroKeyEndsIteration)
{
  {
    auto cursor = m_space.cursor();
    auto object = cursor.write_atom<Object>(m_urids.m_object)->write_header(Object_header{ std::nullopt, m_preset });
    ASSERT_NE(object->new_property<Int>(m_gain, m_urids.m_int)->set(1), nullptr);
    ASSERT_NE(object->new_property<Int>(m_name, m_urids.m_int)->set(2), nullptr);
  }

  // Second property starts after: object header (8), object body (8), first property (8 + 16).
  auto bytes = m_space.as_bytes_mut();
  const uint32_t zero = 0;
  std::memcpy(bytes.data() + 40, &zero, sizeof(zero));

  auto properties = first_atom()->read<Object>(m_urids.m_object)->second;
  const auto first = properties.next();
  ASSERT_TRUE(first);
  EXPECT_EQ(first->first.m_key, m_gain);
  EXPECT_FALSE(properties.next());
}

// Test that property iteration ends at a property whose value claims more bytes than the object holds.
TEST_F(ObjectTest, TruncatedPropertyEndsIteration)
{
  {
    auto cursor = m_space.cursor();
    auto object = cursor.write_atom<Object>(m_urids.m_object)->write_header(Object_header{ std::nullopt, m_preset });
    ASSERT_NE(object->new_property<Int>(m_gain, m_urids.m_int)->set(1), nullptr);
    ASSERT_NE(object->new_property<Int>(m_name, m_urids.m_int)->set(2), nullptr);
  }

  // Size field of the second property's value: after the first property (16 + 24) and the key/context pair.
  auto bytes = m_space.as_bytes_mut();
  const uint32_t bogus_size = 64;
  std::memcpy(bytes.data() + 48, &bogus_size, sizeof(bogus_size));

  const auto object = first_atom()->read<Object>(m_urids.m_object);
  ASSERT_TRUE(object);
  std::vector<Object_reader::Item> properties;
  for (const auto& property : object->second)
  {
    properties.push_back(property);
  }
  ASSERT_EQ(properties.size(), 1u);
  EXPECT_EQ(properties[0].first.m_key, m_gain);
  EXPECT_EQ(*properties[0].second->read<Int>(m_urids.m_int), 1);

  // Retrying does not skip past the damage.
  auto again = object->second;
  ASSERT_TRUE(again.next());
  EXPECT_FALSE(again.next());
  EXPECT_FALSE(again.next());
}

// Test that nested containers in a growing buffer keep all sizes right.
TEST_F(ObjectTest, NestedGrowth)
{
  Vec_space space(Vec_space::Config{ nullptr, 16 });
  {
    auto cursor = space.cursor();
    auto tuple = cursor.write_atom<Tuple>(m_urids.m_tuple);
    ASSERT_TRUE(tuple);
    auto object = tuple->init<Object>(m_urids.m_object)->write_header(Object_header{ std::nullopt, m_preset });
    ASSERT_TRUE(object);
    auto longs = object->new_property<Vector>(m_gain, m_urids.m_vector)->of_type<Long>(m_urids.m_long);
    ASSERT_TRUE(longs);
    for (int64_t idx = 0; idx != 20; ++idx)
    {
      ASSERT_NE(longs->push(idx), nullptr);
    }
    ASSERT_NE(tuple->init<Int>(m_urids.m_int)->set(7), nullptr);
  }

  auto reader = space.read();
  const auto tuple_atom = reader.next_atom();
  ASSERT_NE(tuple_atom, nullptr);
  // Object: 8 + 8 + property (8 + vector (8 + 8 + 160)) = 200; Int: 16.
  EXPECT_EQ(tuple_atom->header().size_of_body(), 200u + 16u);

  auto children = *tuple_atom->read<Tuple>(m_urids.m_tuple);
  const auto object_atom = *children.next();
  EXPECT_EQ(object_atom->header().size_of_body(), 192u);
  auto properties = object_atom->read<Object>(m_urids.m_object)->second;
  const auto property = properties.next();
  ASSERT_TRUE(property);
  const auto longs = property->second->read<Vector>(m_urids.m_vector)->of_type<Long>(m_urids.m_long);
  ASSERT_TRUE(longs);
  ASSERT_EQ(longs->size(), 20u);
  EXPECT_EQ((*longs)[19], 19);
  EXPECT_EQ(*(*children.next())->read<Int>(m_urids.m_int), 7);
  EXPECT_FALSE(children.next());
}

// Test that a Blank, the deprecated anonymous object, reads like an Object.
TEST_F(ObjectTest, BlankReadsAsObject)
{
  {
    auto cursor = m_space.cursor();
    auto object = cursor.write_atom<Object>(m_urids.m_blank)->write_header(Object_header{ std::nullopt, m_preset });
    ASSERT_NE(object->new_property<Bool>(m_gain, m_urids.m_bool)->set(1), nullptr);
  }

  const auto atom = first_atom();
  Error_code err_code;
  EXPECT_FALSE(atom->read<Object>(m_urids.m_object, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ATOM_URID);
  const auto blank = atom->read<Blank>(m_urids.m_blank);
  ASSERT_TRUE(blank);
  EXPECT_EQ(blank->first.m_otype, m_preset);
  auto properties = blank->second;
  const auto property = properties.next();
  ASSERT_TRUE(property);
  EXPECT_EQ(*property->second->read<Bool>(m_urids.m_bool), 1);
}

} // namespace lv2::atom::test
