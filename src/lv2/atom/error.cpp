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
#include "lv2/atom/error.hpp"
#include <flow/util/util.hpp>
#include <cassert>

namespace lv2::atom::error
{

// Types.

/**
 * The boost.system category for errors returned by the lv2::atom module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for example, `Error_code::message()` is invoked on an
 * `Error_code` holding one of our codes.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's conceptual name.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns the human-readable description of the error with the given `int` value; that value should be one
   * of the `Code` values cast to `int`.
   *
   * @param val
   *        Error code value.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns the symbolic representation of the given `Code` sans `S_` prefix: suitable for `ostream<<` and
   * parseable by `istream>>`.
   *
   * @param code
   *        Error code.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  // Glue together Category::name()/message() and the Code enum.
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "lv2/atom";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_SPACE_MISALIGNED:
    return "Atom space: a byte range does not start at an address aligned as required for the target type, or it "
           "is too short to be realigned by skipping padding.";
  case Code::S_OUT_OF_SPACE:
    return "Atom writing: the fixed-capacity buffer has fewer unallocated bytes left than requested.";
  case Code::S_REWIND_BEYOND_ALLOCATED:
    return "Atom writing: asked to rewind (un-allocate) more bytes than are allocated.";
  case Code::S_WRITING_OUT_OF_BOUNDS:
    return "Atom writing: the write would push an atom's recorded body size beyond the 32-bit size field.";
  case Code::S_WRITING_ILLEGAL_STATE:
    return "Atom writing: the operation is illegal in the writer's current state (e.g., non-monotonic time stamp).";
  case Code::S_ATOM_ALREADY_WRITTEN:
    return "Atom writing: an atom was already written to this output port during this processing cycle.";
  case Code::S_INVALID_ATOM_URID:
    return "Atom reading: the atom's type tag does not match the expected type tag.";
  case Code::S_INVALID_URID:
    return "Atom reading/writing: a URID of 0 (none) was found or supplied where a non-zero URID is required.";
  case Code::S_READING_OUT_OF_BOUNDS:
    return "Atom reading: fewer bytes remain than the value or atom being read requires.";
  case Code::S_INVALID_ATOM_VALUE:
    return "Atom reading: a value is structurally present but semantically invalid (e.g., bad UTF-8, missing NUL).";
  case Code::S_ATOM_URID_MISMATCH:
    return "Atom reading: a Vector's child type tag or child size does not match the requested element type.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_SPACE_MISALIGNED:
    return "SPACE_MISALIGNED";
  case Code::S_OUT_OF_SPACE:
    return "OUT_OF_SPACE";
  case Code::S_REWIND_BEYOND_ALLOCATED:
    return "REWIND_BEYOND_ALLOCATED";
  case Code::S_WRITING_OUT_OF_BOUNDS:
    return "WRITING_OUT_OF_BOUNDS";
  case Code::S_WRITING_ILLEGAL_STATE:
    return "WRITING_ILLEGAL_STATE";
  case Code::S_ATOM_ALREADY_WRITTEN:
    return "ATOM_ALREADY_WRITTEN";
  case Code::S_INVALID_ATOM_URID:
    return "INVALID_ATOM_URID";
  case Code::S_INVALID_URID:
    return "INVALID_URID";
  case Code::S_READING_OUT_OF_BOUNDS:
    return "READING_OUT_OF_BOUNDS";
  case Code::S_INVALID_ATOM_VALUE:
    return "INVALID_ATOM_VALUE";
  case Code::S_ATOM_URID_MISMATCH:
    return "ATOM_URID_MISMATCH";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace lv2::atom::error
