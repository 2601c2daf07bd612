/* Flow-CSP: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "csp/store/error.hpp"
#include "csp/util/util_fwd.hpp"

namespace csp::store::error
{

// Types.

/**
 * The boost.system category for errors returned by the csp::store module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something like `ec.message()` is invoked.
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
   * Implements super-class API: returns a `static` string representing this `error_category`.
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation.
   *
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
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
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "csp/store";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_CAPACITY:
    return "Attempted to create a buffered channel data-store with zero or negative capacity.";
  case Code::S_UNKNOWN_POLICY:
    return "Attempted to create a data-store from a configuration naming no known buffering policy.";

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
  case Code::S_INVALID_CAPACITY:
    return "INVALID_CAPACITY";
  case Code::S_UNKNOWN_POLICY:
    return "UNKNOWN_POLICY";

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

} // namespace csp::store::error
