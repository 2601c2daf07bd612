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
#include "csp/net/error.hpp"
#include "csp/util/util_fwd.hpp"

namespace csp::net::error
{

// Types.

/**
 * The boost.system category for errors returned by the csp::net module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::name()` and `Error_code::message()`).
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
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging #Error_code).
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
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_NOT_CONNECTED => `"NOT_CONNECTED"`.
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
  /* Assign Category as the category for net::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "csp/net";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_NOT_CONNECTED:
    return "Will not write: the channel end is not connected (it is moving, disconnected, or destroyed).";
  case Code::S_ENDPOINT_DESTROYED:
    return "Channel end was destroyed: it can never be connected again.";
  case Code::S_ENDPOINT_NULL:
    return "Channel end is null (default-constructed or moved-from): it has no channel identity.";
  case Code::S_ENDPOINT_STATE_INVALID_FOR_OP:
    return "Operation is not permitted in the channel end's current connection state.";
  case Code::S_CHANNEL_ALREADY_BOUND:
    return "Could not bind channel end: another writer binding of the same channel is live.";
  case Code::S_LOCATION_UNREACHABLE:
    return "Could not bind channel end: the location could not be reached.";
  case Code::S_LINK_HOSED:
    return "Unable to send: the link to the channel's location broke; the channel end is now disconnected.";
  case Code::S_INPUT_FULL:
    return "Value not sent: the reading end's store is full and cannot accept it now; the link remains usable.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments that violate its documented contract.";

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
  case Code::S_NOT_CONNECTED:
    return "NOT_CONNECTED";
  case Code::S_ENDPOINT_DESTROYED:
    return "ENDPOINT_DESTROYED";
  case Code::S_ENDPOINT_NULL:
    return "ENDPOINT_NULL";
  case Code::S_ENDPOINT_STATE_INVALID_FOR_OP:
    return "ENDPOINT_STATE_INVALID_FOR_OP";
  case Code::S_CHANNEL_ALREADY_BOUND:
    return "CHANNEL_ALREADY_BOUND";
  case Code::S_LOCATION_UNREACHABLE:
    return "LOCATION_UNREACHABLE";
  case Code::S_LINK_HOSED:
    return "LINK_HOSED";
  case Code::S_INPUT_FULL:
    return "INPUT_FULL";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";

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

} // namespace csp::net::error
