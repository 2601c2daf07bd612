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
#pragma once

#include "csp/common.hpp"
#include <boost/system/error_code.hpp>

/**
 * Namespace containing the csp::store module's extension of boost.system error conventions.  Since a data-store
 * never fails at run time (it never blocks, and underflow is a precondition violation) these are all construction
 * or configuration errors; they reach the user inside a `flow::error::Runtime_error`.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace csp::store::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors emitted by csp::store.  These values are convertible to #Error_code (a/k/a
 * `boost::system::error_code`) and thus extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol to Category::code_symbol().  Add new values at the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Attempted to create a buffered channel data-store with zero or negative capacity.
  S_INVALID_CAPACITY = S_CODE_LOWEST_INT_VALUE,

  /// Attempted to create a data-store from a configuration naming no known buffering policy.
  S_UNKNOWN_POLICY,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a store::error::Code from a standard input stream: the integer value or the case-insensitive
 * symbol sans `S_` prefix.  If none is recognized, Code::S_END_SENTINEL is the result.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a store::error::Code to a standard output stream, e.g., Code::S_INVALID_CAPACITY =>
 * `"INVALID_CAPACITY"`.  The output string is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace csp::store::error

namespace boost::system
{

// Types.

/// Authorizes boost.system to make `enum` csp::store::error::Code convertible to `Error_code`.
template<>
struct is_error_code_enum<::csp::store::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
