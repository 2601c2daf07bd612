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
 * Namespace containing the csp::net module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  A Link_factory or Output_link
 * supplied by the network layer may well emit codes from other categories (e.g., `boost::asio::error`); those
 * are passed through to the user unchanged.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace csp::net::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by csp::net functions/methods *outside of*
 * errors passed through from the network layer.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol to Category::code_symbol().  Add new values at the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Will not write: the channel end is not connected (it is moving, disconnected, or destroyed).
  S_NOT_CONNECTED = S_CODE_LOWEST_INT_VALUE,

  /// Channel end was destroyed: it can never be connected again.
  S_ENDPOINT_DESTROYED,

  /// Channel end is null (default-constructed or moved-from): it has no channel identity.
  S_ENDPOINT_NULL,

  /// Operation is not permitted in the channel end's current connection state.
  S_ENDPOINT_STATE_INVALID_FOR_OP,

  /// Could not bind channel end: another writer binding of the same channel is live.
  S_CHANNEL_ALREADY_BOUND,

  /// Could not bind channel end: the location could not be reached.
  S_LOCATION_UNREACHABLE,

  /// Unable to send: the link to the channel's location broke; the channel end is now disconnected.
  S_LINK_HOSED,

  /// Value not sent: the reading end's store is full and cannot accept it now; the link remains usable.
  S_INPUT_FULL,

  /// User called an API with 1 or more arguments that violate its documented contract.
  S_INVALID_ARGUMENT,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a net::error::Code from a standard input stream: the integer value or the case-insensitive
 * symbol sans `S_` prefix.  If none is recognized, Code::S_END_SENTINEL is the result.  Handy in tests to specify
 * an expected outcome symbolically ("expect NOT_CONNECTED").
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a net::error::Code to a standard output stream, e.g., Code::S_NOT_CONNECTED => `"NOT_CONNECTED"`.
 * The output string is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace csp::net::error

namespace boost::system
{

// Types.

/// Authorizes boost.system to make `enum` csp::net::error::Code convertible to `Error_code`.
template<>
struct is_error_code_enum<::csp::net::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
